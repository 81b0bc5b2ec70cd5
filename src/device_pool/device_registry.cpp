#include "device_pool/device_registry.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "device_pool/errors.hpp"
#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
constexpr int k_max_health_score{100};
constexpr char k_reason_heartbeat[] = "heartbeat";
constexpr char k_reason_absent[] = "absent_from_heartbeat";
constexpr char k_reason_stale[] = "stale_heartbeat";

bool is_sticky(DeviceStatus status) noexcept {
    return status == DeviceStatus::Reserved || status == DeviceStatus::Maintenance;
}

bool has_tag(const TargetDevice& device, const std::string& tag) {
    return std::find(device.tags.begin(), device.tags.end(), tag) != device.tags.end();
}

std::optional<std::string> normalized_serial(const std::optional<std::string>& serial_number) {
    if (!serial_number.has_value() || serial_number->empty()) {
        return std::nullopt;
    }
    return serial_number;
}

void copy_report_fields(TargetDevice& device, const HeartbeatDeviceReport& report) {
    device.device_type = report.device_type;
    if (const auto serial = normalized_serial(report.serial_number); serial.has_value()) {
        device.serial_number = serial;
    }
    device.ip_address = report.ip_address;
    device.android_version = report.android_version;
    device.api_level = report.api_level;
    device.manufacturer = report.manufacturer;
    device.model = report.model;
    device.adb_endpoint = report.adb_endpoint;
    device.ssh_endpoint = report.ssh_endpoint;
    device.memory_mb = report.memory_mb;
    device.storage_gb = report.storage_gb;
    device.screen_resolution = report.screen_resolution;
    device.network_capabilities = report.network_capabilities;
    if (report.tags.has_value()) {
        device.tags = *report.tags;
    }
    if (report.purpose.has_value()) {
        device.purpose = *report.purpose;
    }
    device.adb_status = report.adb_status;
    device.serial_status = report.serial_status;
    if (report.heartbeat_interval_seconds.has_value()) {
        device.heartbeat_interval_seconds = *report.heartbeat_interval_seconds;
    }
}
}  // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<EventSink> event_sink)
    : event_sink_(std::move(event_sink)),
      logger_(get_logger()) {
    if (event_sink_ == nullptr) {
        throw std::invalid_argument("DeviceRegistry requires an event sink");
    }
}

HeartbeatResult DeviceRegistry::apply_heartbeat(const HeartbeatBatch& batch, TimePoint now) {
    if (batch.gateway_id.empty()) {
        throw std::invalid_argument("Heartbeat batch requires a gateway id");
    }

    KeyedLock<GatewayId> gateway_lock(gateway_locks_, batch.gateway_id);

    HeartbeatResult result{};
    std::vector<StatusChange> changes;
    std::vector<TargetDevice> registered;
    auto reported_names = std::make_shared<NameSet>();
    {
        std::unique_lock lock(mutex_);

        std::shared_ptr<const NameSet> previous = previous_names(batch.gateway_id);
        if (previous == nullptr) {
            // First batch seen from this gateway since start-up: diff against the devices we already hold for it.
            auto seeded = std::make_shared<NameSet>();
            for (const auto& [device_id, device] : map_devices_) {
                if (device.gateway_id == batch.gateway_id && device.is_active) {
                    seeded->insert(device.name);
                }
            }
            previous = seeded;
        }

        for (const HeartbeatDeviceReport& report : batch.devices) {
            if (!report.name.empty()) {
                reported_names->insert(report.name);
            }
            try {
                validate_report(report);
                const std::size_t created_before = result.created.size();
                TargetDevice& device = reconcile_locked(batch.gateway_id, report, now, result, changes);
                if (result.created.size() > created_before) {
                    registered.push_back(device);
                } else {
                    result.updated.push_back(device);
                }
            } catch (const std::invalid_argument& exc) {
                logger_->warn(R"({{"component":"device_registry","gateway":{},"device":{},"rejected":{}}})",
                              json_quote(batch.gateway_id),
                              json_quote(report.name),
                              json_quote(exc.what()));
                result.rejected.push_back(report.name + ": " + exc.what());
            } catch (const ConflictError& exc) {
                logger_->warn(R"({{"component":"device_registry","gateway":{},"device":{},"rejected":{}}})",
                              json_quote(batch.gateway_id),
                              json_quote(report.name),
                              json_quote(exc.what()));
                result.rejected.push_back(report.name + ": " + exc.what());
            }
        }

        for (const std::string& missing_name : *previous) {
            if (reported_names->count(missing_name) != 0U) {
                continue;
            }
            const auto iterator_name = map_name_index_.find(NameKey{batch.gateway_id, missing_name});
            if (iterator_name == map_name_index_.end()) {
                continue;
            }
            TargetDevice& device = map_devices_.at(iterator_name->second);
            if (is_sticky(device.status) || device.status == DeviceStatus::Offline) {
                continue;
            }
            set_status_locked(device, DeviceStatus::Offline, k_reason_absent, now, changes);
            device.adb_status = false;
            device.serial_status = false;
            result.went_offline.push_back(device);
        }
    }

    {
        std::scoped_lock snapshot_lock(snapshot_mutex_);
        map_gateway_snapshots_[batch.gateway_id] = std::move(reported_names);
    }

    logger_->debug(R"({{"component":"device_registry","gateway":"{}","updated":{},"created":{},"offline":{},"rejected":{}}})",
                   batch.gateway_id,
                   result.updated.size(),
                   result.created.size(),
                   result.went_offline.size(),
                   result.rejected.size());

    for (const TargetDevice& device : registered) {
        publish_registered(device, true);
    }
    publish_status_changes(changes);
    return result;
}

std::vector<TargetDevice> DeviceRegistry::sweep_stale(TimePoint now, int multiplier, const std::optional<GatewayId>& gateway_id) {
    if (multiplier <= 0) {
        throw std::invalid_argument("Staleness multiplier must be positive");
    }

    std::vector<TargetDevice> deactivated;
    std::vector<StatusChange> changes;
    {
        std::unique_lock lock(mutex_);
        for (auto& [device_id, device] : map_devices_) {
            if (!device.is_active || is_sticky(device.status)) {
                continue;
            }
            if (gateway_id.has_value() && device.gateway_id != *gateway_id) {
                continue;
            }
            const TimePoint reference = device.last_heartbeat.value_or(device.created_at);
            const Seconds threshold{static_cast<Seconds::rep>(multiplier) * device.heartbeat_interval_seconds};
            if (now - reference <= threshold) {
                continue;
            }
            set_status_locked(device, DeviceStatus::Offline, k_reason_stale, now, changes);
            device.is_active = false;
            device.deactivated_by_staleness = true;
            device.deactivation_reason = k_reason_stale;
            device.adb_status = false;
            device.serial_status = false;
            deactivated.push_back(device);
        }
    }

    if (!deactivated.empty()) {
        logger_->info(R"({{"component":"device_registry","action":"stale_sweep","deactivated":{}}})", deactivated.size());
    }
    publish_status_changes(changes);
    for (const TargetDevice& device : deactivated) {
        LifecycleEvent event{};
        event.type = event_type::k_device_deactivated;
        event.subjects["device"] = std::to_string(device.id);
        event.subjects["gateway"] = device.gateway_id;
        event.details["reason"] = k_reason_stale;
        publish_event(*event_sink_, event, *logger_);
    }
    return deactivated;
}

TargetDevice DeviceRegistry::register_device(const Principal& actor, TargetDevice device, TimePoint now) {
    require_role(actor, Role::Developer, "register devices");
    if (device.name.empty() || device.gateway_id.empty()) {
        throw std::invalid_argument("Device registration requires a name and a gateway id");
    }
    if (device.status == DeviceStatus::Reserved) {
        throw std::invalid_argument("Devices are reserved only through reservations");
    }
    if (device.heartbeat_interval_seconds <= 0) {
        throw std::invalid_argument("Device heartbeat_interval_seconds must be positive");
    }
    device.serial_number = normalized_serial(device.serial_number);
    {
        std::unique_lock lock(mutex_);
        if (device.serial_number.has_value() && map_serial_index_.count(*device.serial_number) != 0U) {
            throw ConflictError("Device with serial number " + *device.serial_number + " already exists",
                                {std::to_string(map_serial_index_.at(*device.serial_number))});
        }
        const NameKey name_key{device.gateway_id, device.name};
        if (const auto iterator_name = map_name_index_.find(name_key); iterator_name != map_name_index_.end()) {
            throw ConflictError("Device " + device.name + " already exists on gateway " + device.gateway_id,
                                {std::to_string(iterator_name->second)});
        }
        device.id = next_device_id_++;
        device.is_active = true;
        device.deactivated_by_staleness = false;
        device.created_at = now;
        device.updated_at = now;
        map_devices_.emplace(device.id, device);
        index_locked(device);
    }
    publish_registered(device, false);
    return device;
}

TargetDevice DeviceRegistry::update_device(const Principal& actor, DeviceId device_id, const DeviceUpdate& update, TimePoint now) {
    require_role(actor, Role::Developer, "update devices");
    if (update.name.has_value() && update.name->empty()) {
        throw std::invalid_argument("Device name cannot be empty");
    }
    if (update.heartbeat_interval_seconds.has_value() && *update.heartbeat_interval_seconds <= 0) {
        throw std::invalid_argument("Device heartbeat_interval_seconds must be positive");
    }

    std::unique_lock lock(mutex_);
    TargetDevice& device = require_locked(device_id);

    const std::optional<std::string> new_serial = update.serial_number.has_value() ? normalized_serial(update.serial_number)
                                                                                   : device.serial_number;
    if (new_serial.has_value() && new_serial != device.serial_number) {
        if (const auto iterator_serial = map_serial_index_.find(*new_serial); iterator_serial != map_serial_index_.end()) {
            throw ConflictError("Device with serial number " + *new_serial + " already exists",
                                {std::to_string(iterator_serial->second)});
        }
    }
    const std::string new_name = update.name.value_or(device.name);
    if (new_name != device.name) {
        if (const auto iterator_name = map_name_index_.find(NameKey{device.gateway_id, new_name}); iterator_name != map_name_index_.end()) {
            throw ConflictError("Device " + new_name + " already exists on gateway " + device.gateway_id,
                                {std::to_string(iterator_name->second)});
        }
    }

    unindex_locked(device);
    device.name = new_name;
    device.serial_number = new_serial;
    if (update.device_type.has_value()) {
        device.device_type = *update.device_type;
    }
    if (update.ip_address.has_value()) {
        device.ip_address = *update.ip_address;
    }
    if (update.location.has_value()) {
        device.location = *update.location;
    }
    if (update.adb_endpoint.has_value()) {
        device.adb_endpoint = *update.adb_endpoint;
    }
    if (update.ssh_endpoint.has_value()) {
        device.ssh_endpoint = *update.ssh_endpoint;
    }
    if (update.tags.has_value()) {
        device.tags = *update.tags;
    }
    if (update.purpose.has_value()) {
        device.purpose = *update.purpose;
    }
    if (update.heartbeat_interval_seconds.has_value()) {
        device.heartbeat_interval_seconds = *update.heartbeat_interval_seconds;
    }
    device.updated_at = now;
    index_locked(device);
    return device;
}

TargetDevice DeviceRegistry::set_maintenance(const Principal& actor, DeviceId device_id, bool enabled, const std::string& reason, TimePoint now) {
    require_role(actor, Role::Admin, "change device maintenance");
    std::vector<StatusChange> changes;
    TargetDevice snapshot{};
    {
        std::unique_lock lock(mutex_);
        TargetDevice& device = require_locked(device_id);
        if (enabled) {
            set_status_locked(device, DeviceStatus::Maintenance, reason.empty() ? "maintenance" : reason, now, changes);
            device.deactivation_reason = reason;
        } else if (device.status == DeviceStatus::Maintenance) {
            set_status_locked(device, DeviceStatus::Offline, "maintenance_finished", now, changes);
            device.is_active = true;
            device.deactivated_by_staleness = false;
            device.deactivation_reason.clear();
        }
        snapshot = device;
    }
    logger_->info(R"({{"component":"device_registry","device":{},"maintenance":{},"by":{}}})", device_id, enabled, actor.user_id);
    publish_status_changes(changes);
    return snapshot;
}

TargetDevice DeviceRegistry::deactivate_device(const Principal& actor, DeviceId device_id, const std::string& reason, TimePoint now) {
    require_role(actor, Role::Admin, "deactivate devices");
    std::vector<StatusChange> changes;
    TargetDevice snapshot{};
    {
        std::unique_lock lock(mutex_);
        TargetDevice& device = require_locked(device_id);
        set_status_locked(device, DeviceStatus::Maintenance, "deactivated", now, changes);
        device.is_active = false;
        device.deactivated_by_staleness = false;
        device.deactivation_reason = reason;
        snapshot = device;
    }
    publish_status_changes(changes);

    LifecycleEvent event{};
    event.type = event_type::k_device_deactivated;
    event.subjects["device"] = std::to_string(device_id);
    event.subjects["gateway"] = snapshot.gateway_id;
    event.subjects["user"] = std::to_string(actor.user_id);
    event.details["reason"] = reason;
    publish_event(*event_sink_, event, *logger_);
    return snapshot;
}

void DeviceRegistry::remove_device(const Principal& actor, DeviceId device_id, const std::function<bool(DeviceId)>& has_history) {
    require_role(actor, Role::Admin, "remove devices");
    if (has_history && has_history(device_id)) {
        throw ConflictError("Device " + std::to_string(device_id) + " is referenced by reservation history; deactivate it instead",
                            {std::to_string(device_id)});
    }
    GatewayId gateway_id;
    {
        std::unique_lock lock(mutex_);
        TargetDevice& device = require_locked(device_id);
        gateway_id = device.gateway_id;
        unindex_locked(device);
        map_devices_.erase(device_id);
    }
    logger_->info(R"({{"component":"device_registry","device":{},"action":"removed","by":{}}})", device_id, actor.user_id);

    LifecycleEvent event{};
    event.type = event_type::k_device_deactivated;
    event.subjects["device"] = std::to_string(device_id);
    event.subjects["gateway"] = gateway_id;
    event.details["reason"] = "removed";
    publish_event(*event_sink_, event, *logger_);
}

std::optional<TargetDevice> DeviceRegistry::find(DeviceId device_id) const {
    std::shared_lock lock(mutex_);
    const auto iterator_device = map_devices_.find(device_id);
    if (iterator_device == map_devices_.end()) {
        return std::nullopt;
    }
    return iterator_device->second;
}

std::optional<TargetDevice> DeviceRegistry::find_by_serial(const std::string& serial_number) const {
    std::shared_lock lock(mutex_);
    const auto iterator_serial = map_serial_index_.find(serial_number);
    if (iterator_serial == map_serial_index_.end()) {
        return std::nullopt;
    }
    return map_devices_.at(iterator_serial->second);
}

std::optional<TargetDevice> DeviceRegistry::find_by_name(const GatewayId& gateway_id, const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto iterator_name = map_name_index_.find(NameKey{gateway_id, name});
    if (iterator_name == map_name_index_.end()) {
        return std::nullopt;
    }
    return map_devices_.at(iterator_name->second);
}

std::vector<TargetDevice> DeviceRegistry::list(const DeviceFilter& filter) const {
    std::shared_lock lock(mutex_);
    std::vector<TargetDevice> devices;
    for (const auto& [device_id, device] : map_devices_) {
        if (filter.gateway_id.has_value() && device.gateway_id != *filter.gateway_id) {
            continue;
        }
        if (filter.status.has_value() && device.status != *filter.status) {
            continue;
        }
        if (filter.device_type.has_value() && device.device_type != *filter.device_type) {
            continue;
        }
        if (filter.tag.has_value() && !has_tag(device, *filter.tag)) {
            continue;
        }
        if (filter.is_active.has_value() && device.is_active != *filter.is_active) {
            continue;
        }
        devices.push_back(device);
    }
    return devices;
}

DeviceStatistics DeviceRegistry::statistics() const {
    std::shared_lock lock(mutex_);
    DeviceStatistics stats{};
    stats.total = map_devices_.size();
    for (const auto& [device_id, device] : map_devices_) {
        if (device.is_active) {
            ++stats.active;
        }
        ++stats.by_status[std::string{to_string(device.status)}];
        ++stats.by_type[std::string{to_string(device.device_type)}];
        ++stats.by_gateway[device.gateway_id];
    }
    return stats;
}

std::set<std::string> DeviceRegistry::last_reported_names(const GatewayId& gateway_id) const {
    const auto names = previous_names(gateway_id);
    if (names == nullptr) {
        return {};
    }
    return *names;
}

TargetDevice DeviceRegistry::mark_reserved(DeviceId device_id, TimePoint now) {
    std::vector<StatusChange> changes;
    TargetDevice snapshot{};
    {
        std::unique_lock lock(mutex_);
        TargetDevice& device = require_locked(device_id);
        if (!device.is_active || device.status == DeviceStatus::Maintenance) {
            throw ConflictError("Device " + std::to_string(device_id) + " is not in service (" + std::string{to_string(device.status)} + ")",
                                {std::to_string(device_id)});
        }
        set_status_locked(device, DeviceStatus::Reserved, "reservation_active", now, changes);
        snapshot = device;
    }
    publish_status_changes(changes);
    return snapshot;
}

bool DeviceRegistry::release(DeviceId device_id, TimePoint now) {
    std::vector<StatusChange> changes;
    {
        std::unique_lock lock(mutex_);
        const auto iterator_device = map_devices_.find(device_id);
        if (iterator_device == map_devices_.end()) {
            logger_->warn(R"({{"component":"device_registry","device":{},"release":"unknown device"}})", device_id);
            return false;
        }
        TargetDevice& device = iterator_device->second;
        if (device.status != DeviceStatus::Reserved) {
            return false;
        }
        set_status_locked(device, DeviceStatus::Available, "reservation_released", now, changes);
    }
    publish_status_changes(changes);
    return true;
}

void DeviceRegistry::mirror_association(DeviceId device_id, std::optional<AssociationStatus> status, std::optional<int> health, TimePoint now) {
    std::optional<int> previous_health;
    bool health_changed = false;
    GatewayId gateway_id;
    {
        std::unique_lock lock(mutex_);
        TargetDevice& device = require_locked(device_id);
        device.association_status = status;
        device.association_health = health;
        if (health.has_value()) {
            previous_health = device.health_score;
            health_changed = device.health_score != health;
            device.health_score = health;
            device.health_check_timestamp = now;
        }
        device.updated_at = now;
        gateway_id = device.gateway_id;
    }
    if (health_changed) {
        LifecycleEvent event{};
        event.type = event_type::k_device_health_changed;
        event.subjects["device"] = std::to_string(device_id);
        event.subjects["gateway"] = gateway_id;
        event.details["old_health"] = previous_health.has_value() ? std::to_string(*previous_health) : "none";
        event.details["new_health"] = std::to_string(*health);
        publish_event(*event_sink_, event, *logger_);
    }
}

void DeviceRegistry::demote_after_disassociation(DeviceId device_id, bool forced, TimePoint now) {
    std::vector<StatusChange> changes;
    {
        std::unique_lock lock(mutex_);
        TargetDevice& device = require_locked(device_id);
        if (device.status == DeviceStatus::Reserved && !forced) {
            throw ConflictError("Device " + std::to_string(device_id) + " is reserved; force is required to disassociate it",
                                {std::to_string(device_id)});
        }
        const bool demote = device.status == DeviceStatus::Available || device.status == DeviceStatus::Reserved;
        if (demote) {
            set_status_locked(device, DeviceStatus::Offline, forced ? "forced_disassociation" : "disassociated", now, changes);
        }
        device.adb_status = false;
        device.serial_status = false;
        device.association_status = AssociationStatus::Disconnected;
        device.updated_at = now;
    }
    publish_status_changes(changes);
}

TargetDevice& DeviceRegistry::require_locked(DeviceId device_id) {
    const auto iterator_device = map_devices_.find(device_id);
    if (iterator_device == map_devices_.end()) {
        throw NotFoundError("device", std::to_string(device_id));
    }
    return iterator_device->second;
}

std::optional<DeviceId> DeviceRegistry::match_locked(const GatewayId& gateway_id, const HeartbeatDeviceReport& report) const {
    if (const auto serial = normalized_serial(report.serial_number); serial.has_value()) {
        if (const auto iterator_serial = map_serial_index_.find(*serial); iterator_serial != map_serial_index_.end()) {
            return iterator_serial->second;
        }
    }
    if (const auto iterator_name = map_name_index_.find(NameKey{gateway_id, report.name}); iterator_name != map_name_index_.end()) {
        return iterator_name->second;
    }
    return std::nullopt;
}

TargetDevice& DeviceRegistry::reconcile_locked(const GatewayId& gateway_id,
                                               const HeartbeatDeviceReport& report,
                                               TimePoint now,
                                               HeartbeatResult& result,
                                               std::vector<StatusChange>& changes) {
    const std::optional<DeviceId> matched = match_locked(gateway_id, report);
    if (!matched.has_value()) {
        TargetDevice device{};
        device.id = next_device_id_++;
        device.name = report.name;
        device.gateway_id = gateway_id;
        copy_report_fields(device, report);
        device.health_score = report.health_score;
        if (report.health_score.has_value()) {
            device.health_check_timestamp = now;
        }
        device.status = DeviceStatus::Available;
        device.is_active = true;
        device.last_heartbeat = now;
        device.created_at = now;
        device.updated_at = now;
        auto [iterator_device, inserted] = map_devices_.emplace(device.id, device);
        index_locked(iterator_device->second);
        result.created.push_back(iterator_device->second);
        logger_->info(R"({{"component":"device_registry","gateway":"{}","device":"{}","id":{},"action":"auto_registered"}})",
                      gateway_id,
                      report.name,
                      device.id);
        return iterator_device->second;
    }

    TargetDevice& device = map_devices_.at(*matched);
    const std::optional<std::string> reported_serial = normalized_serial(report.serial_number);
    const bool moves = device.gateway_id != gateway_id || device.name != report.name;
    const bool serial_changes = reported_serial.has_value() && reported_serial != device.serial_number;
    if (moves) {
        const auto iterator_name = map_name_index_.find(NameKey{gateway_id, report.name});
        if (iterator_name != map_name_index_.end() && iterator_name->second != device.id) {
            throw ConflictError("Serial " + report.serial_number.value_or("") + " matches device " + std::to_string(device.id) +
                                    " but " + report.name + " is already taken by device " + std::to_string(iterator_name->second),
                                {std::to_string(device.id), std::to_string(iterator_name->second)});
        }
    }
    // A changed serial is never indexed yet; match_locked would have matched on it.
    const bool reindex = moves || serial_changes;
    if (reindex) {
        unindex_locked(device);
    }
    if (moves) {
        device.gateway_id = gateway_id;
        device.name = report.name;
    }
    copy_report_fields(device, report);
    if (reindex) {
        index_locked(device);
    }
    if (report.health_score.has_value()) {
        device.health_score = report.health_score;
        device.health_check_timestamp = now;
    }
    device.last_heartbeat = now;
    device.updated_at = now;

    if (!device.is_active && device.deactivated_by_staleness) {
        device.is_active = true;
        device.deactivated_by_staleness = false;
        device.deactivation_reason.clear();
        logger_->info(R"({{"component":"device_registry","device":{},"action":"reactivated"}})", device.id);
    }
    if (!is_sticky(device.status) && device.is_active) {
        set_status_locked(device, DeviceStatus::Available, k_reason_heartbeat, now, changes);
    }
    return device;
}

void DeviceRegistry::index_locked(const TargetDevice& device) {
    if (device.serial_number.has_value()) {
        map_serial_index_[*device.serial_number] = device.id;
    }
    map_name_index_[NameKey{device.gateway_id, device.name}] = device.id;
}

void DeviceRegistry::unindex_locked(const TargetDevice& device) {
    if (device.serial_number.has_value()) {
        const auto iterator_serial = map_serial_index_.find(*device.serial_number);
        if (iterator_serial != map_serial_index_.end() && iterator_serial->second == device.id) {
            map_serial_index_.erase(iterator_serial);
        }
    }
    const auto iterator_name = map_name_index_.find(NameKey{device.gateway_id, device.name});
    if (iterator_name != map_name_index_.end() && iterator_name->second == device.id) {
        map_name_index_.erase(iterator_name);
    }
}

void DeviceRegistry::set_status_locked(TargetDevice& device,
                                       DeviceStatus status,
                                       const std::string& reason,
                                       TimePoint now,
                                       std::vector<StatusChange>& changes) {
    if (device.status == status) {
        return;
    }
    changes.push_back(StatusChange{device.id, device.gateway_id, device.status, status, reason});
    device.status = status;
    device.updated_at = now;
}

std::shared_ptr<const DeviceRegistry::NameSet> DeviceRegistry::previous_names(const GatewayId& gateway_id) const {
    std::scoped_lock lock(snapshot_mutex_);
    const auto iterator_snapshot = map_gateway_snapshots_.find(gateway_id);
    if (iterator_snapshot == map_gateway_snapshots_.end()) {
        return nullptr;
    }
    return iterator_snapshot->second;
}

void DeviceRegistry::publish_status_changes(const std::vector<StatusChange>& changes) {
    for (const StatusChange& change : changes) {
        logger_->info(R"({{"component":"device_registry","device":{},"gateway":"{}","old_status":"{}","new_status":"{}","reason":{}}})",
                      change.device_id,
                      change.gateway_id,
                      to_string(change.old_status),
                      to_string(change.new_status),
                      json_quote(change.reason));
        LifecycleEvent event{};
        event.type = event_type::k_device_status_changed;
        event.subjects["device"] = std::to_string(change.device_id);
        event.subjects["gateway"] = change.gateway_id;
        event.details["old_status"] = std::string{to_string(change.old_status)};
        event.details["new_status"] = std::string{to_string(change.new_status)};
        event.details["reason"] = change.reason;
        publish_event(*event_sink_, event, *logger_);
    }
}

void DeviceRegistry::publish_registered(const TargetDevice& device, bool auto_registered) {
    LifecycleEvent event{};
    event.type = event_type::k_device_registered;
    event.subjects["device"] = std::to_string(device.id);
    event.subjects["gateway"] = device.gateway_id;
    event.details["name"] = device.name;
    event.details["status"] = std::string{to_string(device.status)};
    event.details["source"] = auto_registered ? "heartbeat" : "manual";
    publish_event(*event_sink_, event, *logger_);
}

void DeviceRegistry::validate_report(const HeartbeatDeviceReport& report) {
    if (report.name.empty()) {
        throw std::invalid_argument("device entry without a name");
    }
    if (report.health_score.has_value() && (*report.health_score < 0 || *report.health_score > k_max_health_score)) {
        throw std::invalid_argument("health_score outside 0-100");
    }
    if (report.heartbeat_interval_seconds.has_value() && *report.heartbeat_interval_seconds <= 0) {
        throw std::invalid_argument("heartbeat_interval_seconds must be positive");
    }
}

}  // namespace device_pool
