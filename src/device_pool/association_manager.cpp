#include "device_pool/association_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "device_pool/errors.hpp"
#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
constexpr int k_failed_below{30};
constexpr int k_disconnected_below{60};
constexpr int k_full_health{100};
constexpr int k_maintenance_cap{40};
constexpr int k_degraded_penalty{20};
constexpr int k_offline_device_cap{20};
constexpr int k_max_port{65'535};

std::string join(const std::vector<std::string>& parts) {
    std::string joined;
    for (const std::string& part : parts) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += part;
    }
    return joined;
}
}  // namespace

bool is_live(AssociationStatus status) noexcept {
    return status == AssociationStatus::Pending || status == AssociationStatus::Connecting || status == AssociationStatus::Connected;
}

AssociationStatus classify_health(int health_score) noexcept {
    if (health_score < k_failed_below) {
        return AssociationStatus::Failed;
    }
    if (health_score < k_disconnected_below) {
        return AssociationStatus::Disconnected;
    }
    return AssociationStatus::Connected;
}

int RegistryHealthProbe::score(const TargetGatewayAssociation&, const TargetDevice& device, const std::optional<Gateway>& gateway) {
    int health = device.health_score.value_or(k_full_health);
    if (!gateway.has_value() || gateway->status == GatewayStatus::Offline) {
        return 0;
    }
    if (gateway->status == GatewayStatus::Maintenance) {
        health = std::min(health, k_maintenance_cap);
    } else if (gateway->status == GatewayStatus::Degraded) {
        health -= k_degraded_penalty;
    }
    if (gateway->health_score.has_value()) {
        health = std::min(health, *gateway->health_score);
    }
    if (device.status == DeviceStatus::Offline) {
        health = std::min(health, k_offline_device_cap);
    }
    return std::clamp(health, 0, k_full_health);
}

AssociationManager::AssociationManager(DeviceRegistry& device_registry,
                                       GatewayRegistry& gateway_registry,
                                       std::shared_ptr<EventSink> event_sink,
                                       std::shared_ptr<HealthProbe> health_probe)
    : device_registry_(device_registry),
      gateway_registry_(gateway_registry),
      event_sink_(std::move(event_sink)),
      health_probe_(std::move(health_probe)),
      logger_(get_logger()) {
    if (event_sink_ == nullptr || health_probe_ == nullptr) {
        throw std::invalid_argument("AssociationManager requires an event sink and a health probe");
    }
}

TargetGatewayAssociation AssociationManager::associate(const Principal& actor,
                                                       DeviceId device_id,
                                                       const GatewayId& gateway_id,
                                                       AssociationStatus initial_status,
                                                       TimePoint now) {
    require_role(actor, Role::Developer, "associate targets");
    bool created = false;
    TargetGatewayAssociation association{};
    {
        std::scoped_lock lock(mutex_);
        association = associate_locked(actor, device_id, gateway_id, initial_status, now, created);
    }
    if (created) {
        publish(event_type::k_target_associated, association, {{"status", std::string{to_string(association.status)}}});
    }
    return association;
}

TargetGatewayAssociation AssociationManager::disassociate(const Principal& actor, DeviceId device_id, const GatewayId& gateway_id, bool force, TimePoint now) {
    require_role(actor, Role::Developer, "disassociate targets");
    TargetGatewayAssociation snapshot{};
    {
        std::scoped_lock lock(mutex_);
        TargetGatewayAssociation* association = live_locked(device_id);
        if (association == nullptr || association->gateway_id != gateway_id) {
            throw NotFoundError("association", std::to_string(device_id) + "@" + gateway_id);
        }
        // Device first: it refuses a reserved target without force before anything changes.
        if (device_registry_.find(device_id).has_value()) {
            device_registry_.demote_after_disassociation(device_id, force, now);
        }
        set_status_locked(*association, AssociationStatus::Disconnected, now);
        snapshot = *association;
    }
    logger_->info(R"({{"component":"association_manager","device":{},"gateway":"{}","action":"disassociated","force":{}}})",
                  device_id,
                  gateway_id,
                  force);
    publish(event_type::k_target_disassociated, snapshot, {{"force", force ? "true" : "false"}});
    return snapshot;
}

BulkAssociationResult AssociationManager::bulk_associate(const Principal& actor,
                                                         const GatewayId& gateway_id,
                                                         const std::vector<DeviceId>& device_ids,
                                                         AssociationStatus initial_status,
                                                         TimePoint now) {
    require_role(actor, Role::Admin, "bulk associate targets");
    if (!gateway_registry_.exists(gateway_id)) {
        throw NotFoundError("gateway", gateway_id);
    }

    BulkAssociationResult result{};
    std::vector<TargetGatewayAssociation> created_associations;
    {
        std::scoped_lock lock(mutex_);
        for (const DeviceId device_id : device_ids) {
            try {
                bool created = false;
                TargetGatewayAssociation association = associate_locked(actor, device_id, gateway_id, initial_status, now, created);
                if (created) {
                    created_associations.push_back(association);
                }
                result.succeeded.push_back(std::move(association));
            } catch (const DevicePoolError& exc) {
                result.errors.push_back("target " + std::to_string(device_id) + ": " + exc.what());
            }
        }
    }

    if (result.succeeded.empty() && !result.errors.empty()) {
        throw ConflictError("No target could be associated with gateway " + gateway_id + ": " + join(result.errors), {gateway_id});
    }
    logger_->info(R"({{"component":"association_manager","gateway":"{}","action":"bulk_associate","succeeded":{},"errors":{}}})",
                  gateway_id,
                  result.succeeded.size(),
                  result.errors.size());
    for (const TargetGatewayAssociation& association : created_associations) {
        publish(event_type::k_target_associated, association, {{"status", std::string{to_string(association.status)}}, {"bulk", "true"}});
    }
    return result;
}

std::vector<TargetGatewayAssociation> AssociationManager::bulk_disassociate(const Principal& actor,
                                                                            const GatewayId& gateway_id,
                                                                            const std::vector<DeviceId>& device_ids,
                                                                            bool force,
                                                                            TimePoint now) {
    require_role(actor, Role::Admin, "bulk disassociate targets");
    if (!gateway_registry_.exists(gateway_id)) {
        throw NotFoundError("gateway", gateway_id);
    }

    std::vector<TargetGatewayAssociation> released;
    {
        std::scoped_lock lock(mutex_);
        std::vector<std::string> problems;
        std::vector<std::string> problem_ids;
        for (const DeviceId device_id : device_ids) {
            const TargetGatewayAssociation* association = live_locked(device_id);
            if (association == nullptr || association->gateway_id != gateway_id) {
                problems.push_back("target " + std::to_string(device_id) + " is not associated with " + gateway_id);
                problem_ids.push_back(std::to_string(device_id));
                continue;
            }
            const auto device = device_registry_.find(device_id);
            if (device.has_value() && device->status == DeviceStatus::Reserved && !force) {
                problems.push_back("target " + std::to_string(device_id) + " is reserved");
                problem_ids.push_back(std::to_string(device_id));
            }
        }
        if (!problems.empty()) {
            throw ConflictError("Bulk disassociation rejected: " + join(problems), problem_ids);
        }

        for (const DeviceId device_id : device_ids) {
            TargetGatewayAssociation* association = live_locked(device_id);
            if (association == nullptr) {
                continue;  // listed twice
            }
            if (device_registry_.find(device_id).has_value()) {
                device_registry_.demote_after_disassociation(device_id, force, now);
            }
            set_status_locked(*association, AssociationStatus::Disconnected, now);
            released.push_back(*association);
        }
    }

    logger_->info(R"({{"component":"association_manager","gateway":"{}","action":"bulk_disassociate","released":{}}})", gateway_id, released.size());
    for (const TargetGatewayAssociation& association : released) {
        publish(event_type::k_target_disassociated, association, {{"force", force ? "true" : "false"}, {"bulk", "true"}});
    }
    return released;
}

TargetGatewayAssociation AssociationManager::update_association(const Principal& actor,
                                                                AssociationId association_id,
                                                                const AssociationUpdate& update,
                                                                TimePoint now) {
    require_role(actor, Role::Developer, "update associations");
    if (update.health_score.has_value() && (*update.health_score < 0 || *update.health_score > k_full_health)) {
        throw std::invalid_argument("Association health score must be within 0-100");
    }
    if (update.tunnel_port.has_value() && (*update.tunnel_port <= 0 || *update.tunnel_port > k_max_port)) {
        throw std::invalid_argument("Tunnel port must be within 1-65535");
    }

    std::optional<Transition> transition;
    TargetGatewayAssociation snapshot{};
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_association = map_associations_.find(association_id);
        if (iterator_association == map_associations_.end()) {
            throw NotFoundError("association", std::to_string(association_id));
        }
        TargetGatewayAssociation& association = iterator_association->second;
        if (update.status.has_value() && is_live(*update.status) && !is_live(association.status)) {
            const TargetGatewayAssociation* other = live_locked(association.target_id);
            if (other != nullptr && other->id != association.id) {
                throw ConflictError("Target " + std::to_string(association.target_id) + " already has a live association with " + other->gateway_id,
                                    {std::to_string(other->id)});
            }
        }
        if (update.tunnel_id.has_value()) {
            association.tunnel_id = update.tunnel_id;
        }
        if (update.tunnel_port.has_value()) {
            association.tunnel_port = update.tunnel_port;
        }
        if (update.tunnel_status.has_value()) {
            association.tunnel_status = *update.tunnel_status;
        }
        if (update.health_score.has_value()) {
            association.health_score = update.health_score;
            association.last_health_check = now;
        }
        if (update.status.has_value() && *update.status != association.status) {
            transition = Transition{association, association.status, "manual_update"};
            set_status_locked(association, *update.status, now);
            transition->association = association;
        }
        association.updated_at = now;
        if (device_registry_.find(association.target_id).has_value()) {
            device_registry_.mirror_association(association.target_id, association.status, association.health_score, now);
        }
        snapshot = association;
    }
    if (transition.has_value()) {
        publish_transition(*transition);
    }
    return snapshot;
}

HealthCheckReport AssociationManager::run_health_checks(TimePoint now, Minutes recheck_interval, const std::optional<GatewayId>& gateway_id) {
    HealthCheckReport report{};
    std::vector<Transition> transitions;
    {
        std::scoped_lock lock(mutex_);
        for (auto& [association_id, association] : map_associations_) {
            if (association.status != AssociationStatus::Connected && association.status != AssociationStatus::Connecting) {
                continue;
            }
            if (gateway_id.has_value() && association.gateway_id != *gateway_id) {
                continue;
            }
            if (association.last_health_check.has_value() && now - *association.last_health_check < recheck_interval) {
                ++report.skipped;
                continue;
            }
            try {
                ++report.checked;
                if (auto transition = score_locked(association, now); transition.has_value()) {
                    report.changed.push_back(transition->association);
                    transitions.push_back(std::move(*transition));
                }
            } catch (const std::exception& exc) {
                logger_->error(R"({{"component":"association_manager","association":{},"health_check_error":{}}})", association_id, json_quote(exc.what()));
            }
        }
    }
    if (report.checked > 0) {
        logger_->info(R"({{"component":"association_manager","action":"health_check","checked":{},"skipped":{},"changed":{}}})",
                      report.checked,
                      report.skipped,
                      report.changed.size());
    }
    for (const Transition& transition : transitions) {
        publish_transition(transition);
    }
    return report;
}

std::optional<TargetGatewayAssociation> AssociationManager::check_association(AssociationId association_id, TimePoint now) {
    std::optional<Transition> transition;
    TargetGatewayAssociation snapshot{};
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_association = map_associations_.find(association_id);
        if (iterator_association == map_associations_.end()) {
            logger_->warn(R"({{"component":"association_manager","association":{},"health_check":"unknown association"}})", association_id);
            return std::nullopt;
        }
        transition = score_locked(iterator_association->second, now);
        snapshot = iterator_association->second;
    }
    if (transition.has_value()) {
        publish_transition(*transition);
    }
    return snapshot;
}

std::vector<TargetGatewayAssociation> AssociationManager::cleanup_inactive(TimePoint now, std::chrono::hours inactivity) {
    std::vector<TargetGatewayAssociation> removed;
    {
        std::scoped_lock lock(mutex_);
        for (auto iterator_association = map_associations_.begin(); iterator_association != map_associations_.end();) {
            const TargetGatewayAssociation& association = iterator_association->second;
            if (is_live(association.status) || now - association.updated_at <= inactivity) {
                ++iterator_association;
                continue;
            }
            try {
                const auto device = device_registry_.find(association.target_id);
                // Only clear the device mirror when no newer live binding replaced this one.
                if (device.has_value() && live_locked(association.target_id) == nullptr) {
                    device_registry_.mirror_association(association.target_id, AssociationStatus::Disconnected, std::nullopt, now);
                }
            } catch (const DevicePoolError& exc) {
                logger_->error(R"({{"component":"association_manager","association":{},"cleanup_error":{}}})", association.id, json_quote(exc.what()));
            }
            removed.push_back(association);
            iterator_association = map_associations_.erase(iterator_association);
        }
    }
    if (!removed.empty()) {
        logger_->info(R"({{"component":"association_manager","action":"cleanup","removed":{}}})", removed.size());
    }
    for (const TargetGatewayAssociation& association : removed) {
        publish(event_type::k_association_removed, association, {{"last_status", std::string{to_string(association.status)}}});
    }
    return removed;
}

std::optional<TargetGatewayAssociation> AssociationManager::find(AssociationId association_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_association = map_associations_.find(association_id);
    if (iterator_association == map_associations_.end()) {
        return std::nullopt;
    }
    return iterator_association->second;
}

std::optional<TargetGatewayAssociation> AssociationManager::live_association_for(DeviceId device_id) const {
    std::scoped_lock lock(mutex_);
    for (const auto& [association_id, association] : map_associations_) {
        if (association.target_id == device_id && is_live(association.status)) {
            return association;
        }
    }
    return std::nullopt;
}

std::vector<TargetGatewayAssociation> AssociationManager::for_gateway(const GatewayId& gateway_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<TargetGatewayAssociation> associations;
    for (const auto& [association_id, association] : map_associations_) {
        if (association.gateway_id == gateway_id) {
            associations.push_back(association);
        }
    }
    return associations;
}

std::vector<TargetGatewayAssociation> AssociationManager::list() const {
    std::scoped_lock lock(mutex_);
    std::vector<TargetGatewayAssociation> associations;
    associations.reserve(map_associations_.size());
    for (const auto& [association_id, association] : map_associations_) {
        associations.push_back(association);
    }
    return associations;
}

bool AssociationManager::has_live_associations(const GatewayId& gateway_id) const {
    std::scoped_lock lock(mutex_);
    return std::any_of(map_associations_.begin(), map_associations_.end(), [&gateway_id](const auto& entry) {
        return entry.second.gateway_id == gateway_id && is_live(entry.second.status);
    });
}

AssociationStatistics AssociationManager::statistics() const {
    std::scoped_lock lock(mutex_);
    AssociationStatistics stats{};
    stats.total = map_associations_.size();
    int health_sum = 0;
    int health_count = 0;
    for (const auto& [association_id, association] : map_associations_) {
        if (is_live(association.status)) {
            ++stats.live;
        }
        ++stats.by_status[std::string{to_string(association.status)}];
        if (association.health_score.has_value()) {
            health_sum += *association.health_score;
            ++health_count;
        }
    }
    if (health_count > 0) {
        stats.average_health = static_cast<double>(health_sum) / health_count;
    }
    return stats;
}

TargetGatewayAssociation AssociationManager::associate_locked(const Principal& actor,
                                                              DeviceId device_id,
                                                              const GatewayId& gateway_id,
                                                              AssociationStatus initial_status,
                                                              TimePoint now,
                                                              bool& created) {
    created = false;
    if (!is_live(initial_status)) {
        throw std::invalid_argument("Associations start pending, connecting or connected");
    }
    if (!device_registry_.find(device_id).has_value()) {
        throw NotFoundError("device", std::to_string(device_id));
    }
    const auto gateway = gateway_registry_.find(gateway_id);
    if (!gateway.has_value()) {
        throw NotFoundError("gateway", gateway_id);
    }
    if (!gateway->is_active) {
        throw ConflictError("Gateway " + gateway_id + " is deactivated", {gateway_id});
    }

    if (const TargetGatewayAssociation* existing = live_locked(device_id); existing != nullptr) {
        if (existing->gateway_id == gateway_id) {
            return *existing;
        }
        throw ConflictError("Target " + std::to_string(device_id) + " is already associated with gateway " + existing->gateway_id +
                                "; disassociate it first",
                            {std::to_string(existing->id), existing->gateway_id});
    }

    TargetGatewayAssociation association{};
    association.id = next_association_id_++;
    association.target_id = device_id;
    association.gateway_id = gateway_id;
    association.status = initial_status;
    association.created_by = actor.user_id;
    association.created_at = now;
    association.updated_at = now;
    map_associations_.emplace(association.id, association);

    gateway_registry_.adjust_target_count(gateway_id, 1, now);
    device_registry_.mirror_association(device_id, association.status, std::nullopt, now);
    created = true;

    logger_->info(R"({{"component":"association_manager","device":{},"gateway":"{}","action":"associated","association":{}}})",
                  device_id,
                  gateway_id,
                  association.id);
    return association;
}

TargetGatewayAssociation* AssociationManager::live_locked(DeviceId device_id) {
    for (auto& [association_id, association] : map_associations_) {
        if (association.target_id == device_id && is_live(association.status)) {
            return &association;
        }
    }
    return nullptr;
}

std::optional<AssociationManager::Transition> AssociationManager::score_locked(TargetGatewayAssociation& association, TimePoint now) {
    const auto device = device_registry_.find(association.target_id);
    if (!device.has_value()) {
        logger_->warn(R"({{"component":"association_manager","association":{},"health_check":"target {} no longer exists"}})",
                      association.id,
                      association.target_id);
        return std::nullopt;
    }
    const int health = std::clamp(health_probe_->score(association, *device, gateway_registry_.find(association.gateway_id)), 0, k_full_health);
    const AssociationStatus previous_status = association.status;
    const AssociationStatus next_status = classify_health(health);

    association.health_score = health;
    association.last_health_check = now;
    if (next_status != previous_status) {
        set_status_locked(association, next_status, now);
    }
    association.updated_at = now;
    device_registry_.mirror_association(association.target_id, association.status, health, now);

    if (next_status == previous_status) {
        return std::nullopt;
    }
    return Transition{association, previous_status, "health_check"};
}

void AssociationManager::set_status_locked(TargetGatewayAssociation& association, AssociationStatus status, TimePoint now) {
    const bool was_live = is_live(association.status);
    association.status = status;
    association.updated_at = now;
    if (was_live && !is_live(status)) {
        gateway_registry_.adjust_target_count(association.gateway_id, -1, now);
    } else if (!was_live && is_live(status)) {
        gateway_registry_.adjust_target_count(association.gateway_id, 1, now);
    }
}

void AssociationManager::publish(const std::string& type, const TargetGatewayAssociation& association, std::map<std::string, std::string> details) {
    LifecycleEvent event{};
    event.type = type;
    event.subjects["association"] = std::to_string(association.id);
    event.subjects["device"] = std::to_string(association.target_id);
    event.subjects["gateway"] = association.gateway_id;
    event.details = std::move(details);
    publish_event(*event_sink_, event, *logger_);
}

void AssociationManager::publish_transition(const Transition& transition) {
    std::map<std::string, std::string> details{
        {"old_status", std::string{to_string(transition.old_status)}},
        {"new_status", std::string{to_string(transition.association.status)}},
        {"reason", transition.reason},
    };
    if (transition.association.health_score.has_value()) {
        details["health_score"] = std::to_string(*transition.association.health_score);
    }
    publish(event_type::k_association_status_changed, transition.association, std::move(details));
}

}  // namespace device_pool
