#include "device_pool/gateway_registry.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

#include "device_pool/errors.hpp"
#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
constexpr int k_max_health_score{100};
constexpr int k_max_port{65'535};

bool is_valid_port(int port) noexcept {
    return port > 0 && port <= k_max_port;
}
}  // namespace

GatewayRegistry::GatewayRegistry(std::shared_ptr<EventSink> event_sink)
    : event_sink_(std::move(event_sink)),
      logger_(get_logger()) {
    if (event_sink_ == nullptr) {
        throw std::invalid_argument("GatewayRegistry requires an event sink");
    }
}

Gateway GatewayRegistry::create_gateway(const Principal& actor, Gateway gateway, TimePoint now) {
    require_role(actor, Role::Admin, "create gateways");
    validate(gateway);
    {
        std::unique_lock lock(mutex_);
        if (map_gateways_.count(gateway.gateway_id) != 0U) {
            throw ConflictError("Gateway " + gateway.gateway_id + " already exists", {gateway.gateway_id});
        }
        if (gateway.parent_gateway_id.has_value()) {
            if (*gateway.parent_gateway_id == gateway.gateway_id) {
                throw ConflictError("Gateway " + gateway.gateway_id + " cannot be its own parent", {gateway.gateway_id});
            }
            if (map_gateways_.count(*gateway.parent_gateway_id) == 0U) {
                throw NotFoundError("gateway", *gateway.parent_gateway_id);
            }
        }
        gateway.current_targets = 0;
        gateway.created_at = now;
        gateway.updated_at = now;
        map_gateways_.emplace(gateway.gateway_id, gateway);
    }
    logger_->info(R"({{"component":"gateway_registry","gateway":"{}","action":"created","type":"{}","parent":"{}"}})",
                  gateway.gateway_id,
                  to_string(gateway.gateway_type),
                  gateway.parent_gateway_id.value_or(""));
    publish(event_type::k_gateway_created,
            gateway.gateway_id,
            {{"name", gateway.name}, {"gateway_type", std::string{to_string(gateway.gateway_type)}}},
            actor.user_id);
    return gateway;
}

Gateway GatewayRegistry::update_gateway(const Principal& actor, const GatewayId& gateway_id, const GatewayUpdate& update, TimePoint now) {
    require_role(actor, Role::Admin, "update gateways");
    if (update.name.has_value() && update.name->empty()) {
        throw std::invalid_argument("Gateway name cannot be empty");
    }
    if ((update.ssh_port.has_value() && !is_valid_port(*update.ssh_port)) || (update.api_port.has_value() && !is_valid_port(*update.api_port))) {
        throw std::invalid_argument("Gateway ports must be within 1-65535");
    }

    Gateway snapshot{};
    std::map<std::string, std::string> changed_fields;
    {
        std::unique_lock lock(mutex_);
        Gateway& gateway = require_locked(gateway_id);

        if (update.parent_gateway_id.has_value()) {
            const GatewayId& parent_id = *update.parent_gateway_id;
            if (parent_id == gateway_id) {
                throw ConflictError("Gateway " + gateway_id + " cannot be its own parent", {gateway_id});
            }
            if (map_gateways_.count(parent_id) == 0U) {
                throw NotFoundError("gateway", parent_id);
            }
            if (is_ancestor_locked(gateway_id, parent_id)) {
                throw ConflictError("Setting parent " + parent_id + " on gateway " + gateway_id + " creates a cycle", {gateway_id, parent_id});
            }
        }

        if (update.clear_parent) {
            gateway.parent_gateway_id.reset();
            changed_fields["parent_gateway_id"] = "";
        } else if (update.parent_gateway_id.has_value()) {
            gateway.parent_gateway_id = update.parent_gateway_id;
            changed_fields["parent_gateway_id"] = *update.parent_gateway_id;
        }
        if (update.name.has_value()) {
            gateway.name = *update.name;
            changed_fields["name"] = *update.name;
        }
        if (update.description.has_value()) {
            gateway.description = *update.description;
            changed_fields["description"] = *update.description;
        }
        if (update.gateway_type.has_value()) {
            gateway.gateway_type = *update.gateway_type;
            changed_fields["gateway_type"] = std::string{to_string(*update.gateway_type)};
        }
        if (update.hostname.has_value()) {
            gateway.hostname = *update.hostname;
            changed_fields["hostname"] = *update.hostname;
        }
        if (update.ip_address.has_value()) {
            gateway.ip_address = *update.ip_address;
            changed_fields["ip_address"] = *update.ip_address;
        }
        if (update.ssh_port.has_value()) {
            gateway.ssh_port = *update.ssh_port;
            changed_fields["ssh_port"] = std::to_string(*update.ssh_port);
        }
        if (update.api_port.has_value()) {
            gateway.api_port = *update.api_port;
            changed_fields["api_port"] = std::to_string(*update.api_port);
        }
        if (update.location.has_value()) {
            gateway.location = *update.location;
            changed_fields["location"] = *update.location;
        }
        if (update.region.has_value()) {
            gateway.region = *update.region;
            changed_fields["region"] = *update.region;
        }
        if (update.environment.has_value()) {
            gateway.environment = *update.environment;
            changed_fields["environment"] = *update.environment;
        }
        if (update.max_targets.has_value()) {
            gateway.max_targets = update.max_targets;
            changed_fields["max_targets"] = std::to_string(*update.max_targets);
        }
        if (update.max_concurrent_sessions.has_value()) {
            gateway.max_concurrent_sessions = update.max_concurrent_sessions;
            changed_fields["max_concurrent_sessions"] = std::to_string(*update.max_concurrent_sessions);
        }
        if (update.features.has_value()) {
            gateway.features = *update.features;
            changed_fields["features"] = std::to_string(update.features->size());
        }
        if (update.tags.has_value()) {
            gateway.tags = *update.tags;
            changed_fields["tags"] = std::to_string(update.tags->size());
        }
        if (update.is_active.has_value()) {
            gateway.is_active = *update.is_active;
            changed_fields["is_active"] = *update.is_active ? "true" : "false";
        }
        gateway.updated_at = now;
        snapshot = gateway;
    }
    publish(event_type::k_gateway_updated, gateway_id, std::move(changed_fields), actor.user_id);
    return snapshot;
}

Gateway GatewayRegistry::deactivate_gateway(const Principal& actor, const GatewayId& gateway_id, TimePoint now) {
    require_role(actor, Role::Admin, "deactivate gateways");
    Gateway snapshot{};
    GatewayStatus previous_status{};
    {
        std::unique_lock lock(mutex_);
        Gateway& gateway = require_locked(gateway_id);
        previous_status = gateway.status;
        gateway.is_active = false;
        gateway.status = GatewayStatus::Maintenance;
        gateway.updated_at = now;
        snapshot = gateway;
    }
    logger_->info(R"({{"component":"gateway_registry","gateway":"{}","action":"deactivated","by":{}}})", gateway_id, actor.user_id);
    publish(event_type::k_gateway_deactivated,
            gateway_id,
            {{"old_status", std::string{to_string(previous_status)}}, {"new_status", std::string{to_string(GatewayStatus::Maintenance)}}},
            actor.user_id);
    return snapshot;
}

void GatewayRegistry::delete_gateway(const Principal& actor, const GatewayId& gateway_id, const std::function<bool(const GatewayId&)>& has_targets) {
    require_role(actor, Role::Admin, "delete gateways");
    {
        std::shared_lock lock(mutex_);
        ensure_deletable_locked(gateway_id);
    }
    // has_targets locks the association manager and the device registry, which
    // themselves read this registry; it must run without mutex_ held.
    if (has_targets && has_targets(gateway_id)) {
        throw ConflictError("Gateway " + gateway_id + " still has associated targets", {gateway_id});
    }
    {
        std::unique_lock lock(mutex_);
        ensure_deletable_locked(gateway_id);
        map_gateways_.erase(gateway_id);
    }
    logger_->info(R"({{"component":"gateway_registry","gateway":"{}","action":"deleted","by":{}}})", gateway_id, actor.user_id);
    publish(event_type::k_gateway_deleted, gateway_id, {}, actor.user_id);
}

std::optional<Gateway> GatewayRegistry::apply_heartbeat(const GatewayHeartbeat& heartbeat, TimePoint now) {
    if (heartbeat.health_score.has_value() && (*heartbeat.health_score < 0 || *heartbeat.health_score > k_max_health_score)) {
        logger_->warn(R"({{"component":"gateway_registry","gateway":"{}","heartbeat":"health_score outside 0-100"}})", heartbeat.gateway_id);
        return std::nullopt;
    }

    Gateway snapshot{};
    GatewayStatus previous_status{};
    {
        std::unique_lock lock(mutex_);
        const auto iterator_gateway = map_gateways_.find(heartbeat.gateway_id);
        if (iterator_gateway == map_gateways_.end()) {
            lock.unlock();
            logger_->warn(R"({{"component":"gateway_registry","gateway":"{}","heartbeat":"unknown gateway"}})", heartbeat.gateway_id);
            return std::nullopt;
        }
        Gateway& gateway = iterator_gateway->second;
        previous_status = gateway.status;
        // Deactivated gateways stay under maintenance until an admin brings them back.
        if (gateway.is_active) {
            gateway.status = heartbeat.status;
        }
        gateway.last_heartbeat = now;
        if (heartbeat.health_score.has_value()) {
            gateway.health_score = heartbeat.health_score;
            gateway.health_check_timestamp = now;
        }
        if (heartbeat.current_sessions.has_value()) {
            gateway.current_sessions = std::max(0, *heartbeat.current_sessions);
        }
        if (heartbeat.cpu_usage.has_value()) {
            gateway.cpu_usage = heartbeat.cpu_usage;
        }
        if (heartbeat.memory_usage.has_value()) {
            gateway.memory_usage = heartbeat.memory_usage;
        }
        if (heartbeat.disk_usage.has_value()) {
            gateway.disk_usage = heartbeat.disk_usage;
        }
        gateway.updated_at = now;
        snapshot = gateway;
    }

    if (previous_status != snapshot.status) {
        logger_->info(R"({{"component":"gateway_registry","gateway":"{}","old_status":"{}","new_status":"{}"}})",
                      snapshot.gateway_id,
                      to_string(previous_status),
                      to_string(snapshot.status));
        publish(event_type::k_gateway_status_changed,
                snapshot.gateway_id,
                {{"old_status", std::string{to_string(previous_status)}}, {"new_status", std::string{to_string(snapshot.status)}}},
                std::nullopt);
    }
    return snapshot;
}

std::vector<Gateway> GatewayRegistry::mark_stale_gateways(TimePoint now, Seconds stale_after) {
    std::vector<std::pair<Gateway, GatewayStatus>> transitions;
    {
        std::unique_lock lock(mutex_);
        for (auto& [gateway_id, gateway] : map_gateways_) {
            if (!gateway.is_active || (gateway.status != GatewayStatus::Online && gateway.status != GatewayStatus::Degraded)) {
                continue;
            }
            const TimePoint reference = gateway.last_heartbeat.value_or(gateway.created_at);
            if (now - reference <= stale_after) {
                continue;
            }
            const GatewayStatus previous_status = gateway.status;
            gateway.status = GatewayStatus::Offline;
            gateway.updated_at = now;
            transitions.emplace_back(gateway, previous_status);
        }
    }

    std::vector<Gateway> stale;
    stale.reserve(transitions.size());
    for (const auto& [gateway, previous_status] : transitions) {
        logger_->warn(R"({{"component":"gateway_registry","gateway":"{}","action":"stale","old_status":"{}"}})",
                      gateway.gateway_id,
                      to_string(previous_status));
        publish(event_type::k_gateway_status_changed,
                gateway.gateway_id,
                {{"old_status", std::string{to_string(previous_status)}},
                 {"new_status", std::string{to_string(GatewayStatus::Offline)}},
                 {"reason", "stale_heartbeat"}},
                std::nullopt);
        stale.push_back(gateway);
    }
    return stale;
}

void GatewayRegistry::adjust_target_count(const GatewayId& gateway_id, int delta, TimePoint now) {
    std::unique_lock lock(mutex_);
    const auto iterator_gateway = map_gateways_.find(gateway_id);
    if (iterator_gateway == map_gateways_.end()) {
        return;
    }
    Gateway& gateway = iterator_gateway->second;
    gateway.current_targets = std::max(0, gateway.current_targets + delta);
    gateway.updated_at = now;
}

std::optional<Gateway> GatewayRegistry::find(const GatewayId& gateway_id) const {
    std::shared_lock lock(mutex_);
    const auto iterator_gateway = map_gateways_.find(gateway_id);
    if (iterator_gateway == map_gateways_.end()) {
        return std::nullopt;
    }
    return iterator_gateway->second;
}

bool GatewayRegistry::exists(const GatewayId& gateway_id) const {
    std::shared_lock lock(mutex_);
    return map_gateways_.count(gateway_id) != 0U;
}

std::vector<Gateway> GatewayRegistry::list(const GatewayFilter& filter) const {
    std::shared_lock lock(mutex_);
    std::vector<Gateway> gateways;
    for (const auto& [gateway_id, gateway] : map_gateways_) {
        if (matches(gateway, filter)) {
            gateways.push_back(gateway);
        }
    }
    return gateways;
}

std::vector<Gateway> GatewayRegistry::children(const GatewayId& gateway_id) const {
    std::shared_lock lock(mutex_);
    std::vector<Gateway> result;
    for (const auto& [child_id, child] : map_gateways_) {
        if (child.parent_gateway_id == gateway_id) {
            result.push_back(child);
        }
    }
    return result;
}

std::vector<GatewayNode> GatewayRegistry::hierarchy() const {
    std::shared_lock lock(mutex_);
    std::vector<GatewayNode> roots;
    for (const auto& [gateway_id, gateway] : map_gateways_) {
        if (!gateway.is_active) {
            continue;
        }
        bool is_root = !gateway.parent_gateway_id.has_value();
        if (!is_root) {
            const auto iterator_parent = map_gateways_.find(*gateway.parent_gateway_id);
            is_root = iterator_parent == map_gateways_.end() || !iterator_parent->second.is_active;
        }
        if (is_root) {
            std::vector<GatewayId> path;
            roots.push_back(build_node_locked(gateway, path));
        }
    }
    return roots;
}

GatewayStatistics GatewayRegistry::statistics() const {
    std::shared_lock lock(mutex_);
    GatewayStatistics stats{};
    stats.total = map_gateways_.size();
    for (const auto& [gateway_id, gateway] : map_gateways_) {
        if (!gateway.is_active) {
            continue;
        }
        ++stats.active;
        ++stats.by_status[std::string{to_string(gateway.status)}];
        ++stats.by_type[std::string{to_string(gateway.gateway_type)}];
        ++stats.by_region[gateway.region.empty() ? "unassigned" : gateway.region];
        ++stats.by_environment[gateway.environment.empty() ? "unassigned" : gateway.environment];
        stats.total_targets += gateway.current_targets;
        stats.total_sessions += gateway.current_sessions;
    }
    return stats;
}

Gateway& GatewayRegistry::require_locked(const GatewayId& gateway_id) {
    const auto iterator_gateway = map_gateways_.find(gateway_id);
    if (iterator_gateway == map_gateways_.end()) {
        throw NotFoundError("gateway", gateway_id);
    }
    return iterator_gateway->second;
}

void GatewayRegistry::ensure_deletable_locked(const GatewayId& gateway_id) const {
    if (map_gateways_.count(gateway_id) == 0U) {
        throw NotFoundError("gateway", gateway_id);
    }
    for (const auto& [child_id, child] : map_gateways_) {
        if (child.parent_gateway_id == gateway_id) {
            throw ConflictError("Gateway " + gateway_id + " still has child gateways", {child_id});
        }
    }
}

bool GatewayRegistry::is_ancestor_locked(const GatewayId& candidate, const GatewayId& gateway_id) const {
    // Walk up from gateway_id; the visited set bounds the walk even if stored data were already cyclic.
    std::set<GatewayId> visited;
    std::optional<GatewayId> current = gateway_id;
    while (current.has_value() && visited.insert(*current).second) {
        if (*current == candidate) {
            return true;
        }
        const auto iterator_gateway = map_gateways_.find(*current);
        if (iterator_gateway == map_gateways_.end()) {
            return false;
        }
        current = iterator_gateway->second.parent_gateway_id;
    }
    return false;
}

GatewayNode GatewayRegistry::build_node_locked(const Gateway& gateway, std::vector<GatewayId>& path) const {
    GatewayNode node{};
    node.gateway = gateway;
    path.push_back(gateway.gateway_id);
    for (const auto& [child_id, child] : map_gateways_) {
        if (!child.is_active || child.parent_gateway_id != gateway.gateway_id) {
            continue;
        }
        if (std::find(path.begin(), path.end(), child_id) != path.end()) {
            continue;
        }
        node.children.push_back(build_node_locked(child, path));
    }
    path.pop_back();
    return node;
}

void GatewayRegistry::publish(const std::string& type,
                              const GatewayId& gateway_id,
                              std::map<std::string, std::string> details,
                              std::optional<UserId> user) {
    LifecycleEvent event{};
    event.type = type;
    event.subjects["gateway"] = gateway_id;
    if (user.has_value()) {
        event.subjects["user"] = std::to_string(*user);
    }
    event.details = std::move(details);
    publish_event(*event_sink_, event, *logger_);
}

void GatewayRegistry::validate(const Gateway& gateway) {
    if (gateway.gateway_id.empty()) {
        throw std::invalid_argument("Gateway id cannot be empty");
    }
    if (gateway.name.empty()) {
        throw std::invalid_argument("Gateway name cannot be empty");
    }
    if (!is_valid_port(gateway.ssh_port) || !is_valid_port(gateway.api_port)) {
        throw std::invalid_argument("Gateway ports must be within 1-65535");
    }
    if (gateway.health_score.has_value() && (*gateway.health_score < 0 || *gateway.health_score > k_max_health_score)) {
        throw std::invalid_argument("Gateway health score must be within 0-100");
    }
}

}  // namespace device_pool
