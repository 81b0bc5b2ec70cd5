// === Gateway Registry ========================================================
//
// Owns gateway records and the parent edges forming the gateway forest.
// Gateway heartbeats refresh status and capacity counters and only emit a
// status-changed event when the status actually moves.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "device_pool/event_sink.hpp"
#include "device_pool/gateway.hpp"
#include "device_pool/roles.hpp"

namespace device_pool {

class GatewayRegistry final {
  public:
    explicit GatewayRegistry(std::shared_ptr<EventSink> event_sink);

    /**
     * @brief Register a gateway.
     *
     * @throws ConflictError on a duplicate gateway id.
     * @throws NotFoundError when the parent does not exist.
     */
    Gateway create_gateway(const Principal& actor, Gateway gateway, TimePoint now);
    /** @brief Apply @p update; rejects parent changes that would make the gateway its own ancestor. */
    Gateway update_gateway(const Principal& actor, const GatewayId& gateway_id, const GatewayUpdate& update, TimePoint now);
    /** @brief Soft delete: inactive and under maintenance. */
    Gateway deactivate_gateway(const Principal& actor, const GatewayId& gateway_id, TimePoint now);
    /**
     * @brief Hard delete.
     *
     * @param has_targets Answers whether devices or live associations still
     *        reference the gateway; such gateways are kept. Called without
     *        the registry lock held, so it may query other components.
     */
    void delete_gateway(const Principal& actor, const GatewayId& gateway_id, const std::function<bool(const GatewayId&)>& has_targets);

    /**
     * @brief Apply a gateway-level heartbeat.
     *
     * Unknown gateways are stale input: the heartbeat is logged and dropped
     * and an empty optional is returned.
     */
    std::optional<Gateway> apply_heartbeat(const GatewayHeartbeat& heartbeat, TimePoint now);
    /** @brief Mark online/degraded gateways silent for longer than @p stale_after as offline. */
    std::vector<Gateway> mark_stale_gateways(TimePoint now, Seconds stale_after);

    /** @brief Shift `current_targets` by @p delta (never below zero). */
    void adjust_target_count(const GatewayId& gateway_id, int delta, TimePoint now);

    [[nodiscard]] std::optional<Gateway> find(const GatewayId& gateway_id) const;
    [[nodiscard]] bool exists(const GatewayId& gateway_id) const;
    [[nodiscard]] std::vector<Gateway> list(const GatewayFilter& filter = {}) const;
    [[nodiscard]] std::vector<Gateway> children(const GatewayId& gateway_id) const;
    /**
     * @brief Active gateways as root-to-leaf trees.
     *
     * Gateways with no parent, or whose parent is missing or inactive, are
     * roots.
     */
    [[nodiscard]] std::vector<GatewayNode> hierarchy() const;
    [[nodiscard]] GatewayStatistics statistics() const;

  private:
    [[nodiscard]] Gateway& require_locked(const GatewayId& gateway_id);
    void ensure_deletable_locked(const GatewayId& gateway_id) const;
    [[nodiscard]] bool is_ancestor_locked(const GatewayId& candidate, const GatewayId& gateway_id) const;
    [[nodiscard]] GatewayNode build_node_locked(const Gateway& gateway, std::vector<GatewayId>& path) const;
    void publish(const std::string& type, const GatewayId& gateway_id, std::map<std::string, std::string> details, std::optional<UserId> user);

    static void validate(const Gateway& gateway);

    mutable std::shared_mutex mutex_;
    std::map<GatewayId, Gateway> map_gateways_;
    std::shared_ptr<EventSink> event_sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
