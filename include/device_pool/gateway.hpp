// === Gateway Records =========================================================
//
// Site, region and master gateways hosting devices, the heartbeat they push on
// their own channel, and the filter used by listings and exports.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "device_pool/types.hpp"

namespace device_pool {

/**
 * @brief Node of the gateway forest.
 *
 * `parent_gateway_id` edges must stay acyclic. `current_targets` follows the
 * live associations bound to the gateway.
 */
struct Gateway final {
    GatewayId gateway_id{};
    std::string name{};
    std::string description{};
    GatewayType gateway_type{GatewayType::Standalone};
    std::optional<GatewayId> parent_gateway_id{};

    GatewayStatus status{GatewayStatus::Offline};
    std::optional<TimePoint> last_heartbeat{};
    std::optional<int> health_score{};
    std::optional<TimePoint> health_check_timestamp{};

    std::string hostname{};
    std::string ip_address{};
    int ssh_port{22};
    int api_port{8000};
    std::string location{};
    std::string region{};
    std::string environment{};                   /**< production, staging, development, ... */

    std::optional<int> max_targets{};
    int current_targets{};
    std::optional<int> max_concurrent_sessions{};
    int current_sessions{};
    std::optional<double> cpu_usage{};
    std::optional<double> memory_usage{};
    std::optional<double> disk_usage{};

    std::vector<std::string> features{};
    std::vector<std::string> tags{};

    bool is_active{true};
    TimePoint created_at{};
    TimePoint updated_at{};
};

/** @brief Partial update; empty fields are left untouched. */
struct GatewayUpdate final {
    std::optional<std::string> name{};
    std::optional<std::string> description{};
    std::optional<GatewayType> gateway_type{};
    std::optional<GatewayId> parent_gateway_id{};
    bool clear_parent{};                          /**< Detach from the current parent. */
    std::optional<std::string> hostname{};
    std::optional<std::string> ip_address{};
    std::optional<int> ssh_port{};
    std::optional<int> api_port{};
    std::optional<std::string> location{};
    std::optional<std::string> region{};
    std::optional<std::string> environment{};
    std::optional<int> max_targets{};
    std::optional<int> max_concurrent_sessions{};
    std::optional<std::vector<std::string>> features{};
    std::optional<std::vector<std::string>> tags{};
    std::optional<bool> is_active{};
};

/** @brief Gateway-level heartbeat (separate from device heartbeats). */
struct GatewayHeartbeat final {
    GatewayId gateway_id{};
    GatewayStatus status{GatewayStatus::Online};
    std::optional<int> health_score{};
    std::optional<int> current_sessions{};
    std::optional<double> cpu_usage{};
    std::optional<double> memory_usage{};
    std::optional<double> disk_usage{};
};

struct GatewayFilter final {
    std::vector<GatewayStatus> statuses{};       /**< Any of; empty matches all. */
    std::vector<GatewayType> gateway_types{};    /**< Any of; empty matches all. */
    std::optional<bool> is_active{};
    std::vector<std::string> tags{};             /**< All must be present. */
    std::optional<std::string> region{};
    std::optional<std::string> location{};
    std::optional<std::string> environment{};
    std::optional<GatewayId> parent_gateway_id{};
    std::optional<int> health_score_min{};
    std::optional<std::string> search{};         /**< Case-insensitive match on id, name or description. */
};

/** @brief True when @p gateway passes every criterion set in @p filter. */
[[nodiscard]] bool matches(const Gateway& gateway, const GatewayFilter& filter);

/** @brief One tree of the gateway forest. */
struct GatewayNode final {
    Gateway gateway{};
    std::vector<GatewayNode> children{};
};

struct GatewayStatistics final {
    std::size_t total{};
    std::size_t active{};
    std::map<std::string, std::size_t> by_status{};       /**< Active gateways only. */
    std::map<std::string, std::size_t> by_type{};
    std::map<std::string, std::size_t> by_region{};
    std::map<std::string, std::size_t> by_environment{};
    int total_targets{};
    int total_sessions{};
};

}  // namespace device_pool
