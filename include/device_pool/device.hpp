// === Device Records ==========================================================
//
// Leasable target devices and the heartbeat payloads gateway agents push to
// describe them.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "device_pool/types.hpp"

namespace device_pool {

/**
 * @brief Leasable unit (physical handset, virtual device or emulator).
 *
 * `status == Reserved` means at most one active reservation references the
 * device. `Offline` and `Maintenance` are never overwritten silently by
 * heartbeat reconciliation.
 */
struct TargetDevice final {
    DeviceId id{};
    std::string name{};
    GatewayId gateway_id{};
    DeviceType device_type{DeviceType::Physical};
    std::optional<std::string> serial_number{};
    std::string ip_address{};
    std::string android_version{};
    std::optional<int> api_level{};
    std::string manufacturer{};
    std::string model{};
    std::string location{};
    std::string adb_endpoint{};
    std::string ssh_endpoint{};
    std::optional<int> memory_mb{};
    std::optional<int> storage_gb{};
    std::string screen_resolution{};
    std::vector<std::string> network_capabilities{};
    std::vector<std::string> tags{};
    std::vector<std::string> purpose{};

    DeviceStatus status{DeviceStatus::Offline};
    bool adb_status{};                                    /**< adb reachability reported by the gateway. */
    bool serial_status{};                                 /**< Serial console reachability. */
    std::optional<int> health_score{};                    /**< 0-100, empty until first check. */
    std::optional<TimePoint> health_check_timestamp{};
    std::optional<TimePoint> last_heartbeat{};
    int heartbeat_interval_seconds{10};
    bool is_active{true};
    bool deactivated_by_staleness{};                      /**< Re-sighting re-activates only these. */
    std::string deactivation_reason{};

    std::optional<AssociationStatus> association_status{};
    std::optional<int> association_health{};

    TimePoint created_at{};
    TimePoint updated_at{};
};

/** @brief One device entry inside a gateway heartbeat batch. */
struct HeartbeatDeviceReport final {
    std::string name{};
    DeviceType device_type{DeviceType::Physical};
    std::optional<std::string> serial_number{};
    std::string ip_address{};
    std::string android_version{};
    std::optional<int> api_level{};
    std::string manufacturer{};
    std::string model{};
    std::string adb_endpoint{};
    std::string ssh_endpoint{};
    std::optional<int> memory_mb{};
    std::optional<int> storage_gb{};
    std::string screen_resolution{};
    std::vector<std::string> network_capabilities{};
    std::optional<std::vector<std::string>> tags{};
    std::optional<std::vector<std::string>> purpose{};
    bool adb_status{};
    bool serial_status{};
    std::optional<int> health_score{};
    std::optional<int> heartbeat_interval_seconds{};
};

/** @brief Periodic device report pushed by one gateway agent. */
struct HeartbeatBatch final {
    GatewayId gateway_id{};
    std::vector<HeartbeatDeviceReport> devices{};
    TimePoint timestamp{};
};

/** @brief Outcome of reconciling one heartbeat batch. */
struct HeartbeatResult final {
    std::vector<TargetDevice> updated{};        /**< Matched devices after reconciliation. */
    std::vector<TargetDevice> created{};        /**< Auto-registered devices. */
    std::vector<TargetDevice> went_offline{};   /**< Devices absent from this batch that left service. */
    std::vector<std::string> rejected{};        /**< One message per skipped report entry. */
};

/** @brief Manual registration or field update; status is never set through it. */
struct DeviceUpdate final {
    std::optional<std::string> name{};
    std::optional<DeviceType> device_type{};
    std::optional<std::string> serial_number{};
    std::optional<std::string> ip_address{};
    std::optional<std::string> location{};
    std::optional<std::string> adb_endpoint{};
    std::optional<std::string> ssh_endpoint{};
    std::optional<std::vector<std::string>> tags{};
    std::optional<std::vector<std::string>> purpose{};
    std::optional<int> heartbeat_interval_seconds{};
};

struct DeviceFilter final {
    std::optional<GatewayId> gateway_id{};
    std::optional<DeviceStatus> status{};
    std::optional<DeviceType> device_type{};
    std::optional<std::string> tag{};
    std::optional<bool> is_active{};
};

struct DeviceStatistics final {
    std::size_t total{};
    std::size_t active{};
    std::map<std::string, std::size_t> by_status{};
    std::map<std::string, std::size_t> by_type{};
    std::map<GatewayId, std::size_t> by_gateway{};
};

}  // namespace device_pool
