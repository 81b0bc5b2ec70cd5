// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight enums used throughout the pool
// (time primitives, identifiers, device/gateway/reservation status sets) plus
// their string conversions.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace device_pool {

/**
 * @brief Wall clock used for leases, quotas and heartbeats.
 *
 * Daily quotas are evaluated on UTC calendar days, so the system clock is used
 * instead of the steady clock.
 */
using SystemClock = std::chrono::system_clock;

/** @brief Alias for timestamps captured from the system clock. */
using TimePoint = SystemClock::time_point;

/** @brief Alias for durations measured in seconds with double precision. */
using Duration = std::chrono::duration<double>;

using Minutes = std::chrono::minutes;
using Seconds = std::chrono::seconds;

using DeviceId = std::int64_t;
using ReservationId = std::int64_t;
using PolicyId = std::int64_t;
using UserId = std::int64_t;
using AssociationId = std::int64_t;
using GatewayId = std::string;

/** @brief Kind of leasable unit. */
enum class DeviceType {
    Physical,
    Virtual,
    Emulator
};

/** @brief Lease-relevant condition of a device. */
enum class DeviceStatus {
    Available,    /**< Reported by its gateway and free to book. */
    Reserved,     /**< Held by an active reservation. */
    Offline,      /**< Absent from the latest heartbeat or stale. */
    Maintenance,  /**< Manually withdrawn; never overwritten by heartbeats. */
    Unhealthy     /**< Reported but failing health checks. */
};

enum class GatewayType {
    Master,
    Region,
    Site,
    Standalone
};

enum class GatewayStatus {
    Online,
    Offline,
    Maintenance,
    Degraded
};

/** @brief Binding state between a device and the gateway serving it. */
enum class AssociationStatus {
    Pending,
    Connecting,
    Connected,
    Disconnected,
    Failed
};

enum class ReservationStatus {
    Pending,
    Active,
    Completed,
    Cancelled,
    Expired
};

enum class ReservationPriority {
    Low,
    Normal,
    High,
    Critical
};

/** @brief Half-open interval `[start, end)`. */
struct TimeWindow final {
    TimePoint start{};
    TimePoint end{};

    [[nodiscard]] Minutes length() const {
        return std::chrono::duration_cast<Minutes>(end - start);
    }
    [[nodiscard]] bool contains(TimePoint instant) const noexcept {
        return start <= instant && instant < end;
    }
};

[[nodiscard]] std::string_view to_string(DeviceType value) noexcept;
[[nodiscard]] std::string_view to_string(DeviceStatus value) noexcept;
[[nodiscard]] std::string_view to_string(GatewayType value) noexcept;
[[nodiscard]] std::string_view to_string(GatewayStatus value) noexcept;
[[nodiscard]] std::string_view to_string(AssociationStatus value) noexcept;
[[nodiscard]] std::string_view to_string(ReservationStatus value) noexcept;
[[nodiscard]] std::string_view to_string(ReservationPriority value) noexcept;

[[nodiscard]] std::optional<GatewayType> parse_gateway_type(std::string_view text);
[[nodiscard]] std::optional<GatewayStatus> parse_gateway_status(std::string_view text);

/** @brief True for statuses that no longer change. */
[[nodiscard]] bool is_terminal(ReservationStatus status) noexcept;

/** @brief Render @p instant as an ISO-8601 UTC timestamp with second precision. */
[[nodiscard]] std::string format_timestamp(TimePoint instant);

}  // namespace device_pool
