#include "device_pool/types.hpp"

#include <array>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace device_pool {

namespace {

template <typename Enum, std::size_t N>
using NameTable = std::array<std::pair<Enum, std::string_view>, N>;

constexpr NameTable<DeviceType, 3> k_device_type_names{{
    {DeviceType::Physical, "physical"},
    {DeviceType::Virtual, "virtual"},
    {DeviceType::Emulator, "emulator"},
}};

constexpr NameTable<DeviceStatus, 5> k_device_status_names{{
    {DeviceStatus::Available, "available"},
    {DeviceStatus::Reserved, "reserved"},
    {DeviceStatus::Offline, "offline"},
    {DeviceStatus::Maintenance, "maintenance"},
    {DeviceStatus::Unhealthy, "unhealthy"},
}};

constexpr NameTable<GatewayType, 4> k_gateway_type_names{{
    {GatewayType::Master, "master"},
    {GatewayType::Region, "region"},
    {GatewayType::Site, "site"},
    {GatewayType::Standalone, "standalone"},
}};

constexpr NameTable<GatewayStatus, 4> k_gateway_status_names{{
    {GatewayStatus::Online, "online"},
    {GatewayStatus::Offline, "offline"},
    {GatewayStatus::Maintenance, "maintenance"},
    {GatewayStatus::Degraded, "degraded"},
}};

constexpr NameTable<AssociationStatus, 5> k_association_status_names{{
    {AssociationStatus::Pending, "pending"},
    {AssociationStatus::Connecting, "connecting"},
    {AssociationStatus::Connected, "connected"},
    {AssociationStatus::Disconnected, "disconnected"},
    {AssociationStatus::Failed, "failed"},
}};

constexpr NameTable<ReservationStatus, 5> k_reservation_status_names{{
    {ReservationStatus::Pending, "pending"},
    {ReservationStatus::Active, "active"},
    {ReservationStatus::Completed, "completed"},
    {ReservationStatus::Cancelled, "cancelled"},
    {ReservationStatus::Expired, "expired"},
}};

constexpr NameTable<ReservationPriority, 4> k_reservation_priority_names{{
    {ReservationPriority::Low, "low"},
    {ReservationPriority::Normal, "normal"},
    {ReservationPriority::High, "high"},
    {ReservationPriority::Critical, "critical"},
}};

template <typename Enum, std::size_t N>
std::string_view lookup_name(const NameTable<Enum, N>& table, Enum value) noexcept {
    for (const auto& [candidate, name] : table) {
        if (candidate == value) {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> lookup_value(const NameTable<Enum, N>& table, std::string_view text) {
    for (const auto& [candidate, name] : table) {
        if (name == text) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string_view to_string(DeviceType value) noexcept {
    return lookup_name(k_device_type_names, value);
}

std::string_view to_string(DeviceStatus value) noexcept {
    return lookup_name(k_device_status_names, value);
}

std::string_view to_string(GatewayType value) noexcept {
    return lookup_name(k_gateway_type_names, value);
}

std::string_view to_string(GatewayStatus value) noexcept {
    return lookup_name(k_gateway_status_names, value);
}

std::string_view to_string(AssociationStatus value) noexcept {
    return lookup_name(k_association_status_names, value);
}

std::string_view to_string(ReservationStatus value) noexcept {
    return lookup_name(k_reservation_status_names, value);
}

std::string_view to_string(ReservationPriority value) noexcept {
    return lookup_name(k_reservation_priority_names, value);
}

std::optional<GatewayType> parse_gateway_type(std::string_view text) {
    return lookup_value(k_gateway_type_names, text);
}

std::optional<GatewayStatus> parse_gateway_status(std::string_view text) {
    return lookup_value(k_gateway_status_names, text);
}

bool is_terminal(ReservationStatus status) noexcept {
    return status == ReservationStatus::Completed
        || status == ReservationStatus::Cancelled
        || status == ReservationStatus::Expired;
}

std::string format_timestamp(TimePoint instant) {
    const std::time_t seconds = SystemClock::to_time_t(instant);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(seconds));
}

}  // namespace device_pool
