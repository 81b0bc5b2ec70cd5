#include "device_pool/admission_controller.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace device_pool {

namespace {
using Days = std::chrono::days;

AdmissionDecision accept(const EffectivePolicy& policy) {
    AdmissionDecision decision{};
    decision.available = true;
    decision.reason = "Time slot is available";
    decision.policy = policy;
    return decision;
}

AdmissionDecision reject(ErrorKind kind, std::optional<PolicyLimit> limit, std::string reason, const EffectivePolicy& policy) {
    AdmissionDecision decision{};
    decision.available = false;
    decision.rejection = kind;
    decision.violated_limit = limit;
    decision.reason = std::move(reason);
    decision.policy = policy;
    return decision;
}

bool is_bookable(const TargetDevice& device) noexcept {
    return device.is_active && (device.status == DeviceStatus::Available || device.status == DeviceStatus::Reserved);
}

/** @brief Reservations that count against the requester's quota and cooldown. */
bool counts_for_user(const Reservation& reservation, std::optional<ReservationId> exclude) noexcept {
    if (exclude.has_value() && reservation.id == *exclude) {
        return false;
    }
    return reservation.status != ReservationStatus::Cancelled && !reservation.is_admin_override;
}

std::string policy_label(const EffectivePolicy& policy) {
    return policy.policy.has_value() ? "policy '" + policy.policy->name + "'" : "system default policy";
}
}  // namespace

std::vector<Reservation> find_conflicts(const TimeWindow& window, const std::vector<Reservation>& reservations, std::optional<ReservationId> exclude) {
    std::vector<Reservation> conflicts;
    for (const Reservation& reservation : reservations) {
        if (exclude.has_value() && reservation.id == *exclude) {
            continue;
        }
        if (holds_window(reservation.status) && windows_overlap(reservation.window, window)) {
            conflicts.push_back(reservation);
        }
    }
    return conflicts;
}

void validate_window(const TimeWindow& window) {
    if (window.end <= window.start) {
        throw std::invalid_argument("Reservation end_time must be after start_time");
    }
}

void throw_rejection(const AdmissionDecision& decision, DeviceId device_id) {
    switch (decision.rejection.value_or(ErrorKind::Conflict)) {
        case ErrorKind::NotFound:
            throw NotFoundError("device", std::to_string(device_id));
        case ErrorKind::PolicyViolation:
            throw PolicyViolationError(decision.violated_limit.value_or(PolicyLimit::MaxDuration), decision.reason);
        default: {
            std::vector<std::string> conflicting_ids;
            for (const Reservation& conflict : decision.conflicts) {
                conflicting_ids.push_back(std::to_string(conflict.id));
            }
            if (conflicting_ids.empty()) {
                conflicting_ids.push_back(std::to_string(device_id));
            }
            throw ConflictError(decision.reason, std::move(conflicting_ids));
        }
    }
}

AdmissionController::AdmissionController(DeviceRegistry& device_registry, PolicyStore& policy_store, ReservationRepository& repository)
    : device_registry_(device_registry),
      policy_store_(policy_store),
      repository_(repository) {}

AdmissionDecision AdmissionController::evaluate(const ReservationRequest& request, const AdmissionSnapshot& snapshot, TimePoint now) {
    validate_window(request.window);
    const EffectivePolicy& policy = snapshot.policy;

    if (!snapshot.device.has_value()) {
        return reject(ErrorKind::NotFound, std::nullopt, fmt::format("Target device {} not found", request.device_id), policy);
    }
    const TargetDevice& device = *snapshot.device;
    if (!is_bookable(device)) {
        return reject(ErrorKind::Conflict,
                      std::nullopt,
                      fmt::format("Target device {} is {}{}", device.id, to_string(device.status), device.is_active ? "" : " and inactive"),
                      policy);
    }

    std::vector<Reservation> conflicts = find_conflicts(request.window, snapshot.device_reservations, request.exclude_reservation);
    if (!conflicts.empty()) {
        AdmissionDecision decision =
            reject(ErrorKind::Conflict, std::nullopt, fmt::format("Time slot conflicts with {} existing reservation(s)", conflicts.size()), policy);
        decision.conflicts = std::move(conflicts);
        return decision;
    }

    if (request.window.end - request.window.start > Minutes{policy.max_duration_minutes}) {
        return reject(ErrorKind::PolicyViolation,
                      PolicyLimit::MaxDuration,
                      fmt::format("Reservation exceeds the maximum duration of {} minutes under {}", policy.max_duration_minutes, policy_label(policy)),
                      policy);
    }

    const TimePoint day_start = std::chrono::floor<Days>(now);
    const TimePoint day_end = day_start + Days{1};
    const auto reservations_today = std::count_if(snapshot.user_reservations.begin(),
                                                  snapshot.user_reservations.end(),
                                                  [&](const Reservation& reservation) {
                                                      return counts_for_user(reservation, request.exclude_reservation) &&
                                                             reservation.window.start >= day_start && reservation.window.start < day_end;
                                                  });
    if (reservations_today >= policy.max_reservations_per_day) {
        return reject(ErrorKind::PolicyViolation,
                      PolicyLimit::DailyQuota,
                      fmt::format("Daily reservation limit of {} reached under {}", policy.max_reservations_per_day, policy_label(policy)),
                      policy);
    }

    std::optional<TimePoint> previous_end;
    for (const Reservation& reservation : snapshot.user_reservations) {
        if (!counts_for_user(reservation, request.exclude_reservation) || reservation.window.end > request.window.start) {
            continue;
        }
        if (!previous_end.has_value() || reservation.window.end > *previous_end) {
            previous_end = reservation.window.end;
        }
    }
    if (previous_end.has_value() && request.window.start < *previous_end + Minutes{policy.cooldown_minutes}) {
        return reject(ErrorKind::PolicyViolation,
                      PolicyLimit::Cooldown,
                      fmt::format("Cooldown of {} minutes after the previous reservation ending {} has not elapsed",
                                  policy.cooldown_minutes,
                                  format_timestamp(*previous_end)),
                      policy);
    }

    if (request.window.start - now > Days{policy.max_reservation_days_in_advance}) {
        return reject(ErrorKind::PolicyViolation,
                      PolicyLimit::AdvanceHorizon,
                      fmt::format("Reservations can be made at most {} days in advance", policy.max_reservation_days_in_advance),
                      policy);
    }

    if (policy.policy.has_value()) {
        const ReservationPolicy& winner = *policy.policy;
        if (winner.allowed_device_types.has_value()) {
            const auto& allowed = *winner.allowed_device_types;
            if (std::find(allowed.begin(), allowed.end(), device.device_type) == allowed.end()) {
                return reject(ErrorKind::PolicyViolation,
                              PolicyLimit::DeviceType,
                              fmt::format("Device type {} is not allowed under {}", to_string(device.device_type), policy_label(policy)),
                              policy);
            }
        }
        if (winner.allowed_roles.has_value() && request.role.has_value()) {
            const auto& allowed = *winner.allowed_roles;
            if (std::find(allowed.begin(), allowed.end(), *request.role) == allowed.end()) {
                return reject(ErrorKind::PolicyViolation,
                              PolicyLimit::Role,
                              fmt::format("Role {} is not allowed under {}", to_string(*request.role), policy_label(policy)),
                              policy);
            }
        }
    }

    return accept(policy);
}

AdmissionSnapshot AdmissionController::snapshot(const ReservationRequest& request) const {
    AdmissionSnapshot snapshot{};
    snapshot.device = device_registry_.find(request.device_id);
    snapshot.policy = policy_store_.effective(request.user_id, request.device_id);
    snapshot.device_reservations = repository_.for_device(request.device_id);
    snapshot.user_reservations = repository_.for_user(request.user_id);
    return snapshot;
}

AdmissionDecision AdmissionController::check_availability(const ReservationRequest& request, TimePoint now) const {
    return evaluate(request, snapshot(request), now);
}

}  // namespace device_pool
