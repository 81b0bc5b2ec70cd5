// === Admission Controller ====================================================
//
// Decides whether a reservation request may be granted. `evaluate` is a pure
// function of the request, a snapshot of the device/reservation/policy state
// and the current time; `check_availability` gathers that snapshot from the
// registries and is read-only.
//
// Checks run in order and stop at the first failure:
//   1. device exists and is bookable (available or reserved)
//   2. no overlap with pending/active reservations on the device
//   3. policy resolution (highest priority wins, defaults otherwise)
//   4. duration cap
//   5. daily quota on the UTC calendar day of `now`
//   6. cooldown after the user's previous reservation
//   7. advance-booking horizon
//   8. device-type and role allow-lists

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "device_pool/device.hpp"
#include "device_pool/device_registry.hpp"
#include "device_pool/errors.hpp"
#include "device_pool/policy_store.hpp"
#include "device_pool/reservation.hpp"
#include "device_pool/roles.hpp"

namespace device_pool {

struct ReservationRequest final {
    UserId user_id{};
    DeviceId device_id{};
    TimeWindow window{};
    std::optional<Role> role{};                            /**< Checked against role allow-lists when present. */
    std::optional<ReservationId> exclude_reservation{};    /**< Reservation being edited; ignored by every check. */
};

/** @brief Everything admission reads, captured at one instant. */
struct AdmissionSnapshot final {
    std::optional<TargetDevice> device{};
    EffectivePolicy policy{};
    std::vector<Reservation> device_reservations{};
    std::vector<Reservation> user_reservations{};
};

struct AdmissionDecision final {
    bool available{};
    std::string reason{};
    std::vector<Reservation> conflicts{};
    std::optional<ErrorKind> rejection{};                  /**< NotFound, Conflict or PolicyViolation when rejected. */
    std::optional<PolicyLimit> violated_limit{};
    EffectivePolicy policy{};                              /**< Policy the decision was made under. */
};

/** @brief Half-open interval intersection: `a.start < b.end && b.start < a.end`. */
[[nodiscard]] constexpr bool windows_overlap(const TimeWindow& lhs, const TimeWindow& rhs) noexcept {
    return lhs.start < rhs.end && rhs.start < lhs.end;
}

/**
 * @brief Overlap written as three cases: starts inside, ends inside, or contains.
 *
 * Equivalent to windows_overlap for non-empty windows; kept for the property
 * tests that pin that equivalence.
 */
[[nodiscard]] constexpr bool windows_overlap_by_cases(const TimeWindow& existing, const TimeWindow& requested) noexcept {
    const bool starts_inside = requested.start >= existing.start && requested.start < existing.end;
    const bool ends_inside = requested.end > existing.start && requested.end <= existing.end;
    const bool contains = requested.start <= existing.start && requested.end >= existing.end;
    return starts_inside || ends_inside || contains;
}

/** @brief Pending/active reservations in @p reservations whose window intersects @p window. */
[[nodiscard]] std::vector<Reservation> find_conflicts(const TimeWindow& window,
                                                      const std::vector<Reservation>& reservations,
                                                      std::optional<ReservationId> exclude = std::nullopt);

/** @brief Throw std::invalid_argument unless `end > start`. */
void validate_window(const TimeWindow& window);

/** @brief Turn a rejection into the matching DevicePoolError. */
[[noreturn]] void throw_rejection(const AdmissionDecision& decision, DeviceId device_id);

class AdmissionController final {
  public:
    AdmissionController(DeviceRegistry& device_registry, PolicyStore& policy_store, ReservationRepository& repository);

    /** @brief Pure decision over @p snapshot. */
    [[nodiscard]] static AdmissionDecision evaluate(const ReservationRequest& request, const AdmissionSnapshot& snapshot, TimePoint now);

    /** @brief Read the current device, policies and reservations for @p request. */
    [[nodiscard]] AdmissionSnapshot snapshot(const ReservationRequest& request) const;

    /** @brief Read-only availability check; no side effects. */
    [[nodiscard]] AdmissionDecision check_availability(const ReservationRequest& request, TimePoint now) const;

  private:
    DeviceRegistry& device_registry_;
    PolicyStore& policy_store_;
    ReservationRepository& repository_;
};

}  // namespace device_pool
