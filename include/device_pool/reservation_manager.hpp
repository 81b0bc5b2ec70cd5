// === Reservation Manager =====================================================
//
// Owns the reservation lifecycle:
//
//   pending -> active -> {completed, expired}
//   pending | active -> cancelled
//   pending -> expired (window ended before activation)
//
// Admission and the insert that follows it run under the per-user and
// per-device locks, so two requests for the same slot cannot both pass the
// overlap test. Every transition into `active` flips the device to reserved,
// every transition out of it releases the device in the same step, and every
// transition is published as `{reservation, user, device, old, new}`.
//
// Lease contract: an active reservation stays alive only while its owner
// calls `touch` more often than the policy's `auto_expire_minutes`; session
// and proxy components are expected to call it on the user's behalf.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "device_pool/admission_controller.hpp"
#include "device_pool/device_registry.hpp"
#include "device_pool/event_sink.hpp"
#include "device_pool/lock_table.hpp"
#include "device_pool/policy_store.hpp"
#include "device_pool/reservation.hpp"
#include "device_pool/retry.hpp"
#include "device_pool/roles.hpp"

namespace device_pool {

struct ReservationDraft final {
    DeviceId device_id{};
    TimeWindow window{};
    ReservationPriority priority{ReservationPriority::Normal};
    std::string purpose{};
    std::optional<std::string> recurrence{};
};

/** @brief Partial update; empty fields are left untouched. */
struct ReservationChange final {
    std::optional<TimeWindow> window{};
    std::optional<ReservationStatus> status{};
    std::optional<ReservationPriority> priority{};
    std::optional<std::string> purpose{};
};

/** @brief Outcome of one lifecycle sweep. */
struct SweepReport final {
    std::vector<ReservationId> activated{};
    std::vector<ReservationId> completed{};
    std::vector<ReservationId> expired{};                /**< Lease lapsed or window ended while pending. */
    std::size_t failures{};
};

class ReservationManager final {
  public:
    ReservationManager(DeviceRegistry& device_registry,
                       PolicyStore& policy_store,
                       ReservationRepository& repository,
                       std::shared_ptr<EventSink> event_sink,
                       RetryPolicy retry_policy = {});

    /**
     * @brief Admit and store a reservation for @p actor.
     *
     * Starts active when the window already contains @p now.
     *
     * @throws NotFoundError, ConflictError, PolicyViolationError on rejection.
     * @throws TransientStoreError once the retry budget is spent.
     */
    Reservation create(const Principal& actor, const ReservationDraft& draft, TimePoint now);

    /**
     * @brief Admin-only creation on behalf of @p user_id that skips admission.
     *
     * The reservation is critical priority and flagged as an override; it
     * never counts toward anyone's quota or cooldown.
     */
    Reservation create_override(const Principal& actor, UserId user_id, const ReservationDraft& draft, const std::string& reason, TimePoint now);

    /** @brief Read-only availability check for @p actor. */
    [[nodiscard]] AdmissionDecision check_availability(const Principal& actor, DeviceId device_id, const TimeWindow& window, TimePoint now) const;

    /** @brief Change window, status, priority or purpose of a reservation. */
    Reservation update(const Principal& actor, ReservationId reservation_id, const ReservationChange& change, TimePoint now);
    Reservation cancel(const Principal& actor, ReservationId reservation_id, TimePoint now);
    /** @brief Delete a reservation that never activated. */
    void remove(const Principal& actor, ReservationId reservation_id, TimePoint now);
    /** @brief Renew the lease of an active reservation. */
    Reservation touch(const Principal& actor, ReservationId reservation_id, TimePoint now);

    /**
     * @brief Periodic lifecycle pass.
     *
     * Activates pending reservations whose window began, completes active
     * ones past their end, expires active ones whose lease lapsed and
     * pending ones whose window ended. A failing reservation is logged and
     * skipped.
     */
    SweepReport expire_stale(TimePoint now);
    /** @brief Emit starting-soon / ending-soon notifications once per reservation; returns how many were sent. */
    std::size_t notify_upcoming(TimePoint now);

    [[nodiscard]] std::optional<Reservation> find(const Principal& actor, ReservationId reservation_id) const;
    [[nodiscard]] std::vector<Reservation> for_user(const Principal& actor, UserId user_id, std::optional<ReservationStatus> status = std::nullopt) const;
    [[nodiscard]] std::vector<Reservation> for_device(DeviceId device_id) const;

    /** @brief True while a pending or active reservation references @p policy_id. */
    [[nodiscard]] bool policy_in_use(PolicyId policy_id) const;
    /** @brief True when any reservation ever referenced @p device_id. */
    [[nodiscard]] bool device_has_history(DeviceId device_id) const;

  private:
    Reservation create_locked(const Principal& actor, const ReservationDraft& draft, TimePoint now);
    Reservation& load_for(const Principal& actor, ReservationId reservation_id, Reservation& storage) const;
    /** @brief Apply a status transition with its device side effect; returns the old status. */
    ReservationStatus transition(Reservation& reservation, ReservationStatus next, const std::string& reason, TimePoint now);
    [[nodiscard]] bool has_other_active(const Reservation& reservation) const;
    [[nodiscard]] EffectivePolicy policy_for(const Reservation& reservation) const;
    void publish_created(const Reservation& reservation);
    void publish_transition(const Reservation& reservation, ReservationStatus old_status, const std::string& reason);
    void publish_simple(const std::string& type, const Reservation& reservation, std::map<std::string, std::string> details);

    static void validate_transition(ReservationStatus from, ReservationStatus to, ReservationId reservation_id);

    DeviceRegistry& device_registry_;
    PolicyStore& policy_store_;
    ReservationRepository& repository_;
    AdmissionController admission_controller_;
    std::shared_ptr<EventSink> event_sink_;
    RetryPolicy retry_policy_;
    mutable LockTable<UserId> user_locks_;
    mutable LockTable<DeviceId> device_locks_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
