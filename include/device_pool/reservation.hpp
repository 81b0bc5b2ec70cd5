// === Reservations ============================================================
//
// Reservation records plus the repository seam the lifecycle manager persists
// them through. The in-memory repository backs the daemon and the tests; a
// durable store plugs in behind the same interface and may raise
// TransientStoreError on lock contention or timeouts.

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device_pool/types.hpp"

namespace device_pool {

/** @brief Exclusive, time-boxed claim on one device. */
struct Reservation final {
    ReservationId id{};
    UserId user_id{};
    DeviceId device_id{};
    TimeWindow window{};                                   /**< `[start, end)`, end after start. */
    ReservationStatus status{ReservationStatus::Pending};
    ReservationPriority priority{ReservationPriority::Normal};
    std::optional<PolicyId> policy_id{};                   /**< Winning policy at admission; empty for defaults. */
    bool is_admin_override{};
    std::string admin_override_reason{};
    std::string purpose{};
    std::optional<std::string> recurrence{};               /**< Opaque recurrence descriptor. */
    std::optional<TimePoint> last_accessed_at{};           /**< Lease marker refreshed by touch. */
    bool notified_start{};
    bool notified_end{};
    TimePoint created_at{};
    TimePoint updated_at{};
};

/** @brief Pending and active reservations block their window on the device. */
[[nodiscard]] bool holds_window(ReservationStatus status) noexcept;

/** @brief Storage seam for reservation records. */
class ReservationRepository {
  public:
    virtual ~ReservationRepository() = default;

    /** @brief Store @p reservation under a fresh id and return the stored copy. */
    virtual Reservation insert(Reservation reservation) = 0;
    /** @throws NotFoundError for unknown ids. */
    virtual void update(const Reservation& reservation) = 0;
    /** @throws NotFoundError for unknown ids. */
    virtual void erase(ReservationId reservation_id) = 0;

    [[nodiscard]] virtual std::optional<Reservation> find(ReservationId reservation_id) const = 0;
    [[nodiscard]] virtual std::vector<Reservation> for_device(DeviceId device_id) const = 0;
    [[nodiscard]] virtual std::vector<Reservation> for_user(UserId user_id) const = 0;
    [[nodiscard]] virtual std::vector<Reservation> with_status(ReservationStatus status) const = 0;
    [[nodiscard]] virtual std::vector<Reservation> all() const = 0;
};

class InMemoryReservationRepository final : public ReservationRepository {
  public:
    Reservation insert(Reservation reservation) override;
    void update(const Reservation& reservation) override;
    void erase(ReservationId reservation_id) override;

    [[nodiscard]] std::optional<Reservation> find(ReservationId reservation_id) const override;
    [[nodiscard]] std::vector<Reservation> for_device(DeviceId device_id) const override;
    [[nodiscard]] std::vector<Reservation> for_user(UserId user_id) const override;
    [[nodiscard]] std::vector<Reservation> with_status(ReservationStatus status) const override;
    [[nodiscard]] std::vector<Reservation> all() const override;

  private:
    template <typename Predicate>
    std::vector<Reservation> select(Predicate predicate) const;

    mutable std::mutex mutex_;
    std::map<ReservationId, Reservation> map_reservations_;
    ReservationId next_reservation_id_{1};
};

}  // namespace device_pool
