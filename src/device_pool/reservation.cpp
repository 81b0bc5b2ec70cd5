#include "device_pool/reservation.hpp"

#include <utility>

#include "device_pool/errors.hpp"

namespace device_pool {

bool holds_window(ReservationStatus status) noexcept {
    return status == ReservationStatus::Pending || status == ReservationStatus::Active;
}

template <typename Predicate>
std::vector<Reservation> InMemoryReservationRepository::select(Predicate predicate) const {
    std::scoped_lock lock(mutex_);
    std::vector<Reservation> reservations;
    for (const auto& [reservation_id, reservation] : map_reservations_) {
        if (predicate(reservation)) {
            reservations.push_back(reservation);
        }
    }
    return reservations;
}

Reservation InMemoryReservationRepository::insert(Reservation reservation) {
    std::scoped_lock lock(mutex_);
    reservation.id = next_reservation_id_++;
    map_reservations_.emplace(reservation.id, reservation);
    return reservation;
}

void InMemoryReservationRepository::update(const Reservation& reservation) {
    std::scoped_lock lock(mutex_);
    const auto iterator_reservation = map_reservations_.find(reservation.id);
    if (iterator_reservation == map_reservations_.end()) {
        throw NotFoundError("reservation", std::to_string(reservation.id));
    }
    iterator_reservation->second = reservation;
}

void InMemoryReservationRepository::erase(ReservationId reservation_id) {
    std::scoped_lock lock(mutex_);
    if (map_reservations_.erase(reservation_id) == 0U) {
        throw NotFoundError("reservation", std::to_string(reservation_id));
    }
}

std::optional<Reservation> InMemoryReservationRepository::find(ReservationId reservation_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_reservation = map_reservations_.find(reservation_id);
    if (iterator_reservation == map_reservations_.end()) {
        return std::nullopt;
    }
    return iterator_reservation->second;
}

std::vector<Reservation> InMemoryReservationRepository::for_device(DeviceId device_id) const {
    return select([device_id](const Reservation& reservation) { return reservation.device_id == device_id; });
}

std::vector<Reservation> InMemoryReservationRepository::for_user(UserId user_id) const {
    return select([user_id](const Reservation& reservation) { return reservation.user_id == user_id; });
}

std::vector<Reservation> InMemoryReservationRepository::with_status(ReservationStatus status) const {
    return select([status](const Reservation& reservation) { return reservation.status == status; });
}

std::vector<Reservation> InMemoryReservationRepository::all() const {
    return select([](const Reservation&) { return true; });
}

}  // namespace device_pool
