#include "device_pool/reservation_manager.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "device_pool/errors.hpp"
#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
bool is_owner_or_admin(const Principal& actor, const Reservation& reservation) noexcept {
    return actor.user_id == reservation.user_id || is_admin(actor);
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char character) { return std::isspace(character) != 0; });
}

std::string reservation_subject(const Reservation& reservation) {
    return std::to_string(reservation.id);
}
}  // namespace

ReservationManager::ReservationManager(DeviceRegistry& device_registry,
                                       PolicyStore& policy_store,
                                       ReservationRepository& repository,
                                       std::shared_ptr<EventSink> event_sink,
                                       RetryPolicy retry_policy)
    : device_registry_(device_registry),
      policy_store_(policy_store),
      repository_(repository),
      admission_controller_(device_registry, policy_store, repository),
      event_sink_(std::move(event_sink)),
      retry_policy_(retry_policy),
      logger_(get_logger()) {
    if (event_sink_ == nullptr) {
        throw std::invalid_argument("ReservationManager requires an event sink");
    }
}

Reservation ReservationManager::create(const Principal& actor, const ReservationDraft& draft, TimePoint now) {
    require_role(actor, Role::Developer, "create reservations");
    validate_window(draft.window);
    if (draft.window.end <= now) {
        throw std::invalid_argument("Reservation window has already ended");
    }
    return with_bounded_retry(retry_policy_, "create_reservation", *logger_, [&]() { return create_locked(actor, draft, now); });
}

Reservation ReservationManager::create_locked(const Principal& actor, const ReservationDraft& draft, TimePoint now) {
    KeyedLock<UserId> user_lock(user_locks_, actor.user_id);
    KeyedLock<DeviceId> device_lock(device_locks_, draft.device_id);

    ReservationRequest request{};
    request.user_id = actor.user_id;
    request.device_id = draft.device_id;
    request.window = draft.window;
    request.role = actor.role;

    const AdmissionDecision decision = admission_controller_.check_availability(request, now);
    if (!decision.available) {
        logger_->info(R"({{"component":"reservation_manager","user":{},"device":{},"admitted":false,"reason":{}}})",
                      actor.user_id,
                      draft.device_id,
                      json_quote(decision.reason));
        throw_rejection(decision, draft.device_id);
    }

    Reservation reservation{};
    reservation.user_id = actor.user_id;
    reservation.device_id = draft.device_id;
    reservation.window = draft.window;
    reservation.priority = draft.priority;
    reservation.purpose = draft.purpose;
    reservation.recurrence = draft.recurrence;
    if (decision.policy.policy.has_value()) {
        reservation.policy_id = decision.policy.policy->id;
    }
    reservation.last_accessed_at = now;
    reservation.created_at = now;
    reservation.updated_at = now;
    reservation = repository_.insert(reservation);

    logger_->info(R"({{"component":"reservation_manager","reservation":{},"user":{},"device":{},"start":"{}","end":"{}","admitted":true}})",
                  reservation.id,
                  reservation.user_id,
                  reservation.device_id,
                  format_timestamp(reservation.window.start),
                  format_timestamp(reservation.window.end));
    publish_created(reservation);

    if (reservation.window.contains(now)) {
        try {
            const ReservationStatus old_status = transition(reservation, ReservationStatus::Active, "window_started", now);
            publish_transition(reservation, old_status, "window_started");
        } catch (const ConflictError& exc) {
            logger_->warn(R"({{"component":"reservation_manager","reservation":{},"activation_deferred":{}}})", reservation.id, json_quote(exc.what()));
        }
    }
    return reservation;
}

Reservation ReservationManager::create_override(const Principal& actor, UserId user_id, const ReservationDraft& draft, const std::string& reason, TimePoint now) {
    require_role(actor, Role::Admin, "create admin override reservations");
    if (is_blank(reason)) {
        throw std::invalid_argument("Admin override requires a justification");
    }
    validate_window(draft.window);
    if (!device_registry_.find(draft.device_id).has_value()) {
        throw NotFoundError("device", std::to_string(draft.device_id));
    }

    return with_bounded_retry(retry_policy_, "create_override_reservation", *logger_, [&]() {
        KeyedLock<UserId> user_lock(user_locks_, user_id);
        KeyedLock<DeviceId> device_lock(device_locks_, draft.device_id);

        Reservation reservation{};
        reservation.user_id = user_id;
        reservation.device_id = draft.device_id;
        reservation.window = draft.window;
        reservation.priority = ReservationPriority::Critical;
        reservation.is_admin_override = true;
        reservation.admin_override_reason = reason;
        reservation.purpose = draft.purpose;
        reservation.recurrence = draft.recurrence;
        reservation.last_accessed_at = now;
        reservation.created_at = now;
        reservation.updated_at = now;
        reservation = repository_.insert(reservation);

        logger_->warn(R"({{"component":"reservation_manager","reservation":{},"admin":{},"user":{},"device":{},"override_reason":{}}})",
                      reservation.id,
                      actor.user_id,
                      user_id,
                      reservation.device_id,
                      json_quote(reason));
        publish_created(reservation);

        if (reservation.window.contains(now)) {
            try {
                const ReservationStatus old_status = transition(reservation, ReservationStatus::Active, "window_started", now);
                publish_transition(reservation, old_status, "window_started");
            } catch (const ConflictError& exc) {
                logger_->warn(R"({{"component":"reservation_manager","reservation":{},"activation_deferred":{}}})", reservation.id, json_quote(exc.what()));
            }
        }
        return reservation;
    });
}

AdmissionDecision ReservationManager::check_availability(const Principal& actor, DeviceId device_id, const TimeWindow& window, TimePoint now) const {
    ReservationRequest request{};
    request.user_id = actor.user_id;
    request.device_id = device_id;
    request.window = window;
    request.role = actor.role;
    return admission_controller_.check_availability(request, now);
}

Reservation ReservationManager::update(const Principal& actor, ReservationId reservation_id, const ReservationChange& change, TimePoint now) {
    require_role(actor, Role::Developer, "update reservations");
    Reservation storage{};
    const Reservation initial = load_for(actor, reservation_id, storage);
    KeyedLock<UserId> user_lock(user_locks_, initial.user_id);
    KeyedLock<DeviceId> device_lock(device_locks_, initial.device_id);
    Reservation& reservation = load_for(actor, reservation_id, storage);

    if (is_terminal(reservation.status)) {
        throw ConflictError("Reservation " + std::to_string(reservation_id) + " is " + std::string{to_string(reservation.status)} +
                                " and can no longer change",
                            {std::to_string(reservation_id)});
    }

    std::map<std::string, std::string> changed_fields;
    if (change.window.has_value()) {
        validate_window(*change.window);
        if (!reservation.is_admin_override) {
            const std::vector<Reservation> conflicts = find_conflicts(*change.window, repository_.for_device(reservation.device_id), reservation.id);
            if (!conflicts.empty()) {
                AdmissionDecision decision{};
                decision.rejection = ErrorKind::Conflict;
                decision.reason = "Time slot conflicts with " + std::to_string(conflicts.size()) + " existing reservation(s)";
                decision.conflicts = conflicts;
                throw_rejection(decision, reservation.device_id);
            }
            const EffectivePolicy policy = policy_for(reservation);
            if (change.window->end - change.window->start > Minutes{policy.max_duration_minutes}) {
                throw PolicyViolationError(PolicyLimit::MaxDuration,
                                           "Reservation exceeds the maximum duration of " + std::to_string(policy.max_duration_minutes) + " minutes");
            }
        }
        reservation.window = *change.window;
        reservation.notified_start = false;
        reservation.notified_end = false;
        changed_fields["start"] = format_timestamp(reservation.window.start);
        changed_fields["end"] = format_timestamp(reservation.window.end);
    }
    if (change.priority.has_value()) {
        if (*change.priority == ReservationPriority::Critical && !is_admin(actor)) {
            throw AccessDeniedError("Only admins may set critical priority");
        }
        reservation.priority = *change.priority;
        changed_fields["priority"] = std::string{to_string(*change.priority)};
    }
    if (change.purpose.has_value()) {
        reservation.purpose = *change.purpose;
        changed_fields["purpose"] = *change.purpose;
    }

    if (!changed_fields.empty()) {
        reservation.updated_at = now;
        repository_.update(reservation);
        publish_simple(event_type::k_reservation_updated, reservation, std::move(changed_fields));
    }
    if (change.status.has_value() && *change.status != reservation.status) {
        const ReservationStatus old_status = transition(reservation, *change.status, "manual_update", now);
        publish_transition(reservation, old_status, "manual_update");
    }
    return reservation;
}

Reservation ReservationManager::cancel(const Principal& actor, ReservationId reservation_id, TimePoint now) {
    require_role(actor, Role::Developer, "cancel reservations");
    Reservation storage{};
    const Reservation initial = load_for(actor, reservation_id, storage);
    KeyedLock<UserId> user_lock(user_locks_, initial.user_id);
    KeyedLock<DeviceId> device_lock(device_locks_, initial.device_id);
    Reservation& reservation = load_for(actor, reservation_id, storage);

    const ReservationStatus old_status = transition(reservation, ReservationStatus::Cancelled, "cancelled", now);
    publish_transition(reservation, old_status, "cancelled");
    return reservation;
}

void ReservationManager::remove(const Principal& actor, ReservationId reservation_id, TimePoint) {
    require_role(actor, Role::Developer, "delete reservations");
    Reservation storage{};
    const Reservation initial = load_for(actor, reservation_id, storage);
    KeyedLock<UserId> user_lock(user_locks_, initial.user_id);
    KeyedLock<DeviceId> device_lock(device_locks_, initial.device_id);
    const Reservation& reservation = load_for(actor, reservation_id, storage);

    if (reservation.status != ReservationStatus::Pending) {
        throw ConflictError("Only pending reservations can be deleted; reservation " + std::to_string(reservation_id) + " is " +
                                std::string{to_string(reservation.status)},
                            {std::to_string(reservation_id)});
    }
    repository_.erase(reservation_id);
    publish_simple(event_type::k_reservation_deleted, reservation, {{"by", std::to_string(actor.user_id)}});
}

Reservation ReservationManager::touch(const Principal& actor, ReservationId reservation_id, TimePoint now) {
    Reservation storage{};
    const Reservation initial = load_for(actor, reservation_id, storage);
    KeyedLock<UserId> user_lock(user_locks_, initial.user_id);
    KeyedLock<DeviceId> device_lock(device_locks_, initial.device_id);
    Reservation& reservation = load_for(actor, reservation_id, storage);

    if (reservation.status != ReservationStatus::Active) {
        throw ConflictError("Only active reservations hold a lease; reservation " + std::to_string(reservation_id) + " is " +
                                std::string{to_string(reservation.status)},
                            {std::to_string(reservation_id)});
    }
    reservation.last_accessed_at = now;
    repository_.update(reservation);
    logger_->debug(R"({{"component":"reservation_manager","reservation":{},"action":"touch"}})", reservation_id);
    return reservation;
}

SweepReport ReservationManager::expire_stale(TimePoint now) {
    SweepReport report{};
    std::vector<Reservation> candidates = repository_.with_status(ReservationStatus::Active);
    const std::vector<Reservation> pending = repository_.with_status(ReservationStatus::Pending);
    // Active first so devices freed in this pass can be handed to pending reservations.
    candidates.insert(candidates.end(), pending.begin(), pending.end());

    for (const Reservation& candidate : candidates) {
        try {
            KeyedLock<UserId> user_lock(user_locks_, candidate.user_id);
            KeyedLock<DeviceId> device_lock(device_locks_, candidate.device_id);
            std::optional<Reservation> current = repository_.find(candidate.id);
            if (!current.has_value() || is_terminal(current->status)) {
                continue;
            }
            Reservation& reservation = *current;

            if (reservation.status == ReservationStatus::Active) {
                if (now >= reservation.window.end) {
                    const ReservationStatus old_status = transition(reservation, ReservationStatus::Completed, "window_ended", now);
                    publish_transition(reservation, old_status, "window_ended");
                    report.completed.push_back(reservation.id);
                    continue;
                }
                if (reservation.is_admin_override) {
                    continue;
                }
                const EffectivePolicy policy = policy_for(reservation);
                const TimePoint last_access = reservation.last_accessed_at.value_or(reservation.created_at);
                if (policy.auto_expire_enabled && now > last_access + Minutes{policy.auto_expire_minutes}) {
                    const ReservationStatus old_status = transition(reservation, ReservationStatus::Expired, "lease_expired", now);
                    publish_transition(reservation, old_status, "lease_expired");
                    report.expired.push_back(reservation.id);
                }
                continue;
            }

            if (now >= reservation.window.end) {
                const ReservationStatus old_status = transition(reservation, ReservationStatus::Expired, "never_activated", now);
                publish_transition(reservation, old_status, "never_activated");
                report.expired.push_back(reservation.id);
                continue;
            }
            if (reservation.window.start > now) {
                continue;
            }
            const auto device = device_registry_.find(reservation.device_id);
            if (!device.has_value() || !device->is_active || device->status != DeviceStatus::Available || has_other_active(reservation)) {
                continue;
            }
            const ReservationStatus old_status = transition(reservation, ReservationStatus::Active, "window_started", now);
            publish_transition(reservation, old_status, "window_started");
            report.activated.push_back(reservation.id);
        } catch (const std::exception& exc) {
            ++report.failures;
            logger_->error(R"({{"component":"reservation_manager","reservation":{},"sweep_error":{}}})", candidate.id, json_quote(exc.what()));
        }
    }

    if (!report.activated.empty() || !report.completed.empty() || !report.expired.empty() || report.failures > 0) {
        logger_->info(R"({{"component":"reservation_manager","action":"sweep","activated":{},"completed":{},"expired":{},"failures":{}}})",
                      report.activated.size(),
                      report.completed.size(),
                      report.expired.size(),
                      report.failures);
    }
    return report;
}

std::size_t ReservationManager::notify_upcoming(TimePoint now) {
    std::size_t sent = 0;
    std::vector<Reservation> candidates = repository_.with_status(ReservationStatus::Pending);
    const std::vector<Reservation> active = repository_.with_status(ReservationStatus::Active);
    candidates.insert(candidates.end(), active.begin(), active.end());

    for (const Reservation& candidate : candidates) {
        try {
            KeyedLock<UserId> user_lock(user_locks_, candidate.user_id);
            KeyedLock<DeviceId> device_lock(device_locks_, candidate.device_id);
            std::optional<Reservation> current = repository_.find(candidate.id);
            if (!current.has_value()) {
                continue;
            }
            Reservation& reservation = *current;
            const EffectivePolicy policy = policy_for(reservation);

            if (reservation.status == ReservationStatus::Pending && !reservation.notified_start && reservation.window.start > now &&
                reservation.window.start - now <= Minutes{policy.notification_before_start_minutes}) {
                reservation.notified_start = true;
                repository_.update(reservation);
                publish_simple(event_type::k_reservation_starting_soon, reservation, {{"start", format_timestamp(reservation.window.start)}});
                ++sent;
            } else if (reservation.status == ReservationStatus::Active && !reservation.notified_end && reservation.window.end > now &&
                       reservation.window.end - now <= Minutes{policy.notification_before_end_minutes}) {
                reservation.notified_end = true;
                repository_.update(reservation);
                publish_simple(event_type::k_reservation_ending_soon, reservation, {{"end", format_timestamp(reservation.window.end)}});
                ++sent;
            }
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"reservation_manager","reservation":{},"notification_error":{}}})", candidate.id, json_quote(exc.what()));
        }
    }
    return sent;
}

std::optional<Reservation> ReservationManager::find(const Principal& actor, ReservationId reservation_id) const {
    std::optional<Reservation> reservation = repository_.find(reservation_id);
    if (!reservation.has_value() || !is_owner_or_admin(actor, *reservation)) {
        return std::nullopt;
    }
    return reservation;
}

std::vector<Reservation> ReservationManager::for_user(const Principal& actor, UserId user_id, std::optional<ReservationStatus> status) const {
    if (actor.user_id != user_id && !is_admin(actor)) {
        throw AccessDeniedError("Only admins may list other users' reservations");
    }
    std::vector<Reservation> reservations = repository_.for_user(user_id);
    if (status.has_value()) {
        reservations.erase(std::remove_if(reservations.begin(),
                                          reservations.end(),
                                          [&status](const Reservation& reservation) { return reservation.status != *status; }),
                           reservations.end());
    }
    return reservations;
}

std::vector<Reservation> ReservationManager::for_device(DeviceId device_id) const {
    return repository_.for_device(device_id);
}

bool ReservationManager::policy_in_use(PolicyId policy_id) const {
    const std::vector<Reservation> reservations = repository_.all();
    return std::any_of(reservations.begin(), reservations.end(), [policy_id](const Reservation& reservation) {
        return holds_window(reservation.status) && reservation.policy_id == policy_id;
    });
}

bool ReservationManager::device_has_history(DeviceId device_id) const {
    return !repository_.for_device(device_id).empty();
}

Reservation& ReservationManager::load_for(const Principal& actor, ReservationId reservation_id, Reservation& storage) const {
    std::optional<Reservation> reservation = repository_.find(reservation_id);
    // Other users' reservations are reported as missing rather than forbidden.
    if (!reservation.has_value() || !is_owner_or_admin(actor, *reservation)) {
        throw NotFoundError("reservation", std::to_string(reservation_id));
    }
    storage = std::move(*reservation);
    return storage;
}

ReservationStatus ReservationManager::transition(Reservation& reservation, ReservationStatus next, const std::string& reason, TimePoint now) {
    const ReservationStatus previous = reservation.status;
    validate_transition(previous, next, reservation.id);

    if (next == ReservationStatus::Active) {
        if (has_other_active(reservation)) {
            throw ConflictError("Device " + std::to_string(reservation.device_id) + " already has an active reservation",
                                {std::to_string(reservation.device_id)});
        }
        device_registry_.mark_reserved(reservation.device_id, now);
        reservation.status = next;
        reservation.last_accessed_at = now;
        reservation.updated_at = now;
        try {
            repository_.update(reservation);
        } catch (const DevicePoolError&) {
            device_registry_.release(reservation.device_id, now);
            reservation.status = previous;
            throw;
        }
        return previous;
    }

    reservation.status = next;
    reservation.updated_at = now;
    repository_.update(reservation);
    if (previous == ReservationStatus::Active) {
        device_registry_.release(reservation.device_id, now);
    }
    logger_->debug(R"({{"component":"reservation_manager","reservation":{},"old_status":"{}","new_status":"{}","reason":{}}})",
                   reservation.id,
                   to_string(previous),
                   to_string(next),
                   json_quote(reason));
    return previous;
}

bool ReservationManager::has_other_active(const Reservation& reservation) const {
    const std::vector<Reservation> reservations = repository_.for_device(reservation.device_id);
    return std::any_of(reservations.begin(), reservations.end(), [&reservation](const Reservation& other) {
        return other.id != reservation.id && other.status == ReservationStatus::Active;
    });
}

EffectivePolicy ReservationManager::policy_for(const Reservation& reservation) const {
    if (reservation.policy_id.has_value()) {
        if (const auto policy = policy_store_.find(*reservation.policy_id); policy.has_value()) {
            return select_effective_policy({*policy});
        }
    }
    return default_effective_policy();
}

void ReservationManager::publish_created(const Reservation& reservation) {
    std::map<std::string, std::string> details{
        {"start", format_timestamp(reservation.window.start)},
        {"end", format_timestamp(reservation.window.end)},
        {"priority", std::string{to_string(reservation.priority)}},
        {"status", std::string{to_string(reservation.status)}},
    };
    if (reservation.is_admin_override) {
        details["admin_override_reason"] = reservation.admin_override_reason;
    }
    publish_simple(event_type::k_reservation_created, reservation, std::move(details));
}

void ReservationManager::publish_transition(const Reservation& reservation, ReservationStatus old_status, const std::string& reason) {
    publish_simple(event_type::k_reservation_status_changed,
                   reservation,
                   {{"old_status", std::string{to_string(old_status)}}, {"new_status", std::string{to_string(reservation.status)}}, {"reason", reason}});
}

void ReservationManager::publish_simple(const std::string& type, const Reservation& reservation, std::map<std::string, std::string> details) {
    LifecycleEvent event{};
    event.type = type;
    event.subjects["reservation"] = reservation_subject(reservation);
    event.subjects["user"] = std::to_string(reservation.user_id);
    event.subjects["device"] = std::to_string(reservation.device_id);
    event.details = std::move(details);
    publish_event(*event_sink_, event, *logger_);
}

void ReservationManager::validate_transition(ReservationStatus from, ReservationStatus to, ReservationId reservation_id) {
    bool allowed = false;
    switch (from) {
        case ReservationStatus::Pending:
            allowed = to == ReservationStatus::Active || to == ReservationStatus::Cancelled || to == ReservationStatus::Expired;
            break;
        case ReservationStatus::Active:
            allowed = to == ReservationStatus::Completed || to == ReservationStatus::Expired || to == ReservationStatus::Cancelled;
            break;
        case ReservationStatus::Completed:
        case ReservationStatus::Cancelled:
        case ReservationStatus::Expired:
            allowed = false;
            break;
    }
    if (!allowed) {
        throw ConflictError("Reservation " + std::to_string(reservation_id) + " cannot move from " + std::string{to_string(from)} + " to " +
                                std::string{to_string(to)},
                            {std::to_string(reservation_id)});
    }
}

}  // namespace device_pool
