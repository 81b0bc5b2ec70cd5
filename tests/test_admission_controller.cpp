#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "recording_event_sink.hpp"
#include "device_pool/admission_controller.hpp"

using namespace device_pool;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    device_pool::test::ensure_logger_initialized();
    return true;
}();

const TimePoint k_base = std::chrono::sys_days{std::chrono::year{2026} / 3 / 2} + std::chrono::hours{9};
const Principal k_admin{1, Role::Admin};
constexpr UserId k_user{42};
constexpr DeviceId k_device{7};

TimeWindow window_at(int start_hour, int minutes) {
    const TimePoint start = std::chrono::sys_days{std::chrono::year{2026} / 3 / 2} + std::chrono::hours{start_hour};
    return TimeWindow{start, start + Minutes{minutes}};
}

Reservation make_reservation(ReservationId id, UserId user_id, const TimeWindow& window, ReservationStatus status = ReservationStatus::Pending) {
    Reservation reservation{};
    reservation.id = id;
    reservation.user_id = user_id;
    reservation.device_id = k_device;
    reservation.window = window;
    reservation.status = status;
    return reservation;
}

AdmissionSnapshot make_snapshot() {
    AdmissionSnapshot snapshot{};
    TargetDevice device{};
    device.id = k_device;
    device.name = "pixel-7";
    device.status = DeviceStatus::Available;
    snapshot.device = device;
    snapshot.policy = default_effective_policy();
    return snapshot;
}

ReservationRequest make_request(const TimeWindow& window) {
    ReservationRequest request{};
    request.user_id = k_user;
    request.device_id = k_device;
    request.window = window;
    request.role = Role::Developer;
    return request;
}
}  // namespace

TEST_CASE("Interval overlap agrees with the case analysis") {
    const TimeWindow existing = window_at(12, 60);
    for (int start_offset = -120; start_offset <= 120; start_offset += 15) {
        for (int length = 15; length <= 180; length += 15) {
            const TimePoint start = existing.start + Minutes{start_offset};
            const TimeWindow requested{start, start + Minutes{length}};
            INFO("offset " << start_offset << " length " << length);
            REQUIRE(windows_overlap(existing, requested) == windows_overlap_by_cases(existing, requested));
        }
    }
    // Back-to-back windows never overlap.
    REQUIRE_FALSE(windows_overlap(window_at(12, 60), window_at(13, 60)));
    REQUIRE_FALSE(windows_overlap(window_at(13, 60), window_at(12, 60)));
}

TEST_CASE("Only pending and active reservations block a slot") {
    const std::vector<Reservation> reservations{
        make_reservation(1, 5, window_at(12, 60), ReservationStatus::Active),
        make_reservation(2, 5, window_at(12, 60), ReservationStatus::Cancelled),
        make_reservation(3, 5, window_at(12, 60), ReservationStatus::Expired),
        make_reservation(4, 5, window_at(12, 30), ReservationStatus::Pending),
    };
    REQUIRE(find_conflicts(window_at(12, 15), reservations).size() == 2);
    REQUIRE(find_conflicts(window_at(12, 15), reservations, 1).size() == 1);
    REQUIRE(find_conflicts(window_at(13, 15), reservations).empty());
    REQUIRE_THROWS_AS(validate_window(TimeWindow{k_base, k_base}), std::invalid_argument);
}

TEST_CASE("Admission rejects missing and unbookable devices") {
    AdmissionSnapshot snapshot = make_snapshot();
    snapshot.device.reset();
    AdmissionDecision decision = AdmissionController::evaluate(make_request(window_at(12, 60)), snapshot, k_base);
    REQUIRE_FALSE(decision.available);
    REQUIRE(decision.rejection == ErrorKind::NotFound);
    REQUIRE_THROWS_AS(throw_rejection(decision, k_device), NotFoundError);

    snapshot = make_snapshot();
    snapshot.device->status = DeviceStatus::Maintenance;
    decision = AdmissionController::evaluate(make_request(window_at(12, 60)), snapshot, k_base);
    REQUIRE(decision.rejection == ErrorKind::Conflict);

    // A reserved device can still be booked for a later slot.
    snapshot.device->status = DeviceStatus::Reserved;
    REQUIRE(AdmissionController::evaluate(make_request(window_at(12, 60)), snapshot, k_base).available);
}

TEST_CASE("Admission reports overlapping reservations as conflicts") {
    AdmissionSnapshot snapshot = make_snapshot();
    snapshot.device_reservations.push_back(make_reservation(11, 99, window_at(12, 60)));

    const AdmissionDecision decision = AdmissionController::evaluate(make_request(window_at(12, 30)), snapshot, k_base);
    REQUIRE_FALSE(decision.available);
    REQUIRE(decision.conflicts.size() == 1);
    try {
        throw_rejection(decision, k_device);
        FAIL("expected ConflictError");
    } catch (const ConflictError& error) {
        REQUIRE(error.conflicting_ids() == std::vector<std::string>{"11"});
    }

    // Editing the reservation itself does not conflict with its old window.
    ReservationRequest edit = make_request(window_at(12, 30));
    edit.exclude_reservation = 11;
    REQUIRE(AdmissionController::evaluate(edit, snapshot, k_base).available);
}

TEST_CASE("The daily quota counts reservations on the UTC day of now") {
    AdmissionSnapshot snapshot = make_snapshot();
    snapshot.user_reservations = {
        make_reservation(1, k_user, window_at(10, 60)),
        make_reservation(2, k_user, window_at(12, 60)),
        make_reservation(3, k_user, window_at(14, 60)),
    };

    const AdmissionDecision fourth = AdmissionController::evaluate(make_request(window_at(16, 60)), snapshot, k_base);
    REQUIRE_FALSE(fourth.available);
    REQUIRE(fourth.violated_limit == PolicyLimit::DailyQuota);
    try {
        throw_rejection(fourth, k_device);
        FAIL("expected PolicyViolationError");
    } catch (const PolicyViolationError& error) {
        REQUIRE(error.limit() == PolicyLimit::DailyQuota);
    }

    SECTION("a cancelled reservation frees its quota slot") {
        snapshot.user_reservations[1].status = ReservationStatus::Cancelled;
        REQUIRE(AdmissionController::evaluate(make_request(window_at(16, 60)), snapshot, k_base).available);
    }

    SECTION("admin overrides never count") {
        snapshot.user_reservations[2].is_admin_override = true;
        REQUIRE(AdmissionController::evaluate(make_request(window_at(16, 60)), snapshot, k_base).available);
    }

    SECTION("reservations starting on another day do not count") {
        snapshot.user_reservations[0].window = window_at(24 + 10, 60);
        REQUIRE(AdmissionController::evaluate(make_request(window_at(16, 60)), snapshot, k_base).available);
    }
}

TEST_CASE("Cooldown follows the user's previous reservation") {
    AdmissionSnapshot snapshot = make_snapshot();
    snapshot.user_reservations.push_back(make_reservation(1, k_user, window_at(10, 60)));

    const AdmissionDecision too_soon = AdmissionController::evaluate(make_request(window_at(11, 60)), snapshot, k_base);
    REQUIRE(too_soon.violated_limit == PolicyLimit::Cooldown);

    REQUIRE(AdmissionController::evaluate(make_request(window_at(12, 60)), snapshot, k_base).available);

    snapshot.policy.cooldown_minutes = 0;
    REQUIRE(AdmissionController::evaluate(make_request(window_at(11, 60)), snapshot, k_base).available);
}

TEST_CASE("Duration and advance horizon limits") {
    AdmissionSnapshot snapshot = make_snapshot();

    REQUIRE(AdmissionController::evaluate(make_request(window_at(12, 240)), snapshot, k_base).available);
    REQUIRE(AdmissionController::evaluate(make_request(window_at(12, 241)), snapshot, k_base).violated_limit == PolicyLimit::MaxDuration);

    const TimeWindow far_out{k_base + std::chrono::days{15}, k_base + std::chrono::days{15} + Minutes{60}};
    REQUIRE(AdmissionController::evaluate(make_request(far_out), snapshot, k_base).violated_limit == PolicyLimit::AdvanceHorizon);
    const TimeWindow near_edge{k_base + std::chrono::days{14}, k_base + std::chrono::days{14} + Minutes{60}};
    REQUIRE(AdmissionController::evaluate(make_request(near_edge), snapshot, k_base).available);
}

TEST_CASE("Allow-lists of the winning policy apply") {
    AdmissionSnapshot snapshot = make_snapshot();
    ReservationPolicy policy{};
    policy.id = 3;
    policy.name = "emulators only";
    policy.allowed_device_types = std::vector<DeviceType>{DeviceType::Emulator};
    snapshot.policy = select_effective_policy({policy});

    REQUIRE(AdmissionController::evaluate(make_request(window_at(12, 60)), snapshot, k_base).violated_limit == PolicyLimit::DeviceType);

    snapshot.device->device_type = DeviceType::Emulator;
    policy.allowed_roles = std::vector<Role>{Role::Admin};
    snapshot.policy = select_effective_policy({policy});
    REQUIRE(AdmissionController::evaluate(make_request(window_at(12, 60)), snapshot, k_base).violated_limit == PolicyLimit::Role);

    ReservationRequest without_role = make_request(window_at(12, 60));
    without_role.role.reset();
    REQUIRE(AdmissionController::evaluate(without_role, snapshot, k_base).available);
}

TEST_CASE("The highest-priority attached policy decides admission") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    DeviceRegistry devices{sink};
    PolicyStore policies{sink};
    InMemoryReservationRepository repository;
    AdmissionController controller{devices, policies, repository};

    HeartbeatBatch batch{};
    batch.gateway_id = "gw-1";
    batch.timestamp = k_base;
    HeartbeatDeviceReport report{};
    report.name = "pixel-7";
    report.serial_number = "SER-7";
    batch.devices.push_back(report);
    const DeviceId device_id = devices.apply_heartbeat(batch, k_base).created.front().id;

    ReservationPolicy user_policy{};
    user_policy.name = "short sessions";
    user_policy.priority_level = 1;
    user_policy.max_duration_minutes = 60;
    user_policy = policies.create_policy(k_admin, user_policy);
    policies.assign_to_users(k_admin, user_policy.id, {k_user});

    ReservationPolicy device_policy{};
    device_policy.name = "long soak";
    device_policy.priority_level = 5;
    device_policy.max_duration_minutes = 480;
    device_policy = policies.create_policy(k_admin, device_policy);
    policies.assign_to_devices(k_admin, device_policy.id, {device_id});

    ReservationRequest request = make_request(window_at(12, 400));
    request.device_id = device_id;
    const AdmissionDecision decision = controller.check_availability(request, k_base);
    REQUIRE(decision.available);
    REQUIRE(decision.policy.policy->name == "long soak");

    // Without the device policy the user's 60-minute cap applies.
    policies.remove_from_devices(k_admin, device_policy.id, {device_id});
    REQUIRE(controller.check_availability(request, k_base).violated_limit == PolicyLimit::MaxDuration);
}
