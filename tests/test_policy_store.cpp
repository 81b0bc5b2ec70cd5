#include <memory>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "recording_event_sink.hpp"
#include "device_pool/errors.hpp"
#include "device_pool/policy_store.hpp"

using namespace device_pool;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    device_pool::test::ensure_logger_initialized();
    return true;
}();

const Principal k_admin{1, Role::Admin};
const Principal k_developer{2, Role::Developer};

ReservationPolicy make_policy(const std::string& name, int priority_level, int max_duration_minutes) {
    ReservationPolicy policy{};
    policy.name = name;
    policy.priority_level = priority_level;
    policy.max_duration_minutes = max_duration_minutes;
    return policy;
}
}  // namespace

TEST_CASE("PolicyStore falls back to system defaults without attachments") {
    PolicyStore store{std::make_shared<test::RecordingEventSink>()};
    const EffectivePolicy effective = store.effective(10, 20);
    REQUIRE(effective.is_default());
    REQUIRE(effective.max_duration_minutes == 240);
    REQUIRE(effective.cooldown_minutes == 60);
    REQUIRE(effective.max_reservations_per_day == 3);
    REQUIRE(effective.max_reservation_days_in_advance == 14);
    REQUIRE(effective.auto_expire_enabled);
    REQUIRE(effective.auto_expire_minutes == 15);
}

TEST_CASE("PolicyStore resolves the highest priority policy across user and device") {
    PolicyStore store{std::make_shared<test::RecordingEventSink>()};
    const ReservationPolicy relaxed = store.create_policy(k_admin, make_policy("relaxed", 10, 480));
    const ReservationPolicy strict = store.create_policy(k_admin, make_policy("strict", 1, 60));
    store.assign_to_users(k_admin, relaxed.id, {10});
    store.assign_to_devices(k_admin, strict.id, {20});

    const std::vector<ReservationPolicy> resolved = store.resolve(10, 20);
    REQUIRE(resolved.size() == 2);
    REQUIRE(resolved.front().id == relaxed.id);

    const EffectivePolicy effective = store.effective(10, 20);
    REQUIRE_FALSE(effective.is_default());
    REQUIRE(effective.max_duration_minutes == 480);

    // Another user on the same device only sees the device policy.
    REQUIRE(store.effective(11, 20).max_duration_minutes == 60);
}

TEST_CASE("PolicyStore breaks priority ties by lowest policy id") {
    PolicyStore store{std::make_shared<test::RecordingEventSink>()};
    const ReservationPolicy first = store.create_policy(k_admin, make_policy("first", 5, 90));
    const ReservationPolicy second = store.create_policy(k_admin, make_policy("second", 5, 30));
    store.assign_to_devices(k_admin, second.id, {1});
    store.assign_to_devices(k_admin, first.id, {1});
    REQUIRE(store.effective(99, 1).max_duration_minutes == 90);
}

TEST_CASE("PolicyStore enforces unique names and valid limits") {
    PolicyStore store{std::make_shared<test::RecordingEventSink>()};
    (void)store.create_policy(k_admin, make_policy("standard", 0, 120));
    REQUIRE_THROWS_AS(store.create_policy(k_admin, make_policy("standard", 1, 60)), ConflictError);
    REQUIRE_THROWS_AS(store.create_policy(k_admin, make_policy("zero", 0, 0)), std::invalid_argument);
    REQUIRE_THROWS_AS(store.create_policy(k_developer, make_policy("sneaky", 0, 60)), AccessDeniedError);
    REQUIRE_THROWS_AS(store.assign_to_users(k_admin, 404, {1}), NotFoundError);
}

TEST_CASE("PolicyStore refuses to delete a policy still in use") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    PolicyStore store{sink};
    const ReservationPolicy policy = store.create_policy(k_admin, make_policy("busy", 0, 60));
    store.assign_to_users(k_admin, policy.id, {3});

    REQUIRE_THROWS_AS(store.delete_policy(k_admin, policy.id, [](PolicyId) { return true; }), ConflictError);
    REQUIRE(store.find(policy.id).has_value());

    store.delete_policy(k_admin, policy.id, [](PolicyId) { return false; });
    REQUIRE_FALSE(store.find(policy.id).has_value());
    REQUIRE(store.effective(3, 1).is_default());
    REQUIRE_FALSE(sink->of_type(event_type::k_policy_changed).empty());
}

TEST_CASE("PolicyStore detaches policies from users and devices") {
    PolicyStore store{std::make_shared<test::RecordingEventSink>()};
    const ReservationPolicy policy = store.create_policy(k_admin, make_policy("temporary", 0, 45));
    store.assign_to_users(k_admin, policy.id, {4});
    store.assign_to_devices(k_admin, policy.id, {5});
    store.remove_from_users(k_admin, policy.id, {4});
    REQUIRE(store.effective(4, 6).is_default());
    REQUIRE_FALSE(store.effective(4, 5).is_default());
    store.remove_from_devices(k_admin, policy.id, {5});
    REQUIRE(store.effective(4, 5).is_default());
}

TEST_CASE("PolicyStore updates keep names unique") {
    PolicyStore store{std::make_shared<test::RecordingEventSink>()};
    ReservationPolicy standard = store.create_policy(k_admin, make_policy("standard", 0, 120));
    (void)store.create_policy(k_admin, make_policy("extended", 0, 480));

    standard.max_duration_minutes = 180;
    REQUIRE(store.update_policy(k_admin, standard).max_duration_minutes == 180);
    REQUIRE(store.find(standard.id)->max_duration_minutes == 180);

    standard.name = "extended";
    REQUIRE_THROWS_AS(store.update_policy(k_admin, standard), ConflictError);
    REQUIRE_THROWS_AS(store.update_policy(k_developer, standard), AccessDeniedError);

    ReservationPolicy missing = make_policy("ghost", 0, 60);
    missing.id = 404;
    REQUIRE_THROWS_AS(store.update_policy(k_admin, missing), NotFoundError);
}
