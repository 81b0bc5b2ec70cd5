#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "device_pool/errors.hpp"
#include "device_pool/periodic_task.hpp"
#include "device_pool/pool_runtime.hpp"
#include "device_pool/worker_pool.hpp"

using namespace device_pool;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    device_pool::test::ensure_logger_initialized();
    return true;
}();

const TimePoint k_base = std::chrono::sys_days{std::chrono::year{2026} / 3 / 2} + std::chrono::hours{9};
const Principal k_admin{1, Role::Admin};
const Principal k_alice{10, Role::Developer};

/** @brief Poll @p condition for up to five seconds. */
template <typename Condition>
bool eventually(Condition condition) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return condition();
}

Configuration make_configuration() {
    Configuration config{};
    config.log_directory = (std::filesystem::temp_directory_path() / "device_pool_tests_logs").string();
    config.worker_threads = 2;
    config.expiry_sweep_interval = Seconds{3600};
    config.cleanup_sweep_interval = Seconds{3600};
    config.stale_multiplier = 3;
    config.gateway_stale_after = Seconds{180};
    config.health_recheck_interval = Minutes{5};
    config.association_inactivity = std::chrono::hours{24};
    config.admission_retry = RetryPolicy{3, std::chrono::milliseconds{1}};
    config.export_path = (std::filesystem::temp_directory_path() / "device_pool_test_gateways.json").string();
    return config;
}

/** @brief One online gateway serving one freshly reported device. */
DeviceId seed_fleet(PoolRuntime& runtime) {
    Gateway gateway{};
    gateway.gateway_id = "gw-1";
    gateway.name = "Lab rack 1";
    gateway.gateway_type = GatewayType::Site;
    (void)runtime.gateways().create_gateway(k_admin, gateway, k_base);
    GatewayHeartbeat heartbeat{};
    heartbeat.gateway_id = "gw-1";
    (void)runtime.gateways().apply_heartbeat(heartbeat, k_base);

    HeartbeatBatch batch{};
    batch.gateway_id = "gw-1";
    batch.timestamp = k_base;
    HeartbeatDeviceReport report{};
    report.name = "pixel-7";
    report.serial_number = "SER-7";
    batch.devices.push_back(report);
    return runtime.apply_device_heartbeat(batch, k_base).created.front().id;
}
}  // namespace

TEST_CASE("WorkerPool runs submitted work and reports failures through futures") {
    WorkerPool pool{2};
    REQUIRE(pool.thread_count() == 2);

    auto answer = pool.submit([]() { return 6 * 7; });
    auto failure = pool.submit([]() -> int { throw ConflictError("slot taken"); });
    REQUIRE(answer.get() == 42);
    REQUIRE_THROWS_AS(failure.get(), ConflictError);

    std::atomic<int> completed{0};
    for (int index = 0; index < 16; ++index) {
        (void)pool.submit([&completed]() { ++completed; });
    }
    pool.shutdown();
    REQUIRE(completed == 16);
    REQUIRE(pool.pending() == 0);
    REQUIRE_THROWS_AS(pool.submit([]() {}), std::runtime_error);
}

TEST_CASE("WorkerPool keeps at least one worker") {
    WorkerPool pool{0};
    REQUIRE(pool.thread_count() == 1);
    REQUIRE(pool.submit([]() { return true; }).get());
}

TEST_CASE("PeriodicTask runs on demand and survives failing passes") {
    std::atomic<int> calls{0};
    PeriodicTask task{"test_sweep", std::chrono::hours{1}, [&calls]() {
                          if (++calls == 1) {
                              throw std::runtime_error("store unavailable");
                          }
                      }};
    REQUIRE_FALSE(task.running());

    task.start();
    REQUIRE(task.running());
    task.trigger_now();
    REQUIRE(eventually([&task]() { return task.pass_count() == 1; }));
    task.trigger_now();
    REQUIRE(eventually([&task]() { return task.pass_count() == 2; }));
    REQUIRE(calls == 2);

    task.stop();
    REQUIRE_FALSE(task.running());
    task.stop();
}

TEST_CASE("PeriodicTask rejects a zero interval or an empty body") {
    REQUIRE_THROWS_AS(PeriodicTask("bad", std::chrono::milliseconds{0}, []() {}), std::invalid_argument);
    REQUIRE_THROWS_AS(PeriodicTask("bad", std::chrono::milliseconds{10}, nullptr), std::invalid_argument);
}

TEST_CASE("The cleanup sweep retires silent devices, gateways and dead associations") {
    PoolRuntime runtime{make_configuration()};
    const DeviceId device_id = seed_fleet(runtime);
    (void)runtime.associations().associate(k_admin, device_id, "gw-1", AssociationStatus::Connected, k_base);

    REQUIRE(runtime.run_cleanup_sweep(k_base + std::chrono::seconds{20}).stale_devices == 0);

    const CleanupReport report = runtime.run_cleanup_sweep(k_base + std::chrono::minutes{10});
    REQUIRE(report.stale_devices == 1);
    REQUIRE(report.stale_gateways == 1);
    REQUIRE(report.health.checked == 1);
    REQUIRE(report.health.changed.front().status == AssociationStatus::Failed);
    REQUIRE(report.associations_removed == 0);
    REQUIRE(runtime.gateways().find("gw-1")->current_targets == 0);

    const CleanupReport later = runtime.run_cleanup_sweep(k_base + std::chrono::hours{25});
    REQUIRE(later.associations_removed == 1);
    REQUIRE(runtime.associations().list().empty());
}

TEST_CASE("The lease sweep expires reservations and feeds the outbound queue") {
    PoolRuntime runtime{make_configuration()};
    const DeviceId device_id = seed_fleet(runtime);

    ReservationDraft draft{};
    draft.device_id = device_id;
    draft.window = TimeWindow{k_base, k_base + Minutes{60}};
    const Reservation reservation = runtime.reservations().create(k_alice, draft, k_base);
    REQUIRE(reservation.status == ReservationStatus::Active);

    const SweepReport report = runtime.run_lease_sweep(k_base + Minutes{16});
    REQUIRE(report.expired.size() == 1);
    REQUIRE(runtime.devices().find(device_id)->status == DeviceStatus::Available);

    bool saw_expiry = false;
    while (const auto event = runtime.outbound_events().try_consume()) {
        if (event->type == event_type::k_reservation_status_changed && event->details.at("new_status") == "expired") {
            saw_expiry = true;
        }
    }
    REQUIRE(saw_expiry);
}

TEST_CASE("expire_stale_now wakes the running lease sweep") {
    PoolRuntime runtime{make_configuration()};
    const DeviceId device_id = seed_fleet(runtime);

    // Booked in the past for a window that has already ended.
    const TimePoint now = SystemClock::now();
    ReservationDraft draft{};
    draft.device_id = device_id;
    draft.window = TimeWindow{now - std::chrono::hours{2}, now - std::chrono::hours{1}};
    const Reservation reservation = runtime.reservations().create(k_alice, draft, now - std::chrono::hours{3});
    REQUIRE(reservation.status == ReservationStatus::Pending);

    runtime.run();
    runtime.expire_stale_now();
    REQUIRE(eventually([&]() {
        return runtime.reservations().find(k_alice, reservation.id)->status == ReservationStatus::Expired;
    }));
    runtime.shutdown();
}

TEST_CASE("Deletion guards consult the other components") {
    PoolRuntime runtime{make_configuration()};
    const DeviceId device_id = seed_fleet(runtime);

    REQUIRE_THROWS_AS(runtime.delete_gateway(k_admin, "gw-1"), ConflictError);

    ReservationPolicy policy{};
    policy.name = "lab default";
    policy = runtime.policies().create_policy(k_admin, policy);
    runtime.policies().assign_to_devices(k_admin, policy.id, {device_id});

    ReservationDraft draft{};
    draft.device_id = device_id;
    draft.window = TimeWindow{k_base + std::chrono::hours{1}, k_base + std::chrono::hours{2}};
    const Reservation reservation = runtime.reservations().create(k_alice, draft, k_base);
    REQUIRE(reservation.policy_id == policy.id);
    REQUIRE_THROWS_AS(runtime.remove_device(k_admin, device_id), ConflictError);
    REQUIRE_THROWS_AS(runtime.delete_policy(k_admin, policy.id), ConflictError);

    (void)runtime.reservations().cancel(k_alice, reservation.id, k_base);
    REQUIRE_NOTHROW(runtime.delete_policy(k_admin, policy.id));

    REQUIRE(runtime.export_gateways_to(runtime.configuration().export_path) == 1);
    REQUIRE(std::filesystem::exists(runtime.configuration().export_path));
}

TEST_CASE("Device heartbeats from unknown or deactivated gateways are dropped") {
    PoolRuntime runtime{make_configuration()};

    HeartbeatBatch batch{};
    batch.gateway_id = "never-registered";
    batch.timestamp = k_base;
    HeartbeatDeviceReport ghost{};
    ghost.name = "ghost";
    batch.devices.push_back(ghost);

    const HeartbeatResult unknown = runtime.apply_device_heartbeat(batch, k_base);
    REQUIRE(unknown.created.empty());
    REQUIRE(unknown.rejected.empty());
    REQUIRE(runtime.devices().list().empty());

    (void)seed_fleet(runtime);
    (void)runtime.gateways().deactivate_gateway(k_admin, "gw-1", k_base);
    batch.gateway_id = "gw-1";
    REQUIRE(runtime.apply_device_heartbeat(batch, k_base + std::chrono::seconds{10}).created.empty());
    REQUIRE(runtime.devices().list().size() == 1);
}

TEST_CASE("Request entry points run on the worker pool") {
    PoolRuntime runtime{make_configuration()};
    const DeviceId device_id = seed_fleet(runtime);

    HeartbeatBatch batch{};
    batch.gateway_id = "gw-1";
    batch.timestamp = SystemClock::now();
    HeartbeatDeviceReport pixel{};
    pixel.name = "pixel-7";
    pixel.serial_number = "SER-7";
    HeartbeatDeviceReport galaxy{};
    galaxy.name = "galaxy-s23";
    galaxy.serial_number = "SER-23";
    batch.devices = {pixel, galaxy};
    const HeartbeatResult result = runtime.submit_device_heartbeat(batch).get();
    REQUIRE(result.created.size() == 1);
    REQUIRE(result.updated.size() == 1);

    GatewayHeartbeat gateway_heartbeat{};
    gateway_heartbeat.gateway_id = "gw-1";
    gateway_heartbeat.status = GatewayStatus::Degraded;
    REQUIRE(runtime.submit_gateway_heartbeat(gateway_heartbeat).get()->status == GatewayStatus::Degraded);

    const TimePoint now = SystemClock::now();
    ReservationDraft draft{};
    draft.device_id = device_id;
    draft.window = TimeWindow{now + std::chrono::hours{1}, now + std::chrono::hours{2}};
    const Reservation reservation = runtime.submit_create_reservation(k_alice, draft).get();
    REQUIRE(reservation.status == ReservationStatus::Pending);

    auto clash = runtime.submit_create_reservation(Principal{11, Role::Developer}, draft);
    REQUIRE_THROWS_AS(clash.get(), ConflictError);

    ReservationChange change{};
    change.purpose = "nightly regression";
    REQUIRE(runtime.submit_update_reservation(k_alice, reservation.id, change).get().purpose == "nightly regression");
    REQUIRE(runtime.submit_cancel_reservation(k_alice, reservation.id).get().status == ReservationStatus::Cancelled);
}

TEST_CASE("Gateway deletion and association churn do not block each other") {
    PoolRuntime runtime{make_configuration()};
    const DeviceId device_id = seed_fleet(runtime);
    constexpr int k_rounds = 200;

    auto deletions = std::async(std::launch::async, [&runtime]() {
        int deleted = 0;
        for (int round = 0; round < k_rounds; ++round) {
            Gateway spare{};
            spare.gateway_id = "gw-x";
            spare.name = "Spare rack";
            (void)runtime.gateways().create_gateway(k_admin, spare, k_base);
            runtime.delete_gateway(k_admin, "gw-x");
            ++deleted;
        }
        return deleted;
    });
    auto churn = std::async(std::launch::async, [&runtime, device_id]() {
        int cycles = 0;
        for (int round = 0; round < k_rounds; ++round) {
            (void)runtime.associations().associate(k_admin, device_id, "gw-1", AssociationStatus::Connected, k_base);
            (void)runtime.associations().disassociate(k_admin, device_id, "gw-1", true, k_base);
            ++cycles;
        }
        return cycles;
    });

    REQUIRE(deletions.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    REQUIRE(churn.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    REQUIRE(deletions.get() == k_rounds);
    REQUIRE(churn.get() == k_rounds);
    REQUIRE_FALSE(runtime.gateways().exists("gw-x"));
}
