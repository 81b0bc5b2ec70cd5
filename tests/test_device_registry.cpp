#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "recording_event_sink.hpp"
#include "device_pool/device_registry.hpp"
#include "device_pool/errors.hpp"

using namespace device_pool;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    device_pool::test::ensure_logger_initialized();
    return true;
}();

const TimePoint k_base = std::chrono::sys_days{std::chrono::year{2026} / 3 / 2} + std::chrono::hours{9};
const Principal k_admin{1, Role::Admin};
const Principal k_developer{2, Role::Developer};

HeartbeatDeviceReport make_report(const std::string& name, const std::string& serial) {
    HeartbeatDeviceReport report{};
    report.name = name;
    report.serial_number = serial;
    report.model = "Pixel 8";
    report.adb_status = true;
    report.heartbeat_interval_seconds = 10;
    return report;
}

HeartbeatBatch make_batch(const GatewayId& gateway_id, std::vector<HeartbeatDeviceReport> devices, TimePoint timestamp) {
    HeartbeatBatch batch{};
    batch.gateway_id = gateway_id;
    batch.devices = std::move(devices);
    batch.timestamp = timestamp;
    return batch;
}
}  // namespace

TEST_CASE("DeviceRegistry auto-registers unknown devices as available") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    DeviceRegistry registry{sink};

    const HeartbeatResult result = registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A")}, k_base), k_base);
    REQUIRE(result.created.size() == 1);
    REQUIRE(result.updated.empty());

    const auto device = registry.find_by_serial("SER-A");
    REQUIRE(device.has_value());
    REQUIRE(device->status == DeviceStatus::Available);
    REQUIRE(device->gateway_id == "gw-1");
    REQUIRE(device->last_heartbeat == k_base);
    REQUIRE(sink->of_type(event_type::k_device_registered).size() == 1);
}

TEST_CASE("Applying the same heartbeat twice is idempotent") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    DeviceRegistry registry{sink};
    const HeartbeatBatch batch = make_batch("gw-1", {make_report("phone-a", "SER-A"), make_report("phone-b", "SER-B")}, k_base);

    (void)registry.apply_heartbeat(batch, k_base);
    const auto first_devices = registry.list();
    const auto status_events_before = sink->of_type(event_type::k_device_status_changed).size();

    const HeartbeatResult second = registry.apply_heartbeat(batch, k_base + std::chrono::seconds{10});
    const auto second_devices = registry.list();

    REQUIRE(second.created.empty());
    REQUIRE(second.updated.size() == 2);
    REQUIRE(second_devices.size() == first_devices.size());
    for (std::size_t index = 0; index < first_devices.size(); ++index) {
        REQUIRE(second_devices[index].id == first_devices[index].id);
        REQUIRE(second_devices[index].status == first_devices[index].status);
    }
    REQUIRE(sink->of_type(event_type::k_device_status_changed).size() == status_events_before);
    REQUIRE(sink->of_type(event_type::k_device_registered).size() == 2);
}

TEST_CASE("Devices missing from the next heartbeat go offline unless reserved") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    DeviceRegistry registry{sink};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A"), make_report("phone-b", "SER-B")}, k_base), k_base);

    const DeviceId reserved_id = registry.find_by_serial("SER-B")->id;
    (void)registry.mark_reserved(reserved_id, k_base);

    const TimePoint later = k_base + std::chrono::minutes{5};
    const HeartbeatResult result = registry.apply_heartbeat(make_batch("gw-1", {}, later), later);

    REQUIRE(result.went_offline.size() == 1);
    const auto absent = registry.find_by_serial("SER-A");
    REQUIRE(absent->status == DeviceStatus::Offline);
    REQUIRE_FALSE(absent->adb_status);
    REQUIRE(registry.find(reserved_id)->status == DeviceStatus::Reserved);

    const auto events = sink->of_type(event_type::k_device_status_changed);
    REQUIRE_FALSE(events.empty());
    REQUIRE(events.back().details.at("old_status") == "available");
    REQUIRE(events.back().details.at("new_status") == "offline");
    REQUIRE(events.back().subjects.at("gateway") == "gw-1");
}

TEST_CASE("Heartbeats never override maintenance or reserved status") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A")}, k_base), k_base);
    const DeviceId device_id = registry.find_by_serial("SER-A")->id;
    (void)registry.set_maintenance(k_admin, device_id, true, "battery swap", k_base);

    HeartbeatDeviceReport refreshed = make_report("phone-a", "SER-A");
    refreshed.health_score = 88;
    const TimePoint later = k_base + std::chrono::seconds{10};
    (void)registry.apply_heartbeat(make_batch("gw-1", {refreshed}, later), later);

    const auto device = registry.find(device_id);
    REQUIRE(device->status == DeviceStatus::Maintenance);
    REQUIRE(device->health_score == 88);
    REQUIRE(device->last_heartbeat == later);
}

TEST_CASE("Staleness sweep deactivates silent devices but spares reserved ones") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    DeviceRegistry registry{sink};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A"), make_report("phone-b", "SER-B")}, k_base), k_base);
    const DeviceId silent_id = registry.find_by_serial("SER-A")->id;
    const DeviceId reserved_id = registry.find_by_serial("SER-B")->id;
    (void)registry.mark_reserved(reserved_id, k_base);

    // 30 s threshold (3 x 10 s) is not yet exceeded.
    REQUIRE(registry.sweep_stale(k_base + std::chrono::seconds{30}, 3).empty());

    const auto deactivated = registry.sweep_stale(k_base + std::chrono::minutes{5}, 3);
    REQUIRE(deactivated.size() == 1);
    REQUIRE(deactivated.front().id == silent_id);

    const auto silent = registry.find(silent_id);
    REQUIRE(silent->status == DeviceStatus::Offline);
    REQUIRE_FALSE(silent->is_active);
    REQUIRE(silent->deactivated_by_staleness);
    REQUIRE(registry.find(reserved_id)->status == DeviceStatus::Reserved);
    REQUIRE(sink->of_type(event_type::k_device_deactivated).size() == 1);

    SECTION("re-sighting reactivates the device") {
        const TimePoint later = k_base + std::chrono::minutes{6};
        (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A")}, later), later);
        const auto revived = registry.find(silent_id);
        REQUIRE(revived->is_active);
        REQUIRE(revived->status == DeviceStatus::Available);
    }
}

TEST_CASE("A bad heartbeat entry is rejected without aborting the batch") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    HeartbeatDeviceReport unnamed = make_report("", "SER-X");
    HeartbeatDeviceReport unhealthy = make_report("phone-bad", "SER-Y");
    unhealthy.health_score = 150;

    const HeartbeatResult result =
        registry.apply_heartbeat(make_batch("gw-1", {unnamed, make_report("phone-a", "SER-A"), unhealthy}, k_base), k_base);

    REQUIRE(result.created.size() == 1);
    REQUIRE(result.rejected.size() == 2);
    REQUIRE(registry.list().size() == 1);
}

TEST_CASE("Serial matches that collide with another device name are rejected") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A"), make_report("phone-b", "SER-B")}, k_base), k_base);

    const TimePoint later = k_base + std::chrono::seconds{10};
    const HeartbeatResult result =
        registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-b", "SER-A"), make_report("phone-b", "SER-B")}, later), later);

    REQUIRE(result.rejected.size() == 1);
    REQUIRE(registry.find_by_serial("SER-A")->name == "phone-a");
}

TEST_CASE("A device reporting a new serial is re-indexed under it") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-1")}, k_base), k_base);
    const DeviceId phone_a = registry.find_by_serial("SER-1")->id;

    const TimePoint swapped = k_base + std::chrono::seconds{10};
    const HeartbeatResult renumbered = registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-2")}, swapped), swapped);
    REQUIRE(renumbered.created.empty());
    REQUIRE(registry.find_by_serial("SER-2")->id == phone_a);
    REQUIRE_FALSE(registry.find_by_serial("SER-1").has_value());

    // The freed serial now belongs to whichever device reports it next.
    const TimePoint later = k_base + std::chrono::seconds{20};
    const HeartbeatResult result =
        registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-2"), make_report("phone-c", "SER-1")}, later), later);
    REQUIRE(result.created.size() == 1);
    REQUIRE(result.rejected.empty());
    REQUIRE(result.created.front().name == "phone-c");
    REQUIRE(registry.find(phone_a)->name == "phone-a");
    REQUIRE(registry.find_by_serial("SER-1")->name == "phone-c");
    REQUIRE(registry.list().size() == 2);
}

TEST_CASE("Manual registration enforces unique serial and name") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    TargetDevice device{};
    device.name = "emulator-1";
    device.gateway_id = "gw-2";
    device.device_type = DeviceType::Emulator;
    device.serial_number = "EMU-1";
    device.status = DeviceStatus::Available;

    const TargetDevice stored = registry.register_device(k_developer, device, k_base);
    REQUIRE(stored.id > 0);
    REQUIRE_THROWS_AS(registry.register_device(k_developer, device, k_base), ConflictError);

    TargetDevice reserved = device;
    reserved.serial_number = "EMU-2";
    reserved.name = "emulator-2";
    reserved.status = DeviceStatus::Reserved;
    REQUIRE_THROWS_AS(registry.register_device(k_developer, reserved, k_base), std::invalid_argument);

    TargetDevice tester_device = device;
    tester_device.serial_number = "EMU-3";
    tester_device.name = "emulator-3";
    REQUIRE_THROWS_AS(registry.register_device(Principal{3, Role::Tester}, tester_device, k_base), AccessDeniedError);
}

TEST_CASE("Release only returns reserved devices to available") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A")}, k_base), k_base);
    const DeviceId device_id = registry.find_by_serial("SER-A")->id;

    (void)registry.mark_reserved(device_id, k_base);
    (void)registry.set_maintenance(k_admin, device_id, true, "screen cracked", k_base);
    REQUIRE_FALSE(registry.release(device_id, k_base));
    REQUIRE(registry.find(device_id)->status == DeviceStatus::Maintenance);
    REQUIRE_THROWS_AS(registry.mark_reserved(device_id, k_base), ConflictError);

    (void)registry.set_maintenance(k_admin, device_id, false, "", k_base);
    REQUIRE(registry.find(device_id)->status == DeviceStatus::Offline);
}

TEST_CASE("Removal is refused for devices with reservation history") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A")}, k_base), k_base);
    const DeviceId device_id = registry.find_by_serial("SER-A")->id;

    REQUIRE_THROWS_AS(registry.remove_device(k_admin, device_id, [](DeviceId) { return true; }), ConflictError);
    const TargetDevice deactivated = registry.deactivate_device(k_admin, device_id, "retired", k_base);
    REQUIRE_FALSE(deactivated.is_active);
    REQUIRE(deactivated.status == DeviceStatus::Maintenance);

    registry.remove_device(k_admin, device_id, [](DeviceId) { return false; });
    REQUIRE_FALSE(registry.find(device_id).has_value());
    REQUIRE_THROWS_AS(registry.remove_device(k_admin, device_id, nullptr), NotFoundError);
}

TEST_CASE("Statistics count devices by status, type and gateway") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A"), make_report("phone-b", "SER-B")}, k_base), k_base);
    (void)registry.apply_heartbeat(make_batch("gw-2", {make_report("phone-c", "SER-C")}, k_base), k_base);

    const DeviceStatistics stats = registry.statistics();
    REQUIRE(stats.total == 3);
    REQUIRE(stats.active == 3);
    REQUIRE(stats.by_status.at("available") == 3);
    REQUIRE(stats.by_type.at("physical") == 3);
    REQUIRE(stats.by_gateway.at("gw-1") == 2);
    REQUIRE(registry.last_reported_names("gw-2") == std::set<std::string>{"phone-c"});
}

TEST_CASE("Device updates keep the name and serial indexes consistent") {
    DeviceRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.apply_heartbeat(make_batch("gw-1", {make_report("phone-a", "SER-A"), make_report("phone-b", "SER-B")}, k_base), k_base);
    const DeviceId device_id = registry.find_by_serial("SER-A")->id;

    DeviceUpdate rename{};
    rename.name = "phone-a2";
    rename.serial_number = "SER-A2";
    rename.tags = std::vector<std::string>{"usb3"};
    const TargetDevice updated = registry.update_device(k_developer, device_id, rename, k_base);
    REQUIRE(updated.name == "phone-a2");
    REQUIRE(registry.find_by_name("gw-1", "phone-a2")->id == device_id);
    REQUIRE_FALSE(registry.find_by_name("gw-1", "phone-a").has_value());
    REQUIRE_FALSE(registry.find_by_serial("SER-A").has_value());
    REQUIRE(registry.find_by_serial("SER-A2")->tags == std::vector<std::string>{"usb3"});

    DeviceUpdate collision{};
    collision.name = "phone-b";
    REQUIRE_THROWS_AS(registry.update_device(k_developer, device_id, collision, k_base), ConflictError);

    DeviceUpdate bad_interval{};
    bad_interval.heartbeat_interval_seconds = 0;
    REQUIRE_THROWS_AS(registry.update_device(k_developer, device_id, bad_interval, k_base), std::invalid_argument);

    try {
        (void)registry.update_device(k_developer, 999, DeviceUpdate{}, k_base);
        FAIL("expected NotFoundError");
    } catch (const NotFoundError& error) {
        REQUIRE(error.entity() == "device");
        REQUIRE(error.identifier() == "999");
    }
}
