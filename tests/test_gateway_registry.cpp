#include <chrono>
#include <memory>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "recording_event_sink.hpp"
#include "device_pool/errors.hpp"
#include "device_pool/gateway_registry.hpp"

using namespace device_pool;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    device_pool::test::ensure_logger_initialized();
    return true;
}();

const TimePoint k_base = std::chrono::sys_days{std::chrono::year{2026} / 3 / 2} + std::chrono::hours{9};
const Principal k_admin{1, Role::Admin};

Gateway make_gateway(const GatewayId& gateway_id, GatewayType gateway_type, std::optional<GatewayId> parent = std::nullopt) {
    Gateway gateway{};
    gateway.gateway_id = gateway_id;
    gateway.name = gateway_id + " gateway";
    gateway.gateway_type = gateway_type;
    gateway.parent_gateway_id = std::move(parent);
    gateway.region = "eu-west";
    gateway.environment = "production";
    return gateway;
}

/** @brief master -> region -> site-a, site-b */
void seed_tree(GatewayRegistry& registry) {
    (void)registry.create_gateway(k_admin, make_gateway("master", GatewayType::Master), k_base);
    (void)registry.create_gateway(k_admin, make_gateway("region", GatewayType::Region, "master"), k_base);
    (void)registry.create_gateway(k_admin, make_gateway("site-a", GatewayType::Site, "region"), k_base);
    (void)registry.create_gateway(k_admin, make_gateway("site-b", GatewayType::Site, "region"), k_base);
}
}  // namespace

TEST_CASE("GatewayRegistry rejects duplicates, missing parents and non-admins") {
    GatewayRegistry registry{std::make_shared<test::RecordingEventSink>()};
    (void)registry.create_gateway(k_admin, make_gateway("gw-1", GatewayType::Site), k_base);

    REQUIRE_THROWS_AS(registry.create_gateway(k_admin, make_gateway("gw-1", GatewayType::Site), k_base), ConflictError);
    REQUIRE_THROWS_AS(registry.create_gateway(k_admin, make_gateway("gw-2", GatewayType::Site, "ghost"), k_base), NotFoundError);
    REQUIRE_THROWS_AS(registry.create_gateway(k_admin, make_gateway("gw-3", GatewayType::Site, "gw-3"), k_base), ConflictError);
    REQUIRE_THROWS_AS(registry.create_gateway(Principal{5, Role::Developer}, make_gateway("gw-4", GatewayType::Site), k_base), AccessDeniedError);

    Gateway bad_port = make_gateway("gw-5", GatewayType::Site);
    bad_port.ssh_port = 70'000;
    REQUIRE_THROWS_AS(registry.create_gateway(k_admin, bad_port, k_base), std::invalid_argument);
}

TEST_CASE("GatewayRegistry refuses parent changes that would form a cycle") {
    GatewayRegistry registry{std::make_shared<test::RecordingEventSink>()};
    seed_tree(registry);

    GatewayUpdate onto_descendant{};
    onto_descendant.parent_gateway_id = "site-a";
    REQUIRE_THROWS_AS(registry.update_gateway(k_admin, "master", onto_descendant, k_base), ConflictError);

    GatewayUpdate onto_self{};
    onto_self.parent_gateway_id = "region";
    REQUIRE_THROWS_AS(registry.update_gateway(k_admin, "region", onto_self, k_base), ConflictError);

    GatewayUpdate sideways{};
    sideways.parent_gateway_id = "site-a";
    const Gateway moved = registry.update_gateway(k_admin, "site-b", sideways, k_base);
    REQUIRE(moved.parent_gateway_id == GatewayId{"site-a"});

    GatewayUpdate detach{};
    detach.clear_parent = true;
    REQUIRE_FALSE(registry.update_gateway(k_admin, "site-b", detach, k_base).parent_gateway_id.has_value());
}

TEST_CASE("GatewayRegistry builds the hierarchy from active gateways") {
    GatewayRegistry registry{std::make_shared<test::RecordingEventSink>()};
    seed_tree(registry);

    auto roots = registry.hierarchy();
    REQUIRE(roots.size() == 1);
    REQUIRE(roots.front().gateway.gateway_id == "master");
    REQUIRE(roots.front().children.size() == 1);
    REQUIRE(roots.front().children.front().children.size() == 2);

    // A deactivated parent promotes its active children to roots.
    (void)registry.deactivate_gateway(k_admin, "region", k_base);
    roots = registry.hierarchy();
    REQUIRE(roots.size() == 3);
    REQUIRE(registry.children("region").size() == 2);
    REQUIRE_FALSE(registry.find("region")->is_active);
    REQUIRE(registry.find("region")->status == GatewayStatus::Maintenance);
}

TEST_CASE("Gateway heartbeats emit status events only on change") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    GatewayRegistry registry{sink};
    (void)registry.create_gateway(k_admin, make_gateway("gw-1", GatewayType::Site), k_base);

    GatewayHeartbeat heartbeat{};
    heartbeat.gateway_id = "gw-1";
    heartbeat.status = GatewayStatus::Online;
    heartbeat.health_score = 95;
    heartbeat.current_sessions = 2;

    REQUIRE(registry.apply_heartbeat(heartbeat, k_base).has_value());
    REQUIRE(registry.apply_heartbeat(heartbeat, k_base + std::chrono::seconds{30}).has_value());
    REQUIRE(sink->of_type(event_type::k_gateway_status_changed).size() == 1);

    heartbeat.status = GatewayStatus::Degraded;
    const auto degraded = registry.apply_heartbeat(heartbeat, k_base + std::chrono::seconds{60});
    REQUIRE(degraded->status == GatewayStatus::Degraded);
    REQUIRE(degraded->current_sessions == 2);
    REQUIRE(sink->of_type(event_type::k_gateway_status_changed).size() == 2);

    GatewayHeartbeat unknown{};
    unknown.gateway_id = "ghost";
    REQUIRE_FALSE(registry.apply_heartbeat(unknown, k_base).has_value());

    heartbeat.health_score = 101;
    REQUIRE_FALSE(registry.apply_heartbeat(heartbeat, k_base).has_value());
}

TEST_CASE("Heartbeats from a deactivated gateway keep it under maintenance") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    GatewayRegistry registry{sink};
    (void)registry.create_gateway(k_admin, make_gateway("gw-1", GatewayType::Site), k_base);
    (void)registry.deactivate_gateway(k_admin, "gw-1", k_base);
    sink->clear();

    GatewayHeartbeat heartbeat{};
    heartbeat.gateway_id = "gw-1";
    heartbeat.status = GatewayStatus::Online;
    heartbeat.health_score = 80;
    const auto gateway = registry.apply_heartbeat(heartbeat, k_base + std::chrono::seconds{30});

    REQUIRE(gateway->status == GatewayStatus::Maintenance);
    REQUIRE_FALSE(gateway->is_active);
    REQUIRE(gateway->health_score == 80);
    REQUIRE(gateway->last_heartbeat == k_base + std::chrono::seconds{30});
    REQUIRE(sink->of_type(event_type::k_gateway_status_changed).empty());
}

TEST_CASE("Silent gateways are marked offline by the stale sweep") {
    auto sink = std::make_shared<test::RecordingEventSink>();
    GatewayRegistry registry{sink};
    (void)registry.create_gateway(k_admin, make_gateway("gw-1", GatewayType::Site), k_base);
    (void)registry.create_gateway(k_admin, make_gateway("gw-2", GatewayType::Site), k_base);

    GatewayHeartbeat heartbeat{};
    heartbeat.gateway_id = "gw-1";
    (void)registry.apply_heartbeat(heartbeat, k_base);
    heartbeat.gateway_id = "gw-2";
    (void)registry.apply_heartbeat(heartbeat, k_base + std::chrono::minutes{4});

    const auto stale = registry.mark_stale_gateways(k_base + std::chrono::minutes{5}, Seconds{180});
    REQUIRE(stale.size() == 1);
    REQUIRE(stale.front().gateway_id == "gw-1");
    REQUIRE(registry.find("gw-1")->status == GatewayStatus::Offline);
    REQUIRE(registry.find("gw-2")->status == GatewayStatus::Online);
    REQUIRE(sink->of_type(event_type::k_gateway_status_changed).back().details.at("reason") == "stale_heartbeat");
}

TEST_CASE("Gateway deletion is refused while children or targets remain") {
    GatewayRegistry registry{std::make_shared<test::RecordingEventSink>()};
    seed_tree(registry);

    REQUIRE_THROWS_AS(registry.delete_gateway(k_admin, "region", nullptr), ConflictError);
    REQUIRE_THROWS_AS(registry.delete_gateway(k_admin, "site-a", [](const GatewayId&) { return true; }), ConflictError);

    registry.delete_gateway(k_admin, "site-a", [](const GatewayId&) { return false; });
    REQUIRE_FALSE(registry.exists("site-a"));
    REQUIRE_THROWS_AS(registry.delete_gateway(k_admin, "site-a", nullptr), NotFoundError);
}

TEST_CASE("The deletion guard may read the registry it guards") {
    GatewayRegistry registry{std::make_shared<test::RecordingEventSink>()};
    seed_tree(registry);

    bool guard_saw_gateway = false;
    registry.delete_gateway(k_admin, "site-b", [&](const GatewayId& candidate) {
        guard_saw_gateway = registry.find(candidate).has_value();
        return false;
    });
    REQUIRE(guard_saw_gateway);
    REQUIRE_FALSE(registry.exists("site-b"));

    SECTION("a child created while the guard runs still blocks deletion") {
        REQUIRE_THROWS_AS(registry.delete_gateway(k_admin,
                                                  "site-a",
                                                  [&](const GatewayId&) {
                                                      (void)registry.create_gateway(k_admin, make_gateway("rack-1", GatewayType::Standalone, "site-a"), k_base);
                                                      return false;
                                                  }),
                          ConflictError);
        REQUIRE(registry.exists("site-a"));
    }
}

TEST_CASE("Gateway listing filters and statistics") {
    GatewayRegistry registry{std::make_shared<test::RecordingEventSink>()};
    seed_tree(registry);
    Gateway lab = make_gateway("lab-1", GatewayType::Standalone);
    lab.region = "us-east";
    lab.environment = "staging";
    lab.description = "Nightly regression LAB";
    lab.tags = {"nightly", "usb3"};
    (void)registry.create_gateway(k_admin, lab, k_base);
    registry.adjust_target_count("lab-1", 3, k_base);
    registry.adjust_target_count("lab-1", -5, k_base);
    registry.adjust_target_count("site-a", 2, k_base);

    GatewayFilter by_type{};
    by_type.gateway_types = {GatewayType::Site};
    REQUIRE(registry.list(by_type).size() == 2);

    GatewayFilter by_search{};
    by_search.search = "regression lab";
    REQUIRE(registry.list(by_search).size() == 1);

    GatewayFilter by_tags{};
    by_tags.tags = {"nightly", "usb2"};
    REQUIRE(registry.list(by_tags).empty());

    GatewayFilter by_region{};
    by_region.region = "eu-west";
    by_region.parent_gateway_id = "region";
    REQUIRE(registry.list(by_region).size() == 2);

    const GatewayStatistics stats = registry.statistics();
    REQUIRE(stats.total == 5);
    REQUIRE(stats.active == 5);
    REQUIRE(stats.by_type.at("site") == 2);
    REQUIRE(stats.by_region.at("us-east") == 1);
    REQUIRE(stats.by_environment.at("staging") == 1);
    REQUIRE(stats.total_targets == 2);
    REQUIRE(registry.find("lab-1")->current_targets == 0);
}
