#include "device_pool/pool_runtime.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "device_pool/errors.hpp"
#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
/** @brief Identity used for work the daemon does on its own behalf. */
constexpr Principal k_system_principal{0, Role::Admin};

std::shared_ptr<FanoutEventSink> make_event_sink(const std::shared_ptr<QueuedEventSink>& queued_sink) {
    auto fanout = std::make_shared<FanoutEventSink>();
    fanout->attach(std::make_shared<LoggingEventSink>());
    fanout->attach(queued_sink);
    return fanout;
}
}  // namespace

PoolRuntime::PoolRuntime(Configuration configuration)
    : configuration_(std::move(configuration)),
      queued_sink_(std::make_shared<QueuedEventSink>()),
      event_sink_(make_event_sink(queued_sink_)),
      device_registry_(event_sink_),
      gateway_registry_(event_sink_),
      policy_store_(event_sink_),
      reservation_repository_(),
      association_manager_(device_registry_, gateway_registry_, event_sink_),
      reservation_manager_(device_registry_, policy_store_, reservation_repository_, event_sink_, configuration_.admission_retry),
      worker_pool_(configuration_.worker_threads),
      lease_sweep_("lease_sweep", configuration_.expiry_sweep_interval, [this]() { (void)run_lease_sweep(SystemClock::now()); }),
      cleanup_sweep_("cleanup_sweep", configuration_.cleanup_sweep_interval, [this]() { (void)run_cleanup_sweep(SystemClock::now()); }),
      logger_(get_logger()) {}

PoolRuntime::~PoolRuntime() {
    shutdown();
}

void PoolRuntime::initialize() {
    logger_->info(R"({{"component":"pool_runtime","action":"initializing"}})");
    if (configuration_.import_path.has_value()) {
        const ImportReport report = import_gateways_from(*configuration_.import_path, true);
        for (const ImportError& error : report.errors) {
            logger_->warn(R"({{"component":"pool_runtime","import_error":{},"gateway":{},"index":{}}})", json_quote(error.message), json_quote(error.gateway_id), error.index);
        }
    }
}

void PoolRuntime::run() {
    logger_->info(R"({{"component":"pool_runtime","action":"starting_sweeps"}})");
    lease_sweep_.start();
    cleanup_sweep_.start();
}

void PoolRuntime::shutdown() {
    lease_sweep_.stop();
    cleanup_sweep_.stop();
    worker_pool_.shutdown();
}

void PoolRuntime::expire_stale_now() {
    lease_sweep_.trigger_now();
}

HeartbeatResult PoolRuntime::apply_device_heartbeat(const HeartbeatBatch& batch, TimePoint now) {
    const std::optional<Gateway> gateway = gateway_registry_.find(batch.gateway_id);
    if (!gateway.has_value() || !gateway->is_active) {
        logger_->warn(R"({{"component":"pool_runtime","gateway":{},"heartbeat":"{}","devices":{}}})",
                      json_quote(batch.gateway_id),
                      gateway.has_value() ? "inactive gateway" : "unknown gateway",
                      batch.devices.size());
        return HeartbeatResult{};
    }
    return device_registry_.apply_heartbeat(batch, now);
}

std::future<HeartbeatResult> PoolRuntime::submit_device_heartbeat(HeartbeatBatch batch) {
    return worker_pool_.submit([this, batch = std::move(batch)]() { return apply_device_heartbeat(batch, SystemClock::now()); });
}

std::future<std::optional<Gateway>> PoolRuntime::submit_gateway_heartbeat(GatewayHeartbeat heartbeat) {
    return worker_pool_.submit([this, heartbeat = std::move(heartbeat)]() { return gateway_registry_.apply_heartbeat(heartbeat, SystemClock::now()); });
}

std::future<Reservation> PoolRuntime::submit_create_reservation(Principal actor, ReservationDraft draft) {
    return worker_pool_.submit([this, actor, draft = std::move(draft)]() { return reservation_manager_.create(actor, draft, SystemClock::now()); });
}

std::future<Reservation> PoolRuntime::submit_update_reservation(Principal actor, ReservationId reservation_id, ReservationChange change) {
    return worker_pool_.submit([this, actor, reservation_id, change = std::move(change)]() {
        return reservation_manager_.update(actor, reservation_id, change, SystemClock::now());
    });
}

std::future<Reservation> PoolRuntime::submit_cancel_reservation(Principal actor, ReservationId reservation_id) {
    return worker_pool_.submit([this, actor, reservation_id]() { return reservation_manager_.cancel(actor, reservation_id, SystemClock::now()); });
}

SweepReport PoolRuntime::run_lease_sweep(TimePoint now) {
    SweepReport report = reservation_manager_.expire_stale(now);
    const std::size_t notified = reservation_manager_.notify_upcoming(now);
    logger_->debug(R"({{"component":"pool_runtime","sweep":"lease","activated":{},"completed":{},"expired":{},"failures":{},"notified":{}}})",
                   report.activated.size(),
                   report.completed.size(),
                   report.expired.size(),
                   report.failures,
                   notified);
    return report;
}

CleanupReport PoolRuntime::run_cleanup_sweep(TimePoint now) {
    CleanupReport report{};
    report.stale_devices = device_registry_.sweep_stale(now, configuration_.stale_multiplier).size();
    report.stale_gateways = gateway_registry_.mark_stale_gateways(now, configuration_.gateway_stale_after).size();
    report.health = association_manager_.run_health_checks(now, configuration_.health_recheck_interval);
    report.associations_removed = association_manager_.cleanup_inactive(now, configuration_.association_inactivity).size();
    logger_->debug(R"({{"component":"pool_runtime","sweep":"cleanup","stale_devices":{},"stale_gateways":{},"checked":{},"removed":{}}})",
                   report.stale_devices,
                   report.stale_gateways,
                   report.health.checked,
                   report.associations_removed);
    return report;
}

ImportReport PoolRuntime::import_gateways_from(const std::filesystem::path& path, bool update_existing) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Cannot open gateway import file " + path.string());
    }
    const std::string json_text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    logger_->info(R"({{"component":"pool_runtime","action":"import","path":{}}})", json_quote(path.string()));
    return import_gateways(gateway_registry_, *event_sink_, k_system_principal, json_text, update_existing, SystemClock::now());
}

std::size_t PoolRuntime::export_gateways_to(const std::filesystem::path& path) const {
    std::ofstream output(path);
    if (!output) {
        throw std::runtime_error("Cannot open gateway export file " + path.string());
    }
    output << export_gateways_json(gateway_registry_);
    const std::size_t exported = gateway_registry_.list().size();
    logger_->info(R"({{"component":"pool_runtime","action":"export","gateways":{},"path":{}}})", exported, json_quote(path.string()));
    return exported;
}

void PoolRuntime::delete_gateway(const Principal& actor, const GatewayId& gateway_id) {
    gateway_registry_.delete_gateway(actor, gateway_id, [this](const GatewayId& candidate) {
        DeviceFilter filter{};
        filter.gateway_id = candidate;
        return association_manager_.has_live_associations(candidate) || !device_registry_.list(filter).empty();
    });
}

void PoolRuntime::remove_device(const Principal& actor, DeviceId device_id) {
    device_registry_.remove_device(actor, device_id, [this](DeviceId candidate) { return reservation_manager_.device_has_history(candidate); });
}

void PoolRuntime::delete_policy(const Principal& actor, PolicyId policy_id) {
    policy_store_.delete_policy(actor, policy_id, [this](PolicyId candidate) { return reservation_manager_.policy_in_use(candidate); });
}

DeviceRegistry& PoolRuntime::devices() noexcept {
    return device_registry_;
}

GatewayRegistry& PoolRuntime::gateways() noexcept {
    return gateway_registry_;
}

PolicyStore& PoolRuntime::policies() noexcept {
    return policy_store_;
}

AssociationManager& PoolRuntime::associations() noexcept {
    return association_manager_;
}

ReservationManager& PoolRuntime::reservations() noexcept {
    return reservation_manager_;
}

WorkerPool& PoolRuntime::workers() noexcept {
    return worker_pool_;
}

QueuedEventSink& PoolRuntime::outbound_events() noexcept {
    return *queued_sink_;
}

const Configuration& PoolRuntime::configuration() const noexcept {
    return configuration_;
}

}  // namespace device_pool
