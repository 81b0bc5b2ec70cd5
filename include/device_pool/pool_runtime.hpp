// === Pool Runtime ============================================================
//
// Composition root of the daemon. Owns the event sinks, registries, stores,
// managers, the request worker pool and the two maintenance sweeps:
//
//   lease sweep    reservation expiry/activation + upcoming notifications
//   cleanup sweep  stale devices, stale gateways, association health checks
//                  and association cleanup
//
// Request entry points (heartbeats, reservation create/update/cancel) have a
// submit_* form that runs the work on the request worker pool and hands the
// result or the error back through a future.
//
// Constructed once per process; nothing else holds mutable global state.

#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

#include "device_pool/association_manager.hpp"
#include "device_pool/configuration.hpp"
#include "device_pool/device_registry.hpp"
#include "device_pool/event_sink.hpp"
#include "device_pool/gateway_interchange.hpp"
#include "device_pool/gateway_registry.hpp"
#include "device_pool/periodic_task.hpp"
#include "device_pool/policy_store.hpp"
#include "device_pool/reservation.hpp"
#include "device_pool/reservation_manager.hpp"
#include "device_pool/worker_pool.hpp"

namespace device_pool {

struct CleanupReport final {
    std::size_t stale_devices{};
    std::size_t stale_gateways{};
    HealthCheckReport health{};
    std::size_t associations_removed{};
};

class PoolRuntime final {
  public:
    explicit PoolRuntime(Configuration configuration);
    ~PoolRuntime();

    /** @brief Import the configured gateway file, if any. */
    void initialize();
    /** @brief Start both maintenance sweeps. */
    void run();
    /** @brief Stop the sweeps and drain the worker pool. */
    void shutdown();

    /** @brief Run the lease sweep immediately instead of waiting for its interval. */
    void expire_stale_now();

    /**
     * @brief Reconcile a device heartbeat batch.
     *
     * Batches from gateways that are unknown or deactivated are stale input:
     * they are logged and answered with an empty result.
     */
    HeartbeatResult apply_device_heartbeat(const HeartbeatBatch& batch, TimePoint now);

    std::future<HeartbeatResult> submit_device_heartbeat(HeartbeatBatch batch);
    std::future<std::optional<Gateway>> submit_gateway_heartbeat(GatewayHeartbeat heartbeat);
    std::future<Reservation> submit_create_reservation(Principal actor, ReservationDraft draft);
    std::future<Reservation> submit_update_reservation(Principal actor, ReservationId reservation_id, ReservationChange change);
    std::future<Reservation> submit_cancel_reservation(Principal actor, ReservationId reservation_id);

    SweepReport run_lease_sweep(TimePoint now);
    CleanupReport run_cleanup_sweep(TimePoint now);

    ImportReport import_gateways_from(const std::filesystem::path& path, bool update_existing);
    /** @brief Write the JSON export of every gateway to @p path; returns the number written. */
    std::size_t export_gateways_to(const std::filesystem::path& path) const;

    /** @brief Hard-delete a gateway unless children, devices or live associations still reference it. */
    void delete_gateway(const Principal& actor, const GatewayId& gateway_id);
    /** @brief Hard-delete a device that never carried a reservation. */
    void remove_device(const Principal& actor, DeviceId device_id);
    /** @brief Delete a policy no pending or active reservation references. */
    void delete_policy(const Principal& actor, PolicyId policy_id);

    [[nodiscard]] DeviceRegistry& devices() noexcept;
    [[nodiscard]] GatewayRegistry& gateways() noexcept;
    [[nodiscard]] PolicyStore& policies() noexcept;
    [[nodiscard]] AssociationManager& associations() noexcept;
    [[nodiscard]] ReservationManager& reservations() noexcept;
    [[nodiscard]] WorkerPool& workers() noexcept;
    /** @brief Events waiting for the notification collaborator. */
    [[nodiscard]] QueuedEventSink& outbound_events() noexcept;
    [[nodiscard]] const Configuration& configuration() const noexcept;

  private:
    Configuration configuration_;
    std::shared_ptr<QueuedEventSink> queued_sink_;
    std::shared_ptr<FanoutEventSink> event_sink_;
    DeviceRegistry device_registry_;
    GatewayRegistry gateway_registry_;
    PolicyStore policy_store_;
    InMemoryReservationRepository reservation_repository_;
    AssociationManager association_manager_;
    ReservationManager reservation_manager_;
    WorkerPool worker_pool_;
    PeriodicTask lease_sweep_;
    PeriodicTask cleanup_sweep_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
