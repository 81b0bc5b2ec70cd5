// === Association Manager =====================================================
//
// Owns the target-gateway association records: the binding between a device
// and the gateway currently serving it. A device has at most one live
// association at a time. Health checks re-score live associations through a
// pluggable probe, and the cleanup pass deletes associations that stayed
// disconnected or failed for longer than the inactivity window.

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "device_pool/device.hpp"
#include "device_pool/device_registry.hpp"
#include "device_pool/event_sink.hpp"
#include "device_pool/gateway.hpp"
#include "device_pool/gateway_registry.hpp"
#include "device_pool/roles.hpp"

namespace device_pool {

struct TargetGatewayAssociation final {
    AssociationId id{};
    DeviceId target_id{};
    GatewayId gateway_id{};
    AssociationStatus status{AssociationStatus::Pending};
    std::optional<int> health_score{};
    std::optional<TimePoint> last_health_check{};
    std::optional<std::string> tunnel_id{};
    std::optional<int> tunnel_port{};
    std::string tunnel_status{};
    std::map<std::string, std::string> connection_details{};
    std::optional<UserId> created_by{};
    TimePoint created_at{};
    TimePoint updated_at{};
};

/** @brief Pending, connecting and connected associations hold the device. */
[[nodiscard]] bool is_live(AssociationStatus status) noexcept;

/** @brief Status implied by a health score: below 30 failed, below 60 disconnected. */
[[nodiscard]] AssociationStatus classify_health(int health_score) noexcept;

struct AssociationUpdate final {
    std::optional<AssociationStatus> status{};
    std::optional<int> health_score{};
    std::optional<std::string> tunnel_id{};
    std::optional<int> tunnel_port{};
    std::optional<std::string> tunnel_status{};
};

/** @brief Per-item outcome of a bulk association call. */
struct BulkAssociationResult final {
    std::vector<TargetGatewayAssociation> succeeded{};
    std::vector<std::string> errors{};
};

struct HealthCheckReport final {
    std::size_t checked{};
    std::size_t skipped{};                               /**< Checked too recently. */
    std::vector<TargetGatewayAssociation> changed{};     /**< Associations whose status moved. */
};

struct AssociationStatistics final {
    std::size_t total{};
    std::size_t live{};
    std::map<std::string, std::size_t> by_status{};
    std::optional<double> average_health{};
};

/** @brief Scores one association; 0-100. */
class HealthProbe {
  public:
    virtual ~HealthProbe() = default;

    [[nodiscard]] virtual int score(const TargetGatewayAssociation& association,
                                    const TargetDevice& device,
                                    const std::optional<Gateway>& gateway) = 0;
};

/**
 * @brief Probe deriving the score from what the registries already know.
 *
 * Starts from the device health score (100 when unknown) and caps it by the
 * gateway condition: offline or missing gateways score 0, maintenance caps
 * at 40, degraded costs 20 points, and a known gateway health score is an
 * upper bound. An offline device caps at 20.
 */
class RegistryHealthProbe final : public HealthProbe {
  public:
    [[nodiscard]] int score(const TargetGatewayAssociation& association,
                            const TargetDevice& device,
                            const std::optional<Gateway>& gateway) override;
};

class AssociationManager final {
  public:
    AssociationManager(DeviceRegistry& device_registry,
                       GatewayRegistry& gateway_registry,
                       std::shared_ptr<EventSink> event_sink,
                       std::shared_ptr<HealthProbe> health_probe = std::make_shared<RegistryHealthProbe>());

    /**
     * @brief Bind @p device_id to @p gateway_id.
     *
     * Re-associating with the same gateway returns the existing record.
     *
     * @throws ConflictError when the device is live on a different gateway or the gateway is inactive.
     */
    TargetGatewayAssociation associate(const Principal& actor,
                                       DeviceId device_id,
                                       const GatewayId& gateway_id,
                                       AssociationStatus initial_status,
                                       TimePoint now);
    /**
     * @brief Release the live binding between @p device_id and @p gateway_id.
     *
     * Reserved devices need @p force and are then demoted to offline.
     */
    TargetGatewayAssociation disassociate(const Principal& actor, DeviceId device_id, const GatewayId& gateway_id, bool force, TimePoint now);

    /** @brief Associate each device independently; throws only when none succeeded. */
    BulkAssociationResult bulk_associate(const Principal& actor,
                                         const GatewayId& gateway_id,
                                         const std::vector<DeviceId>& device_ids,
                                         AssociationStatus initial_status,
                                         TimePoint now);
    /** @brief Disassociate every device or none: the whole batch is validated first. */
    std::vector<TargetGatewayAssociation> bulk_disassociate(const Principal& actor,
                                                            const GatewayId& gateway_id,
                                                            const std::vector<DeviceId>& device_ids,
                                                            bool force,
                                                            TimePoint now);

    TargetGatewayAssociation update_association(const Principal& actor, AssociationId association_id, const AssociationUpdate& update, TimePoint now);

    /**
     * @brief Re-score live associations last checked longer than @p recheck_interval ago.
     *
     * Per-association failures are logged and do not stop the pass.
     */
    HealthCheckReport run_health_checks(TimePoint now, Minutes recheck_interval, const std::optional<GatewayId>& gateway_id = std::nullopt);
    /** @brief Check one association now; unknown ids are logged and ignored. */
    std::optional<TargetGatewayAssociation> check_association(AssociationId association_id, TimePoint now);
    /** @brief Delete associations disconnected or failed for longer than @p inactivity. */
    std::vector<TargetGatewayAssociation> cleanup_inactive(TimePoint now, std::chrono::hours inactivity);

    [[nodiscard]] std::optional<TargetGatewayAssociation> find(AssociationId association_id) const;
    [[nodiscard]] std::optional<TargetGatewayAssociation> live_association_for(DeviceId device_id) const;
    [[nodiscard]] std::vector<TargetGatewayAssociation> for_gateway(const GatewayId& gateway_id) const;
    [[nodiscard]] std::vector<TargetGatewayAssociation> list() const;
    [[nodiscard]] bool has_live_associations(const GatewayId& gateway_id) const;
    [[nodiscard]] AssociationStatistics statistics() const;

  private:
    struct Transition final {
        TargetGatewayAssociation association{};
        AssociationStatus old_status{};
        std::string reason{};
    };

    TargetGatewayAssociation associate_locked(const Principal& actor,
                                              DeviceId device_id,
                                              const GatewayId& gateway_id,
                                              AssociationStatus initial_status,
                                              TimePoint now,
                                              bool& created);
    TargetGatewayAssociation* live_locked(DeviceId device_id);
    std::optional<Transition> score_locked(TargetGatewayAssociation& association, TimePoint now);
    void set_status_locked(TargetGatewayAssociation& association, AssociationStatus status, TimePoint now);
    void publish(const std::string& type, const TargetGatewayAssociation& association, std::map<std::string, std::string> details);
    void publish_transition(const Transition& transition);

    DeviceRegistry& device_registry_;
    GatewayRegistry& gateway_registry_;
    std::shared_ptr<EventSink> event_sink_;
    std::shared_ptr<HealthProbe> health_probe_;

    mutable std::mutex mutex_;
    std::map<AssociationId, TargetGatewayAssociation> map_associations_;
    AssociationId next_association_id_{1};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
