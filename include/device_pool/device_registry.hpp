// === Device Registry =========================================================
//
// Owns device records and reconciles them against gateway heartbeats. Every
// status mutation (heartbeat, reservation lifecycle, maintenance, association
// side effects) goes through this class under a single writer lock, so device
// status changes are serialized instead of racing last-writer-wins.
//
// Liveness detection keeps, per gateway, the immutable set of device names
// reported by the previous heartbeat. A new batch is diffed against that set
// and the snapshot is swapped whole once reconciliation finishes. Heartbeats
// from the same gateway are serialized through a per-gateway lock.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

#include "device_pool/device.hpp"
#include "device_pool/event_sink.hpp"
#include "device_pool/lock_table.hpp"
#include "device_pool/roles.hpp"

namespace device_pool {

class DeviceRegistry final {
  public:
    explicit DeviceRegistry(std::shared_ptr<EventSink> event_sink);

    /**
     * @brief Reconcile one heartbeat batch.
     *
     * Matches each report by serial number, then by `(gateway, name)`;
     * unknown devices are auto-registered as available. Reserved and
     * maintenance devices keep their status but still get fresh hardware,
     * health and heartbeat fields. Devices named in the previous batch for
     * this gateway but absent now go offline unless reserved or under
     * maintenance. A malformed entry is skipped without aborting the batch.
     * The gateway is not checked here; PoolRuntime::apply_device_heartbeat
     * drops batches from unknown gateways before they get this far.
     */
    HeartbeatResult apply_heartbeat(const HeartbeatBatch& batch, TimePoint now);

    /**
     * @brief Deactivate devices silent for longer than `multiplier x heartbeat_interval_seconds`.
     *
     * Covers gateways that stopped heartbeating altogether. Reserved and
     * maintenance devices are left untouched.
     */
    std::vector<TargetDevice> sweep_stale(TimePoint now, int multiplier, const std::optional<GatewayId>& gateway_id = std::nullopt);

    TargetDevice register_device(const Principal& actor, TargetDevice device, TimePoint now);
    TargetDevice update_device(const Principal& actor, DeviceId device_id, const DeviceUpdate& update, TimePoint now);
    /** @brief Enter or leave manual maintenance; leaving maintenance waits for the next heartbeat as offline. */
    TargetDevice set_maintenance(const Principal& actor, DeviceId device_id, bool enabled, const std::string& reason, TimePoint now);
    /** @brief Soft delete: inactive and in maintenance, kept for reservation history. */
    TargetDevice deactivate_device(const Principal& actor, DeviceId device_id, const std::string& reason, TimePoint now);
    /**
     * @brief Hard delete a device that was never referenced.
     *
     * @param has_history Answers whether any reservation references the device.
     */
    void remove_device(const Principal& actor, DeviceId device_id, const std::function<bool(DeviceId)>& has_history);

    [[nodiscard]] std::optional<TargetDevice> find(DeviceId device_id) const;
    [[nodiscard]] std::optional<TargetDevice> find_by_serial(const std::string& serial_number) const;
    [[nodiscard]] std::optional<TargetDevice> find_by_name(const GatewayId& gateway_id, const std::string& name) const;
    [[nodiscard]] std::vector<TargetDevice> list(const DeviceFilter& filter = {}) const;
    [[nodiscard]] DeviceStatistics statistics() const;
    /** @brief Device names the last heartbeat of @p gateway_id reported. */
    [[nodiscard]] std::set<std::string> last_reported_names(const GatewayId& gateway_id) const;

    /**
     * @brief Flip a device to reserved for an activating reservation.
     *
     * @throws NotFoundError for unknown devices.
     * @throws ConflictError when the device is inactive or under maintenance.
     */
    TargetDevice mark_reserved(DeviceId device_id, TimePoint now);
    /**
     * @brief Return a reserved device to available.
     *
     * Devices that left the reserved state independently (maintenance,
     * forced disassociation) are not touched. Returns true when released.
     */
    bool release(DeviceId device_id, TimePoint now);

    /** @brief Record the association status/health the association manager derived. */
    void mirror_association(DeviceId device_id, std::optional<AssociationStatus> status, std::optional<int> health, TimePoint now);
    /**
     * @brief Take a device out of service after it lost its gateway binding.
     *
     * Available devices go offline; reserved devices go offline only when
     * @p forced. adb/serial reachability is cleared either way.
     *
     * @throws ConflictError for a reserved device without @p forced.
     */
    void demote_after_disassociation(DeviceId device_id, bool forced, TimePoint now);

  private:
    struct StatusChange final {
        DeviceId device_id{};
        GatewayId gateway_id{};
        DeviceStatus old_status{};
        DeviceStatus new_status{};
        std::string reason{};
    };

    using NameSet = std::set<std::string>;
    using NameKey = std::pair<GatewayId, std::string>;

    TargetDevice& require_locked(DeviceId device_id);
    std::optional<DeviceId> match_locked(const GatewayId& gateway_id, const HeartbeatDeviceReport& report) const;
    TargetDevice& reconcile_locked(const GatewayId& gateway_id,
                                   const HeartbeatDeviceReport& report,
                                   TimePoint now,
                                   HeartbeatResult& result,
                                   std::vector<StatusChange>& changes);
    void index_locked(const TargetDevice& device);
    void unindex_locked(const TargetDevice& device);
    void set_status_locked(TargetDevice& device, DeviceStatus status, const std::string& reason, TimePoint now, std::vector<StatusChange>& changes);
    [[nodiscard]] std::shared_ptr<const NameSet> previous_names(const GatewayId& gateway_id) const;
    void publish_status_changes(const std::vector<StatusChange>& changes);
    void publish_registered(const TargetDevice& device, bool auto_registered);

    static void validate_report(const HeartbeatDeviceReport& report);

    mutable std::shared_mutex mutex_;
    std::map<DeviceId, TargetDevice> map_devices_;
    std::map<std::string, DeviceId> map_serial_index_;
    std::map<NameKey, DeviceId> map_name_index_;
    DeviceId next_device_id_{1};

    mutable std::mutex snapshot_mutex_;
    std::map<GatewayId, std::shared_ptr<const NameSet>> map_gateway_snapshots_;
    LockTable<GatewayId> gateway_locks_;

    std::shared_ptr<EventSink> event_sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
