// === Policy Store ============================================================
//
// Owns fair-use reservation policies and their many-to-many attachments to
// users and devices. Admission reads it through `resolve`/`effective`; admins
// administer it through the CRUD and assignment operations.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "device_pool/event_sink.hpp"
#include "device_pool/roles.hpp"
#include "device_pool/types.hpp"

namespace device_pool {

/** @brief Named fair-use rule set. */
struct ReservationPolicy final {
    PolicyId id{};
    std::string name{};
    std::string description{};
    int max_duration_minutes{240};
    int cooldown_minutes{60};
    int max_reservations_per_day{3};
    int max_reservation_days_in_advance{14};
    int priority_level{0};                                /**< Higher wins during resolution. */
    std::optional<std::vector<DeviceType>> allowed_device_types{};
    std::optional<std::vector<Role>> allowed_roles{};
    bool auto_expire_enabled{true};
    int auto_expire_minutes{15};
    int notification_before_start_minutes{15};
    int notification_before_end_minutes{15};
};

/** @brief Limits applied to a request once resolution picked a winner. */
struct EffectivePolicy final {
    std::optional<ReservationPolicy> policy{};            /**< Winning policy; empty for system defaults. */
    int max_duration_minutes{};
    int cooldown_minutes{};
    int max_reservations_per_day{};
    int max_reservation_days_in_advance{};
    bool auto_expire_enabled{};
    int auto_expire_minutes{};
    int notification_before_start_minutes{};
    int notification_before_end_minutes{};

    [[nodiscard]] bool is_default() const noexcept {
        return !policy.has_value();
    }
};

/** @brief Limits used when neither the user nor the device carries a policy. */
[[nodiscard]] EffectivePolicy default_effective_policy();

/** @brief Collapse @p policies (any order) to the highest-priority one, or defaults. */
[[nodiscard]] EffectivePolicy select_effective_policy(const std::vector<ReservationPolicy>& policies);

/** @brief Thread-safe policy repository with user/device attachments. */
class PolicyStore final {
  public:
    explicit PolicyStore(std::shared_ptr<EventSink> event_sink);

    /** @brief Create a policy; names are unique. Returns the stored copy with its id. */
    ReservationPolicy create_policy(const Principal& actor, ReservationPolicy policy);
    ReservationPolicy update_policy(const Principal& actor, const ReservationPolicy& policy);
    /**
     * @brief Delete a policy.
     *
     * @param in_use Predicate answering whether a live reservation still
     *        references the policy; a referenced policy is not deleted.
     */
    void delete_policy(const Principal& actor, PolicyId policy_id, const std::function<bool(PolicyId)>& in_use);

    [[nodiscard]] std::optional<ReservationPolicy> find(PolicyId policy_id) const;
    [[nodiscard]] std::vector<ReservationPolicy> list() const;

    void assign_to_devices(const Principal& actor, PolicyId policy_id, const std::vector<DeviceId>& device_ids);
    void assign_to_users(const Principal& actor, PolicyId policy_id, const std::vector<UserId>& user_ids);
    void remove_from_devices(const Principal& actor, PolicyId policy_id, const std::vector<DeviceId>& device_ids);
    void remove_from_users(const Principal& actor, PolicyId policy_id, const std::vector<UserId>& user_ids);

    /** @brief Union of policies attached to @p user_id and @p device_id, highest priority first. */
    [[nodiscard]] std::vector<ReservationPolicy> resolve(UserId user_id, DeviceId device_id) const;
    [[nodiscard]] EffectivePolicy effective(UserId user_id, DeviceId device_id) const;

  private:
    static void validate(const ReservationPolicy& policy);
    [[nodiscard]] const ReservationPolicy& require_locked(PolicyId policy_id) const;
    void publish_change(PolicyId policy_id, const std::string& action);

    mutable std::shared_mutex mutex_;
    std::map<PolicyId, ReservationPolicy> map_policies_;
    std::map<DeviceId, std::set<PolicyId>> map_device_policies_;
    std::map<UserId, std::set<PolicyId>> map_user_policies_;
    PolicyId next_policy_id_{1};
    std::shared_ptr<EventSink> event_sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
