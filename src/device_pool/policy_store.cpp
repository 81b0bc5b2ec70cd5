#include "device_pool/policy_store.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "device_pool/errors.hpp"
#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
constexpr int k_default_max_duration_minutes{240};
constexpr int k_default_cooldown_minutes{60};
constexpr int k_default_max_reservations_per_day{3};
constexpr int k_default_advance_days{14};
constexpr int k_default_auto_expire_minutes{15};
constexpr int k_default_notification_minutes{15};

EffectivePolicy from_policy(const ReservationPolicy& policy) {
    EffectivePolicy effective{};
    effective.policy = policy;
    effective.max_duration_minutes = policy.max_duration_minutes;
    effective.cooldown_minutes = policy.cooldown_minutes;
    effective.max_reservations_per_day = policy.max_reservations_per_day;
    effective.max_reservation_days_in_advance = policy.max_reservation_days_in_advance;
    effective.auto_expire_enabled = policy.auto_expire_enabled;
    effective.auto_expire_minutes = policy.auto_expire_minutes;
    effective.notification_before_start_minutes = policy.notification_before_start_minutes;
    effective.notification_before_end_minutes = policy.notification_before_end_minutes;
    return effective;
}

bool ranks_before(const ReservationPolicy& lhs, const ReservationPolicy& rhs) {
    if (lhs.priority_level != rhs.priority_level) {
        return lhs.priority_level > rhs.priority_level;
    }
    return lhs.id < rhs.id;
}
}  // namespace

EffectivePolicy default_effective_policy() {
    EffectivePolicy effective{};
    effective.max_duration_minutes = k_default_max_duration_minutes;
    effective.cooldown_minutes = k_default_cooldown_minutes;
    effective.max_reservations_per_day = k_default_max_reservations_per_day;
    effective.max_reservation_days_in_advance = k_default_advance_days;
    effective.auto_expire_enabled = true;
    effective.auto_expire_minutes = k_default_auto_expire_minutes;
    effective.notification_before_start_minutes = k_default_notification_minutes;
    effective.notification_before_end_minutes = k_default_notification_minutes;
    return effective;
}

EffectivePolicy select_effective_policy(const std::vector<ReservationPolicy>& policies) {
    if (policies.empty()) {
        return default_effective_policy();
    }
    // The winner's limits apply exclusively; no merging across policies.
    const auto winner = std::min_element(policies.begin(), policies.end(), ranks_before);
    return from_policy(*winner);
}

PolicyStore::PolicyStore(std::shared_ptr<EventSink> event_sink)
    : event_sink_(std::move(event_sink)),
      logger_(get_logger()) {
    if (event_sink_ == nullptr) {
        throw std::invalid_argument("PolicyStore requires an event sink");
    }
}

ReservationPolicy PolicyStore::create_policy(const Principal& actor, ReservationPolicy policy) {
    require_role(actor, Role::Admin, "create reservation policies");
    validate(policy);
    {
        std::unique_lock lock(mutex_);
        const bool duplicate = std::any_of(map_policies_.begin(), map_policies_.end(), [&policy](const auto& entry) {
            return entry.second.name == policy.name;
        });
        if (duplicate) {
            throw ConflictError("Policy with name " + policy.name + " already exists", {policy.name});
        }
        policy.id = next_policy_id_++;
        map_policies_.emplace(policy.id, policy);
    }
    logger_->info(R"({{"component":"policy_store","action":"created","policy":{},"name":"{}","priority":{}}})",
                  policy.id,
                  policy.name,
                  policy.priority_level);
    publish_change(policy.id, "created");
    return policy;
}

ReservationPolicy PolicyStore::update_policy(const Principal& actor, const ReservationPolicy& policy) {
    require_role(actor, Role::Admin, "update reservation policies");
    validate(policy);
    {
        std::unique_lock lock(mutex_);
        (void)require_locked(policy.id);
        for (const auto& [policy_id, existing] : map_policies_) {
            if (policy_id != policy.id && existing.name == policy.name) {
                throw ConflictError("Policy with name " + policy.name + " already exists", {policy.name});
            }
        }
        map_policies_[policy.id] = policy;
    }
    publish_change(policy.id, "updated");
    return policy;
}

void PolicyStore::delete_policy(const Principal& actor, PolicyId policy_id, const std::function<bool(PolicyId)>& in_use) {
    require_role(actor, Role::Admin, "delete reservation policies");
    if (in_use && in_use(policy_id)) {
        throw ConflictError("Policy " + std::to_string(policy_id) + " is referenced by live reservations",
                            {std::to_string(policy_id)});
    }
    {
        std::unique_lock lock(mutex_);
        (void)require_locked(policy_id);
        map_policies_.erase(policy_id);
        for (auto& [device_id, policy_ids] : map_device_policies_) {
            policy_ids.erase(policy_id);
        }
        for (auto& [user_id, policy_ids] : map_user_policies_) {
            policy_ids.erase(policy_id);
        }
    }
    publish_change(policy_id, "deleted");
}

std::optional<ReservationPolicy> PolicyStore::find(PolicyId policy_id) const {
    std::shared_lock lock(mutex_);
    const auto iterator_policy = map_policies_.find(policy_id);
    if (iterator_policy == map_policies_.end()) {
        return std::nullopt;
    }
    return iterator_policy->second;
}

std::vector<ReservationPolicy> PolicyStore::list() const {
    std::shared_lock lock(mutex_);
    std::vector<ReservationPolicy> policies;
    policies.reserve(map_policies_.size());
    for (const auto& [policy_id, policy] : map_policies_) {
        policies.push_back(policy);
    }
    return policies;
}

void PolicyStore::assign_to_devices(const Principal& actor, PolicyId policy_id, const std::vector<DeviceId>& device_ids) {
    require_role(actor, Role::Admin, "assign reservation policies");
    {
        std::unique_lock lock(mutex_);
        (void)require_locked(policy_id);
        for (const DeviceId device_id : device_ids) {
            map_device_policies_[device_id].insert(policy_id);
        }
    }
    publish_change(policy_id, "assigned_to_devices");
}

void PolicyStore::assign_to_users(const Principal& actor, PolicyId policy_id, const std::vector<UserId>& user_ids) {
    require_role(actor, Role::Admin, "assign reservation policies");
    {
        std::unique_lock lock(mutex_);
        (void)require_locked(policy_id);
        for (const UserId user_id : user_ids) {
            map_user_policies_[user_id].insert(policy_id);
        }
    }
    publish_change(policy_id, "assigned_to_users");
}

void PolicyStore::remove_from_devices(const Principal& actor, PolicyId policy_id, const std::vector<DeviceId>& device_ids) {
    require_role(actor, Role::Admin, "remove reservation policies");
    {
        std::unique_lock lock(mutex_);
        (void)require_locked(policy_id);
        for (const DeviceId device_id : device_ids) {
            const auto iterator_device = map_device_policies_.find(device_id);
            if (iterator_device != map_device_policies_.end()) {
                iterator_device->second.erase(policy_id);
            }
        }
    }
    publish_change(policy_id, "removed_from_devices");
}

void PolicyStore::remove_from_users(const Principal& actor, PolicyId policy_id, const std::vector<UserId>& user_ids) {
    require_role(actor, Role::Admin, "remove reservation policies");
    {
        std::unique_lock lock(mutex_);
        (void)require_locked(policy_id);
        for (const UserId user_id : user_ids) {
            const auto iterator_user = map_user_policies_.find(user_id);
            if (iterator_user != map_user_policies_.end()) {
                iterator_user->second.erase(policy_id);
            }
        }
    }
    publish_change(policy_id, "removed_from_users");
}

std::vector<ReservationPolicy> PolicyStore::resolve(UserId user_id, DeviceId device_id) const {
    std::shared_lock lock(mutex_);
    std::set<PolicyId> policy_ids;
    if (const auto iterator_user = map_user_policies_.find(user_id); iterator_user != map_user_policies_.end()) {
        policy_ids.insert(iterator_user->second.begin(), iterator_user->second.end());
    }
    if (const auto iterator_device = map_device_policies_.find(device_id); iterator_device != map_device_policies_.end()) {
        policy_ids.insert(iterator_device->second.begin(), iterator_device->second.end());
    }

    std::vector<ReservationPolicy> policies;
    policies.reserve(policy_ids.size());
    for (const PolicyId policy_id : policy_ids) {
        const auto iterator_policy = map_policies_.find(policy_id);
        if (iterator_policy != map_policies_.end()) {
            policies.push_back(iterator_policy->second);
        }
    }
    std::sort(policies.begin(), policies.end(), ranks_before);
    return policies;
}

EffectivePolicy PolicyStore::effective(UserId user_id, DeviceId device_id) const {
    return select_effective_policy(resolve(user_id, device_id));
}

void PolicyStore::validate(const ReservationPolicy& policy) {
    if (policy.name.empty()) {
        throw std::invalid_argument("Policy name cannot be empty");
    }
    if (policy.max_duration_minutes <= 0) {
        throw std::invalid_argument("Policy max_duration_minutes must be positive");
    }
    if (policy.max_reservations_per_day <= 0) {
        throw std::invalid_argument("Policy max_reservations_per_day must be positive");
    }
    if (policy.cooldown_minutes < 0 || policy.max_reservation_days_in_advance < 0) {
        throw std::invalid_argument("Policy cooldown and advance horizon cannot be negative");
    }
    if (policy.auto_expire_enabled && policy.auto_expire_minutes <= 0) {
        throw std::invalid_argument("Policy auto_expire_minutes must be positive when auto-expire is enabled");
    }
}

const ReservationPolicy& PolicyStore::require_locked(PolicyId policy_id) const {
    const auto iterator_policy = map_policies_.find(policy_id);
    if (iterator_policy == map_policies_.end()) {
        throw NotFoundError("policy", std::to_string(policy_id));
    }
    return iterator_policy->second;
}

void PolicyStore::publish_change(PolicyId policy_id, const std::string& action) {
    LifecycleEvent event{};
    event.type = event_type::k_policy_changed;
    event.subjects["policy"] = std::to_string(policy_id);
    event.details["action"] = action;
    publish_event(*event_sink_, event, *logger_);
}

}  // namespace device_pool
