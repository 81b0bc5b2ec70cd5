#include "device_pool/errors.hpp"

#include <utility>

namespace device_pool {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::Conflict:
            return "conflict";
        case ErrorKind::PolicyViolation:
            return "policy_violation";
        case ErrorKind::StaleInput:
            return "stale_input";
        case ErrorKind::Transient:
            return "transient";
        case ErrorKind::AccessDenied:
            return "access_denied";
    }
    return "unknown";
}

std::string_view to_string(PolicyLimit limit) noexcept {
    switch (limit) {
        case PolicyLimit::MaxDuration:
            return "max_duration";
        case PolicyLimit::DailyQuota:
            return "daily_quota";
        case PolicyLimit::Cooldown:
            return "cooldown";
        case PolicyLimit::AdvanceHorizon:
            return "advance_horizon";
        case PolicyLimit::DeviceType:
            return "device_type";
        case PolicyLimit::Role:
            return "role";
    }
    return "unknown";
}

DevicePoolError::DevicePoolError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind) {}

ErrorKind DevicePoolError::kind() const noexcept {
    return kind_;
}

NotFoundError::NotFoundError(std::string entity, std::string identifier)
    : DevicePoolError(ErrorKind::NotFound, entity + " " + identifier + " not found"),
      str_entity_(std::move(entity)),
      str_identifier_(std::move(identifier)) {}

const std::string& NotFoundError::entity() const noexcept {
    return str_entity_;
}

const std::string& NotFoundError::identifier() const noexcept {
    return str_identifier_;
}

ConflictError::ConflictError(const std::string& message, std::vector<std::string> conflicting_ids)
    : DevicePoolError(ErrorKind::Conflict, message),
      list_conflicting_ids_(std::move(conflicting_ids)) {}

const std::vector<std::string>& ConflictError::conflicting_ids() const noexcept {
    return list_conflicting_ids_;
}

PolicyViolationError::PolicyViolationError(PolicyLimit limit, const std::string& message)
    : DevicePoolError(ErrorKind::PolicyViolation, message),
      limit_(limit) {}

PolicyLimit PolicyViolationError::limit() const noexcept {
    return limit_;
}

TransientStoreError::TransientStoreError(const std::string& message)
    : DevicePoolError(ErrorKind::Transient, message) {}

AccessDeniedError::AccessDeniedError(const std::string& message)
    : DevicePoolError(ErrorKind::AccessDenied, message) {}

}  // namespace device_pool
