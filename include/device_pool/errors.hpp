// === Errors ==================================================================
//
// Exception taxonomy surfaced by the registries and the reservation engine.
// Callers branch on `ErrorKind` (or catch the concrete subclass); only
// `TransientStoreError` is ever retried automatically.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "device_pool/types.hpp"

namespace device_pool {

enum class ErrorKind {
    NotFound,
    Conflict,
    PolicyViolation,
    StaleInput,
    Transient,
    AccessDenied
};

/** @brief Fair-use limit named by a policy violation. */
enum class PolicyLimit {
    MaxDuration,
    DailyQuota,
    Cooldown,
    AdvanceHorizon,
    DeviceType,
    Role
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(PolicyLimit limit) noexcept;

/** @brief Base class for every domain error raised by the pool. */
class DevicePoolError : public std::runtime_error {
  public:
    DevicePoolError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept;

  private:
    ErrorKind kind_;
};

/** @brief Unknown device, reservation, gateway, policy or association id. */
class NotFoundError final : public DevicePoolError {
  public:
    NotFoundError(std::string entity, std::string identifier);

    [[nodiscard]] const std::string& entity() const noexcept;
    [[nodiscard]] const std::string& identifier() const noexcept;

  private:
    std::string str_entity_;
    std::string str_identifier_;
};

/**
 * @brief Request collides with existing state.
 *
 * Carries the ids of the conflicting entities (reservation ids for overlaps,
 * a gateway id for duplicate or cyclic gateways, ...).
 */
class ConflictError final : public DevicePoolError {
  public:
    explicit ConflictError(const std::string& message, std::vector<std::string> conflicting_ids = {});

    [[nodiscard]] const std::vector<std::string>& conflicting_ids() const noexcept;

  private:
    std::vector<std::string> list_conflicting_ids_;
};

/** @brief A fair-use limit rejected the request. */
class PolicyViolationError final : public DevicePoolError {
  public:
    PolicyViolationError(PolicyLimit limit, const std::string& message);

    [[nodiscard]] PolicyLimit limit() const noexcept;

  private:
    PolicyLimit limit_;
};

/** @brief Lock contention or timeout in a store; safe to retry. */
class TransientStoreError final : public DevicePoolError {
  public:
    explicit TransientStoreError(const std::string& message);
};

class AccessDeniedError final : public DevicePoolError {
  public:
    explicit AccessDeniedError(const std::string& message);
};

}  // namespace device_pool
