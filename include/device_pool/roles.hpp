// === Roles ===================================================================
//
// Ordered role hierarchy and the single capability predicate used wherever the
// pool checks whether a caller may perform an action.

#pragma once

#include <optional>
#include <string_view>

#include "device_pool/types.hpp"

namespace device_pool {

/** @brief Roles ordered by privilege; a higher role satisfies every lower one. */
enum class Role {
    Tester = 0,
    Developer = 1,
    Admin = 2
};

/** @brief Resolved caller identity handed over by the identity collaborator. */
struct Principal final {
    UserId user_id{};
    Role role{Role::Tester};
};

/** @brief True when @p actual grants at least the privileges of @p required. */
[[nodiscard]] constexpr bool satisfies(Role required, Role actual) noexcept {
    return static_cast<int>(actual) >= static_cast<int>(required);
}

[[nodiscard]] inline bool is_admin(const Principal& principal) noexcept {
    return satisfies(Role::Admin, principal.role);
}

/** @brief Throw AccessDeniedError unless @p principal holds @p required. */
void require_role(const Principal& principal, Role required, std::string_view action);

[[nodiscard]] std::string_view to_string(Role role) noexcept;
[[nodiscard]] std::optional<Role> parse_role(std::string_view text);

}  // namespace device_pool
