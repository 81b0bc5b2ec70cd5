#include "device_pool/roles.hpp"

#include <fmt/format.h>

#include "device_pool/errors.hpp"

namespace device_pool {

void require_role(const Principal& principal, Role required, std::string_view action) {
    if (satisfies(required, principal.role)) {
        return;
    }
    throw AccessDeniedError(fmt::format(
        "user {} with role {} may not {} (requires {})",
        principal.user_id,
        to_string(principal.role),
        action,
        to_string(required)
    ));
}

std::string_view to_string(Role role) noexcept {
    switch (role) {
        case Role::Tester:
            return "tester";
        case Role::Developer:
            return "developer";
        case Role::Admin:
            return "admin";
    }
    return "unknown";
}

std::optional<Role> parse_role(std::string_view text) {
    if (text == "tester") {
        return Role::Tester;
    }
    if (text == "developer") {
        return Role::Developer;
    }
    if (text == "admin") {
        return Role::Admin;
    }
    return std::nullopt;
}

}  // namespace device_pool
