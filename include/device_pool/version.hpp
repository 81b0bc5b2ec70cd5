// === Version Metadata ========================================================
//
// Exposes the pool's semantic version string used in logs and exports.

#pragma once

#include <string_view>

namespace device_pool {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace device_pool
