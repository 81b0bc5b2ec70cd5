// === Configuration ===========================================================
//
// Strongly-typed runtime knobs for the pool daemon: sweep cadences, staleness
// windows, admission retry budget and interchange paths. `ConfigurationLoader`
// translates environment variables into this structure so downstream modules
// never touch `std::getenv` directly.

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "device_pool/retry.hpp"
#include "device_pool/types.hpp"

namespace device_pool {

/**
 * @brief Immutable bundle of runtime settings.
 *
 * Every field is populated by ConfigurationLoader; consumers treat the values
 * as authoritative.
 */
struct Configuration final {
    std::string log_directory{};                   /**< Destination directory for structured logs. */
    std::size_t worker_threads{};                  /**< Request worker pool size. */
    Seconds expiry_sweep_interval{};               /**< Lease-expiry sweep cadence. */
    Seconds cleanup_sweep_interval{};              /**< Stale-device and association cleanup cadence. */
    int stale_multiplier{};                        /**< Heartbeat intervals of silence before a device goes stale. */
    Seconds gateway_stale_after{};
    Minutes health_recheck_interval{};
    std::chrono::hours association_inactivity{};
    RetryPolicy admission_retry{};
    std::string export_path{};
    std::optional<std::string> import_path{};      /**< Gateways imported at start-up when set. */
};

/** @brief Hydrates Configuration from `DEVICE_POOL_*` environment variables. */
class ConfigurationLoader final {
  public:
    /**
     * @brief Read the environment, apply defaults and initialise the logger.
     *
     * Unparsable or non-positive values fall back to their default with a
     * warning.
     */
    static Configuration load();
};

}  // namespace device_pool
