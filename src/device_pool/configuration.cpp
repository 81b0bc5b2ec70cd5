// === Configuration Loader ====================================================
//
// Parses and validates the environment-driven settings that feed the pool
// runtime. Defaults apply to unset variables; values that fail to parse or are
// not positive fall back to the default and leave a warning in the log.
//
// Note: this file never reads from disk; callers populate the process
// environment ahead of time (service unit, shell-sourced `.env`, ...).

#include "device_pool/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_export_path{"gateways.json"};
constexpr int k_default_worker_threads{4};
constexpr int k_default_expiry_sweep_seconds{60};
constexpr int k_default_cleanup_sweep_seconds{300};
constexpr int k_default_stale_multiplier{3};
constexpr int k_default_gateway_stale_seconds{180};
constexpr int k_default_health_recheck_minutes{5};
constexpr int k_default_association_inactivity_hours{24};
constexpr int k_default_admission_retries{3};
constexpr int k_default_admission_backoff_ms{50};

int parse_int(const char* variable, int fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn(R"({{"component":"configuration","variable":"{}","error":"must be positive","fallback":{}}})", variable, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn(R"({{"component":"configuration","variable":"{}","error":"not an integer","fallback":{}}})", variable, fallback);
        return fallback;
    }
}

std::optional<std::string> parse_string(const char* variable) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::nullopt;
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("DEVICE_POOL_LOG_DIR").value_or(std::string{k_default_log_directory});

    auto logger = initialize_logger(config.log_directory);
    logger->info(R"({{"component":"configuration","action":"loading","source":"environment"}})");

    config.worker_threads = static_cast<std::size_t>(parse_int("DEVICE_POOL_WORKER_THREADS", k_default_worker_threads));
    config.expiry_sweep_interval = Seconds{parse_int("DEVICE_POOL_EXPIRY_SWEEP_SECONDS", k_default_expiry_sweep_seconds)};
    config.cleanup_sweep_interval = Seconds{parse_int("DEVICE_POOL_CLEANUP_SWEEP_SECONDS", k_default_cleanup_sweep_seconds)};
    config.stale_multiplier = parse_int("DEVICE_POOL_STALE_MULTIPLIER", k_default_stale_multiplier);
    config.gateway_stale_after = Seconds{parse_int("DEVICE_POOL_GATEWAY_STALE_SECONDS", k_default_gateway_stale_seconds)};
    config.health_recheck_interval = Minutes{parse_int("DEVICE_POOL_HEALTH_RECHECK_MINUTES", k_default_health_recheck_minutes)};
    config.association_inactivity = std::chrono::hours{parse_int("DEVICE_POOL_ASSOCIATION_INACTIVITY_HOURS", k_default_association_inactivity_hours)};
    config.admission_retry.max_attempts = parse_int("DEVICE_POOL_ADMISSION_RETRIES", k_default_admission_retries);
    config.admission_retry.base_backoff = std::chrono::milliseconds{parse_int("DEVICE_POOL_ADMISSION_BACKOFF_MS", k_default_admission_backoff_ms)};
    config.export_path = parse_string("DEVICE_POOL_EXPORT_PATH").value_or(std::string{k_default_export_path});
    config.import_path = parse_string("DEVICE_POOL_IMPORT_PATH");

    logger->info(R"({{"component":"configuration","action":"loaded","workers":{},"expiry_sweep_s":{},"cleanup_sweep_s":{},"stale_multiplier":{},"admission_retries":{}}})",
                 config.worker_threads,
                 config.expiry_sweep_interval.count(),
                 config.cleanup_sweep_interval.count(),
                 config.stale_multiplier,
                 config.admission_retry.max_attempts);

    return config;
}

}  // namespace device_pool
