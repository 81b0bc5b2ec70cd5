// === Bounded Retry ===========================================================
//
// Re-runs an operation that failed with a TransientStoreError, sleeping a
// linearly growing backoff between attempts. Every other exception escapes on
// the first attempt.

#pragma once

#include <chrono>
#include <string_view>
#include <thread>

#include <spdlog/logger.h>

#include "device_pool/errors.hpp"

namespace device_pool {

struct RetryPolicy final {
    int max_attempts{3};                                  /**< Total attempts including the first. */
    std::chrono::milliseconds base_backoff{50};           /**< Sleep before attempt n+1 is base x n. */
};

template <typename Operation>
auto with_bounded_retry(const RetryPolicy& policy, std::string_view operation_name, spdlog::logger& logger, Operation&& operation)
    -> decltype(operation()) {
    const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    int attempt = 1;
    while (true) {
        try {
            return operation();
        } catch (const TransientStoreError& exc) {
            logger.warn(R"({{"component":"retry","operation":"{}","attempt":{},"max_attempts":{},"error":"{}"}})",
                        operation_name,
                        attempt,
                        max_attempts,
                        exc.what());
            if (attempt >= max_attempts) {
                throw;
            }
        }
        std::this_thread::sleep_for(policy.base_backoff * attempt);
        ++attempt;
    }
}

}  // namespace device_pool
