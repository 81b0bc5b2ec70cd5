// === Periodic Task ===========================================================
//
// One background thread running a sweep at a fixed cadence. Each task stops
// independently, and `trigger_now` wakes the loop for an immediate pass.

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/logger.h>

#include "device_pool/types.hpp"

namespace device_pool {

class PeriodicTask final {
  public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /** @brief Start the background loop; the first pass runs after one interval. */
    void start();
    /** @brief Wake the loop and wait for it to exit. */
    void stop();
    /** @brief Run a pass as soon as the loop is free instead of waiting for the interval. */
    void trigger_now();

    [[nodiscard]] bool running() const noexcept;
    /** @brief Completed passes, failed ones included. */
    [[nodiscard]] std::size_t pass_count() const noexcept;

  private:
    void loop();
    void run_once();

    std::string str_name_;
    std::chrono::milliseconds interval_;
    std::function<void()> body_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool flag_triggered_{false};
    std::atomic<bool> flag_running_{false};
    std::atomic<std::size_t> pass_count_{0};
    std::thread thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
