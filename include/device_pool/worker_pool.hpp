// === Worker Pool =============================================================
//
// Fixed-size pool executing request handlers in FIFO order. Submitted work
// returns a future carrying either the handler's result or its exception.
// Shutdown stops intake, drains the queue and joins every worker.

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

namespace device_pool {

class WorkerPool final {
  public:
    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue @p task for execution.
     *
     * @throws std::runtime_error once shutdown has begun.
     */
    template <typename Task>
    auto submit(Task&& task) -> std::future<std::invoke_result_t<std::decay_t<Task>>> {
        using Result = std::invoke_result_t<std::decay_t<Task>>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Task>(task));
        std::future<Result> future = packaged->get_future();
        {
            std::scoped_lock lock(mutex_);
            if (!flag_running_.load()) {
                throw std::runtime_error("WorkerPool is shut down");
            }
            queue_tasks_.emplace([packaged]() { (*packaged)(); });
        }
        condition_.notify_one();
        return future;
    }

    /** @brief Stop accepting work, run what is queued and join the workers. */
    void shutdown();

    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t thread_count() const noexcept;

  private:
    void worker_loop();

    std::vector<std::thread> list_workers_;
    std::queue<std::function<void()>> queue_tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> flag_running_{true};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace device_pool
