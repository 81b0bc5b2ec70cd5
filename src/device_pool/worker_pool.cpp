#include "device_pool/worker_pool.hpp"

#include <algorithm>

#include "device_pool/logging.hpp"

namespace device_pool {

WorkerPool::WorkerPool(std::size_t thread_count)
    : logger_(get_logger()) {
    const std::size_t worker_count = std::max<std::size_t>(1U, thread_count);
    list_workers_.reserve(worker_count);
    for (std::size_t index = 0; index < worker_count; ++index) {
        list_workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
    logger_->info(R"({{"component":"worker_pool","action":"started","threads":{}}})", worker_count);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (!flag_running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();
    for (std::thread& worker : list_workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    logger_->info(R"({{"component":"worker_pool","action":"stopped"}})");
}

std::size_t WorkerPool::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_tasks_.size();
}

std::size_t WorkerPool::thread_count() const noexcept {
    return list_workers_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            condition_.wait(lock, [this]() { return !flag_running_.load() || !queue_tasks_.empty(); });
            if (queue_tasks_.empty()) {
                return;
            }
            task = std::move(queue_tasks_.front());
            queue_tasks_.pop();
        }
        // packaged_task stores handler exceptions in the future.
        task();
    }
}

}  // namespace device_pool
