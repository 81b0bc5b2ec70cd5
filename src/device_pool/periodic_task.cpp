#include "device_pool/periodic_task.hpp"

#include <stdexcept>
#include <utility>

#include "device_pool/logging.hpp"

namespace device_pool {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body)
    : str_name_(std::move(name)),
      interval_(interval),
      body_(std::move(body)),
      logger_(get_logger()) {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("PeriodicTask interval must be positive");
    }
    if (!body_) {
        throw std::invalid_argument("PeriodicTask requires a body");
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info(R"({{"component":"periodic_task","task":"{}","action":"started","interval_ms":{}}})", str_name_, interval_.count());
    thread_ = std::thread(&PeriodicTask::loop, this);
}

void PeriodicTask::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (!flag_running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    logger_->info(R"({{"component":"periodic_task","task":"{}","action":"stopped","passes":{}}})", str_name_, pass_count_.load());
}

void PeriodicTask::trigger_now() {
    {
        std::scoped_lock lock(mutex_);
        flag_triggered_ = true;
    }
    condition_.notify_all();
}

bool PeriodicTask::running() const noexcept {
    return flag_running_.load();
}

std::size_t PeriodicTask::pass_count() const noexcept {
    return pass_count_.load();
}

void PeriodicTask::loop() {
    while (true) {
        {
            std::unique_lock lock(mutex_);
            condition_.wait_for(lock, interval_, [this]() { return !flag_running_.load() || flag_triggered_; });
            if (!flag_running_.load()) {
                return;
            }
            flag_triggered_ = false;
        }
        run_once();
    }
}

void PeriodicTask::run_once() {
    try {
        body_();
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"periodic_task","task":"{}","error":{}}})", str_name_, json_quote(exc.what()));
    }
    ++pass_count_;
}

}  // namespace device_pool
