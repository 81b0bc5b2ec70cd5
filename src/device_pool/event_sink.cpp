#include "device_pool/event_sink.hpp"

#include <exception>
#include <utility>

#include <json/json.h>

#include "device_pool/logging.hpp"

namespace device_pool {

void publish_event(EventSink& sink, const LifecycleEvent& event, spdlog::logger& logger) {
    try {
        sink.publish(event);
    } catch (const std::exception& exc) {
        logger.warn(R"({{"component":"event_sink","event":"{}","error":{}}})", event.type, json_quote(exc.what()));
    }
}

std::string to_json_line(const LifecycleEvent& event) {
    Json::Value root;
    root["type"] = event.type;
    root["occurred_at"] = format_timestamp(event.occurred_at);
    Json::Value subjects(Json::objectValue);
    for (const auto& [key, value] : event.subjects) {
        subjects[key] = value;
    }
    root["subjects"] = subjects;
    Json::Value details(Json::objectValue);
    for (const auto& [key, value] : event.details) {
        details[key] = value;
    }
    root["details"] = details;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

LoggingEventSink::LoggingEventSink()
    : logger_(get_logger()) {}

void LoggingEventSink::publish(const LifecycleEvent& event) {
    logger_->info("{}", to_json_line(event));
}

QueuedEventSink::QueuedEventSink(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void QueuedEventSink::publish(const LifecycleEvent& event) {
    std::scoped_lock lock(mutex_);
    if (queue_events_.size() >= capacity_) {
        queue_events_.pop();
        ++dropped_count_;
    }
    queue_events_.push(event);
}

std::optional<LifecycleEvent> QueuedEventSink::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    LifecycleEvent event = std::move(queue_events_.front());
    queue_events_.pop();
    return event;
}

std::size_t QueuedEventSink::size() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

std::size_t QueuedEventSink::dropped() const {
    std::scoped_lock lock(mutex_);
    return dropped_count_;
}

FanoutEventSink::FanoutEventSink()
    : logger_(get_logger()) {}

void FanoutEventSink::attach(std::shared_ptr<EventSink> sink) {
    if (sink == nullptr) {
        return;
    }
    std::scoped_lock lock(mutex_);
    list_sinks_.push_back(std::move(sink));
}

void FanoutEventSink::publish(const LifecycleEvent& event) {
    std::vector<std::shared_ptr<EventSink>> sinks;
    {
        std::scoped_lock lock(mutex_);
        sinks = list_sinks_;
    }
    for (const auto& sink : sinks) {
        publish_event(*sink, event, *logger_);
    }
}

}  // namespace device_pool
