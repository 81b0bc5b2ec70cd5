// === Event Sink ==============================================================
//
// Outbound channel for lifecycle and audit events. The pool publishes
// fire-and-forget: a sink that throws or drops events never changes the
// outcome of the operation that produced them.

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "device_pool/types.hpp"

namespace device_pool {

/** @brief Event names published by the registries and the reservation engine. */
namespace event_type {
inline constexpr char k_device_registered[] = "target_registered";
inline constexpr char k_device_status_changed[] = "target_status_changed";
inline constexpr char k_device_deactivated[] = "target_deactivated";
inline constexpr char k_device_health_changed[] = "target_health_changed";
inline constexpr char k_gateway_created[] = "gateway_created";
inline constexpr char k_gateway_updated[] = "gateway_updated";
inline constexpr char k_gateway_deactivated[] = "gateway_deactivated";
inline constexpr char k_gateway_deleted[] = "gateway_deleted";
inline constexpr char k_gateway_status_changed[] = "gateway_status_changed";
inline constexpr char k_gateway_imported[] = "gateway_imported";
inline constexpr char k_target_associated[] = "target_associated";
inline constexpr char k_target_disassociated[] = "target_disassociated";
inline constexpr char k_association_status_changed[] = "association_status_changed";
inline constexpr char k_association_removed[] = "association_removed";
inline constexpr char k_reservation_created[] = "reservation_created";
inline constexpr char k_reservation_status_changed[] = "reservation_status_changed";
inline constexpr char k_reservation_updated[] = "reservation_updated";
inline constexpr char k_reservation_deleted[] = "reservation_deleted";
inline constexpr char k_reservation_starting_soon[] = "reservation_starting_soon";
inline constexpr char k_reservation_ending_soon[] = "reservation_ending_soon";
inline constexpr char k_policy_changed[] = "policy_changed";
}  // namespace event_type

/**
 * @brief Structured lifecycle event.
 *
 * `subjects` names the entities involved (`device`, `gateway`, `reservation`,
 * `user`, ...); `details` carries free-form attributes such as
 * `old_status`/`new_status`.
 */
struct LifecycleEvent final {
    std::string type{};
    std::map<std::string, std::string> subjects{};
    std::map<std::string, std::string> details{};
    TimePoint occurred_at{SystemClock::now()};
};

/** @brief Consumer of lifecycle events (notifications, audit trail, ...). */
class EventSink {
  public:
    virtual ~EventSink() = default;

    /** @brief Deliver @p event; implementations may drop it or throw. */
    virtual void publish(const LifecycleEvent& event) = 0;
};

/**
 * @brief Publish @p event and swallow delivery failures after logging them.
 *
 * Every component routes its events through this helper so no business
 * invariant depends on delivery.
 */
void publish_event(EventSink& sink, const LifecycleEvent& event, spdlog::logger& logger);

/** @brief Sink that writes each event to the shared structured log. */
class LoggingEventSink final : public EventSink {
  public:
    LoggingEventSink();

    void publish(const LifecycleEvent& event) override;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Thread-safe FIFO sink drained by downstream notification workers. */
class QueuedEventSink final : public EventSink {
  public:
    explicit QueuedEventSink(std::size_t capacity = 10'000);

    /** @brief Enqueue @p event; the oldest event is dropped when full. */
    void publish(const LifecycleEvent& event) override;
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<LifecycleEvent> try_consume();
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t dropped() const;

  private:
    mutable std::mutex mutex_;
    std::queue<LifecycleEvent> queue_events_;
    std::size_t capacity_;
    std::size_t dropped_count_{};
};

/** @brief Forwards every event to each attached sink in order. */
class FanoutEventSink final : public EventSink {
  public:
    FanoutEventSink();

    void attach(std::shared_ptr<EventSink> sink);
    void publish(const LifecycleEvent& event) override;

  private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<EventSink>> list_sinks_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Render @p event as a single-line JSON object. */
[[nodiscard]] std::string to_json_line(const LifecycleEvent& event);

}  // namespace device_pool
