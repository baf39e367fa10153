/**
 * @file event_bus.h
 * @brief Typed transfer events with bounded per-subscriber queues
 *
 * Publishers never block: each subscription owns a bounded queue and, when
 * it is full, the oldest queued event is discarded to make room. Consumers
 * see how many events they lost through dropped_count().
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_EVENT_BUS_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_EVENT_BUS_H

#include "kcenon/resilient_transfer/core/transfer_id.h"
#include "transfer_task.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::resilient_transfer {

enum class event_type {
    queued,
    started,
    progress,
    completed,
    failed,
    cancelled,
    queue_stats_updated,
};

[[nodiscard]] constexpr auto to_string(event_type type) noexcept -> std::string_view {
    switch (type) {
        case event_type::queued:
            return "queued";
        case event_type::started:
            return "started";
        case event_type::progress:
            return "progress";
        case event_type::completed:
            return "completed";
        case event_type::failed:
            return "failed";
        case event_type::cancelled:
            return "cancelled";
        case event_type::queue_stats_updated:
            return "queue_stats_updated";
        default:
            return "unknown";
    }
}

/**
 * @brief Manager-wide counters
 */
struct manager_stats {
    uint32_t total_slots = 0;
    uint32_t active_slots = 0;
    uint32_t active_transfers = 0;
    uint32_t queued_transfers = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t cancelled = 0;
    uint64_t dropped_events = 0;
};

struct transfer_event {
    event_type type = event_type::progress;
    transfer_id id;
    task_state state = task_state::queued;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    double fraction = 0.0;
    double bytes_per_second = 0.0;
    std::string error;                   // failed events only
    std::optional<manager_stats> stats;  // queue_stats_updated events only
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Receiving end of a subscription
 */
class event_subscription {
public:
    event_subscription(std::optional<event_type> filter, std::size_t capacity);

    event_subscription(const event_subscription&) = delete;
    auto operator=(const event_subscription&) -> event_subscription& = delete;

    [[nodiscard]] auto accepts(event_type type) const noexcept -> bool {
        return !filter_ || *filter_ == type;
    }

    /**
     * @brief Enqueue without blocking, discarding the oldest event when full
     * @return true when an event was discarded
     */
    auto push(transfer_event event) -> bool;

    [[nodiscard]] auto try_pop() -> std::optional<transfer_event>;

    /**
     * @brief Wait up to @p timeout for an event; empty when closed or timed out
     */
    [[nodiscard]] auto wait_pop(std::chrono::milliseconds timeout) -> std::optional<transfer_event>;

    /**
     * @brief Remove and return every queued event
     */
    [[nodiscard]] auto drain() -> std::vector<transfer_event>;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    [[nodiscard]] auto dropped_count() const noexcept -> uint64_t { return dropped_.load(); }

    /**
     * @brief Stop receiving; wakes blocked consumers
     */
    auto close() -> void;

    [[nodiscard]] auto is_closed() const -> bool;

private:
    const std::optional<event_type> filter_;
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<transfer_event> queue_;
    std::atomic<uint64_t> dropped_{0};
    bool closed_ = false;
};

class event_bus {
public:
    static constexpr std::size_t default_capacity = 1000;
    static constexpr std::size_t max_capacity = 5000;

    explicit event_bus(std::size_t capacity = default_capacity);
    ~event_bus();

    event_bus(const event_bus&) = delete;
    auto operator=(const event_bus&) -> event_bus& = delete;

    [[nodiscard]] auto subscribe(event_type type) -> std::shared_ptr<event_subscription>;

    [[nodiscard]] auto subscribe_all() -> std::shared_ptr<event_subscription>;

    /**
     * @brief Deliver to every matching subscription; never blocks
     */
    auto publish(const transfer_event& event) -> void;

    [[nodiscard]] auto subscriber_count() const -> std::size_t;

    [[nodiscard]] auto total_dropped() const noexcept -> uint64_t { return dropped_.load(); }

    /**
     * @brief Close every subscription
     */
    auto close() -> void;

private:
    auto add(std::optional<event_type> filter) -> std::shared_ptr<event_subscription>;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<event_subscription>> subscriptions_;
    std::atomic<uint64_t> dropped_{0};
    bool closed_ = false;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_EVENT_BUS_H
