/**
 * @file event_bus.cpp
 * @brief Drop-oldest event delivery
 */

#include "kcenon/resilient_transfer/transfer/event_bus.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <algorithm>

namespace kcenon::resilient_transfer {

event_subscription::event_subscription(std::optional<event_type> filter, std::size_t capacity)
    : filter_(filter), capacity_(std::max<std::size_t>(1, capacity)) {}

auto event_subscription::push(transfer_event event) -> bool {
    bool discarded = false;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_.fetch_add(1);
            discarded = true;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return discarded;
}

auto event_subscription::try_pop() -> std::optional<transfer_event> {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto event_subscription::wait_pop(std::chrono::milliseconds timeout)
    -> std::optional<transfer_event> {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto event_subscription::drain() -> std::vector<transfer_event> {
    std::lock_guard lock(mutex_);
    std::vector<transfer_event> events(std::make_move_iterator(queue_.begin()),
                                       std::make_move_iterator(queue_.end()));
    queue_.clear();
    return events;
}

auto event_subscription::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

auto event_subscription::close() -> void {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto event_subscription::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

event_bus::event_bus(std::size_t capacity)
    : capacity_(std::clamp<std::size_t>(capacity, 1, max_capacity)) {}

event_bus::~event_bus() {
    close();
}

auto event_bus::add(std::optional<event_type> filter) -> std::shared_ptr<event_subscription> {
    auto subscription = std::make_shared<event_subscription>(filter, capacity_);
    std::lock_guard lock(mutex_);
    if (closed_) {
        subscription->close();
        return subscription;
    }
    subscriptions_.push_back(subscription);
    return subscription;
}

auto event_bus::subscribe(event_type type) -> std::shared_ptr<event_subscription> {
    return add(type);
}

auto event_bus::subscribe_all() -> std::shared_ptr<event_subscription> {
    return add(std::nullopt);
}

auto event_bus::publish(const transfer_event& event) -> void {
    std::vector<std::shared_ptr<event_subscription>> targets;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        auto it = subscriptions_.begin();
        while (it != subscriptions_.end()) {
            auto sub = it->lock();
            if (!sub || sub->is_closed()) {
                it = subscriptions_.erase(it);
                continue;
            }
            if (sub->accepts(event.type)) {
                targets.push_back(std::move(sub));
            }
            ++it;
        }
    }

    for (auto& sub : targets) {
        if (sub->push(event)) {
            const auto total = dropped_.fetch_add(1) + 1;
            // First drop, then every thousandth.
            if (total % 1000 == 1) {
                RT_LOG_WARN(log_category::events,
                            "Event queue full, dropping oldest events (total dropped " +
                                std::to_string(total) + ")");
            }
        }
    }
}

auto event_bus::subscriber_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        subscriptions_.begin(), subscriptions_.end(), [](const auto& weak) {
            auto sub = weak.lock();
            return sub && !sub->is_closed();
        }));
}

auto event_bus::close() -> void {
    std::vector<std::shared_ptr<event_subscription>> targets;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        for (auto& weak : subscriptions_) {
            if (auto sub = weak.lock()) {
                targets.push_back(std::move(sub));
            }
        }
        subscriptions_.clear();
    }
    for (auto& sub : targets) {
        sub->close();
    }
}

}  // namespace kcenon::resilient_transfer
