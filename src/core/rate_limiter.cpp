/**
 * @file rate_limiter.cpp
 * @brief Token bucket request limiter
 */

#include "kcenon/resilient_transfer/core/rate_limiter.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <algorithm>
#include <cmath>

namespace kcenon::resilient_transfer {

namespace {

constexpr auto wait_slice = std::chrono::milliseconds(50);
constexpr auto long_wait_threshold = std::chrono::seconds(2);
constexpr auto long_wait_report_interval = std::chrono::seconds(10);

}  // namespace

rate_limiter::rate_limiter(rate_limit_profile profile, std::string name)
    : name_(std::move(name))
    , rate_(profile.requests_per_second > 0.0 ? profile.requests_per_second : 1.0)
    , capacity_(static_cast<double>(std::max<std::size_t>(profile.burst, 1)))
    , tokens_(capacity_)
    , last_refill_(std::chrono::steady_clock::now())
    , cooldown_until_(last_refill_)
    , last_warning_(last_refill_ - long_wait_report_interval) {}

rate_limiter::~rate_limiter() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto rate_limiter::acquire(const cancellation_token* token) -> result<void> {
    const auto started = std::chrono::steady_clock::now();

    std::unique_lock lock(mutex_);
    while (true) {
        if (closed_.load(std::memory_order_relaxed)) {
            return unexpected(error(error_code::shut_down, name_ + " limiter closed"));
        }
        if (token != nullptr && token->is_cancelled()) {
            return unexpected(error(error_code::cancelled, "cancelled while waiting for " + name_));
        }

        const auto now = std::chrono::steady_clock::now();
        refill_tokens(now);

        auto wait = calculate_wait_time(now);
        if (wait <= std::chrono::microseconds::zero()) {
            tokens_ -= 1.0;
            acquired_.fetch_add(1, std::memory_order_relaxed);
            break;
        }

        cv_.wait_for(lock, std::min<std::chrono::microseconds>(wait, wait_slice));
    }
    lock.unlock();

    const auto waited = std::chrono::steady_clock::now() - started;
    if (waited >= long_wait_threshold) {
        report_long_wait(waited);
    }
    return {};
}

auto rate_limiter::try_acquire() -> bool {
    std::lock_guard lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    refill_tokens(now);

    if (now < cooldown_until_ || tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    acquired_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

auto rate_limiter::drain() -> void {
    std::lock_guard lock(mutex_);
    refill_tokens(std::chrono::steady_clock::now());
    tokens_ = 0.0;
    RT_LOG_DEBUG(log_category::rate_limit, name_ + " bucket drained");
}

auto rate_limiter::set_cooldown(std::chrono::milliseconds duration) -> void {
    if (duration <= std::chrono::milliseconds::zero()) {
        return;
    }
    std::lock_guard lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + duration;
    if (deadline > cooldown_until_) {
        cooldown_until_ = deadline;
    }
}

auto rate_limiter::cooldown_remaining() const -> std::chrono::milliseconds {
    std::lock_guard lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (now >= cooldown_until_) {
        return std::chrono::milliseconds::zero();
    }
    return std::chrono::ceil<std::chrono::milliseconds>(cooldown_until_ - now);
}

auto rate_limiter::reconfigure(rate_limit_profile profile) -> result<void> {
    if (auto valid = profile.validate(); !valid) {
        return valid;
    }

    {
        std::lock_guard lock(mutex_);
        refill_tokens(std::chrono::steady_clock::now());
        rate_ = profile.requests_per_second;
        capacity_ = static_cast<double>(profile.burst);
        tokens_ = std::min(tokens_, capacity_);
    }
    cv_.notify_all();

    RT_LOG_INFO(log_category::rate_limit,
                name_ + " reconfigured to " + std::to_string(profile.requests_per_second) +
                    " req/s, burst " + std::to_string(profile.burst));
    return {};
}

auto rate_limiter::reset() -> void {
    {
        std::lock_guard lock(mutex_);
        tokens_ = capacity_;
        last_refill_ = std::chrono::steady_clock::now();
        cooldown_until_ = last_refill_;
    }
    cv_.notify_all();
}

auto rate_limiter::available_tokens() const -> double {
    std::lock_guard lock(mutex_);
    const auto elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - last_refill_);
    return std::min(tokens_ + std::max(0.0, elapsed.count()) * rate_, capacity_);
}

auto rate_limiter::profile() const -> rate_limit_profile {
    std::lock_guard lock(mutex_);
    return {rate_, static_cast<std::size_t>(capacity_)};
}

auto rate_limiter::total_acquired() const noexcept -> uint64_t {
    return acquired_.load(std::memory_order_relaxed);
}

auto rate_limiter::refill_tokens(std::chrono::steady_clock::time_point now) -> void {
    auto elapsed = std::chrono::duration<double>(now - last_refill_);
    if (elapsed.count() > 0.0) {
        tokens_ = std::min(tokens_ + elapsed.count() * rate_, capacity_);
        last_refill_ = now;
    }
}

auto rate_limiter::calculate_wait_time(std::chrono::steady_clock::time_point now) const
    -> std::chrono::microseconds {
    std::chrono::microseconds wait{0};
    if (now < cooldown_until_) {
        wait = std::chrono::ceil<std::chrono::microseconds>(cooldown_until_ - now);
    }

    const double needed = 1.0 - tokens_;
    if (needed > 0.0) {
        const auto refill = std::chrono::microseconds(
            static_cast<int64_t>(std::ceil(needed / rate_ * 1'000'000.0)));
        wait = std::max(wait, refill);
    }
    return wait;
}

auto rate_limiter::report_long_wait(std::chrono::steady_clock::duration waited) -> void {
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(mutex_);
        if (now - last_warning_ < long_wait_report_interval) {
            return;
        }
        last_warning_ = now;
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(waited).count();
    RT_LOG_WARN(log_category::rate_limit,
                "Request waited " + std::to_string(ms) + " ms for a " + name_ +
                    " token; the platform limit is being approached");
}

rate_limiter_registry::rate_limiter_registry() {
    for (std::size_t i = 0; i < rate_limit_scope_count; ++i) {
        const auto scope = static_cast<rate_limit_scope>(i);
        limiters_[i] = std::make_unique<rate_limiter>(rate_limit_profile::defaults_for(scope),
                                                      std::string(to_string(scope)));
    }
}

auto rate_limiter_registry::get(rate_limit_scope scope) -> rate_limiter& {
    return *limiters_[static_cast<std::size_t>(scope)];
}

auto rate_limiter_registry::configure(rate_limit_scope scope, rate_limit_profile profile)
    -> result<void> {
    return get(scope).reconfigure(profile);
}

}  // namespace kcenon::resilient_transfer
