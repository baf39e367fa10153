/**
 * @file resource_allocator.cpp
 * @brief Thread pool sizing, slot pool and throughput monitor
 */

#include "kcenon/resilient_transfer/transfer/resource_allocator.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <thread>

namespace kcenon::resilient_transfer {

namespace {

constexpr std::chrono::milliseconds slot_poll_interval{50};

auto size_tier(uint64_t size) -> uint32_t {
    if (size >= 10 * gibibyte) {
        return 16;
    }
    if (size >= 5 * gibibyte) {
        return 12;
    }
    if (size >= gibibyte) {
        return 8;
    }
    if (size >= 500 * mebibyte) {
        return 4;
    }
    return 1;
}

auto mean(const std::deque<double>& values, std::size_t first, std::size_t count) -> double {
    double sum = 0.0;
    for (std::size_t i = first; i < first + count; ++i) {
        sum += values[i];
    }
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

}  // namespace

auto resource_config::effective_cpu_cores() const -> uint32_t {
    if (cpu_cores > 0) {
        return cpu_cores;
    }
    return std::max(1U, std::thread::hardware_concurrency());
}

auto compute_total_threads(const resource_config& config) -> uint32_t {
    if (config.max_threads > 0) {
        return std::clamp<uint32_t>(config.max_threads, 1, resource_config::absolute_max_threads);
    }
    const uint32_t baseline =
        std::min(config.effective_cpu_cores() * 2, resource_config::max_baseline_threads);
    const uint64_t memory = config.memory_mb > 0 ? config.memory_mb : resource_config::assumed_memory_mb;
    const auto memory_threads = static_cast<uint32_t>(
        std::min<uint64_t>(memory / resource_config::memory_per_thread_mb,
                           resource_config::absolute_max_threads));
    return std::clamp<uint32_t>(std::min(baseline, memory_threads), 1,
                                resource_config::absolute_max_threads);
}

auto desired_threads(uint64_t size,
                     transfer_priority priority,
                     uint32_t pool_share,
                     uint32_t cpu_cores) -> uint32_t {
    if (size < 100 * mebibyte) {
        return 1;
    }

    uint32_t desired = size_tier(size);
    if (priority == transfer_priority::high) {
        if (size >= 10 * gibibyte) {
            desired = desired * 2;
        } else if (size >= 5 * gibibyte) {
            desired = desired * 7 / 4;
        } else if (size >= gibibyte) {
            desired = desired * 3 / 2;
        }
    } else if (priority == transfer_priority::low) {
        desired = desired / 2;
    }

    desired = std::min(desired, std::max(1U, pool_share));
    desired = std::min(desired, resource_config::max_threads_per_file);
    desired = std::min(desired, std::max(1U, cpu_cores));
    return std::max(1U, desired);
}

// ---------------------------------------------------------------------------
// transfer_allocation
// ---------------------------------------------------------------------------

struct transfer_allocation::pool_state {
    explicit pool_state(uint32_t total) : total_threads(total) {}

    const uint32_t total_threads;
    std::mutex mutex;
    uint32_t allocated_threads = 0;
    uint32_t active_transfers = 0;
    bool shut_down = false;
};

transfer_allocation::transfer_allocation(std::shared_ptr<pool_state> pool,
                                         uint32_t threads,
                                         uint64_t size,
                                         transfer_priority priority)
    : pool_(std::move(pool)), threads_(threads), size_(size), priority_(priority) {}

transfer_allocation::~transfer_allocation() {
    complete();
}

auto transfer_allocation::complete() -> void {
    {
        std::lock_guard lock(mutex_);
        if (completed_) {
            return;
        }
        completed_ = true;
    }
    std::lock_guard pool_lock(pool_->mutex);
    pool_->allocated_threads -= std::min(pool_->allocated_threads, threads_);
    if (pool_->active_transfers > 0) {
        --pool_->active_transfers;
    }
}

auto transfer_allocation::is_complete() const -> bool {
    std::lock_guard lock(mutex_);
    return completed_;
}

// ---------------------------------------------------------------------------
// slot_pool
// ---------------------------------------------------------------------------

slot_pool::slot_pool(uint32_t capacity) : capacity_(std::max(1U, capacity)) {}

auto slot_pool::acquire(const cancellation_token* token) -> result<void> {
    std::unique_lock lock(mutex_);
    while (true) {
        if (closed_) {
            return unexpected(error(error_code::shut_down, "slot pool closed"));
        }
        if (token != nullptr && token->is_cancelled()) {
            return unexpected(error(error_code::cancelled, "cancelled while waiting for a slot"));
        }
        if (in_use_ < capacity_) {
            ++in_use_;
            peak_ = std::max(peak_, in_use_);
            return {};
        }
        cv_.wait_for(lock, slot_poll_interval);
    }
}

auto slot_pool::release() -> void {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

auto slot_pool::close() -> void {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto slot_pool::in_use() const -> uint32_t {
    std::lock_guard lock(mutex_);
    return in_use_;
}

auto slot_pool::peak_in_use() const -> uint32_t {
    std::lock_guard lock(mutex_);
    return peak_;
}

// ---------------------------------------------------------------------------
// throughput_monitor
// ---------------------------------------------------------------------------

auto throughput_monitor::record(const std::string& key, double bytes_per_second) -> void {
    std::lock_guard lock(mutex_);
    auto& samples = samples_[key];
    samples.push_back(bytes_per_second);
    while (samples.size() > max_samples) {
        samples.pop_front();
    }
}

auto throughput_monitor::should_scale_up(const std::string& key) const -> bool {
    std::lock_guard lock(mutex_);
    auto it = samples_.find(key);
    if (it == samples_.end() || it->second.size() < 3) {
        return false;
    }
    const auto& samples = it->second;
    const double avg = mean(samples, 0, samples.size());
    double squares = 0.0;
    for (double s : samples) {
        squares += (s - avg) * (s - avg);
    }
    const double spread = std::sqrt(squares / static_cast<double>(samples.size()));
    const double mb = static_cast<double>(mebibyte);
    return avg / mb > scale_up_min_mbps && spread / mb < scale_up_max_spread_mbps;
}

auto throughput_monitor::should_scale_down(const std::string& key) const -> bool {
    std::lock_guard lock(mutex_);
    auto it = samples_.find(key);
    if (it == samples_.end() || it->second.size() < 6) {
        return false;
    }
    const auto& samples = it->second;
    const auto n = samples.size();
    const double recent = mean(samples, n - 3, 3);
    const double older = mean(samples, n - 6, 3);
    return recent < older * scale_down_ratio;
}

auto throughput_monitor::sample_count(const std::string& key) const -> std::size_t {
    std::lock_guard lock(mutex_);
    auto it = samples_.find(key);
    return it == samples_.end() ? 0 : it->second.size();
}

auto throughput_monitor::forget(const std::string& key) -> void {
    std::lock_guard lock(mutex_);
    samples_.erase(key);
}

// ---------------------------------------------------------------------------
// resource_allocator
// ---------------------------------------------------------------------------

resource_allocator::resource_allocator(resource_config config)
    : config_(config),
      total_threads_(compute_total_threads(config_)),
      pool_(std::make_shared<transfer_allocation::pool_state>(total_threads_)),
      slots_(total_threads_),
      workers_("part_workers", total_threads_) {
    if (auto started = workers_.start(); !started) {
        RT_LOG_ERROR(log_category::manager,
                     "Part worker pool did not start: " + started.error().message);
    }
    RT_LOG_DEBUG(log_category::manager,
                 "Resource pool sized to " + std::to_string(total_threads_) + " threads (" +
                     std::to_string(config_.effective_cpu_cores()) + " cores)");
}

resource_allocator::~resource_allocator() {
    shutdown();
}

auto resource_allocator::allocate(uint64_t size,
                                  transfer_priority priority,
                                  uint32_t concurrent_files)
    -> result<std::shared_ptr<transfer_allocation>> {
    std::lock_guard lock(pool_->mutex);
    if (pool_->shut_down) {
        return unexpected(error(error_code::shut_down, "resource allocator is shut down"));
    }

    const uint32_t share = total_threads_ / std::max(1U, concurrent_files);
    const uint32_t desired =
        desired_threads(size, priority, share, config_.effective_cpu_cores());
    const uint32_t available = total_threads_ - std::min(total_threads_, pool_->allocated_threads);
    const uint32_t granted = std::max(1U, std::min(desired, available));

    pool_->allocated_threads += granted;
    ++pool_->active_transfers;
    return std::make_shared<transfer_allocation>(pool_, granted, size, priority);
}

auto resource_allocator::stats() const -> resource_stats {
    resource_stats stats;
    stats.total_threads = total_threads_;
    {
        std::lock_guard lock(pool_->mutex);
        const uint32_t active = std::min(total_threads_, pool_->allocated_threads);
        stats.active_threads = active;
        stats.available_threads = total_threads_ - active;
        stats.active_transfers = pool_->active_transfers;
    }
    stats.slots_in_use = slots_.in_use();
    stats.peak_slots_in_use = slots_.peak_in_use();
    return stats;
}

auto resource_allocator::shutdown() -> void {
    {
        std::lock_guard lock(pool_->mutex);
        pool_->shut_down = true;
    }
    slots_.close();
    workers_.stop();
}

}  // namespace kcenon::resilient_transfer
