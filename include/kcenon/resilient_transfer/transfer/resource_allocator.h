/**
 * @file resource_allocator.h
 * @brief Thread budget shared by concurrent transfers and their parts
 *
 * The allocator sizes a global pool from CPU cores and memory, hands each
 * transfer a share depending on its size and priority, and owns the slot
 * pool every part operation must hold while it runs.
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_RESOURCE_ALLOCATOR_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_RESOURCE_ALLOCATOR_H

#include "kcenon/resilient_transfer/core/cancellation.h"
#include "kcenon/resilient_transfer/core/types.h"
#include "kcenon/resilient_transfer/core/worker_pool.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kcenon::resilient_transfer {

inline constexpr uint64_t mebibyte = 1024ULL * 1024ULL;
inline constexpr uint64_t gibibyte = 1024ULL * mebibyte;

/**
 * @brief Scheduling priority of a transfer
 */
enum class transfer_priority {
    low,     // Half of the size tier
    normal,  // Size tier
    high,    // Size tier with the large-file multiplier
};

[[nodiscard]] constexpr auto to_string(transfer_priority priority) noexcept -> std::string_view {
    switch (priority) {
        case transfer_priority::low:
            return "low";
        case transfer_priority::normal:
            return "normal";
        case transfer_priority::high:
            return "high";
        default:
            return "unknown";
    }
}

/**
 * @brief Pool sizing inputs
 */
struct resource_config {
    static constexpr uint32_t max_baseline_threads = 16;
    static constexpr uint32_t absolute_max_threads = 32;
    static constexpr uint32_t max_threads_per_file = 16;
    static constexpr uint64_t memory_per_thread_mb = 128;
    static constexpr uint64_t assumed_memory_mb = 3072;

    uint32_t cpu_cores = 0;    // 0 = std::thread::hardware_concurrency()
    uint64_t memory_mb = 0;    // 0 = assumed_memory_mb
    uint32_t max_threads = 0;  // 0 = derived from cores and memory

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_threads > absolute_max_threads) {
            return unexpected(error(error_code::invalid_configuration,
                                    "max_threads must not exceed " +
                                        std::to_string(absolute_max_threads)));
        }
        return {};
    }

    [[nodiscard]] auto effective_cpu_cores() const -> uint32_t;
};

/**
 * @brief Total pool size: min(2 x cores capped at 16, memory / 128 MB), in [1, 32]
 */
[[nodiscard]] auto compute_total_threads(const resource_config& config) -> uint32_t;

/**
 * @brief Threads a transfer of @p size bytes would like
 *
 * Size tiers: below 500 MB 1, 500 MB-1 GB 4, 1-5 GB 8, 5-10 GB 12,
 * 10 GB and more 16. Capped by @p pool_share, 16 per file and
 * @p cpu_cores; never below 1.
 */
[[nodiscard]] auto desired_threads(uint64_t size,
                                   transfer_priority priority,
                                   uint32_t pool_share,
                                   uint32_t cpu_cores) -> uint32_t;

class resource_allocator;

/**
 * @brief Threads granted to one transfer
 *
 * complete() returns the threads to the pool; it is idempotent and also
 * runs on destruction.
 */
class transfer_allocation {
public:
    struct pool_state;

    transfer_allocation(std::shared_ptr<pool_state> pool,
                        uint32_t threads,
                        uint64_t size,
                        transfer_priority priority);
    ~transfer_allocation();

    transfer_allocation(const transfer_allocation&) = delete;
    auto operator=(const transfer_allocation&) -> transfer_allocation& = delete;

    [[nodiscard]] auto threads() const noexcept -> uint32_t { return threads_; }

    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }

    [[nodiscard]] auto priority() const noexcept -> transfer_priority { return priority_; }

    auto complete() -> void;

    [[nodiscard]] auto is_complete() const -> bool;

private:
    std::shared_ptr<pool_state> pool_;
    const uint32_t threads_;
    const uint64_t size_;
    const transfer_priority priority_;
    mutable std::mutex mutex_;
    bool completed_ = false;
};

/**
 * @brief Counting pool bounding simultaneous part operations
 */
class slot_pool {
public:
    explicit slot_pool(uint32_t capacity);

    slot_pool(const slot_pool&) = delete;
    auto operator=(const slot_pool&) -> slot_pool& = delete;

    /**
     * @brief Block until a slot is free
     * @return cancelled when @p token fires, shut_down after close()
     */
    [[nodiscard]] auto acquire(const cancellation_token* token = nullptr) -> result<void>;

    auto release() -> void;

    /**
     * @brief Wake all waiters; later acquires fail with shut_down
     */
    auto close() -> void;

    [[nodiscard]] auto capacity() const noexcept -> uint32_t { return capacity_; }

    [[nodiscard]] auto in_use() const -> uint32_t;

    /**
     * @brief Highest number of slots held at the same time
     */
    [[nodiscard]] auto peak_in_use() const -> uint32_t;

private:
    const uint32_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint32_t in_use_ = 0;
    uint32_t peak_ = 0;
    bool closed_ = false;
};

/**
 * @brief Releases a held slot on scope exit
 */
class slot_guard {
public:
    explicit slot_guard(slot_pool& pool) noexcept : pool_(&pool) {}
    ~slot_guard() {
        if (pool_ != nullptr) {
            pool_->release();
        }
    }

    slot_guard(const slot_guard&) = delete;
    auto operator=(const slot_guard&) -> slot_guard& = delete;

private:
    slot_pool* pool_;
};

/**
 * @brief Per-transfer throughput samples used to decide scaling
 */
class throughput_monitor {
public:
    static constexpr std::size_t max_samples = 10;
    static constexpr double scale_up_min_mbps = 10.0;
    static constexpr double scale_up_max_spread_mbps = 2.0;
    static constexpr double scale_down_ratio = 0.8;

    auto record(const std::string& key, double bytes_per_second) -> void;

    /**
     * @brief Mean above 10 MB/s and spread below 2 MB/s over at least 3 samples
     */
    [[nodiscard]] auto should_scale_up(const std::string& key) const -> bool;

    /**
     * @brief Last 3 samples average below 80% of the 3 before them
     */
    [[nodiscard]] auto should_scale_down(const std::string& key) const -> bool;

    [[nodiscard]] auto sample_count(const std::string& key) const -> std::size_t;

    auto forget(const std::string& key) -> void;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<double>> samples_;
};

/**
 * @brief Snapshot of pool usage
 */
struct resource_stats {
    uint32_t total_threads = 0;
    uint32_t available_threads = 0;
    uint32_t active_threads = 0;
    uint32_t active_transfers = 0;
    uint32_t slots_in_use = 0;
    uint32_t peak_slots_in_use = 0;
};

class resource_allocator {
public:
    explicit resource_allocator(resource_config config = {});
    ~resource_allocator();

    resource_allocator(const resource_allocator&) = delete;
    auto operator=(const resource_allocator&) -> resource_allocator& = delete;

    /**
     * @brief Grant threads to a transfer of @p size bytes
     *
     * Takes what is available, at least one thread. Fails only after
     * shutdown().
     * @param concurrent_files transfers expected to share the pool
     */
    [[nodiscard]] auto allocate(uint64_t size,
                                transfer_priority priority = transfer_priority::normal,
                                uint32_t concurrent_files = 1)
        -> result<std::shared_ptr<transfer_allocation>>;

    [[nodiscard]] auto slots() noexcept -> slot_pool& { return slots_; }

    /**
     * @brief Shared pool running the part workers of every transfer
     */
    [[nodiscard]] auto workers() noexcept -> worker_pool& { return workers_; }

    [[nodiscard]] auto monitor() noexcept -> throughput_monitor& { return monitor_; }

    [[nodiscard]] auto stats() const -> resource_stats;

    [[nodiscard]] auto total_threads() const noexcept -> uint32_t { return total_threads_; }

    [[nodiscard]] auto config() const noexcept -> const resource_config& { return config_; }

    auto shutdown() -> void;

private:
    const resource_config config_;
    const uint32_t total_threads_;
    std::shared_ptr<transfer_allocation::pool_state> pool_;
    slot_pool slots_;
    worker_pool workers_;
    throughput_monitor monitor_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_RESOURCE_ALLOCATOR_H
