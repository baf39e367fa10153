/**
 * @file part_scheduler.h
 * @brief Runs the parts of one transfer on a bounded set of workers
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_PART_SCHEDULER_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_PART_SCHEDULER_H

#include "kcenon/resilient_transfer/core/cancellation.h"
#include "kcenon/resilient_transfer/core/types.h"
#include "kcenon/resilient_transfer/core/worker_pool.h"
#include "resource_allocator.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace kcenon::resilient_transfer {

/**
 * @brief Worker set for the parts of a single file
 *
 * Worker loops run as jobs on the shared part worker_pool; a single-worker
 * run stays on the calling thread. Every part runs while holding one slot of
 * the global slot_pool, so the number of part operations across all
 * transfers never exceeds the pool capacity. Parts complete in any order. The first failure stops the
 * remaining workers at their next part boundary.
 *
 * Parallelism can be lowered or raised while running (between 1 and the
 * worker count); surplus workers idle until they are needed again.
 */
class part_scheduler {
public:
    using part_fn = std::function<result<void>(uint32_t index)>;
    using gate_fn = std::function<result<void>()>;

    part_scheduler(worker_pool& workers,
                   slot_pool& slots,
                   uint32_t max_workers,
                   const cancellation_token* token);

    part_scheduler(const part_scheduler&) = delete;
    auto operator=(const part_scheduler&) -> part_scheduler& = delete;

    /**
     * @brief Run @p fn for every index in @p pending
     * @param gate checked before each part (pause point); its error stops the run
     * @return cancelled when the token fired, otherwise the first part error;
     *         shut_down when the worker pool stopped before every part ran
     */
    [[nodiscard]] auto run(const std::vector<uint32_t>& pending,
                           const part_fn& fn,
                           const gate_fn& gate = {}) -> result<void>;

    auto set_parallelism(uint32_t workers) -> void;

    [[nodiscard]] auto parallelism() const noexcept -> uint32_t { return parallelism_.load(); }

    [[nodiscard]] auto max_workers() const noexcept -> uint32_t { return max_workers_; }

    /**
     * @brief Most parts this scheduler ran at the same time
     */
    [[nodiscard]] auto peak_concurrency() const noexcept -> uint32_t { return peak_.load(); }

private:
    worker_pool& workers_;
    slot_pool& slots_;
    const uint32_t max_workers_;
    const cancellation_token* token_;
    std::atomic<uint32_t> parallelism_;
    std::atomic<uint32_t> running_{0};
    std::atomic<uint32_t> peak_{0};
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_PART_SCHEDULER_H
