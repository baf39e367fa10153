/**
 * @file part_scheduler.cpp
 * @brief Part worker loop
 */

#include "kcenon/resilient_transfer/transfer/part_scheduler.h"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace kcenon::resilient_transfer {

namespace {

constexpr std::chrono::milliseconds idle_poll_interval{20};

}  // namespace

part_scheduler::part_scheduler(worker_pool& workers,
                               slot_pool& slots,
                               uint32_t max_workers,
                               const cancellation_token* token)
    : workers_(workers),
      slots_(slots),
      max_workers_(std::max(1U, max_workers)),
      token_(token),
      parallelism_(std::max(1U, max_workers)) {}

auto part_scheduler::set_parallelism(uint32_t workers) -> void {
    parallelism_.store(std::clamp(workers, 1U, max_workers_));
}

auto part_scheduler::run(const std::vector<uint32_t>& pending,
                         const part_fn& fn,
                         const gate_fn& gate) -> result<void> {
    if (pending.empty()) {
        return {};
    }

    std::mutex mutex;
    std::size_t next = 0;
    std::size_t finished = 0;
    std::optional<error> failure;
    std::atomic<bool> stop{false};

    auto record = [&](const error& err) {
        std::lock_guard lock(mutex);
        if (!failure) {
            failure = err;
        }
        stop.store(true);
    };

    auto worker = [&](uint32_t worker_index) {
        while (!stop.load()) {
            if (token_ != nullptr && token_->is_cancelled()) {
                record(error(error_code::cancelled, "transfer cancelled"));
                return;
            }
            if (worker_index >= parallelism_.load()) {
                {
                    std::lock_guard lock(mutex);
                    if (next >= pending.size()) {
                        return;
                    }
                }
                std::this_thread::sleep_for(idle_poll_interval);
                continue;
            }

            uint32_t index = 0;
            {
                std::lock_guard lock(mutex);
                if (next >= pending.size()) {
                    return;
                }
                index = pending[next++];
            }

            if (gate) {
                auto open = gate();
                if (!open) {
                    record(open.error());
                    return;
                }
            }

            auto slot = slots_.acquire(token_);
            if (!slot) {
                record(slot.error());
                return;
            }
            slot_guard guard(slots_);

            const auto now_running = running_.fetch_add(1) + 1;
            auto peak = peak_.load();
            while (now_running > peak && !peak_.compare_exchange_weak(peak, now_running)) {
            }

            result<void> outcome;
            try {
                outcome = fn(index);
            } catch (const std::exception& e) {
                outcome = unexpected(error(error_code::internal_error,
                                           std::string("part worker failed: ") + e.what()));
            }
            running_.fetch_sub(1);

            if (!outcome) {
                record(outcome.error());
                return;
            }
            std::lock_guard lock(mutex);
            ++finished;
        }
    };

    const auto workers =
        static_cast<uint32_t>(std::min<std::size_t>(max_workers_, pending.size()));
    if (workers == 1) {
        worker(0);
    } else {
        std::vector<std::future<void>> loops;
        loops.reserve(workers);
        for (uint32_t i = 0; i < workers; ++i) {
            auto submitted = workers_.submit([&worker, i] { worker(i); }, "part_worker");
            if (!submitted) {
                record(submitted.error());
                break;
            }
            loops.push_back(std::move(submitted.value()));
        }
        // A loop dropped by a stopping pool leaves a broken promise; wait() still returns.
        for (auto& loop : loops) {
            loop.wait();
        }
    }

    if (token_ != nullptr && token_->is_cancelled()) {
        return unexpected(error(error_code::cancelled, "transfer cancelled"));
    }
    if (failure) {
        return unexpected(*failure);
    }
    if (finished < pending.size()) {
        return unexpected(error(error_code::shut_down,
                                "part workers stopped before every part ran"));
    }
    return {};
}

}  // namespace kcenon::resilient_transfer
