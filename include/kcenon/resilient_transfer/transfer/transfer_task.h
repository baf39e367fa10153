/**
 * @file transfer_task.h
 * @brief Transfer task identity, state machine and progress tracking
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_TRANSFER_TASK_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_TRANSFER_TASK_H

#include "kcenon/resilient_transfer/core/cancellation.h"
#include "kcenon/resilient_transfer/core/error_codes.h"
#include "kcenon/resilient_transfer/core/transfer_id.h"
#include "kcenon/resilient_transfer/core/types.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::resilient_transfer {

/**
 * @brief Lifecycle state of a transfer task
 */
enum class task_state {
    queued,        // Admitted, waiting for a worker
    initializing,  // Validating inputs and resume state
    active,        // Moving parts
    paused,        // Halted at a part boundary
    completed,
    failed,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(task_state state) noexcept -> std::string_view {
    switch (state) {
        case task_state::queued:
            return "queued";
        case task_state::initializing:
            return "initializing";
        case task_state::active:
            return "active";
        case task_state::paused:
            return "paused";
        case task_state::completed:
            return "completed";
        case task_state::failed:
            return "failed";
        case task_state::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(task_state state) noexcept -> bool {
    return state == task_state::completed || state == task_state::failed ||
           state == task_state::cancelled;
}

/**
 * @brief Legal edges of the task state machine
 *
 * Cancellation is accepted from every non-terminal state. Terminal states
 * have no outgoing edges.
 */
[[nodiscard]] constexpr auto is_valid_transition(task_state from, task_state to) noexcept -> bool {
    if (is_terminal(from)) {
        return false;
    }
    if (to == task_state::cancelled) {
        return true;
    }
    switch (from) {
        case task_state::queued:
            return to == task_state::initializing || to == task_state::failed;
        case task_state::initializing:
            return to == task_state::active || to == task_state::completed ||
                   to == task_state::failed;
        case task_state::active:
            return to == task_state::paused || to == task_state::completed ||
                   to == task_state::failed;
        case task_state::paused:
            // A pause that lands while the final commit is in flight.
            return to == task_state::active || to == task_state::completed ||
                   to == task_state::failed;
        default:
            return false;
    }
}

/**
 * @brief What the caller asked to transfer
 */
struct task_descriptor {
    transfer_direction direction = transfer_direction::upload;
    std::filesystem::path local_path;
    std::string remote_locator;  // upload: destination path base; download: object key
    uint64_t declared_size = 0;
    std::string origin;
    std::optional<std::string> batch_id;
    std::optional<std::string> batch_label;

    /**
     * @brief Logical name shown to users (the file name)
     */
    [[nodiscard]] auto name() const -> std::string { return local_path.filename().string(); }
};

/**
 * @brief Point-in-time progress values
 */
struct progress_snapshot {
    double fraction = 0.0;
    double bytes_per_second = 0.0;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
};

/**
 * @brief Copy of a task's observable state
 */
struct task_snapshot {
    transfer_id id;
    task_descriptor descriptor;
    task_state state = task_state::queued;
    progress_snapshot progress;
    std::optional<transfer_failure> failure;
    std::string object_key;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;

    [[nodiscard]] auto is_terminal() const noexcept -> bool {
        return resilient_transfer::is_terminal(state);
    }
};

/**
 * @brief One queued or running transfer
 *
 * All members are synchronized; engines report progress from worker threads
 * while the manager reads snapshots.
 */
class transfer_task {
public:
    static constexpr double speed_smoothing = 0.25;
    static constexpr std::chrono::milliseconds min_sample_interval{100};

    transfer_task(transfer_id id, task_descriptor descriptor);

    transfer_task(const transfer_task&) = delete;
    auto operator=(const transfer_task&) -> transfer_task& = delete;

    [[nodiscard]] auto id() const noexcept -> const transfer_id& { return id_; }

    [[nodiscard]] auto descriptor() const noexcept -> const task_descriptor& { return descriptor_; }

    [[nodiscard]] auto state() const -> task_state;

    /**
     * @brief Move to @p next
     * @return invalid_state_transition for illegal edges
     */
    [[nodiscard]] auto transition(task_state next) -> result<void>;

    /**
     * @brief Force CANCELLED and fire the cancellation token
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Move to FAILED and record the failure
     */
    [[nodiscard]] auto fail(transfer_failure failure) -> result<void>;

    [[nodiscard]] auto pause() -> result<void>;

    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Block while PAUSED
     * @return cancelled when the task is cancelled while waiting
     */
    [[nodiscard]] auto wait_while_paused() -> result<void>;

    /**
     * @brief Block until the task is terminal or @p timeout elapses
     * @return true when terminal
     */
    [[nodiscard]] auto wait_terminal(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Record the bytes transferred so far
     *
     * Regressions are ignored. Samples closer than min_sample_interval to
     * the previous one update the byte count but not the speed.
     * @return true when the value was accepted
     */
    auto update_progress(uint64_t bytes_transferred) -> bool;

    /**
     * @brief Replace the total when the real payload size becomes known
     */
    auto set_total_bytes(uint64_t total) -> void;

    auto set_object_key(std::string key) -> void;

    [[nodiscard]] auto progress() const -> progress_snapshot;

    [[nodiscard]] auto snapshot() const -> task_snapshot;

    [[nodiscard]] auto token() const noexcept -> const cancellation_token& { return token_; }

private:
    auto transition_locked(task_state next) -> result<void>;
    [[nodiscard]] auto progress_locked() const -> progress_snapshot;

    const transfer_id id_;
    const task_descriptor descriptor_;
    cancellation_token token_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    task_state state_ = task_state::queued;
    uint64_t total_bytes_;
    uint64_t bytes_transferred_ = 0;
    double speed_ = 0.0;
    bool has_speed_ = false;
    uint64_t sample_bytes_ = 0;
    std::chrono::steady_clock::time_point sample_time_;
    std::optional<transfer_failure> failure_;
    std::string object_key_;
    std::chrono::system_clock::time_point created_at_;
    std::optional<std::chrono::system_clock::time_point> started_at_;
    std::optional<std::chrono::system_clock::time_point> completed_at_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_TRANSFER_TASK_H
