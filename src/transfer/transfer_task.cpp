/**
 * @file transfer_task.cpp
 * @brief Transfer task state machine implementation
 */

#include "kcenon/resilient_transfer/transfer/transfer_task.h"

#include <algorithm>

namespace kcenon::resilient_transfer {

transfer_task::transfer_task(transfer_id id, task_descriptor descriptor)
    : id_(id),
      descriptor_(std::move(descriptor)),
      total_bytes_(descriptor_.declared_size),
      sample_time_(std::chrono::steady_clock::now()),
      created_at_(std::chrono::system_clock::now()) {}

auto transfer_task::state() const -> task_state {
    std::lock_guard lock(mutex_);
    return state_;
}

auto transfer_task::transition_locked(task_state next) -> result<void> {
    if (!is_valid_transition(state_, next)) {
        return unexpected(error(error_code::invalid_state_transition,
                                std::string("cannot move from ") + std::string(to_string(state_)) +
                                    " to " + std::string(to_string(next))));
    }
    state_ = next;
    const auto now = std::chrono::system_clock::now();
    if (next == task_state::active && !started_at_) {
        started_at_ = now;
        sample_time_ = std::chrono::steady_clock::now();
        sample_bytes_ = bytes_transferred_;
    }
    if (is_terminal(next) && !completed_at_) {
        completed_at_ = now;
        if (next == task_state::completed) {
            bytes_transferred_ = std::max(bytes_transferred_, total_bytes_);
        }
    }
    state_cv_.notify_all();
    return {};
}

auto transfer_task::transition(task_state next) -> result<void> {
    std::lock_guard lock(mutex_);
    return transition_locked(next);
}

auto transfer_task::cancel() -> result<void> {
    {
        std::lock_guard lock(mutex_);
        auto moved = transition_locked(task_state::cancelled);
        if (!moved) {
            return moved;
        }
    }
    token_.cancel();
    return {};
}

auto transfer_task::fail(transfer_failure failure) -> result<void> {
    std::lock_guard lock(mutex_);
    auto moved = transition_locked(task_state::failed);
    if (!moved) {
        return moved;
    }
    failure_ = std::move(failure);
    return {};
}

auto transfer_task::pause() -> result<void> {
    std::lock_guard lock(mutex_);
    if (state_ != task_state::active) {
        return unexpected(error(error_code::invalid_state_transition,
                                "only an active transfer can be paused (state is " +
                                    std::string(to_string(state_)) + ")"));
    }
    return transition_locked(task_state::paused);
}

auto transfer_task::resume() -> result<void> {
    std::lock_guard lock(mutex_);
    if (state_ != task_state::paused) {
        return unexpected(error(error_code::invalid_state_transition,
                                "only a paused transfer can be resumed (state is " +
                                    std::string(to_string(state_)) + ")"));
    }
    // The speed window restarts so the pause does not drag the average down.
    sample_time_ = std::chrono::steady_clock::now();
    sample_bytes_ = bytes_transferred_;
    return transition_locked(task_state::active);
}

auto transfer_task::wait_while_paused() -> result<void> {
    std::unique_lock lock(mutex_);
    state_cv_.wait(lock, [this] { return state_ != task_state::paused; });
    if (state_ == task_state::cancelled || token_.is_cancelled()) {
        return unexpected(error(error_code::cancelled, "transfer cancelled"));
    }
    return {};
}

auto transfer_task::wait_terminal(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return is_terminal(state_); });
}

auto transfer_task::update_progress(uint64_t bytes_transferred) -> bool {
    std::lock_guard lock(mutex_);
    if (is_terminal(state_) || bytes_transferred < bytes_transferred_) {
        return false;
    }
    bytes_transferred_ = bytes_transferred;

    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = now - sample_time_;
    if (elapsed < min_sample_interval) {
        return true;
    }
    const double seconds = std::chrono::duration<double>(elapsed).count();
    const double sample = static_cast<double>(bytes_transferred_ - sample_bytes_) / seconds;
    speed_ = has_speed_ ? speed_smoothing * sample + (1.0 - speed_smoothing) * speed_ : sample;
    has_speed_ = true;
    sample_time_ = now;
    sample_bytes_ = bytes_transferred_;
    return true;
}

auto transfer_task::set_total_bytes(uint64_t total) -> void {
    std::lock_guard lock(mutex_);
    total_bytes_ = total;
}

auto transfer_task::set_object_key(std::string key) -> void {
    std::lock_guard lock(mutex_);
    object_key_ = std::move(key);
}

auto transfer_task::progress_locked() const -> progress_snapshot {
    progress_snapshot snap;
    snap.bytes_transferred = bytes_transferred_;
    snap.total_bytes = total_bytes_;
    snap.bytes_per_second = state_ == task_state::active ? speed_ : 0.0;
    if (total_bytes_ == 0) {
        snap.fraction = state_ == task_state::completed ? 1.0 : 0.0;
    } else {
        snap.fraction = std::min(1.0, static_cast<double>(bytes_transferred_) /
                                          static_cast<double>(total_bytes_));
    }
    return snap;
}

auto transfer_task::progress() const -> progress_snapshot {
    std::lock_guard lock(mutex_);
    return progress_locked();
}

auto transfer_task::snapshot() const -> task_snapshot {
    std::lock_guard lock(mutex_);
    task_snapshot snap;
    snap.id = id_;
    snap.descriptor = descriptor_;
    snap.state = state_;
    snap.progress = progress_locked();
    snap.failure = failure_;
    snap.object_key = object_key_;
    snap.created_at = created_at_;
    snap.started_at = started_at_;
    snap.completed_at = completed_at_;
    return snap;
}

}  // namespace kcenon::resilient_transfer
