/**
 * @file cancellation.h
 * @brief Cooperative cancellation shared between a task and its workers
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_CANCELLATION_H
#define KCENON_RESILIENT_TRANSFER_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace kcenon::resilient_transfer {

/**
 * @brief Cancellation flag with interruptible sleeps
 *
 * Copies share the same state. Every blocking point in the engine (slot
 * acquisition, rate-limit waits, backoff sleeps) polls or waits on a token.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<state>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->cancelled.load();
    }

    /**
     * @brief Sleep for up to @p duration
     * @return true if the sleep was interrupted by cancellation
     */
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> duration) const -> bool {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled.load(); });
    }

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<state> state_;
};

/**
 * @brief Sleep that honours an optional token
 * @return true if cancelled
 */
template <typename Rep, typename Period>
auto interruptible_sleep(const cancellation_token* token,
                         std::chrono::duration<Rep, Period> duration) -> bool {
    if (token == nullptr) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    return token->wait_for(duration);
}

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_CANCELLATION_H
