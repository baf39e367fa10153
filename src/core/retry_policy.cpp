/**
 * @file retry_policy.cpp
 * @brief Backoff computation and retry decisions
 */

#include "kcenon/resilient_transfer/core/retry_policy.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <algorithm>
#include <random>

namespace kcenon::resilient_transfer {

auto compute_backoff(const retry_policy& policy, uint32_t attempt) -> std::chrono::milliseconds {
    // Doubling stops once the ceiling is reached; the shift bound keeps it in range.
    int64_t ceiling = policy.initial_delay.count();
    const int64_t limit = policy.max_delay.count();
    for (uint32_t i = 0; i < attempt && ceiling < limit && i < 62; ++i) {
        ceiling *= 2;
    }
    ceiling = std::min(ceiling, limit);
    if (ceiling <= 0) {
        return std::chrono::milliseconds::zero();
    }
    if (!policy.use_jitter) {
        return std::chrono::milliseconds(ceiling);
    }

    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int64_t> dis(0, ceiling);
    return std::chrono::milliseconds(dis(gen));
}

auto retry_executor::prepare_retry(std::string_view operation,
                                   uint32_t attempt,
                                   const error& err,
                                   bool& auth_refreshed,
                                   const cancellation_token* token) -> result<void> {
    const auto category = classify(err.code);
    const std::string op(operation);

    if (category == error_category::cancelled) {
        return unexpected(err);
    }

    if (err.code == error_code::auth_expired && !auth_refreshed && hooks_.on_auth_expired) {
        RT_LOG_INFO(log_category::retry,
                    op + ": credentials expired, refreshing before one more attempt");
        if (interruptible_sleep(token, policy_.credential_refresh_delay)) {
            return unexpected(error(error_code::cancelled, op + " cancelled"));
        }
        if (auto refreshed = hooks_.on_auth_expired(); !refreshed) {
            RT_LOG_ERROR(log_category::retry,
                         op + ": credential refresh failed: " + refreshed.error().message);
            return unexpected(refreshed.error());
        }
        auth_refreshed = true;
        return {};
    }

    if (!is_retryable(err.code)) {
        RT_LOG_DEBUG(log_category::retry,
                     op + " failed with non-retryable error: " + err.message);
        return unexpected(err);
    }

    if (attempt + 1 >= policy_.max_attempts) {
        RT_LOG_ERROR(log_category::retry,
                     op + " failed after " + std::to_string(attempt + 1) +
                         " attempts: " + err.message);
        return unexpected(error(err.code, op + " failed after " + std::to_string(attempt + 1) +
                                              " attempts: " + err.message));
    }

    const auto delay = err.retry_after ? *err.retry_after : compute_backoff(policy_, attempt);

    if (category == error_category::retryable_throttle && hooks_.on_throttled) {
        hooks_.on_throttled(delay);
    }
    if (hooks_.on_retry) {
        hooks_.on_retry(attempt + 1, err, delay);
    }

    RT_LOG_WARN(log_category::retry,
                op + " attempt " + std::to_string(attempt + 1) + " failed (" +
                    std::string(to_string(category)) + "): " + err.message + "; retrying in " +
                    std::to_string(delay.count()) + " ms");

    if (interruptible_sleep(token, delay)) {
        return unexpected(error(error_code::cancelled, op + " cancelled during backoff"));
    }
    return {};
}

}  // namespace kcenon::resilient_transfer
