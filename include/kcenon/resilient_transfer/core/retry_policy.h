/**
 * @file retry_policy.h
 * @brief Retry with full-jitter exponential backoff
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_RETRY_POLICY_H
#define KCENON_RESILIENT_TRANSFER_CORE_RETRY_POLICY_H

#include "cancellation.h"
#include "error_codes.h"
#include "types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

namespace kcenon::resilient_transfer {

/**
 * @brief Retry limits and delays
 */
struct retry_policy {
    uint32_t max_attempts = 10;
    std::chrono::milliseconds initial_delay{200};
    std::chrono::milliseconds max_delay{15000};
    bool use_jitter = true;
    std::chrono::milliseconds credential_refresh_delay{1000};

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_attempts == 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "retry max_attempts must be at least 1"));
        }
        if (initial_delay.count() < 0 || max_delay < initial_delay) {
            return unexpected(error(error_code::invalid_configuration,
                                    "retry delays must satisfy 0 <= initial <= max"));
        }
        return {};
    }
};

/**
 * @brief Delay before retry number @p attempt (0-based)
 *
 * The ceiling is min(max_delay, initial_delay * 2^attempt). With jitter the
 * result is uniform in [0, ceiling], otherwise it is the ceiling.
 */
[[nodiscard]] auto compute_backoff(const retry_policy& policy, uint32_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief Callbacks wiring the executor to limiter and credential manager
 */
struct retry_hooks {
    /// Called on throttling with the delay about to be applied
    std::function<void(std::chrono::milliseconds)> on_throttled;
    /// Called once per operation when credentials expired; should force a refresh
    std::function<result<void>()> on_auth_expired;
    /// Observes every scheduled retry
    std::function<void(uint32_t attempt, const error&, std::chrono::milliseconds)> on_retry;
};

/**
 * @brief Runs an operation until it succeeds or fails fatally
 *
 * Only retryable_network and retryable_throttle errors are retried. A
 * server-provided retry_after is used verbatim instead of the computed
 * backoff. auth_expired triggers one credential refresh and one extra
 * attempt. Backoff sleeps end early when the token is cancelled.
 *
 * @code
 * retry_executor executor(policy, hooks);
 * auto receipt = executor.execute("upload_part", [&] {
 *     return backend.upload_part(lease, key, upload_id, n, data);
 * }, &token);
 * @endcode
 */
class retry_executor {
public:
    explicit retry_executor(retry_policy policy = {}, retry_hooks hooks = {})
        : policy_(policy), hooks_(std::move(hooks)) {}

    template <typename F>
    auto execute(std::string_view operation, F&& op, const cancellation_token* token = nullptr)
        -> std::invoke_result_t<F&> {
        bool auth_refreshed = false;
        for (uint32_t attempt = 0;; ++attempt) {
            if (token != nullptr && token->is_cancelled()) {
                return unexpected(error(error_code::cancelled,
                                        std::string(operation) + " cancelled"));
            }

            auto outcome = op();
            if (outcome) {
                return outcome;
            }

            auto next = prepare_retry(operation, attempt, outcome.error(), auth_refreshed, token);
            if (!next) {
                return unexpected(next.error());
            }
        }
    }

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    /**
     * @return success to retry, or the error to surface
     */
    [[nodiscard]] auto prepare_retry(std::string_view operation,
                                     uint32_t attempt,
                                     const error& err,
                                     bool& auth_refreshed,
                                     const cancellation_token* token) -> result<void>;

    retry_policy policy_;
    retry_hooks hooks_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_RETRY_POLICY_H
