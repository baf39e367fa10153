/**
 * @file rate_limiter.h
 * @brief Request rate limiting using a token bucket per operation class
 *
 * Every remote call takes one token from the bucket of its operation class
 * before it is issued. Buckets start full, refill continuously and can be
 * drained and put into cooldown when the server answers with throttling.
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_RATE_LIMITER_H
#define KCENON_RESILIENT_TRANSFER_CORE_RATE_LIMITER_H

#include "cancellation.h"
#include "types.h"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace kcenon::resilient_transfer {

/**
 * @brief Operation classes with independent request budgets
 */
enum class rate_limit_scope {
    platform_api,    ///< control-plane calls (credentials, multipart bookkeeping, listing)
    job_submission,  ///< job creation
    jobs_usage,      ///< job status and usage queries
    storage_io,      ///< part uploads and ranged reads
};

inline constexpr std::size_t rate_limit_scope_count = 4;

[[nodiscard]] constexpr auto to_string(rate_limit_scope scope) -> std::string_view {
    switch (scope) {
        case rate_limit_scope::platform_api:
            return "platform_api";
        case rate_limit_scope::job_submission:
            return "job_submission";
        case rate_limit_scope::jobs_usage:
            return "jobs_usage";
        case rate_limit_scope::storage_io:
            return "storage_io";
    }
    return "unknown";
}

/**
 * @brief Refill rate and burst capacity of one bucket
 */
struct rate_limit_profile {
    double requests_per_second = 1.0;
    std::size_t burst = 1;

    /**
     * @brief Default targets, about 80% of the published hard limits
     */
    [[nodiscard]] static constexpr auto defaults_for(rate_limit_scope scope) -> rate_limit_profile {
        switch (scope) {
            case rate_limit_scope::platform_api:
                return {1.6, 150};
            case rate_limit_scope::job_submission:
                return {0.139, 50};
            case rate_limit_scope::jobs_usage:
                return {20.0, 300};
            case rate_limit_scope::storage_io:
                return {80.0, 200};
        }
        return {1.0, 1};
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (!(requests_per_second > 0.0)) {
            return unexpected(error(error_code::invalid_configuration,
                                    "rate limit must be positive"));
        }
        if (burst == 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "rate limit burst must be at least 1"));
        }
        return {};
    }
};

/**
 * @brief Token bucket request limiter
 *
 * @code
 * rate_limiter limiter({20.0, 300});
 *
 * if (auto r = limiter.acquire(&token); !r) {
 *     return unexpected(r.error());  // cancelled while waiting
 * }
 * issue_request();
 *
 * // on HTTP 429
 * limiter.drain();
 * limiter.set_cooldown(std::chrono::seconds(5));
 * @endcode
 */
class rate_limiter {
public:
    explicit rate_limiter(rate_limit_profile profile, std::string name = "rate_limiter");

    /**
     * @brief Destructor wakes all waiters, which then fail with shut_down
     */
    ~rate_limiter();

    rate_limiter(const rate_limiter&) = delete;
    auto operator=(const rate_limiter&) -> rate_limiter& = delete;

    /**
     * @brief Take one token, waiting for refill and any active cooldown
     *
     * Only the calling thread blocks. The wait is polled in short slices so
     * that a cancelled @p token ends it promptly.
     *
     * @return error_code::cancelled if @p token fired while waiting
     */
    [[nodiscard]] auto acquire(const cancellation_token* token = nullptr) -> result<void>;

    /**
     * @brief Take one token if available right now and no cooldown is active
     */
    [[nodiscard]] auto try_acquire() -> bool;

    /**
     * @brief Empty the bucket after the server reported throttling
     */
    auto drain() -> void;

    /**
     * @brief Block acquisitions for @p duration from now
     *
     * A cooldown is only ever extended; a shorter request leaves the
     * current deadline in place.
     */
    auto set_cooldown(std::chrono::milliseconds duration) -> void;

    [[nodiscard]] auto cooldown_remaining() const -> std::chrono::milliseconds;

    /**
     * @brief Change rate and burst; current tokens are clamped to the new burst
     */
    [[nodiscard]] auto reconfigure(rate_limit_profile profile) -> result<void>;

    /**
     * @brief Refill the bucket to capacity and clear any cooldown
     */
    auto reset() -> void;

    [[nodiscard]] auto available_tokens() const -> double;

    [[nodiscard]] auto profile() const -> rate_limit_profile;

    /**
     * @brief Tokens handed out since construction
     */
    [[nodiscard]] auto total_acquired() const noexcept -> uint64_t;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }

private:
    auto refill_tokens(std::chrono::steady_clock::time_point now) -> void;
    [[nodiscard]] auto calculate_wait_time(std::chrono::steady_clock::time_point now) const
        -> std::chrono::microseconds;
    auto report_long_wait(std::chrono::steady_clock::duration waited) -> void;

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    double rate_;
    double capacity_;
    double tokens_;
    std::chrono::steady_clock::time_point last_refill_;
    std::chrono::steady_clock::time_point cooldown_until_;
    std::chrono::steady_clock::time_point last_warning_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> acquired_{0};
};

/**
 * @brief Process-wide set of buckets, one per rate_limit_scope
 *
 * Owned by the transfer manager and shared by all of its transfers.
 */
class rate_limiter_registry {
public:
    rate_limiter_registry();

    [[nodiscard]] auto get(rate_limit_scope scope) -> rate_limiter&;

    [[nodiscard]] auto configure(rate_limit_scope scope, rate_limit_profile profile)
        -> result<void>;

private:
    std::array<std::unique_ptr<rate_limiter>, rate_limit_scope_count> limiters_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_RATE_LIMITER_H
