/**
 * @file credential_manager.h
 * @brief Shared credential cache with single-flight refresh
 *
 * One credential_manager is constructed by the owner of the engine and
 * injected into every uploader and downloader. Leases are cached per
 * storage context; all tasks on the same storage share one lease.
 */

#ifndef KCENON_RESILIENT_TRANSFER_CLOUD_CREDENTIAL_MANAGER_H
#define KCENON_RESILIENT_TRANSFER_CLOUD_CREDENTIAL_MANAGER_H

#include "credential_types.h"

#include "kcenon/resilient_transfer/core/rate_limiter.h"
#include "kcenon/resilient_transfer/core/retry_policy.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace kcenon::resilient_transfer {

/**
 * @brief Refresh timing of the credential cache
 */
struct credential_manager_config {
    /// Leases older than this are refreshed proactively
    std::chrono::seconds refresh_interval{600};
    /// Leases this close to expiry are refreshed
    std::chrono::seconds expiry_buffer{300};
    /// Background refresher wake-up period
    std::chrono::seconds check_interval{60};
    /// Retry applied to each fetch from the credential source
    retry_policy refresh_retry{3, std::chrono::milliseconds(200), std::chrono::milliseconds(2000),
                               true, std::chrono::milliseconds(0)};

    [[nodiscard]] auto validate() const -> result<void> {
        if (refresh_interval.count() <= 0 || check_interval.count() <= 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "credential refresh intervals must be positive"));
        }
        if (expiry_buffer.count() < 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "credential expiry buffer must not be negative"));
        }
        return refresh_retry.validate();
    }
};

using lease_ptr = std::shared_ptr<const credential_lease>;

/**
 * @brief Caches leases and refreshes them before they expire
 *
 * Lookups take a shared lock. On a miss or stale lease the exclusive lock is
 * taken, the lease re-checked, and one refresh registered; the fetch itself
 * runs with no lock held and concurrent callers for the same key wait for
 * that single fetch.
 */
class credential_manager {
public:
    /**
     * @param source  issues new leases
     * @param config  refresh timing
     * @param limiter optional bucket every fetch takes a token from
     */
    explicit credential_manager(std::shared_ptr<credential_source> source,
                                credential_manager_config config = {},
                                rate_limiter* limiter = nullptr);
    ~credential_manager();

    credential_manager(const credential_manager&) = delete;
    credential_manager& operator=(const credential_manager&) = delete;

    /**
     * @brief Cached lease for @p context, refreshed when stale
     *
     * If a refresh fails while the cached lease is still unexpired, the
     * cached lease is returned and a warning logged.
     */
    [[nodiscard]] auto get_credentials(const storage_context& context) -> result<lease_ptr>;

    /**
     * @brief Fetch a new lease regardless of the cached one's age
     *
     * Joins a refresh already in flight for the same key.
     */
    [[nodiscard]] auto force_refresh(const storage_context& context) -> result<lease_ptr>;

    auto invalidate(const storage_context& context) -> void;

    auto clear() -> void;

    /**
     * @brief Start renewing cached leases on a background thread
     */
    [[nodiscard]] auto start_background_refresh() -> result<void>;

    auto stop_background_refresh() -> void;

    [[nodiscard]] auto is_background_refresh_running() const -> bool;

    [[nodiscard]] auto cached_count() const -> std::size_t;

    /**
     * @brief Number of fetches issued to the credential source
     */
    [[nodiscard]] auto fetch_count() const -> uint64_t;

    [[nodiscard]] auto config() const -> const credential_manager_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CLOUD_CREDENTIAL_MANAGER_H
