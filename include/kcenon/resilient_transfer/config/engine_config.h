/**
 * @file engine_config.h
 * @brief Configuration of the transfer engine and manager
 */

#ifndef KCENON_RESILIENT_TRANSFER_CONFIG_ENGINE_CONFIG_H
#define KCENON_RESILIENT_TRANSFER_CONFIG_ENGINE_CONFIG_H

#include "kcenon/resilient_transfer/cloud/credential_manager.h"
#include "kcenon/resilient_transfer/cloud/credential_types.h"
#include "kcenon/resilient_transfer/core/rate_limiter.h"
#include "kcenon/resilient_transfer/core/retry_policy.h"
#include "kcenon/resilient_transfer/core/types.h"
#include "kcenon/resilient_transfer/encryption/streaming_cipher.h"
#include "kcenon/resilient_transfer/transfer/event_bus.h"
#include "kcenon/resilient_transfer/transfer/resource_allocator.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::resilient_transfer {

/**
 * @brief Per-file transfer behaviour
 */
struct engine_config {
    /// Files at or above this size are transferred in parts (100MB)
    static constexpr uint64_t default_multipart_threshold = 100 * mebibyte;

    /// Default part size (32MB)
    static constexpr uint64_t default_part_size = 32 * mebibyte;

    static constexpr uint64_t default_min_part_size = 16 * mebibyte;
    static constexpr uint64_t default_max_part_size = 64 * mebibyte;

    /// Minimum length of the master secret in bytes
    static constexpr std::size_t min_master_secret_size = 32;

    uint64_t multipart_threshold = default_multipart_threshold;
    uint64_t part_size = default_part_size;
    uint64_t min_part_size = default_min_part_size;
    uint64_t max_part_size = default_max_part_size;
    std::size_t cipher_window = default_cipher_window;

    /// Extra free space required on top of a download's needs
    double disk_space_margin = 0.15;

    std::chrono::hours resume_max_age{24 * 7};
    std::chrono::seconds lock_stale_after{30 * 60};

    /**
     * Skip the remote duplicate check before fresh uploads. Saves one list
     * call per file at the cost of possibly storing the same file twice.
     * Off unless the caller opts in.
     */
    bool fast_mode = false;

    /// Upload even when an object with the same name prefix already exists
    bool allow_duplicates = false;

    /// Verify the end-to-end SHA-512 after every transfer
    bool verify_checksum = true;

    /// When set, download destinations must lie under this directory
    std::optional<std::filesystem::path> download_root;

    /// Secret every per-file key is derived from (never persisted)
    byte_buffer master_secret;

    /// Storage used when a submission carries no override
    storage_context default_storage;

    [[nodiscard]] auto validate() const -> result<void> {
        if (min_part_size == 0 || min_part_size > max_part_size) {
            return unexpected(error(error_code::invalid_configuration,
                                    "part size bounds must satisfy 0 < min <= max"));
        }
        if (part_size < min_part_size || part_size > max_part_size) {
            return unexpected(error(error_code::invalid_configuration,
                                    "part size " + std::to_string(part_size) + " outside [" +
                                        std::to_string(min_part_size) + ", " +
                                        std::to_string(max_part_size) + "]"));
        }
        if (part_size % cipher_block_size != 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "part size must be a multiple of " +
                                        std::to_string(cipher_block_size)));
        }
        if (multipart_threshold == 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "multipart threshold must be positive"));
        }
        if (cipher_window < cipher_block_size || cipher_window % cipher_block_size != 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "cipher window must be a positive multiple of " +
                                        std::to_string(cipher_block_size)));
        }
        if (disk_space_margin < 0.0 || disk_space_margin > 10.0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "disk space margin must lie in [0, 10]"));
        }
        if (resume_max_age.count() <= 0 || lock_stale_after.count() <= 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "resume max age and lock stale age must be positive"));
        }
        if (master_secret.size() < min_master_secret_size) {
            return unexpected(error(error_code::invalid_configuration,
                                    "master secret must be at least " +
                                        std::to_string(min_master_secret_size) + " bytes"));
        }
        return {};
    }
};

/**
 * @brief Everything the transfer manager needs
 */
struct transfer_manager_config {
    static constexpr uint32_t default_max_concurrent_transfers = 5;
    static constexpr uint32_t max_concurrent_transfers_limit = 10;

    engine_config engine;
    retry_policy retry;
    std::array<rate_limit_profile, rate_limit_scope_count> rate_profiles{
        rate_limit_profile::defaults_for(rate_limit_scope::platform_api),
        rate_limit_profile::defaults_for(rate_limit_scope::job_submission),
        rate_limit_profile::defaults_for(rate_limit_scope::jobs_usage),
        rate_limit_profile::defaults_for(rate_limit_scope::storage_io),
    };
    credential_manager_config credentials;
    resource_config resources;
    uint32_t max_concurrent_transfers = default_max_concurrent_transfers;
    std::size_t event_queue_capacity = event_bus::default_capacity;
    /// Renew cached leases on a background thread while the manager runs
    bool background_credential_refresh = false;

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto r = engine.validate(); !r) {
            return r;
        }
        if (auto r = retry.validate(); !r) {
            return r;
        }
        for (const auto& profile : rate_profiles) {
            if (auto r = profile.validate(); !r) {
                return r;
            }
        }
        if (auto r = credentials.validate(); !r) {
            return r;
        }
        if (auto r = resources.validate(); !r) {
            return r;
        }
        if (max_concurrent_transfers < 1 ||
            max_concurrent_transfers > max_concurrent_transfers_limit) {
            return unexpected(error(error_code::invalid_configuration,
                                    "max_concurrent_transfers must lie in [1, " +
                                        std::to_string(max_concurrent_transfers_limit) + "]"));
        }
        if (event_queue_capacity < 1 || event_queue_capacity > event_bus::max_capacity) {
            return unexpected(error(error_code::invalid_configuration,
                                    "event queue capacity must lie in [1, " +
                                        std::to_string(event_bus::max_capacity) + "]"));
        }
        return {};
    }
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CONFIG_ENGINE_CONFIG_H
