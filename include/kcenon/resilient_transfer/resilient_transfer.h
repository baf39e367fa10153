/**
 * @file resilient_transfer.h
 * @brief Main header for the resilient_transfer library
 * @version 0.1.0
 *
 * Include this header to access the transfer manager, the upload and
 * download engines and their supporting types.
 *
 * @code
 * #include <kcenon/resilient_transfer/resilient_transfer.h>
 *
 * using namespace kcenon::resilient_transfer;
 *
 * auto backend = local_storage_backend::create("/srv/objects");
 * auto manager = transfer_manager::builder()
 *     .with_backend(backend.value())
 *     .with_credential_source(source)
 *     .with_master_secret(secret)
 *     .build();
 * @endcode
 */

#ifndef KCENON_RESILIENT_TRANSFER_RESILIENT_TRANSFER_H
#define KCENON_RESILIENT_TRANSFER_RESILIENT_TRANSFER_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/resilient_transfer/core/types.h"
#include "kcenon/resilient_transfer/core/error_codes.h"
#include "kcenon/resilient_transfer/core/transfer_id.h"
#include "kcenon/resilient_transfer/core/checksum.h"
#include "kcenon/resilient_transfer/core/rate_limiter.h"
#include "kcenon/resilient_transfer/core/retry_policy.h"
#include "kcenon/resilient_transfer/core/resume_store.h"
#include "kcenon/resilient_transfer/core/logging.h"

// Credentials and encryption
#include "kcenon/resilient_transfer/cloud/credential_manager.h"
#include "kcenon/resilient_transfer/encryption/streaming_cipher.h"

// Configuration
#include "kcenon/resilient_transfer/config/engine_config.h"
#include "kcenon/resilient_transfer/config/feature_flags.h"

// Transfer engines
#include "kcenon/resilient_transfer/transfer/storage_backend.h"
#include "kcenon/resilient_transfer/transfer/local_storage_backend.h"
#include "kcenon/resilient_transfer/transfer/uploader.h"
#include "kcenon/resilient_transfer/transfer/downloader.h"
#include "kcenon/resilient_transfer/transfer/transfer_manager.h"

namespace kcenon::resilient_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_RESILIENT_TRANSFER_H
