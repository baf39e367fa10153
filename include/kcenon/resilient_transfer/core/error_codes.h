/**
 * @file error_codes.h
 * @brief Error classification and remediation hints for resilient_transfer
 *
 * Every error raised by a remote call, the cipher, or the local filesystem is
 * classified exactly once into an error_category. The retry executor only
 * retries the two retryable categories; everything else surfaces to the task.
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_RESILIENT_TRANSFER_CORE_ERROR_CODES_H

#include "types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::resilient_transfer {

/**
 * @brief Error classification used by the retry executor
 */
enum class error_category {
    none,
    retryable_network,
    retryable_throttle,
    fatal_auth,
    fatal_validation,
    fatal_resource,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(error_category category) noexcept
    -> std::string_view {
    switch (category) {
        case error_category::none:
            return "none";
        case error_category::retryable_network:
            return "retryable_network";
        case error_category::retryable_throttle:
            return "retryable_throttle";
        case error_category::fatal_auth:
            return "fatal_auth";
        case error_category::fatal_validation:
            return "fatal_validation";
        case error_category::fatal_resource:
            return "fatal_resource";
        case error_category::cancelled:
            return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Check if error code is in network error range
 */
[[nodiscard]] constexpr auto is_network_error(int32_t code) noexcept -> bool {
    return code <= -100 && code >= -119;
}

/**
 * @brief Check if error code is in throttling error range
 */
[[nodiscard]] constexpr auto is_throttle_error(int32_t code) noexcept -> bool {
    return code <= -120 && code >= -129;
}

/**
 * @brief Check if error code is in authentication error range
 */
[[nodiscard]] constexpr auto is_auth_error(int32_t code) noexcept -> bool {
    return code <= -130 && code >= -139;
}

/**
 * @brief Check if error code is in validation error range
 */
[[nodiscard]] constexpr auto is_validation_error(int32_t code) noexcept -> bool {
    return code <= -140 && code >= -179;
}

/**
 * @brief Check if error code is in resource error range
 */
[[nodiscard]] constexpr auto is_resource_error(int32_t code) noexcept -> bool {
    return code <= -180 && code >= -199;
}

/**
 * @brief Classify an error code
 *
 * Lifecycle errors other than cancellation (shutdown, internal) count as
 * fatal resource errors.
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_category {
    const auto value = static_cast<int32_t>(code);
    if (code == error_code::success) {
        return error_category::none;
    }
    if (code == error_code::cancelled) {
        return error_category::cancelled;
    }
    if (is_network_error(value)) {
        return error_category::retryable_network;
    }
    if (is_throttle_error(value)) {
        return error_category::retryable_throttle;
    }
    if (is_auth_error(value)) {
        return error_category::fatal_auth;
    }
    if (is_validation_error(value)) {
        return error_category::fatal_validation;
    }
    return error_category::fatal_resource;
}

/**
 * @brief Check if the error is retryable
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    const auto category = classify(code);
    return category == error_category::retryable_network ||
           category == error_category::retryable_throttle;
}

/**
 * @brief Actionable hint for a fatal error, empty when none applies
 */
[[nodiscard]] constexpr auto remediation_hint(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::destination_exists:
            return "set the overwrite option to replace the existing file";
        case error_code::duplicate_object:
            return "enable allow_duplicates, or fast_mode to skip the duplicate check";
        case error_code::insufficient_disk_space:
            return "free disk space on the destination volume and resume";
        case error_code::path_unsafe:
            return "choose a destination inside download_root without '..' components";
        case error_code::path_invalid:
            return "check that the local path names a regular file";
        case error_code::file_locked:
            return "another upload of this file is running; wait or remove a stale lock";
        case error_code::auth_denied:
        case error_code::credentials_unavailable:
            return "verify the account has access to the storage";
        case error_code::auth_expired:
            return "re-authenticate and resume the transfer";
        case error_code::checksum_mismatch:
        case error_code::size_mismatch:
            return "retry the transfer; the resume state was discarded";
        default:
            return "";
    }
}

/**
 * @brief Description of a fatal transfer error reported to callers
 */
struct transfer_failure {
    std::string object;
    error_code code = error_code::success;
    error_category category = error_category::none;
    std::string message;
    std::string remediation;

    transfer_failure() = default;

    transfer_failure(std::string obj, const error& err)
        : object(std::move(obj)),
          code(err.code),
          category(classify(err.code)),
          message(err.message),
          remediation(remediation_hint(err.code)) {}

    /**
     * @brief Human readable one-line description
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string out = object.empty() ? std::string{} : object + ": ";
        out += message.empty() ? std::string(to_string(code)) : message;
        out += " [";
        out += to_string(category);
        out += "]";
        if (!remediation.empty()) {
            out += " (hint: " + remediation + ")";
        }
        return out;
    }
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_ERROR_CODES_H
