/**
 * @file types.h
 * @brief Core type definitions for resilient_transfer
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_TYPES_H
#define KCENON_RESILIENT_TRANSFER_CORE_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::resilient_transfer {

/**
 * @brief Error codes for transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Network errors (retryable)
 * - -120 to -129: Throttling errors (retryable)
 * - -130 to -139: Authentication errors
 * - -140 to -179: Validation errors
 * - -180 to -199: Resource errors
 * - -200 to -219: Lifecycle and internal errors
 */
enum class error_code {
    success = 0,

    // Network errors (-100 to -119)
    transient_network = -100,
    connection_failed = -101,
    connection_timeout = -102,
    connection_reset = -103,
    server_error = -104,

    // Throttling errors (-120 to -129)
    throttled = -120,

    // Authentication errors (-130 to -139)
    auth_expired = -130,
    auth_denied = -131,
    credentials_unavailable = -132,

    // Validation errors (-140 to -179)
    checksum_mismatch = -140,
    size_mismatch = -141,
    cipher_error = -142,
    path_invalid = -143,
    path_unsafe = -144,
    destination_exists = -145,
    duplicate_object = -146,
    resume_state_invalid = -147,
    object_not_found = -148,
    invalid_configuration = -149,
    invalid_argument = -150,
    invalid_state_transition = -151,
    transfer_not_found = -152,

    // Resource errors (-180 to -199)
    insufficient_disk_space = -180,
    file_read_error = -181,
    file_write_error = -182,
    file_not_found = -183,
    file_locked = -184,

    // Lifecycle and internal errors (-200 to -219)
    cancelled = -200,
    shut_down = -201,
    internal_error = -210,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::transient_network:
            return "transient network error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_reset:
            return "connection reset";
        case error_code::server_error:
            return "server error";
        case error_code::throttled:
            return "request throttled";
        case error_code::auth_expired:
            return "credentials expired";
        case error_code::auth_denied:
            return "access denied";
        case error_code::credentials_unavailable:
            return "credentials unavailable";
        case error_code::checksum_mismatch:
            return "checksum mismatch";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::cipher_error:
            return "cipher error";
        case error_code::path_invalid:
            return "invalid path";
        case error_code::path_unsafe:
            return "unsafe path";
        case error_code::destination_exists:
            return "destination already exists";
        case error_code::duplicate_object:
            return "duplicate object";
        case error_code::resume_state_invalid:
            return "resume state invalid";
        case error_code::object_not_found:
            return "remote object not found";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::transfer_not_found:
            return "transfer not found";
        case error_code::insufficient_disk_space:
            return "insufficient disk space";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_locked:
            return "file locked by another transfer";
        case error_code::cancelled:
            return "cancelled";
        case error_code::shut_down:
            return "engine shut down";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and an optional server retry hint
 */
struct error {
    error_code code;
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, std::chrono::milliseconds after)
        : code(c), message(std::move(msg)), retry_after(after) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Direction of a transfer relative to the local machine
 */
enum class transfer_direction {
    upload,
    download,
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) -> const char* {
    return dir == transfer_direction::upload ? "upload" : "download";
}

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_TYPES_H
