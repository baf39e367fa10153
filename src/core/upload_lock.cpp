/**
 * @file upload_lock.cpp
 * @brief Exclusive lock file creation and stale-lock takeover
 */

#include "kcenon/resilient_transfer/core/upload_lock.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <cstdio>
#include <optional>

#if defined(_WIN32)
#include <process.h>
#define RT_GETPID _getpid
#else
#include <unistd.h>
#define RT_GETPID ::getpid
#endif

namespace kcenon::resilient_transfer {

namespace {

/**
 * @brief Create @p path only if it does not exist ("wx" is exclusive create)
 */
auto create_exclusive(const std::filesystem::path& path) -> bool {
    std::FILE* file = std::fopen(path.string().c_str(), "wx");
    if (file == nullptr) {
        return false;
    }
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    std::fprintf(file, "pid=%ld\ncreated=%lld\n", static_cast<long>(RT_GETPID()),
                 static_cast<long long>(now));
    std::fclose(file);
    return true;
}

auto lock_age(const std::filesystem::path& path) -> std::optional<std::chrono::seconds> {
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    auto age = std::filesystem::file_time_type::clock::now() - modified;
    return std::chrono::duration_cast<std::chrono::seconds>(age);
}

}  // namespace

auto upload_lock::lock_path(const std::filesystem::path& local_path) -> std::filesystem::path {
    auto path = local_path;
    path += ".upload.lock";
    return path;
}

auto upload_lock::acquire(const std::filesystem::path& local_path, std::chrono::seconds stale_after)
    -> result<upload_lock> {
    const auto path = lock_path(local_path);

    if (create_exclusive(path)) {
        return upload_lock(path);
    }

    auto age = lock_age(path);
    if (!age) {
        // The lock vanished between the attempts; try once more.
        if (create_exclusive(path)) {
            return upload_lock(path);
        }
        return unexpected(error(error_code::file_locked, "cannot create lock " + path.string()));
    }

    if (*age < stale_after) {
        return unexpected(error(error_code::file_locked,
                                local_path.filename().string() +
                                    " is already being uploaded (lock held for " +
                                    std::to_string(age->count()) + "s)"));
    }

    RT_LOG_WARN(log_category::upload,
                "Taking over stale upload lock " + path.string() + " (age " +
                    std::to_string(age->count()) + "s)");
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (create_exclusive(path)) {
        return upload_lock(path);
    }
    return unexpected(error(error_code::file_locked,
                            "another process took over the lock " + path.string()));
}

upload_lock::upload_lock(upload_lock&& other) noexcept
    : path_(std::move(other.path_)), held_(other.held_) {
    other.held_ = false;
}

auto upload_lock::operator=(upload_lock&& other) noexcept -> upload_lock& {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        held_ = other.held_;
        other.held_ = false;
    }
    return *this;
}

upload_lock::~upload_lock() {
    release();
}

auto upload_lock::release() -> void {
    if (!held_) {
        return;
    }
    held_ = false;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        RT_LOG_WARN(log_category::upload, "Failed to remove upload lock " + path_.string());
    }
}

}  // namespace kcenon::resilient_transfer
