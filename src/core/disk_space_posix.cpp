/**
 * @file disk_space_posix.cpp
 * @brief statvfs-based free-space query
 */

#include "kcenon/resilient_transfer/core/disk_space.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <sys/statvfs.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <sstream>

namespace kcenon::resilient_transfer {

namespace {

auto nearest_existing(const std::filesystem::path& path) -> std::filesystem::path {
    std::error_code ec;
    auto current = path.empty() ? std::filesystem::current_path(ec) : path;
    while (!current.empty() && !std::filesystem::exists(current, ec)) {
        auto parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }
    return current.empty() ? std::filesystem::path(".") : current;
}

}  // namespace

auto available_space(const std::filesystem::path& path) -> result<uint64_t> {
    const auto existing = nearest_existing(path);

    struct statvfs info {};
    if (::statvfs(existing.c_str(), &info) != 0) {
        return unexpected(error(error_code::file_read_error,
                                "statvfs failed for " + existing.string() + ": " +
                                    std::strerror(errno)));
    }
    return static_cast<uint64_t>(info.f_bavail) * static_cast<uint64_t>(info.f_frsize);
}

auto required_with_margin(uint64_t required, double margin) noexcept -> uint64_t {
    if (margin <= 0.0) {
        return required;
    }
    return static_cast<uint64_t>(std::ceil(static_cast<double>(required) * (1.0 + margin)));
}

auto check_available_space(const std::filesystem::path& path,
                           uint64_t required,
                           double margin) -> result<void> {
    auto available = available_space(path);
    if (!available) {
        return unexpected(available.error());
    }

    const auto needed = required_with_margin(required, margin);
    if (available.value() < needed) {
        std::ostringstream oss;
        oss << "insufficient disk space at " << path.string() << ": need "
            << needed / (1024 * 1024) << " MB, have " << available.value() / (1024 * 1024)
            << " MB";
        RT_LOG_ERROR(log_category::disk, oss.str());
        return unexpected(error(error_code::insufficient_disk_space, oss.str()));
    }

    RT_LOG_DEBUG(log_category::disk,
                 "Disk space ok at " + path.string() + " (" +
                     std::to_string(available.value() / (1024 * 1024)) + " MB free)");
    return {};
}

}  // namespace kcenon::resilient_transfer
