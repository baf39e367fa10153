/**
 * @file disk_space_windows.cpp
 * @brief GetDiskFreeSpaceExW-based free-space query
 */

#include "kcenon/resilient_transfer/core/disk_space.h"
#include "kcenon/resilient_transfer/core/logging.h"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <cmath>
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

    ULARGE_INTEGER free_to_caller{};
    if (!::GetDiskFreeSpaceExW(existing.wstring().c_str(), &free_to_caller, nullptr, nullptr)) {
        return unexpected(error(error_code::file_read_error,
                                "GetDiskFreeSpaceExW failed for " + existing.string() +
                                    " (error " + std::to_string(::GetLastError()) + ")"));
    }
    return static_cast<uint64_t>(free_to_caller.QuadPart);
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
    return {};
}

}  // namespace kcenon::resilient_transfer
