/**
 * @file disk_space.h
 * @brief Free-space checks before downloads write to disk
 *
 * One interface; the implementation is chosen per platform by the build
 * (disk_space_posix.cpp or disk_space_windows.cpp).
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_DISK_SPACE_H
#define KCENON_RESILIENT_TRANSFER_CORE_DISK_SPACE_H

#include "types.h"

#include <cstdint>
#include <filesystem>

namespace kcenon::resilient_transfer {

/**
 * @brief Bytes available to the current user on the volume holding @p path
 *
 * If @p path does not exist yet, its nearest existing ancestor is queried.
 */
[[nodiscard]] auto available_space(const std::filesystem::path& path) -> result<uint64_t>;

/**
 * @brief Bytes needed to hold @p required plus a safety margin
 * @param margin fraction on top of @p required (0.15 adds 15%)
 */
[[nodiscard]] auto required_with_margin(uint64_t required, double margin) noexcept -> uint64_t;

/**
 * @brief Fail with insufficient_disk_space unless @p required bytes fit
 *
 * The error message names the path and both sizes in MB.
 */
[[nodiscard]] auto check_available_space(const std::filesystem::path& path,
                                         uint64_t required,
                                         double margin) -> result<void>;

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_DISK_SPACE_H
