/**
 * @file upload_lock.h
 * @brief Advisory lock preventing two uploads of the same local file
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_UPLOAD_LOCK_H
#define KCENON_RESILIENT_TRANSFER_CORE_UPLOAD_LOCK_H

#include "types.h"

#include <chrono>
#include <filesystem>

namespace kcenon::resilient_transfer {

/**
 * @brief `<file>.upload.lock` holding the owner's process id
 *
 * Created exclusively; a lock older than the stale age is assumed to belong
 * to a crashed process and is taken over. Released on destruction.
 */
class upload_lock {
public:
    static constexpr std::chrono::minutes default_stale_after{30};

    [[nodiscard]] static auto acquire(const std::filesystem::path& local_path,
                                      std::chrono::seconds stale_after = default_stale_after)
        -> result<upload_lock>;

    [[nodiscard]] static auto lock_path(const std::filesystem::path& local_path)
        -> std::filesystem::path;

    upload_lock(upload_lock&& other) noexcept;
    auto operator=(upload_lock&& other) noexcept -> upload_lock&;
    upload_lock(const upload_lock&) = delete;
    auto operator=(const upload_lock&) -> upload_lock& = delete;

    ~upload_lock();

    auto release() -> void;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] auto is_held() const noexcept -> bool { return held_; }

private:
    explicit upload_lock(std::filesystem::path path) : path_(std::move(path)), held_(true) {}

    std::filesystem::path path_;
    bool held_ = false;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_UPLOAD_LOCK_H
