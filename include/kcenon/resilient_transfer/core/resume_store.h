/**
 * @file resume_store.h
 * @brief Durable per-transfer resume state
 *
 * Each in-flight chunked transfer keeps a JSON sidecar next to its local
 * file (`<file>.upload.resume` or `<file>.download.resume`). The sidecar is
 * rewritten atomically after every completed part and removed on success.
 * The schema is versioned; unknown fields are ignored and missing required
 * fields make the state invalid.
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_RESUME_STORE_H
#define KCENON_RESILIENT_TRANSFER_CORE_RESUME_STORE_H

#include "types.h"

#include "kcenon/resilient_transfer/cloud/credential_types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::resilient_transfer {

inline constexpr int resume_format_version = 1;

/**
 * @brief One part confirmed by the remote side (upload) or written locally (download)
 */
struct completed_part {
    uint32_t part_number = 0;  ///< 1-based
    uint64_t size = 0;         ///< bytes moved for this part (ciphertext)
    std::string etag;

    [[nodiscard]] auto operator==(const completed_part& other) const -> bool = default;
};

/**
 * @brief Everything needed to continue an interrupted transfer
 *
 * The engine master secret is never stored; only the per-file key derived
 * from it is.
 */
struct resume_state {
    int format_version = resume_format_version;
    transfer_direction direction = transfer_direction::upload;
    std::string local_path;
    std::string object_key;
    storage_type storage = storage_type::s3;
    std::string storage_id;
    std::string upload_id;          ///< multipart session (upload)
    uint64_t plain_size = 0;
    uint64_t total_size = 0;        ///< ciphertext size of the whole object
    uint64_t part_size = 0;         ///< plaintext bytes per part
    uint64_t bytes_transferred = 0;
    std::vector<completed_part> completed_parts;
    std::string file_key;           ///< base64 per-file key
    std::string file_id;            ///< base64 derivation salt
    std::string random_suffix;      ///< object key suffix (upload)
    std::string checksum;           ///< plaintext SHA-512 (upload)
    std::string etag;               ///< remote object ETag (download)
    std::string encrypted_path;     ///< partial ciphertext artifact (download)
    bool committed = false;         ///< multipart completed remotely (upload)
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_update{};

    /**
     * @brief Record a part, replacing any earlier record with the same number
     *
     * Keeps bytes_transferred equal to the sum of part sizes.
     */
    auto record_part(completed_part part) -> void;

    /**
     * @brief Forget a part so that it is transferred again
     * @return true if the part was recorded
     */
    auto remove_part(uint32_t part_number) -> bool;

    [[nodiscard]] auto has_part(uint32_t part_number) const -> bool;

    [[nodiscard]] auto find_part(uint32_t part_number) const -> const completed_part*;

    /**
     * @brief bytes_transferred matches the recorded parts
     */
    [[nodiscard]] auto is_consistent() const -> bool;
};

/**
 * @brief Resume store configuration
 */
struct resume_store_config {
    /// States not updated for this long are discarded
    std::chrono::hours max_age{24 * 7};
};

/**
 * @brief Loads, validates and atomically persists resume states
 */
class resume_store {
public:
    explicit resume_store(resume_store_config config = {});
    ~resume_store();

    resume_store(const resume_store&) = delete;
    auto operator=(const resume_store&) -> resume_store& = delete;

    [[nodiscard]] static auto state_path(const std::filesystem::path& local_path,
                                         transfer_direction direction) -> std::filesystem::path;

    /**
     * @brief Persist @p state via a temporary file and rename
     *
     * last_update is stamped with the current time.
     */
    [[nodiscard]] auto save(const resume_state& state) -> result<void>;

    /**
     * @return file_not_found when no state exists, resume_state_invalid when it cannot be parsed
     */
    [[nodiscard]] auto load(const std::filesystem::path& local_path,
                            transfer_direction direction) -> result<resume_state>;

    [[nodiscard]] auto remove(const std::filesystem::path& local_path,
                              transfer_direction direction) -> result<void>;

    [[nodiscard]] auto exists(const std::filesystem::path& local_path,
                              transfer_direction direction) const -> bool;

    /**
     * @brief Check a loaded upload state against the file about to be sent
     */
    [[nodiscard]] auto validate_upload(const resume_state& state,
                                       const std::filesystem::path& local_path,
                                       uint64_t plain_size) const -> result<void>;

    /**
     * @brief Check a loaded download state against the remote object
     *
     * A changed ETag means the remote object was replaced and the partial
     * download must restart from byte zero.
     */
    [[nodiscard]] auto validate_download(const resume_state& state,
                                         const std::filesystem::path& local_path,
                                         uint64_t plain_size,
                                         std::string_view etag) const -> result<void>;

    /**
     * @brief Delete resume files in @p directory older than max_age or unreadable
     * @return Number of files removed
     */
    [[nodiscard]] auto purge_stale(const std::filesystem::path& directory) -> std::size_t;

    [[nodiscard]] static auto serialize(const resume_state& state) -> std::string;

    [[nodiscard]] static auto parse(std::string_view json) -> result<resume_state>;

    [[nodiscard]] auto config() const -> const resume_store_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_RESUME_STORE_H
