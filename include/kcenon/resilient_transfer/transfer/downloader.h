/**
 * @file downloader.h
 * @brief Resumable, decrypting download of one remote object
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_DOWNLOADER_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_DOWNLOADER_H

#include "engine_context.h"
#include "resource_allocator.h"
#include "transfer_task.h"

#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::resilient_transfer {

struct download_request {
    std::string object_key;
    std::filesystem::path local_path;
    /// Size announced by the caller; must match the object's plaintext size
    std::optional<uint64_t> declared_size;
    /// Storage holding the object; empty uses engine_config::default_storage
    std::optional<storage_context> storage;
    /// Replace an existing destination that differs from the object
    bool overwrite = false;
    transfer_priority priority = transfer_priority::normal;
    uint32_t concurrent_files = 1;
};

/**
 * @brief Layout of a stored object, read from its metadata
 */
struct object_layout {
    uint64_t plain_size = 0;
    uint64_t part_size = 0;
    uint64_t part_count = 0;
    uint64_t remote_size = 0;
    std::string checksum;
    std::string etag;
    byte_buffer file_id;

    /**
     * @brief Parse and cross-check the metadata of @p info
     * @return invalid_argument for missing or unsupported metadata,
     *         size_mismatch when the stored size cannot hold the plaintext
     */
    [[nodiscard]] static auto from_object(const object_info& info) -> result<object_layout>;
};

/**
 * @brief Downloads one object
 *
 * Ciphertext parts are fetched with ranged reads into `<file>.encrypted`
 * (progress persisted to `<file>.download.resume`), then decrypted in order
 * into `<file>.partial` while the plaintext is hashed. The partial file is
 * renamed onto the destination only after size and SHA-512 match the
 * object's metadata.
 */
class downloader {
public:
    explicit downloader(engine_context context);

    /**
     * @brief Run the download to completion, failure or cancellation
     *
     * Moves @p task to ACTIVE once data starts moving; terminal transitions
     * are left to the caller.
     */
    [[nodiscard]] auto run(transfer_task& task,
                           const download_request& request,
                           const transfer_observer& observer = {}) -> result<transfer_outcome>;

    /**
     * @brief Reject destinations that escape their directory or @p root
     *
     * @return path_invalid for an empty path or a directory, path_unsafe for
     *         `..` components or a path outside @p root
     */
    [[nodiscard]] static auto check_destination(const std::filesystem::path& local_path,
                                                const std::optional<std::filesystem::path>& root)
        -> result<void>;

    [[nodiscard]] auto context() const noexcept -> const engine_context& { return context_; }

private:
    engine_context context_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_DOWNLOADER_H
