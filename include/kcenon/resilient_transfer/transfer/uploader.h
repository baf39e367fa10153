/**
 * @file uploader.h
 * @brief Encrypting, resumable upload of one local file
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_UPLOADER_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_UPLOADER_H

#include "engine_context.h"
#include "resource_allocator.h"
#include "transfer_task.h"

#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::resilient_transfer {

struct upload_request {
    std::filesystem::path local_path;
    /// Remote destination prefix; empty uses the storage context's path base
    std::string path_base;
    /// Storage to upload to; empty uses engine_config::default_storage
    std::optional<storage_context> storage;
    transfer_priority priority = transfer_priority::normal;
    /// Transfers expected to share the thread pool with this one
    uint32_t concurrent_files = 1;
};

/**
 * @brief Uploads one file
 *
 * Files below the multipart threshold are encrypted to a temporary
 * `<file>.encrypted` artifact and sent in one call. Larger files are sent
 * as independently encrypted parts over a multipart session whose progress
 * is persisted to `<file>.upload.resume` after every part, so an interrupted
 * upload continues with the first missing part.
 *
 * @code
 * uploader up(context);
 * transfer_task task(transfer_id::generate(), descriptor);
 * auto outcome = up.run(task, {"/data/model.bin", "projects/42"});
 * @endcode
 */
class uploader {
public:
    explicit uploader(engine_context context);

    /**
     * @brief Run the upload to completion, failure or cancellation
     *
     * Moves @p task to ACTIVE once parts start moving; terminal transitions
     * are left to the caller.
     */
    [[nodiscard]] auto run(transfer_task& task,
                           const upload_request& request,
                           const transfer_observer& observer = {}) -> result<transfer_outcome>;

    /**
     * @brief Object key for @p file_name under @p path_base
     */
    [[nodiscard]] static auto make_object_key(const std::string& path_base,
                                              const std::string& file_name,
                                              const std::string& suffix) -> std::string;

    [[nodiscard]] auto context() const noexcept -> const engine_context& { return context_; }

private:
    engine_context context_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_UPLOADER_H
