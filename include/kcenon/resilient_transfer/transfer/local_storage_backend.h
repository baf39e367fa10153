/**
 * @file local_storage_backend.h
 * @brief Directory-backed implementation of the storage protocol
 *
 * Layout under the root directory:
 * - objects/<key>          object contents
 * - meta/<key>             "name=value" metadata lines, including the ETag
 * - multipart/<upload_id>/ staged parts and the target key
 *
 * Expired leases are rejected with auth_expired, like a real object store.
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_LOCAL_STORAGE_BACKEND_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_LOCAL_STORAGE_BACKEND_H

#include "storage_backend.h"

#include <filesystem>
#include <memory>

namespace kcenon::resilient_transfer {

class local_storage_backend : public storage_backend {
public:
    /**
     * @brief Create the directory layout under @p root if needed
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root)
        -> result<std::shared_ptr<local_storage_backend>>;

    ~local_storage_backend() override;

    local_storage_backend(const local_storage_backend&) = delete;
    auto operator=(const local_storage_backend&) -> local_storage_backend& = delete;

    [[nodiscard]] auto create_multipart(const credential_lease& lease, const std::string& key)
        -> result<std::string> override;

    [[nodiscard]] auto upload_part(const credential_lease& lease,
                                   const std::string& key,
                                   const std::string& upload_id,
                                   uint32_t part_number,
                                   std::span<const std::byte> data) -> result<part_receipt> override;

    [[nodiscard]] auto list_parts(const credential_lease& lease,
                                  const std::string& key,
                                  const std::string& upload_id)
        -> result<std::vector<part_receipt>> override;

    [[nodiscard]] auto complete_multipart(const credential_lease& lease,
                                          const std::string& key,
                                          const std::string& upload_id,
                                          const std::vector<part_receipt>& parts,
                                          const metadata_map& metadata)
        -> result<object_info> override;

    [[nodiscard]] auto abort_multipart(const credential_lease& lease,
                                       const std::string& key,
                                       const std::string& upload_id) -> result<void> override;

    [[nodiscard]] auto put_object(const credential_lease& lease,
                                  const std::string& key,
                                  const std::filesystem::path& source,
                                  const metadata_map& metadata) -> result<object_info> override;

    [[nodiscard]] auto head_object(const credential_lease& lease, const std::string& key)
        -> result<object_info> override;

    [[nodiscard]] auto read_range(const credential_lease& lease,
                                  const std::string& key,
                                  uint64_t offset,
                                  uint64_t length) -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto list_objects(const credential_lease& lease, const std::string& prefix)
        -> result<std::vector<object_info>> override;

    [[nodiscard]] auto delete_object(const credential_lease& lease, const std::string& key)
        -> result<void> override;

    /**
     * @brief Replace an object's bytes outside the protocol (new ETag)
     */
    [[nodiscard]] auto overwrite_object(const std::string& key, std::span<const std::byte> data)
        -> result<object_info>;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

private:
    explicit local_storage_backend(std::filesystem::path root);

    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_LOCAL_STORAGE_BACKEND_H
