/**
 * @file storage_backend.h
 * @brief Remote object storage protocol used by the transfer engine
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_STORAGE_BACKEND_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_STORAGE_BACKEND_H

#include "kcenon/resilient_transfer/cloud/credential_types.h"
#include "kcenon/resilient_transfer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::resilient_transfer {

using metadata_map = std::map<std::string, std::string>;

/**
 * @brief Object metadata names written on commit
 */
struct metadata_keys {
    static constexpr std::string_view plain_size = "rt-plain-size";
    static constexpr std::string_view part_size = "rt-part-size";
    static constexpr std::string_view part_count = "rt-part-count";
    static constexpr std::string_view checksum = "rt-checksum";
    static constexpr std::string_view checksum_algorithm = "rt-checksum-algorithm";
    static constexpr std::string_view file_id = "rt-file-id";
    static constexpr std::string_view cipher = "rt-cipher";
};

inline constexpr std::string_view cipher_identifier = "aes-256-cbc-hkdf-sha256";

/**
 * @brief Server acknowledgement of one uploaded part
 */
struct part_receipt {
    uint32_t part_number = 0;
    std::string etag;
    uint64_t size = 0;
};

/**
 * @brief Result of a head, put or complete call
 */
struct object_info {
    std::string key;
    uint64_t size = 0;
    std::string etag;
    metadata_map metadata;

    [[nodiscard]] auto find_metadata(std::string_view name) const -> std::optional<std::string> {
        auto it = metadata.find(std::string(name));
        if (it == metadata.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * @brief Object storage operations
 *
 * Implementations report failures with the engine's error taxonomy so the
 * retry executor can classify them: transient_network / connection_* /
 * server_error for retryable faults, throttled (with retry_after when the
 * server sent one) for rate limiting, auth_expired when the lease was
 * rejected, object_not_found for missing keys.
 */
class storage_backend {
public:
    virtual ~storage_backend() = default;

    /**
     * @return session (upload) id
     */
    [[nodiscard]] virtual auto create_multipart(const credential_lease& lease,
                                                const std::string& key) -> result<std::string> = 0;

    [[nodiscard]] virtual auto upload_part(const credential_lease& lease,
                                           const std::string& key,
                                           const std::string& upload_id,
                                           uint32_t part_number,
                                           std::span<const std::byte> data)
        -> result<part_receipt> = 0;

    /**
     * @brief Parts the server holds for a session, in any order
     *
     * Fails with object_not_found when the session no longer exists.
     */
    [[nodiscard]] virtual auto list_parts(const credential_lease& lease,
                                          const std::string& key,
                                          const std::string& upload_id)
        -> result<std::vector<part_receipt>> = 0;

    /**
     * @param parts receipts ordered by part number
     */
    [[nodiscard]] virtual auto complete_multipart(const credential_lease& lease,
                                                  const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<part_receipt>& parts,
                                                  const metadata_map& metadata)
        -> result<object_info> = 0;

    [[nodiscard]] virtual auto abort_multipart(const credential_lease& lease,
                                               const std::string& key,
                                               const std::string& upload_id) -> result<void> = 0;

    /**
     * @brief Single-shot upload of a whole file
     */
    [[nodiscard]] virtual auto put_object(const credential_lease& lease,
                                          const std::string& key,
                                          const std::filesystem::path& source,
                                          const metadata_map& metadata) -> result<object_info> = 0;

    [[nodiscard]] virtual auto head_object(const credential_lease& lease,
                                           const std::string& key) -> result<object_info> = 0;

    /**
     * @brief Read [offset, offset + length) of an object
     */
    [[nodiscard]] virtual auto read_range(const credential_lease& lease,
                                          const std::string& key,
                                          uint64_t offset,
                                          uint64_t length) -> result<std::vector<std::byte>> = 0;

    [[nodiscard]] virtual auto list_objects(const credential_lease& lease,
                                            const std::string& prefix)
        -> result<std::vector<object_info>> = 0;

    /**
     * @brief Remove a committed object and its metadata
     *
     * Fails with object_not_found when nothing is stored under @p key.
     */
    [[nodiscard]] virtual auto delete_object(const credential_lease& lease,
                                             const std::string& key) -> result<void> = 0;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_STORAGE_BACKEND_H
