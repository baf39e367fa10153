/**
 * @file credential_types.h
 * @brief Storage contexts, credential leases and the issuing interface
 */

#ifndef KCENON_RESILIENT_TRANSFER_CLOUD_CREDENTIAL_TYPES_H
#define KCENON_RESILIENT_TRANSFER_CLOUD_CREDENTIAL_TYPES_H

#include "kcenon/resilient_transfer/core/types.h"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::resilient_transfer {

/**
 * @brief Object storage families the platform hands out leases for
 */
enum class storage_type {
    s3,
    azure_blob,
};

[[nodiscard]] constexpr auto to_string(storage_type type) -> std::string_view {
    switch (type) {
        case storage_type::s3:
            return "s3";
        case storage_type::azure_blob:
            return "azure_blob";
    }
    return "unknown";
}

[[nodiscard]] inline auto storage_type_from_string(std::string_view text)
    -> std::optional<storage_type> {
    if (text == "s3") return storage_type::s3;
    if (text == "azure_blob") return storage_type::azure_blob;
    return std::nullopt;
}

/**
 * @brief Identifies which storage (and optionally which object) a lease is for
 *
 * An empty storage_id means the account's default storage. Downloads of
 * objects on a non-default storage pass that object's own context so the
 * lease is issued for the right backend.
 */
struct storage_context {
    std::string storage_id;
    storage_type type = storage_type::s3;
    std::string bucket;
    std::string path_base;
    std::string region;
    std::optional<std::string> object_path;

    /**
     * @brief Cache key: storage id (or "default") plus ":path" for per-object leases
     */
    [[nodiscard]] auto cache_key() const -> std::string {
        std::string key = storage_id.empty() ? std::string("default") : storage_id;
        if (object_path && !object_path->empty()) {
            key += ":" + *object_path;
        }
        return key;
    }

    [[nodiscard]] auto operator==(const storage_context& other) const -> bool = default;
};

/**
 * @brief Time-bounded credential grant for one storage context
 */
struct credential_lease {
    storage_context context;
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::string sas_token;
    std::chrono::system_clock::time_point issued_at{};
    std::chrono::system_clock::time_point expires_at{};

    [[nodiscard]] auto is_expired() const -> bool {
        return std::chrono::system_clock::now() >= expires_at;
    }

    /**
     * @brief True if the lease expires within @p buffer from now
     */
    [[nodiscard]] auto expires_within(std::chrono::seconds buffer) const -> bool {
        return std::chrono::system_clock::now() + buffer >= expires_at;
    }

    [[nodiscard]] auto time_until_expiration() const -> std::chrono::seconds {
        auto remaining = expires_at - std::chrono::system_clock::now();
        if (remaining.count() <= 0) {
            return std::chrono::seconds::zero();
        }
        return std::chrono::duration_cast<std::chrono::seconds>(remaining);
    }

    [[nodiscard]] auto age() const -> std::chrono::seconds {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - issued_at);
    }

    /**
     * @brief Log-safe summary without secrets
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string out = std::string(to_string(context.type)) + " lease for " + context.cache_key();
        if (!access_key_id.empty()) {
            out += " (key " + access_key_id.substr(0, std::min<std::size_t>(4, access_key_id.size())) +
                   "...)";
        }
        out += ", expires in " + std::to_string(time_until_expiration().count()) + "s";
        return out;
    }
};

/**
 * @brief Issues leases; implemented by the platform API client
 */
class credential_source {
public:
    virtual ~credential_source() = default;

    /**
     * @brief Request a new lease for @p context
     *
     * Errors should use the engine taxonomy: network and throttling errors are
     * retried by the credential manager, auth errors are surfaced.
     */
    [[nodiscard]] virtual auto fetch(const storage_context& context) -> result<credential_lease> = 0;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CLOUD_CREDENTIAL_TYPES_H
