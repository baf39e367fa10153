/**
 * @file checksum.h
 * @brief Digest utilities for end-to-end integrity verification
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_CHECKSUM_H
#define KCENON_RESILIENT_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/resilient_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::resilient_transfer {

/**
 * @brief Supported digest algorithms
 */
enum class digest_algorithm {
    sha256,
    sha512,
};

[[nodiscard]] constexpr auto to_string(digest_algorithm algo) -> const char* {
    return algo == digest_algorithm::sha256 ? "SHA-256" : "SHA-512";
}

/**
 * @brief Streaming digest computed while data is read or written
 *
 * The download path feeds plaintext into a hasher as it writes so the
 * checksum needs no second pass over the file.
 */
class incremental_hasher {
public:
    explicit incremental_hasher(digest_algorithm algo = digest_algorithm::sha512);
    ~incremental_hasher();

    incremental_hasher(const incremental_hasher&) = delete;
    incremental_hasher& operator=(const incremental_hasher&) = delete;
    incremental_hasher(incremental_hasher&&) noexcept;
    incremental_hasher& operator=(incremental_hasher&&) noexcept;

    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish and return the lowercase hex digest
     *
     * The hasher cannot be updated afterwards until reset().
     */
    [[nodiscard]] auto finalize() -> result<std::string>;

    [[nodiscard]] auto reset() -> result<void>;

    [[nodiscard]] auto bytes_processed() const noexcept -> uint64_t;

    [[nodiscard]] auto algorithm() const noexcept -> digest_algorithm;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief One-shot digest helpers
 */
class checksum {
public:
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    [[nodiscard]] static auto sha512(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Digest of a whole file, read in fixed-size blocks
     */
    [[nodiscard]] static auto hash_file(const std::filesystem::path& path,
                                        digest_algorithm algo = digest_algorithm::sha512)
        -> result<std::string>;

    /**
     * @brief Case-insensitive comparison of two hex digests
     */
    [[nodiscard]] static auto equals(std::string_view a, std::string_view b) noexcept -> bool;

    [[nodiscard]] static auto to_hex(std::span<const std::byte> data) -> std::string;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_CHECKSUM_H
