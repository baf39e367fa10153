/**
 * @file streaming_cipher.h
 * @brief Per-part AES-256-CBC encryption over bounded windows
 *
 * Each part of a file is encrypted independently with key material derived
 * from a per-file key and the part index, so parts can be produced and
 * consumed in any order. Every part carries its own PKCS7 padding (1 to 16
 * bytes); a part of P plaintext bytes becomes P + 16 - P % 16 bytes.
 *
 * Input is processed in windows of at most cipher_window bytes, so cipher
 * working memory never depends on the part or file size.
 */

#ifndef KCENON_RESILIENT_TRANSFER_ENCRYPTION_STREAMING_CIPHER_H
#define KCENON_RESILIENT_TRANSFER_ENCRYPTION_STREAMING_CIPHER_H

#include "kcenon/resilient_transfer/core/checksum.h"
#include "kcenon/resilient_transfer/core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::resilient_transfer {

inline constexpr std::size_t cipher_block_size = 16;
inline constexpr std::size_t cipher_key_size = 32;
inline constexpr std::size_t cipher_iv_size = 16;
inline constexpr std::size_t file_id_size = 16;
inline constexpr std::size_t default_cipher_window = 16 * 1024;

using byte_buffer = std::vector<std::byte>;

/**
 * @brief Key and IV for one part
 */
struct part_key_material {
    std::array<std::byte, cipher_key_size> key{};
    std::array<std::byte, cipher_iv_size> iv{};
};

/**
 * @brief Inclusive range of acceptable sizes
 */
struct size_range {
    uint64_t min = 0;
    uint64_t max = 0;

    [[nodiscard]] constexpr auto contains(uint64_t value) const noexcept -> bool {
        return value >= min && value <= max;
    }
};

/**
 * @brief Ciphertext size of one padded part
 */
[[nodiscard]] constexpr auto encrypted_size(uint64_t plain_size) noexcept -> uint64_t {
    return plain_size + cipher_block_size - plain_size % cipher_block_size;
}

/**
 * @brief Number of parts a payload is split into (at least one)
 */
[[nodiscard]] constexpr auto part_count(uint64_t plain_size, uint64_t part_size) noexcept
    -> uint64_t {
    if (part_size == 0 || plain_size == 0) {
        return 1;
    }
    return (plain_size + part_size - 1) / part_size;
}

/**
 * @brief Acceptable total ciphertext sizes for an n-part object
 *
 * Each of the n parts adds 1 to 16 bytes of padding; with a part size that
 * is a multiple of 16 every full part adds exactly 16, so the range is
 * [S + 16(n-1) + 1, S + 16n].
 */
[[nodiscard]] constexpr auto encrypted_size_bounds(uint64_t plain_size, uint64_t part_size) noexcept
    -> size_range {
    const auto n = part_count(plain_size, part_size);
    return {plain_size + cipher_block_size * (n - 1) + 1, plain_size + cipher_block_size * n};
}

/**
 * @brief Whole-object padding check: [S+1, S+16]
 */
[[nodiscard]] constexpr auto is_valid_encrypted_size(uint64_t plain_size,
                                                     uint64_t encrypted) noexcept -> bool {
    return encrypted >= plain_size + 1 && encrypted <= plain_size + cipher_block_size;
}

/**
 * @brief Offset of part @p index inside the concatenated ciphertext
 *
 * Valid when part_size is a multiple of the block size.
 */
[[nodiscard]] constexpr auto encrypted_part_offset(uint64_t index, uint64_t part_size) noexcept
    -> uint64_t {
    return index * (part_size + cipher_block_size);
}

/**
 * @brief Per-file key: HKDF-SHA256(master secret, salt = file id)
 */
[[nodiscard]] auto derive_file_key(std::span<const std::byte> master_secret,
                                   std::span<const std::byte> file_id) -> result<byte_buffer>;

/**
 * @brief Per-part key and IV: HKDF-SHA256(file key, info = file id || LE64(index))
 */
[[nodiscard]] auto derive_part_material(std::span<const std::byte> file_key,
                                        std::span<const std::byte> file_id,
                                        uint64_t part_index) -> result<part_key_material>;

/**
 * @brief Incremental encryptor for one part
 *
 * @code
 * auto enc = part_encryptor::create(material);
 * byte_buffer out;
 * enc.value().update(chunk_a, out);
 * enc.value().update(chunk_b, out);
 * enc.value().finalize(out);  // appends the PKCS7 block
 * @endcode
 */
class part_encryptor {
public:
    [[nodiscard]] static auto create(const part_key_material& material,
                                     std::size_t window = default_cipher_window)
        -> result<part_encryptor>;

    ~part_encryptor();
    part_encryptor(part_encryptor&&) noexcept;
    auto operator=(part_encryptor&&) noexcept -> part_encryptor&;
    part_encryptor(const part_encryptor&) = delete;
    auto operator=(const part_encryptor&) -> part_encryptor& = delete;

    /**
     * @brief Encrypt @p input and append ciphertext to @p output
     */
    [[nodiscard]] auto update(std::span<const std::byte> input, byte_buffer& output)
        -> result<void>;

    [[nodiscard]] auto finalize(byte_buffer& output) -> result<void>;

private:
    class impl;
    explicit part_encryptor(std::unique_ptr<impl> state);
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Incremental decryptor for one part
 *
 * finalize() fails with cipher_error when the padding is invalid.
 */
class part_decryptor {
public:
    [[nodiscard]] static auto create(const part_key_material& material,
                                     std::size_t window = default_cipher_window)
        -> result<part_decryptor>;

    ~part_decryptor();
    part_decryptor(part_decryptor&&) noexcept;
    auto operator=(part_decryptor&&) noexcept -> part_decryptor&;
    part_decryptor(const part_decryptor&) = delete;
    auto operator=(const part_decryptor&) -> part_decryptor& = delete;

    [[nodiscard]] auto update(std::span<const std::byte> input, byte_buffer& output)
        -> result<void>;

    [[nodiscard]] auto finalize(byte_buffer& output) -> result<void>;

private:
    class impl;
    explicit part_decryptor(std::unique_ptr<impl> state);
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto encrypt_part(const part_key_material& material,
                                std::span<const std::byte> plaintext,
                                std::size_t window = default_cipher_window) -> result<byte_buffer>;

[[nodiscard]] auto decrypt_part(const part_key_material& material,
                                std::span<const std::byte> ciphertext,
                                std::size_t window = default_cipher_window) -> result<byte_buffer>;

/**
 * @brief Encrypt a whole file as a single part
 * @return ciphertext bytes written
 */
[[nodiscard]] auto encrypt_file(const part_key_material& material,
                                const std::filesystem::path& input,
                                const std::filesystem::path& output,
                                std::size_t window = default_cipher_window) -> result<uint64_t>;

/**
 * @brief Decrypt a single-part file, optionally hashing the plaintext written
 * @return plaintext bytes written
 */
[[nodiscard]] auto decrypt_file(const part_key_material& material,
                                const std::filesystem::path& input,
                                const std::filesystem::path& output,
                                incremental_hasher* hasher = nullptr,
                                std::size_t window = default_cipher_window) -> result<uint64_t>;

[[nodiscard]] auto generate_random_bytes(std::size_t count) -> result<byte_buffer>;

/**
 * @brief Random alphanumeric string used to make object keys unique
 */
[[nodiscard]] auto generate_random_suffix(std::size_t length = 12) -> result<std::string>;

[[nodiscard]] auto base64_encode(std::span<const std::byte> data) -> std::string;

[[nodiscard]] auto base64_decode(std::string_view text) -> result<byte_buffer>;

/**
 * @brief Overwrite key material before release
 */
auto secure_zero(std::span<std::byte> data) noexcept -> void;

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_ENCRYPTION_STREAMING_CIPHER_H
