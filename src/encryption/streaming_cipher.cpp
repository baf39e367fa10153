/**
 * @file streaming_cipher.cpp
 * @brief AES-256-CBC part cipher and HKDF key derivation (OpenSSL 3)
 */

#include "kcenon/resilient_transfer/encryption/streaming_cipher.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <fstream>

namespace kcenon::resilient_transfer {

namespace {

constexpr char file_key_info[] = "resilient-transfer file key";

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 */
class evp_cipher_ctx_wrapper {
public:
    evp_cipher_ctx_wrapper() : ctx_(EVP_CIPHER_CTX_new()) {}

    ~evp_cipher_ctx_wrapper() {
        if (ctx_) {
            EVP_CIPHER_CTX_free(ctx_);
        }
    }

    evp_cipher_ctx_wrapper(const evp_cipher_ctx_wrapper&) = delete;
    auto operator=(const evp_cipher_ctx_wrapper&) -> evp_cipher_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_CIPHER_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_;
};

/**
 * @brief RAII wrapper for EVP_KDF_CTX
 */
class evp_kdf_ctx_wrapper {
public:
    explicit evp_kdf_ctx_wrapper(const char* algorithm) {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, algorithm, nullptr);
        if (kdf) {
            ctx_ = EVP_KDF_CTX_new(kdf);
            EVP_KDF_free(kdf);
        }
    }

    ~evp_kdf_ctx_wrapper() {
        if (ctx_) {
            EVP_KDF_CTX_free(ctx_);
        }
    }

    evp_kdf_ctx_wrapper(const evp_kdf_ctx_wrapper&) = delete;
    auto operator=(const evp_kdf_ctx_wrapper&) -> evp_kdf_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_KDF_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_KDF_CTX* ctx_ = nullptr;
};

auto hkdf_sha256(std::span<const std::byte> key,
                 std::span<const std::byte> salt,
                 std::span<const std::byte> info,
                 std::span<std::byte> output) -> result<void> {
    evp_kdf_ctx_wrapper ctx("HKDF");
    if (!ctx) {
        return unexpected(error(error_code::cipher_error,
                                "HKDF unavailable: " + get_openssl_error()));
    }

    char digest[] = "SHA256";
    std::array<OSSL_PARAM, 5> params{};
    std::size_t n = 0;
    params[n++] = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest, 0);
    params[n++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<std::byte*>(key.data()), key.size());
    if (!salt.empty()) {
        params[n++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<std::byte*>(salt.data()), salt.size());
    }
    params[n++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_INFO, const_cast<std::byte*>(info.data()), info.size());
    params[n] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(ctx.get(), reinterpret_cast<unsigned char*>(output.data()), output.size(),
                       params.data()) != 1) {
        return unexpected(error(error_code::cipher_error,
                                "HKDF derivation failed: " + get_openssl_error()));
    }
    return {};
}

/**
 * @brief Shared state of part_encryptor and part_decryptor
 */
class cipher_stream {
public:
    cipher_stream(bool encrypting, std::size_t window)
        : encrypting_(encrypting), window_(std::max<std::size_t>(window, cipher_block_size)) {}

    auto init(const part_key_material& material) -> result<void> {
        if (!ctx_) {
            return unexpected(error(error_code::cipher_error,
                                    "failed to create cipher context: " + get_openssl_error()));
        }
        const auto* key = reinterpret_cast<const unsigned char*>(material.key.data());
        const auto* iv = reinterpret_cast<const unsigned char*>(material.iv.data());
        if (EVP_CipherInit_ex(ctx_.get(), EVP_aes_256_cbc(), nullptr, key, iv,
                              encrypting_ ? 1 : 0) != 1) {
            return unexpected(error(error_code::cipher_error, get_openssl_error()));
        }
        EVP_CIPHER_CTX_set_padding(ctx_.get(), 1);
        return {};
    }

    auto update(std::span<const std::byte> input, byte_buffer& output) -> result<void> {
        if (finalized_) {
            return unexpected(error(error_code::cipher_error, "cipher already finalized"));
        }
        std::size_t offset = 0;
        while (offset < input.size()) {
            const auto take = std::min(window_, input.size() - offset);
            const auto base = output.size();
            output.resize(base + take + cipher_block_size);

            int written = 0;
            if (EVP_CipherUpdate(ctx_.get(),
                                 reinterpret_cast<unsigned char*>(output.data() + base),
                                 &written,
                                 reinterpret_cast<const unsigned char*>(input.data() + offset),
                                 static_cast<int>(take)) != 1) {
                output.resize(base);
                return unexpected(error(error_code::cipher_error, get_openssl_error()));
            }
            output.resize(base + static_cast<std::size_t>(written));
            offset += take;
        }
        return {};
    }

    auto finalize(byte_buffer& output) -> result<void> {
        if (finalized_) {
            return unexpected(error(error_code::cipher_error, "cipher already finalized"));
        }
        finalized_ = true;

        const auto base = output.size();
        output.resize(base + cipher_block_size);
        int written = 0;
        if (EVP_CipherFinal_ex(ctx_.get(), reinterpret_cast<unsigned char*>(output.data() + base),
                               &written) != 1) {
            output.resize(base);
            ERR_clear_error();
            return unexpected(error(error_code::cipher_error,
                                    encrypting_ ? "encryption finalization failed"
                                                : "invalid padding in decrypted part"));
        }
        output.resize(base + static_cast<std::size_t>(written));
        return {};
    }

    auto window() const -> std::size_t { return window_; }

private:
    evp_cipher_ctx_wrapper ctx_;
    bool encrypting_;
    std::size_t window_;
    bool finalized_ = false;
};

auto transform_file(const part_key_material& material,
                    const std::filesystem::path& input,
                    const std::filesystem::path& output,
                    bool encrypting,
                    incremental_hasher* hasher,
                    std::size_t window) -> result<uint64_t> {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        return unexpected(error(error_code::file_read_error, "cannot open " + input.string()));
    }
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected(error(error_code::file_write_error, "cannot create " + output.string()));
    }

    cipher_stream stream(encrypting, window);
    if (auto r = stream.init(material); !r) {
        return unexpected(r.error());
    }

    byte_buffer in_buf(stream.window());
    byte_buffer out_buf;
    out_buf.reserve(stream.window() + cipher_block_size);
    uint64_t written = 0;

    auto emit = [&](const byte_buffer& data) -> result<void> {
        if (data.empty()) {
            return {};
        }
        if (hasher != nullptr) {
            if (auto h = hasher->update(data); !h) {
                return h;
            }
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            return unexpected(error(error_code::file_write_error,
                                    "write failed: " + output.string()));
        }
        written += data.size();
        return {};
    };

    while (in) {
        in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        out_buf.clear();
        if (auto r = stream.update(std::span(in_buf.data(), got), out_buf); !r) {
            return unexpected(r.error());
        }
        if (auto r = emit(out_buf); !r) {
            return unexpected(r.error());
        }
    }
    if (in.bad()) {
        return unexpected(error(error_code::file_read_error, "read failed: " + input.string()));
    }

    out_buf.clear();
    if (auto r = stream.finalize(out_buf); !r) {
        return unexpected(r.error());
    }
    if (auto r = emit(out_buf); !r) {
        return unexpected(r.error());
    }

    out.flush();
    if (!out) {
        return unexpected(error(error_code::file_write_error, "flush failed: " + output.string()));
    }
    return written;
}

}  // namespace

auto derive_file_key(std::span<const std::byte> master_secret,
                     std::span<const std::byte> file_id) -> result<byte_buffer> {
    if (master_secret.empty()) {
        return unexpected(error(error_code::invalid_configuration, "master secret is empty"));
    }
    byte_buffer key(cipher_key_size);
    const auto info = std::as_bytes(std::span(file_key_info, sizeof(file_key_info) - 1));
    if (auto r = hkdf_sha256(master_secret, file_id, info, key); !r) {
        return unexpected(r.error());
    }
    return key;
}

auto derive_part_material(std::span<const std::byte> file_key,
                          std::span<const std::byte> file_id,
                          uint64_t part_index) -> result<part_key_material> {
    if (file_key.size() != cipher_key_size) {
        return unexpected(error(error_code::cipher_error, "file key must be 32 bytes"));
    }

    byte_buffer info(file_id.begin(), file_id.end());
    for (int i = 0; i < 8; ++i) {
        info.push_back(static_cast<std::byte>((part_index >> (8 * i)) & 0xFF));
    }

    std::array<std::byte, cipher_key_size + cipher_iv_size> okm{};
    if (auto r = hkdf_sha256(file_key, {}, info, okm); !r) {
        return unexpected(r.error());
    }

    part_key_material material;
    std::copy_n(okm.begin(), cipher_key_size, material.key.begin());
    std::copy_n(okm.begin() + cipher_key_size, cipher_iv_size, material.iv.begin());
    secure_zero(okm);
    return material;
}

// ============================================================================
// part_encryptor
// ============================================================================

class part_encryptor::impl : public cipher_stream {
public:
    explicit impl(std::size_t window) : cipher_stream(true, window) {}
};

part_encryptor::part_encryptor(std::unique_ptr<impl> state) : impl_(std::move(state)) {}
part_encryptor::~part_encryptor() = default;
part_encryptor::part_encryptor(part_encryptor&&) noexcept = default;
auto part_encryptor::operator=(part_encryptor&&) noexcept -> part_encryptor& = default;

auto part_encryptor::create(const part_key_material& material, std::size_t window)
    -> result<part_encryptor> {
    auto state = std::make_unique<impl>(window);
    if (auto r = state->init(material); !r) {
        return unexpected(r.error());
    }
    return part_encryptor(std::move(state));
}

auto part_encryptor::update(std::span<const std::byte> input, byte_buffer& output)
    -> result<void> {
    return impl_->update(input, output);
}

auto part_encryptor::finalize(byte_buffer& output) -> result<void> {
    return impl_->finalize(output);
}

// ============================================================================
// part_decryptor
// ============================================================================

class part_decryptor::impl : public cipher_stream {
public:
    explicit impl(std::size_t window) : cipher_stream(false, window) {}
};

part_decryptor::part_decryptor(std::unique_ptr<impl> state) : impl_(std::move(state)) {}
part_decryptor::~part_decryptor() = default;
part_decryptor::part_decryptor(part_decryptor&&) noexcept = default;
auto part_decryptor::operator=(part_decryptor&&) noexcept -> part_decryptor& = default;

auto part_decryptor::create(const part_key_material& material, std::size_t window)
    -> result<part_decryptor> {
    auto state = std::make_unique<impl>(window);
    if (auto r = state->init(material); !r) {
        return unexpected(r.error());
    }
    return part_decryptor(std::move(state));
}

auto part_decryptor::update(std::span<const std::byte> input, byte_buffer& output)
    -> result<void> {
    return impl_->update(input, output);
}

auto part_decryptor::finalize(byte_buffer& output) -> result<void> {
    return impl_->finalize(output);
}

// ============================================================================
// Convenience helpers
// ============================================================================

auto encrypt_part(const part_key_material& material,
                  std::span<const std::byte> plaintext,
                  std::size_t window) -> result<byte_buffer> {
    auto enc = part_encryptor::create(material, window);
    if (!enc) {
        return unexpected(enc.error());
    }
    byte_buffer out;
    out.reserve(static_cast<std::size_t>(encrypted_size(plaintext.size())));
    if (auto r = enc.value().update(plaintext, out); !r) {
        return unexpected(r.error());
    }
    if (auto r = enc.value().finalize(out); !r) {
        return unexpected(r.error());
    }
    return out;
}

auto decrypt_part(const part_key_material& material,
                  std::span<const std::byte> ciphertext,
                  std::size_t window) -> result<byte_buffer> {
    if (ciphertext.empty() || ciphertext.size() % cipher_block_size != 0) {
        return unexpected(error(error_code::cipher_error,
                                "ciphertext length " + std::to_string(ciphertext.size()) +
                                    " is not a positive multiple of the block size"));
    }
    auto dec = part_decryptor::create(material, window);
    if (!dec) {
        return unexpected(dec.error());
    }
    byte_buffer out;
    out.reserve(ciphertext.size());
    if (auto r = dec.value().update(ciphertext, out); !r) {
        return unexpected(r.error());
    }
    if (auto r = dec.value().finalize(out); !r) {
        return unexpected(r.error());
    }
    return out;
}

auto encrypt_file(const part_key_material& material,
                  const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  std::size_t window) -> result<uint64_t> {
    auto written = transform_file(material, input, output, true, nullptr, window);
    if (written) {
        RT_LOG_DEBUG(log_category::cipher, "Encrypted " + input.filename().string() + " (" +
                                               std::to_string(written.value()) + " bytes)");
    }
    return written;
}

auto decrypt_file(const part_key_material& material,
                  const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  incremental_hasher* hasher,
                  std::size_t window) -> result<uint64_t> {
    return transform_file(material, input, output, false, hasher, window);
}

auto generate_random_bytes(std::size_t count) -> result<byte_buffer> {
    byte_buffer out(count);
    if (count > 0 &&
        RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
        return unexpected(error(error_code::cipher_error,
                                "random generation failed: " + get_openssl_error()));
    }
    return out;
}

auto generate_random_suffix(std::size_t length) -> result<std::string> {
    static constexpr char alphabet[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    constexpr std::size_t alphabet_size = sizeof(alphabet) - 1;
    // Largest multiple of 62 below 256; higher bytes are rejected to avoid bias.
    constexpr unsigned accept_below = 248;

    std::string out;
    out.reserve(length);
    while (out.size() < length) {
        auto bytes = generate_random_bytes(length * 2);
        if (!bytes) {
            return unexpected(bytes.error());
        }
        for (auto b : bytes.value()) {
            const auto v = static_cast<unsigned>(b);
            if (v < accept_below) {
                out += alphabet[v % alphabet_size];
                if (out.size() == length) {
                    break;
                }
            }
        }
    }
    return out;
}

auto base64_encode(std::span<const std::byte> data) -> std::string {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                    reinterpret_cast<const unsigned char*>(data.data()),
                                    static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(std::max(len, 0)));
    return out;
}

auto base64_decode(std::string_view text) -> result<byte_buffer> {
    if (text.empty()) {
        return byte_buffer{};
    }
    if (text.size() % 4 != 0) {
        return unexpected(error(error_code::invalid_argument, "invalid base64 length"));
    }

    byte_buffer out(text.size() / 4 * 3);
    const int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                    reinterpret_cast<const unsigned char*>(text.data()),
                                    static_cast<int>(text.size()));
    if (len < 0) {
        return unexpected(error(error_code::invalid_argument, "invalid base64 data"));
    }

    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(len) - padding);
    return out;
}

auto secure_zero(std::span<std::byte> data) noexcept -> void {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

}  // namespace kcenon::resilient_transfer
