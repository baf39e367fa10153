/**
 * @file checksum.cpp
 * @brief OpenSSL EVP digest implementation
 */

#include "kcenon/resilient_transfer/core/checksum.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <vector>

namespace kcenon::resilient_transfer {

namespace {

constexpr std::size_t file_read_block = 1024 * 1024;

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

auto evp_for(digest_algorithm algo) -> const EVP_MD* {
    return algo == digest_algorithm::sha256 ? EVP_sha256() : EVP_sha512();
}

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto one_shot(digest_algorithm algo, std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, evp_for(algo), nullptr) != 1) {
        return {};
    }
    return checksum::to_hex(std::as_bytes(std::span(digest.data(), len)));
}

}  // namespace

class incremental_hasher::impl {
public:
    explicit impl(digest_algorithm algo) : algo_(algo), ctx_(EVP_MD_CTX_new()) {
        if (ctx_) {
            ready_ = EVP_DigestInit_ex(ctx_.get(), evp_for(algo_), nullptr) == 1;
        }
    }

    auto update(std::span<const std::byte> data) -> result<void> {
        if (!ready_) {
            return unexpected(error(error_code::internal_error,
                                    "digest context not initialized: " + get_openssl_error()));
        }
        if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            return unexpected(error(error_code::internal_error, get_openssl_error()));
        }
        processed_ += data.size();
        return {};
    }

    auto finalize() -> result<std::string> {
        if (!ready_) {
            return unexpected(error(error_code::internal_error, "digest already finalized"));
        }
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1) {
            return unexpected(error(error_code::internal_error, get_openssl_error()));
        }
        ready_ = false;
        return checksum::to_hex(std::as_bytes(std::span(digest.data(), len)));
    }

    auto reset() -> result<void> {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), evp_for(algo_), nullptr) != 1) {
            return unexpected(error(error_code::internal_error, get_openssl_error()));
        }
        ready_ = true;
        processed_ = 0;
        return {};
    }

    digest_algorithm algo_;
    md_ctx_ptr ctx_;
    bool ready_ = false;
    uint64_t processed_ = 0;
};

incremental_hasher::incremental_hasher(digest_algorithm algo)
    : impl_(std::make_unique<impl>(algo)) {}

incremental_hasher::~incremental_hasher() = default;
incremental_hasher::incremental_hasher(incremental_hasher&&) noexcept = default;
incremental_hasher& incremental_hasher::operator=(incremental_hasher&&) noexcept = default;

auto incremental_hasher::update(std::span<const std::byte> data) -> result<void> {
    return impl_->update(data);
}

auto incremental_hasher::finalize() -> result<std::string> {
    return impl_->finalize();
}

auto incremental_hasher::reset() -> result<void> {
    return impl_->reset();
}

auto incremental_hasher::bytes_processed() const noexcept -> uint64_t {
    return impl_->processed_;
}

auto incremental_hasher::algorithm() const noexcept -> digest_algorithm {
    return impl_->algo_;
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    return one_shot(digest_algorithm::sha256, data);
}

auto checksum::sha512(std::span<const std::byte> data) -> std::string {
    return one_shot(digest_algorithm::sha512, data);
}

auto checksum::hash_file(const std::filesystem::path& path, digest_algorithm algo)
    -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::file_read_error,
                                "cannot open file for hashing: " + path.string()));
    }

    incremental_hasher hasher(algo);
    std::vector<std::byte> buffer(file_read_block);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<std::size_t>(file.gcount());
        if (got == 0) {
            break;
        }
        if (auto r = hasher.update(std::span(buffer.data(), got)); !r) {
            return unexpected(r.error());
        }
    }
    if (file.bad()) {
        return unexpected(error(error_code::file_read_error,
                                "read failed while hashing: " + path.string()));
    }
    return hasher.finalize();
}

auto checksum::equals(std::string_view a, std::string_view b) noexcept -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

auto checksum::to_hex(std::span<const std::byte> data) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        const auto v = static_cast<unsigned char>(b);
        out += digits[v >> 4];
        out += digits[v & 0x0F];
    }
    return out;
}

}  // namespace kcenon::resilient_transfer
