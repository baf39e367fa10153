/**
 * @file cipher_benchmark.cpp
 * @brief Benchmarks for part encryption, key derivation and checksums
 */

#include <benchmark/benchmark.h>

#include <kcenon/resilient_transfer/core/checksum.h>
#include <kcenon/resilient_transfer/encryption/streaming_cipher.h>

#include <algorithm>
#include <cstddef>
#include <random>
#include <vector>

namespace kcenon::resilient_transfer::benchmark {

namespace {

auto generate_data(std::size_t size, uint32_t seed) -> byte_buffer {
    byte_buffer data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

class cipher_benchmark_fixture {
public:
    cipher_benchmark_fixture()
        : master_secret_(generate_data(32, 7)), file_id_(generate_data(file_id_size, 8)) {
        auto file_key = derive_file_key(master_secret_, file_id_);
        if (file_key) {
            file_key_ = std::move(file_key.value());
            auto material = derive_part_material(file_key_, file_id_, 0);
            if (material) {
                material_ = material.value();
                ready_ = true;
            }
        }
    }

    [[nodiscard]] auto ready() const -> bool { return ready_; }
    [[nodiscard]] auto material() const -> const part_key_material& { return material_; }
    [[nodiscard]] auto master_secret() const -> const byte_buffer& { return master_secret_; }
    [[nodiscard]] auto file_id() const -> const byte_buffer& { return file_id_; }
    [[nodiscard]] auto file_key() const -> const byte_buffer& { return file_key_; }

private:
    byte_buffer master_secret_;
    byte_buffer file_id_;
    byte_buffer file_key_;
    part_key_material material_;
    bool ready_ = false;
};

auto get_fixture() -> cipher_benchmark_fixture& {
    static cipher_benchmark_fixture fixture;
    return fixture;
}

}  // namespace

// ============================================================================
// Part encryption
// ============================================================================

static void BM_EncryptPart(::benchmark::State& state) {
    auto& fixture = get_fixture();
    if (!fixture.ready()) {
        state.SkipWithError("Key derivation failed");
        return;
    }

    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto plaintext = generate_data(data_size, 42);

    for (auto _ : state) {
        auto result = encrypt_part(fixture.material(), plaintext);
        if (!result) {
            state.SkipWithError("Encryption failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_DecryptPart(::benchmark::State& state) {
    auto& fixture = get_fixture();
    if (!fixture.ready()) {
        state.SkipWithError("Key derivation failed");
        return;
    }

    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto plaintext = generate_data(data_size, 42);
    auto ciphertext = encrypt_part(fixture.material(), plaintext);
    if (!ciphertext) {
        state.SkipWithError("Failed to prepare ciphertext");
        return;
    }

    for (auto _ : state) {
        auto result = decrypt_part(fixture.material(), ciphertext.value());
        if (!result) {
            state.SkipWithError("Decryption failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Streaming encryption with a varying cipher window
 *
 * Input is fed in window-sized slices, the way the uploader reads files.
 */
static void BM_EncryptWindow(::benchmark::State& state) {
    auto& fixture = get_fixture();
    if (!fixture.ready()) {
        state.SkipWithError("Key derivation failed");
        return;
    }

    const std::size_t data_size = 8 * 1024 * 1024;
    const auto window = static_cast<std::size_t>(state.range(0));
    auto plaintext = generate_data(data_size, 43);
    byte_buffer out;
    out.reserve(encrypted_size(data_size));

    for (auto _ : state) {
        auto enc = part_encryptor::create(fixture.material(), window);
        if (!enc) {
            state.SkipWithError("Encryptor creation failed");
            return;
        }
        out.clear();
        for (std::size_t offset = 0; offset < data_size; offset += window) {
            const auto len = std::min(window, data_size - offset);
            if (!enc.value().update(std::span<const std::byte>(plaintext).subspan(offset, len),
                                    out)) {
                state.SkipWithError("Encryption failed");
                return;
            }
        }
        if (!enc.value().finalize(out)) {
            state.SkipWithError("Finalize failed");
            return;
        }
        ::benchmark::DoNotOptimize(out.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["window"] = ::benchmark::Counter(static_cast<double>(window));
}

// ============================================================================
// Key derivation
// ============================================================================

static void BM_DeriveFileKey(::benchmark::State& state) {
    auto& fixture = get_fixture();
    for (auto _ : state) {
        auto key = derive_file_key(fixture.master_secret(), fixture.file_id());
        if (!key) {
            state.SkipWithError("Key derivation failed");
            return;
        }
        ::benchmark::DoNotOptimize(key.value());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_DerivePartMaterial(::benchmark::State& state) {
    auto& fixture = get_fixture();
    if (!fixture.ready()) {
        state.SkipWithError("Key derivation failed");
        return;
    }
    uint64_t index = 0;
    for (auto _ : state) {
        auto material = derive_part_material(fixture.file_key(), fixture.file_id(), index++);
        if (!material) {
            state.SkipWithError("Part derivation failed");
            return;
        }
        ::benchmark::DoNotOptimize(material.value());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

// ============================================================================
// Checksums
// ============================================================================

static void BM_Sha512Incremental(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_data(data_size, 44);

    for (auto _ : state) {
        incremental_hasher hasher(digest_algorithm::sha512);
        if (!hasher.update(data)) {
            state.SkipWithError("Hash update failed");
            return;
        }
        auto digest = hasher.finalize();
        if (!digest) {
            state.SkipWithError("Hash finalize failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

// ============================================================================
// Registration
// ============================================================================

BENCHMARK(BM_EncryptPart)
    ->Arg(64 * 1024)
    ->Arg(1024 * 1024)
    ->Arg(8 * 1024 * 1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_DecryptPart)
    ->Arg(64 * 1024)
    ->Arg(1024 * 1024)
    ->Arg(8 * 1024 * 1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_EncryptWindow)
    ->Arg(4 * 1024)
    ->Arg(16 * 1024)
    ->Arg(256 * 1024)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_DeriveFileKey);
BENCHMARK(BM_DerivePartMaterial);

BENCHMARK(BM_Sha512Incremental)
    ->Arg(1024 * 1024)
    ->Arg(16 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::resilient_transfer::benchmark
