/**
 * @file test_streaming_cipher.cpp
 * @brief Unit tests for the per-part cipher, key derivation and helpers
 */

#include <gtest/gtest.h>

#include <kcenon/resilient_transfer/encryption/streaming_cipher.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace kcenon::resilient_transfer::test {

namespace {

auto random_buffer(std::size_t size, uint32_t seed = 42) -> byte_buffer {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    byte_buffer data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dist(gen));
    }
    return data;
}

auto bytes_of(std::string_view text) -> byte_buffer {
    byte_buffer out(text.size());
    std::transform(text.begin(), text.end(), out.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return out;
}

}  // namespace

class StreamingCipherTest : public ::testing::Test {
protected:
    void SetUp() override {
        master_ = bytes_of("0123456789abcdef0123456789abcdef-master");
        file_id_ = random_buffer(file_id_size, 7);

        auto key = derive_file_key(master_, file_id_);
        ASSERT_TRUE(key);
        file_key_ = key.value();

        auto material = derive_part_material(file_key_, file_id_, 0);
        ASSERT_TRUE(material);
        material_ = material.value();
    }

    byte_buffer master_;
    byte_buffer file_id_;
    byte_buffer file_key_;
    part_key_material material_;
};

// ============================================================================
// Size arithmetic
// ============================================================================

TEST_F(StreamingCipherTest, EncryptedSizeAddsOneToSixteenBytes) {
    EXPECT_EQ(encrypted_size(0), 16u);
    EXPECT_EQ(encrypted_size(1), 16u);
    EXPECT_EQ(encrypted_size(15), 16u);
    EXPECT_EQ(encrypted_size(16), 32u);
    EXPECT_EQ(encrypted_size(17), 32u);
}

TEST_F(StreamingCipherTest, PartCount) {
    EXPECT_EQ(part_count(0, 64), 1u);
    EXPECT_EQ(part_count(64, 64), 1u);
    EXPECT_EQ(part_count(65, 64), 2u);
    EXPECT_EQ(part_count(300 * 1024, 64 * 1024), 5u);
}

TEST_F(StreamingCipherTest, EncryptedSizeBoundsForParts) {
    // 5 parts: four full parts add 16 each, the last adds 1..16
    const auto bounds = encrypted_size_bounds(300 * 1024, 64 * 1024);
    EXPECT_EQ(bounds.min, 300u * 1024 + 64 + 1);
    EXPECT_EQ(bounds.max, 300u * 1024 + 80);

    const auto single = encrypted_size_bounds(100, 64 * 1024);
    EXPECT_EQ(single.min, 101u);
    EXPECT_EQ(single.max, 116u);
    EXPECT_TRUE(single.contains(encrypted_size(100)));
}

TEST_F(StreamingCipherTest, WholeObjectPaddingCheck) {
    EXPECT_TRUE(is_valid_encrypted_size(100, 101));
    EXPECT_TRUE(is_valid_encrypted_size(100, 116));
    EXPECT_FALSE(is_valid_encrypted_size(100, 100));
    EXPECT_FALSE(is_valid_encrypted_size(100, 117));
}

TEST_F(StreamingCipherTest, PartOffsets) {
    EXPECT_EQ(encrypted_part_offset(0, 64), 0u);
    EXPECT_EQ(encrypted_part_offset(3, 64), 240u);
}

// ============================================================================
// Key derivation
// ============================================================================

TEST_F(StreamingCipherTest, DerivationIsDeterministic) {
    auto again = derive_file_key(master_, file_id_);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), file_key_);
    EXPECT_EQ(file_key_.size(), cipher_key_size);

    auto material = derive_part_material(file_key_, file_id_, 0);
    ASSERT_TRUE(material);
    EXPECT_EQ(material.value().key, material_.key);
    EXPECT_EQ(material.value().iv, material_.iv);
}

TEST_F(StreamingCipherTest, DerivationSeparatesFilesAndParts) {
    auto other_file = derive_file_key(master_, random_buffer(file_id_size, 8));
    ASSERT_TRUE(other_file);
    EXPECT_NE(other_file.value(), file_key_);

    auto part_one = derive_part_material(file_key_, file_id_, 1);
    ASSERT_TRUE(part_one);
    EXPECT_NE(part_one.value().key, material_.key);
    EXPECT_NE(part_one.value().iv, material_.iv);
}

TEST_F(StreamingCipherTest, DerivationRejectsBadInput) {
    auto empty_master = derive_file_key(byte_buffer{}, file_id_);
    ASSERT_FALSE(empty_master);
    EXPECT_EQ(empty_master.error().code, error_code::invalid_configuration);

    auto short_key = derive_part_material(random_buffer(8), file_id_, 0);
    ASSERT_FALSE(short_key);
    EXPECT_EQ(short_key.error().code, error_code::cipher_error);
}

// ============================================================================
// Part cipher
// ============================================================================

TEST_F(StreamingCipherTest, PartRoundTrip) {
    for (std::size_t size : {0u, 1u, 15u, 16u, 17u, 4096u, 100000u}) {
        const auto plain = random_buffer(size, static_cast<uint32_t>(size));
        auto cipher = encrypt_part(material_, plain);
        ASSERT_TRUE(cipher);
        EXPECT_EQ(cipher.value().size(), encrypted_size(size));

        auto back = decrypt_part(material_, cipher.value());
        ASSERT_TRUE(back);
        EXPECT_EQ(back.value(), plain);
    }
}

TEST_F(StreamingCipherTest, OutputDoesNotDependOnWindow) {
    const auto plain = random_buffer(70000);
    auto small_window = encrypt_part(material_, plain, 16);
    auto default_window = encrypt_part(material_, plain);
    auto large_window = encrypt_part(material_, plain, 1 << 20);
    ASSERT_TRUE(small_window);
    ASSERT_TRUE(default_window);
    ASSERT_TRUE(large_window);

    EXPECT_EQ(small_window.value(), default_window.value());
    EXPECT_EQ(large_window.value(), default_window.value());
}

TEST_F(StreamingCipherTest, IncrementalMatchesOneShot) {
    const auto plain = random_buffer(50001);
    auto one_shot = encrypt_part(material_, plain);
    ASSERT_TRUE(one_shot);

    auto enc = part_encryptor::create(material_, 1024);
    ASSERT_TRUE(enc);
    byte_buffer out;
    const std::span<const std::byte> view(plain);
    ASSERT_TRUE(enc.value().update(view.subspan(0, 333), out));
    ASSERT_TRUE(enc.value().update(view.subspan(333, 20000), out));
    ASSERT_TRUE(enc.value().update(view.subspan(20333), out));
    ASSERT_TRUE(enc.value().finalize(out));

    EXPECT_EQ(out, one_shot.value());
    EXPECT_FALSE(enc.value().finalize(out));
}

TEST_F(StreamingCipherTest, PartsAreIndependent) {
    const auto plain = random_buffer(1000);
    auto part_two = derive_part_material(file_key_, file_id_, 2);
    ASSERT_TRUE(part_two);

    auto c0 = encrypt_part(material_, plain);
    auto c2 = encrypt_part(part_two.value(), plain);
    ASSERT_TRUE(c0);
    ASSERT_TRUE(c2);
    EXPECT_NE(c0.value(), c2.value());

    auto back = decrypt_part(part_two.value(), c2.value());
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value(), plain);
}

TEST_F(StreamingCipherTest, WrongKeyDoesNotRecoverPlaintext) {
    const auto plain = random_buffer(4096);
    auto cipher = encrypt_part(material_, plain);
    ASSERT_TRUE(cipher);

    auto other = derive_part_material(file_key_, file_id_, 9);
    ASSERT_TRUE(other);
    auto back = decrypt_part(other.value(), cipher.value());
    if (back) {
        EXPECT_NE(back.value(), plain);
    } else {
        EXPECT_EQ(back.error().code, error_code::cipher_error);
    }
}

TEST_F(StreamingCipherTest, TruncatedCiphertextIsRejected) {
    auto cipher = encrypt_part(material_, random_buffer(100));
    ASSERT_TRUE(cipher);

    auto truncated = cipher.value();
    truncated.resize(truncated.size() - 3);
    auto back = decrypt_part(material_, truncated);
    ASSERT_FALSE(back);
    EXPECT_EQ(back.error().code, error_code::cipher_error);

    auto empty = decrypt_part(material_, byte_buffer{});
    EXPECT_FALSE(empty);
}

TEST_F(StreamingCipherTest, CorruptPaddingIsRejected) {
    // A 32-byte part ends in a full padding block; flipping the last byte of
    // the block before it corrupts the final padding byte.
    auto cipher = encrypt_part(material_, random_buffer(32));
    ASSERT_TRUE(cipher);
    auto& bytes = cipher.value();
    ASSERT_EQ(bytes.size(), 48u);
    bytes[31] ^= std::byte{0x5a};

    auto back = decrypt_part(material_, bytes);
    ASSERT_FALSE(back);
    EXPECT_EQ(back.error().code, error_code::cipher_error);
}

// ============================================================================
// File cipher
// ============================================================================

class StreamingCipherFileTest : public StreamingCipherTest {
protected:
    void SetUp() override {
        StreamingCipherTest::SetUp();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("resilient_transfer_test_cipher_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::string& name, const byte_buffer& data) -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(StreamingCipherFileTest, FileRoundTripWithHash) {
    const auto plain = random_buffer(123457);
    const auto input = write_file("plain.bin", plain);
    const auto sealed = test_dir_ / "plain.bin.enc";
    const auto opened = test_dir_ / "plain.out";

    auto written = encrypt_file(material_, input, sealed, 4096);
    ASSERT_TRUE(written);
    EXPECT_EQ(written.value(), encrypted_size(plain.size()));
    EXPECT_EQ(std::filesystem::file_size(sealed), written.value());

    incremental_hasher hasher(digest_algorithm::sha512);
    auto restored = decrypt_file(material_, sealed, opened, &hasher, 4096);
    ASSERT_TRUE(restored);
    EXPECT_EQ(restored.value(), plain.size());

    auto streamed_hash = hasher.finalize();
    auto file_hash = checksum::hash_file(input, digest_algorithm::sha512);
    ASSERT_TRUE(streamed_hash);
    ASSERT_TRUE(file_hash);
    EXPECT_EQ(streamed_hash.value(), file_hash.value());
}

TEST_F(StreamingCipherFileTest, FileMatchesPartCipher) {
    const auto plain = random_buffer(5000);
    const auto input = write_file("p.bin", plain);
    const auto sealed = test_dir_ / "p.enc";
    ASSERT_TRUE(encrypt_file(material_, input, sealed));

    auto expected = encrypt_part(material_, plain);
    ASSERT_TRUE(expected);

    std::ifstream in(sealed, std::ios::binary);
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(bytes_of(raw), expected.value());
}

TEST_F(StreamingCipherFileTest, MissingInputFails) {
    auto r = encrypt_file(material_, test_dir_ / "absent.bin", test_dir_ / "out.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_read_error);
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(StreamingCipherTest, Base64) {
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes_of("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");

    auto decoded = base64_decode("Zm9vYg==");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), bytes_of("foob"));

    EXPECT_FALSE(base64_decode("abc"));
    EXPECT_FALSE(base64_decode("@@@@"));
}

TEST_F(StreamingCipherTest, RandomSuffixIsAlphanumeric) {
    auto a = generate_random_suffix();
    auto b = generate_random_suffix();
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a.value().size(), 12u);
    EXPECT_NE(a.value(), b.value());
    for (char c : a.value()) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)));
    }

    auto longer = generate_random_suffix(40);
    ASSERT_TRUE(longer);
    EXPECT_EQ(longer.value().size(), 40u);
}

TEST_F(StreamingCipherTest, SecureZero) {
    auto secret = random_buffer(64);
    secure_zero(secret);
    EXPECT_TRUE(std::all_of(secret.begin(), secret.end(),
                            [](std::byte b) { return b == std::byte{0}; }));
}

}  // namespace kcenon::resilient_transfer::test
