/**
 * @file transfer_id.cpp
 * @brief transfer_id generation and text conversion
 */

#include "kcenon/resilient_transfer/core/transfer_id.h"

#include <cctype>
#include <random>

namespace kcenon::resilient_transfer {

namespace {

constexpr char hex_digits[] = "0123456789abcdef";

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

auto transfer_id::generate() -> transfer_id {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    transfer_id id;
    const uint64_t high = dis(gen);
    const uint64_t low = dis(gen);
    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>(high >> (i * 8));
        id.bytes[i + 8] = static_cast<uint8_t>(low >> (i * 8));
    }

    // RFC 4122 version 4, variant 10xx
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);
    return id;
}

auto transfer_id::to_string() const -> std::string {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += hex_digits[bytes[i] >> 4];
        out += hex_digits[bytes[i] & 0x0F];
    }
    return out;
}

auto transfer_id::from_string(std::string_view str) -> std::optional<transfer_id> {
    transfer_id id;
    std::size_t nibble = 0;
    for (char c : str) {
        if (c == '-') continue;
        const int v = hex_value(c);
        if (v < 0 || nibble >= 32) {
            return std::nullopt;
        }
        auto& target = id.bytes[nibble / 2];
        target = static_cast<uint8_t>(nibble % 2 == 0 ? v << 4 : target | v);
        ++nibble;
    }
    if (nibble != 32) {
        return std::nullopt;
    }
    return id;
}

}  // namespace kcenon::resilient_transfer
