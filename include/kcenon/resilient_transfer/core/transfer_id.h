/**
 * @file transfer_id.h
 * @brief UUID identity of a transfer task
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_TRANSFER_ID_H
#define KCENON_RESILIENT_TRANSFER_CORE_TRANSFER_ID_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::resilient_transfer {

/**
 * @brief Random (version 4) UUID identifying one transfer task
 */
struct transfer_id {
    std::array<uint8_t, 16> bytes{};

    constexpr transfer_id() noexcept = default;

    explicit constexpr transfer_id(const std::array<uint8_t, 16>& b) noexcept : bytes(b) {}

    [[nodiscard]] static auto generate() -> transfer_id;

    /**
     * @brief Canonical 8-4-4-4-12 lowercase text form
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] static auto from_string(std::string_view str) -> std::optional<transfer_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const transfer_id& other) const noexcept
        -> bool = default;

    [[nodiscard]] constexpr auto operator<(const transfer_id& other) const noexcept -> bool {
        return bytes < other.bytes;
    }
};

}  // namespace kcenon::resilient_transfer

template <>
struct std::hash<kcenon::resilient_transfer::transfer_id> {
    auto operator()(const kcenon::resilient_transfer::transfer_id& id) const noexcept
        -> std::size_t {
        std::size_t h = 1469598103934665603ULL;
        for (auto b : id.bytes) {
            h = (h ^ b) * 1099511628211ULL;
        }
        return h;
    }
};

#endif  // KCENON_RESILIENT_TRANSFER_CORE_TRANSFER_ID_H
