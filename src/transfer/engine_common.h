/**
 * @file engine_common.h
 * @brief Helpers shared by the uploader and downloader (internal)
 */

#ifndef KCENON_RESILIENT_TRANSFER_SRC_TRANSFER_ENGINE_COMMON_H
#define KCENON_RESILIENT_TRANSFER_SRC_TRANSFER_ENGINE_COMMON_H

#include "kcenon/resilient_transfer/core/logging.h"
#include "kcenon/resilient_transfer/core/resume_store.h"
#include "kcenon/resilient_transfer/encryption/streaming_cipher.h"
#include "kcenon/resilient_transfer/transfer/engine_context.h"
#include "kcenon/resilient_transfer/transfer/part_scheduler.h"
#include "kcenon/resilient_transfer/transfer/storage_backend.h"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::resilient_transfer::detail {

inline constexpr std::string_view checksum_algorithm_name = "sha512";

/**
 * @brief Plaintext bytes of part @p index
 */
[[nodiscard]] inline auto plain_part_length(uint64_t plain_size, uint64_t part_size, uint64_t index)
    -> uint64_t {
    const auto offset = index * part_size;
    if (offset >= plain_size) {
        return 0;
    }
    return std::min(part_size, plain_size - offset);
}

/**
 * @brief Ciphertext size of the whole object when every part is padded
 */
[[nodiscard]] inline auto expected_ciphertext_size(uint64_t plain_size, uint64_t part_size)
    -> uint64_t {
    const auto parts = part_count(plain_size, part_size);
    uint64_t total = 0;
    for (uint64_t i = 0; i < parts; ++i) {
        total += encrypted_size(plain_part_length(plain_size, part_size, i));
    }
    return total;
}

/**
 * @brief Part size recorded for a single-shot object (one part covering it)
 */
[[nodiscard]] inline auto single_part_size(uint64_t plain_size) -> uint64_t {
    const auto rounded = (plain_size + cipher_block_size - 1) / cipher_block_size * cipher_block_size;
    return std::max<uint64_t>(rounded, cipher_block_size);
}

/**
 * @brief Plaintext bytes covered by the completed parts of @p state
 */
[[nodiscard]] inline auto plain_bytes_done(const resume_state& state) -> uint64_t {
    uint64_t done = 0;
    for (const auto& part : state.completed_parts) {
        done += plain_part_length(state.plain_size, state.part_size, part.part_number - 1);
    }
    return done;
}

[[nodiscard]] inline auto parse_u64(const std::optional<std::string>& text) -> std::optional<uint64_t> {
    if (!text || text->empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    const auto* end = text->data() + text->size();
    auto [ptr, ec] = std::from_chars(text->data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Per-file key and id, wiped on destruction
 */
struct file_material {
    byte_buffer file_key;
    byte_buffer file_id;

    file_material() = default;
    file_material(const file_material&) = delete;
    auto operator=(const file_material&) -> file_material& = delete;
    file_material(file_material&&) noexcept = default;
    auto operator=(file_material&&) noexcept -> file_material& = default;

    ~file_material() {
        secure_zero(file_key);
        secure_zero(file_id);
    }

    [[nodiscard]] auto for_part(uint64_t index) const -> result<part_key_material> {
        return derive_part_material(file_key, file_id, index);
    }
};

/**
 * @brief Derive the per-file key for @p file_id from the master secret
 */
[[nodiscard]] inline auto derive_material(const byte_buffer& master_secret, byte_buffer file_id)
    -> result<file_material> {
    auto key = derive_file_key(master_secret, file_id);
    if (!key) {
        return unexpected(key.error());
    }
    file_material material;
    material.file_key = std::move(key.value());
    material.file_id = std::move(file_id);
    return material;
}

/**
 * @brief Material persisted in a resume state
 */
[[nodiscard]] inline auto decode_material(const resume_state& state) -> result<file_material> {
    auto key = base64_decode(state.file_key);
    auto id = base64_decode(state.file_id);
    if (!key || !id || key.value().size() != cipher_key_size || id.value().size() != file_id_size) {
        return unexpected(error(error_code::resume_state_invalid,
                                "resume state carries malformed key material"));
    }
    file_material material;
    material.file_key = std::move(key.value());
    material.file_id = std::move(id.value());
    return material;
}

[[nodiscard]] inline auto sorted_parts(const resume_state& state) -> std::vector<completed_part> {
    auto parts = state.completed_parts;
    std::sort(parts.begin(), parts.end(), [](const completed_part& a, const completed_part& b) {
        return a.part_number < b.part_number;
    });
    return parts;
}

/**
 * @brief 0-based indices of parts not yet recorded in @p state
 */
[[nodiscard]] inline auto pending_parts(const resume_state& state, uint64_t total_parts)
    -> std::vector<uint32_t> {
    std::vector<uint32_t> pending;
    for (uint64_t i = 0; i < total_parts; ++i) {
        if (!state.has_part(static_cast<uint32_t>(i + 1))) {
            pending.push_back(static_cast<uint32_t>(i));
        }
    }
    return pending;
}

inline auto remove_quietly(const std::filesystem::path& path) -> void {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

/**
 * @brief Removes a temporary file on scope exit unless released
 */
class scoped_removal {
public:
    explicit scoped_removal(std::filesystem::path path) : path_(std::move(path)) {}
    ~scoped_removal() {
        if (armed_) {
            remove_quietly(path_);
        }
    }

    scoped_removal(const scoped_removal&) = delete;
    auto operator=(const scoped_removal&) -> scoped_removal& = delete;

    auto release() noexcept -> void { armed_ = false; }

private:
    std::filesystem::path path_;
    bool armed_ = true;
};

[[nodiscard]] inline auto sibling_path(const std::filesystem::path& path, std::string_view suffix)
    -> std::filesystem::path {
    auto result_path = path;
    result_path += std::string(suffix);
    return result_path;
}

/**
 * @brief Feed one part's throughput to the monitor and adapt the worker count
 */
inline auto adapt_parallelism(throughput_monitor& monitor,
                              part_scheduler& scheduler,
                              const std::string& key,
                              double bytes_per_second) -> void {
    monitor.record(key, bytes_per_second);
    const auto current = scheduler.parallelism();
    if (monitor.should_scale_down(key) && current > 1) {
        scheduler.set_parallelism(current - 1);
        RT_LOG_DEBUG(log_category::manager,
                     "Throughput dropping, parallelism " + std::to_string(current - 1));
    } else if (monitor.should_scale_up(key) && current < scheduler.max_workers()) {
        scheduler.set_parallelism(current + 1);
        RT_LOG_DEBUG(log_category::manager,
                     "Throughput stable, parallelism " + std::to_string(current + 1));
    }
}

[[nodiscard]] inline auto make_log_context(const transfer_task& task, const std::string& object)
    -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = task.id().to_string();
    ctx.object = object;
    ctx.direction = to_string(task.descriptor().direction);
    return ctx;
}

}  // namespace kcenon::resilient_transfer::detail

#endif  // KCENON_RESILIENT_TRANSFER_SRC_TRANSFER_ENGINE_COMMON_H
