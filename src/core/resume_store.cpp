/**
 * @file resume_store.cpp
 * @brief Resume state persistence and validation
 */

#include "kcenon/resilient_transfer/core/resume_store.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <numeric>
#include <optional>
#include <sstream>
#include <utility>

namespace kcenon::resilient_transfer {

namespace {

constexpr std::string_view upload_suffix = ".upload.resume";
constexpr std::string_view download_suffix = ".download.resume";
constexpr std::size_t max_json_depth = 16;

// ----------------------------------------------------------------------------
// Minimal JSON reader
// ----------------------------------------------------------------------------

struct json_value {
    enum class kind { null, boolean, number, string, array, object };

    kind type = kind::null;
    bool flag = false;
    std::string text;  ///< string contents, or the raw number token
    std::vector<json_value> items;  ///< array items, or object member values
    std::vector<std::string> keys;  ///< object member names, parallel to items

    [[nodiscard]] auto find(std::string_view key) const -> const json_value* {
        for (std::size_t i = 0; i < keys.size() && i < items.size(); ++i) {
            if (keys[i] == key) {
                return &items[i];
            }
        }
        return nullptr;
    }
};

class json_reader {
public:
    explicit json_reader(std::string_view input) : input_(input) {}

    auto parse() -> std::optional<json_value> {
        auto value = parse_value(0);
        skip_ws();
        if (!value || pos_ != input_.size()) {
            return std::nullopt;
        }
        return value;
    }

private:
    auto skip_ws() -> void {
        while (pos_ < input_.size() &&
               (input_[pos_] == ' ' || input_[pos_] == '\n' || input_[pos_] == '\r' ||
                input_[pos_] == '\t')) {
            ++pos_;
        }
    }

    auto consume(char c) -> bool {
        skip_ws();
        if (pos_ < input_.size() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto consume_literal(std::string_view word) -> bool {
        if (input_.substr(pos_, word.size()) == word) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    auto parse_value(std::size_t depth) -> std::optional<json_value> {
        if (depth > max_json_depth) {
            return std::nullopt;
        }
        skip_ws();
        if (pos_ >= input_.size()) {
            return std::nullopt;
        }

        json_value value;
        const char c = input_[pos_];
        if (c == '{') {
            ++pos_;
            value.type = json_value::kind::object;
            if (consume('}')) {
                return value;
            }
            do {
                skip_ws();
                auto key = parse_string();
                if (!key || !consume(':')) {
                    return std::nullopt;
                }
                auto member = parse_value(depth + 1);
                if (!member) {
                    return std::nullopt;
                }
                value.keys.push_back(std::move(*key));
                value.items.push_back(std::move(*member));
            } while (consume(','));
            if (!consume('}')) {
                return std::nullopt;
            }
        } else if (c == '[') {
            ++pos_;
            value.type = json_value::kind::array;
            if (consume(']')) {
                return value;
            }
            do {
                auto item = parse_value(depth + 1);
                if (!item) {
                    return std::nullopt;
                }
                value.items.push_back(std::move(*item));
            } while (consume(','));
            if (!consume(']')) {
                return std::nullopt;
            }
        } else if (c == '"') {
            auto text = parse_string();
            if (!text) {
                return std::nullopt;
            }
            value.type = json_value::kind::string;
            value.text = std::move(*text);
        } else if (consume_literal("true")) {
            value.type = json_value::kind::boolean;
            value.flag = true;
        } else if (consume_literal("false")) {
            value.type = json_value::kind::boolean;
        } else if (consume_literal("null")) {
            value.type = json_value::kind::null;
        } else {
            const auto start = pos_;
            while (pos_ < input_.size() &&
                   (std::isdigit(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '-' ||
                    input_[pos_] == '+' || input_[pos_] == '.' || input_[pos_] == 'e' ||
                    input_[pos_] == 'E')) {
                ++pos_;
            }
            if (start == pos_) {
                return std::nullopt;
            }
            value.type = json_value::kind::number;
            value.text = std::string(input_.substr(start, pos_ - start));
        }
        return value;
    }

    auto parse_string() -> std::optional<std::string> {
        if (pos_ >= input_.size() || input_[pos_] != '"') {
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < input_.size()) {
            char c = input_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= input_.size()) {
                return std::nullopt;
            }
            char esc = input_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > input_.size()) {
                        return std::nullopt;
                    }
                    unsigned code = 0;
                    auto [ptr, ec] = std::from_chars(input_.data() + pos_,
                                                     input_.data() + pos_ + 4, code, 16);
                    if (ec != std::errc{} || ptr != input_.data() + pos_ + 4) {
                        return std::nullopt;
                    }
                    pos_ += 4;
                    append_utf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    static auto append_utf8(std::string& out, unsigned code) -> void {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string_view input_;
    std::size_t pos_ = 0;
};

auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '"': output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n"; break;
            case '\r': output += "\\r"; break;
            case '\t': output += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto time_point_to_int64(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto int64_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

template <typename T>
auto to_number(const json_value* value) -> std::optional<T> {
    if (value == nullptr || value->type != json_value::kind::number) {
        return std::nullopt;
    }
    T out{};
    const auto* first = value->text.data();
    const auto* last = first + value->text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return out;
}

auto to_text(const json_value* value) -> std::optional<std::string> {
    if (value == nullptr || value->type != json_value::kind::string) {
        return std::nullopt;
    }
    return value->text;
}

auto invalid(std::string message) -> unexpected {
    return unexpected(error(error_code::resume_state_invalid, std::move(message)));
}

auto normalized(const std::filesystem::path& path) -> std::string {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal().string();
}

auto is_resume_file(const std::filesystem::path& path) -> bool {
    const auto name = path.filename().string();
    auto ends_with = [&](std::string_view suffix) {
        return name.size() > suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(upload_suffix) || ends_with(download_suffix);
}

}  // namespace

// ============================================================================
// resume_state
// ============================================================================

auto resume_state::record_part(completed_part part) -> void {
    auto it = std::find_if(completed_parts.begin(), completed_parts.end(),
                           [&](const completed_part& p) { return p.part_number == part.part_number; });
    if (it != completed_parts.end()) {
        bytes_transferred -= it->size;
        *it = std::move(part);
        bytes_transferred += it->size;
        return;
    }
    bytes_transferred += part.size;
    completed_parts.push_back(std::move(part));
}

auto resume_state::remove_part(uint32_t part_number) -> bool {
    auto it = std::find_if(completed_parts.begin(), completed_parts.end(),
                           [&](const completed_part& p) { return p.part_number == part_number; });
    if (it == completed_parts.end()) {
        return false;
    }
    bytes_transferred -= it->size;
    completed_parts.erase(it);
    return true;
}

auto resume_state::has_part(uint32_t part_number) const -> bool {
    return find_part(part_number) != nullptr;
}

auto resume_state::find_part(uint32_t part_number) const -> const completed_part* {
    for (const auto& p : completed_parts) {
        if (p.part_number == part_number) {
            return &p;
        }
    }
    return nullptr;
}

auto resume_state::is_consistent() const -> bool {
    const auto sum = std::accumulate(completed_parts.begin(), completed_parts.end(), uint64_t{0},
                                     [](uint64_t acc, const completed_part& p) { return acc + p.size; });
    return sum == bytes_transferred;
}

// ============================================================================
// resume_store::impl
// ============================================================================

class resume_store::impl {
public:
    explicit impl(resume_store_config cfg) : config(cfg) {}

    auto write_atomic(const std::filesystem::path& target, const std::string& content)
        -> result<void> {
        auto tmp = target;
        tmp += ".tmp";

        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return unexpected(error(error_code::file_write_error,
                                        "cannot write resume state: " + tmp.string()));
            }
            file << content;
            file.flush();
            if (!file) {
                return unexpected(error(error_code::file_write_error,
                                        "failed writing resume state: " + tmp.string()));
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, target, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            return unexpected(error(error_code::file_write_error,
                                    "cannot replace resume state " + target.string() + ": " +
                                        ec.message()));
        }
        return {};
    }

    auto check_common(const resume_state& state,
                      transfer_direction expected,
                      const std::filesystem::path& local_path,
                      uint64_t plain_size) const -> result<void> {
        if (state.format_version != resume_format_version) {
            return invalid("unsupported resume format version " +
                           std::to_string(state.format_version));
        }
        if (state.direction != expected) {
            return invalid("resume state belongs to a " +
                           std::string(to_string(state.direction)) + " transfer");
        }
        const auto age = std::chrono::system_clock::now() - state.last_update;
        if (age > config.max_age) {
            return invalid("resume state is older than " +
                           std::to_string(config.max_age.count()) + " hours");
        }
        if (normalized(state.local_path) != normalized(local_path)) {
            return invalid("resume state was recorded for " + state.local_path);
        }
        if (state.plain_size != plain_size) {
            return invalid("file size changed from " + std::to_string(state.plain_size) + " to " +
                           std::to_string(plain_size));
        }
        if (state.part_size == 0 || state.part_size % 16 != 0) {
            return invalid("part size must be a positive multiple of 16");
        }
        if (!state.is_consistent()) {
            return invalid("bytes_transferred does not match the recorded parts");
        }
        if (state.bytes_transferred > state.total_size) {
            return invalid("recorded parts exceed the object size");
        }
        const auto parts = state.plain_size == 0
                               ? uint64_t{1}
                               : (state.plain_size + state.part_size - 1) / state.part_size;
        for (const auto& part : state.completed_parts) {
            if (part.part_number == 0 || part.part_number > parts) {
                return invalid("part number " + std::to_string(part.part_number) + " out of range");
            }
        }
        if (state.file_key.empty() || state.file_id.empty()) {
            return invalid("encryption material missing");
        }
        return {};
    }

    resume_store_config config;
    std::mutex mutex;
};

// ============================================================================
// resume_store
// ============================================================================

resume_store::resume_store(resume_store_config config)
    : impl_(std::make_unique<impl>(config)) {}

resume_store::~resume_store() = default;

auto resume_store::state_path(const std::filesystem::path& local_path, transfer_direction direction)
    -> std::filesystem::path {
    auto path = local_path;
    path += std::string(direction == transfer_direction::upload ? upload_suffix : download_suffix);
    return path;
}

auto resume_store::save(const resume_state& state) -> result<void> {
    auto stamped = state;
    stamped.last_update = std::chrono::system_clock::now();
    if (stamped.created_at == std::chrono::system_clock::time_point{}) {
        stamped.created_at = stamped.last_update;
    }

    const auto target = state_path(stamped.local_path, stamped.direction);
    const auto json = serialize(stamped);

    std::lock_guard lock(impl_->mutex);
    auto written = impl_->write_atomic(target, json);
    if (!written) {
        RT_LOG_ERROR(log_category::resume, written.error().message);
        return written;
    }
    RT_LOG_TRACE(log_category::resume,
                 "Saved resume state " + target.string() + " (" +
                     std::to_string(stamped.completed_parts.size()) + " parts)");
    return {};
}

auto resume_store::load(const std::filesystem::path& local_path, transfer_direction direction)
    -> result<resume_state> {
    const auto path = state_path(local_path, direction);

    std::string content;
    {
        std::lock_guard lock(impl_->mutex);
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return unexpected(error(error_code::file_not_found,
                                    "no resume state at " + path.string()));
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        content = oss.str();
    }

    auto parsed = parse(content);
    if (!parsed) {
        RT_LOG_WARN(log_category::resume,
                    "Discarding unreadable resume state " + path.string() + ": " +
                        parsed.error().message);
    } else {
        RT_LOG_DEBUG(log_category::resume, "Loaded resume state " + path.string());
    }
    return parsed;
}

auto resume_store::remove(const std::filesystem::path& local_path, transfer_direction direction)
    -> result<void> {
    const auto path = state_path(local_path, direction);
    std::lock_guard lock(impl_->mutex);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return unexpected(error(error_code::file_write_error,
                                "cannot remove resume state " + path.string() + ": " +
                                    ec.message()));
    }
    return {};
}

auto resume_store::exists(const std::filesystem::path& local_path,
                          transfer_direction direction) const -> bool {
    std::error_code ec;
    return std::filesystem::exists(state_path(local_path, direction), ec);
}

auto resume_store::validate_upload(const resume_state& state,
                                   const std::filesystem::path& local_path,
                                   uint64_t plain_size) const -> result<void> {
    if (auto r = impl_->check_common(state, transfer_direction::upload, local_path, plain_size); !r) {
        return r;
    }
    if (state.upload_id.empty()) {
        return invalid("upload session id missing");
    }
    if (state.object_key.empty()) {
        return invalid("object key missing");
    }
    return {};
}

auto resume_store::validate_download(const resume_state& state,
                                     const std::filesystem::path& local_path,
                                     uint64_t plain_size,
                                     std::string_view etag) const -> result<void> {
    if (auto r = impl_->check_common(state, transfer_direction::download, local_path, plain_size);
        !r) {
        return r;
    }
    if (state.etag != etag) {
        return invalid("remote object changed (ETag " + state.etag + " -> " + std::string(etag) + ")");
    }
    if (!state.encrypted_path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(state.encrypted_path, ec)) {
            const auto artifact = std::filesystem::file_size(state.encrypted_path, ec);
            if (ec || artifact > state.total_size) {
                return invalid("partial download is larger than the remote object");
            }
        }
    }
    return {};
}

auto resume_store::purge_stale(const std::filesystem::path& directory) -> std::size_t {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        RT_LOG_WARN(log_category::resume,
                    "Cannot scan " + directory.string() + " for stale resume files: " + ec.message());
        return 0;
    }

    std::size_t removed = 0;
    const auto now = std::chrono::system_clock::now();
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || !is_resume_file(entry.path())) {
            continue;
        }

        std::ifstream file(entry.path(), std::ios::binary);
        std::ostringstream oss;
        oss << file.rdbuf();
        file.close();

        auto parsed = parse(oss.str());
        const bool stale = !parsed || now - parsed.value().last_update > impl_->config.max_age;
        if (!stale) {
            continue;
        }

        std::error_code remove_ec;
        if (std::filesystem::remove(entry.path(), remove_ec)) {
            ++removed;
            RT_LOG_INFO(log_category::resume, "Purged stale resume state " + entry.path().string());
        }
    }
    return removed;
}

auto resume_store::serialize(const resume_state& state) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"format_version\": " << state.format_version << ",\n";
    oss << "  \"direction\": \"" << to_string(state.direction) << "\",\n";
    oss << "  \"local_path\": \"" << escape_json_string(state.local_path) << "\",\n";
    oss << "  \"object_key\": \"" << escape_json_string(state.object_key) << "\",\n";
    oss << "  \"storage_type\": \"" << to_string(state.storage) << "\",\n";
    oss << "  \"storage_id\": \"" << escape_json_string(state.storage_id) << "\",\n";
    oss << "  \"upload_id\": \"" << escape_json_string(state.upload_id) << "\",\n";
    oss << "  \"plain_size\": " << state.plain_size << ",\n";
    oss << "  \"total_size\": " << state.total_size << ",\n";
    oss << "  \"part_size\": " << state.part_size << ",\n";
    oss << "  \"bytes_transferred\": " << state.bytes_transferred << ",\n";
    oss << "  \"completed_parts\": [";
    for (std::size_t i = 0; i < state.completed_parts.size(); ++i) {
        const auto& part = state.completed_parts[i];
        oss << (i == 0 ? "\n" : ",\n");
        oss << "    {\"part_number\": " << part.part_number << ", \"size\": " << part.size
            << ", \"etag\": \"" << escape_json_string(part.etag) << "\"}";
    }
    oss << (state.completed_parts.empty() ? "],\n" : "\n  ],\n");
    oss << "  \"file_key\": \"" << state.file_key << "\",\n";
    oss << "  \"file_id\": \"" << state.file_id << "\",\n";
    oss << "  \"random_suffix\": \"" << escape_json_string(state.random_suffix) << "\",\n";
    oss << "  \"checksum\": \"" << escape_json_string(state.checksum) << "\",\n";
    oss << "  \"etag\": \"" << escape_json_string(state.etag) << "\",\n";
    oss << "  \"encrypted_path\": \"" << escape_json_string(state.encrypted_path) << "\",\n";
    oss << "  \"committed\": " << (state.committed ? "true" : "false") << ",\n";
    oss << "  \"created_at\": " << time_point_to_int64(state.created_at) << ",\n";
    oss << "  \"last_update\": " << time_point_to_int64(state.last_update) << "\n";
    oss << "}\n";
    return oss.str();
}

auto resume_store::parse(std::string_view json) -> result<resume_state> {
    auto root = json_reader(json).parse();
    if (!root || root->type != json_value::kind::object) {
        return invalid("resume state is not a JSON object");
    }

    resume_state state;

    auto version = to_number<int>(root->find("format_version"));
    if (!version) {
        return invalid("missing field: format_version");
    }
    state.format_version = *version;

    auto direction = to_text(root->find("direction"));
    if (!direction || (*direction != "upload" && *direction != "download")) {
        return invalid("missing or invalid field: direction");
    }
    state.direction = *direction == "upload" ? transfer_direction::upload
                                             : transfer_direction::download;

    auto local_path = to_text(root->find("local_path"));
    auto object_key = to_text(root->find("object_key"));
    if (!local_path || !object_key) {
        return invalid("missing field: local_path or object_key");
    }
    state.local_path = std::move(*local_path);
    state.object_key = std::move(*object_key);

    auto plain_size = to_number<uint64_t>(root->find("plain_size"));
    auto total_size = to_number<uint64_t>(root->find("total_size"));
    auto part_size = to_number<uint64_t>(root->find("part_size"));
    auto bytes = to_number<uint64_t>(root->find("bytes_transferred"));
    if (!plain_size || !total_size || !part_size || !bytes) {
        return invalid("missing or invalid size fields");
    }
    state.plain_size = *plain_size;
    state.total_size = *total_size;
    state.part_size = *part_size;

    const auto* parts = root->find("completed_parts");
    if (parts == nullptr || parts->type != json_value::kind::array) {
        return invalid("missing field: completed_parts");
    }
    for (const auto& item : parts->items) {
        if (item.type != json_value::kind::object) {
            return invalid("completed part is not an object");
        }
        auto number = to_number<uint32_t>(item.find("part_number"));
        auto size = to_number<uint64_t>(item.find("size"));
        if (!number || !size) {
            return invalid("completed part lacks part_number or size");
        }
        completed_part part;
        part.part_number = *number;
        part.size = *size;
        part.etag = to_text(item.find("etag")).value_or("");
        state.completed_parts.push_back(std::move(part));
    }
    state.bytes_transferred = *bytes;

    auto file_key = to_text(root->find("file_key"));
    auto file_id = to_text(root->find("file_id"));
    if (!file_key || !file_id) {
        return invalid("missing field: file_key or file_id");
    }
    state.file_key = std::move(*file_key);
    state.file_id = std::move(*file_id);

    auto created = to_number<int64_t>(root->find("created_at"));
    auto updated = to_number<int64_t>(root->find("last_update"));
    if (!created || !updated) {
        return invalid("missing field: created_at or last_update");
    }
    state.created_at = int64_to_time_point(*created);
    state.last_update = int64_to_time_point(*updated);

    if (auto type = to_text(root->find("storage_type"))) {
        state.storage = storage_type_from_string(*type).value_or(storage_type::s3);
    }
    state.storage_id = to_text(root->find("storage_id")).value_or("");
    state.upload_id = to_text(root->find("upload_id")).value_or("");
    state.random_suffix = to_text(root->find("random_suffix")).value_or("");
    state.checksum = to_text(root->find("checksum")).value_or("");
    state.etag = to_text(root->find("etag")).value_or("");
    state.encrypted_path = to_text(root->find("encrypted_path")).value_or("");
    if (const auto* committed = root->find("committed");
        committed != nullptr && committed->type == json_value::kind::boolean) {
        state.committed = committed->flag;
    }

    return state;
}

auto resume_store::config() const -> const resume_store_config& {
    return impl_->config;
}

}  // namespace kcenon::resilient_transfer
