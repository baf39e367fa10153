/**
 * @file local_storage_backend.cpp
 * @brief Directory-backed object store
 */

#include "kcenon/resilient_transfer/transfer/local_storage_backend.h"
#include "kcenon/resilient_transfer/core/checksum.h"
#include "kcenon/resilient_transfer/core/logging.h"
#include "kcenon/resilient_transfer/encryption/streaming_cipher.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace kcenon::resilient_transfer {

namespace {

constexpr std::string_view temp_marker = ".rt-tmp-";
constexpr std::string_view etag_field = "etag";
constexpr std::size_t copy_buffer_size = 1024 * 1024;

auto check_lease(const credential_lease& lease) -> result<void> {
    if (lease.is_expired()) {
        return unexpected(error(error_code::auth_expired,
                                "credential lease for " + lease.context.storage_id + " has expired"));
    }
    return {};
}

/**
 * @brief Keys are relative paths without "." or ".." components
 */
auto validate_key(const std::string& key) -> result<std::filesystem::path> {
    if (key.empty()) {
        return unexpected(error(error_code::invalid_argument, "object key is empty"));
    }
    std::filesystem::path relative(key);
    if (relative.is_absolute() || relative.has_root_name()) {
        return unexpected(error(error_code::path_unsafe, "object key is absolute: " + key));
    }
    for (const auto& component : relative) {
        if (component == ".." || component == ".") {
            return unexpected(error(error_code::path_unsafe, "object key escapes the store: " + key));
        }
    }
    if (key.find(temp_marker) != std::string::npos) {
        return unexpected(error(error_code::invalid_argument, "reserved object key: " + key));
    }
    return relative;
}

auto temp_sibling(const std::filesystem::path& target) -> std::filesystem::path {
    auto suffix = generate_random_suffix(8);
    auto temp = target;
    temp += std::string(temp_marker) + (suffix ? suffix.value() : std::string("x"));
    return temp;
}

auto ensure_parent(const std::filesystem::path& target) -> result<void> {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return unexpected(error(error_code::server_error,
                                "cannot create " + target.parent_path().string() + ": " +
                                    ec.message()));
    }
    return {};
}

auto commit_temp(const std::filesystem::path& temp, const std::filesystem::path& target)
    -> result<void> {
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return unexpected(error(error_code::server_error, "cannot commit " + target.string()));
    }
    return {};
}

auto write_atomic(const std::filesystem::path& target, std::span<const std::byte> data)
    -> result<void> {
    auto parent = ensure_parent(target);
    if (!parent) {
        return parent;
    }
    const auto temp = temp_sibling(target);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error(error_code::server_error, "cannot write " + temp.string()));
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            std::error_code ec;
            out.close();
            std::filesystem::remove(temp, ec);
            return unexpected(error(error_code::server_error, "short write to " + temp.string()));
        }
    }
    return commit_temp(temp, target);
}

/**
 * @brief Append the whole of @p source to @p out
 */
auto append_file(std::ofstream& out, const std::filesystem::path& source) -> result<uint64_t> {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return unexpected(error(error_code::server_error, "cannot read " + source.string()));
    }
    std::vector<char> buffer(copy_buffer_size);
    uint64_t copied = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(buffer.data(), got);
        if (!out) {
            return unexpected(error(error_code::server_error, "short write while assembling"));
        }
        copied += static_cast<uint64_t>(got);
    }
    return copied;
}

auto read_metadata_file(const std::filesystem::path& path) -> metadata_map {
    metadata_map metadata;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        metadata[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return metadata;
}

auto write_metadata_file(const std::filesystem::path& path, const metadata_map& metadata)
    -> result<void> {
    std::string text;
    for (const auto& [name, value] : metadata) {
        if (name.find('=') != std::string::npos || name.find('\n') != std::string::npos ||
            value.find('\n') != std::string::npos) {
            return unexpected(error(error_code::invalid_argument, "malformed metadata entry " + name));
        }
        text += name + "=" + value + "\n";
    }
    return write_atomic(path, std::as_bytes(std::span<const char>(text.data(), text.size())));
}

auto part_file_name(uint32_t part_number) -> std::string {
    char name[32];
    std::snprintf(name, sizeof(name), "part-%06u", part_number);
    return name;
}

auto parse_part_number(const std::string& file_name) -> std::optional<uint32_t> {
    constexpr std::string_view prefix = "part-";
    if (file_name.rfind(prefix, 0) != 0 || file_name.find(temp_marker) != std::string::npos) {
        return std::nullopt;
    }
    uint32_t number = 0;
    for (std::size_t i = prefix.size(); i < file_name.size(); ++i) {
        const char c = file_name[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        number = number * 10 + static_cast<uint32_t>(c - '0');
    }
    return number;
}

}  // namespace

class local_storage_backend::impl {
public:
    explicit impl(std::filesystem::path base) : root(std::move(base)) {}

    auto object_path(const std::filesystem::path& key) const -> std::filesystem::path {
        return root / "objects" / key;
    }

    auto meta_path(const std::filesystem::path& key) const -> std::filesystem::path {
        return root / "meta" / key;
    }

    auto session_path(const std::string& upload_id) const -> std::filesystem::path {
        return root / "multipart" / upload_id;
    }

    /**
     * @brief Session directory for @p upload_id, checked against @p key
     */
    auto open_session(const std::string& key, const std::string& upload_id) const
        -> result<std::filesystem::path> {
        if (upload_id.empty() || upload_id.find_first_of("/\\.") != std::string::npos) {
            return unexpected(error(error_code::invalid_argument, "malformed upload id"));
        }
        auto dir = session_path(upload_id);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            return unexpected(error(error_code::object_not_found, "no such upload: " + upload_id));
        }
        std::ifstream in(dir / "key");
        std::string stored_key;
        std::getline(in, stored_key);
        if (stored_key != key) {
            return unexpected(error(error_code::invalid_argument,
                                    "upload " + upload_id + " belongs to another key"));
        }
        return dir;
    }

    auto describe(const std::string& key, const std::filesystem::path& relative) const
        -> result<object_info> {
        const auto path = object_path(relative);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return unexpected(error(error_code::object_not_found, "object not found: " + key));
        }
        object_info info;
        info.key = key;
        info.size = std::filesystem::file_size(path, ec);
        if (ec) {
            return unexpected(error(error_code::server_error, "cannot stat " + key));
        }
        info.metadata = read_metadata_file(meta_path(relative));
        auto etag = info.metadata.find(std::string(etag_field));
        if (etag != info.metadata.end()) {
            info.etag = etag->second;
            info.metadata.erase(etag);
        }
        return info;
    }

    auto store_metadata(const std::filesystem::path& relative,
                        metadata_map metadata,
                        const std::string& etag) -> result<void> {
        metadata[std::string(etag_field)] = etag;
        return write_metadata_file(meta_path(relative), metadata);
    }

    std::filesystem::path root;
    std::mutex mutex;
};

auto local_storage_backend::create(const std::filesystem::path& root)
    -> result<std::shared_ptr<local_storage_backend>> {
    std::error_code ec;
    for (const char* sub : {"objects", "meta", "multipart"}) {
        std::filesystem::create_directories(root / sub, ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot create storage directory " + (root / sub).string() +
                                        ": " + ec.message()));
        }
    }
    return std::shared_ptr<local_storage_backend>(new local_storage_backend(root));
}

local_storage_backend::local_storage_backend(std::filesystem::path root)
    : impl_(std::make_unique<impl>(std::move(root))) {}

local_storage_backend::~local_storage_backend() = default;

auto local_storage_backend::root() const -> const std::filesystem::path& {
    return impl_->root;
}

auto local_storage_backend::create_multipart(const credential_lease& lease, const std::string& key)
    -> result<std::string> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }
    auto relative = validate_key(key);
    if (!relative) {
        return unexpected(relative.error());
    }

    auto id_bytes = generate_random_bytes(16);
    if (!id_bytes) {
        return unexpected(id_bytes.error());
    }
    auto upload_id = checksum::to_hex(id_bytes.value());

    std::lock_guard lock(impl_->mutex);
    const auto dir = impl_->session_path(upload_id);
    auto written = write_atomic(dir / "key",
                                std::as_bytes(std::span<const char>(key.data(), key.size())));
    if (!written) {
        return unexpected(written.error());
    }
    RT_LOG_DEBUG(log_category::storage, "Created multipart session " + upload_id + " for " + key);
    return upload_id;
}

auto local_storage_backend::upload_part(const credential_lease& lease,
                                        const std::string& key,
                                        const std::string& upload_id,
                                        uint32_t part_number,
                                        std::span<const std::byte> data) -> result<part_receipt> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }
    if (part_number == 0) {
        return unexpected(error(error_code::invalid_argument, "part numbers start at 1"));
    }
    auto session = impl_->open_session(key, upload_id);
    if (!session) {
        return unexpected(session.error());
    }

    auto written = write_atomic(session.value() / part_file_name(part_number), data);
    if (!written) {
        return unexpected(written.error());
    }
    return part_receipt{part_number, checksum::sha256(data), data.size()};
}

auto local_storage_backend::list_parts(const credential_lease& lease,
                                       const std::string& key,
                                       const std::string& upload_id)
    -> result<std::vector<part_receipt>> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }
    auto session = impl_->open_session(key, upload_id);
    if (!session) {
        return unexpected(session.error());
    }

    std::vector<part_receipt> parts;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(session.value(), ec)) {
        auto number = parse_part_number(entry.path().filename().string());
        if (!number) {
            continue;
        }
        auto digest = checksum::hash_file(entry.path(), digest_algorithm::sha256);
        if (!digest) {
            return unexpected(error(error_code::server_error, digest.error().message));
        }
        parts.push_back(part_receipt{*number, digest.value(), entry.file_size(ec)});
    }
    if (ec) {
        return unexpected(error(error_code::server_error, "cannot list upload " + upload_id));
    }
    return parts;
}

auto local_storage_backend::complete_multipart(const credential_lease& lease,
                                               const std::string& key,
                                               const std::string& upload_id,
                                               const std::vector<part_receipt>& parts,
                                               const metadata_map& metadata)
    -> result<object_info> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }
    auto relative = validate_key(key);
    if (!relative) {
        return unexpected(relative.error());
    }
    if (parts.empty()) {
        return unexpected(error(error_code::invalid_argument, "complete requires at least one part"));
    }

    std::lock_guard lock(impl_->mutex);
    auto session = impl_->open_session(key, upload_id);
    if (!session) {
        return unexpected(session.error());
    }

    std::string combined_etags;
    uint32_t previous = 0;
    for (const auto& part : parts) {
        if (part.part_number <= previous) {
            return unexpected(error(error_code::invalid_argument,
                                    "parts must be listed in ascending order"));
        }
        previous = part.part_number;
        auto digest = checksum::hash_file(session.value() / part_file_name(part.part_number),
                                          digest_algorithm::sha256);
        if (!digest) {
            return unexpected(error(error_code::invalid_argument,
                                    "part " + std::to_string(part.part_number) + " was not uploaded"));
        }
        if (!checksum::equals(digest.value(), part.etag)) {
            return unexpected(error(error_code::invalid_argument,
                                    "ETag mismatch for part " + std::to_string(part.part_number)));
        }
        combined_etags += digest.value();
    }

    const auto target = impl_->object_path(relative.value());
    auto parent = ensure_parent(target);
    if (!parent) {
        return unexpected(parent.error());
    }
    const auto temp = temp_sibling(target);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error(error_code::server_error, "cannot assemble " + key));
        }
        for (const auto& part : parts) {
            auto copied = append_file(out, session.value() / part_file_name(part.part_number));
            if (!copied) {
                std::error_code ec;
                out.close();
                std::filesystem::remove(temp, ec);
                return unexpected(copied.error());
            }
        }
    }
    auto committed = commit_temp(temp, target);
    if (!committed) {
        return unexpected(committed.error());
    }

    const auto etag = checksum::sha256(std::as_bytes(
                          std::span<const char>(combined_etags.data(), combined_etags.size()))) +
                      "-" + std::to_string(parts.size());
    auto stored = impl_->store_metadata(relative.value(), metadata, etag);
    if (!stored) {
        return unexpected(stored.error());
    }

    std::error_code ec;
    std::filesystem::remove_all(session.value(), ec);

    RT_LOG_DEBUG(log_category::storage,
                 "Completed multipart " + upload_id + " for " + key + " (" +
                     std::to_string(parts.size()) + " parts)");
    return impl_->describe(key, relative.value());
}

auto local_storage_backend::abort_multipart(const credential_lease& lease,
                                            const std::string& key,
                                            const std::string& upload_id) -> result<void> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return lease_ok;
    }
    std::lock_guard lock(impl_->mutex);
    auto session = impl_->open_session(key, upload_id);
    if (!session) {
        return unexpected(session.error());
    }
    std::error_code ec;
    std::filesystem::remove_all(session.value(), ec);
    if (ec) {
        return unexpected(error(error_code::server_error, "cannot abort upload " + upload_id));
    }
    return {};
}

auto local_storage_backend::put_object(const credential_lease& lease,
                                       const std::string& key,
                                       const std::filesystem::path& source,
                                       const metadata_map& metadata) -> result<object_info> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }
    auto relative = validate_key(key);
    if (!relative) {
        return unexpected(relative.error());
    }

    const auto target = impl_->object_path(relative.value());
    auto parent = ensure_parent(target);
    if (!parent) {
        return unexpected(parent.error());
    }
    const auto temp = temp_sibling(target);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error(error_code::server_error, "cannot store " + key));
        }
        auto copied = append_file(out, source);
        if (!copied) {
            std::error_code ec;
            out.close();
            std::filesystem::remove(temp, ec);
            return unexpected(copied.error());
        }
    }

    auto etag = checksum::hash_file(temp, digest_algorithm::sha256);
    if (!etag) {
        return unexpected(error(error_code::server_error, etag.error().message));
    }

    std::lock_guard lock(impl_->mutex);
    auto committed = commit_temp(temp, target);
    if (!committed) {
        return unexpected(committed.error());
    }
    auto stored = impl_->store_metadata(relative.value(), metadata, etag.value());
    if (!stored) {
        return unexpected(stored.error());
    }
    return impl_->describe(key, relative.value());
}

auto local_storage_backend::head_object(const credential_lease& lease, const std::string& key)
    -> result<object_info> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }
    auto relative = validate_key(key);
    if (!relative) {
        return unexpected(relative.error());
    }
    return impl_->describe(key, relative.value());
}

auto local_storage_backend::read_range(const credential_lease& lease,
                                       const std::string& key,
                                       uint64_t offset,
                                       uint64_t length) -> result<std::vector<std::byte>> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }
    auto relative = validate_key(key);
    if (!relative) {
        return unexpected(relative.error());
    }

    const auto path = impl_->object_path(relative.value());
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error(error_code::object_not_found, "object not found: " + key));
    }
    if (offset > size) {
        return unexpected(error(error_code::invalid_argument,
                                "range starts past the end of " + key));
    }
    const auto count = std::min<uint64_t>(length, size - offset);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(error(error_code::server_error, "cannot open " + key));
    }
    in.seekg(static_cast<std::streamoff>(offset));
    std::vector<std::byte> data(static_cast<std::size_t>(count));
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
    if (static_cast<uint64_t>(in.gcount()) != count) {
        return unexpected(error(error_code::transient_network, "short read from " + key));
    }
    return data;
}

auto local_storage_backend::list_objects(const credential_lease& lease, const std::string& prefix)
    -> result<std::vector<object_info>> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return unexpected(lease_ok.error());
    }

    std::vector<object_info> objects;
    const auto base = impl_->root / "objects";
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(base, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        auto key = std::filesystem::relative(it->path(), base).generic_string();
        if (key.find(temp_marker) != std::string::npos || key.rfind(prefix, 0) != 0) {
            continue;
        }
        auto info = impl_->describe(key, std::filesystem::path(key));
        if (info) {
            objects.push_back(std::move(info.value()));
        }
    }
    if (ec) {
        return unexpected(error(error_code::server_error, "cannot list objects: " + ec.message()));
    }
    std::sort(objects.begin(), objects.end(),
              [](const object_info& a, const object_info& b) { return a.key < b.key; });
    return objects;
}

auto local_storage_backend::delete_object(const credential_lease& lease, const std::string& key)
    -> result<void> {
    auto lease_ok = check_lease(lease);
    if (!lease_ok) {
        return lease_ok;
    }
    auto relative = validate_key(key);
    if (!relative) {
        return unexpected(relative.error());
    }

    std::lock_guard lock(impl_->mutex);
    const auto path = impl_->object_path(relative.value());
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error(error_code::object_not_found, "object not found: " + key));
    }
    if (!std::filesystem::remove(path, ec) || ec) {
        return unexpected(error(error_code::server_error, "cannot delete " + key));
    }
    std::filesystem::remove(impl_->meta_path(relative.value()), ec);
    return {};
}

auto local_storage_backend::overwrite_object(const std::string& key, std::span<const std::byte> data)
    -> result<object_info> {
    auto relative = validate_key(key);
    if (!relative) {
        return unexpected(relative.error());
    }

    std::lock_guard lock(impl_->mutex);
    auto current = impl_->describe(key, relative.value());
    metadata_map metadata = current ? current.value().metadata : metadata_map{};

    auto written = write_atomic(impl_->object_path(relative.value()), data);
    if (!written) {
        return unexpected(written.error());
    }
    auto stored = impl_->store_metadata(relative.value(), std::move(metadata), checksum::sha256(data));
    if (!stored) {
        return unexpected(stored.error());
    }
    return impl_->describe(key, relative.value());
}

}  // namespace kcenon::resilient_transfer
