/**
 * @file upload_download_example.cpp
 * @brief Encrypted upload and download through a local object store
 *
 * This example demonstrates:
 * - Building a transfer_manager with a storage backend and credential source
 * - Following progress events
 * - Uploading a file and downloading it back
 * - Comparing checksums of the original and the restored copy
 */

#include <kcenon/resilient_transfer/resilient_transfer.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace kcenon::resilient_transfer;

namespace {

/**
 * @brief Hands out long-lived leases for the local store
 */
class local_credential_source : public credential_source {
public:
    auto fetch(const storage_context& context) -> result<credential_lease> override {
        credential_lease lease;
        lease.context = context;
        lease.access_key_id = "local";
        lease.secret_access_key = "local";
        lease.issued_at = std::chrono::system_clock::now();
        lease.expires_at = lease.issued_at + std::chrono::hours(12);
        return lease;
    }
};

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto master_secret_from_env() -> byte_buffer {
    std::string text = "example-master-secret-change-me-0123456789";
    if (const char* env = std::getenv("RESILIENT_TRANSFER_SECRET"); env != nullptr) {
        text = env;
    } else {
        std::cout << "RESILIENT_TRANSFER_SECRET not set; using the built-in demo secret"
                  << std::endl;
    }
    byte_buffer secret(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        secret[i] = static_cast<std::byte>(text[i]);
    }
    return secret;
}

/**
 * @brief Print progress events until the transfer reaches a terminal state
 */
auto wait_with_progress(transfer_manager& manager,
                        const std::shared_ptr<event_subscription>& events,
                        const transfer_id& id) -> result<task_snapshot> {
    while (true) {
        auto event = events->wait_pop(std::chrono::milliseconds(500));
        if (event && event->id == id) {
            std::cout << "\r  " << std::fixed << std::setprecision(1)
                      << event->fraction * 100.0 << "% "
                      << format_bytes(event->bytes_transferred) << " / "
                      << format_bytes(event->total_bytes) << " ("
                      << format_bytes(static_cast<uint64_t>(event->bytes_per_second))
                      << "/s)   " << std::flush;
        }
        auto snapshot = manager.get_task(id);
        if (!snapshot) {
            return unexpected(snapshot.error());
        }
        if (snapshot.value().is_terminal()) {
            std::cout << std::endl;
            return snapshot;
        }
    }
}

auto describe_failure(const result<task_snapshot>& snapshot) -> std::string {
    if (!snapshot) {
        return snapshot.error().message;
    }
    if (snapshot.value().failure) {
        return snapshot.value().failure->describe();
    }
    return std::string(to_string(snapshot.value().state));
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload/Download Example - Resilient Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " <local_file> [store_dir] [path_base]" << std::endl;
    std::cout << std::endl;
    std::cout << "  store_dir   Directory used as the object store (default: ./object_store)"
              << std::endl;
    std::cout << "  path_base   Key prefix for the uploaded object (default: examples)"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Set RESILIENT_TRANSFER_SECRET to choose the master secret (32+ bytes)."
              << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "--help") {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    const std::filesystem::path local_path = argv[1];
    const std::filesystem::path store_dir = argc > 2 ? argv[2] : "object_store";
    const std::string path_base = argc > 3 ? argv[3] : "examples";

    auto backend = local_storage_backend::create(store_dir);
    if (!backend) {
        std::cerr << "Cannot open object store: " << backend.error().message << std::endl;
        return 1;
    }

    storage_context storage;
    storage.storage_id = "local";
    storage.path_base = path_base;

    auto built = transfer_manager::builder()
                     .with_backend(backend.value())
                     .with_credential_source(std::make_shared<local_credential_source>())
                     .with_master_secret(master_secret_from_env())
                     .with_default_storage(storage)
                     .with_max_concurrent_transfers(2)
                     .build();
    if (!built) {
        std::cerr << "Cannot start transfer manager: " << built.error().message << std::endl;
        return 1;
    }
    auto& manager = built.value();
    auto progress = manager.subscribe(event_type::progress);

    // Upload
    std::cout << "Uploading " << local_path << std::endl;
    auto upload_id = manager.upload(local_path, path_base);
    if (!upload_id) {
        std::cerr << "Upload rejected: " << upload_id.error().message << std::endl;
        return 1;
    }
    auto uploaded = wait_with_progress(manager, progress, upload_id.value());
    if (!uploaded || uploaded.value().state != task_state::completed) {
        std::cerr << "Upload failed: " << describe_failure(uploaded) << std::endl;
        return 1;
    }
    const auto object_key = uploaded.value().object_key;
    std::cout << "Stored as " << object_key << std::endl;

    // Download next to the original
    auto restored = local_path;
    restored += ".restored";
    std::cout << "Downloading to " << restored << std::endl;
    submit_options options;
    options.overwrite = true;
    auto download_id = manager.download(object_key, restored, options);
    if (!download_id) {
        std::cerr << "Download rejected: " << download_id.error().message << std::endl;
        return 1;
    }
    auto downloaded = wait_with_progress(manager, progress, download_id.value());
    if (!downloaded || downloaded.value().state != task_state::completed) {
        std::cerr << "Download failed: " << describe_failure(downloaded) << std::endl;
        return 1;
    }

    auto original_sum = checksum::hash_file(local_path);
    auto restored_sum = checksum::hash_file(restored);
    if (!original_sum || !restored_sum) {
        std::cerr << "Cannot hash files for comparison" << std::endl;
        return 1;
    }
    const bool same = checksum::equals(original_sum.value(), restored_sum.value());
    std::cout << "SHA-512 " << (same ? "matches" : "DIFFERS") << ": "
              << restored_sum.value().substr(0, 16) << "..." << std::endl;

    const auto stats = manager.get_stats();
    std::cout << "Completed " << stats.completed << ", failed " << stats.failed << std::endl;

    manager.shutdown();
    return same ? 0 : 1;
}
