/**
 * @file resume_transfer.cpp
 * @brief Pause, cancel and resume of a multipart upload
 *
 * This example demonstrates:
 * - Pausing a running upload and resuming it
 * - Cancelling an upload part way through
 * - Submitting the same file again, which continues from the saved parts
 */

#include <kcenon/resilient_transfer/resilient_transfer.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

using namespace kcenon::resilient_transfer;

namespace {

class local_credential_source : public credential_source {
public:
    auto fetch(const storage_context& context) -> result<credential_lease> override {
        credential_lease lease;
        lease.context = context;
        lease.access_key_id = "local";
        lease.issued_at = std::chrono::system_clock::now();
        lease.expires_at = lease.issued_at + std::chrono::hours(12);
        return lease;
    }
};

/**
 * @brief Create a test file for demonstration
 */
auto create_test_file(const std::filesystem::path& path, std::size_t size) -> bool {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::vector<char> buffer(std::min(size, std::size_t{65536}));
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>('A' + (i % 26));
    }

    std::size_t remaining = size;
    while (remaining > 0) {
        const auto to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }
    return static_cast<bool>(file);
}

/**
 * @brief Parse size string (e.g., "10M", "1G")
 */
auto parse_size(const std::string& size_str) -> std::size_t {
    std::size_t pos = 0;
    const double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        switch (static_cast<char>(std::toupper(size_str[pos]))) {
            case 'K': return static_cast<std::size_t>(value * 1024);
            case 'M': return static_cast<std::size_t>(value * 1024 * 1024);
            case 'G': return static_cast<std::size_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<std::size_t>(value);
}

/**
 * @brief Poll until the task passes @p fraction or stops
 */
auto wait_for_fraction(transfer_manager& manager, const transfer_id& id, double fraction)
    -> std::optional<task_snapshot> {
    while (true) {
        auto snapshot = manager.get_task(id);
        if (!snapshot) {
            return std::nullopt;
        }
        if (snapshot.value().is_terminal() || snapshot.value().progress.fraction >= fraction) {
            return snapshot.value();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

auto report(const task_snapshot& snapshot) -> void {
    std::cout << "  state=" << to_string(snapshot.state) << " progress="
              << static_cast<int>(snapshot.progress.fraction * 100.0) << "%";
    if (snapshot.failure) {
        std::cout << " failure=" << snapshot.failure->describe();
    }
    std::cout << std::endl;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Resume Transfer Example - Resilient Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --store <dir>           Object store directory (default: ./object_store)"
              << std::endl;
    std::cout << "  --create-test <size>    Create test file of specified size (e.g., 50M)"
              << std::endl;
    std::cout << "  --pause-at <percent>    Pause the first attempt at this point (default: 30)"
              << std::endl;
    std::cout << "  --cancel-at <percent>   Cancel the resumed attempt at this point (default: 60)"
              << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path store_dir = "object_store";
    std::filesystem::path local_path;
    std::optional<std::size_t> create_test_size;
    double pause_at = 0.30;
    double cancel_at = 0.60;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--store") {
            auto value = next();
            if (!value) return 1;
            store_dir = *value;
        } else if (arg == "--create-test") {
            auto value = next();
            if (!value) return 1;
            create_test_size = parse_size(*value);
        } else if (arg == "--pause-at") {
            auto value = next();
            if (!value) return 1;
            pause_at = std::stod(*value) / 100.0;
        } else if (arg == "--cancel-at") {
            auto value = next();
            if (!value) return 1;
            cancel_at = std::stod(*value) / 100.0;
        } else if (arg[0] != '-') {
            local_path = arg;
        }
    }

    if (local_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (create_test_size && !create_test_file(local_path, *create_test_size)) {
        std::cerr << "Cannot create " << local_path << std::endl;
        return 1;
    }

    auto backend = local_storage_backend::create(store_dir);
    if (!backend) {
        std::cerr << "Cannot open object store: " << backend.error().message << std::endl;
        return 1;
    }

    const std::string secret_text = "resume-example-master-secret-0123456789";
    byte_buffer secret(secret_text.size());
    for (std::size_t i = 0; i < secret_text.size(); ++i) {
        secret[i] = static_cast<std::byte>(secret_text[i]);
    }

    engine_config engine;
    engine.master_secret = secret;
    engine.min_part_size = 1024 * 1024;
    engine.part_size = 5 * 1024 * 1024;
    engine.multipart_threshold = 5 * 1024 * 1024;
    engine.default_storage.storage_id = "local";

    auto built = transfer_manager::builder()
                     .with_engine_config(engine)
                     .with_backend(backend.value())
                     .with_credential_source(std::make_shared<local_credential_source>())
                     .with_rate_limit(rate_limit_scope::storage_io, {20.0, 4})
                     .with_max_concurrent_transfers(1)
                     .build();
    if (!built) {
        std::cerr << "Cannot start transfer manager: " << built.error().message << std::endl;
        return 1;
    }
    auto& manager = built.value();

    // First attempt: pause, hold, resume, then cancel.
    std::cout << "[1] Uploading " << local_path << std::endl;
    auto first = manager.upload(local_path, "resume-demo");
    if (!first) {
        std::cerr << "Upload rejected: " << first.error().message << std::endl;
        return 1;
    }

    if (auto snapshot = wait_for_fraction(manager, first.value(), pause_at);
        snapshot && !snapshot->is_terminal()) {
        if (auto paused = manager.pause(first.value()); paused) {
            std::cout << "[2] Paused" << std::endl;
            std::this_thread::sleep_for(std::chrono::seconds(2));
            report(manager.get_task(first.value()).value());
            if (auto resumed = manager.resume(first.value()); !resumed) {
                std::cerr << "Resume failed: " << resumed.error().message << std::endl;
            } else {
                std::cout << "[3] Resumed" << std::endl;
            }
        }
    }

    if (auto snapshot = wait_for_fraction(manager, first.value(), cancel_at);
        snapshot && !snapshot->is_terminal()) {
        if (auto cancelled = manager.cancel(first.value()); cancelled) {
            std::cout << "[4] Cancelled; resume state kept beside the file" << std::endl;
        }
    }
    if (auto done = manager.wait(first.value(), std::chrono::minutes(5)); done) {
        report(done.value());
    }

    // Second attempt continues from the parts already stored.
    std::cout << "[5] Submitting again" << std::endl;
    auto second = manager.upload(local_path, "resume-demo");
    if (!second) {
        std::cerr << "Upload rejected: " << second.error().message << std::endl;
        return 1;
    }
    auto finished = manager.wait(second.value(), std::chrono::minutes(30));
    if (!finished) {
        std::cerr << "Wait failed: " << finished.error().message << std::endl;
        return 1;
    }
    report(finished.value());
    if (finished.value().state != task_state::completed) {
        return 1;
    }
    std::cout << "Stored as " << finished.value().object_key << std::endl;

    manager.shutdown();
    return 0;
}
