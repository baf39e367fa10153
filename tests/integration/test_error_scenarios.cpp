/**
 * @file test_error_scenarios.cpp
 * @brief Rejected submissions, remote faults and integrity failures
 */

#include "test_fixtures.h"

#include <kcenon/resilient_transfer/core/disk_space.h>

#include <fstream>
#include <random>
#include <sstream>

namespace kcenon::resilient_transfer::test {

class ErrorScenarioTest : public EngineFixture {
protected:
    auto download_with(const download_request& request) -> result<transfer_outcome> {
        auto task = make_task(transfer_direction::download, request.local_path, request.object_key);
        downloader engine(context());
        return engine.run(*task, request);
    }

    /**
     * @brief Stretch a stored object into a sparse one declaring @p parts full parts
     *
     * The object file is resized in place and its metadata rewritten, so
     * head_object reports a consistent layout without the bytes existing.
     */
    auto inflate_object(const std::string& key, uint64_t parts) -> bool {
        const auto object_file = remote_dir_ / "objects" / key;
        const auto meta_file = remote_dir_ / "meta" / key;

        std::ifstream in(meta_file);
        std::ostringstream rewritten;
        std::string line;
        while (std::getline(in, line)) {
            if (line.rfind(std::string(metadata_keys::plain_size) + "=", 0) == 0) {
                line = std::string(metadata_keys::plain_size) + "=" +
                       std::to_string(parts * test_part_size);
            } else if (line.rfind(std::string(metadata_keys::part_count) + "=", 0) == 0) {
                line = std::string(metadata_keys::part_count) + "=" + std::to_string(parts);
            }
            rewritten << line << '\n';
        }
        in.close();
        std::ofstream(meta_file, std::ios::trunc) << rewritten.str();

        std::error_code ec;
        std::filesystem::resize_file(object_file, parts * encrypted_size(test_part_size), ec);
        return !ec;
    }
};

// ============================================================================
// Duplicates
// ============================================================================

TEST_F(ErrorScenarioTest, DuplicateObjectIsRejected) {
    auto source = create_binary_file("dup.bin", 4096);
    ASSERT_TRUE(run_upload(source));

    backend_->reset();
    auto second = run_upload(source);
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, error_code::duplicate_object);
    EXPECT_EQ(backend_->list_calls.load(), 1);
    EXPECT_EQ(backend_->put_calls.load(), 0);

    transfer_failure failure("dup.bin", second.error());
    EXPECT_EQ(failure.category, error_category::fatal_validation);
    EXPECT_NE(failure.describe().find("dup.bin"), std::string::npos);
}

TEST_F(ErrorScenarioTest, DuplicateCheckIgnoresOtherPrefixes) {
    auto source = create_binary_file("dup.bin", 4096);
    ASSERT_TRUE(run_upload(source, "one"));
    EXPECT_TRUE(run_upload(source, "two"));

    auto similar = create_binary_file("dup.bin.bak", 4096);
    EXPECT_TRUE(run_upload(similar, "one"));
}

TEST_F(ErrorScenarioTest, FastModeSkipsDuplicateCheck) {
    config_.fast_mode = true;
    auto source = create_binary_file("fast.bin", 4096);

    ASSERT_TRUE(run_upload(source));
    ASSERT_TRUE(run_upload(source));
    EXPECT_EQ(backend_->list_calls.load(), 0);
    EXPECT_EQ(backend_->put_calls.load(), 2);
}

TEST_F(ErrorScenarioTest, AllowDuplicatesUploadsAgain) {
    config_.allow_duplicates = true;
    auto source = create_binary_file("again.bin", 4096);

    ASSERT_TRUE(run_upload(source));
    ASSERT_TRUE(run_upload(source));
    EXPECT_EQ(backend_->list_calls.load(), 2);
}

// ============================================================================
// Upload input
// ============================================================================

TEST_F(ErrorScenarioTest, MissingSourceFile) {
    auto r = run_upload(upload_dir_ / "absent.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_not_found);
}

TEST_F(ErrorScenarioTest, LockedSourceFile) {
    auto source = create_binary_file("locked.bin", 4096);
    auto held = upload_lock::acquire(source);
    ASSERT_TRUE(held);

    auto r = run_upload(source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_locked);
    EXPECT_EQ(backend_->put_calls.load(), 0);

    held.value().release();
    EXPECT_TRUE(run_upload(source));
}

TEST_F(ErrorScenarioTest, IncompleteContextIsRejected) {
    auto ctx = context();
    ctx.resumes = nullptr;
    uploader engine(ctx);

    auto source = create_binary_file("ctx.bin", 16);
    auto task = make_task(transfer_direction::upload, source, "x");
    upload_request request;
    request.local_path = source;
    auto r = engine.run(*task, request);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);
}

TEST_F(ErrorScenarioTest, ShortMasterSecretIsRejected) {
    config_.master_secret.resize(8);
    auto r = run_upload(create_binary_file("key.bin", 16));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);
}

// ============================================================================
// Remote faults
// ============================================================================

TEST_F(ErrorScenarioTest, TransientFaultsAreRetried) {
    auto source = create_binary_file("flaky.bin", 300 * 1024);

    // Every part call fails until the second attempt has been seen.
    backend_->fail_parts_after = 0;
    std::thread healer([this] {
        while (backend_->upload_part_calls.load() < 2) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        backend_->fail_parts_after = -1;
    });
    auto uploaded = run_upload(source);
    healer.join();

    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_GT(backend_->upload_part_calls.load(), 5);
    EXPECT_EQ(backend_->parts_stored.load(), 5);
}

TEST_F(ErrorScenarioTest, PersistentFaultExhaustsRetries) {
    auto source = create_binary_file("down.bin", 300 * 1024);
    backend_->fail_parts_after = 0;

    auto r = run_upload(source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::connection_reset);
    EXPECT_EQ(backend_->upload_part_calls.load(), static_cast<int>(fast_retry_policy().max_attempts));

    transfer_failure failure("down.bin", r.error());
    EXPECT_EQ(failure.category, error_category::retryable_network);
    EXPECT_FALSE(failure.remediation.empty());
}

TEST_F(ErrorScenarioTest, FatalFaultIsNotRetried) {
    auto source = create_binary_file("denied.bin", 300 * 1024);
    backend_->fail_parts_after = 0;
    backend_->injected_error = error_code::auth_denied;

    auto r = run_upload(source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::auth_denied);
    EXPECT_EQ(backend_->upload_part_calls.load(), 1);
}

// ============================================================================
// Download destination
// ============================================================================

TEST_F(ErrorScenarioTest, ExistingDifferentDestination) {
    auto source = create_binary_file("dest.bin", 4096);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded);

    auto target = download_dir_ / "dest.bin";
    std::ofstream(target) << "something else";

    auto refused = run_download(uploaded.value().object_key, target);
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().code, error_code::destination_exists);
    EXPECT_EQ(backend_->read_calls.load(), 0);

    auto replaced = run_download(uploaded.value().object_key, target, true);
    ASSERT_TRUE(replaced) << replaced.error().message;
    EXPECT_TRUE(files_equal(source, target));
}

TEST_F(ErrorScenarioTest, UnsafeDestinations) {
    auto parent_ref = downloader::check_destination(download_dir_ / ".." / "escape.bin",
                                                    std::nullopt);
    ASSERT_FALSE(parent_ref);
    EXPECT_EQ(parent_ref.error().code, error_code::path_unsafe);

    auto directory = downloader::check_destination(download_dir_, std::nullopt);
    ASSERT_FALSE(directory);
    EXPECT_EQ(directory.error().code, error_code::path_invalid);

    auto empty = downloader::check_destination({}, std::nullopt);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, error_code::path_invalid);

    auto outside = downloader::check_destination(test_dir_ / "elsewhere" / "x.bin", download_dir_);
    ASSERT_FALSE(outside);
    EXPECT_EQ(outside.error().code, error_code::path_unsafe);

    EXPECT_TRUE(downloader::check_destination(download_dir_ / "sub" / "ok.bin", download_dir_));
}

TEST_F(ErrorScenarioTest, DownloadRootIsEnforced) {
    auto source = create_binary_file("rooted.bin", 4096);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded);

    config_.download_root = download_dir_;
    auto outside = run_download(uploaded.value().object_key, test_dir_ / "rooted.bin");
    ASSERT_FALSE(outside);
    EXPECT_EQ(outside.error().code, error_code::path_unsafe);
    EXPECT_EQ(backend_->head_calls.load(), 0);

    auto inside = run_download(uploaded.value().object_key, download_dir_ / "nested" / "rooted.bin");
    ASSERT_TRUE(inside) << inside.error().message;
    EXPECT_TRUE(files_equal(source, download_dir_ / "nested" / "rooted.bin"));
}

// ============================================================================
// Remote object problems
// ============================================================================

TEST_F(ErrorScenarioTest, InsufficientDiskSpaceFailsBeforeReading) {
    auto source = create_binary_file("huge.bin", 150 * 1024);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;

    auto free_bytes = available_space(download_dir_);
    ASSERT_TRUE(free_bytes) << free_bytes.error().message;
    // Half the free space as plaintext plus the same again as ciphertext
    // cannot fit once the margin is added.
    const uint64_t parts = free_bytes.value() / 2 / test_part_size + 1;
    if (parts * test_part_size > (uint64_t{4} << 40)) {
        GTEST_SKIP() << "volume too large for a sparse stand-in object";
    }
    ASSERT_TRUE(inflate_object(uploaded.value().object_key, parts));
    backend_->reset();

    auto target = download_dir_ / "huge.bin";
    auto r = run_download(uploaded.value().object_key, target);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::insufficient_disk_space);
    EXPECT_EQ(backend_->head_calls.load(), 1);
    EXPECT_EQ(backend_->read_calls.load(), 0);
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(target.string() + ".partial")));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(target.string() + ".encrypted")));
    EXPECT_FALSE(std::filesystem::exists(
        resume_store::state_path(target, transfer_direction::download)));

    transfer_failure failure("huge.bin", r.error());
    EXPECT_FALSE(failure.remediation.empty());
}

TEST_F(ErrorScenarioTest, MissingObject) {
    auto r = run_download("projects/7/none.bin-abc", download_dir_ / "none.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::object_not_found);
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "none.bin"));
}

TEST_F(ErrorScenarioTest, EmptyObjectKey) {
    auto r = run_download("", download_dir_ / "x.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_argument);
}

TEST_F(ErrorScenarioTest, DeclaredSizeMustMatch) {
    auto source = create_binary_file("declared.bin", 4096);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded);

    download_request request;
    request.object_key = uploaded.value().object_key;
    request.local_path = download_dir_ / "declared.bin";
    request.declared_size = 4095;
    auto r = download_with(request);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::size_mismatch);
    EXPECT_EQ(backend_->read_calls.load(), 0);

    request.declared_size = 4096;
    EXPECT_TRUE(download_with(request));
}

TEST_F(ErrorScenarioTest, ObjectWithoutMetadataIsRejected) {
    auto plain = create_binary_file("foreign.bin", 1024);
    ASSERT_TRUE(backend_->inner()->put_object(test_lease(), "foreign/foreign.bin", plain, {}));

    auto r = run_download("foreign/foreign.bin", download_dir_ / "foreign.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_argument);
}

TEST_F(ErrorScenarioTest, TamperedObjectNeverReachesDestination) {
    auto source = create_binary_file("tampered.bin", 150 * 1024);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded);

    std::vector<std::byte> noise(static_cast<std::size_t>(uploaded.value().remote_size));
    std::mt19937 gen(1234);
    for (auto& b : noise) {
        b = static_cast<std::byte>(gen() & 0xFF);
    }
    ASSERT_TRUE(backend_->inner()->overwrite_object(uploaded.value().object_key, noise));

    auto target = download_dir_ / "tampered.bin";
    auto r = run_download(uploaded.value().object_key, target);
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().code == error_code::cipher_error ||
                r.error().code == error_code::checksum_mismatch)
        << r.error().message;
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(target.string() + ".partial")));
}

TEST_F(ErrorScenarioTest, WrongMasterSecretCannotDecrypt) {
    auto source = create_binary_file("foreign_key.bin", 150 * 1024);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded);

    config_.master_secret = byte_buffer(40, std::byte{0x5A});
    auto target = download_dir_ / "foreign_key.bin";
    auto r = run_download(uploaded.value().object_key, target);
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().code == error_code::cipher_error ||
                r.error().code == error_code::checksum_mismatch)
        << r.error().message;
    EXPECT_FALSE(std::filesystem::exists(target));
}

// ============================================================================
// Manager failure reporting
// ============================================================================

class ManagerErrorTest : public ManagerFixture {};

TEST_F(ManagerErrorTest, FailedTransferCarriesFailure) {
    auto failed_events = manager_->subscribe(event_type::failed);

    auto id = manager_->upload(upload_dir_ / "ghost.bin", "g");
    ASSERT_TRUE(id);
    auto snapshot = finish(id.value(), task_state::failed);
    ASSERT_TRUE(snapshot.failure.has_value());
    EXPECT_EQ(snapshot.failure->code, error_code::file_not_found);
    EXPECT_EQ(snapshot.failure->object, "ghost.bin");

    auto event = failed_events->wait_pop(std::chrono::seconds(5));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->id, id.value());
    EXPECT_FALSE(event->error.empty());

    auto stats = wait_for_stats([](const manager_stats& s) { return s.failed == 1; });
    EXPECT_EQ(stats.failed, 1u);
}

TEST_F(ManagerErrorTest, FastModeManagerAllowsRepeatUploads) {
    build_manager(2, true);
    auto source = create_binary_file("fm.bin", 2048);

    auto first = manager_->upload(source, "fm");
    ASSERT_TRUE(first);
    finish(first.value());
    auto second = manager_->upload(source, "fm");
    ASSERT_TRUE(second);
    finish(second.value());
    EXPECT_EQ(backend_->list_calls.load(), 0);
}

TEST_F(ManagerErrorTest, DuplicateThroughManagerFails) {
    auto source = create_binary_file("dm.bin", 2048);
    auto first = manager_->upload(source, "dm");
    ASSERT_TRUE(first);
    finish(first.value());

    auto second = manager_->upload(source, "dm");
    ASSERT_TRUE(second);
    auto snapshot = finish(second.value(), task_state::failed);
    ASSERT_TRUE(snapshot.failure.has_value());
    EXPECT_EQ(snapshot.failure->code, error_code::duplicate_object);
}

TEST_F(ManagerErrorTest, PurgeStaleResumeStatesThroughManager) {
    const auto junk = upload_dir_ / "old.bin.download.resume";
    std::ofstream(junk) << "{broken";
    EXPECT_EQ(manager_->purge_stale_resume_states(upload_dir_), 1u);
    EXPECT_FALSE(std::filesystem::exists(junk));
    EXPECT_EQ(manager_->purge_stale_resume_states(test_dir_ / "missing"), 0u);
}

}  // namespace kcenon::resilient_transfer::test
