/**
 * @file test_basic_scenarios.cpp
 * @brief Upload and download round trips through the engines and the manager
 */

#include "test_fixtures.h"

#include <algorithm>
#include <set>

namespace kcenon::resilient_transfer::test {

// ============================================================================
// Engine round trips
// ============================================================================

class BasicTransferTest : public EngineFixture {
protected:
    auto no_leftovers(const std::filesystem::path& local) -> bool {
        return !std::filesystem::exists(std::filesystem::path(local.string() + ".encrypted")) &&
               !std::filesystem::exists(std::filesystem::path(local.string() + ".partial")) &&
               !std::filesystem::exists(resume_store::state_path(local, transfer_direction::upload)) &&
               !std::filesystem::exists(
                   resume_store::state_path(local, transfer_direction::download)) &&
               !std::filesystem::exists(upload_lock::lock_path(local));
    }
};

TEST_F(BasicTransferTest, SingleShotRoundTrip) {
    auto source = create_binary_file("small.bin", 10 * 1024);

    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_EQ(uploaded.value().part_count, 1u);
    EXPECT_EQ(uploaded.value().parts_transferred, 1u);
    EXPECT_EQ(uploaded.value().plain_size, 10u * 1024u);
    EXPECT_EQ(uploaded.value().remote_size, encrypted_size(10 * 1024));
    EXPECT_EQ(uploaded.value().object_key.rfind("projects/7/small.bin-", 0), 0u);
    EXPECT_FALSE(uploaded.value().resumed);
    EXPECT_EQ(backend_->put_calls.load(), 1);
    EXPECT_EQ(backend_->create_calls.load(), 0);
    EXPECT_TRUE(no_leftovers(source));

    auto target = download_dir_ / "small.bin";
    auto downloaded = run_download(uploaded.value().object_key, target);
    ASSERT_TRUE(downloaded) << downloaded.error().message;
    EXPECT_EQ(downloaded.value().checksum, uploaded.value().checksum);
    EXPECT_TRUE(files_equal(source, target));
    EXPECT_TRUE(no_leftovers(target));
}

TEST_F(BasicTransferTest, SingleShotDownloadReadsBoundedRanges) {
    // Below the threshold but larger than one configured part.
    const std::size_t size = 90 * 1024;
    auto source = create_binary_file("bounded.bin", size);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    ASSERT_EQ(uploaded.value().part_count, 1u);

    backend_->reset();
    auto target = download_dir_ / "bounded.bin";
    auto downloaded = run_download(uploaded.value().object_key, target);
    ASSERT_TRUE(downloaded) << downloaded.error().message;

    EXPECT_LE(backend_->largest_read.load(), encrypted_size(test_part_size));
    EXPECT_EQ(backend_->read_calls.load(), 2);
    EXPECT_TRUE(files_equal(source, target));
    EXPECT_TRUE(no_leftovers(target));
}

TEST_F(BasicTransferTest, EmptyFileRoundTrip) {
    auto source = create_binary_file("empty.bin", 0);

    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_EQ(uploaded.value().part_count, 1u);
    EXPECT_EQ(uploaded.value().remote_size, encrypted_size(0));

    auto target = download_dir_ / "empty.bin";
    auto downloaded = run_download(uploaded.value().object_key, target);
    ASSERT_TRUE(downloaded) << downloaded.error().message;
    ASSERT_TRUE(std::filesystem::exists(target));
    EXPECT_EQ(std::filesystem::file_size(target), 0u);
}

TEST_F(BasicTransferTest, MultipartRoundTrip) {
    const std::size_t size = 300 * 1024;
    auto source = create_binary_file("large.bin", size);

    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_EQ(uploaded.value().part_count, 5u);
    EXPECT_EQ(uploaded.value().parts_transferred, 5u);
    EXPECT_EQ(backend_->create_calls.load(), 1);
    EXPECT_EQ(backend_->upload_part_calls.load(), 5);
    EXPECT_EQ(backend_->complete_calls.load(), 1);
    EXPECT_EQ(backend_->put_calls.load(), 0);

    const uint64_t expected_remote = 4 * encrypted_size(test_part_size) +
                                     encrypted_size(size - 4 * test_part_size);
    EXPECT_EQ(uploaded.value().remote_size, expected_remote);
    EXPECT_TRUE(no_leftovers(source));

    auto target = download_dir_ / "large.bin";
    auto downloaded = run_download(uploaded.value().object_key, target);
    ASSERT_TRUE(downloaded) << downloaded.error().message;
    EXPECT_EQ(downloaded.value().parts_transferred, 5u);
    EXPECT_EQ(backend_->read_calls.load(), 5);
    EXPECT_TRUE(files_equal(source, target));
    EXPECT_TRUE(no_leftovers(target));
}

TEST_F(BasicTransferTest, SizeAtThresholdUsesMultipart) {
    auto source = create_binary_file("edge.bin", test_multipart_threshold);

    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_EQ(backend_->create_calls.load(), 1);
    EXPECT_EQ(uploaded.value().part_count, 2u);

    auto below = create_binary_file("below.bin", test_multipart_threshold - 1, 7);
    auto single = run_upload(below);
    ASSERT_TRUE(single) << single.error().message;
    EXPECT_EQ(single.value().part_count, 1u);
    EXPECT_EQ(backend_->put_calls.load(), 1);
}

TEST_F(BasicTransferTest, ObjectMetadataDescribesLayout) {
    const std::size_t size = 200 * 1024;
    auto source = create_binary_file("layout.bin", size);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;

    auto info = backend_->inner()->head_object(test_lease(), uploaded.value().object_key);
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().find_metadata(metadata_keys::plain_size), std::to_string(size));
    EXPECT_EQ(info.value().find_metadata(metadata_keys::part_size), std::to_string(test_part_size));
    EXPECT_EQ(info.value().find_metadata(metadata_keys::part_count), "4");
    EXPECT_EQ(info.value().find_metadata(metadata_keys::cipher), std::string(cipher_identifier));
    EXPECT_EQ(info.value().find_metadata(metadata_keys::checksum), uploaded.value().checksum);

    auto layout = object_layout::from_object(info.value());
    ASSERT_TRUE(layout) << layout.error().message;
    EXPECT_EQ(layout.value().plain_size, size);
    EXPECT_EQ(layout.value().part_count, 4u);
    EXPECT_EQ(layout.value().file_id.size(), file_id_size);
    EXPECT_EQ(layout.value().checksum.size(), 128u);
}

TEST_F(BasicTransferTest, LayoutRejectsWrongPartCount) {
    auto source = create_binary_file("miscounted.bin", 200 * 1024);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;

    auto info = backend_->inner()->head_object(test_lease(), uploaded.value().object_key);
    ASSERT_TRUE(info);
    info.value().metadata[std::string(metadata_keys::part_count)] = "3";

    auto layout = object_layout::from_object(info.value());
    ASSERT_FALSE(layout);
    EXPECT_EQ(layout.error().code, error_code::invalid_argument);
}

TEST_F(BasicTransferTest, StoredBytesAreCiphertext) {
    auto source = create_binary_file("secret.bin", 20 * 1024);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;

    const auto stored = remote_dir_ / "objects" / uploaded.value().object_key;
    ASSERT_TRUE(std::filesystem::exists(stored));
    EXPECT_EQ(std::filesystem::file_size(stored), encrypted_size(20 * 1024));

    auto plain = read_file(source);
    auto cipher = read_file(stored);
    cipher.resize(plain.size());
    EXPECT_NE(plain, cipher);
}

TEST_F(BasicTransferTest, RepeatedUploadsGetDistinctKeys) {
    config_.allow_duplicates = true;
    auto source = create_binary_file("twice.bin", 4 * 1024);

    std::set<std::string> keys;
    for (int i = 0; i < 3; ++i) {
        auto uploaded = run_upload(source);
        ASSERT_TRUE(uploaded) << uploaded.error().message;
        keys.insert(uploaded.value().object_key);
    }
    EXPECT_EQ(keys.size(), 3u);
}

TEST_F(BasicTransferTest, PathBaseIsNormalized) {
    auto source = create_binary_file("norm.bin", 1024);
    auto uploaded = run_upload(source, "a/b//");
    ASSERT_TRUE(uploaded) << uploaded.error().message;
    EXPECT_EQ(uploaded.value().object_key.rfind("a/b/norm.bin-", 0), 0u);

    EXPECT_EQ(uploader::make_object_key("", "f.txt", "abc"), "f.txt-abc");
    EXPECT_EQ(uploader::make_object_key("x/", "f.txt", "abc"), "x/f.txt-abc");
}

TEST_F(BasicTransferTest, MatchingDestinationIsNotFetchedAgain) {
    auto source = create_binary_file("again.bin", 150 * 1024);
    auto uploaded = run_upload(source);
    ASSERT_TRUE(uploaded) << uploaded.error().message;

    auto target = download_dir_ / "again.bin";
    ASSERT_TRUE(run_download(uploaded.value().object_key, target));
    backend_->reset();

    auto second = run_download(uploaded.value().object_key, target);
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_TRUE(second.value().already_complete);
    EXPECT_EQ(second.value().parts_transferred, 0u);
    EXPECT_EQ(backend_->read_calls.load(), 0);
    EXPECT_TRUE(files_equal(source, target));
}

TEST_F(BasicTransferTest, ProgressReachesTotal) {
    auto source = create_binary_file("progress.bin", 300 * 1024);

    auto task = make_task(transfer_direction::upload, source, "p");
    std::atomic<int> notifications{0};
    transfer_observer observer;
    observer.on_progress = [&](const transfer_task&) { ++notifications; };

    uploader engine(context());
    upload_request request;
    request.local_path = source;
    request.path_base = "p";
    auto uploaded = engine.run(*task, request, observer);
    ASSERT_TRUE(uploaded) << uploaded.error().message;

    auto progress = task->progress();
    EXPECT_EQ(progress.total_bytes, 300u * 1024u);
    EXPECT_EQ(progress.bytes_transferred, 300u * 1024u);
    EXPECT_DOUBLE_EQ(progress.fraction, 1.0);
    EXPECT_GE(notifications.load(), 1);
    EXPECT_EQ(task->state(), task_state::active);
    EXPECT_EQ(task->snapshot().object_key, uploaded.value().object_key);
}

// ============================================================================
// Manager round trips
// ============================================================================

class ManagerScenarioTest : public ManagerFixture {};

TEST_F(ManagerScenarioTest, UploadThenDownload) {
    auto events = manager_->subscribe_all();
    auto source = create_binary_file("model.bin", 250 * 1024);

    auto up_id = manager_->upload(source, "projects/42");
    ASSERT_TRUE(up_id);
    auto up = finish(up_id.value());
    ASSERT_FALSE(up.object_key.empty());
    EXPECT_EQ(up.descriptor.origin, "api");
    EXPECT_EQ(up.descriptor.declared_size, 250u * 1024u);
    EXPECT_TRUE(up.started_at.has_value());
    EXPECT_TRUE(up.completed_at.has_value());

    auto target = download_dir_ / "model.bin";
    auto down_id = manager_->download(up.object_key, target);
    ASSERT_TRUE(down_id);
    auto down = finish(down_id.value());
    EXPECT_DOUBLE_EQ(down.progress.fraction, 1.0);
    EXPECT_TRUE(files_equal(source, target));

    auto stats = wait_for_stats([](const manager_stats& s) { return s.completed == 2; });
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(stats.active_transfers, 0u);
    EXPECT_EQ(stats.queued_transfers, 0u);

    std::vector<event_type> seen;
    for (const auto& event : collect_until(*events, up_id.value(), event_type::completed)) {
        seen.push_back(event.type);
    }
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.front(), event_type::queued);
    EXPECT_EQ(seen.back(), event_type::completed);
    EXPECT_NE(std::find(seen.begin(), seen.end(), event_type::started), seen.end());
}

TEST_F(ManagerScenarioTest, StatsEventsCarryCounters) {
    auto stats_events = manager_->subscribe(event_type::queue_stats_updated);
    auto source = create_binary_file("stats.bin", 2048);

    auto id = manager_->upload(source, "s");
    ASSERT_TRUE(id);
    finish(id.value());

    std::optional<manager_stats> last;
    for (auto event = stats_events->wait_pop(std::chrono::seconds(2)); event;
         event = stats_events->wait_pop(std::chrono::milliseconds(200))) {
        EXPECT_EQ(event->type, event_type::queue_stats_updated);
        ASSERT_TRUE(event->stats.has_value());
        last = event->stats;
    }
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->completed, 1u);
    EXPECT_GT(last->total_slots, 0u);
}

TEST_F(ManagerScenarioTest, TaskListingAndPurge) {
    auto a = manager_->upload(create_binary_file("a.bin", 1024, 1), "l");
    auto b = manager_->upload(create_binary_file("b.bin", 1024, 2), "l");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    finish(a.value());
    finish(b.value());

    auto tasks = manager_->list_tasks();
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_LE(tasks[0].created_at, tasks[1].created_at);

    EXPECT_EQ(manager_->purge_terminal(), 2u);
    EXPECT_TRUE(manager_->list_tasks().empty());

    auto gone = manager_->get_task(a.value());
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, error_code::transfer_not_found);
}

TEST_F(ManagerScenarioTest, UnknownIdsAreReported) {
    const auto unknown = transfer_id::generate();

    auto state = manager_->get_state(unknown);
    ASSERT_FALSE(state);
    EXPECT_EQ(state.error().code, error_code::transfer_not_found);

    auto cancelled = manager_->cancel(unknown);
    ASSERT_FALSE(cancelled);
    EXPECT_EQ(cancelled.error().code, error_code::transfer_not_found);

    EXPECT_EQ(manager_->pause(unknown).error().code, error_code::transfer_not_found);
    EXPECT_EQ(manager_->resume(unknown).error().code, error_code::transfer_not_found);
    EXPECT_EQ(manager_->get_progress(unknown).error().code, error_code::transfer_not_found);
    EXPECT_EQ(manager_->wait(unknown, std::chrono::milliseconds(1)).error().code,
              error_code::transfer_not_found);
}

TEST_F(ManagerScenarioTest, SubmitValidatesArguments) {
    auto no_path = manager_->submit(transfer_direction::upload, "", "base", 0, "cli");
    ASSERT_FALSE(no_path);
    EXPECT_EQ(no_path.error().code, error_code::invalid_argument);

    auto no_key = manager_->download("", download_dir_ / "x.bin");
    ASSERT_FALSE(no_key);
    EXPECT_EQ(no_key.error().code, error_code::invalid_argument);
}

TEST_F(ManagerScenarioTest, SubmitRecordsBatchAndOrigin) {
    submit_options options;
    options.batch_id = "batch-1";
    options.batch_label = "nightly";
    auto source = create_binary_file("batch.bin", 512);

    auto id = manager_->submit(transfer_direction::upload, source, "b", 512, "scheduler", options);
    ASSERT_TRUE(id);
    auto done = finish(id.value());
    EXPECT_EQ(done.descriptor.origin, "scheduler");
    EXPECT_EQ(done.descriptor.batch_id, std::optional<std::string>("batch-1"));
    EXPECT_EQ(done.descriptor.batch_label, std::optional<std::string>("nightly"));
    EXPECT_EQ(done.descriptor.name(), "batch.bin");
}

TEST_F(ManagerScenarioTest, WaitTimeoutReturnsCurrentSnapshot) {
    backend_->part_delay = std::chrono::milliseconds(300);
    auto source = create_binary_file("slow.bin", 300 * 1024);

    auto id = manager_->upload(source, "w");
    ASSERT_TRUE(id);
    auto early = manager_->wait(id.value(), std::chrono::milliseconds(20));
    ASSERT_TRUE(early);
    EXPECT_FALSE(early.value().is_terminal());

    finish(id.value());
}

TEST_F(ManagerScenarioTest, BuilderRejectsIncompleteSetup) {
    auto no_backend = transfer_manager::builder()
                          .with_credential_source(source_)
                          .with_master_secret(test_master_secret())
                          .build();
    ASSERT_FALSE(no_backend);
    EXPECT_EQ(no_backend.error().code, error_code::invalid_configuration);

    auto no_source = transfer_manager::builder()
                         .with_backend(backend_)
                         .with_master_secret(test_master_secret())
                         .build();
    ASSERT_FALSE(no_source);
    EXPECT_EQ(no_source.error().code, error_code::invalid_configuration);

    auto no_secret = transfer_manager::builder()
                         .with_backend(backend_)
                         .with_credential_source(source_)
                         .build();
    ASSERT_FALSE(no_secret);
    EXPECT_EQ(no_secret.error().code, error_code::invalid_configuration);

    auto too_many = transfer_manager::builder()
                        .with_backend(backend_)
                        .with_credential_source(source_)
                        .with_master_secret(test_master_secret())
                        .with_max_concurrent_transfers(11)
                        .build();
    ASSERT_FALSE(too_many);
    EXPECT_EQ(too_many.error().code, error_code::invalid_configuration);
}

TEST_F(ManagerScenarioTest, ShutdownRejectsNewWork) {
    EXPECT_TRUE(manager_->is_running());
    manager_->shutdown();
    EXPECT_FALSE(manager_->is_running());

    auto id = manager_->upload(create_binary_file("late.bin", 100), "x");
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, error_code::shut_down);

    auto allocation = manager_->allocate_transfer(1024);
    ASSERT_FALSE(allocation);
    EXPECT_EQ(allocation.error().code, error_code::shut_down);

    manager_->shutdown();  // idempotent
}

TEST_F(ManagerScenarioTest, AllocateAndCompleteThroughManager) {
    auto allocation = manager_->allocate_transfer(2 * gibibyte, transfer_priority::high);
    ASSERT_TRUE(allocation);
    EXPECT_GE(allocation.value()->threads(), 1u);
    EXPECT_GT(manager_->resource_statistics().active_threads, 0u);

    manager_->complete(allocation.value());
    manager_->complete(allocation.value());
    EXPECT_TRUE(allocation.value()->is_complete());
    EXPECT_EQ(manager_->resource_statistics().active_threads, 0u);
}

}  // namespace kcenon::resilient_transfer::test
