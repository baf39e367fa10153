/**
 * @file test_upload_lock.cpp
 * @brief Unit tests for the per-file upload lock
 */

#include <gtest/gtest.h>

#include <kcenon/resilient_transfer/core/upload_lock.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace kcenon::resilient_transfer::test {

class UploadLockTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("resilient_transfer_test_lock_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
        local_ = test_dir_ / "video.mp4";
        std::ofstream(local_) << "payload";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path local_;
};

TEST_F(UploadLockTest, LockPathIsSibling) {
    EXPECT_EQ(upload_lock::lock_path(local_), test_dir_ / "video.mp4.upload.lock");
}

TEST_F(UploadLockTest, AcquireCreatesAndReleaseRemoves) {
    auto lock = upload_lock::acquire(local_);
    ASSERT_TRUE(lock);
    EXPECT_TRUE(lock.value().is_held());
    EXPECT_TRUE(std::filesystem::exists(upload_lock::lock_path(local_)));

    lock.value().release();
    EXPECT_FALSE(lock.value().is_held());
    EXPECT_FALSE(std::filesystem::exists(upload_lock::lock_path(local_)));
}

TEST_F(UploadLockTest, SecondAcquireFails) {
    auto first = upload_lock::acquire(local_);
    ASSERT_TRUE(first);

    auto second = upload_lock::acquire(local_);
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, error_code::file_locked);
    EXPECT_NE(second.error().message.find("video.mp4"), std::string::npos);
}

TEST_F(UploadLockTest, DestructorReleases) {
    {
        auto lock = upload_lock::acquire(local_);
        ASSERT_TRUE(lock);
    }
    EXPECT_FALSE(std::filesystem::exists(upload_lock::lock_path(local_)));

    auto again = upload_lock::acquire(local_);
    EXPECT_TRUE(again);
}

TEST_F(UploadLockTest, MoveTransfersOwnership) {
    auto acquired = upload_lock::acquire(local_);
    ASSERT_TRUE(acquired);

    upload_lock owner = std::move(acquired).value();
    EXPECT_TRUE(owner.is_held());
    EXPECT_TRUE(std::filesystem::exists(owner.path()));

    upload_lock moved(std::move(owner));
    EXPECT_TRUE(moved.is_held());
    EXPECT_FALSE(owner.is_held());  // NOLINT(bugprone-use-after-move)

    moved.release();
    EXPECT_FALSE(std::filesystem::exists(upload_lock::lock_path(local_)));
}

TEST_F(UploadLockTest, StaleLockIsTakenOver) {
    const auto path = upload_lock::lock_path(local_);
    std::ofstream(path) << "pid=1\n";
    std::filesystem::last_write_time(
        path, std::filesystem::file_time_type::clock::now() - std::chrono::hours(2));

    auto lock = upload_lock::acquire(local_, std::chrono::minutes(30));
    ASSERT_TRUE(lock);
    EXPECT_TRUE(lock.value().is_held());
}

TEST_F(UploadLockTest, FreshForeignLockIsRespected) {
    std::ofstream(upload_lock::lock_path(local_)) << "pid=1\n";

    auto lock = upload_lock::acquire(local_, std::chrono::minutes(30));
    ASSERT_FALSE(lock);
    EXPECT_EQ(lock.error().code, error_code::file_locked);
    EXPECT_TRUE(std::filesystem::exists(upload_lock::lock_path(local_)));
}

}  // namespace kcenon::resilient_transfer::test
