/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/resilient_transfer/resilient_transfer.h>

namespace kcenon::resilient_transfer::test {

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(VersionTest, MajorVersionIsCorrect) {
    EXPECT_EQ(version::major, 0);
}

TEST_F(VersionTest, MinorVersionIsCorrect) {
    EXPECT_EQ(version::minor, 1);
}

TEST_F(VersionTest, PatchVersionIsCorrect) {
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, DiskSpaceApiMatchesPlatform) {
#if defined(_WIN32)
    EXPECT_EQ(RESILIENT_TRANS_HAS_WIN32_DISK_API, 1);
#else
    EXPECT_EQ(RESILIENT_TRANS_HAS_WIN32_DISK_API, 0);
#endif
}

TEST_F(VersionTest, LoggerSystemFlagFollowsBuild) {
#if defined(BUILD_WITH_LOGGER_SYSTEM)
    EXPECT_EQ(KCENON_WITH_LOGGER_SYSTEM, 1);
#else
    EXPECT_EQ(KCENON_WITH_LOGGER_SYSTEM, 0);
#endif
}

TEST_F(VersionTest, ThreadSystemIsLinked) {
    EXPECT_EQ(KCENON_WITH_THREAD_SYSTEM, 1);
    EXPECT_EQ(KCENON_WITH_COMMON_SYSTEM, 1);
}

}  // namespace kcenon::resilient_transfer::test
