/**
 * @file test_disk_space.cpp
 * @brief Unit tests for free-space probing
 */

#include <gtest/gtest.h>

#include <kcenon/resilient_transfer/core/disk_space.h>

#include <cstdint>
#include <filesystem>
#include <limits>

namespace kcenon::resilient_transfer::test {

class DiskSpaceTest : public ::testing::Test {
protected:
    std::filesystem::path temp_ = std::filesystem::temp_directory_path();
};

TEST_F(DiskSpaceTest, AvailableSpaceOfTempDirectory) {
    auto space = available_space(temp_);
    ASSERT_TRUE(space);
    EXPECT_GT(space.value(), 0u);
}

TEST_F(DiskSpaceTest, MissingPathUsesNearestAncestor) {
    auto direct = available_space(temp_);
    auto nested = available_space(temp_ / "no" / "such" / "dir" / "file.bin");
    ASSERT_TRUE(direct);
    ASSERT_TRUE(nested);
    EXPECT_GT(nested.value(), 0u);
}

TEST_F(DiskSpaceTest, RequiredWithMargin) {
    EXPECT_EQ(required_with_margin(1000, 0.0), 1000u);
    EXPECT_EQ(required_with_margin(1000, 0.15), 1150u);
    EXPECT_EQ(required_with_margin(1001, 0.5), 1502u);
    EXPECT_EQ(required_with_margin(1000, -1.0), 1000u);
}

TEST_F(DiskSpaceTest, SmallRequirementFits) {
    EXPECT_TRUE(check_available_space(temp_, 1024, 0.15));
}

TEST_F(DiskSpaceTest, HugeRequirementFails) {
    const uint64_t huge = std::numeric_limits<uint64_t>::max() / 4;
    auto r = check_available_space(temp_, huge, 0.15);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::insufficient_disk_space);
    EXPECT_NE(r.error().message.find("MB"), std::string::npos);
    EXPECT_NE(r.error().message.find(temp_.string()), std::string::npos);
}

}  // namespace kcenon::resilient_transfer::test
