/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, classification, result, transfer_id)
 */

#include <gtest/gtest.h>

#include <kcenon/resilient_transfer/core/error_codes.h>
#include <kcenon/resilient_transfer/core/transfer_id.h>
#include <kcenon/resilient_transfer/core/types.h>

#include <memory>
#include <string>
#include <unordered_set>

namespace kcenon::resilient_transfer::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Network errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::transient_network), -100);
    EXPECT_EQ(static_cast<int>(error_code::server_error), -104);

    // Throttling errors: -120 to -129
    EXPECT_EQ(static_cast<int>(error_code::throttled), -120);

    // Authentication errors: -130 to -139
    EXPECT_EQ(static_cast<int>(error_code::auth_expired), -130);
    EXPECT_EQ(static_cast<int>(error_code::credentials_unavailable), -132);

    // Validation errors: -140 to -179
    EXPECT_EQ(static_cast<int>(error_code::checksum_mismatch), -140);
    EXPECT_EQ(static_cast<int>(error_code::transfer_not_found), -152);

    // Resource errors: -180 to -199
    EXPECT_EQ(static_cast<int>(error_code::insufficient_disk_space), -180);
    EXPECT_EQ(static_cast<int>(error_code::file_locked), -184);

    // Lifecycle errors: -200 to -219
    EXPECT_EQ(static_cast<int>(error_code::cancelled), -200);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -210);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::throttled), "request throttled");
    EXPECT_STREQ(to_string(error_code::destination_exists), "destination already exists");
}

TEST_F(ErrorCodeTest, ErrorCarriesDefaultMessage) {
    error err(error_code::file_not_found);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "file not found");
    EXPECT_FALSE(err.retry_after.has_value());

    error none;
    EXPECT_FALSE(static_cast<bool>(none));
}

TEST_F(ErrorCodeTest, ErrorCarriesRetryAfter) {
    error err(error_code::throttled, "slow down", std::chrono::milliseconds(1500));
    ASSERT_TRUE(err.retry_after.has_value());
    EXPECT_EQ(err.retry_after->count(), 1500);
}

// =============================================================================
// Classification Tests
// =============================================================================

class ErrorClassificationTest : public ::testing::Test {};

TEST_F(ErrorClassificationTest, NetworkErrorsAreRetryable) {
    EXPECT_EQ(classify(error_code::transient_network), error_category::retryable_network);
    EXPECT_EQ(classify(error_code::connection_reset), error_category::retryable_network);
    EXPECT_EQ(classify(error_code::server_error), error_category::retryable_network);
    EXPECT_TRUE(is_retryable(error_code::connection_timeout));
}

TEST_F(ErrorClassificationTest, ThrottlingIsRetryable) {
    EXPECT_EQ(classify(error_code::throttled), error_category::retryable_throttle);
    EXPECT_TRUE(is_retryable(error_code::throttled));
}

TEST_F(ErrorClassificationTest, FatalCategories) {
    EXPECT_EQ(classify(error_code::auth_denied), error_category::fatal_auth);
    EXPECT_EQ(classify(error_code::auth_expired), error_category::fatal_auth);
    EXPECT_EQ(classify(error_code::checksum_mismatch), error_category::fatal_validation);
    EXPECT_EQ(classify(error_code::path_unsafe), error_category::fatal_validation);
    EXPECT_EQ(classify(error_code::insufficient_disk_space), error_category::fatal_resource);
    EXPECT_EQ(classify(error_code::shut_down), error_category::fatal_resource);
    EXPECT_EQ(classify(error_code::internal_error), error_category::fatal_resource);
    EXPECT_FALSE(is_retryable(error_code::auth_denied));
    EXPECT_FALSE(is_retryable(error_code::size_mismatch));
}

TEST_F(ErrorClassificationTest, CancellationAndSuccess) {
    EXPECT_EQ(classify(error_code::cancelled), error_category::cancelled);
    EXPECT_EQ(classify(error_code::success), error_category::none);
    EXPECT_FALSE(is_retryable(error_code::cancelled));
}

TEST_F(ErrorClassificationTest, RemediationHints) {
    EXPECT_FALSE(remediation_hint(error_code::destination_exists).empty());
    EXPECT_FALSE(remediation_hint(error_code::insufficient_disk_space).empty());
    EXPECT_FALSE(remediation_hint(error_code::duplicate_object).empty());
    EXPECT_TRUE(remediation_hint(error_code::transient_network).empty());
}

TEST_F(ErrorClassificationTest, TransferFailureDescribe) {
    transfer_failure failure("report.pdf", error(error_code::destination_exists,
                                                 "/tmp/report.pdf already exists"));

    EXPECT_EQ(failure.code, error_code::destination_exists);
    EXPECT_EQ(failure.category, error_category::fatal_validation);

    auto text = failure.describe();
    EXPECT_NE(text.find("report.pdf: /tmp/report.pdf already exists"), std::string::npos);
    EXPECT_NE(text.find("[fatal_validation]"), std::string::npos);
    EXPECT_NE(text.find("hint: set the overwrite option"), std::string::npos);
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r(42);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected(error(error_code::object_not_found, "gone"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::object_not_found);
    EXPECT_EQ(r.error().message, "gone");
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r(std::make_unique<int>(7));
    ASSERT_TRUE(r);
    auto owned = std::move(r).value();
    EXPECT_EQ(*owned, 7);
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok);

    result<void> failed = unexpected(error(error_code::cancelled));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::cancelled);
}

// =============================================================================
// transfer_id Tests
// =============================================================================

class TransferIdTest : public ::testing::Test {};

TEST_F(TransferIdTest, DefaultConstructionIsNull) {
    transfer_id id;
    EXPECT_TRUE(id.is_null());
}

TEST_F(TransferIdTest, GenerateIsVersion4) {
    auto id = transfer_id::generate();
    EXPECT_FALSE(id.is_null());
    EXPECT_EQ(id.bytes[6] & 0xF0, 0x40);
    EXPECT_EQ(id.bytes[8] & 0xC0, 0x80);
}

TEST_F(TransferIdTest, GenerateUniqueness) {
    std::unordered_set<transfer_id> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(transfer_id::generate());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(TransferIdTest, ToStringFormat) {
    auto text = transfer_id::generate().to_string();
    ASSERT_EQ(text.size(), 36u);
    EXPECT_EQ(text[8], '-');
    EXPECT_EQ(text[13], '-');
    EXPECT_EQ(text[14], '4');
    EXPECT_EQ(text[18], '-');
    EXPECT_EQ(text[23], '-');
}

TEST_F(TransferIdTest, FromStringRoundTrip) {
    auto id = transfer_id::generate();
    auto parsed = transfer_id::from_string(id.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST_F(TransferIdTest, FromStringAcceptsUppercase) {
    auto parsed = transfer_id::from_string("0123ABCD-0000-4000-8000-00000000FFFF");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->to_string(), "0123abcd-0000-4000-8000-00000000ffff");
}

TEST_F(TransferIdTest, FromStringInvalid) {
    EXPECT_FALSE(transfer_id::from_string("").has_value());
    EXPECT_FALSE(transfer_id::from_string("not-a-uuid").has_value());
    EXPECT_FALSE(transfer_id::from_string("0123abcd-0000-4000-8000-00000000ffff00").has_value());
    EXPECT_FALSE(transfer_id::from_string("0123abcd-0000-4000-8000-00000000fff").has_value());
}

TEST_F(TransferIdTest, Ordering) {
    transfer_id a;
    transfer_id b;
    b.bytes[15] = 1;
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
}

}  // namespace kcenon::resilient_transfer::test
