/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and secret masking
 */

#include <gtest/gtest.h>

#include <kcenon/resilient_transfer/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace kcenon::resilient_transfer::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfigMasksSecretsOnly) {
    masking_config config;

    EXPECT_TRUE(config.mask_secrets);
    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_filenames);
    EXPECT_EQ(config.mask_char, '*');
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, Presets) {
    auto all = masking_config::all_masked();
    EXPECT_TRUE(all.mask_secrets);
    EXPECT_TRUE(all.mask_paths);
    EXPECT_TRUE(all.mask_filenames);

    auto none = masking_config::none();
    EXPECT_FALSE(none.mask_secrets);
    EXPECT_FALSE(none.mask_paths);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, MasksSecretAssignments) {
    sensitive_info_masker masker;

    auto result = masker.mask("refresh with secret_access_key=ABCDEFGH done");

    EXPECT_EQ(result, "refresh with secret_access_key=ABCD**** done");
}

TEST_F(SensitiveInfoMaskerTest, MasksSasTokenInQueryString) {
    sensitive_info_masker masker;

    auto result = masker.mask("GET /container/blob?sig=0123456789abcdef&se=2030");

    EXPECT_EQ(result.find("0123456789abcdef"), std::string::npos);
    EXPECT_NE(result.find("sig=0123"), std::string::npos);
    EXPECT_NE(result.find("&se=2030"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, ShortSecretKeepsHalfVisible) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_secret("ab"), "a*");
    EXPECT_EQ(masker.mask_secret(""), "");
}

TEST_F(SensitiveInfoMaskerTest, PlainTextUntouched) {
    sensitive_info_masker masker;
    std::string input = "Uploaded part 3 of 5 to projects/42/model.bin-x7Qa";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, NoneConfigLeavesSecrets) {
    sensitive_info_masker masker(masking_config::none());
    std::string input = "token=abcdefgh";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePath) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/home/user/documents/secret.txt");

    EXPECT_NE(result.find("secret.txt"), std::string::npos);
    EXPECT_EQ(result.find("/home/"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePathWithFilename) {
    masking_config config;
    config.mask_paths = true;
    config.mask_filenames = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/data/uploads/checkpoint.bin");

    EXPECT_NE(result.find("chec"), std::string::npos);
    EXPECT_NE(result.find(".bin"), std::string::npos);
    EXPECT_EQ(result.find("checkpoint"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("Resume state saved to /var/tmp/data.zip.upload.resume");

    EXPECT_EQ(result.find("/var/tmp/"), std::string::npos);
    EXPECT_NE(result.find("data.zip.upload.resume"), std::string::npos);
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, AllFieldsToJson) {
    transfer_log_context ctx;
    ctx.transfer_id = "transfer-001";
    ctx.object = "projects/42/data.zip-abc";
    ctx.direction = "upload";
    ctx.part_number = 3;
    ctx.total_parts = 5;
    ctx.bytes_transferred = 524288;
    ctx.total_bytes = 1048576;
    ctx.attempt = 2;
    ctx.rate_mbps = 2.5;
    ctx.duration_ms = 1000;
    ctx.error_message = "Test error";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"transfer_id\":\"transfer-001\""), std::string::npos);
    EXPECT_NE(json.find("\"object\":\"projects/42/data.zip-abc\""), std::string::npos);
    EXPECT_NE(json.find("\"direction\":\"upload\""), std::string::npos);
    EXPECT_NE(json.find("\"part\":3"), std::string::npos);
    EXPECT_NE(json.find("\"total_parts\":5"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":524288"), std::string::npos);
    EXPECT_NE(json.find("\"total_bytes\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"rate_mbps\":2.50"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"error\":\"Test error\""), std::string::npos);
}

TEST_F(TransferLogContextTest, ErrorMessageIsMasked) {
    transfer_log_context ctx;
    ctx.error_message = "lease rejected: session_token=SUPERSECRETVALUE";

    sensitive_info_masker masker;
    auto json = ctx.to_json(&masker);

    EXPECT_EQ(json.find("SUPERSECRETVALUE"), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.transfer_id = "id-with-\"quotes\"";
    ctx.error_message = "Error:\nLine break\tand\ttabs";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Structured Log Entry Tests
// =============================================================================

class StructuredLogEntryTest : public ::testing::Test {};

TEST_F(StructuredLogEntryTest, EntryWithContextAndSource) {
    structured_log_entry entry;
    entry.timestamp = "2026-01-11T10:30:00.000Z";
    entry.level = log_level::warn;
    entry.category = std::string(log_category::download);
    entry.message = "Restarting download from byte 0";
    entry.source_file = "/src/downloader.cpp";
    entry.source_line = 42;
    entry.function_name = "load_resume_state";

    transfer_log_context ctx;
    ctx.transfer_id = "abc-123";
    entry.context = ctx;

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"resilient_transfer.download\""), std::string::npos);
    EXPECT_NE(json.find("\"transfer_id\":\"abc-123\""), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"load_resume_state\""), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class TransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        logger.initialize();
        previous_level_ = logger.get_level();
        logger.set_console_output(false);
        logger.set_level(log_level::debug);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message, const transfer_log_context*) {
            std::lock_guard lock(mutex_);
            records_.push_back({level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_json_callback(nullptr);
        logger.set_level(previous_level_);
        logger.set_console_output(true);
    }

    struct record {
        log_level level;
        std::string category;
        std::string message;
    };

    auto records() -> std::vector<record> {
        std::lock_guard lock(mutex_);
        return records_;
    }

    log_level previous_level_ = log_level::info;
    std::mutex mutex_;
    std::vector<record> records_;
};

TEST_F(TransferLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

TEST_F(TransferLoggerTest, CallbackReceivesRecords) {
    RT_LOG_INFO(log_category::upload, "Upload started");

    auto logged = records();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].level, log_level::info);
    EXPECT_EQ(logged[0].category, log_category::upload);
    EXPECT_EQ(logged[0].message, "Upload started");
}

TEST_F(TransferLoggerTest, LevelFiltering) {
    get_logger().set_level(log_level::warn);

    RT_LOG_DEBUG(log_category::retry, "hidden");
    RT_LOG_INFO(log_category::retry, "hidden too");
    RT_LOG_WARN(log_category::retry, "visible");

    auto logged = records();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].message, "visible");
}

TEST_F(TransferLoggerTest, SecretsNeverReachCallbacks) {
    RT_LOG_INFO(log_category::credentials, "fetched lease token=abcdef123");

    auto logged = records();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].message.find("abcdef123"), std::string::npos);
    EXPECT_NE(logged[0].message.find("token=abcd*****"), std::string::npos);
}

TEST_F(TransferLoggerTest, JsonCallbackCarriesContext) {
    std::string captured;
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured = json;
    });

    transfer_log_context ctx;
    ctx.transfer_id = "tid-7";
    ctx.part_number = 2;
    RT_LOG_INFO_CTX(log_category::upload, "Part uploaded", ctx);

    EXPECT_NE(captured.find("\"message\":\"Part uploaded\""), std::string::npos);
    EXPECT_NE(captured.find("\"transfer_id\":\"tid-7\""), std::string::npos);
    EXPECT_NE(captured.find("\"part\":2"), std::string::npos);
}

}  // namespace kcenon::resilient_transfer::test
