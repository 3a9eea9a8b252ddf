/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/peer_transfer/core/logging.h>

#include <string>
#include <tuple>
#include <vector>

namespace kcenon::peer_transfer::test {

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "a=candidate:1 1 UDP 2122252543 192.168.1.100 50000 typ host";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskIPAddress) {
    masking_config config;
    config.mask_ips = true;
    sensitive_info_masker masker(config);

    // 192.168.1 = 9 chars -> *********
    EXPECT_EQ(masker.mask_ip("192.168.1.100"), "*********.100");
}

TEST_F(SensitiveInfoMaskerTest, MaskCandidateLine) {
    sensitive_info_masker masker(masking_config::all_masked());

    auto result = masker.mask("candidate 10.0.0.1 and 172.16.5.20 gathered");

    EXPECT_EQ(result.find("10.0.0.1"), std::string::npos);
    EXPECT_NE(result.find("******.1"), std::string::npos);
    EXPECT_NE(result.find("********.20"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilenameKeepsExtension) {
    masking_config config;
    config.mask_filenames = true;
    config.visible_chars = 4;
    sensitive_info_masker masker(config);

    EXPECT_EQ(masker.mask_filename("holiday-photos.zip"), "holi**********.zip");
    EXPECT_EQ(masker.mask_filename("a.txt"), "a.txt");
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    sensitive_info_masker masker;
    EXPECT_FALSE(masker.get_config().mask_ips);

    masker.set_config(masking_config::all_masked());
    EXPECT_TRUE(masker.get_config().mask_ips);
    EXPECT_TRUE(masker.get_config().mask_filenames);
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
    ctx.filename = "data.zip";
    ctx.file_size = 1048576;
    ctx.bytes_transferred = 524288;
    ctx.chunk_index = 5;
    ctx.buffered_amount = 16777216;
    ctx.progress_percent = 50.0;
    ctx.state = "connected";
    ctx.error_message = "Test error";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"transfer_id\":\"transfer-001\""), std::string::npos);
    EXPECT_NE(json.find("\"filename\":\"data.zip\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":524288"), std::string::npos);
    EXPECT_NE(json.find("\"chunk_index\":5"), std::string::npos);
    EXPECT_NE(json.find("\"buffered_amount\":16777216"), std::string::npos);
    EXPECT_NE(json.find("\"progress_percent\":50.00"), std::string::npos);
    EXPECT_NE(json.find("\"state\":\"connected\""), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"Test error\""), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonWithMasking) {
    transfer_log_context ctx;
    ctx.filename = "secretplans.pdf";
    ctx.error_message = "ICE failed for 192.168.1.100";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("192.168.1.100"), std::string::npos);
    EXPECT_EQ(json.find("secretplans"), std::string::npos);
    EXPECT_NE(json.find(".pdf"), std::string::npos);
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
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuildsEntryWithContext) {
    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::protocol)
        .with_message("ignored meta frame")
        .with_transfer_id("t-1")
        .with_filename("a.txt")
        .with_file_size(10)
        .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, "peer_transfer.protocol");
    ASSERT_TRUE(entry.context);
    EXPECT_EQ(entry.context->transfer_id, "t-1");
    EXPECT_EQ(entry.context->file_size, 10u);
}

TEST_F(LogEntryBuilderTest, BuildJsonIncludesSourceLocation) {
    auto json = log_entry_builder()
        .with_level(log_level::error)
        .with_category(log_category::channel)
        .with_message("send failed")
        .with_source_location("channel_transport.cpp", 42, "step")
        .build_json();

    EXPECT_NE(json.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"peer_transfer.channel\""), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"step\""), std::string::npos);
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder().build();

    // 2025-12-11T10:30:00.000Z
    ASSERT_EQ(entry.timestamp.size(), 24u);
    EXPECT_EQ(entry.timestamp[10], 'T');
    EXPECT_EQ(entry.timestamp.back(), 'Z');
}

TEST_F(LogEntryBuilderTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Tests
// =============================================================================

class PeerTransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().set_console_output(true);
    }
};

TEST_F(PeerTransferLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(PeerTransferLoggerTest, SetMaskingConfig) {
    get_logger().set_masking_config(masking_config::all_masked());

    auto retrieved = get_logger().get_masking_config();
    EXPECT_TRUE(retrieved.mask_ips);
    EXPECT_TRUE(retrieved.mask_filenames);
}

TEST_F(PeerTransferLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    PT_LOG_INFO(log_category::session, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::session);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(PeerTransferLoggerTest, CallbackReceivesContext) {
    std::string transfer_id;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const transfer_log_context* ctx) {
        if (ctx) transfer_id = ctx->transfer_id;
    });

    transfer_log_context ctx;
    ctx.transfer_id = "abc";
    PT_LOG_WARN_CTX(log_category::channel, "backpressure", ctx);

    EXPECT_EQ(transfer_id, "abc");
}

TEST_F(PeerTransferLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const transfer_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    PT_LOG_DEBUG(log_category::signal, "Debug message");
    PT_LOG_INFO(log_category::signal, "Info message");
    PT_LOG_WARN(log_category::signal, "Warn message");
    PT_LOG_ERROR(log_category::signal, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

TEST_F(PeerTransferLoggerTest, IsEnabled) {
    get_logger().set_level(log_level::error);
    EXPECT_FALSE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

}  // namespace kcenon::peer_transfer::test
