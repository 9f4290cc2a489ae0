/**
 * @file test_logging.cpp
 * @brief Unit tests for usbkit diagnostics logging.
 */

#include <gtest/gtest.h>
#include <usbkit/logging.h>

#include <string>
#include <vector>

using namespace usbkit;

// ─────────────────────────────────────────────────────────────────────────────
// Test Fixtures
// ─────────────────────────────────────────────────────────────────────────────

class DiagnosticsTest : public ::testing::Test {
protected:
    struct Entry {
        LogLevel level;
        std::string subsystem;
        std::string message;
    };

    std::vector<Entry> entries_;

    static void capture(LogLevel level, const char* subsystem, const char* message, void* userdata) {
        static_cast<DiagnosticsTest*>(userdata)->entries_.push_back({level, subsystem, message});
    }

    void SetUp() override {
        set_diagnostic_callback(&DiagnosticsTest::capture, this);
        set_diagnostic_level(LogLevel::Debug);
    }

    void TearDown() override {
        set_diagnostic_callback(nullptr, nullptr);
        set_diagnostic_level(LogLevel::Warning);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Delivery
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DiagnosticsTest, RawMessageReachesCallback) {
    log_raw(LogLevel::Info, "context", "created");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].subsystem, "context");
    EXPECT_EQ(entries_[0].message, "created");
}

TEST_F(DiagnosticsTest, MacroFormatsArguments) {
    USBKIT_LOG_WARN("device", "open of {:03}:{:03} failed: {}", 1, 7, "Access");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
    EXPECT_EQ(entries_[0].message, "open of 001:007 failed: Access");
}

TEST_F(DiagnosticsTest, MacroWithoutArguments) {
    USBKIT_LOG_ERROR("log", "plain text");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "plain text");
}

TEST_F(DiagnosticsTest, OversizedMessageIsTruncated) {
    std::string big(5000, 'x');
    log_raw(LogLevel::Error, "test", big);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_LT(entries_[0].message.size(), big.size());
    EXPECT_GT(entries_[0].message.size(), 0u);
}

// ─────────────────────────────────────────────────────────────────────────────
// Filtering
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(DiagnosticsTest, LevelFiltersVerboseMessages) {
    set_diagnostic_level(LogLevel::Warning);
    USBKIT_LOG_DEBUG("context", "hidden {}", 1);
    USBKIT_LOG_INFO("context", "hidden too");
    USBKIT_LOG_WARN("context", "shown");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(DiagnosticsTest, NoneSilencesEverything) {
    set_diagnostic_level(LogLevel::None);
    USBKIT_LOG_ERROR("context", "hidden");
    EXPECT_TRUE(entries_.empty());
}

TEST_F(DiagnosticsTest, NoneLevelMessagesAreNeverEmitted) {
    log_raw(LogLevel::None, "context", "nothing");
    EXPECT_TRUE(entries_.empty());
}

TEST_F(DiagnosticsTest, LevelRoundTrip) {
    set_diagnostic_level(LogLevel::Info);
    EXPECT_EQ(diagnostic_level(), LogLevel::Info);
    EXPECT_TRUE(diagnostic_enabled(LogLevel::Error));
    EXPECT_FALSE(diagnostic_enabled(LogLevel::Debug));
}

TEST(LogLevelTest, ToStringNames) {
    EXPECT_STREQ(to_string(LogLevel::None), "NONE");
    EXPECT_STREQ(to_string(LogLevel::Error), "ERROR");
    EXPECT_STREQ(to_string(LogLevel::Warning), "WARN");
    EXPECT_STREQ(to_string(LogLevel::Info), "INFO");
    EXPECT_STREQ(to_string(LogLevel::Debug), "DEBUG");
}

TEST(LogLevelTest, NativeDecoding) {
    EXPECT_EQ(log_level_from_native(1), LogLevel::Error);
    EXPECT_EQ(log_level_from_native(4), LogLevel::Debug);
    EXPECT_EQ(log_level_from_native(0), LogLevel::None);
    EXPECT_EQ(log_level_from_native(17), LogLevel::None);
    EXPECT_EQ(log_level_from_native(-1), LogLevel::None);
}
