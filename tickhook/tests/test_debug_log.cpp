#include <gtest/gtest.h>
#include <tickhook/debug_log.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace tickhook;

namespace {

std::vector<std::pair<debug::LogLevel, std::string>> g_routed;

void route(debug::LogLevel level, const char* message) {
    g_routed.emplace_back(level, message);
}

} // namespace

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_routed.clear();
        debug::set_log_callback(&route);
    }

    void TearDown() override {
        debug::clear_log_callback();
    }
};

TEST_F(DebugLogTest, WarnAndErrorReachTheCallback) {
    TICKHOOK_LOG_WARN("ring %d is %s", 3, "full");
    TICKHOOK_LOG_ERROR("slot %u leaked", 7u);

    ASSERT_EQ(g_routed.size(), 2u);
    EXPECT_EQ(g_routed[0].first, debug::LogLevel::Warn);
    EXPECT_EQ(g_routed[0].second.rfind("[WARN][T", 0), 0u);
    EXPECT_NE(g_routed[0].second.find("ring 3 is full"), std::string::npos);

    EXPECT_EQ(g_routed[1].first, debug::LogLevel::Error);
    EXPECT_EQ(g_routed[1].second.rfind("[ERROR][T", 0), 0u);
    EXPECT_NE(g_routed[1].second.find("slot 7 leaked"), std::string::npos);
    EXPECT_EQ(g_routed[1].second.back(), 'd');
}

TEST_F(DebugLogTest, ClearedCallbackStopsRouting) {
    TICKHOOK_LOG_ERROR("first");
    debug::clear_log_callback();
    // Goes to stderr now
    TICKHOOK_LOG_WARN("second");

    ASSERT_EQ(g_routed.size(), 1u);
    EXPECT_NE(g_routed[0].second.find("first"), std::string::npos);
}

TEST_F(DebugLogTest, LongMessagesAreTruncated) {
    std::string long_text(4000, 'x');
    TICKHOOK_LOG_WARN("%s", long_text.c_str());

    ASSERT_EQ(g_routed.size(), 1u);
    EXPECT_LT(g_routed[0].second.size(), 1100u);
    EXPECT_GT(g_routed[0].second.size(), 1000u);
}

TEST(LogLevelTest, NamesEveryLevel) {
    EXPECT_STREQ(debug::log_level_name(debug::LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(debug::log_level_name(debug::LogLevel::Warn), "WARN");
    EXPECT_STREQ(debug::log_level_name(debug::LogLevel::Error), "ERROR");
}
