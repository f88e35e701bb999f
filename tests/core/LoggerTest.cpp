#include "hitl/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace hitl::util;

namespace {

// Redirects the process logger to a temp file for the test's lifetime.
class LogCapture {
public:
    explicit LogCapture(const std::string& name)
        : path_(::testing::TempDir() + name), prevLevel_(logger().level()) {
        std::remove(path_.c_str());
        logger().setFile(path_);
    }
    ~LogCapture() {
        logger().setFile("");
        logger().setFormatJson(false);
        logger().setLevel(prevLevel_);
        std::remove(path_.c_str());
    }
    std::string text() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
private:
    std::string path_;
    LogLevel prevLevel_;
};

} // namespace

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("Warn"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
}

TEST(LoggerTest, TextLineCarriesFields) {
    LogCapture cap("hitl_logger_text.log");
    logger().setLevel(LogLevel::Info);
    logger().log(LogLevel::Info, "approval.pending", { {"owner", "alice"}, {"id", "42"} });
    auto out = cap.text();
    EXPECT_NE(out.find("INFO"), std::string::npos);
    EXPECT_NE(out.find("approval.pending owner=alice id=42"), std::string::npos);
}

TEST(LoggerTest, BelowLevelIsDropped) {
    LogCapture cap("hitl_logger_level.log");
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Info, "quiet");
    logger().log(LogLevel::Error, "loud");
    auto out = cap.text();
    EXPECT_EQ(out.find("quiet"), std::string::npos);
    EXPECT_NE(out.find("loud"), std::string::npos);
}

TEST(LoggerTest, JsonEscapesQuotes) {
    LogCapture cap("hitl_logger_json.log");
    logger().setLevel(LogLevel::Info);
    logger().setFormatJson(true);
    logger().log(LogLevel::Info, "say \"hi\"", { {"path", "C:\\tmp"} });
    auto out = cap.text();
    EXPECT_NE(out.find("\"msg\":\"say \\\"hi\\\"\""), std::string::npos);
    EXPECT_NE(out.find("\"path\":\"C:\\\\tmp\""), std::string::npos);
    EXPECT_NE(out.find("\"lvl\":\"INFO\""), std::string::npos);
}

TEST(LoggerTest, JsonEscapesControlCharacters) {
    LogCapture cap("hitl_logger_ctrl.log");
    logger().setLevel(LogLevel::Info);
    logger().setFormatJson(true);
    logger().log(LogLevel::Info, "ctrl", { {"raw", std::string("a\x01" "b\x1f")} });
    auto out = cap.text();
    EXPECT_NE(out.find("\"raw\":\"a\\u0001b\\u001f\""), std::string::npos);
    EXPECT_EQ(out.find('\x01'), std::string::npos);
}

TEST(LoggerTest, ScopedContextIsPoppedOnExit) {
    LogCapture cap("hitl_logger_scoped.log");
    logger().setLevel(LogLevel::Info);
    {
        Logger::Scoped ctx(std::vector<Field>{ {"session", "s1"} });
        logger().log(LogLevel::Info, "inside");
    }
    logger().log(LogLevel::Info, "outside");
    auto out = cap.text();
    auto inside = out.find("inside");
    auto outside = out.find("outside");
    ASSERT_NE(inside, std::string::npos);
    ASSERT_NE(outside, std::string::npos);
    EXPECT_NE(out.substr(inside, outside - inside).find("session=s1"), std::string::npos);
    EXPECT_EQ(out.substr(outside).find("session=s1"), std::string::npos);
}

TEST(LoggerTest, UnopenableFileFallsBackToStdout) {
    EXPECT_FALSE(logger().setFile("/nonexistent-dir/hitl.log"));
    logger().setFile("");
}
