/// @file logging_test.cpp
/// @brief Tests for AgentGuard logging utilities

#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "common/config.h"
#include "common/logging.h"

namespace agentguard {
namespace {

TEST(LoggingTest, InitializeLogging) {
    LogConfig config;
    config.name = "test-logger";
    config.level = LogLevel::kDebug;

    EXPECT_NO_THROW(InitLogging(config));
    EXPECT_NE(GetLogger(), nullptr);
}

TEST(LoggingTest, LogLevelChange) {
    InitLogging();

    EXPECT_NO_THROW(SetLogLevel(LogLevel::kWarn));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::warn);
    EXPECT_NO_THROW(SetLogLevel(LogLevel::kDebug));
    EXPECT_EQ(GetLogger()->level(), spdlog::level::debug);
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::kTrace);
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warn"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::kOff);
    EXPECT_EQ(ParseLogLevel("bogus"), LogLevel::kInfo);
}

TEST(LoggingTest, LoggingMacros) {
    InitLogging();

    // These should not throw
    EXPECT_NO_THROW({
        AGENTGUARD_LOG_TRACE("Trace message: {}", 1);
        AGENTGUARD_LOG_DEBUG("Debug message: {}", 2);
        AGENTGUARD_LOG_INFO("Info message: {}", 3);
        AGENTGUARD_LOG_WARN("Warn message: {}", 4);
        AGENTGUARD_LOG_ERROR("Error message: {}", 5);
    });
}

TEST(LoggingTest, FlushLogs) {
    InitLogging();
    AGENTGUARD_LOG_INFO("Test message");
    EXPECT_NO_THROW(FlushLogs());
}

TEST(LoggingTest, ReinitializeAfterShutdown) {
    InitLogging();
    ShutdownLogging();
    EXPECT_NE(GetLogger(), nullptr);
    AGENTGUARD_LOG_INFO("Logger rebuilt after shutdown");
}

TEST(LoggingTest, AuditLogDisabledByDefault) {
    InitLogging();
    EXPECT_EQ(GetAuditLogger(), nullptr);
    // No-op without an audit file
    AGENTGUARD_AUDIT("stage={} score={}", "prompt", 0);
}

TEST(LoggingTest, AuditLogWritesLines) {
    const std::string path = ::testing::TempDir() + "agentguard_audit_test.log";

    LogConfig config;
    config.audit_file = path;
    InitLogging(config);
    ASSERT_NE(GetAuditLogger(), nullptr);

    AGENTGUARD_AUDIT("stage={} score={} action={}", "tool_start", 91, "block");
    ShutdownLogging();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("stage=tool_start score=91 action=block"), std::string::npos);

    InitLogging();
    EXPECT_EQ(GetAuditLogger(), nullptr);
}

TEST(LoggingTest, LogConfigFromConfig) {
    auto config = Config::LoadFromString(R"(
logging:
  level: debug
  file: /tmp/agentguard-test.log
  audit_file: /tmp/agentguard-audit.log
)");
    ASSERT_TRUE(config.ok());

    auto log_config = LogConfigFromConfig(*config);
    EXPECT_EQ(log_config.level, LogLevel::kDebug);
    EXPECT_TRUE(log_config.enable_file);
    EXPECT_EQ(log_config.file_path, "/tmp/agentguard-test.log");
    EXPECT_EQ(log_config.audit_file, "/tmp/agentguard-audit.log");

    EXPECT_EQ(LogConfigFromConfig(*config, "error").level, LogLevel::kError);
    EXPECT_EQ(LogConfigFromConfig(Config()).level, LogLevel::kWarn);
    EXPECT_FALSE(LogConfigFromConfig(Config()).enable_file);
}

}  // namespace
}  // namespace agentguard
