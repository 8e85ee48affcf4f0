/// @file config_test.cpp
/// @brief Tests for AgentGuard configuration management

#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "common/config.h"
#include "common/error.h"

namespace agentguard {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
logging:
  level: debug
monitor:
  block_threats: true
  block_level: CRITICAL
  review_threshold: 40
scoring:
  aggravating_keywords:
    - wire
    - transfer
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetString("logging.level"), "debug");
    EXPECT_TRUE(config.GetBool("monitor.block_threats"));
    EXPECT_EQ(config.GetString("monitor.block_level"), "CRITICAL");
    EXPECT_EQ(config.GetInt("monitor.review_threshold"), 40);

    auto keywords = config.GetStringList("scoring.aggravating_keywords");
    ASSERT_EQ(keywords.size(), 2);
    EXPECT_EQ(keywords[0], "wire");
    EXPECT_EQ(keywords[1], "transfer");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("other.deeply.nested", std::string("x"));

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_EQ(config.GetString("other.deeply.nested"), "x");
}

TEST(ConfigTest, GettersDoNotModifyTree) {
    auto result = Config::LoadFromString("monitor:\n  review_threshold: 50\n");
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    EXPECT_FALSE(config.HasKey("monitor.block_level"));
    EXPECT_EQ(config.GetInt("monitor.review_threshold"), 50);
    EXPECT_EQ(config.GetInt("monitor.review_threshold"), 50);
    EXPECT_FALSE(config.HasKey("monitor.block_level"));
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
existing:
  key: value
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
}

TEST(ConfigTest, GetSection) {
    const std::string yaml_content = R"(
rules:
  - id: CUSTOM-001
    category: jailbreak
    severity: HIGH
    pattern: 'opposite\s+day'
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    auto rules = config.GetSection("rules");
    ASSERT_TRUE(rules.has_value());
    ASSERT_TRUE(rules->IsSequence());
    EXPECT_EQ(rules->size(), 1);
    EXPECT_EQ((*rules)[0]["id"].as<std::string>(), "CUSTOM-001");

    EXPECT_FALSE(config.GetSection("missing").has_value());
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
logging:
  level: info
monitor:
  block_threats: false
  review_threshold: 31
)";

    const std::string overlay_yaml = R"(
monitor:
  block_threats: true
  block_level: MEDIUM
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("logging.level"), "info");
    EXPECT_TRUE(base.GetBool("monitor.block_threats"));       // Overwritten
    EXPECT_EQ(base.GetInt("monitor.review_threshold"), 31);   // Kept
    EXPECT_EQ(base.GetString("monitor.block_level"), "MEDIUM");  // Added
}

TEST(ConfigTest, LoadFromEnvironment) {
    setenv("AGENTGUARD_TEST_LOG_LEVEL", "debug", 1);
    setenv("AGENTGUARD_TEST_REVIEW_THRESHOLD", "45", 1);
    setenv("AGENTGUARD_TEST_BLOCK_THREATS", "true", 1);
    setenv("AGENTGUARD_TEST_BLOCK_LEVEL", "CRITICAL", 1);

    Config config = Config::LoadFromEnvironment("AGENTGUARD_TEST_");

    EXPECT_EQ(config.GetString("logging.level"), "debug");
    EXPECT_EQ(config.GetInt("monitor.review_threshold"), 45);
    EXPECT_TRUE(config.GetBool("monitor.block_threats"));
    EXPECT_EQ(config.GetString("monitor.block_level"), "CRITICAL");

    unsetenv("AGENTGUARD_TEST_LOG_LEVEL");
    unsetenv("AGENTGUARD_TEST_REVIEW_THRESHOLD");
    unsetenv("AGENTGUARD_TEST_BLOCK_THREATS");
    unsetenv("AGENTGUARD_TEST_BLOCK_LEVEL");
}

TEST(ConfigTest, EnvironmentIgnoresMalformedNumbers) {
    setenv("AGENTGUARD_BAD_REVIEW_THRESHOLD", "high", 1);

    Config config = Config::LoadFromEnvironment("AGENTGUARD_BAD_");
    EXPECT_FALSE(config.HasKey("monitor.review_threshold"));

    unsetenv("AGENTGUARD_BAD_REVIEW_THRESHOLD");
}

TEST(ConfigTest, ToJson) {
    auto result = Config::LoadFromString("monitor:\n  block_level: HIGH\n  review_threshold: 31\n");
    ASSERT_TRUE(result.ok());

    auto json = result->ToJson();
    EXPECT_EQ(json["monitor"]["block_level"], "HIGH");
    EXPECT_TRUE(json["monitor"].contains("review_threshold"));
}

TEST(ConfigTest, ValidateAcceptsKnownSections) {
    auto result = Config::LoadFromString(R"(
logging:
  level: info
detection:
  window_size: 2048
rules:
  - id: ORG-001
    category: jailbreak
    severity: low
    pattern: 'x'
)");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->Validate().ok());
    EXPECT_TRUE(Config().Validate().ok());
}

TEST(ConfigTest, ValidateRejectsUnknownSection) {
    auto result = Config::LoadFromString("monitr:\n  block_threats: true\n");
    ASSERT_TRUE(result.ok());

    auto status = result->Validate();
    EXPECT_TRUE(absl::IsFailedPrecondition(status));
    EXPECT_NE(status.message().find("monitr"), std::string_view::npos);
}

TEST(ConfigTest, ValidateChecksSectionShapes) {
    auto rules = Config::LoadFromString("rules:\n  id: PI-001\n");
    ASSERT_TRUE(rules.ok());
    EXPECT_FALSE(rules->Validate().ok());

    auto scoring = Config::LoadFromString("scoring: 12\n");
    ASSERT_TRUE(scoring.ok());
    EXPECT_FALSE(scoring->Validate().ok());

    auto root = Config::LoadFromString("- a\n- b\n");
    ASSERT_TRUE(root.ok());
    EXPECT_FALSE(root->Validate().ok());
}

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, ParseErrorCarriesLocation) {
    auto result = Config::LoadFromString("monitor:\n  block_level: [HIGH\n");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(GetErrorCode(result.status()), ErrorCode::kConfigurationError);
    EXPECT_NE(result.status().message().find("<string>:"), std::string_view::npos);
}

TEST(ConfigTest, MissingFile) {
    auto result = Config::LoadFromFile("/nonexistent/agentguard.yaml");
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(absl::IsNotFound(result.status()));
}

TEST(ConfigTest, SetOnEmptyConfig) {
    Config config;
    config.Set("monitor.block_threats", true);
    config.Set("scoring.aggravating_keywords", std::vector<std::string>{"admin", "root"});

    EXPECT_TRUE(config.GetBool("monitor.block_threats"));
    EXPECT_EQ(config.GetStringList("scoring.aggravating_keywords"),
              (std::vector<std::string>{"admin", "root"}));
    EXPECT_TRUE(config.Validate().ok());
}

TEST(ConfigTest, ScalarReadAsSingleItemList) {
    auto result = Config::LoadFromString("scoring:\n  mitigating_phrases: just kidding\n");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->GetStringList("scoring.mitigating_phrases"),
              std::vector<std::string>{"just kidding"});
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto result = Config::LoadFromString("monitor:\n  review_threshold: lots\n");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->GetInt("monitor.review_threshold", 31), 31);
    EXPECT_EQ(result->GetString("monitor.review_threshold"), "lots");
}

}  // namespace
}  // namespace agentguard
