#pragma once

/// @file types.h
/// @brief Rule and threat types shared by detection, scoring and reporting

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace agentguard::detection {

/// @brief Rule severity, totally ordered (kLow < kCritical)
enum class Severity {
    kLow,
    kMedium,
    kHigh,
    kCritical
};

/// @brief Attack taxonomy a rule belongs to
enum class ThreatCategory {
    kPromptInjection,
    kJailbreak,
    kContextManipulation,
    kToolMisuse,
    kSqlInjection,
    kCommandInjection,
    kFileManipulation,
    kNetworkExploit,
    kDataExfiltration
};

/// @brief All categories in catalog order
const std::vector<ThreatCategory>& AllCategories();

/// @brief Uncompiled rule as written in the catalog or in YAML
struct RuleDefinition {
    std::string id;
    ThreatCategory category = ThreatCategory::kPromptInjection;
    Severity severity = Severity::kMedium;
    std::string pattern;
    std::string description;
    std::string framework;  ///< e.g. "OWASP-LLM01, CWE-89"
};

/// @brief A rule whose pattern has been compiled (case-insensitive)
struct Rule {
    std::string id;
    ThreatCategory category = ThreatCategory::kPromptInjection;
    Severity severity = Severity::kMedium;
    std::string pattern;
    std::string description;
    std::string framework;
    std::regex regex;
};

/// @brief One rule matching one scanned text
struct Threat {
    std::string id;
    ThreatCategory category = ThreatCategory::kPromptInjection;
    Severity severity = Severity::kMedium;
    std::string description;
    std::string pattern;
};

/// @brief "CRITICAL", "HIGH", "MEDIUM", "LOW"
std::string SeverityToString(Severity severity);

/// @brief Case-insensitive parse of a severity name
absl::StatusOr<Severity> ParseSeverity(std::string_view name);

/// @brief "prompt_injection", "sql_injection", ...
std::string CategoryToString(ThreatCategory category);

/// @brief Parse a snake_case category name
absl::StatusOr<ThreatCategory> ParseCategory(std::string_view name);

}  // namespace agentguard::detection
