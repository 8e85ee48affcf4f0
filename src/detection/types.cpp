#include "detection/types.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace agentguard::detection {

const std::vector<ThreatCategory>& AllCategories() {
    static const std::vector<ThreatCategory> kCategories = {
        ThreatCategory::kPromptInjection,
        ThreatCategory::kJailbreak,
        ThreatCategory::kContextManipulation,
        ThreatCategory::kToolMisuse,
        ThreatCategory::kSqlInjection,
        ThreatCategory::kCommandInjection,
        ThreatCategory::kFileManipulation,
        ThreatCategory::kNetworkExploit,
        ThreatCategory::kDataExfiltration,
    };
    return kCategories;
}

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::kLow: return "LOW";
        case Severity::kMedium: return "MEDIUM";
        case Severity::kHigh: return "HIGH";
        case Severity::kCritical: return "CRITICAL";
    }
    return "LOW";
}

absl::StatusOr<Severity> ParseSeverity(std::string_view name) {
    const std::string upper = absl::AsciiStrToUpper(name);
    if (upper == "LOW") return Severity::kLow;
    if (upper == "MEDIUM") return Severity::kMedium;
    if (upper == "HIGH") return Severity::kHigh;
    if (upper == "CRITICAL") return Severity::kCritical;
    return MakeError(ErrorCode::kInvalidArgument,
                     absl::StrCat("Unknown severity: '", name, "'"));
}

std::string CategoryToString(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::kPromptInjection: return "prompt_injection";
        case ThreatCategory::kJailbreak: return "jailbreak";
        case ThreatCategory::kContextManipulation: return "context_manipulation";
        case ThreatCategory::kToolMisuse: return "tool_misuse";
        case ThreatCategory::kSqlInjection: return "sql_injection";
        case ThreatCategory::kCommandInjection: return "command_injection";
        case ThreatCategory::kFileManipulation: return "file_manipulation";
        case ThreatCategory::kNetworkExploit: return "network_exploit";
        case ThreatCategory::kDataExfiltration: return "data_exfiltration";
    }
    return "unknown";
}

absl::StatusOr<ThreatCategory> ParseCategory(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(name);
    for (ThreatCategory category : AllCategories()) {
        if (CategoryToString(category) == lower) {
            return category;
        }
    }
    return MakeError(ErrorCode::kInvalidArgument,
                     absl::StrCat("Unknown threat category: '", name, "'"));
}

}  // namespace agentguard::detection
