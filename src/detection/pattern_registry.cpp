#include "detection/pattern_registry.h"

#include <regex>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace agentguard::detection {

namespace {

absl::StatusOr<std::string> RequiredField(const YAML::Node& entry, const char* field,
                                          size_t position) {
    const YAML::Node value = entry[field];
    if (!value || !value.IsScalar() || value.Scalar().empty()) {
        return ConfigurationError(absl::StrCat(
            "Rule #", position, " is missing required field '", field, "'"));
    }
    return value.Scalar();
}

}  // namespace

absl::StatusOr<std::vector<RuleDefinition>> ParseRuleDefinitions(const YAML::Node& node) {
    std::vector<RuleDefinition> definitions;
    if (!node || node.IsNull()) {
        return definitions;
    }
    if (!node.IsSequence()) {
        return ConfigurationError("'rules' must be a sequence of rule definitions");
    }

    for (size_t i = 0; i < node.size(); ++i) {
        const YAML::Node entry = node[i];
        if (!entry.IsMap()) {
            return ConfigurationError(absl::StrCat("Rule #", i, " is not a mapping"));
        }

        RuleDefinition def;
        AGENTGUARD_ASSIGN_OR_RETURN(def.id, RequiredField(entry, "id", i));
        AGENTGUARD_ASSIGN_OR_RETURN(def.pattern, RequiredField(entry, "pattern", i));
        AGENTGUARD_ASSIGN_OR_RETURN(std::string category, RequiredField(entry, "category", i));
        AGENTGUARD_ASSIGN_OR_RETURN(std::string severity, RequiredField(entry, "severity", i));

        auto parsed_category = ParseCategory(category);
        if (!parsed_category.ok()) {
            return ConfigurationError(absl::StrCat(
                "Rule ", def.id, ": ", parsed_category.status().message()));
        }
        def.category = *parsed_category;

        auto parsed_severity = ParseSeverity(severity);
        if (!parsed_severity.ok()) {
            return ConfigurationError(absl::StrCat(
                "Rule ", def.id, ": ", parsed_severity.status().message()));
        }
        def.severity = *parsed_severity;

        if (entry["description"]) {
            def.description = entry["description"].as<std::string>("");
        }
        if (entry["framework"]) {
            def.framework = entry["framework"].as<std::string>("");
        }
        definitions.push_back(std::move(def));
    }
    return definitions;
}

absl::StatusOr<PatternRegistry> PatternRegistry::Load(
    const std::vector<RuleDefinition>& definitions) {
    PatternRegistry registry;
    registry.rules_.reserve(definitions.size());

    for (const auto& def : definitions) {
        if (registry.index_.count(def.id) > 0) {
            AGENTGUARD_LOG_ERROR("Duplicate rule id '{}'", def.id);
            return MakeError(ErrorCode::kDuplicateRule,
                             absl::StrCat("Duplicate rule id: ", def.id));
        }

        Rule rule;
        rule.id = def.id;
        rule.category = def.category;
        rule.severity = def.severity;
        rule.pattern = def.pattern;
        rule.description = def.description;
        rule.framework = def.framework;
        try {
            rule.regex = std::regex(def.pattern,
                                    std::regex::ECMAScript | std::regex::icase |
                                        std::regex::optimize);
        } catch (const std::regex_error& e) {
            AGENTGUARD_LOG_ERROR("Rule '{}' has an invalid pattern: {}", def.id, e.what());
            return MakeError(ErrorCode::kPatternCompileError,
                             absl::StrCat("Rule ", def.id, " pattern does not compile: ",
                                          e.what()));
        }

        registry.index_.emplace(rule.id, registry.rules_.size());
        registry.rules_.push_back(std::move(rule));
    }

    AGENTGUARD_LOG_DEBUG("Loaded {} detection rules", registry.rules_.size());
    return registry;
}

absl::StatusOr<PatternRegistry> PatternRegistry::LoadDefault() {
    return Load(DefaultRuleDefinitions());
}

absl::StatusOr<PatternRegistry> PatternRegistry::LoadFromConfig(const Config& config) {
    std::vector<RuleDefinition> definitions = DefaultRuleDefinitions();

    if (auto section = config.GetSection("rules")) {
        AGENTGUARD_ASSIGN_OR_RETURN(auto extra, ParseRuleDefinitions(*section));
        AGENTGUARD_LOG_INFO("Adding {} rules from configuration", extra.size());
        for (auto& def : extra) {
            definitions.push_back(std::move(def));
        }
    }

    auto registry = Load(definitions);
    if (!registry.ok()) {
        return ConfigurationError(registry.status().message());
    }
    return registry;
}

std::vector<const Rule*> PatternRegistry::ByCategory(ThreatCategory category) const {
    std::vector<const Rule*> result;
    for (const auto& rule : rules_) {
        if (rule.category == category) {
            result.push_back(&rule);
        }
    }
    return result;
}

std::map<ThreatCategory, size_t> PatternRegistry::CountByCategory() const {
    std::map<ThreatCategory, size_t> counts;
    for (const auto& rule : rules_) {
        ++counts[rule.category];
    }
    return counts;
}

const Rule* PatternRegistry::Find(std::string_view id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &rules_[it->second];
}

}  // namespace agentguard::detection
