#pragma once

/// @file pattern_registry.h
/// @brief Immutable, ordered catalog of compiled detection rules

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

#include "common/config.h"
#include "detection/types.h"

namespace agentguard::detection {

/// @brief Built-in rule catalog covering every threat category
const std::vector<RuleDefinition>& DefaultRuleDefinitions();

/// @brief Parse a YAML sequence of rule definitions
///
/// Each entry needs id, category, severity and pattern; description and
/// framework are optional. Unknown category or severity names are errors.
absl::StatusOr<std::vector<RuleDefinition>> ParseRuleDefinitions(const YAML::Node& node);

/// @brief Ordered rule catalog, immutable once loaded
///
/// Every pattern is compiled exactly once, case-insensitively. Loading
/// fails as a whole if any pattern does not compile or an id repeats, so a
/// registry that exists is always fully valid.
class PatternRegistry {
public:
    /// @brief Compile and validate the given definitions
    static absl::StatusOr<PatternRegistry> Load(const std::vector<RuleDefinition>& definitions);

    /// @brief Built-in catalog
    static absl::StatusOr<PatternRegistry> LoadDefault();

    /// @brief Built-in catalog followed by the rules of the `rules:` section
    static absl::StatusOr<PatternRegistry> LoadFromConfig(const Config& config);

    /// @brief All rules in insertion order
    const std::vector<Rule>& Rules() const { return rules_; }

    /// @brief Rules of one category, in registry order
    std::vector<const Rule*> ByCategory(ThreatCategory category) const;

    /// @brief Number of rules per category (categories without rules are omitted)
    std::map<ThreatCategory, size_t> CountByCategory() const;

    /// @brief Look up a rule by id
    /// @return nullptr when no rule has that id
    const Rule* Find(std::string_view id) const;

    size_t Size() const { return rules_.size(); }

private:
    PatternRegistry() = default;

    std::vector<Rule> rules_;
    std::map<std::string, size_t, std::less<>> index_;
};

using PatternRegistryPtr = std::shared_ptr<const PatternRegistry>;

}  // namespace agentguard::detection
