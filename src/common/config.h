#pragma once

/// @file config.h
/// @brief YAML configuration for rules, scoring, monitoring and logging

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace agentguard {

/// @brief Scalar or list value accepted by Config::Set
using ConfigValue = std::variant<bool, int64_t, std::string, std::vector<std::string>>;

/// @brief Top-level sections a configuration file may contain
///
/// @code
///   logging:  { level: info, file: agentguard.log }
///   detection: { window_size: 4096, window_overlap: 512 }
///   scoring:  { severity_points: {...}, aggravating_weight: 11, ... }
///   monitor:  { block_threats: false, block_level: HIGH, review_threshold: 31 }
///   rules:    [ { id, category, severity, pattern, description } ]
/// @endcode
const std::vector<std::string>& KnownConfigSections();

/// @brief Layered YAML configuration addressed with dotted keys
///
/// Getters never modify the tree and fall back to the supplied default when
/// a key is absent, null, or of the wrong shape. Semantic checks on values
/// belong to the component that reads them (ScorerConfig, MonitorConfig,
/// PatternRegistry); Validate() only checks the overall layout.
class Config {
public:
    Config() = default;
    explicit Config(YAML::Node root);

    /// @brief Parse a YAML file
    /// @return NotFound if the file is missing, ConfigurationError with the
    ///         file, line and column if it does not parse
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Overrides read from the environment
    ///
    /// Recognises <prefix>LOG_LEVEL, <prefix>REVIEW_THRESHOLD,
    /// <prefix>BLOCK_THREATS and <prefix>BLOCK_LEVEL. Values that do not
    /// parse are skipped with a warning.
    static Config LoadFromEnvironment(std::string_view prefix = "AGENTGUARD_");

    /// @brief Deep-merge another configuration into this one; `other` wins
    void Merge(const Config& other);

    /// @brief Check the layout: a mapping of known sections, `rules` a sequence
    /// @return ConfigurationError describing the first problem found
    absl::Status Validate() const;

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Scalar items of a sequence, or a lone scalar as a single item;
    ///        empty when the key is missing
    std::vector<std::string> GetStringList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    /// @brief Set a value, creating intermediate mappings as needed
    void Set(std::string_view key, ConfigValue value);

    /// @brief Nested node (e.g. the "rules" sequence) for structured parsing
    /// @return The node, or std::nullopt when the key is absent or null
    std::optional<YAML::Node> GetSection(std::string_view key) const;

    /// @brief Effective configuration as JSON, for `agentguard config`
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    /// Turn an empty root into a mapping; false if the root holds something else
    bool EnsureRootMap();
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Process-wide configuration used by the CLI
Config& GlobalConfig();

/// @brief Build the global configuration: file first, then environment overrides
///
/// The merged result is validated; any failure leaves an empty configuration.
absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "AGENTGUARD_"
);

}  // namespace agentguard
