#include "config.h"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <system_error>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

#include "error.h"
#include "logging.h"

namespace agentguard {

namespace {

Config g_global_config;

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(NodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            const std::string scalar = node.Scalar();
            int64_t as_int = 0;
            double as_double = 0.0;
            if (absl::SimpleAtoi(scalar, &as_int)) {
                return as_int;
            }
            if (absl::SimpleAtod(scalar, &as_double)) {
                return as_double;
            }
            const std::string lower = absl::AsciiStrToLower(scalar);
            if (lower == "true") return true;
            if (lower == "false") return false;
            return scalar;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

}  // namespace

const std::vector<std::string>& KnownConfigSections() {
    static const std::vector<std::string> kSections = {"logging", "detection", "scoring", "monitor",
                                                          "rules"};
    return kSections;
}

namespace {

absl::StatusOr<Config> ParseYaml(const std::function<YAML::Node()>& load,
                                 std::string_view origin) {
    try {
        return Config(load());
    } catch (const YAML::ParserException& e) {
        return ConfigurationError(absl::StrCat(origin, ":", e.mark.line + 1, ":",
                                               e.mark.column + 1, ": ", e.msg));
    } catch (const YAML::Exception& e) {
        return ConfigurationError(absl::StrCat(origin, ": ", e.what()));
    }
}

enum class EnvKind { kString, kInt, kBool };

struct EnvOverride {
    const char* suffix;
    const char* key;
    EnvKind kind;
};

constexpr EnvOverride kEnvOverrides[] = {
    {"LOG_LEVEL", "logging.level", EnvKind::kString},
    {"REVIEW_THRESHOLD", "monitor.review_threshold", EnvKind::kInt},
    {"BLOCK_THREATS", "monitor.block_threats", EnvKind::kBool},
    {"BLOCK_LEVEL", "monitor.block_level", EnvKind::kString},
};

/// Recursive mapping merge; scalars and sequences in `overlay` replace
void MergeInto(YAML::Node& base, const YAML::Node& overlay) {
    if (!overlay.IsMap()) {
        return;
    }
    for (const auto& kv : overlay) {
        const std::string key = kv.first.as<std::string>();
        YAML::Node existing = base[key];
        if (existing.IsMap() && kv.second.IsMap()) {
            MergeInto(existing, kv.second);
        } else {
            base[key] = kv.second;
        }
    }
}

template <typename T>
T ScalarOr(const std::optional<YAML::Node>& node, T fallback) {
    if (!node || !node->IsScalar()) {
        return fallback;
    }
    T value{};
    return YAML::convert<T>::decode(*node, value) ? value : fallback;
}

}  // namespace

Config::Config(YAML::Node root) : root_(std::move(root)) {}

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return NotFoundError(absl::StrCat("No configuration file at ", path.string()));
    }
    const std::string file = path.string();
    return ParseYaml([&file] { return YAML::LoadFile(file); }, file);
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    const std::string text(yaml_content);
    return ParseYaml([&text] { return YAML::Load(text); }, "<string>");
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;
    for (const auto& entry : kEnvOverrides) {
        const std::string name = absl::StrCat(prefix, entry.suffix);
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }

        switch (entry.kind) {
            case EnvKind::kString:
                config.Set(entry.key, std::string(raw));
                break;
            case EnvKind::kInt: {
                int64_t number = 0;
                if (absl::SimpleAtoi(raw, &number)) {
                    config.Set(entry.key, number);
                } else {
                    AGENTGUARD_LOG_WARN("Ignoring {}='{}': not an integer", name, raw);
                }
                break;
            }
            case EnvKind::kBool: {
                bool flag = false;
                if (absl::SimpleAtob(raw, &flag)) {
                    config.Set(entry.key, flag);
                } else {
                    AGENTGUARD_LOG_WARN("Ignoring {}='{}': not a boolean", name, raw);
                }
                break;
            }
        }
    }
    return config;
}

void Config::Merge(const Config& other) {
    if (EnsureRootMap()) {
        MergeInto(root_, other.root_);
    }
}

bool Config::EnsureRootMap() {
    if (root_.IsMap()) {
        return true;
    }
    if (root_.IsDefined() && !root_.IsNull()) {
        AGENTGUARD_LOG_WARN("Configuration root is not a mapping; ignoring update");
        return false;
    }
    // Rebinds the handle; a default-constructed node has no storage yet
    root_ = YAML::Node(YAML::NodeType::Map);
    return true;
}

absl::Status Config::Validate() const {
    if (!root_ || root_.IsNull()) {
        return absl::OkStatus();
    }
    if (!root_.IsMap()) {
        return ConfigurationError("Configuration root must be a mapping");
    }

    const auto& known = KnownConfigSections();
    for (const auto& kv : root_) {
        const std::string section = kv.first.as<std::string>();
        if (std::find(known.begin(), known.end(), section) == known.end()) {
            return ConfigurationError(absl::StrCat(
                "Unknown configuration section '", section, "' (expected one of: ",
                absl::StrJoin(known, ", "), ")"));
        }
        if (section == "rules") {
            if (!kv.second.IsSequence() && !kv.second.IsNull()) {
                return ConfigurationError("'rules' must be a list of rule definitions");
            }
        } else if (!kv.second.IsMap() && !kv.second.IsNull()) {
            return ConfigurationError(absl::StrCat("'", section, "' must be a mapping"));
        }
    }
    return absl::OkStatus();
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    const YAML::Node& root = root_;
    YAML::Node current = YAML::Clone(root);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        // reset() rebinds the handle; operator= would overwrite the parent
        current.reset(current[part]);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::optional<YAML::Node> Config::GetSection(std::string_view key) const {
    return GetNestedNode(key);
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    return ScalarOr<std::string>(GetNestedNode(key), std::string(default_value));
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    return ScalarOr<int64_t>(GetNestedNode(key), default_value);
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    return ScalarOr<bool>(GetNestedNode(key), default_value);
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return {};
    }
    // A lone scalar counts as a one-item list
    if (node->IsScalar()) {
        return {node->Scalar()};
    }

    std::vector<std::string> items;
    if (node->IsSequence()) {
        items.reserve(node->size());
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                items.push_back(item.Scalar());
            }
        }
    }
    return items;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    if (!EnsureRootMap()) {
        return;
    }
    const std::vector<std::string> parts = absl::StrSplit(key, '.');

    // yaml-cpp nodes are handles; reset() rebinds without touching the tree
    YAML::Node parent = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = parent[parts[i]];
        if (!child || !child.IsMap()) {
            parent[parts[i]] = YAML::Node(YAML::NodeType::Map);
            child.reset(parent[parts[i]]);
        }
        parent.reset(child);
    }

    YAML::Node leaf = parent[parts.back()];
    // Lists encode as sequences through yaml-cpp's std::vector converter
    std::visit([&leaf](const auto& v) { leaf = v; }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

Config& GlobalConfig() {
    return g_global_config;
}

absl::Status InitGlobalConfig(const std::optional<std::filesystem::path>& config_path,
                              std::string_view env_prefix) {
    g_global_config = Config();

    Config merged;
    if (config_path) {
        AGENTGUARD_ASSIGN_OR_RETURN(Config from_file, Config::LoadFromFile(*config_path));
        merged = std::move(from_file);
    }
    // Environment overrides take precedence over the file
    merged.Merge(Config::LoadFromEnvironment(env_prefix));

    AGENTGUARD_RETURN_IF_ERROR(merged.Validate());
    g_global_config = std::move(merged);
    return absl::OkStatus();
}

}  // namespace agentguard
