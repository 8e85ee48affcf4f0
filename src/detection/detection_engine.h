#pragma once

/// @file detection_engine.h
/// @brief Matches text against every rule of a PatternRegistry

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "detection/pattern_registry.h"
#include "detection/types.h"

namespace agentguard::detection {

/// @brief Limits on the text handed to a single regex search
///
/// std::regex matches by recursion, so the stack it needs grows with the
/// length of what it matches. Inputs longer than `window_size` are scanned
/// as overlapping windows rather than truncated, so a payload placed after
/// padding is still seen. A match longer than `window_overlap` that
/// straddles a window boundary can be missed.
struct EngineConfig {
    size_t window_size = 4096;
    size_t window_overlap = 512;

    /// @brief Read `detection.window_size` and `detection.window_overlap`
    /// @return ConfigurationError unless 256 <= window_size <= 1 MiB and
    ///         window_overlap < window_size
    static absl::StatusOr<EngineConfig> FromConfig(const Config& config);
};

/// @brief Slices of text that together cover it, each at most
///        `config.window_size` long; consecutive slices share `window_overlap`
std::vector<std::string_view> SplitIntoWindows(std::string_view text,
                                               const EngineConfig& config);

/// @brief Stateless rule matcher
///
/// Matching is an exhaustive, case-insensitive regex search in registry
/// order; each rule contributes at most one Threat. A rule whose matching
/// throws is logged and counted as a non-match, the other rules still run.
/// Long inputs are matched window by window (see EngineConfig).
///
/// Example usage:
/// @code
///   auto registry = PatternRegistry::LoadDefault();
///   DetectionEngine engine(std::make_shared<const PatternRegistry>(*std::move(registry)));
///   for (const auto& threat : engine.Scan("DROP TABLE users; --")) {
///       std::cout << threat.id << " " << SeverityToString(threat.severity) << "\n";
///   }
/// @endcode
class DetectionEngine {
public:
    explicit DetectionEngine(PatternRegistryPtr registry, EngineConfig config = {});

    /// @brief Threats matching text; empty text yields no threats
    std::vector<Threat> Scan(const std::string& text) const;

    /// @brief Same as Scan(std::string); nullptr is treated as absent text
    std::vector<Threat> Scan(const char* text) const;

    /// @brief Highest severity among threats, nullopt when there are none
    static std::optional<Severity> MaxSeverity(const std::vector<Threat>& threats);

    const PatternRegistry& Registry() const { return *registry_; }
    const EngineConfig& GetConfig() const { return config_; }

private:
    bool Matches(const Rule& rule, const std::vector<std::string_view>& windows,
                 std::string_view text) const;

    PatternRegistryPtr registry_;
    EngineConfig config_;
};

}  // namespace agentguard::detection
