#pragma once

/// @file risk_scorer.h
/// @brief Converts detected threats and keyword heuristics into a bounded risk score

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "detection/detection_engine.h"
#include "detection/types.h"

namespace agentguard::scoring {

/// @brief Score band, ordered from least to most severe
enum class RiskLevel {
    kLow,       ///< 0-30, allow
    kMedium,    ///< 31-60, human review
    kHigh,      ///< 61-80, block with manual override
    kCritical   ///< 81-100, always block
};

std::string RiskLevelToString(RiskLevel level);

/// @brief Case-insensitive parse of "LOW" / "MEDIUM" / "HIGH" / "CRITICAL"
absl::StatusOr<RiskLevel> ParseRiskLevel(std::string_view name);

/// @brief Level for a score in [0, 100] using inclusive bands
RiskLevel LevelForScore(int score);

/// @brief Fixed recommendation text for a level
std::string RecommendationFor(RiskLevel level);

/// @brief Tuning knobs of the scorer
struct ScorerConfig {
    int critical_points = 60;
    int high_points = 40;
    int medium_points = 20;
    int low_points = 10;

    /// Points per distinct aggravating keyword found
    int aggravating_weight = 11;

    /// Points removed per distinct mitigating phrase found
    int mitigating_weight = 15;

    std::vector<std::string> aggravating_keywords = {
        "email", "send", "execute", "delete", "drop", "reveal",
        "exfiltrate", "steal", "hack", "bypass", "exploit",
        "secret", "password", "credential", "token", "key"};

    std::vector<std::string> mitigating_phrases = {
        "start fresh", "reset", "clear history", "begin again",
        "new session", "start over", "clear context"};

    /// @brief Points for one threat of the given severity
    int PointsFor(detection::Severity severity) const;

    /// @brief Read the `scoring:` section, falling back to defaults per key
    static absl::StatusOr<ScorerConfig> FromConfig(const Config& config);
};

/// @brief Outcome of scoring one text
struct ScoreResult {
    int score = 0;
    RiskLevel level = RiskLevel::kLow;
    std::vector<detection::Threat> threats;
    std::vector<std::string> reasons;
    std::string recommendation;
    bool requires_review = false;
};

/// @brief Risk scorer
///
/// Scoring runs in a fixed order: rule hits, aggravating keywords,
/// mitigating phrases (floored at zero), clamp to [0, 100], then banding.
/// Keyword checks are plain substring tests on the lower-cased text.
class RiskScorer {
public:
    explicit RiskScorer(std::shared_ptr<const detection::DetectionEngine> engine,
                        ScorerConfig config = {});

    ScoreResult Score(const std::string& text) const;

    /// @brief True for HIGH and CRITICAL results
    static bool ShouldBlock(const ScoreResult& result);

    static bool RequiresHumanReview(const ScoreResult& result);

    const detection::DetectionEngine& Engine() const { return *engine_; }
    const ScorerConfig& GetConfig() const { return config_; }

private:
    std::shared_ptr<const detection::DetectionEngine> engine_;
    ScorerConfig config_;
};

}  // namespace agentguard::scoring
