#include "scoring/risk_scorer.h"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace agentguard::scoring {

namespace {

constexpr int kMinScore = 0;
constexpr int kMaxScore = 100;

std::vector<std::string> FindPresent(const std::string& lowered,
                                     const std::vector<std::string>& needles) {
    std::vector<std::string> found;
    for (const auto& needle : needles) {
        if (needle.empty()) {
            continue;
        }
        if (std::find(found.begin(), found.end(), needle) != found.end()) {
            continue;
        }
        if (lowered.find(needle) != std::string::npos) {
            found.push_back(needle);
        }
    }
    return found;
}

std::vector<std::string> LowerAll(std::vector<std::string> values) {
    for (auto& value : values) {
        absl::AsciiStrToLower(&value);
    }
    return values;
}

}  // namespace

std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::kLow: return "LOW";
        case RiskLevel::kMedium: return "MEDIUM";
        case RiskLevel::kHigh: return "HIGH";
        case RiskLevel::kCritical: return "CRITICAL";
    }
    return "LOW";
}

absl::StatusOr<RiskLevel> ParseRiskLevel(std::string_view name) {
    const std::string upper = absl::AsciiStrToUpper(name);
    if (upper == "LOW") return RiskLevel::kLow;
    if (upper == "MEDIUM") return RiskLevel::kMedium;
    if (upper == "HIGH") return RiskLevel::kHigh;
    if (upper == "CRITICAL") return RiskLevel::kCritical;
    return InvalidArgumentError(absl::StrCat("Unknown risk level: '", name, "'"));
}

RiskLevel LevelForScore(int score) {
    if (score <= 30) return RiskLevel::kLow;
    if (score <= 60) return RiskLevel::kMedium;
    if (score <= 80) return RiskLevel::kHigh;
    return RiskLevel::kCritical;
}

std::string RecommendationFor(RiskLevel level) {
    switch (level) {
        case RiskLevel::kLow:
            return "ALLOW - Low risk, safe to proceed";
        case RiskLevel::kMedium:
            return "REVIEW - Moderate risk, human review recommended";
        case RiskLevel::kHigh:
            return "BLOCK - High risk, block with manual override option";
        case RiskLevel::kCritical:
            return "BLOCK - Critical risk, always block";
    }
    return "ALLOW - Low risk, safe to proceed";
}

int ScorerConfig::PointsFor(detection::Severity severity) const {
    switch (severity) {
        case detection::Severity::kCritical: return critical_points;
        case detection::Severity::kHigh: return high_points;
        case detection::Severity::kMedium: return medium_points;
        case detection::Severity::kLow: return low_points;
    }
    return low_points;
}

absl::StatusOr<ScorerConfig> ScorerConfig::FromConfig(const Config& config) {
    ScorerConfig result;
    const std::pair<const char*, int*> weights[] = {
        {"scoring.severity_points.critical", &result.critical_points},
        {"scoring.severity_points.high", &result.high_points},
        {"scoring.severity_points.medium", &result.medium_points},
        {"scoring.severity_points.low", &result.low_points},
        {"scoring.aggravating_weight", &result.aggravating_weight},
        {"scoring.mitigating_weight", &result.mitigating_weight},
    };
    // A single hit can never need more than the whole scale
    for (const auto& [key, field] : weights) {
        const int64_t value = config.GetInt(key, *field);
        if (value < kMinScore || value > kMaxScore) {
            return ConfigurationError(absl::StrCat(key, " must be between ", kMinScore,
                                                   " and ", kMaxScore, ", got ", value));
        }
        *field = static_cast<int>(value);
    }

    if (config.HasKey("scoring.aggravating_keywords")) {
        result.aggravating_keywords = config.GetStringList("scoring.aggravating_keywords");
    }
    if (config.HasKey("scoring.mitigating_phrases")) {
        result.mitigating_phrases = config.GetStringList("scoring.mitigating_phrases");
    }
    return result;
}

RiskScorer::RiskScorer(std::shared_ptr<const detection::DetectionEngine> engine,
                       ScorerConfig config)
    : engine_(std::move(engine)), config_(std::move(config)) {
    config_.aggravating_keywords = LowerAll(std::move(config_.aggravating_keywords));
    config_.mitigating_phrases = LowerAll(std::move(config_.mitigating_phrases));
}

ScoreResult RiskScorer::Score(const std::string& text) const {
    ScoreResult result;
    result.threats = engine_->Scan(text);

    // Wide enough that long keyword lists cannot overflow before the clamp
    int64_t score = 0;
    for (const auto& threat : result.threats) {
        const int points = config_.PointsFor(threat.severity);
        score += points;
        result.reasons.push_back(absl::StrCat("+", points, ": ", threat.description));
    }

    const std::string lowered = absl::AsciiStrToLower(text);

    const auto aggravating = FindPresent(lowered, config_.aggravating_keywords);
    if (!aggravating.empty()) {
        const int64_t bonus =
            static_cast<int64_t>(aggravating.size()) * config_.aggravating_weight;
        score += bonus;
        result.reasons.push_back(absl::StrCat(
            "+", bonus, ": Malicious keywords: ", absl::StrJoin(aggravating, ", ")));
    }

    const auto mitigating = FindPresent(lowered, config_.mitigating_phrases);
    if (!mitigating.empty()) {
        const int64_t reduction =
            static_cast<int64_t>(mitigating.size()) * config_.mitigating_weight;
        score = std::max<int64_t>(kMinScore, score - reduction);
        result.reasons.push_back(absl::StrCat(
            "-", reduction, ": Legitimate intent: ", absl::StrJoin(mitigating, ", ")));
    }

    result.score = static_cast<int>(std::clamp<int64_t>(score, kMinScore, kMaxScore));
    result.level = LevelForScore(result.score);
    result.recommendation = RecommendationFor(result.level);
    result.requires_review =
        result.level == RiskLevel::kMedium || result.level == RiskLevel::kHigh;

    AGENTGUARD_LOG_TRACE("Scored input: {} ({}), {} threats", result.score,
                         RiskLevelToString(result.level), result.threats.size());
    return result;
}

bool RiskScorer::ShouldBlock(const ScoreResult& result) {
    return result.level == RiskLevel::kHigh || result.level == RiskLevel::kCritical;
}

bool RiskScorer::RequiresHumanReview(const ScoreResult& result) {
    return result.requires_review;
}

}  // namespace agentguard::scoring
