#include "monitor/agent_monitor.h"

#include <utility>

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace agentguard::monitor {

namespace {

constexpr size_t kEventTextChars = 100;

absl::Status BlockedError(std::string_view stage, const scoring::ScoreResult& result) {
    absl::Status status = MakeError(
        ErrorCode::kBlocked,
        absl::StrCat("Blocked ", scoring::RiskLevelToString(result.level), " input at ",
                     stage, " (score ", result.score, "): ", result.recommendation));
    status.SetPayload(kBlockedPayloadKey, absl::Cord(absl::StrCat(result.score)));
    return status;
}

}  // namespace

bool IsBlocked(const absl::Status& status) {
    return absl::IsPermissionDenied(status) &&
           status.GetPayload(kBlockedPayloadKey).has_value();
}

std::optional<int> BlockedScore(const absl::Status& status) {
    if (!IsBlocked(status)) {
        return std::nullopt;
    }
    int score = 0;
    const std::string payload(*status.GetPayload(kBlockedPayloadKey));
    if (!absl::SimpleAtoi(payload, &score)) {
        return std::nullopt;
    }
    return score;
}

absl::StatusOr<MonitorConfig> MonitorConfig::FromConfig(const Config& config) {
    MonitorConfig result;
    result.block_threats = config.GetBool("monitor.block_threats", result.block_threats);
    result.review_threshold = static_cast<int>(
        config.GetInt("monitor.review_threshold", result.review_threshold));
    if (result.review_threshold < 0 || result.review_threshold > 100) {
        return ConfigurationError(absl::StrCat(
            "monitor.review_threshold must be within [0, 100], got ", result.review_threshold));
    }

    if (config.HasKey("monitor.block_level")) {
        auto level = scoring::ParseRiskLevel(config.GetString("monitor.block_level"));
        if (!level.ok()) {
            return ConfigurationError(absl::StrCat("monitor.block_level: ",
                                                   level.status().message()));
        }
        result.block_level = *level;
    }
    return result;
}

AgentMonitor::AgentMonitor(std::shared_ptr<const scoring::RiskScorer> scorer,
                           std::shared_ptr<scoring::ReviewQueue> queue,
                           MonitorConfig config)
    : scorer_(std::move(scorer)), queue_(std::move(queue)), config_(config) {}

absl::Status AgentMonitor::CheckPrompt(const std::string& text) {
    return Inspect(kStagePrompt, text, "");
}

absl::Status AgentMonitor::OnPrompts(const std::vector<std::string>& prompts) {
    for (const auto& prompt : prompts) {
        AGENTGUARD_RETURN_IF_ERROR(Inspect(kStageLlmStart, prompt, ""));
    }
    return OkStatus();
}

absl::Status AgentMonitor::OnToolStart(const std::string& tool_name, const std::string& input) {
    return Inspect(kStageToolStart, input, tool_name.empty() ? "unknown" : tool_name);
}

absl::Status AgentMonitor::OnChainStart(const std::map<std::string, std::string>& inputs) {
    for (const auto& [key, value] : inputs) {
        AGENTGUARD_RETURN_IF_ERROR(Inspect(kStageChainStart, value, key));
    }
    return OkStatus();
}

absl::Status AgentMonitor::Inspect(std::string_view stage, const std::string& text,
                                   const std::string& context) {
    scoring::ScoreResult result = scorer_->Score(text);
    if (result.threats.empty() && result.level == scoring::RiskLevel::kLow) {
        return OkStatus();
    }

    for (const auto& threat : result.threats) {
        AGENTGUARD_LOG_WARN("Security threat detected at {}: {} - {}", stage,
                            detection::CategoryToString(threat.category),
                            threat.description);
    }

    SecurityEvent event;
    event.stage = std::string(stage);
    event.text = text.substr(0, kEventTextChars);
    event.context = context;

    if (queue_ && result.score >= config_.review_threshold) {
        event.review_id = queue_->Add(text, result, {{"stage", event.stage},
                                                     {"context", context}});
    }

    const bool block = config_.block_threats && result.level >= config_.block_level;
    event.blocked = block;
    event.result = result;

    std::vector<std::string> rule_ids;
    for (const auto& threat : result.threats) {
        rule_ids.push_back(threat.id);
    }
    AGENTGUARD_AUDIT("stage={} context={} score={} level={} action={} review_id={} rules={}",
                     stage, context.empty() ? "-" : context, result.score,
                     scoring::RiskLevelToString(result.level), block ? "block" : "allow",
                     event.review_id ? absl::StrCat(*event.review_id) : "-",
                     rule_ids.empty() ? "-" : absl::StrJoin(rule_ids, ","));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    if (block) {
        AGENTGUARD_COUNTER(metric_names::kBlockedTotal).Increment();
        AGENTGUARD_LOG_WARN("Blocked {} input at {} (score {})",
                            scoring::RiskLevelToString(result.level), stage, result.score);
        return BlockedError(stage, result);
    }
    return OkStatus();
}

std::vector<SecurityEvent> AgentMonitor::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

void AgentMonitor::ClearEvents() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

ThreatSummary AgentMonitor::GetThreatSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ThreatSummary summary;
    summary.total_events = events_.size();
    for (const auto& event : events_) {
        summary.total_threats += event.result.threats.size();
        for (const auto& threat : event.result.threats) {
            ++summary.by_category[detection::CategoryToString(threat.category)];
            ++summary.by_severity[detection::SeverityToString(threat.severity)];
        }
    }
    return summary;
}

}  // namespace agentguard::monitor
