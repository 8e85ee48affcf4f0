#pragma once

/// @file agent_monitor.h
/// @brief Host-facing hook that screens agent inputs before they run
///
/// Hosts call the On* hooks at the matching stage of their agent loop. Each
/// text is scored; suspicious inputs are recorded as events, inputs at or
/// above the review threshold are queued for a human, and, when blocking
/// is enabled, inputs at or above the block level are refused with a
/// distinguished status.
///
/// Example usage:
/// @code
///   MonitorConfig config;
///   config.block_threats = true;
///   AgentMonitor monitor(scorer, queue, config);
///   auto status = monitor.OnToolStart("sql", "DROP TABLE users; --");
///   if (IsBlocked(status)) {
///       // refuse to run the tool
///   }
/// @endcode

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "scoring/review_queue.h"
#include "scoring/risk_scorer.h"

namespace agentguard::monitor {

/// @brief Status payload key marking a blocked input; value is the score
inline constexpr char kBlockedPayloadKey[] = "agentguard.blocked";

/// @brief True when the status was produced by a blocking decision
bool IsBlocked(const absl::Status& status);

/// @brief Score carried by a blocked status, nullopt for any other status
std::optional<int> BlockedScore(const absl::Status& status);

/// @brief Hook stages, as recorded on events
inline constexpr char kStagePrompt[] = "prompt";
inline constexpr char kStageLlmStart[] = "llm_start";
inline constexpr char kStageToolStart[] = "tool_start";
inline constexpr char kStageChainStart[] = "chain_start";

struct MonitorConfig {
    bool block_threats = false;
    scoring::RiskLevel block_level = scoring::RiskLevel::kHigh;

    /// Inputs scoring at least this much are queued for review
    int review_threshold = 31;

    /// @brief Read the `monitor:` section
    static absl::StatusOr<MonitorConfig> FromConfig(const Config& config);
};

/// @brief One suspicious input seen by the monitor
struct SecurityEvent {
    std::string stage;
    std::string text;      ///< First 100 characters of the input
    std::string context;   ///< Tool name or input key, empty for prompts
    scoring::ScoreResult result;
    std::optional<uint64_t> review_id;
    bool blocked = false;
};

struct ThreatSummary {
    size_t total_events = 0;
    size_t total_threats = 0;
    std::map<std::string, size_t> by_category;
    std::map<std::string, size_t> by_severity;
};

class AgentMonitor {
public:
    /// @param queue May be null, in which case nothing is queued
    AgentMonitor(std::shared_ptr<const scoring::RiskScorer> scorer,
                 std::shared_ptr<scoring::ReviewQueue> queue,
                 MonitorConfig config = {});

    /// @brief Screen a single prompt
    absl::Status CheckPrompt(const std::string& text);

    /// @brief Screen every prompt of an LLM call; stops at the first blocked one
    absl::Status OnPrompts(const std::vector<std::string>& prompts);

    /// @brief Screen a tool invocation
    absl::Status OnToolStart(const std::string& tool_name, const std::string& input);

    /// @brief Screen the string inputs of a chain, in key order
    absl::Status OnChainStart(const std::map<std::string, std::string>& inputs);

    std::vector<SecurityEvent> GetEvents() const;

    void ClearEvents();

    ThreatSummary GetThreatSummary() const;

    const MonitorConfig& GetConfig() const { return config_; }

private:
    absl::Status Inspect(std::string_view stage, const std::string& text,
                         const std::string& context);

    std::shared_ptr<const scoring::RiskScorer> scorer_;
    std::shared_ptr<scoring::ReviewQueue> queue_;
    MonitorConfig config_;

    mutable std::mutex mutex_;
    std::vector<SecurityEvent> events_;
};

}  // namespace agentguard::monitor
