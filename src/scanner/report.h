#pragma once

/// @file report.h
/// @brief JSON serialization of detection, scoring and scan results

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "attacks/attack.h"
#include "attacks/attack_chain.h"
#include "detection/pattern_registry.h"
#include "detection/types.h"
#include "scanner/security_scanner.h"
#include "scoring/review_queue.h"
#include "scoring/risk_scorer.h"

namespace agentguard::scanner {

nlohmann::json ThreatToJson(const detection::Threat& threat);
nlohmann::json ThreatsToJson(const std::vector<detection::Threat>& threats);
nlohmann::json RuleToJson(const detection::Rule& rule);
nlohmann::json ScoreResultToJson(const scoring::ScoreResult& result);
nlohmann::json ReviewItemToJson(const scoring::ReviewItem& item);
nlohmann::json ReviewSummaryToJson(const scoring::ReviewSummary& summary);
nlohmann::json AttackResultToJson(const attacks::AttackResult& result);
nlohmann::json ChainResultToJson(const attacks::ChainResult& result);
nlohmann::json ScanReportToJson(const ScanReport& report);
nlohmann::json ChainScanReportToJson(const ChainScanReport& report);

/// @brief Pretty-printed JSON for output
///
/// Inputs and simulated responses echo caller text, which need not be valid
/// UTF-8; invalid bytes are written as U+FFFD instead of throwing.
std::string DumpJson(const nlohmann::json& json, int indent = 2);

}  // namespace agentguard::scanner
