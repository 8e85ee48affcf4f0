#include "scanner/report.h"

#include <chrono>

namespace agentguard::scanner {

using json = nlohmann::json;

json ThreatToJson(const detection::Threat& threat) {
    json j;
    j["id"] = threat.id;
    j["category"] = detection::CategoryToString(threat.category);
    j["severity"] = detection::SeverityToString(threat.severity);
    j["description"] = threat.description;
    j["pattern"] = threat.pattern;
    return j;
}

json ThreatsToJson(const std::vector<detection::Threat>& threats) {
    json arr = json::array();
    for (const auto& threat : threats) {
        arr.push_back(ThreatToJson(threat));
    }
    return arr;
}

json RuleToJson(const detection::Rule& rule) {
    json j;
    j["id"] = rule.id;
    j["category"] = detection::CategoryToString(rule.category);
    j["severity"] = detection::SeverityToString(rule.severity);
    j["pattern"] = rule.pattern;
    j["description"] = rule.description;
    j["framework"] = rule.framework;
    return j;
}

json ScoreResultToJson(const scoring::ScoreResult& result) {
    json j;
    j["score"] = result.score;
    j["level"] = scoring::RiskLevelToString(result.level);
    j["threats"] = ThreatsToJson(result.threats);
    j["reasons"] = result.reasons;
    j["recommendation"] = result.recommendation;
    j["requires_review"] = result.requires_review;
    return j;
}

json ReviewItemToJson(const scoring::ReviewItem& item) {
    json j;
    j["id"] = item.id;
    j["text"] = item.text;
    j["score"] = item.score;
    j["level"] = scoring::RiskLevelToString(item.level);
    j["threats"] = ThreatsToJson(item.threats);
    j["reasons"] = item.reasons;
    j["metadata"] = item.metadata;
    j["status"] = scoring::ReviewStatusToString(item.status);
    j["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
        item.created_at.time_since_epoch()).count();
    return j;
}

json ReviewSummaryToJson(const scoring::ReviewSummary& summary) {
    json j;
    j["total"] = summary.total;
    j["pending"] = summary.pending;
    j["approved"] = summary.approved;
    j["rejected"] = summary.rejected;
    return j;
}

json AttackResultToJson(const attacks::AttackResult& result) {
    json j;
    j["attack_name"] = result.attack_name;
    j["payload"] = result.payload;
    j["response"] = result.response;
    j["vulnerable"] = result.vulnerable;
    j["severity"] = attacks::FindingSeverityToString(result.severity);
    j["description"] = result.description;
    return j;
}

json ChainResultToJson(const attacks::ChainResult& result) {
    json steps = json::array();
    for (const auto& step : result.steps) {
        json s;
        s["step"] = step.step;
        s["response"] = step.simulated_response;
        s["vulnerable"] = step.step_vulnerable;
        if (!step.indicator.empty()) {
            s["indicator"] = step.indicator;
        }
        s["step_score"] = step.step_score.score;
        s["step_level"] = scoring::RiskLevelToString(step.step_score.level);
        s["response_score"] = step.response_score.score;
        s["response_level"] = scoring::RiskLevelToString(step.response_score.level);
        steps.push_back(std::move(s));
    }

    json j;
    j["name"] = result.chain.name;
    j["description"] = result.chain.description;
    j["attack_type"] = result.chain.attack_type;
    j["steps"] = std::move(steps);
    j["conjunction"] = result.conjunction ? json(*result.conjunction) : json(nullptr);
    j["status"] = result.chain_vulnerable ? "VULNERABLE" : "SAFE";
    return j;
}

json ScanReportToJson(const ScanReport& report) {
    json findings = json::array();
    for (const auto& finding : report.findings) {
        findings.push_back(AttackResultToJson(finding));
    }
    json all = json::array();
    for (const auto& result : report.all_results) {
        all.push_back(AttackResultToJson(result));
    }

    json j;
    j["total_tests"] = report.total_tests;
    j["vulnerable"] = report.vulnerable;
    j["safe"] = report.safe;
    j["security_score"] = report.security_score;
    j["findings"] = std::move(findings);
    j["all_results"] = std::move(all);
    return j;
}

json ChainScanReportToJson(const ChainScanReport& report) {
    json findings = json::array();
    for (const auto& chain : report.chain_findings) {
        findings.push_back(ChainResultToJson(chain));
    }

    json j;
    j["total_chains"] = report.total_chains;
    j["vulnerable_chains"] = report.vulnerable_chains;
    j["safe_chains"] = report.safe_chains;
    j["chain_findings"] = std::move(findings);
    return j;
}

std::string DumpJson(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace agentguard::scanner
