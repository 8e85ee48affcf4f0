/// @file main.cpp
/// @brief AgentGuard command-line entry point

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "attacks/attack_chain.h"
#include "common/config.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "detection/detection_engine.h"
#include "detection/pattern_registry.h"
#include "scanner/report.h"
#include "scanner/security_scanner.h"
#include "scoring/risk_scorer.h"

namespace {

constexpr char kVersion[] = "0.1.0";
constexpr char kDefaultAgentPrompt[] = "You are a helpful assistant.";

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitBlocked = 2;

using agentguard::detection::DetectionEngine;
using agentguard::scanner::DumpJson;
using agentguard::detection::PatternRegistry;
using agentguard::scoring::RiskScorer;
using agentguard::scoring::ScorerConfig;

/// Objects shared by every command, built once from the configuration
struct Services {
    std::shared_ptr<const PatternRegistry> registry;
    std::shared_ptr<const DetectionEngine> engine;
    std::shared_ptr<const RiskScorer> scorer;
};

std::optional<Services> BuildServices(const agentguard::Config& config) {
    auto registry = PatternRegistry::LoadFromConfig(config);
    if (!registry.ok()) {
        AGENTGUARD_LOG_ERROR("Failed to load rules: {}", registry.status().message());
        return std::nullopt;
    }
    auto engine_config = agentguard::detection::EngineConfig::FromConfig(config);
    if (!engine_config.ok()) {
        AGENTGUARD_LOG_ERROR("Invalid detection configuration: {}",
                             engine_config.status().message());
        return std::nullopt;
    }
    auto scorer_config = ScorerConfig::FromConfig(config);
    if (!scorer_config.ok()) {
        AGENTGUARD_LOG_ERROR("Invalid scoring configuration: {}",
                             scorer_config.status().message());
        return std::nullopt;
    }

    Services services;
    services.registry = std::make_shared<const PatternRegistry>(*std::move(registry));
    services.engine = std::make_shared<const DetectionEngine>(services.registry, *engine_config);
    services.scorer = std::make_shared<const RiskScorer>(services.engine, *std::move(scorer_config));
    return services;
}

void PrintScore(const agentguard::scoring::ScoreResult& result) {
    std::cout << "Risk score: " << result.score << "/100 ("
              << agentguard::scoring::RiskLevelToString(result.level) << ")\n";
    std::cout << "Recommendation: " << result.recommendation << "\n";
    for (const auto& reason : result.reasons) {
        std::cout << "  " << reason << "\n";
    }
    if (result.requires_review) {
        std::cout << "Human review required\n";
    }
}

void PrintThreats(const std::vector<agentguard::detection::Threat>& threats) {
    if (threats.empty()) {
        std::cout << "No threats detected\n";
        return;
    }
    std::cout << threats.size() << " threat(s) detected:\n";
    for (const auto& threat : threats) {
        std::cout << "  [" << agentguard::detection::SeverityToString(threat.severity) << "] "
                  << threat.id << " (" << agentguard::detection::CategoryToString(threat.category)
                  << "): " << threat.description << "\n";
    }
}

void PrintScanReport(const agentguard::scanner::ScanReport& report) {
    std::cout << "Security score: " << report.security_score << "\n";
    std::cout << "Tests: " << report.total_tests << "  vulnerable: " << report.vulnerable
              << "  safe: " << report.safe << "\n";
    for (const auto& finding : report.findings) {
        std::cout << "  [" << agentguard::attacks::FindingSeverityToString(finding.severity)
                  << "] " << finding.attack_name << ": " << finding.description << "\n";
    }
}

void PrintChainReport(const agentguard::scanner::ChainScanReport& report) {
    std::cout << "Chains: " << report.total_chains << "  vulnerable: "
              << report.vulnerable_chains << "  safe: " << report.safe_chains << "\n";
    for (const auto& chain : report.chain_findings) {
        std::cout << "  " << chain.chain.name << " (" << chain.chain.attack_type << ")";
        if (chain.conjunction) {
            std::cout << " - pattern: " << *chain.conjunction;
        }
        std::cout << "\n";
        for (const auto& step : chain.steps) {
            std::cout << "    " << (step.step_vulnerable ? "!" : " ") << " " << step.step
                      << "\n      -> " << step.simulated_response << "\n";
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"AgentGuard - threat scanner for autonomous agent inputs"};
    app.require_subcommand(1);

    std::string config_path;
    std::string log_level;
    bool json_output = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("--json", json_output, "Print results as JSON");
    bool print_metrics = false;
    app.add_flag("--metrics", print_metrics, "Print self-monitoring metrics to stderr on exit");

    std::string text;
    auto* detect_cmd = app.add_subcommand("detect", "List the rules an input triggers");
    detect_cmd->add_option("text", text, "Input text to inspect")->required();

    auto* score_cmd = app.add_subcommand("score", "Score an input and recommend an action");
    score_cmd->add_option("text", text, "Input text to score")->required();

    std::string agent_prompt = kDefaultAgentPrompt;
    auto* scan_cmd = app.add_subcommand("scan", "Run every attack set against an agent prompt");
    scan_cmd->add_option("prompt", agent_prompt, "The agent's system prompt");

    auto* chains_cmd = app.add_subcommand("chains", "Run the multi-step attack chains");
    chains_cmd->add_option("prompt", agent_prompt, "The agent's system prompt");

    std::string category_filter;
    auto* rules_cmd = app.add_subcommand("rules", "List the loaded detection rules");
    rules_cmd->add_option("--category", category_filter, "Only show rules of this category");

    auto* config_cmd = app.add_subcommand("config", "Print the effective configuration as JSON");

    auto* version_cmd = app.add_subcommand("version", "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_cmd->parsed()) {
        std::cout << "AgentGuard v" << kVersion << std::endl;
        return kExitOk;
    }

    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto status = agentguard::InitGlobalConfig(path);
    if (!status.ok()) {
        agentguard::InitLogging();
        AGENTGUARD_LOG_ERROR("Failed to load config: {}", status.message());
        return kExitConfigError;
    }
    const agentguard::Config& config = agentguard::GlobalConfig();

    agentguard::InitLogging(agentguard::LogConfigFromConfig(config, log_level));
    if (!config_path.empty()) {
        AGENTGUARD_LOG_INFO("Loaded configuration from {}", config_path);
    }

    if (config_cmd->parsed()) {
        std::cout << DumpJson(config.ToJson()) << std::endl;
        agentguard::ShutdownLogging();
        return kExitOk;
    }

    auto services = BuildServices(config);
    if (!services) {
        return kExitConfigError;
    }

    int exit_code = kExitOk;

    if (detect_cmd->parsed() || score_cmd->parsed()) {
        auto result = services->scorer->Score(text);
        if (detect_cmd->parsed()) {
            if (json_output) {
                std::cout << DumpJson(agentguard::scanner::ThreatsToJson(result.threats)) << std::endl;
            } else {
                PrintThreats(result.threats);
            }
        } else if (json_output) {
            std::cout << DumpJson(agentguard::scanner::ScoreResultToJson(result)) << std::endl;
        } else {
            PrintScore(result);
        }
        if (RiskScorer::ShouldBlock(result)) {
            exit_code = kExitBlocked;
        }
    } else if (scan_cmd->parsed()) {
        auto scanner = agentguard::scanner::SecurityScanner::CreateDefault(services->scorer);
        auto report = scanner->RunScan(agent_prompt);
        if (json_output) {
            std::cout << DumpJson(agentguard::scanner::ScanReportToJson(report)) << std::endl;
        } else {
            PrintScanReport(report);
        }
    } else if (chains_cmd->parsed()) {
        auto scanner = agentguard::scanner::SecurityScanner::CreateDefault(services->scorer);
        auto report = scanner->RunChainScan(agent_prompt);
        if (json_output) {
            std::cout << DumpJson(agentguard::scanner::ChainScanReportToJson(report)) << std::endl;
        } else {
            PrintChainReport(report);
        }
    } else if (rules_cmd->parsed()) {
        std::optional<agentguard::detection::ThreatCategory> category;
        if (!category_filter.empty()) {
            auto parsed = agentguard::detection::ParseCategory(category_filter);
            if (!parsed.ok()) {
                AGENTGUARD_LOG_ERROR("{}", parsed.status().message());
                return kExitConfigError;
            }
            category = *parsed;
        }

        nlohmann::json rules = nlohmann::json::array();
        for (const auto& rule : services->registry->Rules()) {
            if (category && rule.category != *category) {
                continue;
            }
            if (json_output) {
                rules.push_back(agentguard::scanner::RuleToJson(rule));
            } else {
                std::cout << rule.id << "  "
                          << agentguard::detection::SeverityToString(rule.severity) << "  "
                          << agentguard::detection::CategoryToString(rule.category) << "  "
                          << rule.description << "\n";
            }
        }
        if (json_output) {
            std::cout << DumpJson(rules) << std::endl;
        }
    }

    if (print_metrics) {
        std::cerr << agentguard::MetricsRegistry::Instance().ExportText();
    }

    agentguard::ShutdownLogging();
    return exit_code;
}
