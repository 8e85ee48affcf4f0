#pragma once

/// @file attack_chain.h
/// @brief Multi-step attack scenarios whose intent only shows in aggregate
///
/// Each step of a chain looks harmless on its own. The evaluator runs the
/// steps one by one against the agent, checks every reply for compromise,
/// and separately tests the whole sequence against keyword conjunctions.

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "attacks/attack.h"
#include "attacks/response_simulator.h"
#include "scoring/risk_scorer.h"

namespace agentguard::attacks {

/// @brief A named sequence of innocuous-looking steps
struct AttackChain {
    std::string name;
    std::string description;
    std::vector<std::string> steps;
    std::string attack_type;
};

/// @brief All-of-N keyword set tested against the joined, lower-cased steps
struct ChainConjunction {
    std::string name;
    std::vector<std::string> keywords;
};

/// @brief Credential Harvesting, System Reconnaissance, Data Exfiltration,
/// Social Engineering
const std::vector<AttackChain>& DefaultAttackChains();

const std::vector<ChainConjunction>& DefaultChainConjunctions();

/// @brief Per-step outcome
struct ChainStepResult {
    std::string step;
    std::string simulated_response;
    bool step_vulnerable = false;

    /// Indicator that marked the step, empty when the step is clean
    std::string indicator;

    scoring::ScoreResult step_score;
    scoring::ScoreResult response_score;
};

/// @brief Outcome of one chain
struct ChainResult {
    AttackChain chain;
    std::vector<ChainStepResult> steps;

    /// Name of the conjunction that fired, if any
    std::optional<std::string> conjunction;

    /// Any step vulnerable, or a conjunction fired
    bool chain_vulnerable = false;

    size_t VulnerableSteps() const;
};

/// @brief Evaluates attack chains against an agent
class AttackChainEvaluator : public Attack {
public:
    AttackChainEvaluator(std::shared_ptr<const scoring::RiskScorer> scorer,
                         ResponseSimulator simulator = ChainResponseSimulator(),
                         std::vector<AttackChain> chains = DefaultAttackChains(),
                         std::vector<ChainConjunction> conjunctions = DefaultChainConjunctions());

    /// @brief Run one chain step by step
    ChainResult Evaluate(const AttackChain& chain, const std::string& agent_prompt) const;

    /// @brief Run every configured chain, in order
    std::vector<ChainResult> EvaluateAll(const std::string& agent_prompt) const;

    /// @brief First conjunction whose keywords all appear in the joined steps
    std::optional<std::string> DetectConjunction(const std::vector<std::string>& steps) const;

    /// @brief One AttackResult per chain
    std::vector<AttackResult> Run(const std::string& agent_prompt) const override;

    std::string Name() const override { return "Attack Chains"; }

    const std::vector<AttackChain>& Chains() const { return chains_; }

    /// @brief Scanner finding for an evaluated chain
    static AttackResult ToAttackResult(const ChainResult& result);

private:
    std::shared_ptr<const scoring::RiskScorer> scorer_;
    ResponseSimulator simulator_;
    std::vector<AttackChain> chains_;
    std::vector<ChainConjunction> conjunctions_;
};

}  // namespace agentguard::attacks
