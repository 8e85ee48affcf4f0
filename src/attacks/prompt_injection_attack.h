#pragma once

/// @file prompt_injection_attack.h
/// @brief Single-payload prompt injection attack set

#include <string>
#include <vector>

#include "attacks/attack.h"
#include "attacks/response_simulator.h"

namespace agentguard::attacks {

/// @brief Built-in payloads: direct override, role manipulation, prompt
/// extraction, tool manipulation, jailbreaking, context manipulation and
/// indirect injection
const std::vector<std::string>& DefaultInjectionPayloads();

/// @brief Sends each payload to the agent and checks the reply for compromise
///
/// Every finding carries FindingSeverity::kHigh.
class PromptInjectionAttack : public Attack {
public:
    explicit PromptInjectionAttack(ResponseSimulator simulator = InjectionResponseSimulator(),
                                   std::vector<std::string> payloads = DefaultInjectionPayloads());

    std::vector<AttackResult> Run(const std::string& agent_prompt) const override;

    std::string Name() const override { return "Prompt Injection"; }

    const std::vector<std::string>& Payloads() const { return payloads_; }

private:
    ResponseSimulator simulator_;
    std::vector<std::string> payloads_;
};

}  // namespace agentguard::attacks
