#pragma once

/// @file response_simulator.h
/// @brief Canned agent responses and compromise indicators
///
/// The simulator stands in for a live agent: an ordered table of
/// keyword conditions, first match wins. Injection payloads and chain steps
/// each have their own table, since a row written for one set would shadow
/// the other's. Callers that talk to a real agent pass their own
/// ResponseSimulator instead.

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentguard::attacks {

/// @brief Produces the agent's reply to one input
using ResponseSimulator =
    std::function<std::string(const std::string& agent_prompt, const std::string& input)>;

/// @brief One row of the canned-response table
///
/// The row applies when every group has at least one keyword present in
/// the lower-cased input. "{prompt}" in the response is replaced by the
/// agent prompt.
struct SimulatedResponse {
    std::vector<std::vector<std::string>> conditions;
    std::string response;
};

/// @brief Replies to prompt injection payloads: prompt leak, override,
///        role change, destructive tool use
const std::vector<SimulatedResponse>& InjectionResponseTable();

/// @brief Replies to attack chain steps: database and system
///        reconnaissance, file access, social engineering
const std::vector<SimulatedResponse>& ChainResponseTable();

/// @brief Reply used when no row matches
extern const char kRefusalResponse[];

/// @brief First matching row of @p table, or kRefusalResponse
std::string SimulateAgentResponse(const std::vector<SimulatedResponse>& table,
                                  const std::string& agent_prompt,
                                  const std::string& input);

/// @brief Default simulator for PromptInjectionAttack
ResponseSimulator InjectionResponseSimulator();

/// @brief Default simulator for AttackChainEvaluator
ResponseSimulator ChainResponseSimulator();

/// @brief Simulator that always refuses
ResponseSimulator RefusingResponseSimulator();

/// @brief Check a response for signs that the agent was compromised
///
/// Indicators are, in order: the agent prompt echoed back (skipped when the
/// prompt is empty), compliance phrases, and sensitive-data markers.
/// @return The indicator that fired, or nullopt for a clean response
std::optional<std::string> FindCompromiseIndicator(const std::string& agent_prompt,
                                                   const std::string& response);

}  // namespace agentguard::attacks
