#pragma once

/// @file attack.h
/// @brief Base interface for attack sets run by the security scanner

#include <string>
#include <vector>

namespace agentguard::attacks {

/// @brief Severity of a scanner finding
enum class FindingSeverity {
    kCritical,
    kHigh,
    kMedium,
    kLow,
    kInfo
};

/// @brief "critical", "high", "medium", "low", "info"
std::string FindingSeverityToString(FindingSeverity severity);

/// @brief Outcome of one attack attempt
struct AttackResult {
    std::string attack_name;
    std::string payload;
    std::string response;
    bool vulnerable = false;
    FindingSeverity severity = FindingSeverity::kInfo;
    std::string description;
};

/// @brief Abstract base class for attack sets
class Attack {
public:
    virtual ~Attack() = default;

    /// @brief Run every attempt of this set against an agent
    /// @param agent_prompt The agent's system prompt (may be empty)
    virtual std::vector<AttackResult> Run(const std::string& agent_prompt) const = 0;

    /// @brief Human-readable name of the set
    virtual std::string Name() const = 0;
};

}  // namespace agentguard::attacks
