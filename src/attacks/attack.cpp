#include "attacks/attack.h"

namespace agentguard::attacks {

std::string FindingSeverityToString(FindingSeverity severity) {
    switch (severity) {
        case FindingSeverity::kCritical: return "critical";
        case FindingSeverity::kHigh: return "high";
        case FindingSeverity::kMedium: return "medium";
        case FindingSeverity::kLow: return "low";
        case FindingSeverity::kInfo: return "info";
    }
    return "info";
}

}  // namespace agentguard::attacks
