#include "detection/detection_engine.h"

#include <algorithm>
#include <regex>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace agentguard::detection {

namespace {

constexpr size_t kMinWindowSize = 256;
constexpr size_t kMaxWindowSize = 1024 * 1024;

/// Flags telling the matcher that a window is cut out of a longer text,
/// so `^`, `$` and `\b` only fire at the real ends of the input
std::regex_constants::match_flag_type WindowFlags(std::string_view window,
                                                  std::string_view text) {
    auto flags = std::regex_constants::match_default;
    if (window.data() != text.data()) {
        flags |= std::regex_constants::match_prev_avail;
    }
    if (window.data() + window.size() != text.data() + text.size()) {
        flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
    }
    return flags;
}

}  // namespace

absl::StatusOr<EngineConfig> EngineConfig::FromConfig(const Config& config) {
    EngineConfig result;
    const int64_t size = config.GetInt("detection.window_size",
                                       static_cast<int64_t>(result.window_size));
    const int64_t overlap = config.GetInt("detection.window_overlap",
                                          static_cast<int64_t>(result.window_overlap));

    if (size < static_cast<int64_t>(kMinWindowSize) ||
        size > static_cast<int64_t>(kMaxWindowSize)) {
        return ConfigurationError(absl::StrCat("detection.window_size must be between ",
                                               kMinWindowSize, " and ", kMaxWindowSize,
                                               ", got ", size));
    }
    if (overlap < 0 || overlap >= size) {
        return ConfigurationError(absl::StrCat(
            "detection.window_overlap must be in [0, window_size), got ", overlap));
    }
    result.window_size = static_cast<size_t>(size);
    result.window_overlap = static_cast<size_t>(overlap);
    return result;
}

std::vector<std::string_view> SplitIntoWindows(std::string_view text,
                                               const EngineConfig& config) {
    std::vector<std::string_view> windows;
    if (text.size() <= config.window_size) {
        windows.push_back(text);
        return windows;
    }

    const size_t step = config.window_size - config.window_overlap;
    for (size_t start = 0;; start += step) {
        const size_t length = std::min(config.window_size, text.size() - start);
        windows.push_back(text.substr(start, length));
        if (start + length == text.size()) {
            break;
        }
    }
    return windows;
}

DetectionEngine::DetectionEngine(PatternRegistryPtr registry, EngineConfig config)
    : registry_(std::move(registry)), config_(config) {}

bool DetectionEngine::Matches(const Rule& rule, const std::vector<std::string_view>& windows,
                              std::string_view text) const {
    for (const auto window : windows) {
        if (std::regex_search(window.begin(), window.end(), rule.regex,
                              WindowFlags(window, text))) {
            return true;
        }
    }
    return false;
}

std::vector<Threat> DetectionEngine::Scan(const std::string& text) const {
    std::vector<Threat> threats;
    if (text.empty()) {
        return threats;
    }

    AGENTGUARD_COUNTER(metric_names::kScansTotal).Increment();
    ScopedTimer timer(AGENTGUARD_HISTOGRAM(metric_names::kScanDuration));

    const auto windows = SplitIntoWindows(text, config_);
    if (windows.size() > 1) {
        AGENTGUARD_LOG_DEBUG("Scanning {} bytes in {} windows", text.size(), windows.size());
    }

    for (const auto& rule : registry_->Rules()) {
        bool matched = false;
        try {
            matched = Matches(rule, windows, text);
        } catch (const std::regex_error& e) {
            AGENTGUARD_LOG_WARN("Rule {} failed on input of {} bytes: {}",
                                rule.id, text.size(), e.what());
            AGENTGUARD_COUNTER(metric_names::kRuleMatchErrors).Increment();
            continue;
        }
        if (!matched) {
            continue;
        }

        Threat threat;
        threat.id = rule.id;
        threat.category = rule.category;
        threat.severity = rule.severity;
        threat.description = rule.description;
        threat.pattern = rule.pattern;
        AGENTGUARD_LABELED_COUNTER(metric_names::kRuleHits,
                                   {{"rule", rule.id}, {"category", CategoryToString(rule.category)}})
            .Increment();
        threats.push_back(std::move(threat));
    }

    if (!threats.empty()) {
        AGENTGUARD_COUNTER(metric_names::kThreatsDetected)
            .Add(static_cast<int64_t>(threats.size()));
        AGENTGUARD_LOG_DEBUG("Detected {} threats (first: {})", threats.size(),
                             threats.front().id);
    }
    return threats;
}

std::vector<Threat> DetectionEngine::Scan(const char* text) const {
    if (text == nullptr) {
        return {};
    }
    return Scan(std::string(text));
}

std::optional<Severity> DetectionEngine::MaxSeverity(const std::vector<Threat>& threats) {
    std::optional<Severity> max;
    for (const auto& threat : threats) {
        if (!max || threat.severity > *max) {
            max = threat.severity;
        }
    }
    return max;
}

}  // namespace agentguard::detection
