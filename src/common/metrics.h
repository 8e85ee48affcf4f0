#pragma once

/// @file metrics.h
/// @brief Process-local self-monitoring metrics
///
/// Metrics live in a single registry and are exported in the Prometheus
/// text format. A metric family is identified by its name; counters may
/// additionally carry labels, each distinct label set being its own series:
///
/// @code
///   AGENTGUARD_COUNTER(metric_names::kScansTotal).Increment();
///   AGENTGUARD_LABELED_COUNTER(metric_names::kRuleHits,
///                              {{"rule", "PI-001"}, {"category", "prompt_injection"}})
///       .Increment();
/// @endcode
///
/// References returned by the registry stay valid until Reset(), so call
/// sites look metrics up on every use instead of caching them.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace agentguard {

namespace metric_names {
inline constexpr char kScansTotal[] = "agentguard_scans_total";
inline constexpr char kThreatsDetected[] = "agentguard_threats_detected_total";
inline constexpr char kRuleHits[] = "agentguard_rule_hits_total";
inline constexpr char kRuleMatchErrors[] = "agentguard_rule_match_errors_total";
inline constexpr char kScanDuration[] = "agentguard_scan_duration_seconds";
inline constexpr char kBlockedTotal[] = "agentguard_blocked_total";
inline constexpr char kReviewEnqueued[] = "agentguard_review_enqueued_total";
inline constexpr char kReviewPending[] = "agentguard_review_pending";
}  // namespace metric_names

/// @brief Label name to value; ordered so that series keys are canonical
using MetricLabels = std::map<std::string, std::string>;

/// @brief HELP text for the well-known metric names, empty for others
std::string_view DescribeMetric(std::string_view name);

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name, MetricLabels labels = {});

    void Increment();

    /// @brief Add a non-negative delta; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const;

    const std::string& Name() const { return name_; }
    const MetricLabels& Labels() const { return labels_; }

private:
    std::string name_;
    MetricLabels labels_;
    std::atomic<int64_t> value_{0};
};

/// @brief Value that can go up and down
class Gauge {
public:
    explicit Gauge(std::string name);

    void Set(double value);
    void Add(double delta);
    double Value() const;

    const std::string& Name() const { return name_; }

private:
    std::string name_;
    std::atomic<double> value_{0.0};
};

/// @brief Bucketed distribution of observed values
class Histogram {
public:
    /// @brief Buckets suited to per-scan latency, in seconds
    explicit Histogram(std::string name);

    Histogram(std::string name, std::vector<double> bounds);

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative counts per upper bound, last entry is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }

private:
    std::string name_;
    std::vector<double> bounds_;
    std::vector<int64_t> counts_;
    int64_t count_ = 0;
    double sum_ = 0.0;
    mutable std::mutex mutex_;
};

/// @brief Records the lifetime of the scope, in seconds, into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    /// @brief Counter series for the given labels (none by default)
    Counter& GetCounter(const std::string& name, const MetricLabels& labels = {});
    Gauge& GetGauge(const std::string& name);
    Histogram& GetHistogram(const std::string& name);

    /// @brief Prometheus text exposition, families sorted by name and
    ///        series sorted by label set
    std::string ExportText() const;

    /// @brief Drop all metrics (tests only)
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    // family name -> series key -> counter
    std::map<std::string, std::map<std::string, std::unique_ptr<Counter>>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define AGENTGUARD_COUNTER(name) \
    ::agentguard::MetricsRegistry::Instance().GetCounter(name)

#define AGENTGUARD_LABELED_COUNTER(name, ...) \
    ::agentguard::MetricsRegistry::Instance().GetCounter(name, ::agentguard::MetricLabels __VA_ARGS__)

#define AGENTGUARD_GAUGE(name) \
    ::agentguard::MetricsRegistry::Instance().GetGauge(name)

#define AGENTGUARD_HISTOGRAM(name) \
    ::agentguard::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace agentguard
