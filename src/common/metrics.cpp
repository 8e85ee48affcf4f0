#include "metrics.h"

#include <algorithm>
#include <limits>
#include <sstream>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_replace.h>

namespace agentguard {

namespace {

// Regex scans over prompt-sized text finish in micro- to milliseconds
const std::vector<double> kScanLatencyBuckets = {
    0.0001, 0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.5, 1.0
};

std::string EscapeLabelValue(const std::string& value) {
    return absl::StrReplaceAll(value, {{"\\", "\\\\"}, {"\"", "\\\""}, {"\n", "\\n"}});
}

/// `{a="1",b="2"}`, or empty for an unlabeled series
std::string FormatLabels(const MetricLabels& labels) {
    if (labels.empty()) {
        return "";
    }
    return absl::StrCat(
        "{",
        absl::StrJoin(labels, ",",
                      [](std::string* out, const std::pair<const std::string, std::string>& kv) {
                          absl::StrAppend(out, kv.first, "=\"", EscapeLabelValue(kv.second),
                                          "\"");
                      }),
        "}");
}

void AppendHeader(std::ostringstream& out, const std::string& name, std::string_view type) {
    const std::string_view help = DescribeMetric(name);
    if (!help.empty()) {
        out << "# HELP " << name << " " << help << "\n";
    }
    out << "# TYPE " << name << " " << type << "\n";
}

}  // namespace

std::string_view DescribeMetric(std::string_view name) {
    static const std::map<std::string_view, std::string_view> kHelp = {
        {metric_names::kScansTotal, "Non-empty inputs scanned by the detection engine"},
        {metric_names::kThreatsDetected, "Rule matches across all scans"},
        {metric_names::kRuleHits, "Rule matches by rule id and category"},
        {metric_names::kRuleMatchErrors, "Rules that failed while matching and were skipped"},
        {metric_names::kScanDuration, "Time spent running the rule catalogue over one input"},
        {metric_names::kBlockedTotal, "Inputs refused by the agent monitor"},
        {metric_names::kReviewEnqueued, "Items added to the human review queue"},
        {metric_names::kReviewPending, "Review items awaiting a decision"},
    };
    auto it = kHelp.find(name);
    return it == kHelp.end() ? std::string_view() : it->second;
}

Counter::Counter(std::string name, MetricLabels labels)
    : name_(std::move(name)), labels_(std::move(labels)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta > 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Gauge::Gauge(std::string name) : name_(std::move(name)) {}

void Gauge::Set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::Add(double delta) {
    double current = value_.load(std::memory_order_relaxed);
    while (!value_.compare_exchange_weak(current, current + delta,
                                          std::memory_order_relaxed)) {
    }
}

double Gauge::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Histogram::Histogram(std::string name)
    : Histogram(std::move(name), kScanLatencyBuckets) {}

Histogram::Histogram(std::string name, std::vector<double> bounds)
    : name_(std::move(name)), bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    counts_.assign(bounds_.size() + 1, 0);  // last slot is +Inf
}

void Histogram::Observe(double value) {
    // Upper bounds are inclusive
    const auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value);
    const auto slot = static_cast<size_t>(std::distance(bounds_.begin(), it));

    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[slot];
    ++count_;
    sum_ += value;
}

int64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(counts_.size());

    int64_t cumulative = 0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        cumulative += counts_[i];
        const double bound = i < bounds_.size()
            ? bounds_[i]
            : std::numeric_limits<double>::infinity();
        result.emplace_back(bound, cumulative);
    }
    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const MetricLabels& labels) {
    const std::string key = FormatLabels(labels);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = counters_[name];
    auto it = series.find(key);
    if (it == series.end()) {
        it = series.emplace(key, std::make_unique<Counter>(name, labels)).first;
    }
    return *it->second;
}

Gauge& MetricsRegistry::GetGauge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) {
        slot = std::make_unique<Gauge>(name);
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<Histogram>(name);
    }
    return *slot;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    // Keyed by family name so the dump is sorted across metric types
    std::map<std::string, std::string> families;

    for (const auto& [name, series] : counters_) {
        std::ostringstream out;
        AppendHeader(out, name, "counter");
        for (const auto& [key, counter] : series) {
            out << name << key << " " << counter->Value() << "\n";
        }
        families[name] = out.str();
    }

    for (const auto& [name, gauge] : gauges_) {
        std::ostringstream out;
        AppendHeader(out, name, "gauge");
        out << name << " " << gauge->Value() << "\n";
        families[name] = out.str();
    }

    for (const auto& [name, histogram] : histograms_) {
        std::ostringstream out;
        AppendHeader(out, name, "histogram");
        for (const auto& [bound, count] : histogram->Buckets()) {
            out << name << "_bucket{le=\"";
            if (bound == std::numeric_limits<double>::infinity()) {
                out << "+Inf";
            } else {
                out << bound;
            }
            out << "\"} " << count << "\n";
        }
        out << name << "_sum " << histogram->Sum() << "\n"
            << name << "_count " << histogram->Count() << "\n";
        families[name] = out.str();
    }

    std::string text;
    for (const auto& [name, family] : families) {
        text += family;
    }
    return text;
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
}

}  // namespace agentguard
