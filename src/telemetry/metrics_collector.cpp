#include "telemetry/metrics_collector.h"
#include <algorithm>

namespace aegis {

MetricsCollector::MetricsCollector(size_t history, const Clock& clock)
    : history_(history > 0 ? history : 1), clock_(&clock) {}

void MetricsCollector::record(const std::string& name, double value, std::map<std::string, std::string> tags) {
    MetricSample sample{value, std::move(tags), clock_->now_ms()};
    std::lock_guard lock(mutex_);
    auto& samples = series_[name];
    samples.push_back(std::move(sample));
    while (samples.size() > history_) {
        samples.pop_front();
    }
}

std::vector<MetricSample> MetricsCollector::series(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = series_.find(name);
    if (it == series_.end()) return {};
    return std::vector<MetricSample>(it->second.begin(), it->second.end());
}

std::map<std::string, MetricSummary> MetricsCollector::summary() const {
    std::lock_guard lock(mutex_);
    std::map<std::string, MetricSummary> out;
    for (const auto& [name, samples] : series_) {
        if (samples.empty()) continue;
        MetricSummary s;
        s.count = samples.size();
        s.min = samples.front().value;
        s.max = samples.front().value;
        double total = 0.0;
        for (const auto& sample : samples) {
            s.min = std::min(s.min, sample.value);
            s.max = std::max(s.max, sample.value);
            total += sample.value;
        }
        s.avg = total / static_cast<double>(samples.size());
        s.last = samples.back().value;
        out[name] = s;
    }
    return out;
}

size_t MetricsCollector::metric_count() const {
    std::lock_guard lock(mutex_);
    return series_.size();
}

}  // namespace aegis
