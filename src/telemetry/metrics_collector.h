#pragma once
#ifndef AEGIS_METRICS_COLLECTOR_H
#define AEGIS_METRICS_COLLECTOR_H

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "common/clock.h"

namespace aegis {

struct MetricSample {
    double value = 0.0;
    std::map<std::string, std::string> tags;
    int64_t timestamp = 0;
};

struct MetricSummary {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    double last = 0.0;
};

// Named metric series, each capped at `history` samples (oldest dropped).
class MetricsCollector {
public:
    explicit MetricsCollector(size_t history = 1000, const Clock& clock = system_clock());

    void record(const std::string& name, double value, std::map<std::string, std::string> tags = {});

    std::vector<MetricSample> series(const std::string& name) const;
    std::map<std::string, MetricSummary> summary() const;
    size_t metric_count() const;

private:
    size_t history_;
    const Clock* clock_;
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<MetricSample>> series_;
};

}  // namespace aegis

#endif  // AEGIS_METRICS_COLLECTOR_H
