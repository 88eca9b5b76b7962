#pragma once
#ifndef AEGIS_ANOMALY_SCORER_H
#define AEGIS_ANOMALY_SCORER_H

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "anomaly/threat_record.h"
#include "audit/audit_sink.h"
#include "common/clock.h"
#include "config/config.h"

namespace aegis {

constexpr double ANOMALY_NOISE_CEILING = 0.3;
constexpr double SLOW_OPERATION_MS = 1000.0;
constexpr double HIGH_ERROR_RATE = 0.1;
constexpr double HIGH_FREQUENCY = 1000.0;
constexpr double NO_BASELINE_SCORE = 0.1;

// Composite threat scoring. The strongest of three independent signals wins:
// a keyed pseudo-random baseline with hard thresholds, deviation from the
// operation's behavioral baseline, and request-context heuristics.
class AnomalyScorer {
public:
    AnomalyScorer(const Config& config, std::shared_ptr<AuditSink> sink,
                  const Clock& clock = system_clock());

    // Scores one completed operation, appends the record to the audit trail
    // and runs incident response when composite exceeds the incident threshold.
    ThreatRecord analyze(const std::string& operation, const OperationMetrics& metrics,
                         const RequestContext& context = {});

    double anomaly_score(const std::string& operation, const OperationMetrics& metrics, int64_t now_ms) const;
    double behavioral_score(const std::string& operation, const OperationMetrics& metrics,
                            const RequestContext& context) const;
    double contextual_score(const RequestContext& context, int64_t now_ms) const;

    // Administrative. Returns false, leaving the baseline untouched, when the
    // update is empty or carries a negative, non-finite or >1 error rate value.
    bool update_baseline(const std::string& operation, const BaselineUpdate& update);
    std::optional<BehavioralBaseline> baseline(const std::string& operation) const;

    uint64_t incident_count() const { return incidents_.load(); }
    uint64_t threats_analyzed() const { return analyzed_.load(); }
    uint64_t audit_failures() const { return audit_failures_.load(); }

private:
    std::string next_threat_id(int64_t now_ms) const;
    void respond(const ThreatRecord& record);
    void execute_action(ResponseAction action, const ThreatRecord& record, size_t step);

    double incident_threshold_;
    std::string key_;
    std::shared_ptr<AuditSink> sink_;
    const Clock* clock_;

    mutable std::shared_mutex baselines_mutex_;
    std::unordered_map<std::string, BehavioralBaseline> baselines_;

    std::atomic<uint64_t> incidents_{0};
    std::atomic<uint64_t> analyzed_{0};
    std::atomic<uint64_t> audit_failures_{0};
};

}  // namespace aegis

#endif  // AEGIS_ANOMALY_SCORER_H
