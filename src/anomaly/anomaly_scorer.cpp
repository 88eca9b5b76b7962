#include "anomaly/anomaly_scorer.h"
#include "integrity/fingerprint.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <mutex>

namespace aegis {

namespace {

double clamp_unit(double score) {
    return std::clamp(score, 0.0, 1.0);
}

bool valid_measure(const std::optional<double>& value) {
    return !value || (std::isfinite(*value) && *value >= 0.0);
}

}  // namespace

AnomalyScorer::AnomalyScorer(const Config& config, std::shared_ptr<AuditSink> sink, const Clock& clock)
    : incident_threshold_(config.incident_threshold),
      key_(config.fingerprint_key.empty() ? secure_random_hex(32) : config.fingerprint_key),
      sink_(std::move(sink)),
      clock_(&clock) {}

double AnomalyScorer::anomaly_score(const std::string& operation, const OperationMetrics& metrics,
                                    int64_t now_ms) const {
    std::string payload = operation + "|" + canonical_double(metrics.duration_ms) + "|" +
                          canonical_double(metrics.error_rate) + "|" + std::to_string(now_ms);
    double score = keyed_unit_interval(key_, payload) * ANOMALY_NOISE_CEILING;
    if (metrics.duration_ms > SLOW_OPERATION_MS) score += 0.4;
    if (metrics.error_rate > HIGH_ERROR_RATE) score += 0.3;
    return clamp_unit(score);
}

double AnomalyScorer::behavioral_score(const std::string& operation, const OperationMetrics& metrics,
                                       const RequestContext& context) const {
    BehavioralBaseline base;
    {
        std::shared_lock lock(baselines_mutex_);
        auto it = baselines_.find(operation);
        if (it == baselines_.end()) return NO_BASELINE_SCORE;
        base = it->second;
    }

    double score = 0.0;
    if (metrics.duration_ms > 2.0 * base.max_duration_ms) {
        score += 0.4;
    } else if (metrics.duration_ms > base.max_duration_ms) {
        score += 0.2;
    }
    if (metrics.error_rate > 5.0 * base.error_rate) {
        score += 0.4;
    } else if (metrics.error_rate > 2.0 * base.error_rate) {
        score += 0.2;
    }
    if (context.frequency > HIGH_FREQUENCY) score += 0.2;
    return clamp_unit(score);
}

double AnomalyScorer::contextual_score(const RequestContext& context, int64_t now_ms) const {
    double score = 0.0;
    if (context.suspicious_ip) score += 0.3;
    int hour = context.hour ? *context.hour : utc_hour(now_ms);
    if (hour < 6 || hour > 22) score += 0.2;
    if (context.unusual_location) score += 0.3;
    if (context.rapid_succession) score += 0.2;
    return clamp_unit(score);
}

std::string AnomalyScorer::next_threat_id(int64_t now_ms) const {
    return "sec_" + std::to_string(now_ms) + "_" + secure_random_hex(8);
}

ThreatRecord AnomalyScorer::analyze(const std::string& operation, const OperationMetrics& metrics,
                                    const RequestContext& context) {
    int64_t now = clock_->now_ms();

    ThreatRecord record;
    record.id = next_threat_id(now);
    record.operation = operation;
    record.timestamp = now;
    record.scores.anomaly = anomaly_score(operation, metrics, now);
    record.scores.behavioral = behavioral_score(operation, metrics, context);
    record.scores.contextual = contextual_score(context, now);
    record.scores.composite = std::max({record.scores.anomaly, record.scores.behavioral,
                                        record.scores.contextual});
    record.severity = classify_severity(record.scores.composite);

    bool incident = record.scores.composite > incident_threshold_;
    if (incident) {
        record.actions = response_plan(record.severity);
    }
    record.proof = sha256_hex(record.id + "|" + canonical_double(metrics.duration_ms) + "|" +
                              canonical_double(metrics.error_rate) + "|" +
                              canonical_double(record.scores.composite) + "|" + std::to_string(now));

    analyzed_.fetch_add(1);
    try_append(sink_.get(), "threat_analysis",
               {{"threat_id", record.id},
                {"operation", operation},
                {"composite", canonical_double(record.scores.composite)},
                {"severity", to_string(record.severity)},
                {"proof", record.proof}},
               &audit_failures_);

    if (incident) {
        respond(record);
    }
    return record;
}

void AnomalyScorer::respond(const ThreatRecord& record) {
    uint64_t incident_number = incidents_.fetch_add(1) + 1;
    spdlog::warn("Security incident #{} on {}: composite {:.3f} ({})", incident_number, record.operation,
                 record.scores.composite, to_string(record.severity));
    try_append(sink_.get(), "security_incident",
               {{"threat_id", record.id},
                {"operation", record.operation},
                {"severity", to_string(record.severity)},
                {"incident", std::to_string(incident_number)}},
               &audit_failures_);

    for (size_t i = 0; i < record.actions.size(); ++i) {
        execute_action(record.actions[i], record, i + 1);
    }
}

void AnomalyScorer::execute_action(ResponseAction action, const ThreatRecord& record, size_t step) {
    switch (action) {
        case ResponseAction::Isolate:
        case ResponseAction::Alert:
            spdlog::error("Incident response {} for {} (threat {})", to_string(action), record.operation,
                          record.id);
            break;
        case ResponseAction::FullAudit:
        case ResponseAction::RateLimit:
        case ResponseAction::EnhancedMonitor:
        case ResponseAction::Review:
            spdlog::warn("Incident response {} for {} (threat {})", to_string(action), record.operation,
                         record.id);
            break;
        case ResponseAction::Log:
        case ResponseAction::BaselineUpdate:
            spdlog::info("Incident response {} for {} (threat {})", to_string(action), record.operation,
                         record.id);
            break;
    }
    try_append(sink_.get(), "response_action",
               {{"threat_id", record.id},
                {"operation", record.operation},
                {"action", to_string(action)},
                {"step", std::to_string(step)},
                {"severity", to_string(record.severity)}},
               &audit_failures_);
}

bool AnomalyScorer::update_baseline(const std::string& operation, const BaselineUpdate& update) {
    if (!update.avg_duration_ms && !update.max_duration_ms && !update.error_rate) return false;
    if (!valid_measure(update.avg_duration_ms) || !valid_measure(update.max_duration_ms) ||
        !valid_measure(update.error_rate)) {
        return false;
    }
    if (update.error_rate && *update.error_rate > 1.0) return false;

    std::unique_lock lock(baselines_mutex_);
    auto& base = baselines_[operation];
    if (update.avg_duration_ms) base.avg_duration_ms = *update.avg_duration_ms;
    if (update.max_duration_ms) base.max_duration_ms = *update.max_duration_ms;
    if (update.error_rate) base.error_rate = *update.error_rate;
    spdlog::info("Baseline for {} set to avg {:.1f}ms max {:.1f}ms error rate {:.4f}", operation,
                 base.avg_duration_ms, base.max_duration_ms, base.error_rate);
    return true;
}

std::optional<BehavioralBaseline> AnomalyScorer::baseline(const std::string& operation) const {
    std::shared_lock lock(baselines_mutex_);
    auto it = baselines_.find(operation);
    if (it == baselines_.end()) return std::nullopt;
    return it->second;
}

}  // namespace aegis
