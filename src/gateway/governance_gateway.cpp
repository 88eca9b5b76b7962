#include "gateway/governance_gateway.h"
#include "integrity/fingerprint.h"
#include <spdlog/spdlog.h>

namespace aegis {

GovernanceGateway::GovernanceGateway(const Config& config, std::shared_ptr<AuditSink> sink,
                                     std::shared_ptr<AdmissionStore> store, const Clock& clock)
    : config_(config),
      sink_(std::move(sink)),
      clock_(&clock),
      admission_(config, std::move(store), clock),
      scorer_(config, sink_, clock),
      intrusions_(sink_, clock),
      metrics_(config.metrics_history, clock) {
    admission_.set_trip_listener([this](const CircuitTrip& trip) {
        try_append(sink_.get(), "circuit_opened",
                   {{"operation", trip.key.operation},
                    {"identity", trip.key.identity},
                    {"failures", std::to_string(trip.failure_count)},
                    {"timeout_ms", std::to_string(trip.timeout_ms)}},
                   &audit_failures_);
    });
}

GovernanceGateway::~GovernanceGateway() {
    stop_maintenance();
    admission_.set_trip_listener(nullptr);
}

RequestContext GovernanceGateway::admit(const std::string& operation, const std::string& identity,
                                        const RequestContext& context) {
    auto decision = admission_.check_limit(operation, identity);
    if (decision.allowed) {
        RequestContext scored = context;
        if (operation == RESOURCE_ALLOCATION_OPERATION &&
            intrusions_.record(PATTERN_RAPID_RESOURCE_ALLOCATION, operation + ":" + identity)) {
            scored.rapid_succession = true;
        }
        return scored;
    }

    denied_.fetch_add(1);
    metrics_.record("admission_denied", 1.0, {{"operation", operation}});
    bool circuit = decision.reason == DenialReason::CircuitOpen;
    try_append(sink_.get(), "admission_denied",
               {{"operation", operation},
                {"identity", identity},
                {"reason", circuit ? "circuit_open" : "rate_limited"},
                {"retry_after", std::to_string(decision.retry_after)},
                {"circuit_state", to_string(decision.circuit_state)}},
               &audit_failures_);

    if (circuit) {
        throw CircuitOpenError(operation, identity, decision.retry_after);
    }
    throw RateLimitExceeded(operation, identity, decision.retry_after);
}

void GovernanceGateway::on_success(const std::string& operation, const std::string& identity,
                                   int64_t duration_ms, const RequestContext& context) {
    executed_.fetch_add(1);
    admission_.record_success(operation, identity);
    auto record = scorer_.analyze(operation, OperationMetrics{static_cast<double>(duration_ms), 0.0}, context);
    if (record.severity >= Severity::Low) {
        intrusions_.record(PATTERN_UNUSUAL_COMPUTATION, operation + ":" + identity);
    }
    metrics_.record("operation_success", 1.0, {{"operation", operation}});
    report_performance(operation, duration_ms, true);
}

void GovernanceGateway::on_failure(const std::string& operation, const std::string& identity,
                                   int64_t duration_ms, const RequestContext& context,
                                   const std::string& reason) {
    failed_.fetch_add(1);
    spdlog::warn("Governed operation {} for {} failed after {}ms: {}", operation, identity, duration_ms,
                 reason);
    admission_.record_failure(operation, identity);
    intrusions_.record(PATTERN_REPEATED_FAILURES, operation + ":" + identity);
    scorer_.analyze(operation, OperationMetrics{static_cast<double>(duration_ms), 1.0}, context);
    metrics_.record("operation_failure", 1.0, {{"operation", operation}});
    report_performance(operation, duration_ms, false);
}

void GovernanceGateway::report_performance(const std::string& operation, int64_t duration_ms, bool success) {
    metrics_.record("operation_duration_ms", static_cast<double>(duration_ms),
                    {{"operation", operation}, {"success", success ? "true" : "false"}});
    try_append(sink_.get(), "performance_metric",
               {{"operation", operation},
                {"duration", std::to_string(duration_ms)},
                {"success", success ? "true" : "false"}},
               &audit_failures_);
}

bool GovernanceGateway::update_baseline(const std::string& operation, const BaselineUpdate& update) {
    bool updated = scorer_.update_baseline(operation, update);
    if (updated) {
        auto base = scorer_.baseline(operation);
        try_append(sink_.get(), "baseline_updated",
                   {{"operation", operation},
                    {"avg_duration_ms", canonical_double(base->avg_duration_ms)},
                    {"max_duration_ms", canonical_double(base->max_duration_ms)},
                    {"error_rate", canonical_double(base->error_rate)}},
                   &audit_failures_);
    }
    return updated;
}

void GovernanceGateway::start_maintenance() {
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.maintenance_interval);
    scheduler_.schedule("admission.sweep", interval, [this]() { admission_.sweep(); });
    scheduler_.schedule("metrics.summary", interval, [this]() { log_metrics_summary(); });
    scheduler_.start();
}

void GovernanceGateway::stop_maintenance() {
    scheduler_.stop();
}

void GovernanceGateway::log_metrics_summary() const {
    for (const auto& [name, s] : metrics_.summary()) {
        spdlog::info("metric {}: count={} min={:.1f} max={:.1f} avg={:.2f} last={:.1f}", name, s.count, s.min,
                     s.max, s.avg, s.last);
    }
}

GatewayHealth GovernanceGateway::health() const {
    GatewayHealth h;
    h.tracked_keys = admission_.tracked_keys();
    h.open_circuits = admission_.open_circuits();
    h.threats_analyzed = scorer_.threats_analyzed();
    h.incidents = scorer_.incident_count();
    h.intrusions = intrusions_.detections();
    h.audit_failures = audit_failures_.load() + scorer_.audit_failures() + intrusions_.audit_failures();
    h.executed = executed_.load();
    h.failed = failed_.load();
    h.denied = denied_.load();
    h.maintenance_running = scheduler_.is_running();
    return h;
}

}  // namespace aegis
