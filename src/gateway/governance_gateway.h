#pragma once
#ifndef AEGIS_GOVERNANCE_GATEWAY_H
#define AEGIS_GOVERNANCE_GATEWAY_H

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include "admission/admission_controller.h"
#include "anomaly/anomaly_scorer.h"
#include "anomaly/intrusion_detector.h"
#include "audit/audit_sink.h"
#include "common/errors.h"
#include "config/config.h"
#include "scheduler/maintenance_scheduler.h"
#include "telemetry/metrics_collector.h"

namespace aegis {

// Admitted calls of this operation feed the rapid_resource_allocation pattern.
constexpr const char* RESOURCE_ALLOCATION_OPERATION = "resource_allocation";

struct GatewayHealth {
    size_t tracked_keys = 0;
    size_t open_circuits = 0;
    uint64_t threats_analyzed = 0;
    uint64_t incidents = 0;
    uint64_t intrusions = 0;
    uint64_t audit_failures = 0;
    uint64_t executed = 0;
    uint64_t failed = 0;
    uint64_t denied = 0;
    bool maintenance_running = false;
};

// Runs arbitrary work under admission control, circuit breaking and threat
// scoring, and forwards audit and metric events to the injected sink.
//
//   CLOSED --threshold failures--> OPEN --timeout--> HALF_OPEN --success--> CLOSED
//   HALF_OPEN --failure--> OPEN (timeout doubled, capped)
class GovernanceGateway {
public:
    GovernanceGateway(const Config& config, std::shared_ptr<AuditSink> sink,
                      std::shared_ptr<AdmissionStore> store = nullptr,
                      const Clock& clock = system_clock());
    ~GovernanceGateway();

    GovernanceGateway(const GovernanceGateway&) = delete;
    GovernanceGateway& operator=(const GovernanceGateway&) = delete;

    // Throws RateLimitExceeded or CircuitOpenError without running work, or
    // OperationFailed holding whatever work threw.
    template <typename Work>
    std::invoke_result_t<Work&> execute_governed(const std::string& operation, const std::string& identity,
                                                 Work&& work, const RequestContext& context = {});

    bool update_baseline(const std::string& operation, const BaselineUpdate& update);

    // Registers the admission sweep and metrics summary tasks and starts the
    // scheduler. Stopped again by stop_maintenance() or destruction.
    void start_maintenance();
    void stop_maintenance();

    GatewayHealth health() const;

    AdmissionController& admission() { return admission_; }
    AnomalyScorer& scorer() { return scorer_; }
    IntrusionDetector& intrusions() { return intrusions_; }
    MetricsCollector& metrics() { return metrics_; }
    MaintenanceScheduler& scheduler() { return scheduler_; }

private:
    // Returns the context to score with; rapid_succession is set when the
    // caller trips the rapid allocation pattern.
    RequestContext admit(const std::string& operation, const std::string& identity,
                         const RequestContext& context);
    // Runs fn; on any exception records the failure and throws OperationFailed.
    template <typename Fn>
    decltype(auto) guard_work(const std::string& operation, const std::string& identity,
                              const RequestContext& context, int64_t started, Fn&& fn);
    void on_success(const std::string& operation, const std::string& identity, int64_t duration_ms,
                    const RequestContext& context);
    void on_failure(const std::string& operation, const std::string& identity, int64_t duration_ms,
                    const RequestContext& context, const std::string& reason);
    void report_performance(const std::string& operation, int64_t duration_ms, bool success);
    void log_metrics_summary() const;

    Config config_;
    std::shared_ptr<AuditSink> sink_;
    const Clock* clock_;
    AdmissionController admission_;
    AnomalyScorer scorer_;
    IntrusionDetector intrusions_;
    MetricsCollector metrics_;
    MaintenanceScheduler scheduler_;

    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> denied_{0};
    std::atomic<uint64_t> audit_failures_{0};
};

template <typename Fn>
decltype(auto) GovernanceGateway::guard_work(const std::string& operation, const std::string& identity,
                                             const RequestContext& context, int64_t started, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        auto cause = std::current_exception();
        on_failure(operation, identity, clock_->monotonic_ms() - started, context, e.what());
        throw OperationFailed(operation, e.what(), cause);
    } catch (...) {
        auto cause = std::current_exception();
        on_failure(operation, identity, clock_->monotonic_ms() - started, context, "non-standard exception");
        throw OperationFailed(operation, "non-standard exception", cause);
    }
}

template <typename Work>
std::invoke_result_t<Work&> GovernanceGateway::execute_governed(const std::string& operation,
                                                                const std::string& identity, Work&& work,
                                                                const RequestContext& context) {
    using Result = std::invoke_result_t<Work&>;

    RequestContext scored = admit(operation, identity, context);

    int64_t started = clock_->monotonic_ms();
    if constexpr (std::is_void_v<Result>) {
        guard_work(operation, identity, scored, started, [&work]() { work(); });
        on_success(operation, identity, clock_->monotonic_ms() - started, scored);
    } else {
        Result result = guard_work(operation, identity, scored, started,
                                   [&work]() -> Result { return work(); });
        on_success(operation, identity, clock_->monotonic_ms() - started, scored);
        return result;
    }
}

}  // namespace aegis

#endif  // AEGIS_GOVERNANCE_GATEWAY_H
