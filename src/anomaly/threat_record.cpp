#include "anomaly/threat_record.h"

namespace aegis {

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::Info: return "INFO";
        case Severity::Low: return "LOW";
        case Severity::Medium: return "MEDIUM";
        case Severity::High: return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

Severity classify_severity(double composite) {
    if (composite >= 0.9) return Severity::Critical;
    if (composite >= 0.7) return Severity::High;
    if (composite >= 0.5) return Severity::Medium;
    if (composite >= 0.3) return Severity::Low;
    return Severity::Info;
}

const char* to_string(ResponseAction action) {
    switch (action) {
        case ResponseAction::Isolate: return "isolate";
        case ResponseAction::Alert: return "alert";
        case ResponseAction::FullAudit: return "full_audit";
        case ResponseAction::RateLimit: return "rate_limit";
        case ResponseAction::EnhancedMonitor: return "enhanced_monitor";
        case ResponseAction::Review: return "review";
        case ResponseAction::Log: return "log";
        case ResponseAction::BaselineUpdate: return "baseline_update";
    }
    return "unknown";
}

std::vector<ResponseAction> response_plan(Severity severity) {
    switch (severity) {
        case Severity::Critical:
            return {ResponseAction::Isolate, ResponseAction::Alert, ResponseAction::FullAudit};
        case Severity::High:
            return {ResponseAction::RateLimit, ResponseAction::EnhancedMonitor, ResponseAction::Review};
        case Severity::Medium:
            return {ResponseAction::Log, ResponseAction::BaselineUpdate};
        default:
            return {};
    }
}

}  // namespace aegis
