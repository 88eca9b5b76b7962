#pragma once
#ifndef AEGIS_THREAT_RECORD_H
#define AEGIS_THREAT_RECORD_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aegis {

enum class Severity { Info, Low, Medium, High, Critical };

const char* to_string(Severity severity);

// Fixed cut-offs: >=0.9 CRITICAL, >=0.7 HIGH, >=0.5 MEDIUM, >=0.3 LOW.
Severity classify_severity(double composite);

enum class ResponseAction {
    Isolate,
    Alert,
    FullAudit,
    RateLimit,
    EnhancedMonitor,
    Review,
    Log,
    BaselineUpdate,
};

const char* to_string(ResponseAction action);

// Actions run for an incident of the given severity. Empty below MEDIUM.
std::vector<ResponseAction> response_plan(Severity severity);

struct OperationMetrics {
    double duration_ms = 0.0;
    double error_rate = 0.0;
};

// Caller-supplied request context. hour overrides the clock's UTC hour.
struct RequestContext {
    double frequency = 0.0;
    bool suspicious_ip = false;
    bool unusual_location = false;
    bool rapid_succession = false;
    std::optional<int> hour;
    std::map<std::string, std::string> attributes;
};

struct ThreatScores {
    double anomaly = 0.0;
    double behavioral = 0.0;
    double contextual = 0.0;
    double composite = 0.0;
};

struct ThreatRecord {
    std::string id;
    std::string operation;
    ThreatScores scores;
    Severity severity = Severity::Info;
    std::vector<ResponseAction> actions;
    std::string proof;
    int64_t timestamp = 0;
};

struct BehavioralBaseline {
    double avg_duration_ms = 100.0;
    double max_duration_ms = 1000.0;
    double error_rate = 0.01;
};

// Partial update; absent fields keep their current value.
struct BaselineUpdate {
    std::optional<double> avg_duration_ms;
    std::optional<double> max_duration_ms;
    std::optional<double> error_rate;
};

}  // namespace aegis

#endif  // AEGIS_THREAT_RECORD_H
