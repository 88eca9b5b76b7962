#pragma once
#ifndef AEGIS_CONFIG_H
#define AEGIS_CONFIG_H

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace aegis {

// Throughput budget of one operation type over the sliding window.
struct OperationLimit {
    double base = 1000.0;
    double burst = 0.0;
    double recovery_rate = 0.1;
};

struct Config {
    std::string log_level = "info";
    std::chrono::seconds window{60};

    // Applied to operations missing from operation_limits. Never adapted.
    OperationLimit default_limit{1000.0, 0.0, 0.0};
    std::map<std::string, OperationLimit> operation_limits = {
        {"computation_execution", {100.0, 50.0, 0.1}},
        {"resource_allocation", {50.0, 25.0, 0.1}},
        {"ai_decision", {200.0, 100.0, 0.1}},
    };

    int failure_threshold = 5;
    std::chrono::seconds circuit_base_timeout{30};
    std::chrono::seconds circuit_max_timeout{300};

    double incident_threshold = 0.7;
    std::string fingerprint_key;  // empty = random per process

    std::chrono::seconds maintenance_interval{30};
    size_t metrics_history = 1000;

    // Malformed values are logged and left at their defaults.
    static Config from_env();
};

// Parses "op=base:burst:rate,op2=base:burst:rate". Bad entries are skipped.
std::map<std::string, OperationLimit> parse_operation_limits(const std::string& text);

Config& get_config();

}  // namespace aegis

#endif  // AEGIS_CONFIG_H
