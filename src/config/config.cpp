#include "config/config.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace aegis {

namespace {

template <typename T, typename Parse>
void read_env(const char* name, T& target, Parse parse) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    try {
        size_t consumed = 0;
        std::string value(raw);
        auto parsed = parse(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        target = static_cast<T>(parsed);
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}='{}': {}", name, raw, e.what());
    }
}

long long parse_int(const std::string& s, size_t* pos) { return std::stoll(s, pos); }
double parse_double(const std::string& s, size_t* pos) { return std::stod(s, pos); }

void read_seconds(const char* name, std::chrono::seconds& target) {
    long long secs = target.count();
    read_env(name, secs, parse_int);
    if (secs <= 0) {
        spdlog::warn("Ignoring {}: must be positive", name);
        return;
    }
    target = std::chrono::seconds(secs);
}

}  // namespace

std::map<std::string, OperationLimit> parse_operation_limits(const std::string& text) {
    std::map<std::string, OperationLimit> limits;
    std::stringstream entries(text);
    std::string entry;
    while (std::getline(entries, entry, ',')) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            spdlog::warn("Skipping operation limit '{}': expected op=base:burst:rate", entry);
            continue;
        }
        std::string name = entry.substr(0, eq);
        std::stringstream fields(entry.substr(eq + 1));
        std::string base, burst, rate;
        std::getline(fields, base, ':');
        std::getline(fields, burst, ':');
        std::getline(fields, rate, ':');
        try {
            OperationLimit limit;
            limit.base = std::stod(base);
            limit.burst = burst.empty() ? 0.0 : std::stod(burst);
            limit.recovery_rate = rate.empty() ? limit.recovery_rate : std::stod(rate);
            if (limit.base <= 0.0 || limit.burst < 0.0 || limit.recovery_rate < 0.0) {
                throw std::invalid_argument("negative or zero budget");
            }
            limits[name] = limit;
        } catch (const std::exception& e) {
            spdlog::warn("Skipping operation limit '{}': {}", entry, e.what());
        }
    }
    return limits;
}

Config Config::from_env() {
    Config cfg;

    if (const char* level = std::getenv("AEGIS_LOG_LEVEL")) {
        cfg.log_level = level;
    }

    read_seconds("AEGIS_WINDOW_SECONDS", cfg.window);

    double default_base = cfg.default_limit.base;
    read_env("AEGIS_DEFAULT_LIMIT", default_base, parse_double);
    if (default_base > 0.0) {
        cfg.default_limit.base = default_base;
    }

    if (const char* limits = std::getenv("AEGIS_OPERATION_LIMITS")) {
        for (const auto& [name, limit] : parse_operation_limits(limits)) {
            cfg.operation_limits[name] = limit;
        }
    }

    int threshold = cfg.failure_threshold;
    read_env("AEGIS_FAILURE_THRESHOLD", threshold, parse_int);
    if (threshold > 0) {
        cfg.failure_threshold = threshold;
    }

    read_seconds("AEGIS_CIRCUIT_TIMEOUT", cfg.circuit_base_timeout);
    read_seconds("AEGIS_CIRCUIT_MAX_TIMEOUT", cfg.circuit_max_timeout);
    if (cfg.circuit_max_timeout < cfg.circuit_base_timeout) {
        cfg.circuit_max_timeout = cfg.circuit_base_timeout;
    }

    double incident = cfg.incident_threshold;
    read_env("AEGIS_INCIDENT_THRESHOLD", incident, parse_double);
    if (incident >= 0.0 && incident <= 1.0) {
        cfg.incident_threshold = incident;
    }

    if (const char* key = std::getenv("AEGIS_FINGERPRINT_KEY")) {
        cfg.fingerprint_key = key;
    }

    read_seconds("AEGIS_MAINTENANCE_INTERVAL", cfg.maintenance_interval);

    long long history = static_cast<long long>(cfg.metrics_history);
    read_env("AEGIS_METRICS_HISTORY", history, parse_int);
    if (history > 0) {
        cfg.metrics_history = static_cast<size_t>(history);
    }

    return cfg;
}

Config& get_config() {
    static Config cfg = Config::from_env();
    return cfg;
}

}  // namespace aegis
