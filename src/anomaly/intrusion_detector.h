#pragma once
#ifndef AEGIS_INTRUSION_DETECTOR_H
#define AEGIS_INTRUSION_DETECTOR_H

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "anomaly/threat_record.h"
#include "audit/audit_sink.h"
#include "common/clock.h"

namespace aegis {

constexpr const char* PATTERN_RAPID_RESOURCE_ALLOCATION = "rapid_resource_allocation";
constexpr const char* PATTERN_REPEATED_FAILURES = "repeated_failures";
constexpr const char* PATTERN_UNUSUAL_COMPUTATION = "unusual_computation_patterns";

constexpr size_t DEFAULT_MAX_TRACKED_SUBJECTS = 1000;

// Fires once `threshold` activities fall inside `window_ms`.
struct IntrusionPattern {
    std::string name;
    size_t threshold = 0;
    int64_t window_ms = 0;
    Severity severity = Severity::Low;
};

// rapid_resource_allocation 10/10s HIGH, repeated_failures 5/60s MEDIUM,
// unusual_computation_patterns 3/300s LOW.
std::vector<IntrusionPattern> default_intrusion_patterns();

struct IntrusionAlert {
    std::string pattern;
    std::string subject;
    size_t activities = 0;
    Severity severity = Severity::Low;
};

// Sliding-window counters of suspicious activity per (pattern, subject).
// Every activity at or above a pattern's threshold emits an
// `intrusion_detected` audit event. At most max_subjects counters are kept;
// the least recently active one is dropped to make room.
class IntrusionDetector {
public:
    IntrusionDetector(std::shared_ptr<AuditSink> sink, const Clock& clock = system_clock(),
                      std::vector<IntrusionPattern> patterns = default_intrusion_patterns(),
                      size_t max_subjects = DEFAULT_MAX_TRACKED_SUBJECTS);

    // Unknown pattern names are ignored.
    std::optional<IntrusionAlert> record(const std::string& pattern, const std::string& subject);

    size_t activity_count(const std::string& pattern, const std::string& subject) const;
    size_t tracked_subjects() const;
    const std::vector<IntrusionPattern>& patterns() const { return patterns_; }

    uint64_t detections() const { return detections_.load(); }
    uint64_t audit_failures() const { return audit_failures_.load(); }

private:
    struct Activity {
        std::deque<int64_t> timestamps;
        int64_t last_seen = 0;
    };

    const IntrusionPattern* find_pattern(const std::string& name) const;
    void evict_stalest_locked();

    std::shared_ptr<AuditSink> sink_;
    const Clock* clock_;
    std::vector<IntrusionPattern> patterns_;
    size_t max_subjects_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Activity> activities_;

    std::atomic<uint64_t> detections_{0};
    std::atomic<uint64_t> audit_failures_{0};
};

}  // namespace aegis

#endif  // AEGIS_INTRUSION_DETECTOR_H
