#include "anomaly/intrusion_detector.h"
#include <spdlog/spdlog.h>

namespace aegis {

namespace {

std::string activity_key(const std::string& pattern, const std::string& subject) {
    return pattern + ":" + subject;
}

}  // namespace

std::vector<IntrusionPattern> default_intrusion_patterns() {
    return {
        {PATTERN_RAPID_RESOURCE_ALLOCATION, 10, 10000, Severity::High},
        {PATTERN_REPEATED_FAILURES, 5, 60000, Severity::Medium},
        {PATTERN_UNUSUAL_COMPUTATION, 3, 300000, Severity::Low},
    };
}

IntrusionDetector::IntrusionDetector(std::shared_ptr<AuditSink> sink, const Clock& clock,
                                     std::vector<IntrusionPattern> patterns, size_t max_subjects)
    : sink_(std::move(sink)),
      clock_(&clock),
      patterns_(std::move(patterns)),
      max_subjects_(max_subjects > 0 ? max_subjects : 1) {}

const IntrusionPattern* IntrusionDetector::find_pattern(const std::string& name) const {
    for (const auto& pattern : patterns_) {
        if (pattern.name == name) return &pattern;
    }
    return nullptr;
}

void IntrusionDetector::evict_stalest_locked() {
    auto stalest = activities_.end();
    for (auto it = activities_.begin(); it != activities_.end(); ++it) {
        if (stalest == activities_.end() || it->second.last_seen < stalest->second.last_seen) {
            stalest = it;
        }
    }
    if (stalest != activities_.end()) {
        activities_.erase(stalest);
    }
}

std::optional<IntrusionAlert> IntrusionDetector::record(const std::string& pattern, const std::string& subject) {
    const IntrusionPattern* match = find_pattern(pattern);
    if (!match) {
        spdlog::debug("Ignoring activity for unknown intrusion pattern {}", pattern);
        return std::nullopt;
    }

    int64_t now = clock_->now_ms();
    size_t count = 0;
    {
        std::lock_guard lock(mutex_);
        auto key = activity_key(pattern, subject);
        auto it = activities_.find(key);
        if (it == activities_.end()) {
            if (activities_.size() >= max_subjects_) {
                evict_stalest_locked();
            }
            it = activities_.emplace(key, Activity{}).first;
        }
        auto& activity = it->second;
        int64_t cutoff = now - match->window_ms;
        while (!activity.timestamps.empty() && activity.timestamps.front() <= cutoff) {
            activity.timestamps.pop_front();
        }
        activity.timestamps.push_back(now);
        activity.last_seen = now;
        count = activity.timestamps.size();
    }

    if (count < match->threshold) return std::nullopt;

    detections_.fetch_add(1);
    IntrusionAlert alert{match->name, subject, count, match->severity};
    spdlog::warn("Intrusion pattern {} on {}: {} activities in {}ms ({})", alert.pattern, alert.subject,
                 alert.activities, match->window_ms, to_string(alert.severity));
    try_append(sink_.get(), "intrusion_detected",
               {{"pattern", alert.pattern},
                {"subject", alert.subject},
                {"activities", std::to_string(alert.activities)},
                {"threshold", std::to_string(match->threshold)},
                {"window_ms", std::to_string(match->window_ms)},
                {"severity", to_string(alert.severity)}},
               &audit_failures_);
    return alert;
}

size_t IntrusionDetector::activity_count(const std::string& pattern, const std::string& subject) const {
    std::lock_guard lock(mutex_);
    auto it = activities_.find(activity_key(pattern, subject));
    return it != activities_.end() ? it->second.timestamps.size() : 0;
}

size_t IntrusionDetector::tracked_subjects() const {
    std::lock_guard lock(mutex_);
    return activities_.size();
}

}  // namespace aegis
