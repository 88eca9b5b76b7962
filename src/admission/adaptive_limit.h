#pragma once
#ifndef AEGIS_ADAPTIVE_LIMIT_H
#define AEGIS_ADAPTIVE_LIMIT_H

#include <cstdint>
#include "config/config.h"

namespace aegis {

constexpr double HIGH_USAGE_RATIO = 0.8;
constexpr double LOW_USAGE_RATIO = 0.3;
constexpr double SHRINK_FACTOR = 0.95;
constexpr double FLOOR_FRACTION = 0.5;
constexpr int64_t ADAPT_INTERVAL_MS = 1000;

// Per-operation throughput budget that tightens under sustained pressure and
// recovers when traffic is light. current stays in [0.5*base, base+burst].
class AdaptiveLimit {
public:
    AdaptiveLimit(const OperationLimit& limit, int64_t now_ms, bool adaptive = true);

    double base() const { return base_; }
    double burst() const { return burst_; }
    double recovery_rate() const { return recovery_rate_; }
    double current() const { return current_; }
    int64_t last_update() const { return last_update_; }
    bool adaptive() const { return adaptive_; }

    double floor() const { return base_ * FLOOR_FRACTION; }
    double ceiling() const { return base_ + burst_; }

    // Evaluated at most once per ADAPT_INTERVAL_MS. Returns true if current moved.
    bool update(double usage_ratio, int64_t now_ms);

private:
    double base_;
    double burst_;
    double recovery_rate_;
    double current_;
    int64_t last_update_;
    bool adaptive_;
};

}  // namespace aegis

#endif  // AEGIS_ADAPTIVE_LIMIT_H
