#include "admission/adaptive_limit.h"
#include <algorithm>

namespace aegis {

AdaptiveLimit::AdaptiveLimit(const OperationLimit& limit, int64_t now_ms, bool adaptive)
    : base_(limit.base),
      burst_(std::max(0.0, limit.burst)),
      recovery_rate_(std::max(0.0, limit.recovery_rate)),
      current_(limit.base),
      last_update_(now_ms),
      adaptive_(adaptive) {}

bool AdaptiveLimit::update(double usage_ratio, int64_t now_ms) {
    if (!adaptive_) return false;

    int64_t elapsed_ms = now_ms - last_update_;
    if (elapsed_ms < ADAPT_INTERVAL_MS) return false;
    last_update_ = now_ms;

    double previous = current_;
    if (usage_ratio > HIGH_USAGE_RATIO) {
        current_ = std::max(floor(), current_ * SHRINK_FACTOR);
    } else if (usage_ratio < LOW_USAGE_RATIO) {
        double elapsed_seconds = static_cast<double>(elapsed_ms) / 1000.0;
        current_ = std::min(ceiling(), current_ + base_ * recovery_rate_ * elapsed_seconds);
    }
    return current_ != previous;
}

}  // namespace aegis
