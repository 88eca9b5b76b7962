#include "admission/circuit_breaker.h"
#include <algorithm>

namespace aegis {

const char* to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(CircuitPolicy policy) : policy_(policy) {
    if (policy_.failure_threshold <= 0) policy_.failure_threshold = 5;
    if (policy_.base_timeout.count() <= 0) policy_.base_timeout = std::chrono::milliseconds(30000);
    if (policy_.max_timeout < policy_.base_timeout) policy_.max_timeout = policy_.base_timeout;
}

CircuitState CircuitBreaker::poll(int64_t now_ms) {
    if (state_ == CircuitState::Open && now_ms - tripped_at_ >= timeout_ms_) {
        state_ = CircuitState::HalfOpen;
    }
    return state_;
}

int64_t CircuitBreaker::remaining_open_ms(int64_t now_ms) const {
    if (state_ != CircuitState::Open) return 0;
    return std::max<int64_t>(0, tripped_at_ + timeout_ms_ - now_ms);
}

bool CircuitBreaker::record_failure(int64_t now_ms) {
    failures_++;
    if (state_ == CircuitState::Open) return false;
    if (state_ == CircuitState::Closed && failures_ < policy_.failure_threshold) return false;
    // First trip uses the base timeout, every re-trip doubles up to the cap.
    int64_t base = policy_.base_timeout.count();
    int64_t cap = policy_.max_timeout.count();
    timeout_ms_ = timeout_ms_ == 0 ? base : std::min(timeout_ms_ * 2, cap);
    state_ = CircuitState::Open;
    tripped_at_ = now_ms;
    return true;
}

bool CircuitBreaker::record_success() {
    if (state_ == CircuitState::HalfOpen) {
        state_ = CircuitState::Closed;
        failures_ = 0;
        timeout_ms_ = 0;
        tripped_at_ = 0;
        return true;
    }
    if (failures_ > 0) failures_--;
    return false;
}

void CircuitBreaker::reset() {
    state_ = CircuitState::Closed;
    failures_ = 0;
    tripped_at_ = 0;
    timeout_ms_ = 0;
}

}  // namespace aegis
