#pragma once
#ifndef AEGIS_CIRCUIT_BREAKER_H
#define AEGIS_CIRCUIT_BREAKER_H

#include <chrono>
#include <cstdint>

namespace aegis {

enum class CircuitState { Closed, Open, HalfOpen };

const char* to_string(CircuitState state);

struct CircuitPolicy {
    int failure_threshold = 5;
    std::chrono::milliseconds base_timeout{30000};
    std::chrono::milliseconds max_timeout{300000};
};

// Breaker for a single admission key. Not synchronized: the owning key's
// mutex serializes every call.
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitPolicy policy = {});

    CircuitState state() const { return state_; }
    int failure_count() const { return failures_; }
    int64_t tripped_at() const { return tripped_at_; }
    int64_t timeout_ms() const { return timeout_ms_; }

    // Moves OPEN to HALF_OPEN once the timeout has elapsed.
    CircuitState poll(int64_t now_ms);
    int64_t remaining_open_ms(int64_t now_ms) const;

    // Returns true when this failure tripped the breaker open.
    bool record_failure(int64_t now_ms);
    // Returns true when this success closed a half-open breaker.
    bool record_success();

    void reset();

private:
    CircuitPolicy policy_;
    CircuitState state_ = CircuitState::Closed;
    int failures_ = 0;
    int64_t tripped_at_ = 0;
    int64_t timeout_ms_ = 0;
};

}  // namespace aegis

#endif  // AEGIS_CIRCUIT_BREAKER_H
