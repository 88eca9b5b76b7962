#pragma once
#ifndef AEGIS_CLOCK_H
#define AEGIS_CLOCK_H

#include <atomic>
#include <chrono>
#include <cstdint>

namespace aegis {

// Time source shared by admission, scoring and state fingerprints.
// now_ms() is wall-clock epoch milliseconds, monotonic_ms() is only
// meaningful as a difference and is used to time units of work.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_ms() const = 0;
    virtual int64_t monotonic_ms() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override;
    int64_t monotonic_ms() const override;
};

// Clock that only moves when told to. Both readings share one counter.
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}

    int64_t now_ms() const override { return now_.load(); }
    int64_t monotonic_ms() const override { return now_.load(); }

    void set(int64_t ms) { now_.store(ms); }
    void advance(std::chrono::milliseconds delta) { now_.fetch_add(delta.count()); }

private:
    std::atomic<int64_t> now_;
};

// Process-wide system clock used when no clock is injected.
const Clock& system_clock();

// UTC hour of day [0,23] for an epoch-millisecond timestamp.
int utc_hour(int64_t epoch_ms);

}  // namespace aegis

#endif  // AEGIS_CLOCK_H
