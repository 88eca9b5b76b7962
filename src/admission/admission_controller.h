#pragma once
#ifndef AEGIS_ADMISSION_CONTROLLER_H
#define AEGIS_ADMISSION_CONTROLLER_H

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "admission/admission_store.h"
#include "common/clock.h"
#include "config/config.h"

namespace aegis {

enum class DenialReason { None, RateLimited, CircuitOpen };

struct AdmissionDecision {
    bool allowed = false;
    int remaining = 0;
    int retry_after = 0;  // seconds, advisory
    int limit = 0;
    CircuitState circuit_state = CircuitState::Closed;
    DenialReason reason = DenialReason::None;
};

// Details of a breaker trip, reported after the key lock is released.
struct CircuitTrip {
    AdmissionKey key;
    int failure_count = 0;
    int64_t timeout_ms = 0;
};

// Sliding-window admission per (operation, identity) with an adaptive
// per-operation limit and a per-key circuit breaker.
class AdmissionController {
public:
    AdmissionController(const Config& config, std::shared_ptr<AdmissionStore> store,
                        const Clock& clock = system_clock());

    // Throws ValidationError(InvalidArgument) when cost < 1.
    AdmissionDecision check_limit(const std::string& operation, const std::string& identity, int cost = 1);

    void record_failure(const std::string& operation, const std::string& identity);
    void record_success(const std::string& operation, const std::string& identity);

    CircuitState circuit_state(const std::string& operation, const std::string& identity) const;
    int failure_count(const std::string& operation, const std::string& identity) const;
    size_t window_size(const std::string& operation, const std::string& identity) const;

    // Current budget for operation; unknown operations report the fixed default.
    double current_limit(const std::string& operation) const;
    bool is_configured(const std::string& operation) const;

    // Trims every window, then forgets keys that are closed, empty and have
    // no failures on record. Returns the number of timestamps evicted.
    size_t sweep();

    size_t tracked_keys() const { return store_->size(); }
    size_t open_circuits() const;

    void set_trip_listener(std::function<void(const CircuitTrip&)> listener);

    const std::shared_ptr<AdmissionStore>& store() const { return store_; }

private:
    AdmissionKey make_key(const std::string& operation, const std::string& identity) const;
    AdaptiveLimit make_limit(const std::string& operation) const;
    size_t trim(std::deque<int64_t>& window, int64_t now) const;
    // Returns a trip to report when the failure opened the breaker.
    bool fail_locked(KeyState& state, int64_t now, CircuitTrip& trip, const AdmissionKey& key);
    void notify_trip(const CircuitTrip& trip);

    Config config_;
    std::shared_ptr<AdmissionStore> store_;
    const Clock* clock_;
    CircuitPolicy policy_;
    int64_t window_ms_;

    std::mutex listener_mutex_;
    std::function<void(const CircuitTrip&)> trip_listener_;
};

}  // namespace aegis

#endif  // AEGIS_ADMISSION_CONTROLLER_H
