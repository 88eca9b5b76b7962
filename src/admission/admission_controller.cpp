#include "admission/admission_controller.h"
#include "common/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace aegis {

namespace {

int ceil_seconds(int64_t ms) {
    if (ms <= 0) return 0;
    return static_cast<int>((ms + 999) / 1000);
}

}  // namespace

AdmissionController::AdmissionController(const Config& config, std::shared_ptr<AdmissionStore> store,
                                         const Clock& clock)
    : config_(config),
      store_(store ? std::move(store) : std::make_shared<AdmissionStore>()),
      clock_(&clock),
      window_ms_(std::chrono::duration_cast<std::chrono::milliseconds>(config.window).count()) {
    policy_.failure_threshold = config.failure_threshold;
    policy_.base_timeout = config.circuit_base_timeout;
    policy_.max_timeout = config.circuit_max_timeout;
}

AdmissionKey AdmissionController::make_key(const std::string& operation, const std::string& identity) const {
    return AdmissionKey{operation, identity};
}

AdaptiveLimit AdmissionController::make_limit(const std::string& operation) const {
    auto it = config_.operation_limits.find(operation);
    if (it == config_.operation_limits.end()) {
        return AdaptiveLimit(config_.default_limit, clock_->now_ms(), false);
    }
    return AdaptiveLimit(it->second, clock_->now_ms(), true);
}

size_t AdmissionController::trim(std::deque<int64_t>& window, int64_t now) const {
    size_t evicted = 0;
    int64_t cutoff = now - window_ms_;
    while (!window.empty() && window.front() <= cutoff) {
        window.pop_front();
        evicted++;
    }
    return evicted;
}

bool AdmissionController::fail_locked(KeyState& state, int64_t now, CircuitTrip& trip,
                                      const AdmissionKey& key) {
    if (!state.circuit.record_failure(now)) return false;
    trip = CircuitTrip{key, state.circuit.failure_count(), state.circuit.timeout_ms()};
    return true;
}

void AdmissionController::notify_trip(const CircuitTrip& trip) {
    spdlog::warn("Circuit opened for {}:{} after {} failures, timeout {}ms",
                 trip.key.operation, trip.key.identity, trip.failure_count, trip.timeout_ms);
    std::function<void(const CircuitTrip&)> listener;
    {
        std::lock_guard lock(listener_mutex_);
        listener = trip_listener_;
    }
    if (listener) listener(trip);
}

AdmissionDecision AdmissionController::check_limit(const std::string& operation, const std::string& identity,
                                                   int cost) {
    if (cost < 1) {
        throw ValidationError(ValidationReason::InvalidArgument,
                              "admission cost must be at least 1, got " + std::to_string(cost));
    }

    auto key = make_key(operation, identity);
    auto state = store_->acquire(key, policy_);
    auto limit_factory = [this, &operation]() { return make_limit(operation); };

    AdmissionDecision decision;
    CircuitTrip trip;
    bool tripped = false;
    {
        std::lock_guard lock(state->mutex);
        int64_t now = clock_->now_ms();
        trim(state->window, now);

        if (state->circuit.state() == CircuitState::Open) {
            if (state->circuit.poll(now) == CircuitState::Open) {
                decision.allowed = false;
                decision.retry_after = ceil_seconds(state->circuit.remaining_open_ms(now));
                decision.circuit_state = CircuitState::Open;
                decision.reason = DenialReason::CircuitOpen;
                decision.limit = static_cast<int>(current_limit(operation));
                spdlog::debug("Denied {}:{} (circuit open, retry in {}s)", operation, identity,
                              decision.retry_after);
                return decision;
            }
            spdlog::info("Circuit half-open for {}:{}", operation, identity);
        }

        double current = store_->with_limit(operation, limit_factory,
                                            [](AdaptiveLimit& limit) { return limit.current(); });
        decision.limit = static_cast<int>(std::floor(current));

        if (static_cast<double>(state->window.size() + static_cast<size_t>(cost)) > current) {
            tripped = fail_locked(*state, now, trip, key);
            decision.allowed = false;
            decision.remaining = 0;
            int64_t oldest = state->window.empty() ? now : state->window.front();
            decision.retry_after = std::max(1, ceil_seconds(oldest + window_ms_ - now));
            decision.circuit_state = state->circuit.state();
            decision.reason = DenialReason::RateLimited;
            spdlog::debug("Denied {}:{} (window {} + {} > {:.1f})", operation, identity,
                          state->window.size(), cost, current);
        } else {
            for (int i = 0; i < cost; ++i) state->window.push_back(now);
            auto used = static_cast<double>(state->window.size());
            current = store_->with_limit(operation, limit_factory, [used, now](AdaptiveLimit& limit) {
                limit.update(used / limit.current(), now);
                return limit.current();
            });
            decision.allowed = true;
            decision.limit = static_cast<int>(std::floor(current));
            decision.remaining = std::max(0, decision.limit - static_cast<int>(state->window.size()));
            decision.circuit_state = state->circuit.state();
        }
    }
    if (tripped) notify_trip(trip);
    return decision;
}

void AdmissionController::record_failure(const std::string& operation, const std::string& identity) {
    auto key = make_key(operation, identity);
    auto state = store_->acquire(key, policy_);
    CircuitTrip trip;
    bool tripped = false;
    {
        std::lock_guard lock(state->mutex);
        tripped = fail_locked(*state, clock_->now_ms(), trip, key);
    }
    if (tripped) notify_trip(trip);
}

void AdmissionController::record_success(const std::string& operation, const std::string& identity) {
    auto key = make_key(operation, identity);
    auto state = store_->acquire(key, policy_);
    std::lock_guard lock(state->mutex);
    if (state->circuit.record_success()) {
        spdlog::info("Circuit closed for {}:{}", operation, identity);
    }
}

CircuitState AdmissionController::circuit_state(const std::string& operation, const std::string& identity) const {
    auto state = store_->find(make_key(operation, identity));
    if (!state) return CircuitState::Closed;
    std::lock_guard lock(state->mutex);
    return state->circuit.state();
}

int AdmissionController::failure_count(const std::string& operation, const std::string& identity) const {
    auto state = store_->find(make_key(operation, identity));
    if (!state) return 0;
    std::lock_guard lock(state->mutex);
    return state->circuit.failure_count();
}

size_t AdmissionController::window_size(const std::string& operation, const std::string& identity) const {
    auto state = store_->find(make_key(operation, identity));
    if (!state) return 0;
    std::lock_guard lock(state->mutex);
    return state->window.size();
}

double AdmissionController::current_limit(const std::string& operation) const {
    auto limit_factory = [this, &operation]() { return make_limit(operation); };
    return store_->with_limit(operation, limit_factory,
                              [](AdaptiveLimit& limit) { return limit.current(); });
}

bool AdmissionController::is_configured(const std::string& operation) const {
    return config_.operation_limits.count(operation) > 0;
}

size_t AdmissionController::sweep() {
    int64_t now = clock_->now_ms();
    size_t evicted = 0;
    store_->for_each([&](const AdmissionKey&, KeyState& state) {
        std::lock_guard lock(state.mutex);
        evicted += trim(state.window, now);
    });
    size_t dropped = store_->evict_if([](const KeyState& state) {
        return state.window.empty() && state.circuit.state() == CircuitState::Closed &&
               state.circuit.failure_count() == 0;
    });
    if (evicted > 0 || dropped > 0) {
        spdlog::debug("Admission sweep evicted {} timestamps and {} idle keys, {} keys tracked", evicted,
                      dropped, store_->size());
    }
    return evicted;
}

size_t AdmissionController::open_circuits() const {
    size_t open = 0;
    store_->for_each([&open](const AdmissionKey&, KeyState& state) {
        std::lock_guard lock(state.mutex);
        if (state.circuit.state() == CircuitState::Open) open++;
    });
    return open;
}

void AdmissionController::set_trip_listener(std::function<void(const CircuitTrip&)> listener) {
    std::lock_guard lock(listener_mutex_);
    trip_listener_ = std::move(listener);
}

}  // namespace aegis
