#pragma once
#ifndef AEGIS_ADMISSION_STORE_H
#define AEGIS_ADMISSION_STORE_H

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "admission/adaptive_limit.h"
#include "admission/circuit_breaker.h"

namespace aegis {

struct AdmissionKey {
    std::string operation;
    std::string identity;

    bool operator==(const AdmissionKey& other) const {
        return operation == other.operation && identity == other.identity;
    }
};

struct AdmissionKeyHash {
    size_t operator()(const AdmissionKey& key) const;
};

// Sliding window and breaker of one key. mutex serializes all mutations.
struct KeyState {
    explicit KeyState(CircuitPolicy policy) : circuit(policy) {}

    std::mutex mutex;
    std::deque<int64_t> window;
    CircuitBreaker circuit;
};

// Owns every piece of admission state: per-key windows and breakers, and the
// per-operation adaptive limits. Injected so several controllers, or a test,
// can share or inspect it.
class AdmissionStore {
public:
    AdmissionStore() = default;
    AdmissionStore(const AdmissionStore&) = delete;
    AdmissionStore& operator=(const AdmissionStore&) = delete;

    // Creates the key state on first use.
    std::shared_ptr<KeyState> acquire(const AdmissionKey& key, const CircuitPolicy& policy);
    std::shared_ptr<KeyState> find(const AdmissionKey& key) const;

    size_t size() const;
    std::vector<AdmissionKey> keys() const;

    // Visits a snapshot of the entries. The map lock is not held during fn,
    // so fn may lock the key state.
    void for_each(const std::function<void(const AdmissionKey&, KeyState&)>& fn) const;

    // Runs fn on the operation's limit under the limit-table lock, creating
    // it with make() on first use.
    template <typename Fn>
    auto with_limit(const std::string& operation, const std::function<AdaptiveLimit()>& make, Fn&& fn) {
        std::lock_guard lock(limits_mutex_);
        auto it = limits_.find(operation);
        if (it == limits_.end()) {
            it = limits_.emplace(operation, make()).first;
        }
        return fn(it->second);
    }

    size_t limit_count() const;

    // Drops keys whose state is referenced only by the table and for which
    // idle(state) holds. Returns the number of keys removed.
    size_t evict_if(const std::function<bool(const KeyState&)>& idle);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<AdmissionKey, std::shared_ptr<KeyState>, AdmissionKeyHash> entries_;

    mutable std::mutex limits_mutex_;
    std::unordered_map<std::string, AdaptiveLimit> limits_;
};

}  // namespace aegis

#endif  // AEGIS_ADMISSION_STORE_H
