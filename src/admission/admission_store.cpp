#include "admission/admission_store.h"

namespace aegis {

size_t AdmissionKeyHash::operator()(const AdmissionKey& key) const {
    size_t h1 = std::hash<std::string>{}(key.operation);
    size_t h2 = std::hash<std::string>{}(key.identity);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

std::shared_ptr<KeyState> AdmissionStore::acquire(const AdmissionKey& key, const CircuitPolicy& policy) {
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) return it->second;
    }
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<KeyState>(policy);
    }
    return it->second;
}

std::shared_ptr<KeyState> AdmissionStore::find(const AdmissionKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() ? it->second : nullptr;
}

size_t AdmissionStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::vector<AdmissionKey> AdmissionStore::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<AdmissionKey> out;
    out.reserve(entries_.size());
    for (const auto& [key, _] : entries_) out.push_back(key);
    return out;
}

void AdmissionStore::for_each(const std::function<void(const AdmissionKey&, KeyState&)>& fn) const {
    std::vector<std::pair<AdmissionKey, std::shared_ptr<KeyState>>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& entry : entries_) snapshot.push_back(entry);
    }
    for (auto& [key, state] : snapshot) {
        fn(key, *state);
    }
}

size_t AdmissionStore::evict_if(const std::function<bool(const KeyState&)>& idle) {
    std::unique_lock lock(mutex_);
    size_t evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        // New references are only handed out under the map lock, so a count
        // of one means no caller holds this state.
        if (it->second.use_count() == 1) {
            bool remove = false;
            {
                std::lock_guard state_lock(it->second->mutex);
                remove = idle(*it->second);
            }
            if (remove) {
                it = entries_.erase(it);
                evicted++;
                continue;
            }
        }
        ++it;
    }
    return evicted;
}

size_t AdmissionStore::limit_count() const {
    std::lock_guard lock(limits_mutex_);
    return limits_.size();
}

}  // namespace aegis
