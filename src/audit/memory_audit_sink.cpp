#include "audit/memory_audit_sink.h"

namespace aegis {

MemoryAuditSink::MemoryAuditSink(size_t capacity, const Clock& clock)
    : capacity_(capacity > 0 ? capacity : 1), clock_(&clock) {}

std::string MemoryAuditSink::append_event(const std::string& event_type, const EventDetails& details) {
    std::lock_guard lock(mutex_);
    sequence_++;
    AuditEvent event;
    event.record_id = "audit_" + std::to_string(sequence_);
    event.event_type = event_type;
    event.details = details;
    event.timestamp = clock_->now_ms();
    events_.push_back(event);
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
    return event.record_id;
}

std::vector<AuditEvent> MemoryAuditSink::events() const {
    std::lock_guard lock(mutex_);
    return std::vector<AuditEvent>(events_.begin(), events_.end());
}

std::vector<AuditEvent> MemoryAuditSink::events_of_type(const std::string& event_type) const {
    std::lock_guard lock(mutex_);
    std::vector<AuditEvent> out;
    for (const auto& e : events_) {
        if (e.event_type == event_type) out.push_back(e);
    }
    return out;
}

size_t MemoryAuditSink::count_of_type(const std::string& event_type) const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& e : events_) {
        if (e.event_type == event_type) count++;
    }
    return count;
}

size_t MemoryAuditSink::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

uint64_t MemoryAuditSink::total_appended() const {
    std::lock_guard lock(mutex_);
    return sequence_;
}

void MemoryAuditSink::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

}  // namespace aegis
