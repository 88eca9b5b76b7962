#pragma once
#ifndef AEGIS_MEMORY_AUDIT_SINK_H
#define AEGIS_MEMORY_AUDIT_SINK_H

#include <deque>
#include <mutex>
#include <vector>
#include "audit/audit_sink.h"
#include "common/clock.h"

namespace aegis {

// Bounded in-memory audit trail. Oldest events are dropped past capacity.
class MemoryAuditSink : public AuditSink {
public:
    explicit MemoryAuditSink(size_t capacity = 10000, const Clock& clock = system_clock());

    std::string append_event(const std::string& event_type, const EventDetails& details) override;

    std::vector<AuditEvent> events() const;
    std::vector<AuditEvent> events_of_type(const std::string& event_type) const;
    size_t count_of_type(const std::string& event_type) const;
    size_t size() const;
    uint64_t total_appended() const;
    void clear();

private:
    size_t capacity_;
    const Clock* clock_;
    mutable std::mutex mutex_;
    std::deque<AuditEvent> events_;
    uint64_t sequence_ = 0;
};

}  // namespace aegis

#endif  // AEGIS_MEMORY_AUDIT_SINK_H
