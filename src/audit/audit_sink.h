#pragma once
#ifndef AEGIS_AUDIT_SINK_H
#define AEGIS_AUDIT_SINK_H

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace aegis {

using EventDetails = std::map<std::string, std::string>;

struct AuditEvent {
    std::string record_id;
    std::string event_type;
    EventDetails details;
    int64_t timestamp = 0;
};

// External append-only audit trail. Implementations must accept concurrent
// appends and may throw on failure.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual std::string append_event(const std::string& event_type, const EventDetails& details) = 0;
};

// Best-effort append: anything the sink throws is logged and counted, never
// rethrown.
// Returns the record id on success.
std::optional<std::string> try_append(AuditSink* sink, const std::string& event_type,
                                      const EventDetails& details,
                                      std::atomic<uint64_t>* failures = nullptr);

}  // namespace aegis

#endif  // AEGIS_AUDIT_SINK_H
