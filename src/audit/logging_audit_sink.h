#pragma once
#ifndef AEGIS_LOGGING_AUDIT_SINK_H
#define AEGIS_LOGGING_AUDIT_SINK_H

#include <atomic>
#include <memory>
#include <spdlog/logger.h>
#include "audit/audit_sink.h"

namespace aegis {

// Writes each audit event as one line to an spdlog logger. Uses the default
// logger when none is given.
class LoggingAuditSink : public AuditSink {
public:
    explicit LoggingAuditSink(std::shared_ptr<spdlog::logger> logger = nullptr);

    std::string append_event(const std::string& event_type, const EventDetails& details) override;

    uint64_t appended() const { return sequence_.load(); }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<uint64_t> sequence_{0};
};

std::string format_details(const EventDetails& details);

}  // namespace aegis

#endif  // AEGIS_LOGGING_AUDIT_SINK_H
