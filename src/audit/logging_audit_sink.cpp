#include "audit/logging_audit_sink.h"
#include <spdlog/spdlog.h>

namespace aegis {

LoggingAuditSink::LoggingAuditSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::string LoggingAuditSink::append_event(const std::string& event_type, const EventDetails& details) {
    auto id = "log_" + std::to_string(sequence_.fetch_add(1) + 1);
    logger_->info("[audit {}] {} {}", id, event_type, format_details(details));
    return id;
}

std::string format_details(const EventDetails& details) {
    std::string out;
    for (const auto& [key, value] : details) {
        if (!out.empty()) out += ' ';
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

}  // namespace aegis
