#include "audit/audit_sink.h"
#include <spdlog/spdlog.h>
#include <exception>

namespace aegis {

std::optional<std::string> try_append(AuditSink* sink, const std::string& event_type,
                                      const EventDetails& details, std::atomic<uint64_t>* failures) {
    if (!sink) return std::nullopt;
    try {
        return sink->append_event(event_type, details);
    } catch (const std::exception& e) {
        if (failures) failures->fetch_add(1);
        spdlog::warn("Audit sink rejected {} event: {}", event_type, e.what());
        return std::nullopt;
    } catch (...) {
        if (failures) failures->fetch_add(1);
        spdlog::warn("Audit sink rejected {} event: non-standard exception", event_type);
        return std::nullopt;
    }
}

}  // namespace aegis
