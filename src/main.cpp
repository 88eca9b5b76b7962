#include "audit/logging_audit_sink.h"
#include "config/config.h"
#include "gateway/governance_gateway.h"
#include "state/state_container.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int) {
    g_shutdown_requested = 1;
}

// Governed round trip through the state container: evolve, serialize,
// restore, measure.
int self_check(aegis::GovernanceGateway& gateway) {
    return gateway.execute_governed("computation_execution", "aegisd-self-check", []() {
        aegis::StateContainer state(4);
        aegis::Matrix identity(4, std::vector<aegis::Amplitude>(4, aegis::Amplitude(0.0, 0.0)));
        for (size_t i = 0; i < identity.size(); ++i) identity[i][i] = aegis::Amplitude(1.0, 0.0);
        state.evolve(identity);
        auto restored = aegis::StateContainer::from_record(state.to_record());
        return restored.measure(0).outcome;
    });
}

}  // namespace

int main() {
    try {
        auto& config = aegis::get_config();

        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Starting aegisd v1.0.0");

        auto sink = std::make_shared<aegis::LoggingAuditSink>();
        aegis::GovernanceGateway gateway(config, sink);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        gateway.start_maintenance();

        int outcome = self_check(gateway);
        spdlog::info("Self-check passed, measured outcome {}", outcome);

        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutdown requested");
        gateway.stop_maintenance();
        auto health = gateway.health();
        spdlog::info("aegisd shutdown complete: {} executed, {} failed, {} denied, {} incidents",
                     health.executed, health.failed, health.denied, health.incidents);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
