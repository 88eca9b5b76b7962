#include <gtest/gtest.h>
#include "gateway/governance_gateway.h"
#include "audit/memory_audit_sink.h"
#include "state/state_container.h"
#include <stdexcept>

using namespace aegis;

namespace {

constexpr int64_t kNoonUtcMs = 1700049600000;

class ThrowingSink : public AuditSink {
public:
    std::string append_event(const std::string&, const EventDetails&) override {
        throw std::runtime_error("audit backend down");
    }
};

class IntThrowingSink : public AuditSink {
public:
    std::string append_event(const std::string&, const EventDetails&) override {
        throw 42;
    }
};

Config gateway_config() {
    Config cfg;
    OperationLimit tight;
    tight.base = 2;
    tight.burst = 0;
    cfg.operation_limits["export"] = tight;
    return cfg;
}

}  // namespace

// ========== Success and failure ==========

TEST(GovernanceGatewayTest, test_success_returns_result_and_reports) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);

    int result = gateway.execute_governed("computation_execution", "alice", []() { return 42; });
    EXPECT_EQ(result, 42);

    auto perf = sink->events_of_type("performance_metric");
    ASSERT_EQ(perf.size(), 1u);
    EXPECT_EQ(perf[0].details.at("operation"), "computation_execution");
    EXPECT_EQ(perf[0].details.at("success"), "true");
    EXPECT_EQ(sink->count_of_type("threat_analysis"), 1u);

    auto health = gateway.health();
    EXPECT_EQ(health.executed, 1u);
    EXPECT_EQ(health.failed, 0u);
    EXPECT_EQ(health.threats_analyzed, 1u);
    EXPECT_EQ(health.tracked_keys, 1u);
    EXPECT_EQ(gateway.admission().window_size("computation_execution", "alice"), 1u);
    EXPECT_EQ(gateway.metrics().series("operation_success").size(), 1u);
}

TEST(GovernanceGatewayTest, test_void_work) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(gateway_config(), nullptr, nullptr, clock);
    int calls = 0;
    gateway.execute_governed("computation_execution", "alice", [&calls]() { calls++; });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(gateway.health().executed, 1u);
}

TEST(GovernanceGatewayTest, test_governs_state_operations) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(Config{}, nullptr, nullptr, clock);
    auto record = gateway.execute_governed("computation_execution", "alice", [&clock]() {
        StateContainer state(8, clock);
        return state.to_record();
    });
    auto restored = StateContainer::from_record(record, clock);
    EXPECT_TRUE(restored.verify());
}

TEST(GovernanceGatewayTest, test_failure_wrapped_with_cause) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);

    try {
        gateway.execute_governed("computation_execution", "alice",
                                 []() -> int { throw std::runtime_error("backend timeout"); });
        FAIL() << "expected OperationFailed";
    } catch (const OperationFailed& e) {
        EXPECT_EQ(e.operation(), "computation_execution");
        ASSERT_TRUE(e.cause());
        EXPECT_THROW(e.rethrow_cause(), std::runtime_error);
    }

    EXPECT_EQ(gateway.admission().failure_count("computation_execution", "alice"), 1);
    auto perf = sink->events_of_type("performance_metric");
    ASSERT_EQ(perf.size(), 1u);
    EXPECT_EQ(perf[0].details.at("success"), "false");
    EXPECT_EQ(gateway.health().failed, 1u);
    EXPECT_EQ(gateway.metrics().series("operation_failure").size(), 1u);
}

TEST(GovernanceGatewayTest, test_non_standard_exception_wrapped) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(gateway_config(), nullptr, nullptr, clock);
    try {
        gateway.execute_governed("computation_execution", "alice", []() { throw 7; });
        FAIL() << "expected OperationFailed";
    } catch (const OperationFailed& e) {
        EXPECT_THROW(e.rethrow_cause(), int);
    }
    EXPECT_EQ(gateway.health().failed, 1u);
}

// ========== Admission ==========

TEST(GovernanceGatewayTest, test_rate_limit_blocks_work) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);
    int calls = 0;
    auto work = [&calls]() { return ++calls; };

    gateway.execute_governed("export", "alice", work);
    gateway.execute_governed("export", "alice", work);
    try {
        gateway.execute_governed("export", "alice", work);
        FAIL() << "expected RateLimitExceeded";
    } catch (const RateLimitExceeded& e) {
        EXPECT_GT(e.retry_after(), 0);
        EXPECT_EQ(e.operation(), "export");
        EXPECT_EQ(e.identity(), "alice");
    }
    EXPECT_EQ(calls, 2);

    auto denied = sink->events_of_type("admission_denied");
    ASSERT_EQ(denied.size(), 1u);
    EXPECT_EQ(denied[0].details.at("reason"), "rate_limited");
    EXPECT_EQ(sink->count_of_type("performance_metric"), 2u);
    EXPECT_EQ(gateway.health().denied, 1u);
}

TEST(GovernanceGatewayTest, test_failures_open_circuit) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);
    auto failing = []() -> int { throw std::runtime_error("downstream error"); };

    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(gateway.execute_governed("computation_execution", "alice", failing), OperationFailed);
    }
    EXPECT_EQ(gateway.admission().circuit_state("computation_execution", "alice"), CircuitState::Open);

    auto opened = sink->events_of_type("circuit_opened");
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0].details.at("failures"), "5");
    EXPECT_EQ(opened[0].details.at("timeout_ms"), "30000");

    int calls = 0;
    try {
        gateway.execute_governed("computation_execution", "alice", [&calls]() { return ++calls; });
        FAIL() << "expected CircuitOpenError";
    } catch (const CircuitOpenError& e) {
        EXPECT_EQ(e.retry_after(), 30);
    }
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(gateway.health().open_circuits, 1u);

    auto denied = sink->events_of_type("admission_denied");
    ASSERT_EQ(denied.size(), 1u);
    EXPECT_EQ(denied[0].details.at("reason"), "circuit_open");
    EXPECT_EQ(denied[0].details.at("circuit_state"), "OPEN");
}

TEST(GovernanceGatewayTest, test_circuit_recovers_after_timeout) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(gateway_config(), nullptr, nullptr, clock);
    auto failing = []() -> int { throw std::runtime_error("downstream error"); };
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(gateway.execute_governed("computation_execution", "alice", failing), OperationFailed);
    }

    clock.advance(std::chrono::seconds(30));
    EXPECT_EQ(gateway.execute_governed("computation_execution", "alice", []() { return 1; }), 1);
    EXPECT_EQ(gateway.admission().circuit_state("computation_execution", "alice"), CircuitState::Closed);
    EXPECT_EQ(gateway.health().open_circuits, 0u);
}

TEST(GovernanceGatewayTest, test_half_open_failure_reopens) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(gateway_config(), nullptr, nullptr, clock);
    auto failing = []() -> int { throw std::runtime_error("downstream error"); };
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(gateway.execute_governed("computation_execution", "alice", failing), OperationFailed);
    }
    clock.advance(std::chrono::seconds(30));
    EXPECT_THROW(gateway.execute_governed("computation_execution", "alice", failing), OperationFailed);

    clock.advance(std::chrono::seconds(30));
    try {
        gateway.execute_governed("computation_execution", "alice", []() { return 1; });
        FAIL() << "expected CircuitOpenError";
    } catch (const CircuitOpenError& e) {
        EXPECT_EQ(e.retry_after(), 30);
    }
}

// ========== Audit trail ==========

TEST(GovernanceGatewayTest, test_failing_sink_is_not_fatal) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(gateway_config(), std::make_shared<ThrowingSink>(), nullptr, clock);
    EXPECT_EQ(gateway.execute_governed("computation_execution", "alice", []() { return 5; }), 5);
    auto health = gateway.health();
    EXPECT_EQ(health.executed, 1u);
    // threat_analysis and performance_metric both failed
    EXPECT_EQ(health.audit_failures, 2u);
}

TEST(GovernanceGatewayTest, test_non_standard_sink_exception_is_not_fatal) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(gateway_config(), std::make_shared<IntThrowingSink>(), nullptr, clock);

    int result = 0;
    EXPECT_NO_THROW(result = gateway.execute_governed("computation_execution", "alice", []() { return 7; }));
    EXPECT_EQ(result, 7);

    // The work failure still surfaces as OperationFailed, not as the sink's int.
    EXPECT_THROW(gateway.execute_governed("computation_execution", "alice",
                                          []() -> int { throw std::runtime_error("backend timeout"); }),
                 OperationFailed);

    auto health = gateway.health();
    EXPECT_EQ(health.executed, 1u);
    EXPECT_EQ(health.failed, 1u);
    EXPECT_GE(health.audit_failures, 4u);
}

TEST(GovernanceGatewayTest, test_incident_reported_through_gateway) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);
    RequestContext hostile;
    hostile.suspicious_ip = true;
    hostile.unusual_location = true;
    hostile.rapid_succession = true;
    hostile.hour = 2;

    gateway.execute_governed("ai_decision", "mallory", []() { return true; }, hostile);
    EXPECT_EQ(gateway.health().incidents, 1u);
    EXPECT_EQ(sink->count_of_type("security_incident"), 1u);
    EXPECT_EQ(sink->count_of_type("response_action"), 3u);
}

TEST(GovernanceGatewayTest, test_repeated_failures_detected_as_intrusion) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);
    auto failing = []() -> int { throw std::runtime_error("downstream error"); };
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(gateway.execute_governed("computation_execution", "alice", failing), OperationFailed);
    }
    auto intrusions = sink->events_of_type("intrusion_detected");
    ASSERT_EQ(intrusions.size(), 1u);
    EXPECT_EQ(intrusions[0].details.at("pattern"), "repeated_failures");
    EXPECT_EQ(intrusions[0].details.at("subject"), "computation_execution:alice");
    EXPECT_EQ(gateway.health().intrusions, 1u);
}

TEST(GovernanceGatewayTest, test_rapid_allocation_marks_rapid_succession) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);
    for (int i = 0; i < 9; ++i) {
        gateway.execute_governed("resource_allocation", "bob", []() { return 0; });
    }
    EXPECT_EQ(sink->count_of_type("intrusion_detected"), 0u);

    RequestContext ctx;
    ctx.suspicious_ip = true;
    ctx.unusual_location = true;
    gateway.execute_governed("resource_allocation", "bob", []() { return 0; }, ctx);

    auto intrusions = sink->events_of_type("intrusion_detected");
    ASSERT_EQ(intrusions.size(), 1u);
    EXPECT_EQ(intrusions[0].details.at("pattern"), "rapid_resource_allocation");
    EXPECT_EQ(intrusions[0].details.at("severity"), "HIGH");
    // 0.3 + 0.3 from the caller plus 0.2 for the detected rapid succession.
    EXPECT_EQ(gateway.health().incidents, 1u);
}

TEST(GovernanceGatewayTest, test_update_baseline_audited) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(10000, clock);
    GovernanceGateway gateway(gateway_config(), sink, nullptr, clock);

    BaselineUpdate update;
    update.max_duration_ms = 250.0;
    EXPECT_TRUE(gateway.update_baseline("export", update));
    auto events = sink->events_of_type("baseline_updated");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].details.at("operation"), "export");

    BaselineUpdate invalid;
    invalid.error_rate = -0.5;
    EXPECT_FALSE(gateway.update_baseline("export", invalid));
    EXPECT_EQ(sink->count_of_type("baseline_updated"), 1u);
}

TEST(GovernanceGatewayTest, test_gateways_share_admission_store) {
    ManualClock clock(kNoonUtcMs);
    auto store = std::make_shared<AdmissionStore>();
    GovernanceGateway first(gateway_config(), nullptr, store, clock);
    GovernanceGateway second(gateway_config(), nullptr, store, clock);
    first.execute_governed("export", "alice", []() { return 0; });
    first.execute_governed("export", "alice", []() { return 0; });
    EXPECT_THROW(second.execute_governed("export", "alice", []() { return 0; }), RateLimitExceeded);
}
