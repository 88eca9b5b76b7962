#include <gtest/gtest.h>
#include "admission/admission_controller.h"
#include "gateway/governance_gateway.h"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace aegis;

namespace {

constexpr int64_t kNoonUtcMs = 1700049600000;

}  // namespace

TEST(ConcurrentAdmissionTest, test_single_key_never_over_admits) {
    ManualClock clock(kNoonUtcMs);
    Config cfg;
    AdmissionController controller(cfg, nullptr, clock);
    std::atomic<int> allowed{0};
    std::atomic<int> denied{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                auto decision = controller.check_limit("computation_execution", "shared");
                if (decision.allowed) {
                    allowed++;
                } else {
                    denied++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(allowed.load(), 100);
    EXPECT_EQ(denied.load(), 300);
    EXPECT_EQ(controller.window_size("computation_execution", "shared"), 100u);
}

TEST(ConcurrentAdmissionTest, test_independent_keys) {
    ManualClock clock(kNoonUtcMs);
    AdmissionController controller(Config{}, nullptr, clock);
    std::vector<std::atomic<int>> allowed(6);

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&, t]() {
            std::string identity = "user_" + std::to_string(t);
            for (int i = 0; i < 80; ++i) {
                if (controller.check_limit("resource_allocation", identity).allowed) allowed[t]++;
            }
        });
    }
    for (auto& t : threads) t.join();

    for (int t = 0; t < 6; ++t) {
        EXPECT_EQ(allowed[t].load(), 50) << "identity user_" << t;
    }
    EXPECT_EQ(controller.tracked_keys(), 6u);
}

TEST(ConcurrentAdmissionTest, test_concurrent_failures_trip_once) {
    ManualClock clock(kNoonUtcMs);
    AdmissionController controller(Config{}, nullptr, clock);
    std::atomic<int> trips{0};
    controller.set_trip_listener([&trips](const CircuitTrip&) { trips++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) controller.record_failure("ai_decision", "shared");
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(trips.load(), 1);
    EXPECT_EQ(controller.failure_count("ai_decision", "shared"), 200);
    EXPECT_EQ(controller.circuit_state("ai_decision", "shared"), CircuitState::Open);
}

TEST(ConcurrentAdmissionTest, test_gateway_parallel_execution) {
    ManualClock clock(kNoonUtcMs);
    GovernanceGateway gateway(Config{}, nullptr, nullptr, clock);
    std::atomic<int> ran{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 40; ++i) {
                try {
                    gateway.execute_governed("ai_decision", "shared", [&ran]() { ran++; });
                } catch (const RateLimitExceeded&) {
                    rejected++;
                } catch (const CircuitOpenError&) {
                    rejected++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ran.load(), 200);
    EXPECT_EQ(rejected.load(), 120);
    auto health = gateway.health();
    EXPECT_EQ(health.executed, 200u);
    EXPECT_EQ(health.denied, 120u);
}
