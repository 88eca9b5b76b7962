#include <gtest/gtest.h>
#include "anomaly/anomaly_scorer.h"
#include "audit/memory_audit_sink.h"
#include "state/state_container.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace aegis;

namespace {

constexpr int64_t kNoonUtcMs = 1700049600000;

}  // namespace

TEST(ConcurrentScoringTest, test_parallel_analysis_counts) {
    ManualClock clock(kNoonUtcMs);
    auto sink = std::make_shared<MemoryAuditSink>(100000, clock);
    AnomalyScorer scorer(Config{}, sink, clock);

    RequestContext hostile;
    hostile.suspicious_ip = true;
    hostile.unusual_location = true;
    hostile.rapid_succession = true;
    hostile.hour = 4;
    RequestContext calm;
    calm.hour = 12;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 100; ++i) {
                scorer.analyze("op", {20.0, 0.0}, (t % 2 == 0) ? hostile : calm);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(scorer.threats_analyzed(), 800u);
    EXPECT_EQ(scorer.incident_count(), 400u);
    EXPECT_EQ(sink->count_of_type("threat_analysis"), 800u);
    EXPECT_EQ(sink->count_of_type("security_incident"), 400u);
    EXPECT_EQ(sink->count_of_type("response_action"), 1200u);
}

TEST(ConcurrentScoringTest, test_baseline_updates_during_scoring) {
    ManualClock clock(kNoonUtcMs);
    AnomalyScorer scorer(Config{}, nullptr, clock);
    std::atomic<bool> done{false};

    std::thread writer([&]() {
        for (int i = 1; i <= 500; ++i) {
            BaselineUpdate update;
            update.max_duration_ms = static_cast<double>(i);
            scorer.update_baseline("op", update);
        }
        done = true;
    });
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                double score = scorer.behavioral_score("op", {100.0, 0.0}, {});
                EXPECT_GE(score, 0.0);
                EXPECT_LE(score, 1.0);
            }
        });
    }
    writer.join();
    for (auto& t : readers) t.join();

    ASSERT_TRUE(scorer.baseline("op").has_value());
    EXPECT_DOUBLE_EQ(scorer.baseline("op")->max_duration_ms, 500.0);
}

TEST(ConcurrentScoringTest, test_independent_states_in_parallel) {
    ManualClock clock(kNoonUtcMs);
    std::atomic<int> verified{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                StateContainer state(16, clock);
                state.measure(0);
                if (StateContainer::from_record(state.to_record(), clock).verify()) verified++;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(verified.load(), 160);
}
