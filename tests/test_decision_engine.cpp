#include "core/downloader/DecisionEngine.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace flux::core::downloader;
using namespace std::chrono_literals;

namespace {

const Metrics::Clock::time_point kStart{};

/**
 * Metrics fed one sample per second with the given speeds
 */
Metrics metricsWithSpeeds(const std::vector<uint64_t>& speeds, double rttMs, uint32_t errors = 0) {
    Metrics metrics(1024 * kMiB, kStart);
    uint64_t bytes = 0;
    int second = 0;
    for (uint64_t speed : speeds) {
        bytes += speed;
        metrics.update(bytes, rttMs, kStart + std::chrono::seconds(++second));
    }
    for (uint32_t i = 0; i < errors; ++i) {
        metrics.incrementErrors();
    }
    return metrics;
}

// cv ~0.05
std::vector<uint64_t> stableSpeeds(size_t count = 12) {
    std::vector<uint64_t> speeds;
    for (size_t i = 0; i < count; ++i) {
        speeds.push_back(i % 2 == 0 ? 950000 : 1050000);
    }
    return speeds;
}

// cv ~0.8
std::vector<uint64_t> unstableSpeeds(size_t count = 12) {
    std::vector<uint64_t> speeds;
    for (size_t i = 0; i < count; ++i) {
        speeds.push_back(i % 2 == 0 ? 200000 : 1800000);
    }
    return speeds;
}

DecisionEngine::Clock::time_point at(std::chrono::milliseconds offset) {
    return DecisionEngine::Clock::time_point{} + std::chrono::hours(1) + offset;
}

} // namespace

TEST(DecisionEngineTest, NoDecisionBeforeEnoughSamples) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(stableSpeeds(9), 300.0);

    EXPECT_TRUE(engine.analyze("t", metrics, 2 * kMiB, 4, true, at(0ms)).empty());
    EXPECT_TRUE(engine.history().empty());
}

TEST(DecisionEngineTest, StableHighLatencyDoublesChunkSize) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(stableSpeeds(), 300.0);
    ASSERT_LT(Metrics::coefficientOfVariation(metrics.speedHistory()), 0.15);

    auto decisions = engine.analyze("task-1", metrics, 2 * kMiB, 16, true, at(0ms));

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].type, DecisionType::IncreaseChunkSize);
    EXPECT_EQ(decisions[0].oldValue, 2 * kMiB);
    EXPECT_EQ(decisions[0].newValue, 4 * kMiB);
    EXPECT_EQ(decisions[0].taskId, "task-1");
    EXPECT_FALSE(decisions[0].reason.empty());
    EXPECT_FALSE(decisions[0].expectedImpact.empty());
    EXPECT_GT(decisions[0].timestamp, 0.0);
}

TEST(DecisionEngineTest, ChunkIncreaseIsCappedAtMaximum) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(stableSpeeds(), 300.0);

    auto decisions = engine.analyze("t", metrics, 12 * kMiB, 16, true, at(0ms));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].newValue, 16 * kMiB);

    DecisionEngine atMaximum;
    EXPECT_TRUE(atMaximum.analyze("t", metrics, 16 * kMiB, 16, true, at(0ms)).empty());
}

TEST(DecisionEngineTest, UnstableLowLatencyHalvesChunkSize) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(unstableSpeeds(), 20.0);

    auto decisions = engine.analyze("t", metrics, 4 * kMiB, 16, true, at(0ms));

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].type, DecisionType::DecreaseChunkSize);
    EXPECT_EQ(decisions[0].newValue, 2 * kMiB);
}

TEST(DecisionEngineTest, ChunkDecreaseStopsAtMinimum) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(unstableSpeeds(), 20.0);

    auto decisions = engine.analyze("t", metrics, kMiB, 16, true, at(0ms));
    for (const auto& decision : decisions) {
        EXPECT_NE(decision.type, DecisionType::DecreaseChunkSize);
    }
}

TEST(DecisionEngineTest, HealthyTransferDoublesConnections) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(stableSpeeds(), 100.0);
    ASSERT_GT(metrics.efficiencyScore(), 70.0);

    auto decisions = engine.analyze("t", metrics, 2 * kMiB, 8, true, at(0ms));

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].type, DecisionType::IncreaseConnections);
    EXPECT_EQ(decisions[0].oldValue, 8u);
    EXPECT_EQ(decisions[0].newValue, 16u);
}

TEST(DecisionEngineTest, ErrorsHalveConnections) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(stableSpeeds(), 100.0, 5);
    ASSERT_GT(metrics.errorRate(), 0.10);

    auto decisions = engine.analyze("t", metrics, 2 * kMiB, 8, true, at(0ms));

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].type, DecisionType::DecreaseConnections);
    EXPECT_EQ(decisions[0].newValue, 4u);
}

TEST(DecisionEngineTest, UnstableTransferDoesNotScaleUpConnections) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(unstableSpeeds(), 100.0);
    ASSERT_LE(metrics.efficiencyScore(), 70.0);

    EXPECT_TRUE(engine.analyze("t", metrics, 2 * kMiB, 4, true, at(0ms)).empty());
}

TEST(DecisionEngineTest, ConnectionRulesNeedRangeSupport) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(stableSpeeds(), 100.0, 5);

    EXPECT_TRUE(engine.analyze("t", metrics, 2 * kMiB, 8, false, at(0ms)).empty());
}

TEST(DecisionEngineTest, CooldownSuppressesRepeatedDecisions) {
    DecisionEngine engine;
    auto metrics = metricsWithSpeeds(stableSpeeds(), 300.0);

    ASSERT_EQ(engine.analyze("t", metrics, 2 * kMiB, 16, true, at(0ms)).size(), 1u);
    EXPECT_TRUE(engine.analyze("t", metrics, 4 * kMiB, 16, true, at(1000ms)).empty());
    EXPECT_TRUE(engine.analyze("t", metrics, 4 * kMiB, 16, true, at(4999ms)).empty());

    auto later = engine.analyze("t", metrics, 4 * kMiB, 16, true, at(5000ms));
    ASSERT_EQ(later.size(), 1u);
    EXPECT_EQ(later[0].newValue, 8 * kMiB);
}

TEST(DecisionEngineTest, CooldownsAreIndependentPerRule) {
    DecisionEngine engine;
    auto stable = metricsWithSpeeds(stableSpeeds(), 300.0);

    // Chunk rule fires, connection rule blocked by the maximum
    ASSERT_EQ(engine.analyze("t", stable, 2 * kMiB, 16, true, at(0ms)).size(), 1u);

    // Connection rule still available during the chunk cooldown
    auto decisions = engine.analyze("t", stable, 4 * kMiB, 4, true, at(1000ms));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].type, DecisionType::IncreaseConnections);
}

TEST(DecisionEngineTest, InjectedPolicyOverridesThresholds) {
    DecisionPolicy policy;
    policy.minSamples = 2;
    policy.cooldown = 0ms;
    policy.highRttMs = 10.0;

    DecisionEngine engine(policy);
    auto metrics = metricsWithSpeeds(stableSpeeds(2), 20.0);

    auto first = engine.analyze("t", metrics, 2 * kMiB, 16, true, at(0ms));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].type, DecisionType::IncreaseChunkSize);
    EXPECT_EQ(engine.analyze("t", metrics, 4 * kMiB, 16, true, at(0ms)).size(), 1u);
}

TEST(DecisionEngineTest, DecisionsNeverLeaveBounds) {
    const std::vector<uint64_t> chunkSizes = {kMiB, kMiB + 1, 3 * kMiB / 2, 2 * kMiB, 5 * kMiB,
                                              8 * kMiB, 15 * kMiB, 16 * kMiB};
    const std::vector<Metrics> inputs = {
        metricsWithSpeeds(stableSpeeds(), 300.0),
        metricsWithSpeeds(stableSpeeds(), 100.0),
        metricsWithSpeeds(unstableSpeeds(), 20.0),
        metricsWithSpeeds(stableSpeeds(), 300.0, 40),
        metricsWithSpeeds(unstableSpeeds(), 5.0, 3),
        metricsWithSpeeds(std::vector<uint64_t>(12, 0), 500.0, 1),
    };

    const DecisionPolicy policy;

    for (const auto& metrics : inputs) {
        for (uint64_t chunk : chunkSizes) {
            for (uint32_t connections = 1; connections <= 16; ++connections) {
                DecisionEngine engine;
                for (const auto& decision : engine.analyze("t", metrics, chunk, connections, true, at(0ms))) {
                    switch (decision.type) {
                        case DecisionType::IncreaseChunkSize:
                        case DecisionType::DecreaseChunkSize:
                            EXPECT_GE(decision.newValue, policy.minChunkSize);
                            EXPECT_LE(decision.newValue, policy.maxChunkSize);
                            break;
                        case DecisionType::IncreaseConnections:
                        case DecisionType::DecreaseConnections:
                            EXPECT_GE(decision.newValue, policy.minConnections);
                            EXPECT_LE(decision.newValue, policy.maxConnections);
                            break;
                    }
                }
            }
        }
    }
}

TEST(DecisionEngineTest, ExportAndRecent) {
    DecisionPolicy policy;
    policy.cooldown = 0ms;
    DecisionEngine engine(policy);

    auto stable = metricsWithSpeeds(stableSpeeds(), 300.0);
    engine.analyze("a", stable, 2 * kMiB, 16, true, at(0ms));
    engine.analyze("b", stable, 2 * kMiB, 16, true, at(1ms));
    engine.analyze("a", stable, 4 * kMiB, 16, true, at(2ms));
    engine.analyze("a", stable, 8 * kMiB, 16, true, at(3ms));

    auto exported = engine.exportAll();
    ASSERT_TRUE(exported.is_array());
    ASSERT_EQ(exported.size(), 4u);
    EXPECT_EQ(exported[0]["type"], "increase_chunk_size");
    EXPECT_EQ(exported[0]["download_id"], "a");
    EXPECT_EQ(exported[0]["old_value"], 2 * kMiB);
    EXPECT_EQ(exported[0]["new_value"], 4 * kMiB);
    EXPECT_TRUE(exported[0].contains("reason"));
    EXPECT_TRUE(exported[0].contains("expected_impact"));
    EXPECT_TRUE(exported[0].contains("timestamp"));
    EXPECT_EQ(exported[1]["download_id"], "b");

    auto recent = engine.recent("a", 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].newValue, 8 * kMiB);
    EXPECT_EQ(recent[1].newValue, 16 * kMiB);

    EXPECT_EQ(engine.recent("a").size(), 3u);
    EXPECT_TRUE(engine.recent("missing").empty());
}

TEST(DecisionEngineTest, DecisionTypeNames) {
    EXPECT_STREQ(toString(DecisionType::IncreaseChunkSize), "increase_chunk_size");
    EXPECT_STREQ(toString(DecisionType::DecreaseChunkSize), "decrease_chunk_size");
    EXPECT_STREQ(toString(DecisionType::IncreaseConnections), "increase_connections");
    EXPECT_STREQ(toString(DecisionType::DecreaseConnections), "decrease_connections");
}
