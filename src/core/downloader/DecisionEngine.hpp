#pragma once

/**
 * DecisionEngine.hpp
 *
 * Closed-loop tuning of chunk size and connection count from live
 * transfer metrics.
 */

#include "Metrics.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flux::core {
class Config;
}

namespace flux::core::downloader {

using json = nlohmann::json;

enum class DecisionType {
    IncreaseChunkSize,
    DecreaseChunkSize,
    IncreaseConnections,
    DecreaseConnections
};

const char* toString(DecisionType type);

/**
 * Decision - one immutable adaptive action
 */
struct Decision {
    DecisionType type{DecisionType::IncreaseChunkSize};
    std::string reason;
    uint64_t oldValue{0};
    uint64_t newValue{0};
    std::string expectedImpact;
    double timestamp{0.0};          // seconds since the Unix epoch
    std::string taskId;

    json toJson() const;
};

/**
 * Thresholds and bounds of the decision rules
 */
struct DecisionPolicy {
    size_t minSamples{10};
    std::chrono::milliseconds cooldown{5000};

    double stableCv{0.15};
    double unstableCv{0.30};
    double highRttMs{200.0};
    double lowRttMs{50.0};

    double lowErrorRate{0.05};
    double highErrorRate{0.10};
    double minEfficiencyForScaleUp{70.0};

    uint64_t minChunkSize{1 * kMiB};
    uint64_t maxChunkSize{16 * kMiB};
    uint32_t minConnections{1};
    uint32_t maxConnections{16};

    static DecisionPolicy fromConfig(const Config& config);
};

/**
 * DecisionEngine - analyzes metrics and proposes parameter changes
 *
 * Pure analysis: it never touches a task. Proposals are recorded in an
 * append-only history. Each rule family ("chunk_size", "connections") has
 * its own cooldown, shared by every task analyzed by this engine.
 * Thread-safe.
 */
class DecisionEngine {
public:
    using Clock = std::chrono::steady_clock;

    explicit DecisionEngine(DecisionPolicy policy = {});

    /**
     * Analyze the metrics of one task
     * @param taskId Owning task, stamped on every decision
     * @param metrics Current metrics of the task
     * @param currentChunkSize Chunk size in bytes
     * @param currentConnections Concurrent range requests per round
     * @param supportsRanges Connection rules only apply to range-capable servers
     * @return Decisions to apply, at most one per rule family
     */
    std::vector<Decision> analyze(const std::string& taskId,
                                  const Metrics& metrics,
                                  uint64_t currentChunkSize,
                                  uint32_t currentConnections,
                                  bool supportsRanges);

    std::vector<Decision> analyze(const std::string& taskId,
                                  const Metrics& metrics,
                                  uint64_t currentChunkSize,
                                  uint32_t currentConnections,
                                  bool supportsRanges,
                                  Clock::time_point now);

    /** Flat, ordered snapshot of every decision ever made */
    std::vector<Decision> history() const;

    /** history() as a JSON array */
    json exportAll() const;

    /** The last `limit` decisions of one task, oldest first */
    std::vector<Decision> recent(const std::string& taskId, size_t limit = 5) const;

    const DecisionPolicy& policy() const { return m_policy; }

private:
    std::optional<Decision> analyzeChunkSize(const Metrics& metrics, uint64_t currentSize,
                                             Clock::time_point now);
    std::optional<Decision> analyzeConnections(const Metrics& metrics, uint32_t currentConnections,
                                               Clock::time_point now);

    bool cooldownElapsed(const std::string& key, Clock::time_point now) const;

    DecisionPolicy m_policy;

    mutable std::mutex m_mutex;
    std::vector<Decision> m_history;
    std::map<std::string, Clock::time_point> m_lastDecision;
};

} // namespace flux::core::downloader
