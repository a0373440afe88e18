/**
 * DecisionEngine.cpp
 *
 * Adaptive chunk size / connection count rules.
 */

#include "DecisionEngine.hpp"
#include "../Config.hpp"

#include <algorithm>

namespace flux::core::downloader {

namespace {

constexpr const char* kChunkSizeKey = "chunk_size";
constexpr const char* kConnectionsKey = "connections";

double wallClockSeconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* toString(DecisionType type) {
    switch (type) {
        case DecisionType::IncreaseChunkSize:   return "increase_chunk_size";
        case DecisionType::DecreaseChunkSize:   return "decrease_chunk_size";
        case DecisionType::IncreaseConnections: return "increase_connections";
        case DecisionType::DecreaseConnections: return "decrease_connections";
    }
    return "unknown";
}

json Decision::toJson() const {
    return {
        {"type", toString(type)},
        {"reason", reason},
        {"old_value", oldValue},
        {"new_value", newValue},
        {"expected_impact", expectedImpact},
        {"timestamp", timestamp},
        {"download_id", taskId}
    };
}

DecisionPolicy DecisionPolicy::fromConfig(const Config& config) {
    DecisionPolicy policy;
    policy.minSamples = config.get<size_t>("decisions.minSamples", policy.minSamples);
    policy.cooldown = std::chrono::milliseconds(static_cast<int64_t>(
        config.get<double>("decisions.cooldownSeconds", 5.0) * 1000.0));
    policy.stableCv = config.get<double>("decisions.stableCv", policy.stableCv);
    policy.unstableCv = config.get<double>("decisions.unstableCv", policy.unstableCv);
    policy.highRttMs = config.get<double>("decisions.highRttMs", policy.highRttMs);
    policy.lowRttMs = config.get<double>("decisions.lowRttMs", policy.lowRttMs);
    policy.lowErrorRate = config.get<double>("decisions.lowErrorRate", policy.lowErrorRate);
    policy.highErrorRate = config.get<double>("decisions.highErrorRate", policy.highErrorRate);
    policy.minEfficiencyForScaleUp =
        config.get<double>("decisions.minEfficiencyForScaleUp", policy.minEfficiencyForScaleUp);
    policy.minChunkSize = config.get<uint64_t>("decisions.minChunkSize", policy.minChunkSize);
    policy.maxChunkSize = config.get<uint64_t>("decisions.maxChunkSize", policy.maxChunkSize);
    policy.minConnections = config.get<uint32_t>("decisions.minConnections", policy.minConnections);
    policy.maxConnections = config.get<uint32_t>("decisions.maxConnections", policy.maxConnections);

    if (policy.minChunkSize == 0) policy.minChunkSize = 1;
    if (policy.maxChunkSize < policy.minChunkSize) policy.maxChunkSize = policy.minChunkSize;
    if (policy.minConnections == 0) policy.minConnections = 1;
    if (policy.maxConnections < policy.minConnections) policy.maxConnections = policy.minConnections;
    return policy;
}

DecisionEngine::DecisionEngine(DecisionPolicy policy)
    : m_policy(std::move(policy)) {
}

std::vector<Decision> DecisionEngine::analyze(const std::string& taskId,
                                              const Metrics& metrics,
                                              uint64_t currentChunkSize,
                                              uint32_t currentConnections,
                                              bool supportsRanges) {
    return analyze(taskId, metrics, currentChunkSize, currentConnections, supportsRanges, Clock::now());
}

std::vector<Decision> DecisionEngine::analyze(const std::string& taskId,
                                              const Metrics& metrics,
                                              uint64_t currentChunkSize,
                                              uint32_t currentConnections,
                                              bool supportsRanges,
                                              Clock::time_point now) {
    std::vector<Decision> decisions;

    // Not enough signal yet
    if (metrics.speedHistory().size() < m_policy.minSamples) {
        return decisions;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (auto decision = analyzeChunkSize(metrics, currentChunkSize, now)) {
        decisions.push_back(std::move(*decision));
    }

    if (supportsRanges) {
        if (auto decision = analyzeConnections(metrics, currentConnections, now)) {
            decisions.push_back(std::move(*decision));
        }
    }

    for (auto& decision : decisions) {
        decision.taskId = taskId;
        m_history.push_back(decision);
    }

    return decisions;
}

std::optional<Decision> DecisionEngine::analyzeChunkSize(const Metrics& metrics,
                                                         uint64_t currentSize,
                                                         Clock::time_point now) {
    if (!cooldownElapsed(kChunkSizeKey, now)) {
        return std::nullopt;
    }

    const auto& speeds = metrics.speedHistory();
    if (speeds.size() < 2) {
        return std::nullopt;
    }

    double cv = Metrics::coefficientOfVariation(speeds);
    if (cv == 0.0 && std::all_of(speeds.begin(), speeds.end(), [](double s) { return s == 0.0; })) {
        // Stalled transfer: no throughput signal to act on
        return std::nullopt;
    }

    // Stable throughput on a high-latency link: fewer, larger requests
    if (cv < m_policy.stableCv
        && metrics.rttMs() > m_policy.highRttMs
        && currentSize < m_policy.maxChunkSize) {
        uint64_t newSize = std::min(std::max(currentSize * 2, m_policy.minChunkSize), m_policy.maxChunkSize);
        m_lastDecision[kChunkSizeKey] = now;

        Decision decision;
        decision.type = DecisionType::IncreaseChunkSize;
        decision.reason = "Stable throughput + high RTT detected";
        decision.oldValue = currentSize;
        decision.newValue = newSize;
        decision.expectedImpact = "Reduced overhead from fewer requests";
        decision.timestamp = wallClockSeconds();
        return decision;
    }

    // Unstable throughput on a low-latency link: finer-grained chunks
    if (cv > m_policy.unstableCv
        && metrics.rttMs() < m_policy.lowRttMs
        && currentSize > m_policy.minChunkSize) {
        uint64_t newSize = std::max(std::min(currentSize / 2, m_policy.maxChunkSize), m_policy.minChunkSize);
        m_lastDecision[kChunkSizeKey] = now;

        Decision decision;
        decision.type = DecisionType::DecreaseChunkSize;
        decision.reason = "Unstable throughput + low RTT detected";
        decision.oldValue = currentSize;
        decision.newValue = newSize;
        decision.expectedImpact = "Better adaptability to network conditions";
        decision.timestamp = wallClockSeconds();
        return decision;
    }

    return std::nullopt;
}

std::optional<Decision> DecisionEngine::analyzeConnections(const Metrics& metrics,
                                                           uint32_t currentConnections,
                                                           Clock::time_point now) {
    if (!cooldownElapsed(kConnectionsKey, now)) {
        return std::nullopt;
    }

    double errorRate = metrics.errorRate();

    if (errorRate < m_policy.lowErrorRate
        && currentConnections < m_policy.maxConnections
        && metrics.efficiencyScore() > m_policy.minEfficiencyForScaleUp) {
        uint32_t newConnections = std::min(std::max(currentConnections * 2, m_policy.minConnections),
                                           m_policy.maxConnections);
        m_lastDecision[kConnectionsKey] = now;

        Decision decision;
        decision.type = DecisionType::IncreaseConnections;
        decision.reason = "Low error rate, server handles load well";
        decision.oldValue = currentConnections;
        decision.newValue = newConnections;
        decision.expectedImpact = "Higher throughput via parallelism";
        decision.timestamp = wallClockSeconds();
        return decision;
    }

    if (errorRate > m_policy.highErrorRate
        && currentConnections > m_policy.minConnections) {
        uint32_t newConnections = std::max(std::min(currentConnections / 2, m_policy.maxConnections),
                                           m_policy.minConnections);
        m_lastDecision[kConnectionsKey] = now;

        Decision decision;
        decision.type = DecisionType::DecreaseConnections;
        decision.reason = "High error rate detected";
        decision.oldValue = currentConnections;
        decision.newValue = newConnections;
        decision.expectedImpact = "Reduced server load, fewer errors";
        decision.timestamp = wallClockSeconds();
        return decision;
    }

    return std::nullopt;
}

bool DecisionEngine::cooldownElapsed(const std::string& key, Clock::time_point now) const {
    auto it = m_lastDecision.find(key);
    if (it == m_lastDecision.end()) {
        return true;
    }
    return now - it->second >= m_policy.cooldown;
}

std::vector<Decision> DecisionEngine::history() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history;
}

json DecisionEngine::exportAll() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json exported = json::array();
    for (const auto& decision : m_history) {
        exported.push_back(decision.toJson());
    }
    return exported;
}

std::vector<Decision> DecisionEngine::recent(const std::string& taskId, size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Decision> matching;
    for (const auto& decision : m_history) {
        if (decision.taskId == taskId) {
            matching.push_back(decision);
        }
    }

    if (matching.size() > limit) {
        matching.erase(matching.begin(), matching.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return matching;
}

} // namespace flux::core::downloader
