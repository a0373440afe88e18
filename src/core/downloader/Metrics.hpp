#pragma once

/**
 * Metrics.hpp
 *
 * Rolling throughput / latency / error statistics of one transfer.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace flux::core::downloader {

constexpr uint64_t kMiB = 1024 * 1024;

/**
 * Metrics - per-transfer statistics
 *
 * Owned by its transfer task and mutated only by that task's worker; the
 * engine serializes updates coming from concurrent range fetches. Every
 * method is pure arithmetic and never throws.
 */
class Metrics {
public:
    using Clock = std::chrono::steady_clock;

    /** Number of speed samples kept for stability analysis */
    static constexpr size_t kHistoryCapacity = 60;

    /** Returned by etaSeconds() while the speed is unknown */
    static constexpr double kEtaUnknown = -1.0;

    explicit Metrics(uint64_t totalSize = 0, Clock::time_point start = Clock::now());

    /**
     * Record progress.
     * @param bytesDownloadedTotal Cumulative bytes written so far
     * @param rttMs Round-trip time of the request that produced them
     */
    void update(uint64_t bytesDownloadedTotal, double rttMs);
    void update(uint64_t bytesDownloadedTotal, double rttMs, Clock::time_point now);

    /**
     * Seed the cumulative counter with bytes recovered from a previous run,
     * without producing a speed sample for them. The next sample is measured
     * from `now`.
     */
    void restoreProgress(uint64_t bytesDownloaded);
    void restoreProgress(uint64_t bytesDownloaded, Clock::time_point now);

    void incrementErrors() { ++m_errorCount; }
    void incrementRetries() { ++m_retryCount; }

    uint64_t totalSize() const { return m_totalSize; }
    uint64_t bytesDownloaded() const { return m_bytesDownloaded; }
    uint32_t errorCount() const { return m_errorCount; }
    uint32_t retryCount() const { return m_retryCount; }
    double currentSpeed() const { return m_currentSpeed; }
    double peakSpeed() const { return m_peakSpeed; }
    double averageSpeed() const { return m_averageSpeed; }
    double rttMs() const { return m_rttMs; }
    const std::deque<double>& speedHistory() const { return m_speedHistory; }
    Clock::time_point startTime() const { return m_startTime; }

    // Derived values, computed on read

    double progressPercent() const;
    double etaSeconds() const;
    double elapsedSeconds() const;
    double elapsedSeconds(Clock::time_point now) const;

    /** Errors per MiB transferred (at least one MiB is assumed) */
    double errorRate() const;

    /** 0-100 blend of speed stability (70%) and error rate (30%) */
    double efficiencyScore() const;

    /**
     * Coefficient of variation (sample standard deviation / mean).
     * 0 for fewer than two samples or a zero mean.
     */
    static double coefficientOfVariation(const std::deque<double>& samples);

private:
    uint64_t m_totalSize;
    uint64_t m_bytesDownloaded{0};
    Clock::time_point m_startTime;

    double m_currentSpeed{0.0};
    double m_averageSpeed{0.0};
    double m_peakSpeed{0.0};
    double m_rttMs{0.0};

    uint32_t m_errorCount{0};
    uint32_t m_retryCount{0};

    std::deque<double> m_speedHistory;

    Clock::time_point m_lastUpdateTime;
    uint64_t m_lastBytes{0};
};

} // namespace flux::core::downloader
