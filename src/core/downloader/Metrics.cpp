/**
 * Metrics.cpp
 *
 * Rolling transfer statistics.
 */

#include "Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace flux::core::downloader {

namespace {

double secondsBetween(Metrics::Clock::time_point from, Metrics::Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

Metrics::Metrics(uint64_t totalSize, Clock::time_point start)
    : m_totalSize(totalSize)
    , m_startTime(start)
    , m_lastUpdateTime(start) {
}

void Metrics::update(uint64_t bytesDownloadedTotal, double rttMs) {
    update(bytesDownloadedTotal, rttMs, Clock::now());
}

void Metrics::update(uint64_t bytesDownloadedTotal, double rttMs, Clock::time_point now) {
    double delta = secondsBetween(m_lastUpdateTime, now);

    if (delta > 0.0) {
        double bytesDelta = static_cast<double>(bytesDownloadedTotal) - static_cast<double>(m_lastBytes);
        m_currentSpeed = bytesDelta / delta;

        if (m_currentSpeed > m_peakSpeed) {
            m_peakSpeed = m_currentSpeed;
        }

        m_speedHistory.push_back(m_currentSpeed);
        if (m_speedHistory.size() > kHistoryCapacity) {
            m_speedHistory.pop_front();
        }
    }

    m_bytesDownloaded = bytesDownloadedTotal;
    m_rttMs = rttMs;

    double elapsed = secondsBetween(m_startTime, now);
    if (elapsed > 0.0) {
        m_averageSpeed = static_cast<double>(m_bytesDownloaded) / elapsed;
    }

    m_lastUpdateTime = now;
    m_lastBytes = bytesDownloadedTotal;
}

void Metrics::restoreProgress(uint64_t bytesDownloaded) {
    restoreProgress(bytesDownloaded, Clock::now());
}

void Metrics::restoreProgress(uint64_t bytesDownloaded, Clock::time_point now) {
    m_bytesDownloaded = bytesDownloaded;
    m_lastBytes = bytesDownloaded;
    m_lastUpdateTime = now;
}

double Metrics::progressPercent() const {
    if (m_totalSize == 0) {
        return 0.0;
    }
    return static_cast<double>(m_bytesDownloaded) / static_cast<double>(m_totalSize) * 100.0;
}

double Metrics::etaSeconds() const {
    if (m_currentSpeed <= 0.0) {
        return kEtaUnknown;
    }
    double remaining = m_totalSize > m_bytesDownloaded
        ? static_cast<double>(m_totalSize - m_bytesDownloaded)
        : 0.0;
    return remaining / m_currentSpeed;
}

double Metrics::elapsedSeconds() const {
    return elapsedSeconds(Clock::now());
}

double Metrics::elapsedSeconds(Clock::time_point now) const {
    return secondsBetween(m_startTime, now);
}

double Metrics::errorRate() const {
    uint64_t mebibytes = std::max<uint64_t>(1, m_bytesDownloaded / kMiB);
    return static_cast<double>(m_errorCount) / static_cast<double>(mebibytes);
}

double Metrics::efficiencyScore() const {
    if (m_speedHistory.empty() || m_averageSpeed == 0.0) {
        return 0.0;
    }

    double stability = 1.0;
    if (m_speedHistory.size() >= 2) {
        double mean = std::accumulate(m_speedHistory.begin(), m_speedHistory.end(), 0.0)
                      / static_cast<double>(m_speedHistory.size());
        stability = mean == 0.0 ? 0.0 : std::max(0.0, 1.0 - coefficientOfVariation(m_speedHistory));
    }

    double errorPenalty = std::max(0.0, 1.0 - errorRate());

    double score = (stability * 0.7 + errorPenalty * 0.3) * 100.0;
    if (!std::isfinite(score)) {
        return 0.0;
    }
    return std::clamp(score, 0.0, 100.0);
}

double Metrics::coefficientOfVariation(const std::deque<double>& samples) {
    if (samples.size() < 2) {
        return 0.0;
    }

    double n = static_cast<double>(samples.size());
    double mean = std::accumulate(samples.begin(), samples.end(), 0.0) / n;
    if (mean == 0.0) {
        return 0.0;
    }

    double squares = 0.0;
    for (double s : samples) {
        squares += (s - mean) * (s - mean);
    }
    double stdev = std::sqrt(squares / (n - 1.0));
    return std::abs(stdev / mean);
}

} // namespace flux::core::downloader
