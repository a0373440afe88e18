#pragma once

/**
 * TransferEngine.hpp
 *
 * Adaptive multi-connection download orchestrator.
 * Owns the task registry, runs one worker per active task and publishes
 * every state change on an event bus.
 */

#include "TransferTask.hpp"
#include "TransferClient.hpp"
#include "DecisionEngine.hpp"
#include "ResumableWriter.hpp"
#include "../EventBus.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flux::core {
class Config;
}

namespace flux::core::downloader {

struct EngineOptions {
    uint32_t initialConnections{8};
    size_t fetchThreads{32};
    std::filesystem::path outputDirectory;

    static EngineOptions fromConfig(const Config& config);
};

/**
 * One range of a round: [offset, offset + length)
 */
struct ChunkRange {
    uint64_t offset{0};
    uint64_t length{0};

    bool operator==(const ChunkRange& other) const {
        return offset == other.offset && length == other.length;
    }
};

/**
 * TransferEngine - download orchestration
 *
 * Events (payloads carry the task id as "download_id"):
 *   engine_started, engine_stopped, download_added, download_started,
 *   download_progress, adaptive_decision, download_completed,
 *   download_paused, download_cancelled, download_failed, download_deleted
 *
 * Task operations are thread-safe but must not be called from an event
 * handler, which runs on a worker thread. start() and stop() are meant to
 * be called by the owner of the engine. Operations on the same task run one
 * at a time.
 */
class TransferEngine {
public:
    /**
     * @param transport Injected HTTP transport; a pooled HttpClient is
     *        created on start() when null
     */
    explicit TransferEngine(EngineOptions options = {},
                            ClientOptions clientOptions = {},
                            DecisionPolicy policy = {},
                            std::shared_ptr<utils::HttpTransport> transport = nullptr);
    ~TransferEngine();

    // Disable copy
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // -- Lifecycle --

    void start();

    /**
     * Cancel active tasks, close the client. Idempotent.
     */
    void stop();

    bool isRunning() const { return m_running; }

    // -- Task operations --

    /**
     * Probe `url` and register a QUEUED task.
     * @param outputDir Target directory (EngineOptions::outputDirectory when empty)
     * @param filename Overrides the detected filename
     * @return Task id
     * @throws ProbeError (after emitting download_failed) when the URL cannot be probed
     */
    std::string addTask(const std::string& url,
                        const std::filesystem::path& outputDir = {},
                        const std::optional<std::string>& filename = std::nullopt,
                        bool autoStart = true);

    /** QUEUED or PAUSED -> ACTIVE */
    bool startTask(const std::string& id);

    /** ACTIVE -> PAUSED, resume metadata is kept */
    bool pauseTask(const std::string& id);

    /** -> CANCELLED, partial files are removed */
    bool cancelTask(const std::string& id);

    /**
     * Remove a task from the registry
     * @param deleteFiles Also remove partial, metadata and finished files
     * @return true if the task existed
     */
    bool deleteTask(const std::string& id, bool deleteFiles = false);

    std::optional<TaskSnapshot> getTask(const std::string& id) const;
    std::vector<TaskSnapshot> listByStatus(std::optional<TransferStatus> status = std::nullopt) const;

    /**
     * Block until the task is no longer QUEUED or ACTIVE
     * @return false on timeout or unknown id
     */
    bool waitForTask(const std::string& id, std::chrono::milliseconds timeout) const;

    // -- Events --

    SubscriptionPtr subscribe(EventHandler handler);
    void unsubscribe(const SubscriptionPtr& subscription);

    // -- Decisions --

    json exportDecisions() const;
    bool exportDecisionsToFile(const std::filesystem::path& path) const;
    std::vector<Decision> recentDecisions(const std::string& id, size_t limit = 5) const;

    /**
     * Next ranges to fetch: walks the byte space from 0, jumping over
     * completed ranges, in steps of at most `chunkSize`.
     */
    static std::vector<ChunkRange> planBatch(const ChunkMap& completed,
                                             uint64_t totalSize,
                                             uint64_t chunkSize,
                                             uint32_t maxEntries);

    /** Bytes of [0, totalSize) covered by `completed` */
    static uint64_t coveredBytes(const ChunkMap& completed, uint64_t totalSize);

    /** Starting chunk size for a file of `totalSize` bytes */
    static uint64_t initialChunkSize(uint64_t totalSize);

private:
    std::shared_ptr<TransferTask> findTask(const std::string& id) const;

    void runWorker(const std::shared_ptr<TransferTask>& task);
    void downloadMultipart(const std::shared_ptr<TransferTask>& task,
                           ResumableWriter& writer,
                           ChunkMap& chunks,
                           const CancellationToken& token);
    void downloadWhole(const std::shared_ptr<TransferTask>& task,
                       ResumableWriter& writer,
                       const CancellationToken& token);
    void fetchChunk(const std::shared_ptr<TransferTask>& task,
                    ResumableWriter& writer,
                    ChunkMap& chunks,
                    ChunkRange range,
                    const CancellationToken& token);
    void applyDecision(const std::shared_ptr<TransferTask>& task, const Decision& decision);

    /**
     * Signal the worker and wait for it to exit
     */
    void stopWorker(const std::shared_ptr<TransferTask>& task);

    void setStatus(const std::shared_ptr<TransferTask>& task, TransferStatus status);
    void notifyStatusChanged();
    void emitProgress(const std::shared_ptr<TransferTask>& task, bool finished);

    EngineOptions m_options;
    ClientOptions m_clientOptions;

    EventBus m_events;
    DecisionEngine m_decisions;

    std::shared_ptr<utils::HttpTransport> m_injectedTransport;
    std::unique_ptr<TransferClient> m_client;
    std::unique_ptr<ThreadPool> m_fetchPool;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<TransferTask>> m_tasks;

    mutable std::mutex m_statusMutex;
    mutable std::condition_variable m_statusChanged;

    std::atomic<bool> m_running{false};
};

} // namespace flux::core::downloader
