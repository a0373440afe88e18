/**
 * TransferEngine.cpp
 *
 * Implementation of the adaptive transfer orchestrator.
 */

#include "TransferEngine.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <future>
#include <iterator>

namespace flux::core::downloader {

using utils::FileUtils;
using utils::StringUtils;

namespace {

constexpr uint64_t kGiB = 1024 * kMiB;

} // namespace

EngineOptions EngineOptions::fromConfig(const Config& config) {
    EngineOptions options;
    options.initialConnections = config.get<uint32_t>("engine.initialConnections", options.initialConnections);
    options.fetchThreads = std::max<size_t>(1, config.get<size_t>("engine.fetchThreads", options.fetchThreads));
    options.outputDirectory = config.get<std::string>("engine.outputDirectory", "");
    return options;
}

TransferEngine::TransferEngine(EngineOptions options,
                               ClientOptions clientOptions,
                               DecisionPolicy policy,
                               std::shared_ptr<utils::HttpTransport> transport)
    : m_options(std::move(options))
    , m_clientOptions(std::move(clientOptions))
    , m_decisions(std::move(policy))
    , m_injectedTransport(std::move(transport)) {
}

TransferEngine::~TransferEngine() {
    stop();
}

// -- Lifecycle --

void TransferEngine::start() {
    if (m_running) return;

    std::shared_ptr<utils::HttpTransport> transport = m_injectedTransport;
    if (!transport) {
        transport = std::make_shared<utils::HttpClient>(m_clientOptions.http);
    }

    m_client = std::make_unique<TransferClient>(std::move(transport), m_clientOptions);
    m_fetchPool = std::make_unique<ThreadPool>(m_options.fetchThreads);
    m_running = true;

    FLUX_LOG_INFO("Transfer engine started ({} fetch threads)", m_fetchPool->size());
    m_events.emit("engine_started");
}

void TransferEngine::stop() {
    if (!m_running.exchange(false)) return;

    FLUX_LOG_INFO("Stopping transfer engine");

    std::vector<std::shared_ptr<TransferTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, task] : m_tasks) {
            tasks.push_back(task);
        }
    }

    for (const auto& task : tasks) {
        bool active = false;
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            active = task->status == TransferStatus::Active;
        }
        if (active) {
            cancelTask(task->id);
        }
    }

    // Reap workers that finished on their own
    for (const auto& task : tasks) {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            worker = std::move(task->worker);
        }
        if (worker.joinable()) {
            worker.join();
        }
    }

    m_client->close();
    m_fetchPool.reset();
    m_client.reset();

    m_events.emit("engine_stopped");
}

// -- Task operations --

std::string TransferEngine::addTask(const std::string& url,
                                    const std::filesystem::path& outputDir,
                                    const std::optional<std::string>& filename,
                                    bool autoStart) {
    if (!m_running) {
        throw std::runtime_error("Transfer engine is not started");
    }

    ProbeResult info;
    try {
        info = m_client->probe(url);
    } catch (const std::exception& e) {
        FLUX_LOG_ERROR("Cannot add {}: {}", url, e.what());
        m_events.emit("download_failed", {
            {"download_id", StringUtils::generateUUID()},
            {"url", url},
            {"error", e.what()}
        });
        throw;
    }

    std::string name = filename && !filename->empty() ? *filename : info.filename;
    std::filesystem::path directory = outputDir.empty() ? m_options.outputDirectory : outputDir;

    const auto& policy = m_decisions.policy();
    auto task = std::make_shared<TransferTask>(StringUtils::generateUUID(), url, directory / name,
                                               name, info.size, info.supportsRanges);
    task->chunkSize = std::clamp(initialChunkSize(info.size), policy.minChunkSize, policy.maxChunkSize);
    task->connections = std::clamp(m_options.initialConnections, policy.minConnections, policy.maxConnections);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks[task->id] = task;
    }

    FLUX_LOG_INFO("Added task {}: {} -> {} ({} bytes, ranges: {})",
                  task->id, url, task->destination.string(), info.size, info.supportsRanges);

    m_events.emit("download_added", {
        {"download_id", task->id},
        {"url", url},
        {"filename", name},
        {"size", info.size},
        {"supports_ranges", info.supportsRanges}
    });

    if (autoStart) {
        startTask(task->id);
    }

    return task->id;
}

bool TransferEngine::startTask(const std::string& id) {
    if (!m_running) {
        throw std::runtime_error("Transfer engine is not started");
    }

    auto task = findTask(id);
    if (!task) return false;

    std::lock_guard<std::mutex> control(task->control);

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->status != TransferStatus::Queued && task->status != TransferStatus::Paused) {
            return false;
        }
        task->status = TransferStatus::Active;
        task->token = CancellationToken();
        task->worker = std::thread([this, task] { runWorker(task); });
    }
    notifyStatusChanged();
    return true;
}

bool TransferEngine::pauseTask(const std::string& id) {
    auto task = findTask(id);
    if (!task) return false;

    std::lock_guard<std::mutex> control(task->control);

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->status != TransferStatus::Active) {
            return false;
        }
    }

    stopWorker(task);

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        // The worker may have completed or failed before seeing the request
        if (task->status != TransferStatus::Active) {
            return false;
        }
    }
    setStatus(task, TransferStatus::Paused);

    FLUX_LOG_INFO("Paused task {}", id);
    m_events.emit("download_paused", {{"download_id", id}});
    return true;
}

bool TransferEngine::cancelTask(const std::string& id) {
    auto task = findTask(id);
    if (!task) return false;

    std::lock_guard<std::mutex> control(task->control);

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->status == TransferStatus::Completed || task->status == TransferStatus::Cancelled) {
            return false;
        }
    }

    stopWorker(task);

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->status == TransferStatus::Completed) {
            return false;
        }
    }

    ResumableWriter(task->destination, task->totalSize).cleanup();
    setStatus(task, TransferStatus::Cancelled);

    FLUX_LOG_INFO("Cancelled task {}", id);
    m_events.emit("download_cancelled", {{"download_id", id}});
    return true;
}

bool TransferEngine::deleteTask(const std::string& id, bool deleteFiles) {
    auto task = findTask(id);
    if (!task) return false;

    std::lock_guard<std::mutex> control(task->control);

    stopWorker(task);

    if (deleteFiles) {
        ResumableWriter(task->destination, task->totalSize).cleanup();
        if (FileUtils::fileExists(task->destination) && !FileUtils::deleteFile(task->destination)) {
            FLUX_LOG_DEBUG("Could not remove {}", task->destination.string());
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.erase(id);
    }
    notifyStatusChanged();

    FLUX_LOG_INFO("Deleted task {} (files: {})", id, deleteFiles);
    m_events.emit("download_deleted", {
        {"download_id", id},
        {"filename", task->filename},
        {"delete_files", deleteFiles}
    });
    return true;
}

std::optional<TaskSnapshot> TransferEngine::getTask(const std::string& id) const {
    auto task = findTask(id);
    if (!task) return std::nullopt;
    return task->snapshot();
}

std::vector<TaskSnapshot> TransferEngine::listByStatus(std::optional<TransferStatus> status) const {
    std::vector<std::shared_ptr<TransferTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks.reserve(m_tasks.size());
        for (const auto& [id, task] : m_tasks) {
            tasks.push_back(task);
        }
    }

    std::vector<TaskSnapshot> result;
    for (const auto& task : tasks) {
        TaskSnapshot snapshot = task->snapshot();
        if (!status || snapshot.status == *status) {
            result.push_back(std::move(snapshot));
        }
    }

    // Creation order
    std::sort(result.begin(), result.end(), [](const TaskSnapshot& a, const TaskSnapshot& b) {
        return a.metrics.startTime() < b.metrics.startTime();
    });
    return result;
}

bool TransferEngine::waitForTask(const std::string& id, std::chrono::milliseconds timeout) const {
    auto task = findTask(id);
    if (!task) return false;

    auto finished = [&task] {
        std::lock_guard<std::mutex> lock(task->mutex);
        return !isInProgress(task->status);
    };

    std::unique_lock<std::mutex> lock(m_statusMutex);
    m_statusChanged.wait_for(lock, timeout, [&] {
        return finished() || !findTask(id);
    });
    return finished();
}

// -- Events --

SubscriptionPtr TransferEngine::subscribe(EventHandler handler) {
    return m_events.subscribe(std::move(handler));
}

void TransferEngine::unsubscribe(const SubscriptionPtr& subscription) {
    m_events.unsubscribe(subscription);
}

// -- Decisions --

json TransferEngine::exportDecisions() const {
    return m_decisions.exportAll();
}

bool TransferEngine::exportDecisionsToFile(const std::filesystem::path& path) const {
    if (!utils::JsonUtils::writeFile(path, exportDecisions(), 2)) {
        FLUX_LOG_ERROR("Cannot export decisions to {}", path.string());
        return false;
    }
    return true;
}

std::vector<Decision> TransferEngine::recentDecisions(const std::string& id, size_t limit) const {
    return m_decisions.recent(id, limit);
}

// -- Scheduling helpers --

std::vector<ChunkRange> TransferEngine::planBatch(const ChunkMap& completed,
                                                  uint64_t totalSize,
                                                  uint64_t chunkSize,
                                                  uint32_t maxEntries) {
    std::vector<ChunkRange> batch;
    if (chunkSize == 0) return batch;

    uint64_t cursor = 0;
    while (cursor < totalSize && batch.size() < maxEntries) {
        auto next = completed.upper_bound(cursor);

        // Inside a completed range: jump to its end
        if (next != completed.begin()) {
            auto previous = std::prev(next);
            uint64_t previousEnd = previous->first + previous->second;
            if (previousEnd > cursor) {
                cursor = previousEnd;
                continue;
            }
        }

        uint64_t end = std::min(cursor + chunkSize, totalSize);
        if (next != completed.end()) {
            end = std::min(end, next->first);
        }

        batch.push_back({cursor, end - cursor});
        cursor = end;
    }

    return batch;
}

uint64_t TransferEngine::coveredBytes(const ChunkMap& completed, uint64_t totalSize) {
    uint64_t covered = 0;
    uint64_t reached = 0;

    for (const auto& [offset, length] : completed) {
        uint64_t start = std::max(offset, reached);
        uint64_t end = std::min(offset + length, totalSize);
        if (end > start) {
            covered += end - start;
            reached = end;
        }
    }
    return covered;
}

uint64_t TransferEngine::initialChunkSize(uint64_t totalSize) {
    if (totalSize > kGiB) return 16 * kMiB;
    if (totalSize > 100 * kMiB) return 8 * kMiB;
    return kMiB;
}

// -- Worker --

std::shared_ptr<TransferTask> TransferEngine::findTask(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    return it != m_tasks.end() ? it->second : nullptr;
}

void TransferEngine::runWorker(const std::shared_ptr<TransferTask>& task) {
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        token = task->token;
    }

    // Precedes every progress event of this run
    FLUX_LOG_INFO("Started task {}", task->id);
    m_events.emit("download_started", {{"download_id", task->id}});

    const auto& policy = m_decisions.policy();
    ResumableWriter writer(task->destination, task->totalSize);
    ChunkMap chunks;
    bool prepared = false;

    try {
        ResumeState state = writer.initialize();
        prepared = true;
        chunks = std::move(state.chunks);

        {
            std::lock_guard<std::mutex> lock(task->mutex);
            task->metrics.restoreProgress(state.bytesDownloaded);
            task->chunkSize = std::clamp(state.chunkSize.value_or(initialChunkSize(task->totalSize)),
                                         policy.minChunkSize, policy.maxChunkSize);
            if (state.connections) {
                task->connections = std::clamp(*state.connections, policy.minConnections, policy.maxConnections);
            }
        }

        if (task->supportsRanges && task->totalSize > 0) {
            downloadMultipart(task, writer, chunks, token);
        } else {
            downloadWhole(task, writer, token);
        }

        writer.finalize();
        setStatus(task, TransferStatus::Completed);

        FLUX_LOG_INFO("Completed task {}: {}", task->id, task->destination.string());
        m_events.emit("download_completed", {
            {"download_id", task->id},
            {"filepath", task->destination.string()},
            {"size", task->totalSize}
        });

    } catch (const TransferCancelled&) {
        if (prepared) {
            uint64_t bytes = 0;
            uint64_t chunkSize = 0;
            uint32_t connections = 0;
            {
                std::lock_guard<std::mutex> lock(task->mutex);
                bytes = task->metrics.bytesDownloaded();
                chunkSize = task->chunkSize;
                connections = task->connections;
            }
            try {
                writer.saveMetadata(bytes, chunks, chunkSize, connections);
            } catch (const std::exception& e) {
                FLUX_LOG_WARN("Cannot save resume state of task {}: {}", task->id, e.what());
            }
        }
        FLUX_LOG_DEBUG("Task {} interrupted", task->id);

    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            task->error = e.what();
        }
        setStatus(task, TransferStatus::Failed);

        FLUX_LOG_ERROR("Task {} failed: {}", task->id, e.what());
        m_events.emit("download_failed", {
            {"download_id", task->id},
            {"error", e.what()}
        });
    }
}

void TransferEngine::downloadMultipart(const std::shared_ptr<TransferTask>& task,
                                       ResumableWriter& writer,
                                       ChunkMap& chunks,
                                       const CancellationToken& token) {
    while (true) {
        token.throwIfCancelled();

        Metrics metrics;
        uint64_t chunkSize = 0;
        uint32_t connections = 0;
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            metrics = task->metrics;
            chunkSize = task->chunkSize;
            connections = task->connections;
        }

        for (const auto& decision : m_decisions.analyze(task->id, metrics, chunkSize, connections, true)) {
            applyDecision(task, decision);
        }

        {
            std::lock_guard<std::mutex> lock(task->mutex);
            chunkSize = task->chunkSize;
            connections = task->connections;
        }

        auto batch = planBatch(chunks, task->totalSize, chunkSize, connections);
        if (batch.empty()) {
            break;
        }

        std::vector<std::future<void>> fetches;
        fetches.reserve(batch.size());
        try {
            for (const auto& range : batch) {
                fetches.push_back(m_fetchPool->submit([this, &task, &writer, &chunks, range, &token] {
                    fetchChunk(task, writer, chunks, range, token);
                }));
            }
        } catch (const std::exception&) {
            token.cancel();
            for (auto& fetch : fetches) {
                fetch.wait();
            }
            throw;
        }

        // Wait for the whole round; the first real failure wins over cancellations
        std::exception_ptr failure;
        bool cancelled = false;
        for (auto& fetch : fetches) {
            try {
                fetch.get();
            } catch (const TransferCancelled&) {
                cancelled = true;
            } catch (const std::exception&) {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }

        if (failure) {
            std::rethrow_exception(failure);
        }
        if (cancelled) {
            throw TransferCancelled();
        }

        uint64_t bytes = 0;
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            bytes = task->metrics.bytesDownloaded();
            chunkSize = task->chunkSize;
            connections = task->connections;
        }
        writer.saveMetadata(bytes, chunks, chunkSize, connections);

        emitProgress(task, false);
    }

    uint64_t covered = coveredBytes(chunks, task->totalSize);
    if (covered != task->totalSize) {
        throw TransferError("Incomplete transfer: " + std::to_string(covered) + " of "
                            + std::to_string(task->totalSize) + " bytes", ErrorKind::Other);
    }
}

void TransferEngine::fetchChunk(const std::shared_ptr<TransferTask>& task,
                                ResumableWriter& writer,
                                ChunkMap& chunks,
                                ChunkRange range,
                                const CancellationToken& token) {
    try {
        auto result = m_client->fetchRange(task->url, range.offset, range.offset + range.length - 1, token);
        if (result.data.size() != range.length) {
            throw TransferError("Expected " + std::to_string(range.length) + " bytes at offset "
                                + std::to_string(range.offset) + ", received "
                                + std::to_string(result.data.size()), ErrorKind::Other);
        }

        writer.writeChunk(range.offset, result.data);

        std::lock_guard<std::mutex> lock(task->mutex);
        chunks[range.offset] = range.length;
        task->metrics.update(task->metrics.bytesDownloaded() + range.length, result.rttMs);

    } catch (const TransferCancelled&) {
        throw;
    } catch (const std::exception&) {
        {
            std::lock_guard<std::mutex> lock(task->mutex);
            task->metrics.incrementErrors();
            if (TransferClient::classifyError(std::current_exception()) == ErrorKind::Network) {
                task->metrics.incrementRetries();
            }
        }
        // Fail fast: abort the rest of the round
        token.cancel();
        throw;
    }
}

void TransferEngine::downloadWhole(const std::shared_ptr<TransferTask>& task,
                                   ResumableWriter& writer,
                                   const CancellationToken& token) {
    auto result = m_client->fetchWhole(task->url, token);
    if (task->totalSize > 0 && result.data.size() != task->totalSize) {
        throw TransferError("Expected " + std::to_string(task->totalSize) + " bytes, received "
                            + std::to_string(result.data.size()), ErrorKind::Other);
    }

    writer.writeChunk(0, result.data);

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->metrics.update(result.data.size(), result.rttMs);
    }

    emitProgress(task, true);
}

void TransferEngine::applyDecision(const std::shared_ptr<TransferTask>& task, const Decision& decision) {
    const auto& policy = m_decisions.policy();

    {
        std::lock_guard<std::mutex> lock(task->mutex);
        switch (decision.type) {
            case DecisionType::IncreaseChunkSize:
            case DecisionType::DecreaseChunkSize:
                task->chunkSize = std::clamp(decision.newValue, policy.minChunkSize, policy.maxChunkSize);
                break;
            case DecisionType::IncreaseConnections:
            case DecisionType::DecreaseConnections:
                task->connections = static_cast<uint32_t>(std::clamp<uint64_t>(
                    decision.newValue, policy.minConnections, policy.maxConnections));
                break;
        }
    }

    FLUX_LOG_INFO("Task {}: {} {} -> {} ({})", task->id, toString(decision.type),
                  decision.oldValue, decision.newValue, decision.reason);

    m_events.emit("adaptive_decision", {
        {"download_id", task->id},
        {"decision", decision.toJson()}
    });
}

void TransferEngine::stopWorker(const std::shared_ptr<TransferTask>& task) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->token.cancel();
        worker = std::move(task->worker);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void TransferEngine::setStatus(const std::shared_ptr<TransferTask>& task, TransferStatus status) {
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->status = status;
    }
    notifyStatusChanged();
}

void TransferEngine::notifyStatusChanged() {
    {
        // Waiters check their predicate under this mutex
        std::lock_guard<std::mutex> lock(m_statusMutex);
    }
    m_statusChanged.notify_all();
}

void TransferEngine::emitProgress(const std::shared_ptr<TransferTask>& task, bool finished) {
    json payload;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        payload = {
            {"download_id", task->id},
            {"bytes_downloaded", task->metrics.bytesDownloaded()},
            {"total_size", task->totalSize},
            {"speed", task->metrics.currentSpeed()},
            {"eta", finished ? 0.0 : task->metrics.etaSeconds()}
        };
    }
    m_events.emit("download_progress", payload);
}

} // namespace flux::core::downloader
