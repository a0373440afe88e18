#pragma once

/**
 * TransferTask.hpp
 *
 * Represents a single transfer and its lifecycle state.
 */

#include "Metrics.hpp"
#include "../CancellationToken.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace flux::core::downloader {

/**
 * Transfer status
 *
 * QUEUED -> ACTIVE -> {PAUSED, COMPLETED, FAILED, CANCELLED}, PAUSED -> ACTIVE
 */
enum class TransferStatus {
    Queued,
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled
};

inline const char* toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Queued:    return "queued";
        case TransferStatus::Active:    return "active";
        case TransferStatus::Paused:    return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed:    return "failed";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline std::optional<TransferStatus> parseTransferStatus(const std::string& name) {
    for (auto status : {TransferStatus::Queued, TransferStatus::Active, TransferStatus::Paused,
                        TransferStatus::Completed, TransferStatus::Failed, TransferStatus::Cancelled}) {
        if (name == toString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

inline bool isInProgress(TransferStatus status) {
    return status == TransferStatus::Queued || status == TransferStatus::Active;
}

/**
 * Read-only copy of a task, handed out by the engine
 */
struct TaskSnapshot {
    std::string id;
    std::string url;
    std::filesystem::path destination;
    std::string filename;
    uint64_t totalSize{0};
    bool supportsRanges{false};

    TransferStatus status{TransferStatus::Queued};
    uint64_t chunkSize{0};
    uint32_t connections{0};
    std::string error;
    Metrics metrics;
};

/**
 * TransferTask - one requested download, owned by the engine registry
 *
 * Identity fields are fixed at creation. Everything below `mutex` is
 * guarded by it; the worker thread and the public API both go through it.
 */
struct TransferTask {
    TransferTask(std::string id_, std::string url_, std::filesystem::path destination_,
                 std::string filename_, uint64_t totalSize_, bool supportsRanges_)
        : id(std::move(id_))
        , url(std::move(url_))
        , destination(std::move(destination_))
        , filename(std::move(filename_))
        , totalSize(totalSize_)
        , supportsRanges(supportsRanges_)
        , metrics(totalSize_) {}

    // Disable copy
    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    const std::string id;
    const std::string url;
    const std::filesystem::path destination;
    const std::string filename;
    const uint64_t totalSize;
    const bool supportsRanges;

    mutable std::mutex mutex;
    TransferStatus status{TransferStatus::Queued};
    uint64_t chunkSize{kMiB};
    uint32_t connections{1};
    std::string error;
    Metrics metrics;

    // Held for the whole of a start, pause, cancel or delete, worker join included
    std::mutex control;

    // Current run
    CancellationToken token;
    std::thread worker;

    TaskSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        TaskSnapshot copy;
        copy.id = id;
        copy.url = url;
        copy.destination = destination;
        copy.filename = filename;
        copy.totalSize = totalSize;
        copy.supportsRanges = supportsRanges;
        copy.status = status;
        copy.chunkSize = chunkSize;
        copy.connections = connections;
        copy.error = error;
        copy.metrics = metrics;
        return copy;
    }
};

} // namespace flux::core::downloader
