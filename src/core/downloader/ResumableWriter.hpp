#pragma once

/**
 * ResumableWriter.hpp
 *
 * Out-of-order chunk writes into a pre-allocated partial file, with a
 * sidecar chunk map for resuming after a pause or a restart.
 */

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace flux::core::downloader {

namespace fs = std::filesystem;

/**
 * Byte offset -> length of every range already written
 */
using ChunkMap = std::map<uint64_t, uint64_t>;

/**
 * State recovered by ResumableWriter::initialize()
 */
struct ResumeState {
    uint64_t bytesDownloaded{0};
    ChunkMap chunks;

    // Adaptive parameters in effect when the metadata was saved
    std::optional<uint64_t> chunkSize;
    std::optional<uint32_t> connections;

    bool resumed() const { return !chunks.empty() || bytesDownloaded > 0; }
};

/**
 * ResumableWriter - partial file and metadata of one destination
 *
 * Files:
 *   <dest>.partial  pre-allocated to the full size, written at arbitrary offsets
 *   <dest>.meta     {bytes_downloaded, total_size, chunks, chunk_size, connections}
 *
 * Writes and finalize() share one critical section because they share one
 * file handle. Errors are thrown as WriterError, except from cleanup(),
 * which is best-effort.
 */
class ResumableWriter {
public:
    ResumableWriter(fs::path destination, uint64_t totalSize);
    ~ResumableWriter();

    // Disable copy
    ResumableWriter(const ResumableWriter&) = delete;
    ResumableWriter& operator=(const ResumableWriter&) = delete;

    /**
     * Resume from compatible metadata, or start a fresh pre-allocated file.
     * Unreadable or mismatched metadata is discarded, never reported.
     */
    ResumeState initialize();

    /**
     * Write `data` at `offset` of the partial file
     */
    void writeChunk(uint64_t offset, const std::string& data);

    /**
     * Persist a resume snapshot. The sidecar is replaced atomically.
     * @param chunkSize Current chunk size, 0 to omit
     * @param connections Current connection count, 0 to omit
     */
    void saveMetadata(uint64_t bytesDownloaded, const ChunkMap& chunks,
                      uint64_t chunkSize = 0, uint32_t connections = 0);

    /**
     * Move the partial file over the destination and drop the metadata.
     * The writer accepts no further writes afterwards.
     */
    void finalize();

    /**
     * Remove the partial file and the metadata. Idempotent.
     */
    void cleanup();

    const fs::path& destination() const { return m_destination; }
    const fs::path& partialPath() const { return m_partialPath; }
    const fs::path& metadataPath() const { return m_metadataPath; }
    uint64_t totalSize() const { return m_totalSize; }

    static fs::path partialPathFor(const fs::path& destination);
    static fs::path metadataPathFor(const fs::path& destination);

private:
    std::optional<ResumeState> readMetadata() const;
    void startFresh();
    void openPartial();
    void closePartial();

    fs::path m_destination;
    fs::path m_partialPath;
    fs::path m_metadataPath;
    uint64_t m_totalSize;

    std::mutex m_mutex;
    std::fstream m_file;
    bool m_finalized{false};
};

} // namespace flux::core::downloader
