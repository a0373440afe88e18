/**
 * ResumableWriter.cpp
 *
 * Partial file management and resume metadata.
 */

#include "ResumableWriter.hpp"
#include "TransferErrors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace flux::core::downloader {

using json = nlohmann::json;
using utils::FileUtils;
using utils::JsonUtils;

ResumableWriter::ResumableWriter(fs::path destination, uint64_t totalSize)
    : m_destination(std::move(destination))
    , m_partialPath(partialPathFor(m_destination))
    , m_metadataPath(metadataPathFor(m_destination))
    , m_totalSize(totalSize) {
}

ResumableWriter::~ResumableWriter() {
    std::lock_guard<std::mutex> lock(m_mutex);
    closePartial();
}

fs::path ResumableWriter::partialPathFor(const fs::path& destination) {
    fs::path path = destination;
    path += ".partial";
    return path;
}

fs::path ResumableWriter::metadataPathFor(const fs::path& destination) {
    fs::path path = destination;
    path += ".meta";
    return path;
}

ResumeState ResumableWriter::initialize() {
    std::lock_guard<std::mutex> lock(m_mutex);

    closePartial();
    m_finalized = false;

    if (FileUtils::fileExists(m_partialPath) && FileUtils::fileExists(m_metadataPath)) {
        if (auto state = readMetadata()) {
            openPartial();
            FLUX_LOG_INFO("Resuming {} at {}/{} bytes ({} chunks)",
                          m_destination.string(), state->bytesDownloaded, m_totalSize, state->chunks.size());
            return *state;
        }
        FLUX_LOG_WARN("Discarding unusable resume metadata for {}", m_destination.string());
    }

    startFresh();
    return {};
}

std::optional<ResumeState> ResumableWriter::readMetadata() const {
    auto meta = JsonUtils::parseFile(m_metadataPath);
    if (!meta || !meta->is_object()) {
        return std::nullopt;
    }

    int64_t recordedTotal = JsonUtils::getLong(*meta, "total_size", -1);
    if (recordedTotal < 0 || static_cast<uint64_t>(recordedTotal) != m_totalSize) {
        FLUX_LOG_DEBUG("Metadata size {} does not match {}", recordedTotal, m_totalSize);
        return std::nullopt;
    }

    int64_t bytes = JsonUtils::getLong(*meta, "bytes_downloaded", -1);
    if (bytes < 0 || (m_totalSize > 0 && static_cast<uint64_t>(bytes) > m_totalSize)) {
        return std::nullopt;
    }

    auto chunksIt = meta->find("chunks");
    if (chunksIt == meta->end() || !chunksIt->is_object()) {
        return std::nullopt;
    }

    ResumeState state;
    state.bytesDownloaded = static_cast<uint64_t>(bytes);

    for (const auto& [key, value] : chunksIt->items()) {
        auto offset = utils::StringUtils::parseUnsigned(key);
        if (!offset || !value.is_number_unsigned()) {
            return std::nullopt;
        }
        uint64_t length = value.get<uint64_t>();
        if (length == 0 || *offset + length < *offset || *offset + length > m_totalSize) {
            return std::nullopt;
        }
        state.chunks[*offset] = length;
    }

    int64_t chunkSize = JsonUtils::getLong(*meta, "chunk_size", 0);
    if (chunkSize > 0) {
        state.chunkSize = static_cast<uint64_t>(chunkSize);
    }
    int64_t connections = JsonUtils::getLong(*meta, "connections", 0);
    if (connections > 0) {
        state.connections = static_cast<uint32_t>(connections);
    }

    return state;
}

void ResumableWriter::startFresh() {
    FileUtils::deleteFile(m_partialPath);
    FileUtils::deleteFile(m_metadataPath);

    if (m_destination.has_parent_path() && !FileUtils::createDirectories(m_destination.parent_path())) {
        throw WriterError("Cannot create directory " + m_destination.parent_path().string());
    }

    {
        std::ofstream file(m_partialPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw WriterError("Cannot create " + m_partialPath.string());
        }

        // One byte at the last offset sizes the file (sparse where supported)
        if (m_totalSize > 0) {
            file.seekp(static_cast<std::streamoff>(m_totalSize - 1));
            file.put('\0');
        }
        if (!file) {
            throw WriterError("Cannot pre-allocate " + m_partialPath.string());
        }
    }

    openPartial();
}

void ResumableWriter::openPartial() {
    m_file.open(m_partialPath, std::ios::binary | std::ios::in | std::ios::out);
    if (!m_file.is_open()) {
        throw WriterError("Cannot open " + m_partialPath.string());
    }
}

void ResumableWriter::closePartial() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

void ResumableWriter::writeChunk(uint64_t offset, const std::string& data) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_finalized || !m_file.is_open()) {
        throw WriterError("Writer for " + m_destination.string() + " is not open");
    }

    m_file.seekp(static_cast<std::streamoff>(offset));
    m_file.write(data.data(), static_cast<std::streamsize>(data.size()));
    m_file.flush();

    if (!m_file) {
        m_file.clear();
        throw WriterError("Write of " + std::to_string(data.size()) + " bytes at offset "
                          + std::to_string(offset) + " failed for " + m_partialPath.string());
    }
}

void ResumableWriter::saveMetadata(uint64_t bytesDownloaded, const ChunkMap& chunks,
                                   uint64_t chunkSize, uint32_t connections) {
    json chunkJson = json::object();
    for (const auto& [offset, length] : chunks) {
        chunkJson[std::to_string(offset)] = length;
    }

    json meta = {
        {"bytes_downloaded", bytesDownloaded},
        {"total_size", m_totalSize},
        {"chunks", chunkJson}
    };
    if (chunkSize > 0) meta["chunk_size"] = chunkSize;
    if (connections > 0) meta["connections"] = connections;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
    }

    if (!JsonUtils::writeFileAtomic(m_metadataPath, meta)) {
        throw WriterError("Cannot write " + m_metadataPath.string());
    }
}

void ResumableWriter::finalize() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_finalized) {
        return;
    }

    closePartial();

    if (!FileUtils::replaceFile(m_partialPath, m_destination)) {
        throw WriterError("Cannot move " + m_partialPath.string() + " to " + m_destination.string());
    }

    FileUtils::deleteFile(m_metadataPath);
    m_finalized = true;
}

void ResumableWriter::cleanup() {
    std::lock_guard<std::mutex> lock(m_mutex);

    closePartial();

    fs::path tmpPath = m_metadataPath;
    tmpPath += ".tmp";

    for (const auto& path : {m_partialPath, m_metadataPath, tmpPath}) {
        if (FileUtils::fileExists(path) && !FileUtils::deleteFile(path)) {
            FLUX_LOG_DEBUG("Could not remove {}", path.string());
        }
    }
}

} // namespace flux::core::downloader
