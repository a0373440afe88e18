#pragma once

/**
 * TransferClient.hpp
 *
 * Range negotiation, ranged fetches with retry and whole-body fetches on
 * top of a pooled HTTP transport.
 */

#include "TransferErrors.hpp"
#include "../CancellationToken.hpp"
#include "../../utils/HttpClient.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <string>

namespace flux::core {
class Config;
}

namespace flux::core::downloader {

/**
 * What the server told us about a URL
 */
struct ProbeResult {
    uint64_t size{0};               // 0 when unknown
    bool supportsRanges{false};
    std::string filename;
};

/**
 * Body of a fetch and the time it took
 */
struct FetchResult {
    std::string data;
    double rttMs{0.0};
};

struct ClientOptions {
    utils::HttpOptions http;
    int probeTimeoutSeconds{5};
    int maxRetries{3};
    std::chrono::milliseconds backoffBase{1000};

    static ClientOptions fromConfig(const Config& config);
};

/**
 * TransferClient - HTTP protocol handling of a transfer
 *
 * Thread-safe; one instance is shared by every task of an engine.
 */
class TransferClient {
public:
    static constexpr const char* kFallbackFilename = "download";

    explicit TransferClient(std::shared_ptr<utils::HttpTransport> transport,
                            ClientOptions options = {});
    ~TransferClient();

    // Disable copy
    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    /**
     * Discover size, range support and filename.
     * HEAD first, then a `Range: bytes=0-0` GET if HEAD fails.
     * @throws ProbeError if neither request succeeds
     */
    ProbeResult probe(const std::string& url,
                      const CancellationToken& token = CancellationToken());

    /**
     * GET bytes [start, end] (inclusive). Timeouts, connection failures and
     * 5xx answers are retried with exponential backoff and jitter.
     * @throws HttpStatusError on a non-retryable status or TransferError once
     *         retries are exhausted; TransferCancelled when the token fires
     */
    FetchResult fetchRange(const std::string& url, uint64_t start, uint64_t end,
                           const CancellationToken& token = CancellationToken());

    /**
     * Plain GET of the whole body, no retry
     */
    FetchResult fetchWhole(const std::string& url,
                           const CancellationToken& token = CancellationToken());

    /**
     * Network (timeout, connection failure, 5xx) or anything else
     */
    static ErrorKind classifyError(std::exception_ptr error);

    /**
     * Filename from a Content-Disposition value, else the URL path tail,
     * else kFallbackFilename
     */
    static std::string extractFilename(const std::string& contentDisposition,
                                       const std::string& url);

    /**
     * Close the shared transport after in-flight requests drain. Idempotent.
     */
    void close();

    const ClientOptions& options() const { return m_options; }

private:
    utils::HttpResponse send(utils::HttpMethod method,
                             const std::string& url,
                             std::map<std::string, std::string> headers,
                             int timeoutSeconds,
                             const CancellationToken& token,
                             double& rttMs,
                             size_t maxBodyBytes = 0);

    std::chrono::milliseconds backoffDelay(int attempt) const;

    std::shared_ptr<utils::HttpTransport> m_transport;
    ClientOptions m_options;
};

} // namespace flux::core::downloader
