// Flux - HTTP Client
// Pooled keep-alive HTTP transport using cpr (libcurl)

#pragma once

#include "../core/CancellationToken.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace flux::utils {

/**
 * @brief HTTP response structure
 *
 * Transport failures (DNS, connect, reset, timeout) are reported through
 * `error` with `statusCode == 0`; they are never thrown.
 */
struct HttpResponse {
    long statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;   // names lower-cased
    std::string error;
    bool timedOut{false};
    bool aborted{false};                          // cancelled through the token
    double elapsedSeconds{0.0};

    bool hasTransportError() const { return statusCode == 0; }
    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
    bool isServerError() const { return statusCode >= 500 && statusCode < 600; }

    /**
     * Case-insensitive header lookup
     * @return Header value, or empty string when absent
     */
    std::string header(const std::string& name) const;
};

enum class HttpMethod {
    Head,
    Get
};

/**
 * @brief One request as issued by the transfer client
 */
struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::map<std::string, std::string> headers;
    int timeoutSeconds{0};                        // 0 = transport default
    size_t maxBodyBytes{0};                       // 0 = whole body; otherwise stop reading once reached
};

/**
 * @brief Transport-wide defaults
 */
struct HttpOptions {
    int timeoutSeconds{30};
    int connectTimeoutSeconds{10};
    bool followRedirects{true};
    int maxRedirects{10};
    bool verifySSL{false};                        // off for arbitrary hosts; callers may enable
    std::string userAgent{"Flux/1.0.0"};
    size_t maxPooledSessions{32};
};

/**
 * @brief Seam between the transfer client and the network
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Perform a request. Must be safe to call from many threads at once.
     * The request is abandoned as soon as possible once `token` is cancelled.
     */
    virtual HttpResponse perform(const HttpRequest& request,
                                 const core::CancellationToken& token) = 0;

    /**
     * Stop accepting requests and wait for in-flight ones to finish.
     * Idempotent.
     */
    virtual void close() = 0;
};

/**
 * @brief HTTP client with a keep-alive session pool
 *
 * Each request checks a cpr session out of the pool and returns it when
 * done, so the underlying curl handle (and its open connection) is reused
 * by the next request to the same host.
 */
class HttpClient final : public HttpTransport {
public:
    explicit HttpClient(HttpOptions options = {});
    ~HttpClient() override;

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse perform(const HttpRequest& request,
                         const core::CancellationToken& token) override;
    void close() override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Global CURL initialization (once per process)
 */
class CurlGlobalInit {
public:
    static void init();
};

} // namespace flux::utils
