/**
 * TransferClient.cpp
 *
 * Probe, ranged fetch with retry, whole-body fetch.
 */

#include "TransferClient.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <optional>
#include <random>
#include <stdexcept>

namespace flux::core::downloader {

using utils::HttpMethod;
using utils::HttpResponse;
using utils::StringUtils;

namespace {

std::string describeFailure(const HttpResponse& response) {
    if (response.timedOut) {
        return "timed out";
    }
    if (response.hasTransportError()) {
        return response.error.empty() ? "connection failed" : response.error;
    }
    return "HTTP " + std::to_string(response.statusCode);
}

/**
 * Turn a failed response into the matching exception
 */
[[noreturn]] void throwFailure(const HttpResponse& response, const std::string& url) {
    if (response.aborted) {
        throw TransferCancelled();
    }
    if (response.hasTransportError()) {
        throw TransferError("Request to " + url + " failed: " + describeFailure(response),
                            ErrorKind::Network);
    }
    throw HttpStatusError(response.statusCode, url);
}

/**
 * Total size from "bytes 0-0/12345"; nullopt for "*" or malformed values
 */
std::optional<uint64_t> parseContentRangeTotal(const std::string& contentRange) {
    auto slash = contentRange.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return StringUtils::parseUnsigned(StringUtils::trim(contentRange.substr(slash + 1)));
}

} // namespace

ClientOptions ClientOptions::fromConfig(const Config& config) {
    ClientOptions options;
    options.http.timeoutSeconds = config.get<int>("client.timeoutSeconds", options.http.timeoutSeconds);
    options.http.connectTimeoutSeconds =
        config.get<int>("client.connectTimeoutSeconds", options.http.connectTimeoutSeconds);
    options.http.verifySSL = config.get<bool>("client.verifySsl", options.http.verifySSL);
    options.http.userAgent = config.get<std::string>("client.userAgent", options.http.userAgent);
    options.http.maxPooledSessions =
        config.get<size_t>("client.maxPooledSessions", options.http.maxPooledSessions);
    options.probeTimeoutSeconds = config.get<int>("client.probeTimeoutSeconds", options.probeTimeoutSeconds);
    options.maxRetries = std::max(0, config.get<int>("client.maxRetries", options.maxRetries));
    options.backoffBase = std::chrono::milliseconds(
        config.get<int64_t>("client.backoffBaseMillis", options.backoffBase.count()));
    return options;
}

TransferClient::TransferClient(std::shared_ptr<utils::HttpTransport> transport, ClientOptions options)
    : m_transport(std::move(transport))
    , m_options(std::move(options)) {
    if (!m_transport) {
        throw std::invalid_argument("TransferClient requires a transport");
    }
}

TransferClient::~TransferClient() = default;

HttpResponse TransferClient::send(HttpMethod method,
                                  const std::string& url,
                                  std::map<std::string, std::string> headers,
                                  int timeoutSeconds,
                                  const CancellationToken& token,
                                  double& rttMs,
                                  size_t maxBodyBytes) {
    utils::HttpRequest request;
    request.method = method;
    request.url = url;
    request.headers = std::move(headers);
    request.timeoutSeconds = timeoutSeconds;
    request.maxBodyBytes = maxBodyBytes;

    auto started = std::chrono::steady_clock::now();
    HttpResponse response = m_transport->perform(request, token);
    rttMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    return response;
}

ProbeResult TransferClient::probe(const std::string& url, const CancellationToken& token) {
    double rttMs = 0.0;

    auto head = send(HttpMethod::Head, url, {}, m_options.probeTimeoutSeconds, token, rttMs);
    if (head.aborted) {
        throw TransferCancelled();
    }

    if (head.isSuccess()) {
        ProbeResult result;
        result.size = StringUtils::parseUnsigned(head.header("Content-Length")).value_or(0);

        std::string acceptRanges = StringUtils::toLower(StringUtils::trim(head.header("Accept-Ranges")));
        result.supportsRanges = !acceptRanges.empty() && acceptRanges != "none";
        result.filename = extractFilename(head.header("Content-Disposition"), url);

        FLUX_LOG_DEBUG("HEAD {}: size={} ranges={} ({:.0f} ms)", url, result.size, result.supportsRanges, rttMs);
        return result;
    }

    FLUX_LOG_DEBUG("HEAD {} failed ({}), probing with a ranged GET", url, describeFailure(head));

    // Only the headers matter; a server ignoring Range must not stream the whole file
    auto get = send(HttpMethod::Get, url, {{"Range", "bytes=0-0"}},
                    m_options.probeTimeoutSeconds, token, rttMs, 1);
    if (get.aborted) {
        throw TransferCancelled();
    }
    if (!get.isSuccess()) {
        throw ProbeError("Cannot probe " + url + ": HEAD " + describeFailure(head)
                         + ", GET " + describeFailure(get));
    }

    ProbeResult result;
    std::string contentRange = get.header("Content-Range");
    if (!contentRange.empty()) {
        // The ranged answer's total is authoritative
        result.size = parseContentRangeTotal(contentRange).value_or(0);
        result.supportsRanges = true;
    } else {
        result.size = StringUtils::parseUnsigned(get.header("Content-Length")).value_or(0);
        result.supportsRanges = false;
    }
    result.filename = extractFilename(get.header("Content-Disposition"), url);

    FLUX_LOG_DEBUG("GET probe {}: size={} ranges={}", url, result.size, result.supportsRanges);
    return result;
}

FetchResult TransferClient::fetchRange(const std::string& url, uint64_t start, uint64_t end,
                                       const CancellationToken& token) {
    const std::string range = "bytes=" + std::to_string(start) + "-" + std::to_string(end);

    for (int attempt = 0; ; ++attempt) {
        token.throwIfCancelled();

        FetchResult result;
        auto response = send(HttpMethod::Get, url, {{"Range", range}}, 0, token, result.rttMs);
        if (response.aborted) {
            throw TransferCancelled();
        }

        if (response.statusCode == 200 || response.statusCode == 206) {
            result.data = std::move(response.body);
            return result;
        }

        bool retryable = response.hasTransportError() || response.isServerError();
        if (!retryable || attempt >= m_options.maxRetries) {
            if (retryable) {
                FLUX_LOG_WARN("Range {} of {} failed after {} retries: {}",
                              range, url, m_options.maxRetries, describeFailure(response));
            }
            throwFailure(response, url);
        }

        auto delay = backoffDelay(attempt);
        FLUX_LOG_WARN("Range {} of {} failed ({}), retry {}/{} in {} ms",
                      range, url, describeFailure(response), attempt + 1, m_options.maxRetries, delay.count());

        if (token.waitFor(delay)) {
            throw TransferCancelled();
        }
    }
}

FetchResult TransferClient::fetchWhole(const std::string& url, const CancellationToken& token) {
    token.throwIfCancelled();

    FetchResult result;
    auto response = send(HttpMethod::Get, url, {}, 0, token, result.rttMs);
    if (!response.isSuccess()) {
        throwFailure(response, url);
    }

    result.data = std::move(response.body);
    return result;
}

std::chrono::milliseconds TransferClient::backoffDelay(int attempt) const {
    thread_local std::mt19937_64 generator{std::random_device{}()};

    auto base = m_options.backoffBase.count();
    int64_t jitter = 0;
    if (base > 0) {
        std::uniform_int_distribution<int64_t> distribution(0, base - 1);
        jitter = distribution(generator);
    }
    return std::chrono::milliseconds((base << attempt) + jitter);
}

ErrorKind TransferClient::classifyError(std::exception_ptr error) {
    if (!error) {
        return ErrorKind::Other;
    }

    try {
        std::rethrow_exception(error);
    } catch (const TransferError& e) {
        return e.kind();
    } catch (const std::exception&) {
        return ErrorKind::Other;
    }
}

std::string TransferClient::extractFilename(const std::string& contentDisposition, const std::string& url) {
    auto pos = contentDisposition.find("filename=");
    if (pos != std::string::npos) {
        std::string value = contentDisposition.substr(pos + 9);
        auto semicolon = value.find(';');
        if (semicolon != std::string::npos) {
            value = value.substr(0, semicolon);
        }
        std::string name = StringUtils::sanitizeFileName(value);
        if (!name.empty()) {
            return name;
        }
    }

    // Path of the URL without scheme, authority, query and fragment
    std::string path = url;
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string{} : path.substr(slash);
    }
    auto suffix = path.find_first_of("?#");
    if (suffix != std::string::npos) {
        path = path.substr(0, suffix);
    }

    std::string name = StringUtils::sanitizeFileName(path);
    return name.empty() ? kFallbackFilename : name;
}

void TransferClient::close() {
    m_transport->close();
}

} // namespace flux::core::downloader
