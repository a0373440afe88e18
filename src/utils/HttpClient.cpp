/**
 * HttpClient.cpp
 *
 * Pooled HTTP transport implemented on cpr sessions.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"
#include "../core/Logger.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

#include <algorithm>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace flux::utils {

// -- CurlGlobalInit --

void CurlGlobalInit::init() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

// -- HttpResponse --

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::toLower(name));
    return it != headers.end() ? it->second : std::string{};
}

// -- HttpClient::Impl --

struct HttpClient::Impl {
    HttpOptions options;

    mutable std::mutex mutex;
    std::condition_variable drained;
    std::vector<std::unique_ptr<cpr::Session>> idle;
    size_t checkedOut{0};
    bool closed{false};

    std::unique_ptr<cpr::Session> checkout() {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return nullptr;
        }

        ++checkedOut;
        if (!idle.empty()) {
            auto session = std::move(idle.back());
            idle.pop_back();
            return session;
        }

        auto session = std::make_unique<cpr::Session>();
        session->SetUserAgent(cpr::UserAgent{options.userAgent});
        session->SetVerifySsl(cpr::VerifySsl{options.verifySSL});
        session->SetConnectTimeout(cpr::ConnectTimeout{options.connectTimeoutSeconds * 1000});
        session->SetRedirect(cpr::Redirect{static_cast<long>(options.maxRedirects),
                                           options.followRedirects});
        return session;
    }

    void giveBack(std::unique_ptr<cpr::Session> session, bool reusable) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --checkedOut;
            if (reusable && !closed && idle.size() < options.maxPooledSessions) {
                idle.push_back(std::move(session));
            }
        }
        drained.notify_all();
    }
};

// -- HttpClient --

HttpClient::HttpClient(HttpOptions options) : m_impl(std::make_unique<Impl>()) {
    CurlGlobalInit::init();
    m_impl->options = std::move(options);
}

HttpClient::~HttpClient() {
    close();
}

HttpResponse HttpClient::perform(const HttpRequest& request, const core::CancellationToken& token) {
    HttpResponse result;

    auto session = m_impl->checkout();
    if (!session) {
        result.error = "HTTP client is closed";
        return result;
    }

    cpr::Header headers{{"Connection", "keep-alive"}};
    for (const auto& [key, value] : request.headers) headers[key] = value;

    int timeout = request.timeoutSeconds > 0 ? request.timeoutSeconds : m_impl->options.timeoutSeconds;
    if (timeout <= 0) timeout = 30;

    session->SetUrl(cpr::Url{request.url});
    session->SetHeader(headers);
    session->SetTimeout(cpr::Timeout{timeout * 1000});
    session->SetProgressCallback(cpr::ProgressCallback(
        [token](cpr::cpr_off_t /*downloadTotal*/, cpr::cpr_off_t /*downloadNow*/,
                cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                intptr_t /*userdata*/) -> bool {
            return !token.isCancelled();
        }));

    // A capped body is collected here; curl reports the early stop as a write error
    std::string capped;
    bool truncated = false;
    const bool limited = request.maxBodyBytes > 0 && request.method == HttpMethod::Get;
    if (limited) {
        const size_t limit = request.maxBodyBytes;
        session->SetWriteCallback(cpr::WriteCallback(
            [&capped, &truncated, limit](auto data, intptr_t /*userdata*/) -> bool {
                capped.append(data.data(), std::min(data.size(), limit - capped.size()));
                truncated = capped.size() >= limit;
                return !truncated;
            }));
    }

    cpr::Response response = request.method == HttpMethod::Head ? session->Head() : session->Get();

    // Sessions carrying a write callback are not reused
    m_impl->giveBack(std::move(session), !limited);

    if (truncated && response.status_code > 0 && !token.isCancelled()) {
        response.error = cpr::Error{};
    }

    result.statusCode = response.status_code;
    result.body = limited ? std::move(capped) : std::move(response.text);
    result.elapsedSeconds = response.elapsed;
    for (const auto& [key, value] : response.header) {
        result.headers[StringUtils::toLower(key)] = value;
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        result.statusCode = 0;
        result.error = response.error.message.empty() ? "transport error" : response.error.message;
        result.timedOut = response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        result.aborted = token.isCancelled();
    }

    return result;
}

void HttpClient::close() {
    std::unique_lock<std::mutex> lock(m_impl->mutex);
    if (m_impl->closed) {
        return;
    }

    m_impl->closed = true;
    if (m_impl->checkedOut > 0) {
        FLUX_LOG_DEBUG("Draining {} in-flight HTTP sessions", m_impl->checkedOut);
    }
    m_impl->drained.wait(lock, [this] { return m_impl->checkedOut == 0; });
    m_impl->idle.clear();
}

} // namespace flux::utils
