#pragma once

/**
 * TransferErrors.hpp
 *
 * Exception types raised by the transfer client, the resumable writer and
 * the transfer engine.
 */

#include <stdexcept>
#include <string>

namespace flux::core::downloader {

/**
 * Coarse error class used to count retries separately from errors
 */
enum class ErrorKind {
    Network,   // timeout, connection failure, 5xx
    Other
};

class TransferError : public std::runtime_error {
public:
    TransferError(const std::string& message, ErrorKind kind)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * Server answered with a status the caller does not accept
 */
class HttpStatusError : public TransferError {
public:
    HttpStatusError(long status, const std::string& url)
        : TransferError("HTTP " + std::to_string(status) + " for " + url,
                        (status >= 500 && status < 600) ? ErrorKind::Network : ErrorKind::Other)
        , m_status(status) {}

    long status() const { return m_status; }

private:
    long m_status;
};

/**
 * Neither the HEAD probe nor the ranged GET fallback produced an answer
 */
class ProbeError : public TransferError {
public:
    explicit ProbeError(const std::string& message)
        : TransferError(message, ErrorKind::Network) {}
};

/**
 * Filesystem failure on the partial file or its metadata
 */
class WriterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace flux::core::downloader
