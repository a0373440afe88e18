#pragma once

/**
 * CancellationToken.hpp
 *
 * Cooperative cancellation shared between a transfer worker, the range
 * fetches it launches and the public API thread that pauses or cancels it.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace flux::core {

/**
 * Thrown when a cancellation request is observed. Never counted as a
 * transfer failure.
 */
class TransferCancelled : public std::runtime_error {
public:
    TransferCancelled() : std::runtime_error("Transfer cancelled") {}
};

/**
 * CancellationToken - copyable handle to a shared cancellation flag
 *
 * Copies observe the same flag. A default-constructed token is never
 * cancelled unless cancel() is called on it or one of its copies.
 */
class CancellationToken {
public:
    CancellationToken() : m_state(std::make_shared<State>()) {}

    void cancel() const {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->cancelled = true;
        }
        m_state->condition.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->cancelled;
    }

    void throwIfCancelled() const {
        if (isCancelled()) {
            throw TransferCancelled();
        }
    }

    /**
     * Sleep for up to the given duration, waking early on cancellation.
     * @return true if the token was cancelled
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        return m_state->condition.wait_for(lock, duration, [this] {
            return m_state->cancelled;
        });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable condition;
        bool cancelled{false};
    };

    std::shared_ptr<State> m_state;
};

} // namespace flux::core
