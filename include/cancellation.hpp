/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation token for long-running operations
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef AUTHCORE_CANCELLATION_HPP
#define AUTHCORE_CANCELLATION_HPP

#include "auth_error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace authcore {

/**
 * @class CancellationToken
 * @brief Flag checked at loop points of backend fetches, lock waits and sleeps
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    /** @brief Re-arm the token so the owner can be started again */
    void reset() {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_ = false;
    }

    bool isCancelled() const { return cancelled_; }

    void throwIfCancelled() const {
        if (cancelled_) throw CancelledError();
    }

    /**
     * @brief Sleep for up to @p duration, waking early on cancellation
     * @return true if the token was cancelled
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mtx_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
};

} // namespace authcore

#endif // AUTHCORE_CANCELLATION_HPP
