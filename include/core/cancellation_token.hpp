#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief One-way stop request shared between a caller and a running job
 *
 * cancel() may be called from any thread (not from a signal handler). Waiters in
 * waitFor() wake up immediately.
 */
class CancellationToken
{
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Sleep for up to timeout
     * @return true if cancelled before or during the wait
     */
    bool waitFor(std::chrono::milliseconds timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]
                            { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
