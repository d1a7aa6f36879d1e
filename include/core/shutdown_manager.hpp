#pragma once

#include "logging/logger.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Turns SIGINT/SIGTERM/SIGQUIT into an orderly stop of the current run
 *
 * The signal handler only writes the signal number into a self-pipe; a watcher thread
 * reads it and runs the registered stop callbacks outside signal context. A second
 * signal while stopping ends the process with exit code 130.
 */
class ShutdownManager
{
public:
    static constexpr int kForcedExitCode = 130;

    static ShutdownManager &getInstance();

    /**
     * @brief Install handlers and start the watcher thread
     * @throws std::system_error if the wake-up pipe cannot be created
     */
    void installSignalHandlers(const Logger &logger);

    /**
     * @brief Request a stop from code; callbacks run once, on the calling thread
     */
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    /**
     * @brief Register a stop callback; runs immediately if a stop was already requested
     */
    void onShutdown(std::function<void()> callback);

    bool isShutdownRequested() const noexcept { return requested_.load(); }

    void waitForShutdown();

    int getSignalNumber() const noexcept { return signal_number_.load(); }
    std::string getReason() const;

    /**
     * @brief Restore default handlers, stop the watcher and forget callbacks
     */
    void reset() noexcept;

private:
    ShutdownManager() : logger_(Logger::null()) {}
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void onSignal(int sig) noexcept;

    void watch();
    void stopWatcher() noexcept;
    void restoreDefaultHandlers() noexcept;

    std::atomic<bool> requested_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<int> signal_number_{0};
    std::string reason_;
    std::vector<std::function<void()>> callbacks_;
    mutable std::mutex mutex_;
    std::condition_variable requested_cv_;
    Logger logger_;

    std::thread watcher_;
    bool handlers_installed_ = false;

    // [0] read end for the watcher, [1] write end for the handler
    static int wake_pipe_[2];
};
