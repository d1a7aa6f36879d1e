#include "core/shutdown_manager.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

int ShutdownManager::wake_pipe_[2] = {-1, -1};

namespace
{
    constexpr int kHandledSignals[] = {SIGINT, SIGTERM, SIGQUIT};

    // Written by stopWatcher(); no real signal has number 0
    constexpr unsigned char kStopByte = 0;
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    reset();
    for (int &fd : wake_pipe_)
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }
}

void ShutdownManager::onSignal(int sig) noexcept
{
    const int saved_errno = errno;
    const unsigned char byte = static_cast<unsigned char>(sig);
    if (wake_pipe_[1] >= 0)
    {
        ssize_t ignored = write(wake_pipe_[1], &byte, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

void ShutdownManager::installSignalHandlers(const Logger &logger)
{
    std::lock_guard<std::mutex> lk(mutex_);
    logger_ = logger;

    if (wake_pipe_[0] < 0)
    {
        if (pipe(wake_pipe_) != 0)
        {
            throw std::system_error(errno, std::generic_category(), "Cannot create signal pipe");
        }
        for (int fd : wake_pipe_)
        {
            fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
    }

    if (!handlers_installed_)
    {
        struct sigaction action = {};
        action.sa_handler = &ShutdownManager::onSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        for (int sig : kHandledSignals)
        {
            sigaction(sig, &action, nullptr);
        }
        handlers_installed_ = true;
    }

    if (!watcher_.joinable())
    {
        watcher_ = std::thread(&ShutdownManager::watch, this);
    }
    logger_.debug("Signal handlers installed");
}

void ShutdownManager::watch()
{
    for (;;)
    {
        unsigned char byte = kStopByte;
        ssize_t n = read(wake_pipe_[0], &byte, 1);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n <= 0 || byte == kStopByte)
        {
            return;
        }

        if (requested_.load())
        {
            logger_.warn("Second interrupt, exiting immediately");
            logger_.flush();
            std::_Exit(kForcedExitCode);
        }
        requestShutdown("Signal received", byte);
    }
}

void ShutdownManager::stopWatcher() noexcept
{
    if (!watcher_.joinable())
    {
        return;
    }
    const unsigned char stop = kStopByte;
    ssize_t ignored = write(wake_pipe_[1], &stop, 1);
    (void)ignored;
    watcher_.join();
}

void ShutdownManager::restoreDefaultHandlers() noexcept
{
    if (!handlers_installed_)
    {
        return;
    }
    for (int sig : kHandledSignals)
    {
        signal(sig, SIG_DFL);
    }
    handlers_installed_ = false;
}

void ShutdownManager::onShutdown(std::function<void()> callback)
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!requested_.load())
        {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (stopping_.exchange(true))
    {
        return;
    }

    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        signal_number_.store(signal_number);
        requested_.store(true);
        callbacks.swap(callbacks_);
    }
    requested_cv_.notify_all();

    if (signal_number != 0)
    {
        logger_.warn("Interrupted by signal " + std::to_string(signal_number) +
                     ", finishing items in flight (interrupt again to quit now)");
    }
    else
    {
        logger_.info("Stop requested: " + reason);
    }

    for (auto &callback : callbacks)
    {
        callback();
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    requested_cv_.wait(lk, [this]
                       { return requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    restoreDefaultHandlers();
    stopWatcher();

    std::lock_guard<std::mutex> lk(mutex_);
    requested_.store(false);
    stopping_.store(false);
    signal_number_.store(0);
    reason_.clear();
    callbacks_.clear();
}
