#include "core/process_runner.hpp"
#include "core/errors.hpp"
#include <Poco/Exception.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <istream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace
{
    // Poco's child exits with this code when exec() fails
    constexpr int kExecFailedExitCode = 72;
}

std::string ProcessOutput::errorSummary() const
{
    if (timed_out)
    {
        return "process timed out";
    }

    std::istringstream lines(stderr_text);
    std::string line;
    std::string last;
    while (std::getline(lines, line))
    {
        if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos)
        {
            last = line;
        }
    }
    if (!last.empty())
    {
        return last;
    }
    if (exit_code == kExecFailedExitCode)
    {
        return "could not execute command (exit code 72)";
    }
    return "process exited with code " + std::to_string(exit_code);
}

ProcessOutput ProcessRunner::run(const std::string &command,
                                 const std::vector<std::string> &args,
                                 std::chrono::seconds timeout,
                                 const LineCallback &on_stdout_line)
{
    Poco::Pipe out_pipe;
    Poco::Pipe err_pipe;
    Poco::Process::Args process_args(args.begin(), args.end());

    std::unique_ptr<Poco::ProcessHandle> handle;
    try
    {
        handle = std::make_unique<Poco::ProcessHandle>(
            Poco::Process::launch(command, process_args, nullptr, &out_pipe, &err_pipe));
    }
    catch (const Poco::Exception &e)
    {
        throw ProcessError("Failed to launch " + command + ": " + e.displayText());
    }

    // Own process group so a deadline kill also reaches helpers the tool spawned
    // (yt-dlp runs ffmpeg). Fails with EACCES if the child already exec'd first.
    const pid_t pid = static_cast<pid_t>(handle->id());
    const bool own_group = ::setpgid(pid, pid) == 0;

    ProcessOutput output;
    std::mutex done_mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::atomic<bool> killed{false};

    std::thread watchdog;
    if (timeout.count() > 0)
    {
        watchdog = std::thread([&]()
                               {
            std::unique_lock<std::mutex> lock(done_mutex);
            if (!done_cv.wait_for(lock, timeout, [&]() { return done; }))
            {
                killed.store(true);
                // ESRCH only means every member of the group is already gone
                if (own_group && (::kill(-pid, SIGKILL) == 0 || errno == ESRCH))
                {
                    return;
                }
                try
                {
                    Poco::Process::kill(*handle);
                }
                catch (const Poco::NotFoundException &)
                {
                    // child already exited between the deadline and the kill
                }
            } });
    }

    std::thread stderr_reader([&]()
                              {
        Poco::PipeInputStream err_stream(err_pipe);
        std::ostringstream buffer;
        buffer << err_stream.rdbuf();
        output.stderr_text = buffer.str(); });

    Poco::PipeInputStream out_stream(out_pipe);
    std::string line;
    while (std::getline(out_stream, line))
    {
        if (on_stdout_line)
        {
            on_stdout_line(line);
        }
        output.stdout_text += line;
        output.stdout_text += '\n';
    }

    stderr_reader.join();
    output.exit_code = handle->wait();

    {
        std::lock_guard<std::mutex> lock(done_mutex);
        done = true;
    }
    done_cv.notify_all();
    if (watchdog.joinable())
    {
        watchdog.join();
    }

    output.timed_out = killed.load();
    return output;
}
