#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Captured result of one external tool invocation
 */
struct ProcessOutput
{
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return !timed_out && exit_code == 0; }

    /**
     * @brief Last non-empty stderr line, or a generic message
     */
    std::string errorSummary() const;
};

/**
 * @brief Runs external tools (yt-dlp, ffmpeg) through Poco::Process
 *
 * Each child is moved into its own process group, and a deadline kill signals
 * the whole group. The move races with exec in the child; if exec wins, only the
 * direct child is killed. Children in their own group do not receive the
 * terminal's Ctrl+C.
 */
class ProcessRunner
{
public:
    using LineCallback = std::function<void(const std::string &)>;

    /**
     * @brief Launch a command and wait for it
     * @param command Executable name or path, resolved through PATH
     * @param args Arguments, passed without a shell
     * @param timeout Kill the child after this long; zero disables the deadline
     * @param on_stdout_line Optional callback for each stdout line as it arrives
     * @return Captured output and exit status
     * @throws ProcessError if the command cannot be launched
     */
    static ProcessOutput run(const std::string &command,
                             const std::vector<std::string> &args,
                             std::chrono::seconds timeout = std::chrono::seconds(0),
                             const LineCallback &on_stdout_line = nullptr);
};
