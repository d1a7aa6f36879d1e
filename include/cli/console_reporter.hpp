#pragma once

#include "core/progress_event.hpp"
#include "core/run_coordinator.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <ostream>

/**
 * @brief Console presentation of a run and its exit code
 */
class ConsoleReporter
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitItemFailures = 1;
    static constexpr int kExitUsage = 2;
    static constexpr int kExitResolution = 3;
    static constexpr int kExitInterrupted = 130;

    explicit ConsoleReporter(std::ostream &out);

    /**
     * @brief Sink printing one line per item event and progress in 10% steps
     */
    ProgressSink sink();

    void printSummary(const RunReport &report, const std::filesystem::path &output_dir) const;

    static int exitCode(const RunReport &report);

    /**
     * @brief Write the report as pretty-printed JSON
     * @throws FilesystemError if the file cannot be written
     */
    static void writeJson(const RunReport &report, const std::filesystem::path &path);

private:
    void onEvent(const ProgressEvent &event);

    std::ostream &out_;
    std::mutex mutex_;
    std::map<std::size_t, int> last_decile_;
};
