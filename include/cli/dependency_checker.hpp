#pragma once

#include "logging/logger.hpp"
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Availability of one external tool
 */
struct ToolStatus
{
    std::string name;
    std::string executable;
    bool available = false;
    std::string version; // first version token, empty when unavailable
    std::string detail;  // error text when unavailable
};

/**
 * @brief Probes the external tools the backends rely on and prints install hints
 */
class DependencyChecker
{
public:
    DependencyChecker(std::string ytdlp_path, std::string ffmpeg_path, const Logger &logger);

    ToolStatus checkYtDlp() const;
    ToolStatus checkFfmpeg() const;

    std::vector<ToolStatus> checkAll() const;

    /**
     * @brief Print one status line per tool plus guidance for missing ones
     * @return true if every tool is available
     */
    static bool printReport(const std::vector<ToolStatus> &statuses, std::ostream &out);

    static void printFfmpegInstallation(std::ostream &out);
    static void printYtDlpInstallation(std::ostream &out);

    /**
     * @brief Version token from "ffmpeg version 6.1.1-3ubuntu5 Copyright ..." style output
     */
    static std::string extractFfmpegVersion(const std::string &output);

private:
    ToolStatus probe(const std::string &name, const std::string &executable,
                     const std::vector<std::string> &args) const;

    std::string ytdlp_path_;
    std::string ffmpeg_path_;
    Logger logger_;
};
