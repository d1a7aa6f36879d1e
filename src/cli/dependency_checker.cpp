#include "cli/dependency_checker.hpp"
#include "core/errors.hpp"
#include "core/process_runner.hpp"
#include <sstream>

namespace
{
    const std::chrono::seconds kProbeTimeout{10};

    std::string firstLine(const std::string &text)
    {
        std::istringstream in(text);
        std::string line;
        std::getline(in, line);
        return line;
    }
}

DependencyChecker::DependencyChecker(std::string ytdlp_path, std::string ffmpeg_path, const Logger &logger)
    : ytdlp_path_(std::move(ytdlp_path)), ffmpeg_path_(std::move(ffmpeg_path)), logger_(logger)
{
}

ToolStatus DependencyChecker::probe(const std::string &name, const std::string &executable,
                                    const std::vector<std::string> &args) const
{
    ToolStatus status;
    status.name = name;
    status.executable = executable;

    ProcessOutput output;
    try
    {
        output = ProcessRunner::run(executable, args, kProbeTimeout);
    }
    catch (const ProcessError &e)
    {
        status.detail = e.what();
        logger_.debug(name + " probe failed: " + status.detail);
        return status;
    }

    if (!output.succeeded())
    {
        status.detail = output.errorSummary();
        logger_.debug(name + " probe failed: " + status.detail);
        return status;
    }

    status.available = true;
    status.version = firstLine(output.stdout_text);
    return status;
}

ToolStatus DependencyChecker::checkYtDlp() const
{
    return probe("yt-dlp", ytdlp_path_, {"--version"});
}

ToolStatus DependencyChecker::checkFfmpeg() const
{
    ToolStatus status = probe("FFmpeg", ffmpeg_path_, {"-version"});
    if (status.available)
    {
        status.version = extractFfmpegVersion(status.version);
    }
    return status;
}

std::vector<ToolStatus> DependencyChecker::checkAll() const
{
    return {checkYtDlp(), checkFfmpeg()};
}

std::string DependencyChecker::extractFfmpegVersion(const std::string &output)
{
    std::istringstream in(firstLine(output));
    std::string first, second, third;
    in >> first >> second >> third;
    if (second == "version" && !third.empty())
    {
        return third;
    }
    return "installed";
}

bool DependencyChecker::printReport(const std::vector<ToolStatus> &statuses, std::ostream &out)
{
    bool all_ok = true;
    out << "Dependency check:\n";
    for (const auto &status : statuses)
    {
        if (status.available)
        {
            out << "  [ok]      " << status.name << " " << status.version << "\n";
        }
        else
        {
            all_ok = false;
            out << "  [missing] " << status.name << " (" << status.executable << ")";
            if (!status.detail.empty())
            {
                out << ": " << status.detail;
            }
            out << "\n";
        }
    }

    for (const auto &status : statuses)
    {
        if (status.available)
        {
            continue;
        }
        if (status.name == "FFmpeg")
        {
            printFfmpegInstallation(out);
        }
        else
        {
            printYtDlpInstallation(out);
        }
    }
    return all_ok;
}

void DependencyChecker::printFfmpegInstallation(std::ostream &out)
{
    out << "\nFFmpeg installation:\n";
#if defined(_WIN32)
    out << "  choco install ffmpeg\n"
        << "  winget install Gyan.FFmpeg\n"
        << "  or download from https://ffmpeg.org/download.html and add it to PATH\n";
#elif defined(__APPLE__)
    out << "  brew install ffmpeg\n"
        << "  sudo port install ffmpeg\n";
#else
    out << "  Ubuntu/Debian: sudo apt update && sudo apt install ffmpeg\n"
        << "  CentOS/RHEL:   sudo yum install ffmpeg\n"
        << "  Fedora:        sudo dnf install ffmpeg\n"
        << "  Arch:          sudo pacman -S ffmpeg\n";
#endif
}

void DependencyChecker::printYtDlpInstallation(std::ostream &out)
{
    out << "\nyt-dlp installation:\n"
        << "  pip install -U yt-dlp\n"
        << "  or download a release from https://github.com/yt-dlp/yt-dlp/releases\n";
}
