#include "cli/console_reporter.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace
{
    std::string indexTag(std::size_t index)
    {
        std::ostringstream tag;
        tag << "[" << std::setw(3) << std::setfill('0') << index << "]";
        return tag.str();
    }

    std::string formatElapsed(std::chrono::milliseconds elapsed)
    {
        auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
        std::ostringstream text;
        text << total_seconds / 60 << "m " << std::setw(2) << std::setfill('0') << total_seconds % 60 << "s";
        return text.str();
    }
}

ConsoleReporter::ConsoleReporter(std::ostream &out) : out_(out)
{
}

ProgressSink ConsoleReporter::sink()
{
    return [this](const ProgressEvent &event)
    { onEvent(event); };
}

void ConsoleReporter::onEvent(const ProgressEvent &event)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string tag = indexTag(event.sequence_index);

    switch (event.type)
    {
    case ProgressEvent::Type::STARTED:
        last_decile_[event.sequence_index] = 0;
        out_ << tag << " " << event.title << std::endl;
        break;
    case ProgressEvent::Type::PROGRESS:
    {
        int decile = static_cast<int>(event.ratio * 10.0);
        int &last = last_decile_[event.sequence_index];
        if (decile > last && decile < 10)
        {
            last = decile;
            out_ << tag << " " << decile * 10 << "%" << std::endl;
        }
        break;
    }
    case ProgressEvent::Type::COMPLETED:
        last_decile_.erase(event.sequence_index);
        out_ << tag << " done" << std::endl;
        break;
    case ProgressEvent::Type::SKIPPED:
        last_decile_.erase(event.sequence_index);
        out_ << tag << " already downloaded, skipped" << std::endl;
        break;
    case ProgressEvent::Type::FAILED:
        last_decile_.erase(event.sequence_index);
        out_ << tag << " failed: " << event.message << std::endl;
        break;
    }
}

void ConsoleReporter::printSummary(const RunReport &report, const std::filesystem::path &output_dir) const
{
    const LedgerSnapshot &ledger = report.ledger;
    out_ << "\nDownload summary\n"
         << "==============================\n";
    if (report.resolutionFailed())
    {
        out_ << "Playlist could not be read: " << report.resolution_error.value_or("unknown error") << "\n";
    }
    out_ << "Total:       " << ledger.total << "\n"
         << "Successful:  " << ledger.successful << "\n"
         << "Failed:      " << ledger.failed << "\n"
         << "Skipped:     " << ledger.skipped << "\n";
    if (report.interrupted)
    {
        out_ << "Not started: " << ledger.total - ledger.recorded() << " (interrupted)\n";
    }
    out_ << "Elapsed:     " << formatElapsed(report.elapsed) << "\n"
         << "Output:      " << output_dir.string() << "\n"
         << "==============================" << std::endl;
}

int ConsoleReporter::exitCode(const RunReport &report)
{
    if (report.resolutionFailed())
    {
        return kExitResolution;
    }
    if (report.interrupted)
    {
        return kExitInterrupted;
    }
    if (report.ledger.failed > 0)
    {
        return kExitItemFailures;
    }
    return kExitOk;
}

void ConsoleReporter::writeJson(const RunReport &report, const std::filesystem::path &path)
{
    std::ofstream out(path);
    if (!out.is_open())
    {
        throw FilesystemError("Cannot write report " + path.string());
    }
    out << report.toJson().dump(2) << std::endl;
    if (!out)
    {
        throw FilesystemError("Cannot write report " + path.string());
    }
}
