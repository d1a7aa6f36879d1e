#include "core/item_processor.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "core/filename_sanitizer.hpp"
#include <iomanip>
#include <sstream>
#include <system_error>

ItemProcessor::ItemProcessor(MediaSource &source, const Logger &logger)
    : source_(source), logger_(logger)
{
}

std::filesystem::path ItemProcessor::destinationPath(const ItemDescriptor &item,
                                                     const std::filesystem::path &output_dir,
                                                     PlaylistKind kind)
{
    std::ostringstream name;
    if (kind == PlaylistKind::COLLECTION)
    {
        name << std::setw(3) << std::setfill('0') << item.sequence_index << "_";
    }
    name << FilenameSanitizer::sanitize(item.title) << kExtension;
    return output_dir / name.str();
}

ItemOutcome ItemProcessor::process(const ItemDescriptor &item,
                                   const std::filesystem::path &output_dir,
                                   int bitrate_kbps,
                                   PlaylistKind kind,
                                   const ProgressCallback &progress) const
{
    const std::filesystem::path dest = destinationPath(item, output_dir, kind);

    std::error_code ec;
    if (std::filesystem::exists(dest, ec))
    {
        logger_.info("Skipping existing file: " + dest.filename().string());
        return ItemOutcome::skipped(dest);
    }
    if (ec)
    {
        const std::string reason = "Cannot check " + dest.filename().string() + ": " + ec.message();
        logger_.error(reason);
        return ItemOutcome::failure(dest, reason);
    }

    try
    {
        FileUtils::ensureDirectory(output_dir);
    }
    catch (const FilesystemError &e)
    {
        logger_.error(e.what());
        return ItemOutcome::failure(dest, e.what());
    }

    logger_.info("Processing [" + std::to_string(item.sequence_index) + "] " + item.title);

    FetchResult result;
    try
    {
        result = source_.fetchAndTranscode(item, bitrate_kbps, dest, progress);
    }
    catch (const std::exception &e)
    {
        result = FetchResult::failed(e.what());
    }

    if (!result.success)
    {
        logger_.error("Failed [" + std::to_string(item.sequence_index) + "] " + item.title + ": " +
                      result.error_message);
        return ItemOutcome::failure(dest, result.error_message);
    }

    logger_.info("Saved " + dest.filename().string());
    return ItemOutcome::success(dest);
}
