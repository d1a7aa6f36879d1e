#include "core/ytdlp_media_source.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"

YtDlpMediaSource::YtDlpMediaSource(YtDlpSettings settings, const Logger &logger)
    : client_(std::move(settings), logger), logger_(logger)
{
}

std::vector<ItemDescriptor> YtDlpMediaSource::resolve(const PlaylistRef &ref)
{
    return client_.resolveCollection(ref.url);
}

ItemDescriptor YtDlpMediaSource::describe(const PlaylistRef &ref)
{
    return client_.describeItem(ref.url);
}

FetchResult YtDlpMediaSource::fetchAndTranscode(const ItemDescriptor &item, int bitrate_kbps,
                                                const std::filesystem::path &dest,
                                                const ProgressCallback &progress)
{
    const std::filesystem::path dir = dest.parent_path();
    const std::string stem = FileUtils::tempStem(item);
    const std::string output_template = (dir / (stem + ".%(ext)s")).string();

    ProcessOutput output;
    try
    {
        output = client_.extractAudio(item.fetch_handle, output_template, bitrate_kbps, progress);
    }
    catch (const ProcessError &e)
    {
        FileUtils::removeByPrefix(dir, stem);
        return FetchResult::failed(e.what());
    }

    FetchResult result;
    std::optional<std::filesystem::path> produced = FileUtils::findByPrefix(dir, stem, "mp3");
    if (output.timed_out)
    {
        result = FetchResult::failed("yt-dlp timed out");
    }
    else if (!output.succeeded())
    {
        result = FetchResult::failed("yt-dlp failed: " + output.errorSummary());
    }
    else if (!produced)
    {
        result = FetchResult::failed("yt-dlp finished without producing an mp3");
    }
    else
    {
        try
        {
            FileUtils::moveIntoPlace(*produced, dest);
            if (client_.settings().write_info_json)
            {
                placeInfoJson(dir, stem, dest);
            }
            result = FetchResult::ok();
        }
        catch (const FilesystemError &e)
        {
            result = FetchResult::failed(e.what());
        }
    }

    std::size_t leftovers = FileUtils::removeByPrefix(dir, stem);
    if (leftovers > 0)
    {
        logger_.debug("Removed " + std::to_string(leftovers) + " temporary files for item " + item.id);
    }
    return result;
}

void YtDlpMediaSource::placeInfoJson(const std::filesystem::path &dir, const std::string &stem,
                                     const std::filesystem::path &dest) const
{
    std::optional<std::filesystem::path> info = FileUtils::findByPrefix(dir, stem, "info.json");
    if (!info)
    {
        logger_.warn("yt-dlp did not write metadata for " + dest.filename().string());
        return;
    }
    std::filesystem::path target = dest;
    target.replace_extension(".info.json");
    FileUtils::moveIntoPlace(*info, target);
}
