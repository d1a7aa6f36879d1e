#include "core/two_stage_media_source.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"

namespace
{
    HttpMediaFetcher::Settings fetcherSettings(const YtDlpSettings &settings)
    {
        HttpMediaFetcher::Settings fetch;
        fetch.read_timeout = settings.fetch_timeout;
        fetch.max_attempts = settings.retries;
        return fetch;
    }
}

TwoStageMediaSource::TwoStageMediaSource(YtDlpSettings settings, const Logger &logger)
    : client_(settings, logger),
      fetcher_(fetcherSettings(settings), logger),
      transcoder_(logger),
      logger_(logger)
{
}

std::vector<ItemDescriptor> TwoStageMediaSource::resolve(const PlaylistRef &ref)
{
    return client_.resolveCollection(ref.url);
}

ItemDescriptor TwoStageMediaSource::describe(const PlaylistRef &ref)
{
    return client_.describeItem(ref.url);
}

FetchResult TwoStageMediaSource::fetchAndTranscode(const ItemDescriptor &item, int bitrate_kbps,
                                                   const std::filesystem::path &dest,
                                                   const ProgressCallback &progress)
{
    const std::filesystem::path dir = dest.parent_path();
    std::filesystem::path partial = dest;
    partial += ".part";

    // Download is the first half of the progress range, transcoding the second
    ProgressCallback download_progress;
    ProgressCallback transcode_progress;
    if (progress)
    {
        download_progress = [&progress](double ratio)
        { progress(ratio * 0.5); };
        transcode_progress = [&progress](double ratio)
        { progress(0.5 + ratio * 0.5); };
    }

    std::filesystem::path raw;
    try
    {
        StreamInfo stream = client_.locateAudioStream(item.fetch_handle);
        std::string extension = stream.extension.empty() ? "bin" : stream.extension;
        raw = dir / (FileUtils::tempStem(item) + "." + extension);

        std::uint64_t bytes = fetcher_.download(stream.url, stream.http_headers, raw, download_progress);
        logger_.debug("Fetched " + std::to_string(bytes) + " bytes for item " + item.id);

        transcoder_.transcode(raw, partial, bitrate_kbps, client_.settings().transcode_timeout, transcode_progress);
        FileUtils::moveIntoPlace(partial, dest);
    }
    catch (const std::runtime_error &e)
    {
        FileUtils::removeQuietly(partial);
        if (!raw.empty())
        {
            FileUtils::removeQuietly(raw);
        }
        return FetchResult::failed(e.what());
    }

    FileUtils::removeQuietly(raw);
    return FetchResult::ok();
}
