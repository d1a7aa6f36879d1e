#pragma once

#include "core/audio_transcoder.hpp"
#include "core/http_media_fetcher.hpp"
#include "core/media_source.hpp"
#include "core/ytdlp_client.hpp"
#include "logging/logger.hpp"

/**
 * @brief Two-stage backend: fetch the raw stream, then transcode it locally
 *
 * yt-dlp only locates the stream. The bytes are downloaded over HTTP into a temporary
 * file beside dest and converted with libav into "<dest>.part", which is renamed onto
 * dest when complete. The raw file is deleted whatever the outcome.
 */
class TwoStageMediaSource : public MediaSource
{
public:
    TwoStageMediaSource(YtDlpSettings settings, const Logger &logger);

    std::string name() const override { return "two_stage"; }

    std::vector<ItemDescriptor> resolve(const PlaylistRef &ref) override;
    ItemDescriptor describe(const PlaylistRef &ref) override;
    FetchResult fetchAndTranscode(const ItemDescriptor &item, int bitrate_kbps,
                                  const std::filesystem::path &dest,
                                  const ProgressCallback &progress) override;

private:
    YtDlpClient client_;
    HttpMediaFetcher fetcher_;
    AudioTranscoder transcoder_;
    Logger logger_;
};
