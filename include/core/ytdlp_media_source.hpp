#pragma once

#include "core/media_source.hpp"
#include "core/ytdlp_client.hpp"
#include "logging/logger.hpp"

/**
 * @brief Integrated backend: yt-dlp downloads and converts in one invocation
 *
 * The audio lands under a temporary name in the destination directory and is renamed
 * onto dest once yt-dlp exits successfully.
 */
class YtDlpMediaSource : public MediaSource
{
public:
    YtDlpMediaSource(YtDlpSettings settings, const Logger &logger);

    std::string name() const override { return "ytdlp"; }

    std::vector<ItemDescriptor> resolve(const PlaylistRef &ref) override;
    ItemDescriptor describe(const PlaylistRef &ref) override;
    FetchResult fetchAndTranscode(const ItemDescriptor &item, int bitrate_kbps,
                                  const std::filesystem::path &dest,
                                  const ProgressCallback &progress) override;

private:
    void placeInfoJson(const std::filesystem::path &dir, const std::string &stem,
                       const std::filesystem::path &dest) const;

    YtDlpClient client_;
    Logger logger_;
};
