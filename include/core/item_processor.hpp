#pragma once

#include "core/media_source.hpp"
#include "core/playlist_types.hpp"
#include "core/processing_result.hpp"
#include "core/progress_event.hpp"
#include "logging/logger.hpp"
#include <filesystem>

/**
 * @brief Turns one item descriptor into exactly one outcome
 *
 * The destination path is derived from the sanitized title; if a file already exists
 * there the item is skipped without calling the media source. No retries happen here.
 */
class ItemProcessor
{
public:
    static constexpr const char *kExtension = ".mp3";

    ItemProcessor(MediaSource &source, const Logger &logger);

    /**
     * @brief Process one item
     * @param item Resolved descriptor
     * @param output_dir Directory receiving the audio file
     * @param bitrate_kbps Target bitrate
     * @param kind Collection items get a numeric prefix, single items do not
     * @param progress Optional fraction-done callback forwarded to the source
     * @return Success, Failure(reason) or Skipped(existing path)
     */
    ItemOutcome process(const ItemDescriptor &item,
                        const std::filesystem::path &output_dir,
                        int bitrate_kbps,
                        PlaylistKind kind,
                        const ProgressCallback &progress = nullptr) const;

    /**
     * @brief "<NNN>_<sanitized title>.mp3" for collections, "<sanitized title>.mp3" otherwise
     */
    static std::filesystem::path destinationPath(const ItemDescriptor &item,
                                                 const std::filesystem::path &output_dir,
                                                 PlaylistKind kind);

private:
    MediaSource &source_;
    Logger logger_;
};
