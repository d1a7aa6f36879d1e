#pragma once

#include "core/playlist_types.hpp"
#include "core/processing_result.hpp"
#include "core/progress_event.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Capability that resolves playlists and turns one item into an audio file
 *
 * Implementations carry only read-only configuration and may be called from several
 * worker threads at once.
 */
class MediaSource
{
public:
    virtual ~MediaSource() = default;

    /**
     * @brief Backend name for logs ("ytdlp", "two_stage")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Resolve a collection reference into items ordered by sequence_index
     *
     * Unreadable entries are dropped, so the result may be shorter than the advertised
     * collection size.
     *
     * @throws ResolutionError if the reference cannot be read or yields no valid entry
     */
    virtual std::vector<ItemDescriptor> resolve(const PlaylistRef &ref) = 0;

    /**
     * @brief Look up id and title of a single-item reference
     * @throws ResolutionError if the item cannot be described
     */
    virtual ItemDescriptor describe(const PlaylistRef &ref) = 0;

    /**
     * @brief Download the item and write one audio file at dest
     *
     * Temporary artifacts are removed on success and failure, and dest is only ever
     * produced by a rename of a completed file.
     *
     * @param item Descriptor produced by resolve()/describe()
     * @param bitrate_kbps Target audio bitrate
     * @param dest Final audio file path
     * @param progress Optional fraction-done callback
     */
    virtual FetchResult fetchAndTranscode(const ItemDescriptor &item, int bitrate_kbps,
                                          const std::filesystem::path &dest,
                                          const ProgressCallback &progress) = 0;
};
