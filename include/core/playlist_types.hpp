#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief Whether a reference denotes one item or an ordered collection
 */
enum class PlaylistKind
{
    SINGLE_ITEM,
    COLLECTION
};

/**
 * @brief Opaque external reference (URL or id) supplied by the caller
 */
struct PlaylistRef
{
    std::string url;
    PlaylistKind kind = PlaylistKind::COLLECTION;

    /**
     * @brief Classify a URL: anything carrying a "list=" query parameter is a collection
     */
    static PlaylistRef fromUrl(const std::string &url)
    {
        PlaylistRef ref;
        ref.url = url;
        ref.kind = url.find("list=") != std::string::npos ? PlaylistKind::COLLECTION
                                                          : PlaylistKind::SINGLE_ITEM;
        return ref;
    }

    bool isCollection() const { return kind == PlaylistKind::COLLECTION; }
};

/**
 * @brief Resolved metadata for one media item, immutable once produced
 */
struct ItemDescriptor
{
    std::string id;
    std::string title;
    std::size_t sequence_index = 1; // 1-based position in resolution order
    std::string fetch_handle;       // URL handed back to the media source
};

enum class SchedulingMode
{
    SEQUENTIAL,
    BOUNDED_CONCURRENCY
};

/**
 * @brief Per-run settings, immutable for the duration of a run
 */
struct RunConfig
{
    std::filesystem::path output_dir = "downloads";
    int bitrate_kbps = 320;
    std::optional<std::string> api_key;
    SchedulingMode scheduling = SchedulingMode::SEQUENTIAL;
    std::size_t concurrency_limit = 3;
    std::chrono::milliseconds inter_item_delay{1000};

    // Single-item mode only: use this name instead of looking the title up
    std::optional<std::string> custom_title;
};
