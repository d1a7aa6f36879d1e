#pragma once

#include "core/playlist_types.hpp"
#include "core/process_runner.hpp"
#include "core/progress_event.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Settings for invoking the yt-dlp executable
 */
struct YtDlpSettings
{
    std::string executable = "yt-dlp";
    std::string ffmpeg_location; // empty: let yt-dlp find ffmpeg on PATH
    std::chrono::seconds fetch_timeout{300};
    std::chrono::seconds transcode_timeout{600};
    int retries = 3;
    bool write_info_json = false;
};

/**
 * @brief Direct media stream located by yt-dlp
 */
struct StreamInfo
{
    std::string url;
    std::string extension;
    std::map<std::string, std::string> http_headers;
};

/**
 * @brief Thin wrapper around the yt-dlp command line
 *
 * Metadata calls return yt-dlp's JSON documents; parsing into descriptors is done by
 * the static helpers so it can be tested without the executable.
 */
class YtDlpClient
{
public:
    YtDlpClient(YtDlpSettings settings, const Logger &logger);

    /**
     * @brief Flat playlist dump (-J --flat-playlist)
     * @throws ResolutionError when yt-dlp fails or prints no JSON
     */
    nlohmann::json dumpPlaylist(const std::string &url) const;

    /**
     * @brief Metadata of one item (-J --no-playlist)
     * @throws ResolutionError when yt-dlp fails or prints no JSON
     */
    nlohmann::json dumpItem(const std::string &url) const;

    /**
     * @brief Resolve a collection URL into descriptors
     * @throws ResolutionError when nothing readable comes back
     */
    std::vector<ItemDescriptor> resolveCollection(const std::string &url) const;

    /**
     * @brief Describe one item URL
     * @throws ResolutionError when the item has no id
     */
    ItemDescriptor describeItem(const std::string &url) const;

    /**
     * @brief Find the best audio-only stream URL of one item
     * @throws ItemFetchError when no direct stream is available
     */
    StreamInfo locateAudioStream(const std::string &url) const;

    /**
     * @brief Download and convert to MP3 in one yt-dlp run
     * @param url Item URL
     * @param output_template yt-dlp -o template, must end in ".%(ext)s"
     * @param bitrate_kbps Target MP3 bitrate
     * @param progress Optional download progress callback
     */
    ProcessOutput extractAudio(const std::string &url, const std::string &output_template,
                               int bitrate_kbps, const ProgressCallback &progress) const;

    const YtDlpSettings &settings() const { return settings_; }

    /**
     * @brief Turn a playlist document into descriptors, skipping unreadable entries
     *
     * sequence_index is the 1-based position among valid entries. A document without
     * "entries" but with an "id" is treated as a one-item collection.
     */
    static std::vector<ItemDescriptor> parsePlaylistEntries(const nlohmann::json &document,
                                                            const Logger &logger);

    /**
     * @brief Build a descriptor from one entry, std::nullopt if it lacks an id
     */
    static std::optional<ItemDescriptor> parseEntry(const nlohmann::json &entry, std::size_t sequence_index);

    /**
     * @brief Parse the fraction from a "[download]  42.0% of ..." line
     */
    static std::optional<double> parseDownloadProgress(const std::string &line);

    /**
     * @brief Parse the JSON document printed by a -J invocation
     * @throws ResolutionError if the text is not a JSON object
     */
    static nlohmann::json parseDocument(const std::string &stdout_text);

private:
    ProcessOutput invoke(const std::vector<std::string> &args, std::chrono::seconds timeout,
                         const ProcessRunner::LineCallback &on_line = nullptr) const;

    YtDlpSettings settings_;
    Logger logger_;
};
