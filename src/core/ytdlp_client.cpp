#include "core/ytdlp_client.hpp"
#include "core/errors.hpp"
#include <regex>

namespace
{
    const std::string kWatchUrlPrefix = "https://www.youtube.com/watch?v=";

    std::string stringField(const nlohmann::json &object, const char *key)
    {
        auto it = object.find(key);
        if (it != object.end() && it->is_string())
        {
            return it->get<std::string>();
        }
        return "";
    }
}

YtDlpClient::YtDlpClient(YtDlpSettings settings, const Logger &logger)
    : settings_(std::move(settings)), logger_(logger)
{
}

ProcessOutput YtDlpClient::invoke(const std::vector<std::string> &args, std::chrono::seconds timeout,
                                  const ProcessRunner::LineCallback &on_line) const
{
    std::vector<std::string> full_args = args;
    if (!settings_.ffmpeg_location.empty())
    {
        full_args.insert(full_args.begin(), {"--ffmpeg-location", settings_.ffmpeg_location});
    }
    logger_.trace("Running " + settings_.executable + " with " + std::to_string(full_args.size()) + " arguments");
    return ProcessRunner::run(settings_.executable, full_args, timeout, on_line);
}

nlohmann::json YtDlpClient::parseDocument(const std::string &stdout_text)
{
    nlohmann::json document = nlohmann::json::parse(stdout_text, nullptr, false);
    if (document.is_discarded() || !document.is_object())
    {
        throw ResolutionError("yt-dlp did not return a JSON document");
    }
    return document;
}

nlohmann::json YtDlpClient::dumpPlaylist(const std::string &url) const
{
    ProcessOutput output;
    try
    {
        output = invoke({"-J", "--flat-playlist", "--ignore-errors", "--no-warnings", url},
                        settings_.fetch_timeout);
    }
    catch (const ProcessError &e)
    {
        throw ResolutionError(e.what());
    }

    // --ignore-errors may exit non-zero while still printing a usable document
    if (output.stdout_text.empty() || output.timed_out)
    {
        throw ResolutionError("Could not read playlist " + url + ": " + output.errorSummary());
    }
    return parseDocument(output.stdout_text);
}

nlohmann::json YtDlpClient::dumpItem(const std::string &url) const
{
    ProcessOutput output;
    try
    {
        output = invoke({"-J", "--no-playlist", "--no-warnings", url}, settings_.fetch_timeout);
    }
    catch (const ProcessError &e)
    {
        throw ResolutionError(e.what());
    }

    if (!output.succeeded())
    {
        throw ResolutionError("Could not read item " + url + ": " + output.errorSummary());
    }
    return parseDocument(output.stdout_text);
}

std::vector<ItemDescriptor> YtDlpClient::resolveCollection(const std::string &url) const
{
    std::vector<ItemDescriptor> items = parsePlaylistEntries(dumpPlaylist(url), logger_);
    if (items.empty())
    {
        throw ResolutionError("Playlist " + url + " has no readable entries");
    }
    logger_.info("Resolved " + std::to_string(items.size()) + " items from " + url);
    return items;
}

ItemDescriptor YtDlpClient::describeItem(const std::string &url) const
{
    std::optional<ItemDescriptor> item = parseEntry(dumpItem(url), 1);
    if (!item)
    {
        throw ResolutionError("Item " + url + " has no id");
    }
    return *item;
}

StreamInfo YtDlpClient::locateAudioStream(const std::string &url) const
{
    ProcessOutput output;
    try
    {
        output = invoke({"-J", "--no-playlist", "--no-warnings", "-f", "bestaudio/best", url},
                        settings_.fetch_timeout);
    }
    catch (const ProcessError &e)
    {
        throw ItemFetchError(e.what());
    }
    if (!output.succeeded())
    {
        throw ItemFetchError("yt-dlp could not locate a stream: " + output.errorSummary());
    }

    nlohmann::json document = nlohmann::json::parse(output.stdout_text, nullptr, false);
    if (document.is_discarded() || !document.is_object())
    {
        throw ItemFetchError("yt-dlp returned malformed stream metadata");
    }

    StreamInfo info;
    info.url = stringField(document, "url");
    info.extension = stringField(document, "ext");
    if (info.url.empty())
    {
        throw ItemFetchError("No direct audio stream available for " + url);
    }

    auto headers = document.find("http_headers");
    if (headers != document.end() && headers->is_object())
    {
        for (auto it = headers->begin(); it != headers->end(); ++it)
        {
            if (it.value().is_string())
            {
                info.http_headers[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return info;
}

ProcessOutput YtDlpClient::extractAudio(const std::string &url, const std::string &output_template,
                                        int bitrate_kbps, const ProgressCallback &progress) const
{
    std::vector<std::string> args = {
        "--no-playlist",
        "--newline",
        "--no-warnings",
        "--retries", std::to_string(settings_.retries),
        "-f", "bestaudio/best",
        "-x",
        "--audio-format", "mp3",
        "--audio-quality", std::to_string(bitrate_kbps) + "K",
        "--postprocessor-args", "ExtractAudio:-ar 44100 -ac 2",
        "-o", output_template};
    if (settings_.write_info_json)
    {
        args.push_back("--write-info-json");
    }
    args.push_back(url);

    ProcessRunner::LineCallback on_line;
    if (progress)
    {
        on_line = [&progress](const std::string &line)
        {
            std::optional<double> ratio = parseDownloadProgress(line);
            if (ratio)
            {
                progress(*ratio);
            }
        };
    }

    return invoke(args, settings_.fetch_timeout + settings_.transcode_timeout, on_line);
}

std::optional<ItemDescriptor> YtDlpClient::parseEntry(const nlohmann::json &entry, std::size_t sequence_index)
{
    if (!entry.is_object())
    {
        return std::nullopt;
    }
    if (stringField(entry, "_type") == "playlist")
    {
        return std::nullopt;
    }

    ItemDescriptor item;
    item.id = stringField(entry, "id");
    if (item.id.empty())
    {
        return std::nullopt;
    }
    item.title = stringField(entry, "title");
    item.sequence_index = sequence_index;

    std::string handle = stringField(entry, "webpage_url");
    if (handle.empty())
    {
        handle = stringField(entry, "url");
    }
    if (handle.rfind("http", 0) != 0)
    {
        handle = kWatchUrlPrefix + item.id;
    }
    item.fetch_handle = handle;
    return item;
}

std::vector<ItemDescriptor> YtDlpClient::parsePlaylistEntries(const nlohmann::json &document,
                                                              const Logger &logger)
{
    std::vector<ItemDescriptor> items;

    auto entries = document.find("entries");
    if (entries == document.end() || !entries->is_array())
    {
        std::optional<ItemDescriptor> single = parseEntry(document, 1);
        if (single)
        {
            items.push_back(*single);
        }
        return items;
    }

    std::size_t position = 0;
    std::size_t dropped = 0;
    for (const auto &entry : *entries)
    {
        std::optional<ItemDescriptor> item = parseEntry(entry, items.size() + 1);
        ++position;
        if (!item)
        {
            ++dropped;
            logger.debug("Skipping unreadable playlist entry at position " + std::to_string(position));
            continue;
        }
        items.push_back(*item);
    }

    if (dropped > 0)
    {
        logger.info("Dropped " + std::to_string(dropped) + " unreadable playlist entries");
    }
    return items;
}

std::optional<double> YtDlpClient::parseDownloadProgress(const std::string &line)
{
    static const std::regex pattern(R"(^\[download\]\s+([0-9]+(?:\.[0-9]+)?)%)");
    std::smatch match;
    if (!std::regex_search(line, match, pattern))
    {
        return std::nullopt;
    }
    double percent = std::stod(match[1].str());
    if (percent > 100.0)
    {
        percent = 100.0;
    }
    return percent / 100.0;
}
