#include "cli/interactive_prompt.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    const char *kNotice =
        "IMPORTANT NOTICE\n"
        "\n"
        "This tool is provided for educational purposes only. By using it you agree that:\n"
        "  - you will respect the terms of service of the sites you download from\n"
        "  - you will only download content you have permission to use\n"
        "  - downloading copyrighted material without permission may violate the law\n"
        "    in your jurisdiction\n"
        "  - the developers are not responsible for any misuse of this tool\n"
        "\n"
        "Do you understand and agree to these terms? (y/N): ";

    std::string trim(const std::string &text)
    {
        auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    bool isNumber(const std::string &text)
    {
        return !text.empty() && text.size() <= 6 && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                            { return std::isdigit(c); });
    }
}

InteractivePrompt::InteractivePrompt(std::istream &in, std::ostream &out) : in_(in), out_(out)
{
}

std::string InteractivePrompt::ask(const std::string &question, const std::string &def)
{
    out_ << question;
    if (!def.empty())
    {
        out_ << " (default: " << def << ")";
    }
    out_ << ": " << std::flush;

    std::string line;
    if (!std::getline(in_, line))
    {
        return def;
    }
    line = trim(line);
    return line.empty() ? def : line;
}

bool InteractivePrompt::acknowledgeNotice()
{
    out_ << kNotice << std::flush;
    std::string line;
    if (!std::getline(in_, line))
    {
        return false;
    }
    line = trim(line);
    std::transform(line.begin(), line.end(), line.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return line == "y" || line == "yes";
}

void InteractivePrompt::gather(CliOptions &options)
{
    if (!options.url)
    {
        std::string url = ask("Playlist or video URL", "");
        if (url.empty())
        {
            throw UsageError("A URL is required");
        }
        options.url = url;
    }

    nlohmann::json &overrides = options.overrides;
    if (!overrides.contains("output_dir"))
    {
        overrides["output_dir"] = ask("Output directory", "downloads");
    }

    bool has_bitrate = overrides.contains("audio") && overrides["audio"].contains("bitrate_kbps");
    if (!has_bitrate)
    {
        std::string quality = ask("Audio quality in kbps", "320");
        if (!isNumber(quality))
        {
            throw UsageError("Audio quality must be a number, got '" + quality + "'");
        }
        overrides["audio"]["bitrate_kbps"] = std::stoi(quality);
    }

    if (!overrides.contains("api_key"))
    {
        std::string key = ask("Metadata API key (optional, Enter to skip)", "");
        if (!key.empty())
        {
            overrides["api_key"] = key;
        }
    }

    if (options.playlistRef().isCollection())
    {
        bool has_mode = overrides.contains("scheduling") && overrides["scheduling"].contains("mode");
        if (!has_mode)
        {
            out_ << "Download mode:\n"
                 << "  1. Standard (one at a time)\n"
                 << "  2. Concurrent (faster)\n";
            if (ask("Choose mode", "1") == "2")
            {
                std::string limit = ask("Max concurrent downloads", "3");
                if (!isNumber(limit))
                {
                    throw UsageError("Concurrency must be a number, got '" + limit + "'");
                }
                overrides["scheduling"]["mode"] = "concurrent";
                overrides["scheduling"]["concurrency_limit"] = std::stoi(limit);
            }
        }
    }
    else if (!overrides.contains("custom_title"))
    {
        std::string title = ask("Custom file name (optional, Enter to use the video title)", "");
        if (!title.empty())
        {
            overrides["custom_title"] = title;
        }
    }
}
