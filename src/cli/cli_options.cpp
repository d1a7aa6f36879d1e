#include "cli/cli_options.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace
{
    int parseInteger(const std::string &option, const std::string &value)
    {
        std::size_t consumed = 0;
        int number = 0;
        try
        {
            number = std::stoi(value, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw UsageError(option + " expects a number, got '" + value + "'");
        }
        if (consumed != value.size())
        {
            throw UsageError(option + " expects a number, got '" + value + "'");
        }
        return number;
    }

    std::string uppercase(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return text;
    }
}

CliOptions CliOptions::parse(int argc, const char *const argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++)
    {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CliOptions CliOptions::parse(const std::vector<std::string> &args)
{
    CliOptions options;

    for (std::size_t i = 0; i < args.size(); i++)
    {
        const std::string &arg = args[i];

        auto value = [&]() -> std::string
        {
            if (i + 1 >= args.size())
            {
                throw UsageError(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else if (arg == "--url" || arg == "-u")
        {
            options.url = value();
        }
        else if (arg == "--output" || arg == "-o")
        {
            options.overrides["output_dir"] = value();
        }
        else if (arg == "--quality" || arg == "-q")
        {
            options.overrides["audio"]["bitrate_kbps"] = parseInteger(arg, value());
        }
        else if (arg == "--backend" || arg == "-b")
        {
            options.overrides["source"]["backend"] = value();
        }
        else if (arg == "--concurrency" || arg == "-j")
        {
            int limit = parseInteger(arg, value());
            options.overrides["scheduling"]["concurrency_limit"] = limit;
            options.overrides["scheduling"]["mode"] = limit > 1 ? "concurrent" : "sequential";
        }
        else if (arg == "--delay-ms")
        {
            options.overrides["scheduling"]["inter_item_delay_ms"] = parseInteger(arg, value());
        }
        else if (arg == "--config" || arg == "-c")
        {
            options.config_path = value();
        }
        else if (arg == "--api-key")
        {
            options.overrides["api_key"] = value();
        }
        else if (arg == "--title")
        {
            options.overrides["custom_title"] = value();
        }
        else if (arg == "--single")
        {
            options.force_single = true;
        }
        else if (arg == "--collection")
        {
            options.force_collection = true;
        }
        else if (arg == "--log-level")
        {
            options.overrides["log_level"] = uppercase(value());
        }
        else if (arg == "--log-file")
        {
            options.overrides["log_file"] = value();
        }
        else if (arg == "--report")
        {
            options.report_path = value();
        }
        else if (arg == "--write-info-json")
        {
            options.overrides["write_info_json"] = true;
        }
        else if (arg == "--check")
        {
            options.check_only = true;
        }
        else if (arg == "--yes" || arg == "-y")
        {
            options.assume_yes = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw UsageError("Unknown option: " + arg);
        }
        else if (!options.url)
        {
            options.url = arg;
        }
        else
        {
            throw UsageError("Unexpected argument: " + arg);
        }
    }

    if (options.force_single && options.force_collection)
    {
        throw UsageError("--single and --collection are mutually exclusive");
    }
    if (options.url && options.url->empty())
    {
        throw UsageError("--url must not be empty");
    }
    return options;
}

PlaylistRef CliOptions::playlistRef() const
{
    PlaylistRef ref = PlaylistRef::fromUrl(url.value_or(""));
    if (force_single)
    {
        ref.kind = PlaylistKind::SINGLE_ITEM;
    }
    else if (force_collection)
    {
        ref.kind = PlaylistKind::COLLECTION;
    }
    return ref;
}

std::string CliOptions::usage(const std::string &program)
{
    std::ostringstream out;
    out << "tunegrab - download playlists as MP3\n"
        << "Usage: " << program << " [options] [URL]\n"
        << "Options:\n"
        << "  --url, -u URL           Playlist or single item URL (prompted when missing)\n"
        << "  --output, -o DIR        Output directory (default: downloads)\n"
        << "  --quality, -q KBPS      MP3 bitrate, 32-320 (default: 320)\n"
        << "  --backend, -b NAME      ytdlp or two_stage (default: ytdlp)\n"
        << "  --concurrency, -j N     Process up to N items at once (default: sequential)\n"
        << "  --delay-ms MS           Pause between sequential items (default: 1000)\n"
        << "  --config, -c FILE       JSON or YAML config file\n"
        << "  --api-key KEY           Metadata API key\n"
        << "  --title NAME            File name for a single item\n"
        << "  --single                Treat the URL as a single item\n"
        << "  --collection            Treat the URL as a playlist\n"
        << "  --log-level LEVEL       TRACE, DEBUG, INFO, WARN or ERROR\n"
        << "  --log-file FILE         Also write the log to FILE\n"
        << "  --report FILE           Write the run report as JSON\n"
        << "  --write-info-json       Keep a .info.json metadata file per item\n"
        << "  --check                 Check external tools and exit\n"
        << "  --yes, -y               Accept the notice and skip prompts\n"
        << "  --help, -h              Show this help message\n"
        << "Exit codes: 0 all ok, 1 some items failed, 2 usage error, 3 playlist unreadable, 130 interrupted\n";
    return out.str();
}
