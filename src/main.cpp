#include "cli/cli_options.hpp"
#include "cli/console_reporter.hpp"
#include "cli/dependency_checker.hpp"
#include "cli/interactive_prompt.hpp"
#include "core/cancellation_token.hpp"
#include "core/config_manager.hpp"
#include "core/errors.hpp"
#include "core/media_source_factory.hpp"
#include "core/run_coordinator.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <memory>

int main(int argc, char *argv[])
{
    const std::string program = argc > 0 ? argv[0] : "tunegrab";

    CliOptions options;
    try
    {
        options = CliOptions::parse(argc, argv);
    }
    catch (const UsageError &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n"
                  << CliOptions::usage(program);
        return ConsoleReporter::kExitUsage;
    }

    if (options.show_help)
    {
        std::cout << CliOptions::usage(program);
        return ConsoleReporter::kExitOk;
    }

    ConfigManager config;
    try
    {
        if (options.config_path)
        {
            config.loadFile(*options.config_path);
        }
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return ConsoleReporter::kExitUsage;
    }

    if (options.check_only)
    {
        config.update(options.overrides);
        DependencyChecker checker(config.getString("source.ytdlp_path", "yt-dlp"),
                                  config.getString("source.ffmpeg_path", "ffmpeg"), Logger::null());
        bool all_ok = DependencyChecker::printReport(checker.checkAll(), std::cout);
        return all_ok ? ConsoleReporter::kExitOk : ConsoleReporter::kExitItemFailures;
    }

    RunConfig run_config;
    try
    {
        if (!options.assume_yes)
        {
            InteractivePrompt prompt(std::cin, std::cout);
            if (!prompt.acknowledgeNotice())
            {
                std::cerr << "You must agree to the terms to continue." << std::endl;
                return ConsoleReporter::kExitUsage;
            }
            prompt.gather(options);
        }
        else if (!options.url)
        {
            throw UsageError("--url is required with --yes");
        }

        config.update(options.overrides);
        run_config = config.toRunConfig();
    }
    catch (const UsageError &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n"
                  << CliOptions::usage(program);
        return ConsoleReporter::kExitUsage;
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return ConsoleReporter::kExitUsage;
    }

    std::unique_ptr<Logger> logger_holder;
    try
    {
        logger_holder = std::make_unique<Logger>(Logger::create("tunegrab", config.logLevel(), config.logFile()));
    }
    catch (const spdlog::spdlog_ex &e)
    {
        std::cerr << "Error: cannot open log file: " << e.what() << std::endl;
        return ConsoleReporter::kExitUsage;
    }
    const Logger &logger = *logger_holder;
    const std::string backend = config.backend();
    logger.info("Starting tunegrab with " + backend + " backend, " +
                std::to_string(run_config.bitrate_kbps) + " kbps, output " + run_config.output_dir.string());

    DependencyChecker checker(config.getString("source.ytdlp_path", "yt-dlp"),
                              config.getString("source.ffmpeg_path", "ffmpeg"), logger);
    std::vector<ToolStatus> tools = {checker.checkYtDlp()};
    if (backend == MediaSourceFactory::kIntegrated)
    {
        // The two-stage backend transcodes in-process and needs no ffmpeg binary
        tools.push_back(checker.checkFfmpeg());
    }
    if (!DependencyChecker::printReport(tools, std::cout))
    {
        logger.error("Required external tools are missing");
        return ConsoleReporter::kExitUsage;
    }

    std::unique_ptr<MediaSource> source =
        MediaSourceFactory::create(backend, config.toYtDlpSettings(), logger);

    CancellationToken cancellation;
    auto &shutdown = ShutdownManager::getInstance();
    shutdown.installSignalHandlers(logger);
    shutdown.onShutdown([&cancellation]()
                        { cancellation.cancel(); });

    ConsoleReporter reporter(std::cout);
    RunCoordinator coordinator(*source, logger);
    coordinator.setProgressSink(reporter.sink());
    coordinator.setCancellationToken(&cancellation);

    PlaylistRef ref = options.playlistRef();
    logger.info(std::string(ref.isCollection() ? "Playlist" : "Single item") + ": " + ref.url);
    RunReport report = coordinator.run(ref, run_config);

    reporter.printSummary(report, run_config.output_dir);
    if (options.report_path)
    {
        try
        {
            ConsoleReporter::writeJson(report, *options.report_path);
            logger.info("Report written to " + *options.report_path);
        }
        catch (const FilesystemError &e)
        {
            logger.error(e.what());
        }
    }

    // Callbacks reference the token on this stack frame
    shutdown.reset();
    logger.flush();
    return ConsoleReporter::exitCode(report);
}
