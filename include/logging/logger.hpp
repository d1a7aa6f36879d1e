#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Logging handle backed by spdlog
 *
 * A Logger is constructed once by the application and passed by reference to the
 * components that report through it. Copies share the same underlying spdlog logger.
 */
class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    /**
     * @brief Create a console logger, optionally mirrored to a file
     * @param name Logger name shown in the output
     * @param log_level Level name (TRACE, DEBUG, INFO, WARN, ERROR)
     * @param log_file Optional log file path, empty for console only
     */
    static Logger create(const std::string &name, const std::string &log_level = "INFO",
                         const std::string &log_file = "")
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
        Logger handle(logger);
        handle.setLevel(log_level);
        return handle;
    }

    /**
     * @brief Logger that discards everything (tests)
     */
    static Logger null()
    {
        return Logger(std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>()));
    }

    static spdlog::level::level_enum parseLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "INFO")
            return spdlog::level::info;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;
        return spdlog::level::info;
    }

    static bool isValidLevel(const std::string &log_level)
    {
        return log_level == "TRACE" || log_level == "DEBUG" || log_level == "INFO" ||
               log_level == "WARN" || log_level == "ERROR";
    }

    void setLevel(const std::string &log_level)
    {
        if (!isValidLevel(log_level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
        logger_->set_level(parseLevel(log_level));
    }

    void trace(const std::string &message) const
    {
        log(Level::TRACE, message);
    }

    void debug(const std::string &message) const
    {
        log(Level::DEBUG, message);
    }

    void info(const std::string &message) const
    {
        log(Level::INFO, message);
    }

    void warn(const std::string &message) const
    {
        log(Level::WARN, message);
    }

    void error(const std::string &message) const
    {
        log(Level::ERROR, message);
    }

    void flush() const
    {
        logger_->flush();
    }

private:
    explicit Logger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    void log(Level level, const std::string &message) const
    {
        switch (level)
        {
        case Level::TRACE:
            logger_->trace(message);
            break;
        case Level::DEBUG:
            logger_->debug(message);
            break;
        case Level::INFO:
            logger_->info(message);
            break;
        case Level::WARN:
            logger_->warn(message);
            break;
        case Level::ERROR:
            logger_->error(message);
            break;
        }
    }

    std::shared_ptr<spdlog::logger> logger_;
};
