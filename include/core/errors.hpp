#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief A playlist reference could not be turned into an item list
 *
 * Fatal to a run: no item is processed and the report carries the message.
 */
class ResolutionError : public std::runtime_error
{
public:
    explicit ResolutionError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Download or transcode of a single item failed
 */
class ItemFetchError : public std::runtime_error
{
public:
    explicit ItemFetchError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Output directory or destination file could not be created/written
 */
class FilesystemError : public std::runtime_error
{
public:
    explicit FilesystemError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief An external tool could not be launched
 */
class ProcessError : public std::runtime_error
{
public:
    explicit ProcessError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief FFmpeg decode/encode failure
 */
class TranscodeError : public std::runtime_error
{
public:
    explicit TranscodeError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Malformed command line
 */
class UsageError : public std::runtime_error
{
public:
    explicit UsageError(const std::string &message) : std::runtime_error(message) {}
};
