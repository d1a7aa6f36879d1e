#pragma once

#include "core/progress_event.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

/**
 * @brief Downloads a raw media stream over HTTP(S) into a local file
 */
class HttpMediaFetcher
{
public:
    struct Settings
    {
        std::chrono::seconds connect_timeout{30};
        std::chrono::seconds read_timeout{300};
        int max_attempts = 3;
    };

    HttpMediaFetcher(Settings settings, const Logger &logger);

    /**
     * @brief Download url into target, overwriting it
     *
     * Network failures are retried with backoff. A failed download leaves no file behind.
     *
     * @return Number of bytes written
     * @throws ItemFetchError after the last failed attempt
     */
    std::uint64_t download(const std::string &url,
                           const std::map<std::string, std::string> &headers,
                           const std::filesystem::path &target,
                           const ProgressCallback &progress) const;

private:
    std::uint64_t downloadOnce(const std::string &url,
                               const std::map<std::string, std::string> &headers,
                               const std::filesystem::path &target,
                               const ProgressCallback &progress) const;

    Settings settings_;
    Logger logger_;
};
