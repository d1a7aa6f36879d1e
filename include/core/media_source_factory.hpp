#pragma once

#include "core/media_source.hpp"
#include "core/ytdlp_client.hpp"
#include "logging/logger.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Creates the media source backend named in the configuration
 */
class MediaSourceFactory
{
public:
    static constexpr const char *kIntegrated = "ytdlp";
    static constexpr const char *kTwoStage = "two_stage";

    /**
     * @brief Build a backend by name
     * @throws ConfigError for an unknown name
     */
    static std::unique_ptr<MediaSource> create(const std::string &backend, const YtDlpSettings &settings,
                                               const Logger &logger);

    static bool isKnownBackend(const std::string &backend);

    static std::vector<std::string> backendNames();
};
