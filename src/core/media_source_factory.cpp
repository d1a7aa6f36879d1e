#include "core/media_source_factory.hpp"
#include "core/errors.hpp"
#include "core/two_stage_media_source.hpp"
#include "core/ytdlp_media_source.hpp"

std::unique_ptr<MediaSource> MediaSourceFactory::create(const std::string &backend, const YtDlpSettings &settings,
                                                        const Logger &logger)
{
    if (backend == kIntegrated)
    {
        return std::make_unique<YtDlpMediaSource>(settings, logger);
    }
    if (backend == kTwoStage)
    {
        return std::make_unique<TwoStageMediaSource>(settings, logger);
    }
    throw ConfigError("Unknown source backend: " + backend);
}

bool MediaSourceFactory::isKnownBackend(const std::string &backend)
{
    return backend == kIntegrated || backend == kTwoStage;
}

std::vector<std::string> MediaSourceFactory::backendNames()
{
    return {kIntegrated, kTwoStage};
}
