#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/media_source_factory.hpp"

TEST(MediaSourceFactoryTest, CreatesIntegratedBackend)
{
    auto source = MediaSourceFactory::create("ytdlp", YtDlpSettings{}, Logger::null());
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->name(), "ytdlp");
}

TEST(MediaSourceFactoryTest, CreatesTwoStageBackend)
{
    auto source = MediaSourceFactory::create("two_stage", YtDlpSettings{}, Logger::null());
    ASSERT_NE(source, nullptr);
    EXPECT_EQ(source->name(), "two_stage");
}

TEST(MediaSourceFactoryTest, UnknownBackendIsConfigError)
{
    EXPECT_THROW(MediaSourceFactory::create("torrent", YtDlpSettings{}, Logger::null()), ConfigError);
    EXPECT_FALSE(MediaSourceFactory::isKnownBackend("torrent"));
    EXPECT_FALSE(MediaSourceFactory::isKnownBackend(""));
}

TEST(MediaSourceFactoryTest, BackendNamesAreAllKnown)
{
    std::vector<std::string> names = MediaSourceFactory::backendNames();
    ASSERT_EQ(names.size(), 2u);
    for (const auto &name : names)
    {
        EXPECT_TRUE(MediaSourceFactory::isKnownBackend(name)) << name;
    }
}
