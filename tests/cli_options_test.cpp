#include <gtest/gtest.h>
#include "cli/cli_options.hpp"
#include "core/errors.hpp"

TEST(CliOptionsTest, EmptyCommandLineHasNoUrl)
{
    CliOptions options = CliOptions::parse(std::vector<std::string>{});
    EXPECT_FALSE(options.url.has_value());
    EXPECT_TRUE(options.overrides.empty());
    EXPECT_FALSE(options.assume_yes);
}

TEST(CliOptionsTest, PositionalArgumentIsTheUrl)
{
    CliOptions options = CliOptions::parse({"https://www.youtube.com/playlist?list=PL1"});
    ASSERT_TRUE(options.url.has_value());
    EXPECT_EQ(*options.url, "https://www.youtube.com/playlist?list=PL1");
    EXPECT_TRUE(options.playlistRef().isCollection());
}

TEST(CliOptionsTest, SettingsBecomeConfigOverrides)
{
    CliOptions options = CliOptions::parse({"-u", "https://x.test/watch?v=1", "-o", "music", "-q", "192",
                                            "--backend", "two_stage", "--delay-ms", "0",
                                            "--log-level", "debug", "--write-info-json"});
    EXPECT_EQ(options.overrides["output_dir"], "music");
    EXPECT_EQ(options.overrides["audio"]["bitrate_kbps"], 192);
    EXPECT_EQ(options.overrides["source"]["backend"], "two_stage");
    EXPECT_EQ(options.overrides["scheduling"]["inter_item_delay_ms"], 0);
    EXPECT_EQ(options.overrides["log_level"], "DEBUG");
    EXPECT_EQ(options.overrides["write_info_json"], true);
}

TEST(CliOptionsTest, ConcurrencyAboveOneSelectsConcurrentMode)
{
    CliOptions concurrent = CliOptions::parse({"-j", "4"});
    EXPECT_EQ(concurrent.overrides["scheduling"]["mode"], "concurrent");
    EXPECT_EQ(concurrent.overrides["scheduling"]["concurrency_limit"], 4);

    CliOptions sequential = CliOptions::parse({"--concurrency", "1"});
    EXPECT_EQ(sequential.overrides["scheduling"]["mode"], "sequential");
}

TEST(CliOptionsTest, SingleForcesSingleItem)
{
    CliOptions options = CliOptions::parse({"--single", "https://www.youtube.com/watch?v=a&list=PL1"});
    EXPECT_EQ(options.playlistRef().kind, PlaylistKind::SINGLE_ITEM);
}

TEST(CliOptionsTest, CollectionForcesCollection)
{
    CliOptions options = CliOptions::parse({"--collection", "https://www.youtube.com/watch?v=a"});
    EXPECT_EQ(options.playlistRef().kind, PlaylistKind::COLLECTION);
}

TEST(CliOptionsTest, SingleAndCollectionTogetherAreRejected)
{
    EXPECT_THROW(CliOptions::parse({"--single", "--collection", "u"}), UsageError);
}

TEST(CliOptionsTest, UnknownOptionIsRejected)
{
    EXPECT_THROW(CliOptions::parse({"--frobnicate"}), UsageError);
}

TEST(CliOptionsTest, MissingValueIsRejected)
{
    EXPECT_THROW(CliOptions::parse({"--output"}), UsageError);
}

TEST(CliOptionsTest, NonNumericQualityIsRejected)
{
    EXPECT_THROW(CliOptions::parse({"-q", "high"}), UsageError);
    EXPECT_THROW(CliOptions::parse({"-q", "320k"}), UsageError);
}

TEST(CliOptionsTest, SecondPositionalIsRejected)
{
    EXPECT_THROW(CliOptions::parse({"url-one", "url-two"}), UsageError);
}

TEST(CliOptionsTest, EmptyUrlIsRejected)
{
    EXPECT_THROW(CliOptions::parse({"--url", ""}), UsageError);
}

TEST(CliOptionsTest, FlagsAreRecorded)
{
    const char *argv[] = {"tunegrab", "--check", "-y", "--report", "run.json", "-c", "cfg.yaml", "-h"};
    CliOptions options = CliOptions::parse(8, argv);
    EXPECT_TRUE(options.check_only);
    EXPECT_TRUE(options.assume_yes);
    EXPECT_TRUE(options.show_help);
    EXPECT_EQ(options.report_path.value_or(""), "run.json");
    EXPECT_EQ(options.config_path.value_or(""), "cfg.yaml");
}

TEST(CliOptionsTest, UsageMentionsProgramAndExitCodes)
{
    std::string text = CliOptions::usage("tunegrab");
    EXPECT_NE(text.find("Usage: tunegrab"), std::string::npos);
    EXPECT_NE(text.find("--concurrency"), std::string::npos);
    EXPECT_NE(text.find("130 interrupted"), std::string::npos);
}
