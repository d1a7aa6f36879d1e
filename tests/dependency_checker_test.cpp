#include "test_base.hpp"
#include "cli/dependency_checker.hpp"
#include <sstream>

class DependencyCheckerTest : public TestBase
{
protected:
    std::string tool(const std::string &name, const std::string &body)
    {
        std::filesystem::path script = createDummyFile("bin/" + name, "#!/bin/sh\n" + body);
        std::filesystem::permissions(script, std::filesystem::perms::owner_all);
        return script.string();
    }
};

TEST_F(DependencyCheckerTest, ReportsVersionsOfWorkingTools)
{
    DependencyChecker checker(tool("yt-dlp", "echo 2024.08.06\n"),
                              tool("ffmpeg", "echo 'ffmpeg version 6.1.1-3ubuntu5 Copyright (c) 2000-2023'\n"),
                              logger_);

    ToolStatus ytdlp = checker.checkYtDlp();
    EXPECT_TRUE(ytdlp.available);
    EXPECT_EQ(ytdlp.version, "2024.08.06");

    ToolStatus ffmpeg = checker.checkFfmpeg();
    EXPECT_TRUE(ffmpeg.available);
    EXPECT_EQ(ffmpeg.version, "6.1.1-3ubuntu5");
}

TEST_F(DependencyCheckerTest, FailingToolIsMissing)
{
    DependencyChecker checker(tool("yt-dlp", "echo 'broken install' >&2\nexit 1\n"),
                              (testDir() / "bin" / "no-ffmpeg").string(), logger_);

    std::vector<ToolStatus> statuses = checker.checkAll();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_FALSE(statuses[0].available);
    EXPECT_EQ(statuses[0].detail, "broken install");
    EXPECT_FALSE(statuses[1].available);
}

TEST_F(DependencyCheckerTest, ReportListsMissingToolsWithHints)
{
    std::vector<ToolStatus> statuses(2);
    statuses[0].name = "yt-dlp";
    statuses[0].executable = "yt-dlp";
    statuses[0].available = true;
    statuses[0].version = "2024.08.06";
    statuses[1].name = "FFmpeg";
    statuses[1].executable = "ffmpeg";

    std::ostringstream out;
    EXPECT_FALSE(DependencyChecker::printReport(statuses, out));
    EXPECT_NE(out.str().find("[ok]      yt-dlp 2024.08.06"), std::string::npos);
    EXPECT_NE(out.str().find("[missing] FFmpeg (ffmpeg)"), std::string::npos);
    EXPECT_NE(out.str().find("FFmpeg installation"), std::string::npos);
    EXPECT_EQ(out.str().find("yt-dlp installation"), std::string::npos);
}

TEST_F(DependencyCheckerTest, FfmpegVersionFallsBackToInstalled)
{
    EXPECT_EQ(DependencyChecker::extractFfmpegVersion("ffmpeg version n7.0 Copyright"), "n7.0");
    EXPECT_EQ(DependencyChecker::extractFfmpegVersion("something unexpected"), "installed");
}
