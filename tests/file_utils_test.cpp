#include "test_base.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"

class FileUtilsTest : public TestBase
{
};

TEST_F(FileUtilsTest, TempStemCarriesIndexAndId)
{
    ItemDescriptor item;
    item.id = "dQw4w9WgXcQ";
    item.sequence_index = 7;
    EXPECT_EQ(FileUtils::tempStem(item), ".tmp_007_dQw4w9WgXcQ");
}

TEST_F(FileUtilsTest, TempStemSanitizesId)
{
    ItemDescriptor item;
    item.id = "a/b:c";
    item.sequence_index = 12;
    EXPECT_EQ(FileUtils::tempStem(item), ".tmp_012_a_b_c");
}

TEST_F(FileUtilsTest, EnsureDirectoryCreatesParents)
{
    fs::path nested = testDir() / "x" / "y" / "z";
    FileUtils::ensureDirectory(nested);
    EXPECT_TRUE(FileUtils::isValidDirectory(nested));
    // Existing directory is fine
    EXPECT_NO_THROW(FileUtils::ensureDirectory(nested));
}

TEST_F(FileUtilsTest, EnsureDirectoryOnFileThrows)
{
    fs::path file = createDummyFile("plain");
    EXPECT_THROW(FileUtils::ensureDirectory(file), FilesystemError);
    EXPECT_THROW(FileUtils::ensureDirectory(file / "child"), FilesystemError);
}

TEST_F(FileUtilsTest, MoveIntoPlaceReplacesTarget)
{
    fs::path from = createDummyFile(".tmp_001_a.mp3", "new");
    fs::path to = createDummyFile("001_a.mp3", "old");

    FileUtils::moveIntoPlace(from, to);

    EXPECT_FALSE(fs::exists(from));
    std::ifstream in(to);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "new");
}

TEST_F(FileUtilsTest, MoveIntoPlaceMissingSourceThrows)
{
    EXPECT_THROW(FileUtils::moveIntoPlace(testDir() / "absent", testDir() / "target"), FilesystemError);
}

TEST_F(FileUtilsTest, RemoveQuietlyReportsWhetherSomethingWasRemoved)
{
    fs::path file = createDummyFile("gone");
    EXPECT_TRUE(FileUtils::removeQuietly(file));
    EXPECT_FALSE(FileUtils::removeQuietly(file));
}

TEST_F(FileUtilsTest, RemoveByPrefixOnlyTouchesMatchingFiles)
{
    createDummyFile(".tmp_001_a.webm");
    createDummyFile(".tmp_001_a.mp3");
    createDummyFile(".tmp_001_a.info.json");
    createDummyFile(".tmp_002_b.webm");
    createDummyFile("001_a.mp3");

    EXPECT_EQ(FileUtils::removeByPrefix(testDir(), ".tmp_001_a"), 3u);
    EXPECT_EQ(listFiles(testDir()), (std::vector<std::string>{".tmp_002_b.webm", "001_a.mp3"}));
}

TEST_F(FileUtilsTest, RemoveByPrefixOnMissingDirectoryIsZero)
{
    EXPECT_EQ(FileUtils::removeByPrefix(testDir() / "absent", ".tmp_"), 0u);
}

TEST_F(FileUtilsTest, FindByPrefixMatchesExactExtension)
{
    createDummyFile(".tmp_003_c.mp3");
    createDummyFile(".tmp_003_c.webm");

    auto found = FileUtils::findByPrefix(testDir(), ".tmp_003_c", "mp3");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), ".tmp_003_c.mp3");
    EXPECT_FALSE(FileUtils::findByPrefix(testDir(), ".tmp_003_c", "m4a").has_value());
}

TEST_F(FileUtilsTest, IsValidDirectory)
{
    EXPECT_TRUE(FileUtils::isValidDirectory(testDir()));
    EXPECT_FALSE(FileUtils::isValidDirectory(createDummyFile("f")));
    EXPECT_FALSE(FileUtils::isValidDirectory(testDir() / "absent"));
}
