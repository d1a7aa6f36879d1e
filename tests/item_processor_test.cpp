#include "test_base.hpp"
#include "fake_media_source.hpp"
#include "core/item_processor.hpp"

class ItemProcessorTest : public TestBase
{
protected:
    FakeMediaSource source_;
};

TEST_F(ItemProcessorTest, CollectionDestinationHasZeroPaddedPrefix)
{
    ItemDescriptor item;
    item.title = "A/B";
    item.sequence_index = 7;
    EXPECT_EQ(ItemProcessor::destinationPath(item, "out", PlaylistKind::COLLECTION),
              std::filesystem::path("out") / "007_A_B.mp3");
}

TEST_F(ItemProcessorTest, SingleItemDestinationHasNoPrefix)
{
    ItemDescriptor item;
    item.title = "Song: Live";
    EXPECT_EQ(ItemProcessor::destinationPath(item, "out", PlaylistKind::SINGLE_ITEM),
              std::filesystem::path("out") / "Song_ Live.mp3");
}

TEST_F(ItemProcessorTest, IndicesAboveThreeDigitsAreNotCut)
{
    ItemDescriptor item;
    item.title = "t";
    item.sequence_index = 1234;
    EXPECT_EQ(ItemProcessor::destinationPath(item, "", PlaylistKind::COLLECTION).filename(), "1234_t.mp3");
}

TEST_F(ItemProcessorTest, SuccessWritesDestination)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Hello"})[0];

    ItemOutcome outcome = processor.process(item, testDir(), 192, PlaylistKind::COLLECTION);

    EXPECT_TRUE(outcome.isSuccess());
    EXPECT_EQ(outcome.destination, testDir() / "001_Hello.mp3");
    EXPECT_TRUE(std::filesystem::exists(outcome.destination));
    EXPECT_EQ(source_.fetch_calls.load(), 1);
    EXPECT_EQ(source_.bitrates(), std::vector<int>{192});
}

TEST_F(ItemProcessorTest, ExistingFileIsSkippedWithoutCallingSource)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Hello"})[0];
    createDummyFile("001_Hello.mp3");

    ItemOutcome outcome = processor.process(item, testDir(), 320, PlaylistKind::COLLECTION);

    EXPECT_TRUE(outcome.isSkipped());
    EXPECT_EQ(outcome.destination, testDir() / "001_Hello.mp3");
    EXPECT_EQ(source_.fetch_calls.load(), 0);
}

TEST_F(ItemProcessorTest, SourceFailureCarriesReason)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Broken"})[0];
    source_.failing_indices = {1};

    ItemOutcome outcome = processor.process(item, testDir(), 320, PlaylistKind::COLLECTION);

    EXPECT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.reason, "scripted failure for item 1");
    EXPECT_FALSE(std::filesystem::exists(testDir() / "001_Broken.mp3"));
}

TEST_F(ItemProcessorTest, ExceptionFromSourceBecomesFailure)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Throws"})[0];
    source_.on_fetch = [](const ItemDescriptor &)
    { throw ItemFetchError("network down"); };

    ItemOutcome outcome = processor.process(item, testDir(), 320, PlaylistKind::COLLECTION);

    EXPECT_TRUE(outcome.isFailure());
    EXPECT_EQ(outcome.reason, "network down");
}

TEST_F(ItemProcessorTest, MissingOutputDirectoryIsCreated)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Nested"})[0];
    std::filesystem::path nested = testDir() / "a" / "b";

    ItemOutcome outcome = processor.process(item, nested, 320, PlaylistKind::COLLECTION);

    EXPECT_TRUE(outcome.isSuccess());
    EXPECT_TRUE(std::filesystem::exists(nested / "001_Nested.mp3"));
}

TEST_F(ItemProcessorTest, UncreatableOutputDirectoryIsFailure)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Blocked"})[0];
    // A regular file where a directory is expected
    std::filesystem::path blocker = createDummyFile("blocker");

    ItemOutcome outcome = processor.process(item, blocker / "sub", 320, PlaylistKind::COLLECTION);

    EXPECT_TRUE(outcome.isFailure());
    EXPECT_FALSE(outcome.reason.empty());
    EXPECT_EQ(source_.fetch_calls.load(), 0);
}

TEST_F(ItemProcessorTest, ProgressIsForwarded)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Progress"})[0];
    std::vector<double> seen;

    processor.process(item, testDir(), 320, PlaylistKind::COLLECTION, [&seen](double ratio)
                      { seen.push_back(ratio); });

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_DOUBLE_EQ(seen[0], 0.5);
}

TEST_F(ItemProcessorTest, UncheckableDestinationIsFailureNotFetch)
{
    ItemProcessor processor(source_, logger_);
    ItemDescriptor item = FakeMediaSource::makeItems({"Hello"})[0];
    // A path component over NAME_MAX makes the existence check itself fail
    const std::filesystem::path output_dir = testDir() / std::string(300, 'd');

    ItemOutcome outcome = processor.process(item, output_dir, 320, PlaylistKind::COLLECTION);

    EXPECT_TRUE(outcome.isFailure());
    EXPECT_NE(outcome.reason.find("Cannot check 001_Hello.mp3"), std::string::npos) << outcome.reason;
    EXPECT_EQ(source_.fetch_calls.load(), 0);
}
