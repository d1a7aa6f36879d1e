#include "test_base.hpp"
#include "fake_media_source.hpp"
#include "core/run_coordinator.hpp"
#include <mutex>

class RunCoordinatorTest : public TestBase
{
protected:
    RunConfig config() const
    {
        RunConfig cfg;
        cfg.output_dir = testDir() / "out";
        cfg.inter_item_delay = std::chrono::milliseconds(0);
        return cfg;
    }

    PlaylistRef collection() const
    {
        return PlaylistRef::fromUrl("https://www.youtube.com/playlist?list=PLtest");
    }

    PlaylistRef single() const
    {
        return PlaylistRef::fromUrl("https://www.youtube.com/watch?v=abc");
    }

    FakeMediaSource source_;
};

TEST_F(RunCoordinatorTest, SanitizedNamesGetSequencePrefixes)
{
    source_.items = FakeMediaSource::makeItems({"A/B", "", std::string(250, 'C')});
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(collection(), config());

    EXPECT_EQ(report.ledger, (LedgerSnapshot{3, 3, 0, 0}));
    EXPECT_EQ(report.final_state, RunState::DONE);
    std::vector<std::string> expected = {"001_A_B.mp3", "002__.mp3",
                                         "003_" + std::string(200, 'C') + "....mp3"};
    EXPECT_EQ(listFiles(config().output_dir), expected);
}

TEST_F(RunCoordinatorTest, SingleItemWithExistingFileIsSkipped)
{
    RunConfig cfg = config();
    cfg.custom_title = "My Song";
    std::filesystem::create_directories(cfg.output_dir);
    std::ofstream(cfg.output_dir / "My Song.mp3") << "existing";
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(single(), cfg);

    EXPECT_EQ(report.ledger, (LedgerSnapshot{1, 0, 0, 1}));
    EXPECT_EQ(source_.fetch_calls.load(), 0);
    EXPECT_EQ(source_.describe_calls.load(), 0);
    EXPECT_EQ(source_.resolve_calls.load(), 0);
    ASSERT_EQ(report.items.size(), 1u);
    EXPECT_TRUE(report.items[0].outcome.isSkipped());
}

TEST_F(RunCoordinatorTest, SingleItemUsesDescribedTitleWithoutPrefix)
{
    source_.described.id = "abc";
    source_.described.title = "Described Title";
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.runSingle("https://www.youtube.com/watch?v=abc", config());

    EXPECT_EQ(report.ledger, (LedgerSnapshot{1, 1, 0, 0}));
    EXPECT_EQ(source_.describe_calls.load(), 1);
    EXPECT_EQ(source_.resolve_calls.load(), 0);
    EXPECT_EQ(listFiles(config().output_dir), std::vector<std::string>{"Described Title.mp3"});
}

TEST_F(RunCoordinatorTest, SingleItemDescribeFailureIsResolutionError)
{
    source_.describe_error = "video unavailable";
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(single(), config());

    EXPECT_TRUE(report.resolutionFailed());
    EXPECT_EQ(report.ledger.total, 0u);
    ASSERT_TRUE(report.resolution_error.has_value());
    EXPECT_EQ(*report.resolution_error, "video unavailable");
}

TEST_F(RunCoordinatorTest, OneFailureDoesNotStopTheRun)
{
    source_.items = FakeMediaSource::makeItems({"one", "two", "three", "four", "five"});
    source_.failing_indices = {3};
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(collection(), config());

    EXPECT_EQ(report.ledger, (LedgerSnapshot{5, 4, 1, 0}));
    EXPECT_EQ(source_.fetchedIndices(), (std::vector<std::size_t>{1, 2, 3, 4, 5}));
    ASSERT_EQ(report.items.size(), 5u);
    EXPECT_TRUE(report.items[2].outcome.isFailure());
    EXPECT_EQ(report.items[2].outcome.reason, "scripted failure for item 3");
    EXPECT_FALSE(report.interrupted);
}

TEST_F(RunCoordinatorTest, BoundedConcurrencyMatchesSequentialLedger)
{
    source_.items = FakeMediaSource::makeItems({"w", "x", "y", "z"});
    source_.fetch_delay = std::chrono::milliseconds(50);
    RunConfig cfg = config();
    cfg.scheduling = SchedulingMode::BOUNDED_CONCURRENCY;
    cfg.concurrency_limit = 2;
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(collection(), cfg);

    EXPECT_EQ(report.ledger, (LedgerSnapshot{4, 4, 0, 0}));
    EXPECT_LE(source_.peak_in_flight.load(), 2);
    EXPECT_EQ(listFiles(cfg.output_dir),
              (std::vector<std::string>{"001_w.mp3", "002_x.mp3", "003_y.mp3", "004_z.mp3"}));
}

TEST_F(RunCoordinatorTest, ReportItemsAreInResolutionOrderUnderConcurrency)
{
    source_.items = FakeMediaSource::makeItems({"a", "b", "c", "d", "e", "f"});
    RunConfig cfg = config();
    cfg.scheduling = SchedulingMode::BOUNDED_CONCURRENCY;
    cfg.concurrency_limit = 3;
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(collection(), cfg);

    ASSERT_EQ(report.items.size(), 6u);
    for (std::size_t i = 1; i < report.items.size(); ++i)
    {
        EXPECT_LT(report.items[i - 1].item.sequence_index, report.items[i].item.sequence_index);
        EXPECT_LT(report.items[i - 1].outcome.destination.filename().string(),
                  report.items[i].outcome.destination.filename().string());
    }
}

TEST_F(RunCoordinatorTest, SecondRunSkipsEverything)
{
    source_.items = FakeMediaSource::makeItems({"a", "b", "c"});
    RunCoordinator coordinator(source_, logger_);

    RunReport first = coordinator.run(collection(), config());
    ASSERT_EQ(first.ledger, (LedgerSnapshot{3, 3, 0, 0}));

    RunReport second = coordinator.run(collection(), config());
    EXPECT_EQ(second.ledger, (LedgerSnapshot{3, 0, 0, 3}));
    EXPECT_EQ(source_.fetch_calls.load(), 3);
}

TEST_F(RunCoordinatorTest, ResolutionFailureIsDistinctFromEmptySuccess)
{
    source_.resolve_error = "playlist does not exist";
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(collection(), config());

    EXPECT_TRUE(report.resolutionFailed());
    EXPECT_EQ(report.final_state, RunState::RESOLUTION_FAILED);
    EXPECT_EQ(report.ledger, (LedgerSnapshot{0, 0, 0, 0}));
    EXPECT_EQ(report.resolution_error.value_or(""), "playlist does not exist");
    EXPECT_EQ(source_.fetch_calls.load(), 0);
    EXPECT_EQ(coordinator.state(), RunState::RESOLUTION_FAILED);
}

TEST_F(RunCoordinatorTest, EmptyResolutionIsResolutionFailure)
{
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(collection(), config());

    EXPECT_TRUE(report.resolutionFailed());
    EXPECT_TRUE(report.resolution_error.has_value());
    EXPECT_EQ(report.ledger.total, 0u);
}

TEST_F(RunCoordinatorTest, LedgerIsBalancedAtRunEnd)
{
    source_.items = FakeMediaSource::makeItems({"a", "b", "c", "d"});
    source_.failing_indices = {2};
    RunConfig cfg = config();
    std::filesystem::create_directories(cfg.output_dir);
    std::ofstream(cfg.output_dir / "004_d.mp3") << "existing";
    RunCoordinator coordinator(source_, logger_);

    RunReport report = coordinator.run(collection(), cfg);

    EXPECT_EQ(report.ledger, (LedgerSnapshot{4, 2, 1, 1}));
    EXPECT_TRUE(report.ledger.isBalanced());
}

TEST_F(RunCoordinatorTest, CancellationStopsNewItems)
{
    source_.items = FakeMediaSource::makeItems({"a", "b", "c", "d"});
    CancellationToken token;
    source_.on_fetch = [&token](const ItemDescriptor &item)
    {
        if (item.sequence_index == 2)
        {
            token.cancel();
        }
    };
    RunCoordinator coordinator(source_, logger_);
    coordinator.setCancellationToken(&token);

    RunReport report = coordinator.run(collection(), config());

    // Item 2 was already in flight and completes
    EXPECT_EQ(report.ledger, (LedgerSnapshot{4, 2, 0, 0}));
    EXPECT_TRUE(report.interrupted);
    EXPECT_FALSE(report.ledger.isBalanced());
    EXPECT_EQ(report.items.size(), 2u);
}

TEST_F(RunCoordinatorTest, CancellationInterruptsPacingDelay)
{
    source_.items = FakeMediaSource::makeItems({"a", "b"});
    RunConfig cfg = config();
    cfg.inter_item_delay = std::chrono::seconds(30);
    CancellationToken token;
    source_.on_fetch = [&token](const ItemDescriptor &)
    { token.cancel(); };
    RunCoordinator coordinator(source_, logger_);
    coordinator.setCancellationToken(&token);

    auto started = std::chrono::steady_clock::now();
    RunReport report = coordinator.run(collection(), cfg);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(report.ledger, (LedgerSnapshot{2, 1, 0, 0}));
    EXPECT_TRUE(report.interrupted);
}

TEST_F(RunCoordinatorTest, PacingDelayAppliesBetweenSequentialItems)
{
    source_.items = FakeMediaSource::makeItems({"a", "b", "c"});
    RunConfig cfg = config();
    cfg.inter_item_delay = std::chrono::milliseconds(100);
    RunCoordinator coordinator(source_, logger_);

    auto started = std::chrono::steady_clock::now();
    coordinator.run(collection(), cfg);
    auto elapsed = std::chrono::steady_clock::now() - started;

    // Two pauses, none after the last item
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
}

TEST_F(RunCoordinatorTest, ProgressEventsArriveInItemLifecycleOrder)
{
    source_.items = FakeMediaSource::makeItems({"a", "b"});
    source_.failing_indices = {2};
    std::vector<ProgressEvent> events;
    RunCoordinator coordinator(source_, logger_);
    coordinator.setProgressSink([&events](const ProgressEvent &event)
                                { events.push_back(event); });

    coordinator.run(collection(), config());

    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(events[0].type, ProgressEvent::Type::STARTED);
    EXPECT_EQ(events[1].type, ProgressEvent::Type::PROGRESS);
    EXPECT_DOUBLE_EQ(events[1].ratio, 0.5);
    EXPECT_EQ(events[2].type, ProgressEvent::Type::COMPLETED);
    EXPECT_EQ(events[3].sequence_index, 2u);
    EXPECT_EQ(events[5].type, ProgressEvent::Type::FAILED);
    EXPECT_EQ(events[5].message, "scripted failure for item 2");
}

TEST_F(RunCoordinatorTest, SinkCanReplaceItselfDuringRun)
{
    source_.items = FakeMediaSource::makeItems({"a", "b"});
    source_.failing_indices = {2};
    std::vector<ProgressEvent> first;
    std::vector<ProgressEvent> second;
    RunCoordinator coordinator(source_, logger_);
    coordinator.setProgressSink([&](const ProgressEvent &event)
                                {
                                    first.push_back(event);
                                    coordinator.setProgressSink([&second](const ProgressEvent &next)
                                                                { second.push_back(next); });
                                });

    RunReport report = coordinator.run(collection(), config());

    EXPECT_EQ(report.ledger, (LedgerSnapshot{2, 1, 1, 0}));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].type, ProgressEvent::Type::STARTED);
    ASSERT_EQ(second.size(), 5u);
    EXPECT_EQ(second.back().type, ProgressEvent::Type::FAILED);
}

TEST_F(RunCoordinatorTest, ThrowingSinkDoesNotAffectOutcomes)
{
    source_.items = FakeMediaSource::makeItems({"a", "b"});
    RunCoordinator coordinator(source_, logger_);
    coordinator.setProgressSink([](const ProgressEvent &)
                                { throw std::runtime_error("sink broke"); });

    RunReport report = coordinator.run(collection(), config());

    EXPECT_EQ(report.ledger, (LedgerSnapshot{2, 2, 0, 0}));
}

TEST_F(RunCoordinatorTest, ReportSerializesToJson)
{
    source_.items = FakeMediaSource::makeItems({"a", "b"});
    source_.failing_indices = {2};
    RunCoordinator coordinator(source_, logger_);

    nlohmann::json doc = coordinator.run(collection(), config()).toJson();

    EXPECT_EQ(doc["state"], "done");
    EXPECT_EQ(doc["ledger"]["total"], 2);
    ASSERT_EQ(doc["items"].size(), 2u);
    EXPECT_EQ(doc["items"][0]["outcome"], "success");
    EXPECT_EQ(doc["items"][1]["outcome"], "failure");
    EXPECT_EQ(doc["items"][1]["reason"], "scripted failure for item 2");
    EXPECT_FALSE(doc.contains("resolution_error"));
}
