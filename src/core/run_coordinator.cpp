#include "core/run_coordinator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>
#include <tbb/task_arena.h>
#include <thread>

const char *runStateName(RunState state)
{
    switch (state)
    {
    case RunState::IDLE:
        return "idle";
    case RunState::RESOLVING:
        return "resolving";
    case RunState::ITERATING:
        return "iterating";
    case RunState::REPORTING:
        return "reporting";
    case RunState::DONE:
        return "done";
    case RunState::RESOLUTION_FAILED:
        return "resolution_failed";
    }
    return "unknown";
}

nlohmann::json RunReport::toJson() const
{
    nlohmann::json doc;
    doc["ledger"] = ledger.toJson();
    doc["state"] = runStateName(final_state);
    doc["interrupted"] = interrupted;
    doc["elapsed_seconds"] = static_cast<double>(elapsed.count()) / 1000.0;
    if (resolution_error)
    {
        doc["resolution_error"] = *resolution_error;
    }

    nlohmann::json entries = nlohmann::json::array();
    for (const auto &record : items)
    {
        nlohmann::json entry{
            {"sequence_index", record.item.sequence_index},
            {"id", record.item.id},
            {"title", record.item.title},
            {"outcome", outcomeKindName(record.outcome.kind)},
            {"destination", record.outcome.destination.string()}};
        if (!record.outcome.reason.empty())
        {
            entry["reason"] = record.outcome.reason;
        }
        entries.push_back(entry);
    }
    doc["items"] = entries;
    return doc;
}

RunCoordinator::RunCoordinator(MediaSource &source, const Logger &logger)
    : source_(source), processor_(source, logger), logger_(logger)
{
}

void RunCoordinator::setProgressSink(ProgressSink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void RunCoordinator::setCancellationToken(const CancellationToken *token)
{
    cancellation_ = token;
}

RunReport RunCoordinator::runSingle(const std::string &url, const RunConfig &config)
{
    PlaylistRef ref;
    ref.url = url;
    ref.kind = PlaylistKind::SINGLE_ITEM;
    return run(ref, config);
}

RunReport RunCoordinator::run(const PlaylistRef &ref, const RunConfig &config)
{
    const auto started = std::chrono::steady_clock::now();
    StatsLedger ledger;
    RunReport report;
    state_.store(RunState::IDLE);

    if (config.api_key)
    {
        logger_.debug("Metadata API key supplied; " + source_.name() + " backend reads metadata itself");
    }

    transition(RunState::RESOLVING);
    std::vector<ItemDescriptor> items;
    try
    {
        items = resolveItems(ref, config);
    }
    catch (const ResolutionError &e)
    {
        logger_.error(std::string("Resolution failed: ") + e.what());
        transition(RunState::RESOLUTION_FAILED);
        report.final_state = RunState::RESOLUTION_FAILED;
        report.resolution_error = e.what();
        report.ledger = ledger.snapshot();
        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return report;
    }

    std::sort(items.begin(), items.end(), [](const ItemDescriptor &a, const ItemDescriptor &b)
              { return a.sequence_index < b.sequence_index; });

    // total is fixed before any item runs so an interrupted run still reports it
    ledger.setTotal(items.size());

    transition(RunState::ITERATING);
    std::vector<std::optional<ItemOutcome>> outcomes(items.size());
    const bool bounded = config.scheduling == SchedulingMode::BOUNDED_CONCURRENCY && ref.isCollection() &&
                         config.concurrency_limit > 1 && items.size() > 1;
    if (bounded)
    {
        runBounded(items, ref.kind, config, ledger, outcomes);
    }
    else
    {
        runSequential(items, ref.kind, config, ledger, outcomes);
    }

    transition(RunState::REPORTING);
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (outcomes[i])
        {
            report.items.push_back(ItemRecord{items[i], *outcomes[i]});
        }
        else
        {
            report.interrupted = true;
        }
    }
    report.ledger = ledger.snapshot();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (report.interrupted)
    {
        logger_.warn("Run interrupted after " + std::to_string(report.ledger.recorded()) + " of " +
                     std::to_string(report.ledger.total) + " items");
    }
    logger_.info("Run finished: " + report.ledger.toString());

    transition(RunState::DONE);
    report.final_state = RunState::DONE;
    return report;
}

std::vector<ItemDescriptor> RunCoordinator::resolveItems(const PlaylistRef &ref, const RunConfig &config)
{
    if (ref.isCollection())
    {
        logger_.info("Resolving playlist " + ref.url + " via " + source_.name());
        std::vector<ItemDescriptor> items = source_.resolve(ref);
        if (items.empty())
        {
            throw ResolutionError("Playlist " + ref.url + " has no valid entries");
        }
        return items;
    }

    ItemDescriptor item;
    if (config.custom_title)
    {
        item.title = *config.custom_title;
        item.fetch_handle = ref.url;
    }
    else
    {
        item = source_.describe(ref);
    }
    item.sequence_index = 1;
    return {item};
}

void RunCoordinator::runSequential(const std::vector<ItemDescriptor> &items, PlaylistKind kind,
                                   const RunConfig &config, StatsLedger &ledger,
                                   std::vector<std::optional<ItemOutcome>> &outcomes)
{
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (cancelled())
        {
            return;
        }
        outcomes[i] = processOne(items[i], kind, config, ledger);

        const bool last = i + 1 == items.size();
        if (!last && config.inter_item_delay.count() > 0 && !pause(config.inter_item_delay))
        {
            return;
        }
    }
}

void RunCoordinator::runBounded(const std::vector<ItemDescriptor> &items, PlaylistKind kind,
                                const RunConfig &config, StatsLedger &ledger,
                                std::vector<std::optional<ItemOutcome>> &outcomes)
{
    const int limit = static_cast<int>(std::min(config.concurrency_limit, items.size()));
    logger_.info("Processing " + std::to_string(items.size()) + " items with up to " +
                 std::to_string(limit) + " in flight");

    // Items spend their time waiting on I/O, so allow more threads than cores
    tbb::global_control parallelism(tbb::global_control::max_allowed_parallelism,
                                    static_cast<std::size_t>(limit));
    tbb::task_arena arena(limit);
    arena.execute([&]()
                  { tbb::parallel_for(
                        tbb::blocked_range<std::size_t>(0, items.size(), 1),
                        [&](const tbb::blocked_range<std::size_t> &range)
                        {
                            for (std::size_t i = range.begin(); i != range.end(); ++i)
                            {
                                if (cancelled())
                                {
                                    continue;
                                }
                                outcomes[i] = processOne(items[i], kind, config, ledger);
                            }
                        },
                        tbb::simple_partitioner()); });
}

ItemOutcome RunCoordinator::processOne(const ItemDescriptor &item, PlaylistKind kind, const RunConfig &config,
                                       StatsLedger &ledger)
{
    ProgressEvent started;
    started.type = ProgressEvent::Type::STARTED;
    started.sequence_index = item.sequence_index;
    started.title = item.title;
    emit(started);

    ProgressCallback forward = [this, &item](double ratio)
    {
        ProgressEvent event;
        event.type = ProgressEvent::Type::PROGRESS;
        event.sequence_index = item.sequence_index;
        event.title = item.title;
        event.ratio = std::clamp(ratio, 0.0, 1.0);
        emit(event);
    };

    ItemOutcome outcome = processor_.process(item, config.output_dir, config.bitrate_kbps, kind, forward);
    ledger.record(outcome);

    ProgressEvent finished;
    finished.sequence_index = item.sequence_index;
    finished.title = item.title;
    switch (outcome.kind)
    {
    case ItemOutcome::Kind::SUCCESS:
        finished.type = ProgressEvent::Type::COMPLETED;
        finished.ratio = 1.0;
        break;
    case ItemOutcome::Kind::SKIPPED:
        finished.type = ProgressEvent::Type::SKIPPED;
        finished.ratio = 1.0;
        break;
    case ItemOutcome::Kind::FAILURE:
        finished.type = ProgressEvent::Type::FAILED;
        finished.message = outcome.reason;
        break;
    }
    emit(finished);
    return outcome;
}

bool RunCoordinator::cancelled() const
{
    return cancellation_ && cancellation_->isCancelled();
}

// false when cancelled during the delay
bool RunCoordinator::pause(std::chrono::milliseconds delay) const
{
    if (cancellation_)
    {
        return !cancellation_->waitFor(delay);
    }
    std::this_thread::sleep_for(delay);
    return true;
}

void RunCoordinator::emit(const ProgressEvent &event)
{
    // Sink calls are serialized by emit_mutex_; sink_mutex_ only guards the handle,
    // so a sink may replace itself through setProgressSink
    std::lock_guard<std::mutex> serialize(emit_mutex_);
    ProgressSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (!sink)
    {
        return;
    }
    try
    {
        sink(event);
    }
    catch (const std::exception &e)
    {
        logger_.warn(std::string("Progress sink threw: ") + e.what());
    }
}

void RunCoordinator::transition(RunState next)
{
    RunState previous = state_.exchange(next);
    logger_.debug(std::string("Run state ") + runStateName(previous) + " -> " + runStateName(next));
}
