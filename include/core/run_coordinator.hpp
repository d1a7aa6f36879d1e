#pragma once

#include "core/cancellation_token.hpp"
#include "core/item_processor.hpp"
#include "core/media_source.hpp"
#include "core/playlist_types.hpp"
#include "core/progress_event.hpp"
#include "core/stats_ledger.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Lifecycle of one run: Idle -> Resolving -> Iterating -> Reporting -> Done
 *
 * RESOLUTION_FAILED is terminal and replaces the rest of the sequence.
 */
enum class RunState
{
    IDLE,
    RESOLVING,
    ITERATING,
    REPORTING,
    DONE,
    RESOLUTION_FAILED
};

const char *runStateName(RunState state);

/**
 * @brief Outcome of one item, kept in resolution order
 */
struct ItemRecord
{
    ItemDescriptor item;
    ItemOutcome outcome;
};

/**
 * @brief Everything the caller gets back from a run
 */
struct RunReport
{
    LedgerSnapshot ledger;
    RunState final_state = RunState::IDLE;
    std::optional<std::string> resolution_error; // set only when resolution failed
    bool interrupted = false;                    // cancellation stopped items from starting
    std::vector<ItemRecord> items;               // ascending sequence_index
    std::chrono::milliseconds elapsed{0};

    bool resolutionFailed() const { return final_state == RunState::RESOLUTION_FAILED; }

    nlohmann::json toJson() const;
};

/**
 * @brief Drives one run from playlist reference to final ledger
 *
 * Owns a fresh StatsLedger per run and is the only writer to it. Individual item
 * failures are recorded and never abort the run. A cancellation token stops new items
 * from starting; items already in flight finish normally.
 */
class RunCoordinator
{
public:
    RunCoordinator(MediaSource &source, const Logger &logger);

    /**
     * @brief Receive discrete progress events; calls are serialized
     *
     * May be called from inside a sink; the replacement receives the next event.
     */
    void setProgressSink(ProgressSink sink);

    /**
     * @brief Token checked before each item and during the pacing delay
     */
    void setCancellationToken(const CancellationToken *token);

    /**
     * @brief Run the pipeline for a reference
     *
     * Collection references are resolved first; single-item references are described
     * (or named from config.custom_title) and processed as one item.
     */
    RunReport run(const PlaylistRef &ref, const RunConfig &config);

    /**
     * @brief Shortcut for one item URL
     */
    RunReport runSingle(const std::string &url, const RunConfig &config);

    RunState state() const { return state_.load(); }

private:
    std::vector<ItemDescriptor> resolveItems(const PlaylistRef &ref, const RunConfig &config);
    void runSequential(const std::vector<ItemDescriptor> &items, PlaylistKind kind,
                       const RunConfig &config, StatsLedger &ledger,
                       std::vector<std::optional<ItemOutcome>> &outcomes);
    void runBounded(const std::vector<ItemDescriptor> &items, PlaylistKind kind,
                    const RunConfig &config, StatsLedger &ledger,
                    std::vector<std::optional<ItemOutcome>> &outcomes);
    ItemOutcome processOne(const ItemDescriptor &item, PlaylistKind kind, const RunConfig &config,
                           StatsLedger &ledger);

    bool cancelled() const;
    bool pause(std::chrono::milliseconds delay) const;
    void emit(const ProgressEvent &event);
    void transition(RunState next);

    MediaSource &source_;
    ItemProcessor processor_;
    Logger logger_;
    ProgressSink sink_;
    std::mutex sink_mutex_;
    std::mutex emit_mutex_;
    const CancellationToken *cancellation_ = nullptr;
    std::atomic<RunState> state_{RunState::IDLE};
};
