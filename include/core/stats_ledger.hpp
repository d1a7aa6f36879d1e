#pragma once

#include "core/processing_result.hpp"
#include <cstddef>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief Counter values of a ledger at one point in time
 */
struct LedgerSnapshot
{
    std::size_t total = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;

    std::size_t recorded() const { return successful + failed + skipped; }

    // total == successful + failed + skipped
    bool isBalanced() const { return total == recorded(); }

    bool operator==(const LedgerSnapshot &other) const
    {
        return total == other.total && successful == other.successful &&
               failed == other.failed && skipped == other.skipped;
    }
    bool operator!=(const LedgerSnapshot &other) const { return !(*this == other); }

    nlohmann::json toJson() const;
    std::string toString() const;
};

/**
 * @brief Run-scoped outcome counters
 *
 * Created with all-zero counters at run start and written only by the run coordinator.
 * Updates are serialized so concurrent workers can report through a single owner.
 */
class StatsLedger
{
public:
    StatsLedger() = default;
    StatsLedger(const StatsLedger &) = delete;
    StatsLedger &operator=(const StatsLedger &) = delete;

    void setTotal(std::size_t total);

    /**
     * @brief Increment exactly one of successful/failed/skipped
     */
    void record(const ItemOutcome &outcome);

    LedgerSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    LedgerSnapshot counters_;
};
