#include "core/stats_ledger.hpp"

nlohmann::json LedgerSnapshot::toJson() const
{
    return nlohmann::json{
        {"total", total},
        {"successful", successful},
        {"failed", failed},
        {"skipped", skipped}};
}

std::string LedgerSnapshot::toString() const
{
    return "{total: " + std::to_string(total) +
           ", successful: " + std::to_string(successful) +
           ", failed: " + std::to_string(failed) +
           ", skipped: " + std::to_string(skipped) + "}";
}

void StatsLedger::setTotal(std::size_t total)
{
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.total = total;
}

void StatsLedger::record(const ItemOutcome &outcome)
{
    std::lock_guard<std::mutex> lock(mutex_);
    switch (outcome.kind)
    {
    case ItemOutcome::Kind::SUCCESS:
        ++counters_.successful;
        break;
    case ItemOutcome::Kind::FAILURE:
        ++counters_.failed;
        break;
    case ItemOutcome::Kind::SKIPPED:
        ++counters_.skipped;
        break;
    }
}

LedgerSnapshot StatsLedger::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}
