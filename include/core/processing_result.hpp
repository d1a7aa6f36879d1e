#pragma once

#include <filesystem>
#include <string>

/**
 * @brief Result of one fetch+transcode call on a media source
 */
struct FetchResult
{
    bool success;
    std::string error_message;

    FetchResult() : success(false) {}
    FetchResult(bool s, const std::string &msg = "")
        : success(s), error_message(msg) {}

    static FetchResult ok() { return FetchResult(true); }
    static FetchResult failed(const std::string &msg) { return FetchResult(false, msg); }
};

/**
 * @brief Per-item classification, produced exactly once per item per run
 */
struct ItemOutcome
{
    enum class Kind
    {
        SUCCESS,
        FAILURE,
        SKIPPED
    };

    Kind kind = Kind::FAILURE;
    std::filesystem::path destination;
    std::string reason; // failure text, empty otherwise

    static ItemOutcome success(const std::filesystem::path &dest)
    {
        return ItemOutcome{Kind::SUCCESS, dest, ""};
    }

    static ItemOutcome failure(const std::filesystem::path &dest, const std::string &why)
    {
        return ItemOutcome{Kind::FAILURE, dest, why};
    }

    static ItemOutcome skipped(const std::filesystem::path &existing)
    {
        return ItemOutcome{Kind::SKIPPED, existing, ""};
    }

    bool isSuccess() const { return kind == Kind::SUCCESS; }
    bool isFailure() const { return kind == Kind::FAILURE; }
    bool isSkipped() const { return kind == Kind::SKIPPED; }
};

inline const char *outcomeKindName(ItemOutcome::Kind kind)
{
    switch (kind)
    {
    case ItemOutcome::Kind::SUCCESS:
        return "success";
    case ItemOutcome::Kind::FAILURE:
        return "failure";
    case ItemOutcome::Kind::SKIPPED:
        return "skipped";
    }
    return "unknown";
}
