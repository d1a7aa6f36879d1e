#pragma once

#include <cstddef>
#include <functional>
#include <string>

/**
 * @brief Discrete progress notification for one item
 *
 * Events are informational only; a sink cannot pause or cancel the run.
 */
struct ProgressEvent
{
    enum class Type
    {
        STARTED,
        PROGRESS,
        COMPLETED,
        SKIPPED,
        FAILED
    };

    Type type = Type::STARTED;
    std::size_t sequence_index = 0;
    std::string title;
    double ratio = 0.0; // 0.0 to 1.0, meaningful for PROGRESS
    std::string message;
};

using ProgressSink = std::function<void(const ProgressEvent &)>;

// Fraction-done callback handed to a media source for one item
using ProgressCallback = std::function<void(double)>;
