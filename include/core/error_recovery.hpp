#pragma once
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
extern "C"
{
#include <libavutil/error.h>
}
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    // The backoff stops doubling after this many attempts
    static constexpr int kMaxBackoffShift = 6;

    // Retry with exponential backoff: 100ms, 200ms, 400ms... between attempts,
    // capped at base_delay * 2^kMaxBackoffShift. The last failure is rethrown.
    template <typename Func>
    static auto retryWithBackoff(const Logger &logger, int max_attempts, const std::string &operation_name,
                                 Func func, std::chrono::milliseconds base_delay = std::chrono::milliseconds(100))
        -> decltype(func())
    {
        if (max_attempts < 1)
        {
            max_attempts = 1;
        }

        for (int attempt = 0; attempt < max_attempts; ++attempt)
        {
            try
            {
                return func();
            }
            catch (const std::exception &e)
            {
                if (attempt == max_attempts - 1)
                {
                    logger.error("Operation '" + operation_name + "' failed after " +
                                 std::to_string(max_attempts) + " attempts: " + e.what());
                    throw;
                }

                auto delay = backoffDelay(base_delay, attempt);
                logger.warn("Operation '" + operation_name + "' failed, retrying in " +
                            std::to_string(delay.count()) + "ms (attempt " +
                            std::to_string(attempt + 1) + "/" + std::to_string(max_attempts) +
                            "): " + e.what());

                std::this_thread::sleep_for(delay);
            }
        }
        throw std::runtime_error("All retry attempts failed for operation: " + operation_name);
    }

    static std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base_delay, int attempt)
    {
        const int shift = attempt < kMaxBackoffShift ? attempt : kMaxBackoffShift;
        return base_delay * (1 << shift);
    }

    // Human readable text for an FFmpeg error code
    static std::string ffmpegErrorString(int error_code)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE);
        return std::string(err_buf) + " (error code: " + std::to_string(error_code) + ")";
    }
};
