#pragma once

#include "core/progress_event.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>

/**
 * @brief Converts any audio container FFmpeg can read into a constant-bitrate MP3
 *
 * Output is always 44.1 kHz stereo.
 */
class AudioTranscoder
{
public:
    static constexpr int kSampleRate = 44100;
    static constexpr int kChannels = 2;

    explicit AudioTranscoder(const Logger &logger);

    /**
     * @brief Transcode input into an MP3 file at output
     * @param input Raw media file
     * @param output Destination; written directly, callers handle atomic placement
     * @param bitrate_kbps Target bitrate in kbit/s
     * @param timeout Abort once exceeded, zero for no limit
     * @param progress Optional callback receiving 0..1
     * @throws TranscodeError on any FFmpeg failure or timeout
     */
    void transcode(const std::filesystem::path &input,
                   const std::filesystem::path &output,
                   int bitrate_kbps,
                   std::chrono::seconds timeout,
                   const ProgressCallback &progress = nullptr) const;

private:
    Logger logger_;
};
