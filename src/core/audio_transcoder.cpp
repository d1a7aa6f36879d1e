#include "core/audio_transcoder.hpp"
#include "core/error_recovery.hpp"
#include "core/errors.hpp"
#include "core/external_library_wrappers.hpp"
#include <algorithm>

extern "C"
{
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

namespace
{
    struct Deadline
    {
        bool enabled = false;
        std::chrono::steady_clock::time_point at;

        bool expired() const { return enabled && std::chrono::steady_clock::now() >= at; }
    };

    // FFmpeg polls this during blocking I/O; non-zero aborts the operation with AVERROR_EXIT
    int interruptCallback(void *opaque)
    {
        return static_cast<const Deadline *>(opaque)->expired() ? 1 : 0;
    }

    /**
     * @brief State of one input-to-MP3 conversion
     *
     * All FFmpeg objects are held by RAII wrappers so any thrown TranscodeError releases them.
     */
    class TranscodeSession
    {
    public:
        TranscodeSession(const Logger &logger, std::chrono::seconds timeout, const ProgressCallback &progress)
            : logger_(logger), progress_(progress)
        {
            if (timeout.count() > 0)
            {
                deadline_.enabled = true;
                deadline_.at = std::chrono::steady_clock::now() + timeout;
            }
            interrupt_.callback = interruptCallback;
            interrupt_.opaque = &deadline_;
        }

        void run(const std::filesystem::path &input, const std::filesystem::path &output, int bitrate_kbps)
        {
            openInput(input);
            openEncoder(bitrate_kbps);
            openOutput(output);
            openResampler();

            check(avformat_write_header(output_ctx_.get(), nullptr), "write MP3 header");

            AVPacketRAII packet;
            AVFrameRAII decoded;
            if (!packet.get() || !decoded.get())
            {
                throw TranscodeError("Could not allocate frame or packet");
            }

            int ret = 0;
            while ((ret = av_read_frame(input_ctx_.get(), packet.get())) >= 0)
            {
                if (packet->stream_index == stream_index_)
                {
                    int sent = avcodec_send_packet(decoder_.get(), packet.get());
                    av_packet_unref(packet.get());
                    check(sent, "decode audio packet");
                    drainDecoder(decoded.get());
                }
                else
                {
                    av_packet_unref(packet.get());
                }
            }
            if (ret != AVERROR_EOF)
            {
                check(ret, "read input");
            }

            // Flush decoder, resampler, FIFO, then the encoder
            check(avcodec_send_packet(decoder_.get(), nullptr), "flush decoder");
            drainDecoder(decoded.get());
            resample(nullptr);
            encodeQueued(true);
            encodeFrame(nullptr);

            check(av_write_trailer(output_ctx_.get()), "write MP3 trailer");
            if (progress_)
            {
                progress_(1.0);
            }
        }

    private:
        void check(int ret, const std::string &operation) const
        {
            if (ret >= 0)
            {
                return;
            }
            if (ret == AVERROR_EXIT && deadline_.expired())
            {
                throw TranscodeError("Transcode timed out during " + operation);
            }
            throw TranscodeError("Failed to " + operation + ": " + ErrorRecovery::ffmpegErrorString(ret));
        }

        void openInput(const std::filesystem::path &input)
        {
            *input_ctx_.address() = avformat_alloc_context();
            if (!input_ctx_.get())
            {
                throw TranscodeError("Could not allocate input context");
            }
            input_ctx_.get()->interrupt_callback = interrupt_;

            // avformat_open_input frees the context on failure and leaves it null
            check(avformat_open_input(input_ctx_.address(), input.c_str(), nullptr, nullptr),
                  "open " + input.filename().string());
            check(avformat_find_stream_info(input_ctx_.get(), nullptr), "probe input streams");

            const AVCodec *codec = nullptr;
            stream_index_ = av_find_best_stream(input_ctx_.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
            if (stream_index_ < 0 || !codec)
            {
                throw TranscodeError("No decodable audio stream in " + input.filename().string());
            }

            decoder_.set(avcodec_alloc_context3(codec));
            if (!decoder_.get())
            {
                throw TranscodeError("Could not allocate decoder context");
            }
            AVStream *stream = input_ctx_.get()->streams[stream_index_];
            check(avcodec_parameters_to_context(decoder_.get(), stream->codecpar), "copy decoder parameters");
            check(avcodec_open2(decoder_.get(), codec, nullptr), "open decoder");

            if (decoder_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC)
            {
                av_channel_layout_default(&decoder_->ch_layout, decoder_->ch_layout.nb_channels);
            }

            if (input_ctx_.get()->duration > 0)
            {
                double seconds = static_cast<double>(input_ctx_.get()->duration) / AV_TIME_BASE;
                expected_samples_ = static_cast<int64_t>(seconds * AudioTranscoder::kSampleRate);
            }
            logger_.debug("Decoding " + std::string(codec->name) + " audio at " +
                          std::to_string(decoder_->sample_rate) + " Hz");
        }

        void openEncoder(int bitrate_kbps)
        {
            const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_MP3);
            if (!codec)
            {
                throw TranscodeError("FFmpeg was built without an MP3 encoder");
            }
            encoder_.set(avcodec_alloc_context3(codec));
            if (!encoder_.get())
            {
                throw TranscodeError("Could not allocate encoder context");
            }

            encoder_->bit_rate = static_cast<int64_t>(bitrate_kbps) * 1000;
            encoder_->sample_rate = AudioTranscoder::kSampleRate;
            av_channel_layout_default(&encoder_->ch_layout, AudioTranscoder::kChannels);
            encoder_->sample_fmt = (codec->sample_fmts && codec->sample_fmts[0] != AV_SAMPLE_FMT_NONE)
                                       ? codec->sample_fmts[0]
                                       : AV_SAMPLE_FMT_S16P;
            encoder_->time_base = AVRational{1, AudioTranscoder::kSampleRate};

            check(avcodec_open2(encoder_.get(), codec, nullptr), "open MP3 encoder");
            frame_size_ = encoder_->frame_size > 0 ? encoder_->frame_size : 1152;
        }

        void openOutput(const std::filesystem::path &output)
        {
            check(avformat_alloc_output_context2(output_ctx_.address(), nullptr, "mp3", output.c_str()),
                  "allocate MP3 muxer");
            output_ctx_.get()->interrupt_callback = interrupt_;

            out_stream_ = avformat_new_stream(output_ctx_.get(), nullptr);
            if (!out_stream_)
            {
                throw TranscodeError("Could not create output stream");
            }
            out_stream_->time_base = encoder_->time_base;
            check(avcodec_parameters_from_context(out_stream_->codecpar, encoder_.get()), "copy encoder parameters");

            if (input_ctx_.get()->metadata)
            {
                av_dict_copy(&output_ctx_.get()->metadata, input_ctx_.get()->metadata, 0);
            }

            check(avio_open2(&output_ctx_.get()->pb, output.c_str(), AVIO_FLAG_WRITE, &interrupt_, nullptr),
                  "open " + output.filename().string());
        }

        void openResampler()
        {
            check(swr_alloc_set_opts2(resampler_.address(),
                                      &encoder_->ch_layout, encoder_->sample_fmt, encoder_->sample_rate,
                                      &decoder_->ch_layout, decoder_->sample_fmt, decoder_->sample_rate,
                                      0, nullptr),
                  "configure resampler");
            check(swr_init(resampler_.get()), "initialize resampler");

            fifo_.set(av_audio_fifo_alloc(encoder_->sample_fmt, encoder_->ch_layout.nb_channels, frame_size_));
            if (!fifo_.get())
            {
                throw TranscodeError("Could not allocate sample FIFO");
            }
        }

        void drainDecoder(AVFrame *decoded)
        {
            while (true)
            {
                int ret = avcodec_receive_frame(decoder_.get(), decoded);
                if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
                {
                    return;
                }
                check(ret, "decode audio frame");
                resample(decoded);
                av_frame_unref(decoded);
                encodeQueued(false);
            }
        }

        // Convert one decoded frame (or flush the resampler with nullptr) into the FIFO
        void resample(const AVFrame *decoded)
        {
            const int in_samples = decoded ? decoded->nb_samples : 0;
            const int in_rate = decoder_->sample_rate;
            const int capacity = static_cast<int>(av_rescale_rnd(swr_get_delay(resampler_.get(), in_rate) + in_samples,
                                                                 encoder_->sample_rate, in_rate, AV_ROUND_UP));
            if (capacity <= 0)
            {
                return;
            }

            AVFrameRAII converted;
            if (!converted.get())
            {
                throw TranscodeError("Could not allocate resample frame");
            }
            converted->format = encoder_->sample_fmt;
            converted->sample_rate = encoder_->sample_rate;
            converted->nb_samples = capacity;
            check(av_channel_layout_copy(&converted->ch_layout, &encoder_->ch_layout), "copy channel layout");
            check(av_frame_get_buffer(converted.get(), 0), "allocate resample buffer");

            int produced = swr_convert(resampler_.get(), converted->data, capacity,
                                       decoded ? const_cast<const uint8_t **>(decoded->extended_data) : nullptr,
                                       in_samples);
            check(produced, "resample audio");
            if (produced == 0)
            {
                return;
            }
            if (av_audio_fifo_write(fifo_.get(), reinterpret_cast<void **>(converted->data), produced) < produced)
            {
                throw TranscodeError("Could not queue resampled audio");
            }
        }

        // Encode full frames from the FIFO; when flushing also the final short frame
        void encodeQueued(bool flush)
        {
            while (av_audio_fifo_size(fifo_.get()) >= frame_size_ ||
                   (flush && av_audio_fifo_size(fifo_.get()) > 0))
            {
                const int samples = std::min(av_audio_fifo_size(fifo_.get()), frame_size_);

                AVFrameRAII frame;
                if (!frame.get())
                {
                    throw TranscodeError("Could not allocate encoder frame");
                }
                frame->format = encoder_->sample_fmt;
                frame->sample_rate = encoder_->sample_rate;
                frame->nb_samples = samples;
                check(av_channel_layout_copy(&frame->ch_layout, &encoder_->ch_layout), "copy channel layout");
                check(av_frame_get_buffer(frame.get(), 0), "allocate encoder buffer");

                if (av_audio_fifo_read(fifo_.get(), reinterpret_cast<void **>(frame->data), samples) < samples)
                {
                    throw TranscodeError("Could not read queued audio");
                }
                frame->pts = next_pts_;
                next_pts_ += samples;

                encodeFrame(frame.get());
                reportProgress();
            }
        }

        void encodeFrame(const AVFrame *frame)
        {
            check(avcodec_send_frame(encoder_.get(), frame), "encode audio frame");

            AVPacketRAII packet;
            if (!packet.get())
            {
                throw TranscodeError("Could not allocate output packet");
            }
            while (true)
            {
                int ret = avcodec_receive_packet(encoder_.get(), packet.get());
                if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
                {
                    return;
                }
                check(ret, "receive encoded packet");

                packet->stream_index = out_stream_->index;
                av_packet_rescale_ts(packet.get(), encoder_->time_base, out_stream_->time_base);
                int written = av_interleaved_write_frame(output_ctx_.get(), packet.get());
                av_packet_unref(packet.get());
                check(written, "write MP3 packet");
            }
        }

        void reportProgress() const
        {
            if (!progress_ || expected_samples_ <= 0)
            {
                return;
            }
            double ratio = static_cast<double>(next_pts_) / static_cast<double>(expected_samples_);
            progress_(std::min(ratio, 1.0));
        }

        Logger logger_;
        const ProgressCallback &progress_;
        Deadline deadline_;
        AVIOInterruptCB interrupt_{};

        AVInputContextRAII input_ctx_;
        AVOutputContextRAII output_ctx_;
        AVCodecContextRAII decoder_;
        AVCodecContextRAII encoder_;
        SwrContextRAII resampler_;
        AVAudioFifoRAII fifo_;
        AVStream *out_stream_ = nullptr;

        int stream_index_ = -1;
        int frame_size_ = 1152;
        int64_t next_pts_ = 0;
        int64_t expected_samples_ = 0;
    };
}

AudioTranscoder::AudioTranscoder(const Logger &logger) : logger_(logger)
{
}

void AudioTranscoder::transcode(const std::filesystem::path &input,
                                const std::filesystem::path &output,
                                int bitrate_kbps,
                                std::chrono::seconds timeout,
                                const ProgressCallback &progress) const
{
    logger_.debug("Transcoding " + input.filename().string() + " to " + std::to_string(bitrate_kbps) + " kbps MP3");
    TranscodeSession session(logger_, timeout, progress);
    session.run(input, output, bitrate_kbps);
}
