#pragma once
extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libswresample/swresample.h>
}

// RAII wrapper for a demuxing AVFormatContext opened with avformat_open_input
class AVInputContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVInputContextRAII() : ctx_(nullptr) {}
    ~AVInputContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVInputContextRAII(const AVInputContextRAII &) = delete;
    AVInputContextRAII &operator=(const AVInputContextRAII &) = delete;
};

// RAII wrapper for a muxing AVFormatContext; closes its AVIO handle when one was opened
class AVOutputContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVOutputContextRAII() : ctx_(nullptr) {}
    ~AVOutputContextRAII()
    {
        if (!ctx_)
            return;
        if (ctx_->oformat && !(ctx_->oformat->flags & AVFMT_NOFILE) && ctx_->pb)
            avio_closep(&ctx_->pb);
        avformat_free_context(ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVOutputContextRAII(const AVOutputContextRAII &) = delete;
    AVOutputContextRAII &operator=(const AVOutputContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}
    explicit AVCodecContextRAII(AVCodecContext *existing_ctx) : ctx_(existing_ctx) {}

    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }
    AVCodecContext *operator->() { return ctx_; }

    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    // Disable copy
    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}
    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() { return frame_; }
    AVFrame *operator->() { return frame_; }

    // Disable copy
    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}
    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() { return packet_; }
    AVPacket *operator->() { return packet_; }

    // Disable copy
    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;
};

// RAII wrapper for libswresample SwrContext
class SwrContextRAII
{
private:
    SwrContext *ctx_;

public:
    SwrContextRAII() : ctx_(nullptr) {}
    ~SwrContextRAII()
    {
        if (ctx_)
            swr_free(&ctx_);
    }

    SwrContext *get() { return ctx_; }
    SwrContext **address() { return &ctx_; }

    // Disable copy
    SwrContextRAII(const SwrContextRAII &) = delete;
    SwrContextRAII &operator=(const SwrContextRAII &) = delete;
};

// RAII wrapper for AVAudioFifo
class AVAudioFifoRAII
{
private:
    AVAudioFifo *fifo_;

public:
    AVAudioFifoRAII() : fifo_(nullptr) {}
    ~AVAudioFifoRAII()
    {
        if (fifo_)
            av_audio_fifo_free(fifo_);
    }

    AVAudioFifo *get() { return fifo_; }
    void set(AVAudioFifo *fifo)
    {
        if (fifo_)
            av_audio_fifo_free(fifo_);
        fifo_ = fifo;
    }

    // Disable copy
    AVAudioFifoRAII(const AVAudioFifoRAII &) = delete;
    AVAudioFifoRAII &operator=(const AVAudioFifoRAII &) = delete;
};
