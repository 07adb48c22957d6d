#pragma once

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

// RAII wrapper for FFmpeg AVFormatContext (input side)
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() const { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
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

    AVCodecContext *get() const { return ctx_; }

    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;

    AVCodecContextRAII(AVCodecContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(nullptr) {}
    explicit AVFrameRAII(AVFrame *existing_frame) : frame_(existing_frame) {}

    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() const { return frame_; }

    void set(AVFrame *new_frame)
    {
        if (frame_)
            av_frame_free(&frame_);
        frame_ = new_frame;
    }

    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;

    AVFrameRAII(AVFrameRAII &&other) noexcept : frame_(other.frame_)
    {
        other.frame_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(nullptr) {}
    explicit AVPacketRAII(AVPacket *existing_packet) : packet_(existing_packet) {}

    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() const { return packet_; }

    void set(AVPacket *new_packet)
    {
        if (packet_)
            av_packet_free(&packet_);
        packet_ = new_packet;
    }

    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;

    AVPacketRAII(AVPacketRAII &&other) noexcept : packet_(other.packet_)
    {
        other.packet_ = nullptr;
    }
};

// RAII wrapper for FFmpeg SwsContext (pixel format conversion)
class SwsContextRAII
{
private:
    SwsContext *ctx_;

public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContext *get() const { return ctx_; }

    void set(SwsContext *c)
    {
        if (ctx_)
            sws_freeContext(ctx_);
        ctx_ = c;
    }

    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;

    SwsContextRAII(SwsContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg SwrContext (audio resampling)
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

    SwrContext *get() const { return ctx_; }
    SwrContext **address() { return &ctx_; }

    SwrContextRAII(const SwrContextRAII &) = delete;
    SwrContextRAII &operator=(const SwrContextRAII &) = delete;

    SwrContextRAII(SwrContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};
