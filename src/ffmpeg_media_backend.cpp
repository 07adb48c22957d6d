#include "core/ffmpeg_media_backend.hpp"
#include "core/error_recovery.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <cstring>
#include <fstream>
#include <vector>

extern "C"
{
#include <libavutil/channel_layout.h>
#include <libavutil/imgutils.h>
#include <libavutil/samplefmt.h>
}

namespace
{
    int findVideoStream(AVFormatContext *ctx)
    {
        for (unsigned int i = 0; i < ctx->nb_streams; i++)
        {
            const AVStream *stream = ctx->streams[i];
            if (stream->codecpar->codec_type == AVMEDIA_TYPE_VIDEO &&
                !(stream->disposition & AV_DISPOSITION_ATTACHED_PIC))
            {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    int findAudioStream(AVFormatContext *ctx)
    {
        for (unsigned int i = 0; i < ctx->nb_streams; i++)
        {
            if (ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO)
            {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    void openInput(AVFormatContextRAII &format_ctx, const std::string &file_path)
    {
        int open_result = ErrorRecovery::retryFFmpegOperation(
            [&]()
            { return avformat_open_input(format_ctx.address(), file_path.c_str(), nullptr, nullptr); },
            2, "avformat_open_input");
        if (open_result < 0)
        {
            throw SourceUnreadable("Could not open media file: " + file_path + " - " +
                                   ErrorRecovery::ffmpegError(open_result));
        }

        int stream_info_result = avformat_find_stream_info(format_ctx.get(), nullptr);
        if (stream_info_result < 0)
        {
            throw SourceUnreadable("Could not find stream information (file may be corrupted): " + file_path);
        }
    }

    double streamFps(const AVStream *stream)
    {
        double fps = av_q2d(stream->avg_frame_rate);
        if (!(fps > 0.0) || !std::isfinite(fps))
            fps = av_q2d(stream->r_frame_rate);
        if (!(fps > 0.0) || !std::isfinite(fps))
            fps = 25.0;
        return fps;
    }

    double mediaDuration(const AVFormatContext *ctx, const AVStream *stream)
    {
        if (stream && stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        {
            return stream->duration * av_q2d(stream->time_base);
        }
        if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0)
        {
            return static_cast<double>(ctx->duration) / AV_TIME_BASE;
        }
        return 0.0;
    }

    void openDecoder(AVFormatContext *format_ctx, int stream_index, AVCodecContextRAII &codec_ctx,
                     const std::string &file_path)
    {
        const AVCodecParameters *codec_params = format_ctx->streams[stream_index]->codecpar;
        const AVCodec *codec = avcodec_find_decoder(codec_params->codec_id);
        if (!codec)
        {
            throw SourceUnreadable("Unsupported codec in " + file_path);
        }
        AVCodecContext *temp_codec_ctx = avcodec_alloc_context3(codec);
        if (!temp_codec_ctx)
        {
            throw SourceUnreadable("Could not allocate decoder context for " + file_path);
        }
        codec_ctx.set(temp_codec_ctx);

        if (avcodec_parameters_to_context(codec_ctx.get(), codec_params) < 0)
        {
            throw SourceUnreadable("Could not copy codec parameters for " + file_path);
        }
        codec_ctx.get()->thread_count = 0; // let FFmpeg pick
        if (avcodec_open2(codec_ctx.get(), codec, nullptr) < 0)
        {
            throw SourceUnreadable("Could not open decoder for " + file_path);
        }
    }

    void writeWavHeader(std::ofstream &out, uint32_t data_bytes, int sample_rate)
    {
        const uint16_t channels = 1;
        const uint16_t bits_per_sample = 16;
        const uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
        const uint16_t block_align = channels * bits_per_sample / 8;
        const uint32_t riff_size = 36 + data_bytes;
        const uint32_t fmt_size = 16;
        const uint16_t pcm_format = 1;
        const uint32_t rate = static_cast<uint32_t>(sample_rate);

        out.write("RIFF", 4);
        out.write(reinterpret_cast<const char *>(&riff_size), 4);
        out.write("WAVE", 4);
        out.write("fmt ", 4);
        out.write(reinterpret_cast<const char *>(&fmt_size), 4);
        out.write(reinterpret_cast<const char *>(&pcm_format), 2);
        out.write(reinterpret_cast<const char *>(&channels), 2);
        out.write(reinterpret_cast<const char *>(&rate), 4);
        out.write(reinterpret_cast<const char *>(&byte_rate), 4);
        out.write(reinterpret_cast<const char *>(&block_align), 2);
        out.write(reinterpret_cast<const char *>(&bits_per_sample), 2);
        out.write("data", 4);
        out.write(reinterpret_cast<const char *>(&data_bytes), 4);
    }
}

FFmpegFrameSource::FFmpegFrameSource(const std::string &file_path)
    : file_path_(file_path)
{
    openInput(format_ctx_, file_path_);

    video_stream_index_ = findVideoStream(format_ctx_.get());
    if (video_stream_index_ < 0)
    {
        throw SourceUnreadable("No video stream found in " + file_path_);
    }
    AVStream *video_stream = format_ctx_.get()->streams[video_stream_index_];
    openDecoder(format_ctx_.get(), video_stream_index_, codec_ctx_, file_path_);

    time_base_ = video_stream->time_base;
    start_pts_ = video_stream->start_time != AV_NOPTS_VALUE ? video_stream->start_time : 0;

    info_.has_video = true;
    info_.has_audio = findAudioStream(format_ctx_.get()) >= 0;
    info_.fps = streamFps(video_stream);
    info_.duration_seconds = mediaDuration(format_ctx_.get(), video_stream);
    info_.total_frames = video_stream->nb_frames > 0
                             ? video_stream->nb_frames
                             : static_cast<int64_t>(std::llround(info_.duration_seconds * info_.fps));
    info_.width = codec_ctx_.get()->width;
    info_.height = codec_ctx_.get()->height;

    AVFrame *temp_frame = av_frame_alloc();
    AVPacket *temp_packet = av_packet_alloc();
    if (!temp_frame || !temp_packet)
    {
        if (temp_frame)
            av_frame_free(&temp_frame);
        if (temp_packet)
            av_packet_free(&temp_packet);
        throw SourceUnreadable("Could not allocate frame or packet");
    }
    frame_.set(temp_frame);
    packet_.set(temp_packet);

    Logger::info("Video loaded: " + file_path_ + " - duration " + std::to_string(info_.duration_seconds) +
                 "s, fps " + std::to_string(info_.fps) + ", frames " + std::to_string(info_.total_frames) +
                 ", resolution " + std::to_string(info_.width) + "x" + std::to_string(info_.height));
}

int64_t FFmpegFrameSource::framePts(int64_t frame_index) const
{
    const double seconds = static_cast<double>(frame_index) / info_.fps;
    return start_pts_ + static_cast<int64_t>(seconds / av_q2d(time_base_));
}

int64_t FFmpegFrameSource::currentFrameIndex() const
{
    int64_t pts = frame_.get()->best_effort_timestamp;
    if (pts == AV_NOPTS_VALUE)
        pts = frame_.get()->pts;
    if (pts == AV_NOPTS_VALUE)
        return -1;
    const double seconds = (pts - start_pts_) * av_q2d(time_base_);
    return static_cast<int64_t>(std::llround(seconds * info_.fps));
}

bool FFmpegFrameSource::decodeNext()
{
    while (true)
    {
        int response = avcodec_receive_frame(codec_ctx_.get(), frame_.get());
        if (response == 0)
            return true;
        if (response == AVERROR_EOF)
            return false;
        if (response != AVERROR(EAGAIN))
        {
            Logger::debug("Decoder error in " + file_path_ + ": " + ErrorRecovery::ffmpegError(response));
            return false;
        }
        if (draining_)
            return false;

        int read_result = av_read_frame(format_ctx_.get(), packet_.get());
        if (read_result < 0)
        {
            // End of input: flush the decoder
            avcodec_send_packet(codec_ctx_.get(), nullptr);
            draining_ = true;
            continue;
        }
        if (packet_.get()->stream_index == video_stream_index_)
        {
            int send_result = avcodec_send_packet(codec_ctx_.get(), packet_.get());
            if (send_result < 0 && send_result != AVERROR(EAGAIN))
            {
                Logger::debug("Dropping undecodable packet in " + file_path_ + ": " +
                              ErrorRecovery::ffmpegError(send_result));
            }
        }
        av_packet_unref(packet_.get());
    }
}

bool FFmpegFrameSource::convertCurrent(cv::Mat &out)
{
    AVFrame *frame = frame_.get();
    if (frame->width <= 0 || frame->height <= 0)
        return false;

    if (!sws_ctx_.get())
    {
        sws_ctx_.set(sws_getContext(frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                                    frame->width, frame->height, AV_PIX_FMT_BGR24,
                                    SWS_BILINEAR, nullptr, nullptr, nullptr));
        if (!sws_ctx_.get())
        {
            Logger::error("Could not create scaler context for " + file_path_);
            return false;
        }
    }

    out.create(frame->height, frame->width, CV_8UC3);
    uint8_t *dst_data[4] = {out.data, nullptr, nullptr, nullptr};
    int dst_linesize[4] = {static_cast<int>(out.step[0]), 0, 0, 0};
    sws_scale(sws_ctx_.get(), frame->data, frame->linesize, 0, frame->height, dst_data, dst_linesize);
    return true;
}

bool FFmpegFrameSource::rewind()
{
    int seek_result = av_seek_frame(format_ctx_.get(), video_stream_index_, start_pts_, AVSEEK_FLAG_BACKWARD);
    avcodec_flush_buffers(codec_ctx_.get());
    draining_ = false;
    if (seek_result < 0)
    {
        Logger::warn("Rewind failed for " + file_path_ + ": " + ErrorRecovery::ffmpegError(seek_result));
        return false;
    }
    return true;
}

bool FFmpegFrameSource::readNext(cv::Mat &out)
{
    if (!decodeNext())
        return false;
    return convertCurrent(out);
}

bool FFmpegFrameSource::readFrameAt(int64_t frame_index, cv::Mat &out)
{
    if (frame_index < 0)
        return false;

    // Seek to nearest keyframe before target, then decode forward
    int seek_result = av_seek_frame(format_ctx_.get(), video_stream_index_, framePts(frame_index), AVSEEK_FLAG_BACKWARD);
    avcodec_flush_buffers(codec_ctx_.get());
    draining_ = false;
    if (seek_result < 0)
    {
        Logger::debug("Seek to frame " + std::to_string(frame_index) + " failed, decoding from start");
        if (!rewind())
            return false;
    }

    while (decodeNext())
    {
        const int64_t current = currentFrameIndex();
        if (current < 0 || current >= frame_index)
        {
            return convertCurrent(out);
        }
    }
    return false;
}

MediaInfo FFmpegMediaBackend::probe(const std::string &media_path)
{
    AVFormatContextRAII format_ctx;
    openInput(format_ctx, media_path);

    MediaInfo info;
    const int video_index = findVideoStream(format_ctx.get());
    const int audio_index = findAudioStream(format_ctx.get());
    info.has_video = video_index >= 0;
    info.has_audio = audio_index >= 0;
    if (!info.has_video && !info.has_audio)
    {
        throw SourceUnreadable("No audio or video stream found in " + media_path);
    }

    const AVStream *video_stream = info.has_video ? format_ctx.get()->streams[video_index] : nullptr;
    info.duration_seconds = mediaDuration(format_ctx.get(), video_stream);
    if (video_stream)
    {
        info.fps = streamFps(video_stream);
        info.total_frames = video_stream->nb_frames > 0
                                ? video_stream->nb_frames
                                : static_cast<int64_t>(std::llround(info.duration_seconds * info.fps));
        info.width = video_stream->codecpar->width;
        info.height = video_stream->codecpar->height;
    }
    return info;
}

std::unique_ptr<FrameSource> FFmpegMediaBackend::openVideo(const std::string &media_path)
{
    return std::make_unique<FFmpegFrameSource>(media_path);
}

bool FFmpegMediaBackend::extractAudio(const std::string &media_path, const std::string &wav_path)
{
    AVFormatContextRAII format_ctx;
    openInput(format_ctx, media_path);

    const int audio_index = findAudioStream(format_ctx.get());
    if (audio_index < 0)
    {
        Logger::warn("No audio stream in " + media_path);
        return false;
    }

    AVCodecContextRAII codec_ctx;
    openDecoder(format_ctx.get(), audio_index, codec_ctx, media_path);

    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, 1);

    SwrContextRAII swr_ctx;
    int swr_result = swr_alloc_set_opts2(swr_ctx.address(),
                                         &out_layout, AV_SAMPLE_FMT_S16, kTargetSampleRate,
                                         &codec_ctx.get()->ch_layout, codec_ctx.get()->sample_fmt,
                                         codec_ctx.get()->sample_rate, 0, nullptr);
    if (swr_result < 0 || swr_init(swr_ctx.get()) < 0)
    {
        throw SourceUnreadable("Could not create audio resampler for " + media_path);
    }

    AVFrameRAII frame(av_frame_alloc());
    AVPacketRAII packet(av_packet_alloc());
    if (!frame.get() || !packet.get())
    {
        throw SourceUnreadable("Could not allocate frame or packet");
    }

    std::ofstream out(wav_path, std::ios::binary);
    if (!out.is_open())
    {
        throw std::runtime_error("Cannot create audio file: " + wav_path);
    }
    writeWavHeader(out, 0, kTargetSampleRate);

    uint64_t data_bytes = 0;
    std::vector<int16_t> samples;
    auto writeConverted = [&](const uint8_t **input, int input_samples)
    {
        int capacity = swr_get_out_samples(swr_ctx.get(), input_samples);
        if (capacity <= 0)
            return;
        samples.resize(static_cast<size_t>(capacity));
        uint8_t *output = reinterpret_cast<uint8_t *>(samples.data());
        int converted = swr_convert(swr_ctx.get(), &output, capacity, input, input_samples);
        if (converted > 0)
        {
            out.write(reinterpret_cast<const char *>(samples.data()), converted * static_cast<int>(sizeof(int16_t)));
            data_bytes += static_cast<uint64_t>(converted) * sizeof(int16_t);
        }
    };

    auto drainDecoder = [&]()
    {
        while (avcodec_receive_frame(codec_ctx.get(), frame.get()) == 0)
        {
            writeConverted(const_cast<const uint8_t **>(frame.get()->extended_data), frame.get()->nb_samples);
        }
    };

    while (av_read_frame(format_ctx.get(), packet.get()) >= 0)
    {
        if (packet.get()->stream_index == audio_index)
        {
            if (avcodec_send_packet(codec_ctx.get(), packet.get()) >= 0)
            {
                drainDecoder();
            }
        }
        av_packet_unref(packet.get());
    }
    avcodec_send_packet(codec_ctx.get(), nullptr);
    drainDecoder();
    writeConverted(nullptr, 0); // flush resampler

    if (data_bytes == 0)
    {
        throw SourceUnreadable("Audio stream produced no samples: " + media_path);
    }

    out.seekp(0, std::ios::beg);
    writeWavHeader(out, static_cast<uint32_t>(data_bytes), kTargetSampleRate);
    out.close();
    if (!out)
    {
        throw std::runtime_error("Failed writing audio file: " + wav_path);
    }

    Logger::info("Audio extracted to: " + wav_path + " (" +
                 std::to_string(data_bytes / sizeof(int16_t) / kTargetSampleRate) + "s)");
    return true;
}
