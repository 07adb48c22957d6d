#pragma once

#include "core/media_backend.hpp"
#include "core/external_library_wrappers.hpp"
#include <string>

/**
 * @brief FrameSource over an FFmpeg demuxer/decoder pair
 *
 * Frames are converted to BGR24 with libswscale and copied into cv::Mat.
 */
class FFmpegFrameSource : public FrameSource
{
public:
    /**
     * @throws SourceUnreadable if the file has no decodable video stream
     */
    explicit FFmpegFrameSource(const std::string &file_path);

    const MediaInfo &info() const override { return info_; }
    bool readFrameAt(int64_t frame_index, cv::Mat &out) override;
    bool rewind() override;
    bool readNext(cv::Mat &out) override;

private:
    bool decodeNext(); // leaves the decoded picture in frame_
    bool convertCurrent(cv::Mat &out);
    int64_t framePts(int64_t frame_index) const;
    int64_t currentFrameIndex() const;

    std::string file_path_;
    MediaInfo info_;
    int video_stream_index_ = -1;
    AVRational time_base_{0, 1};
    int64_t start_pts_ = 0;
    bool draining_ = false;

    AVFormatContextRAII format_ctx_;
    AVCodecContextRAII codec_ctx_;
    AVFrameRAII frame_;
    AVPacketRAII packet_;
    SwsContextRAII sws_ctx_;
};

/**
 * @brief MediaBackend implemented with libavformat/libavcodec/libswresample
 */
class FFmpegMediaBackend : public MediaBackend
{
public:
    MediaInfo probe(const std::string &media_path) override;
    std::unique_ptr<FrameSource> openVideo(const std::string &media_path) override;
    bool extractAudio(const std::string &media_path, const std::string &wav_path) override;

    static constexpr int kTargetSampleRate = 16000;
};
