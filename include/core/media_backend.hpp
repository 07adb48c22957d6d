#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Stream-level facts about a media file
 */
struct MediaInfo
{
    bool has_video = false;
    bool has_audio = false;
    double duration_seconds = 0.0;
    double fps = 0.0;
    int64_t total_frames = 0;
    int width = 0;
    int height = 0;
};

/**
 * @brief Random-access and sequential reader of decoded video frames (BGR, 8-bit)
 */
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    virtual const MediaInfo &info() const = 0;

    /**
     * @brief Decode the frame at a given index
     * @return false if the frame could not be read
     */
    virtual bool readFrameAt(int64_t frame_index, cv::Mat &out) = 0;

    /**
     * @brief Position the sequential reader on the first frame
     */
    virtual bool rewind() = 0;

    /**
     * @brief Decode the next frame in presentation order
     * @return false at end of stream
     */
    virtual bool readNext(cv::Mat &out) = 0;
};

/**
 * @brief Media toolkit used by the pipeline: probing, frame access and audio extraction
 */
class MediaBackend
{
public:
    virtual ~MediaBackend() = default;

    /**
     * @throws SourceUnreadable if the file cannot be opened or has no usable stream
     */
    virtual MediaInfo probe(const std::string &media_path) = 0;

    /**
     * @throws SourceUnreadable if the file has no decodable video stream
     */
    virtual std::unique_ptr<FrameSource> openVideo(const std::string &media_path) = 0;

    /**
     * @brief Extract the first audio stream as 16 kHz mono 16-bit PCM WAV
     * @return false when the media has no audio stream
     * @throws SourceUnreadable if the media cannot be opened or decoded
     */
    virtual bool extractAudio(const std::string &media_path, const std::string &wav_path) = 0;
};
