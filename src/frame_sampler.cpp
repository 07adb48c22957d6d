#include "core/frame_sampler.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace
{
    double roundTimestamp(double seconds)
    {
        return std::round(seconds * 100.0) / 100.0;
    }

    bool nearAny(const std::set<double> &timestamps, double timestamp, double tolerance)
    {
        return std::any_of(timestamps.begin(), timestamps.end(),
                           [&](double t)
                           { return std::abs(t - timestamp) < tolerance; });
    }

    cv::Mat toGray(const cv::Mat &frame)
    {
        if (frame.channels() == 1)
            return frame;
        cv::Mat gray;
        cv::cvtColor(frame, gray, frame.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
        return gray;
    }

    cv::Mat lumaHistogram(const cv::Mat &gray)
    {
        cv::Mat hist;
        const int channels[] = {0};
        const int hist_size[] = {256};
        const float range[] = {0.0f, 256.0f};
        const float *ranges[] = {range};
        cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);
        cv::normalize(hist, hist);
        return hist;
    }
}

FrameSampler::FrameSampler(FrameStore &store, const SamplerSettings &settings)
    : store_(store), settings_(settings)
{
}

int FrameSampler::targetFrameCount(double duration_seconds, const SamplerSettings &settings)
{
    int target = settings.interval_seconds > 0.0
                     ? static_cast<int>(duration_seconds / settings.interval_seconds)
                     : settings.max_frames;
    return std::max(settings.min_frames, std::min(target, settings.max_frames));
}

double FrameSampler::sceneChangeScore(const cv::Mat &previous_gray, const cv::Mat &current_gray)
{
    const double correlation = cv::compareHist(lumaHistogram(current_gray), lumaHistogram(previous_gray),
                                               cv::HISTCMP_CORREL);
    return (1.0 - correlation) * 100.0;
}

std::vector<CandidateFrame> FrameSampler::sample(FrameSource &source)
{
    const MediaInfo &info = source.info();
    frames_read_ = 0;

    Logger::info("Adaptive extraction: duration=" + std::to_string(info.duration_seconds) +
                 "s, target_frames=" + std::to_string(targetFrameCount(info.duration_seconds, settings_)));

    std::vector<CandidateFrame> frames;
    std::set<double> timestamps;

    sampleUniform(source, frames, timestamps);

    if (static_cast<int>(frames.size()) < settings_.max_frames)
    {
        detectSceneChanges(source, settings_.max_frames - static_cast<int>(frames.size()), frames, timestamps);
    }

    if (frames_read_ == 0)
    {
        throw SourceUnreadable("No readable frames in video");
    }

    if (static_cast<int>(frames.size()) < kMinimumUsefulFrames && info.duration_seconds > kFallbackMinDurationSeconds)
    {
        Logger::info("Not enough frames detected, sampling evenly...");
        releaseAll(frames);
        frames = sampleEvenly(source, settings_.max_frames);
    }

    std::stable_sort(frames.begin(), frames.end(),
                     [](const CandidateFrame &a, const CandidateFrame &b)
                     { return a.timestamp_seconds < b.timestamp_seconds; });

    Logger::info("Adaptive extraction complete: " + std::to_string(frames.size()) + " keyframes");
    return frames;
}

void FrameSampler::sampleUniform(FrameSource &source, std::vector<CandidateFrame> &frames,
                                 std::set<double> &timestamps)
{
    const MediaInfo &info = source.info();
    if (info.fps <= 0.0 || info.total_frames <= 0)
    {
        Logger::warn("Video reports no frame rate or frame count, skipping uniform sampling");
        return;
    }

    const int target = targetFrameCount(info.duration_seconds, settings_);
    const double uniform_interval = info.duration_seconds / (target + 1);

    cv::Mat frame;
    for (int i = 0; i < target; i++)
    {
        const double target_time = uniform_interval * (i + 1);
        int64_t frame_pos = static_cast<int64_t>(target_time * info.fps);
        frame_pos = std::min(frame_pos, info.total_frames - 1);

        if (!source.readFrameAt(frame_pos, frame) || frame.empty())
        {
            Logger::debug("Could not read frame " + std::to_string(frame_pos));
            continue;
        }
        frames_read_++;

        const double timestamp = roundTimestamp(frame_pos / info.fps);
        if (nearAny(timestamps, timestamp, kUniformCollisionSeconds))
            continue;

        CandidateFrame candidate;
        candidate.frame_index = frame_pos;
        candidate.timestamp_seconds = timestamp;
        candidate.image_ref = store_.put(frame);
        candidate.extraction_method = ExtractionMethod::UNIFORM;
        frames.push_back(candidate);
        timestamps.insert(timestamp);

        Logger::debug("Uniform frame " + std::to_string(frames.size()) + " at " + std::to_string(timestamp) + "s");
    }
}

void FrameSampler::detectSceneChanges(FrameSource &source, int max_additional, std::vector<CandidateFrame> &frames,
                                      std::set<double> &timestamps)
{
    const MediaInfo &info = source.info();
    const double fps = info.fps > 0.0 ? info.fps : 25.0;
    const int64_t sample_rate = std::max<int64_t>(1, static_cast<int64_t>(fps / 2));

    if (!source.rewind())
    {
        Logger::warn("Cannot rewind video, skipping scene detection");
        return;
    }

    int added = 0;
    int64_t frame_idx = 0;
    cv::Mat frame;
    cv::Mat previous_gray;

    while (added < max_additional && source.readNext(frame))
    {
        if (frame_idx % sample_rate != 0 || frame.empty())
        {
            frame_idx++;
            continue;
        }
        frames_read_++;

        cv::Mat gray = toGray(frame);
        if (!previous_gray.empty())
        {
            const double score = sceneChangeScore(previous_gray, gray);
            const double timestamp = roundTimestamp(frame_idx / fps);

            if (score > settings_.scene_threshold && !nearAny(timestamps, timestamp, kSceneCollisionSeconds))
            {
                CandidateFrame candidate;
                candidate.frame_index = frame_idx;
                candidate.timestamp_seconds = timestamp;
                candidate.image_ref = store_.put(frame);
                candidate.extraction_method = ExtractionMethod::SCENE_CHANGE;
                candidate.scene_change_score = std::round(score * 100.0) / 100.0;
                frames.push_back(candidate);
                timestamps.insert(timestamp);
                added++;

                Logger::info("Scene change frame at " + std::to_string(timestamp) +
                             "s (score=" + std::to_string(score) + "%)");
            }
        }

        previous_gray = gray.clone();
        frame_idx++;
    }
}

std::vector<CandidateFrame> FrameSampler::sampleEvenly(FrameSource &source, int count)
{
    std::vector<CandidateFrame> frames;
    const MediaInfo &info = source.info();
    if (info.fps <= 0.0 || info.total_frames <= 0 || count <= 0)
        return frames;

    const int64_t interval = info.total_frames / (count + 1);
    cv::Mat frame;
    for (int i = 0; i < count; i++)
    {
        const int64_t frame_pos = interval * (i + 1);
        if (!source.readFrameAt(frame_pos, frame) || frame.empty())
            continue;

        CandidateFrame candidate;
        candidate.frame_index = frame_pos;
        candidate.timestamp_seconds = roundTimestamp(frame_pos / info.fps);
        candidate.image_ref = store_.put(frame);
        candidate.extraction_method = ExtractionMethod::UNIFORM;
        frames.push_back(candidate);
    }
    return frames;
}

void FrameSampler::releaseAll(const std::vector<CandidateFrame> &frames)
{
    for (const auto &candidate : frames)
    {
        store_.release(candidate.image_ref);
    }
}
