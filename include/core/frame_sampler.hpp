#pragma once

#include "core/frame_store.hpp"
#include "core/media_backend.hpp"
#include "core/media_types.hpp"
#include "core/pipeline_config.hpp"
#include <set>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Two-phase adaptive frame sampler.
 *
 * Phase 1 takes evenly spaced frames so the whole duration is covered. Phase 2 scans
 * the video at roughly two samples per second and adds frames where the luminance
 * histogram changes sharply. Picked frames are written to the FrameStore and returned
 * sorted by timestamp.
 */
class FrameSampler
{
public:
    /**
     * @param store Destination of picked frame images
     * @param settings Interval, frame bounds and scene threshold
     */
    FrameSampler(FrameStore &store, const SamplerSettings &settings);

    /**
     * @brief Sample candidate frames from a video
     * @param source Decoded video; rewound and seeked as needed
     * @return Candidates in ascending timestamp order
     * @throws SourceUnreadable if no frame of the source can be read
     */
    std::vector<CandidateFrame> sample(FrameSource &source);

    /**
     * @brief Scene-change score of two luminance images: (1 - histogram correlation) * 100
     */
    static double sceneChangeScore(const cv::Mat &previous_gray, const cv::Mat &current_gray);

    /**
     * @brief Number of evenly spaced frames phase 1 aims for
     */
    static int targetFrameCount(double duration_seconds, const SamplerSettings &settings);

    static constexpr double kUniformCollisionSeconds = 1.0;
    static constexpr double kSceneCollisionSeconds = 2.0;
    static constexpr int kMinimumUsefulFrames = 3;
    static constexpr double kFallbackMinDurationSeconds = 10.0;

private:
    void sampleUniform(FrameSource &source, std::vector<CandidateFrame> &frames, std::set<double> &timestamps);
    void detectSceneChanges(FrameSource &source, int max_additional, std::vector<CandidateFrame> &frames,
                            std::set<double> &timestamps);
    std::vector<CandidateFrame> sampleEvenly(FrameSource &source, int count);
    void releaseAll(const std::vector<CandidateFrame> &frames);

    FrameStore &store_;
    SamplerSettings settings_;
    int64_t frames_read_ = 0;
};
