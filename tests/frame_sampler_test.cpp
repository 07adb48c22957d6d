#include "core/frame_sampler.hpp"
#include "core/pipeline_errors.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>

namespace
{
    // A different picture every ten seconds
    cv::Mat blockPicture(int64_t frame_index, double fps)
    {
        const int block = static_cast<int>(frame_index / fps) / 10;
        switch (block % 3)
        {
        case 0:
            return test_images::gradient(160, 120);
        case 1:
            return test_images::checkerboard(10, 160, 120);
        default:
            return test_images::reverseGradient(160, 120);
        }
    }

    void expectStrictlyIncreasing(const std::vector<CandidateFrame> &frames)
    {
        for (size_t i = 1; i < frames.size(); i++)
        {
            EXPECT_LT(frames[i - 1].timestamp_seconds, frames[i].timestamp_seconds) << "at index " << i;
        }
    }
}

class FrameSamplerTest : public ::testing::Test
{
protected:
    SamplerSettings settings_;
    MemoryFrameStore store_;
};

TEST_F(FrameSamplerTest, TargetCountIsClampedToBounds)
{
    EXPECT_EQ(FrameSampler::targetFrameCount(65.0, settings_), 16);
    EXPECT_EQ(FrameSampler::targetFrameCount(8.0, settings_), 10);
    EXPECT_EQ(FrameSampler::targetFrameCount(3600.0, settings_), 50);
}

TEST_F(FrameSamplerTest, SixtyFiveSecondVideoYieldsTenToSixteenFrames)
{
    const double fps = 10.0;
    SyntheticFrameSource source(65.0, fps, [fps](int64_t i)
                                { return blockPicture(i, fps); });
    FrameSampler sampler(store_, settings_);

    auto frames = sampler.sample(source);

    EXPECT_GE(frames.size(), 10u);
    EXPECT_LE(frames.size(), 16u);
    expectStrictlyIncreasing(frames);
    EXPECT_EQ(store_.size(), frames.size());
    for (const auto &frame : frames)
    {
        EXPECT_GE(frame.timestamp_seconds, 0.0);
        EXPECT_LE(frame.timestamp_seconds, 65.0);
        EXPECT_FALSE(store_.load(frame.image_ref).empty());
    }
}

TEST_F(FrameSamplerTest, LongVideoNeverExceedsMaxFrames)
{
    const double fps = 5.0;
    SyntheticFrameSource source(600.0, fps, [fps](int64_t i)
                                { return blockPicture(i, fps); });
    FrameSampler sampler(store_, settings_);

    auto frames = sampler.sample(source);

    EXPECT_GE(frames.size(), static_cast<size_t>(settings_.min_frames));
    EXPECT_LE(frames.size(), static_cast<size_t>(settings_.max_frames));
    expectStrictlyIncreasing(frames);
}

TEST_F(FrameSamplerTest, SceneChangeAddsFrameBetweenUniformSamples)
{
    settings_.interval_seconds = 15.0;
    settings_.min_frames = 2;
    const double fps = 10.0;
    // Black until 4 s, white afterwards
    SyntheticFrameSource source(30.0, fps, [](int64_t i)
                                { return test_images::solid(i < 40 ? 0 : 255, 160, 120); });
    FrameSampler sampler(store_, settings_);

    auto frames = sampler.sample(source);

    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].extraction_method, ExtractionMethod::SCENE_CHANGE);
    EXPECT_DOUBLE_EQ(frames[0].timestamp_seconds, 4.0);
    EXPECT_GT(frames[0].scene_change_score, settings_.scene_threshold);
    EXPECT_EQ(frames[1].extraction_method, ExtractionMethod::UNIFORM);
    EXPECT_DOUBLE_EQ(frames[1].timestamp_seconds, 10.0);
    EXPECT_EQ(frames[2].extraction_method, ExtractionMethod::UNIFORM);
    EXPECT_DOUBLE_EQ(frames[2].timestamp_seconds, 20.0);
}

TEST_F(FrameSamplerTest, IdenticalHistogramsScoreZero)
{
    cv::Mat gray(120, 160, CV_8UC1, cv::Scalar(90));
    EXPECT_NEAR(FrameSampler::sceneChangeScore(gray, gray.clone()), 0.0, 1e-6);

    cv::Mat other(120, 160, CV_8UC1, cv::Scalar(200));
    EXPECT_GT(FrameSampler::sceneChangeScore(gray, other), 20.0);
}

TEST_F(FrameSamplerTest, FallsBackToEvenSamplingWhenRandomAccessFails)
{
    const double fps = 10.0;
    SyntheticFrameSource source(30.0, fps, [](int64_t)
                                { return test_images::solid(60, 160, 120); });
    source.failing_random_reads = FrameSampler::targetFrameCount(30.0, settings_);
    FrameSampler sampler(store_, settings_);

    auto frames = sampler.sample(source);

    EXPECT_EQ(frames.size(), static_cast<size_t>(settings_.max_frames));
    expectStrictlyIncreasing(frames);
    for (const auto &frame : frames)
    {
        EXPECT_EQ(frame.extraction_method, ExtractionMethod::UNIFORM);
    }
}

TEST_F(FrameSamplerTest, UnreadableSourceThrows)
{
    SyntheticFrameSource source(30.0, 10.0, [](int64_t)
                                { return test_images::solid(0); });
    source.fail_all = true;
    FrameSampler sampler(store_, settings_);

    EXPECT_THROW(sampler.sample(source), SourceUnreadable);
    EXPECT_EQ(store_.size(), 0u);
}
