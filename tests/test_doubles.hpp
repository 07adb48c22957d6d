#pragma once

#include "core/media_backend.hpp"
#include "core/pipeline_errors.hpp"
#include "database/result_store.hpp"
#include "providers/ai_providers.hpp"
#include "storage/object_storage.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

/**
 * @brief Test images shared by the hasher, sampler and pipeline tests
 */
namespace test_images
{
    inline cv::Mat solid(int value, int width = 320, int height = 240)
    {
        return cv::Mat(height, width, CV_8UC3, cv::Scalar(value, value, value));
    }

    inline cv::Mat checkerboard(int square, int width = 340, int height = 320)
    {
        cv::Mat image(height, width, CV_8UC3);
        for (int y = 0; y < height; y++)
        {
            for (int x = 0; x < width; x++)
            {
                const uint8_t v = ((x / square) + (y / square)) % 2 == 0 ? 255 : 0;
                image.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
            }
        }
        return image;
    }

    // Brightness rises left to right (and slightly top to bottom)
    inline cv::Mat gradient(int width = 320, int height = 240)
    {
        cv::Mat image(height, width, CV_8UC3);
        for (int y = 0; y < height; y++)
        {
            for (int x = 0; x < width; x++)
            {
                const uint8_t v = static_cast<uint8_t>(x * 200 / width + y * 55 / height);
                image.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
            }
        }
        return image;
    }

    // Brightness falls left to right
    inline cv::Mat reverseGradient(int width = 320, int height = 240)
    {
        cv::Mat image;
        cv::flip(gradient(width, height), image, 1);
        return image;
    }
}

/**
 * @brief Frame source computing every frame from its index
 */
class SyntheticFrameSource : public FrameSource
{
public:
    using Generator = std::function<cv::Mat(int64_t)>;

    SyntheticFrameSource(double duration_seconds, double fps, Generator generator)
        : generator_(std::move(generator))
    {
        info_.has_video = true;
        info_.duration_seconds = duration_seconds;
        info_.fps = fps;
        info_.total_frames = static_cast<int64_t>(duration_seconds * fps);
        info_.width = 320;
        info_.height = 240;
    }

    const MediaInfo &info() const override { return info_; }

    bool readFrameAt(int64_t frame_index, cv::Mat &out) override
    {
        random_reads++;
        if (fail_all || failing_random_reads > 0)
        {
            if (failing_random_reads > 0)
                failing_random_reads--;
            return false;
        }
        if (frame_index < 0 || frame_index >= info_.total_frames)
            return false;
        out = generator_(frame_index);
        return true;
    }

    bool rewind() override
    {
        cursor_ = 0;
        return true;
    }

    bool readNext(cv::Mat &out) override
    {
        if (fail_all || cursor_ >= info_.total_frames)
            return false;
        out = generator_(cursor_++);
        return true;
    }

    bool fail_all = false;
    int failing_random_reads = 0;
    int random_reads = 0;

private:
    MediaInfo info_;
    Generator generator_;
    int64_t cursor_ = 0;
};

/**
 * @brief Media backend serving a synthetic video and a tiny WAV file
 */
class FakeMediaBackend : public MediaBackend
{
public:
    FakeMediaBackend(double duration_seconds, double fps, SyntheticFrameSource::Generator generator)
        : duration_(duration_seconds), fps_(fps), generator_(std::move(generator))
    {
    }

    MediaInfo probe(const std::string &media_path) override
    {
        if (unreadable)
            throw SourceUnreadable("Cannot open " + media_path);
        MediaInfo info;
        info.has_video = has_video;
        info.has_audio = has_audio;
        info.duration_seconds = duration_;
        info.fps = has_video ? fps_ : 0.0;
        info.total_frames = has_video ? static_cast<int64_t>(duration_ * fps_) : 0;
        return info;
    }

    std::unique_ptr<FrameSource> openVideo(const std::string &media_path) override
    {
        if (!has_video)
            throw SourceUnreadable("No video stream in " + media_path);
        return std::make_unique<SyntheticFrameSource>(duration_, fps_, generator_);
    }

    bool extractAudio(const std::string &, const std::string &wav_path) override
    {
        if (!has_audio)
            return false;
        std::ofstream out(wav_path, std::ios::binary);
        out << "RIFF-fake-wav";
        last_wav_path = wav_path;
        return true;
    }

    bool has_video = true;
    bool has_audio = true;
    bool unreadable = false;
    std::string last_wav_path;

private:
    double duration_;
    double fps_;
    SyntheticFrameSource::Generator generator_;
};

class FakeTranscriptionProvider : public TranscriptionProvider
{
public:
    Transcript transcribe(const std::string &audio_path, const std::string &language) override
    {
        calls++;
        audio_existed = std::filesystem::exists(audio_path);
        Transcript result = transcript;
        result.language = language;
        return result;
    }

    std::string name() const override { return "fake-transcription"; }

    Transcript transcript;
    std::atomic<int> calls{0};
    std::atomic<bool> audio_existed{false};
};

/**
 * @brief Vision provider answering through a script; records every request
 */
class ScriptedVisionProvider : public VisionProvider
{
public:
    struct Call
    {
        std::string image_path;
        std::string prompt;
        nlohmann::json context;
        bool image_existed = false;
    };

    using Responder = std::function<std::string(int call_index)>;

    explicit ScriptedVisionProvider(Responder responder) : responder_(std::move(responder)) {}

    std::string describeFrame(const std::string &image_path, const std::string &prompt,
                              const nlohmann::json &context) override
    {
        int index;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            index = static_cast<int>(calls_.size());
            calls_.push_back(Call{image_path, prompt, context, std::filesystem::exists(image_path)});
        }
        return responder_(index);
    }

    std::string name() const override { return "scripted-vision"; }

    std::vector<Call> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    Responder responder_;
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

/**
 * @brief Analysis provider answering through a handler; records prompts
 */
class ScriptedAnalysisProvider : public AnalysisProvider
{
public:
    using Handler = std::function<std::string(const std::string &prompt, const std::string &system_message,
                                              const std::string &response_format)>;

    explicit ScriptedAnalysisProvider(Handler handler) : handler_(std::move(handler)) {}

    std::string analyze(const std::string &prompt, const std::string &system_message, int,
                        const std::string &response_format) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_.push_back(prompt);
        }
        return handler_(prompt, system_message, response_format);
    }

    std::string name() const override { return "scripted-analysis"; }

    std::vector<std::string> prompts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<std::string> prompts_;
};

/**
 * @brief In-memory ResultStore with switchable failures
 */
class MemoryResultStore : public ResultStore
{
public:
    DBOpResult saveJob(const PipelineJob &job) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stages[job.job_id] = job.stage;
        return DBOpResult(true);
    }

    DBOpResult appendProgress(const std::string &job_id, const ProgressEntry &entry) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_progress)
            return DBOpResult(false, "progress table locked");
        progress[job_id].push_back(entry.message);
        return DBOpResult(true);
    }

    DBOpResult saveTranscript(const std::string &job_id, const EnrichedTranscript &transcript) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transcripts[job_id] = transcript;
        return DBOpResult(true);
    }

    DBOpResult saveFrame(const std::string &job_id, const FrameRecord &frame) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_frames)
            return DBOpResult(false, "disk full");
        frames[job_id].push_back(frame);
        return DBOpResult(true);
    }

    DBOpResult saveAnalysis(const std::string &job_id, const nlohmann::json &analysis) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_analysis)
            return DBOpResult(false, "disk full");
        analyses[job_id] = analysis;
        return DBOpResult(true);
    }

    DBOpResult clearResults(const std::string &job_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_calls++;
        transcripts.erase(job_id);
        frames.erase(job_id);
        analyses.erase(job_id);
        return DBOpResult(true);
    }

    size_t frameCount(const std::string &job_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = frames.find(job_id);
        return it == frames.end() ? 0 : it->second.size();
    }

    bool hasAnalysis(const std::string &job_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return analyses.count(job_id) > 0;
    }

    std::atomic<bool> fail_progress{false};
    std::atomic<bool> fail_frames{false};
    std::atomic<bool> fail_analysis{false};
    int clear_calls = 0;

    std::map<std::string, PipelineStage> stages;
    std::map<std::string, std::vector<std::string>> progress;
    std::map<std::string, EnrichedTranscript> transcripts;
    std::map<std::string, std::vector<FrameRecord>> frames;
    std::map<std::string, nlohmann::json> analyses;

private:
    std::mutex mutex_;
};

/**
 * @brief Object storage recording uploads instead of copying them
 */
class RecordingObjectStorage : public ObjectStorage
{
public:
    std::string upload(const std::string &local_path, const std::string &object_key) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_uploads)
            throw std::runtime_error("bucket unavailable");
        if (!std::filesystem::exists(local_path))
            throw std::runtime_error("missing local file " + local_path);
        objects[object_key] = local_path;
        return "https://cdn.test/" + object_key;
    }

    size_t removePrefix(const std::string &prefix) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed_prefixes.push_back(prefix);
        size_t removed = 0;
        for (auto it = objects.begin(); it != objects.end();)
        {
            if (it->first.compare(0, prefix.size(), prefix) == 0)
            {
                it = objects.erase(it);
                removed++;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    size_t objectCount()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects.size();
    }

    std::atomic<bool> fail_uploads{false};
    std::map<std::string, std::string> objects;
    std::vector<std::string> removed_prefixes;

private:
    std::mutex mutex_;
};
