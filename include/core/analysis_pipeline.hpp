#pragma once

#include "core/frame_store.hpp"
#include "core/media_analyzer.hpp"
#include "core/media_backend.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_job.hpp"
#include "core/vision_retry_machine.hpp"
#include "database/result_store.hpp"
#include "providers/ai_providers.hpp"
#include "storage/object_storage.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Collaborators of the pipeline, injected once
 */
struct PipelineServices
{
    std::shared_ptr<MediaBackend> media;
    std::shared_ptr<TranscriptionProvider> transcription;
    std::shared_ptr<VisionProvider> vision;
    std::shared_ptr<AnalysisProvider> analysis;
    std::shared_ptr<AnalysisProvider> enrichment;
    std::shared_ptr<ObjectStorage> storage;
    std::shared_ptr<ResultStore> store;
    RefusalPolicy refusal_policy = looksLikeRefusal;
};

/**
 * @brief Receives job state changes as they happen
 */
class JobObserver
{
public:
    virtual ~JobObserver() = default;
    virtual void onStageChanged(const std::string &job_id, PipelineStage stage) = 0;
    virtual void onProgress(const std::string &job_id, const ProgressEntry &entry) = 0;
    virtual bool isCancelled(const std::string &job_id) const = 0;
};

/**
 * @brief Job-scoped working directory, removed when the object goes out of scope
 */
class ScopedTempDir
{
public:
    /**
     * @throws std::runtime_error if the directory cannot be created
     */
    ScopedTempDir(const std::filesystem::path &root, const std::string &name);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Sequential stage machine running one job from media file to persisted analysis.
 *
 * Stages: extracting_audio, transcribing, enriching, sampling_frames, deduplicating,
 * analyzing_frames, synthesizing, persisting, then completed. Any stage-level exception
 * moves the job to failed. A frame whose description step throws is skipped. The job's
 * working directory is gone before the terminal stage is published.
 */
class AnalysisPipeline
{
public:
    /**
     * @throws std::invalid_argument if a required service is missing
     */
    AnalysisPipeline(PipelineServices services, const PipelineConfig &config);

    /**
     * @brief Run the job to a terminal stage
     * @param job Updated in place (stage, progress_log, error_message)
     * @param observer Optional sink for stage changes, progress and cancellation
     * @return COMPLETED or FAILED
     */
    PipelineStage execute(PipelineJob &job, JobObserver *observer = nullptr);

    static std::string keyframeObjectKey(const std::string &job_id, int sequence);

private:
    struct AnalyzedFrame
    {
        CandidateFrame frame;
        FrameDescription description;
    };

    struct JobContext
    {
        PipelineJob &job;
        JobObserver *observer;
        std::filesystem::path work_dir;
        MediaInfo info;
        bool has_audio = false;
        EnrichedTranscript transcript;
        std::unique_ptr<FileFrameStore> frames_store;
        std::vector<CandidateFrame> candidates;
        std::vector<AnalyzedFrame> analyzed;
        nlohmann::json analysis;
    };

    void runStages(JobContext &ctx);
    void extractAudio(JobContext &ctx);
    void transcribe(JobContext &ctx);
    void enrichTranscript(JobContext &ctx);
    void sampleFrames(JobContext &ctx);
    void deduplicateFrames(JobContext &ctx);
    void analyzeFrames(JobContext &ctx);
    void synthesize(JobContext &ctx);
    void persist(JobContext &ctx);

    void enterStage(PipelineJob &job, PipelineStage stage, JobObserver *observer);
    void progress(PipelineJob &job, LogLevel level, const std::string &message, JobObserver *observer);
    void checkCancelled(const PipelineJob &job, JobObserver *observer) const;
    void saveJobRow(const PipelineJob &job);

    PipelineServices services_;
    PipelineConfig config_;
    MediaAnalyzer analyzer_;
};
