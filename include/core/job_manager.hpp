#pragma once

#include "core/analysis_pipeline.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_job.hpp"
#include <tbb/task_arena.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Accepts jobs and runs them on a bounded TBB arena.
 *
 * Each job runs its stages sequentially; up to max_concurrent_jobs jobs run at once.
 * Job state is kept in memory and mirrored to the result store by the pipeline.
 */
class JobManager
{
public:
    /**
     * @throws std::invalid_argument if a required service is missing
     */
    JobManager(PipelineServices services, const PipelineConfig &config);
    ~JobManager();

    JobManager(const JobManager &) = delete;
    JobManager &operator=(const JobManager &) = delete;

    /**
     * @brief Register a job and queue it
     * @param media_path Media file to analyze
     * @param context Free-text domain context for the prompts
     * @param mode Analysis mode used for audio-only media
     * @return Job id
     * @throws std::runtime_error after shutdown()
     */
    std::string submit(const std::string &media_path, const std::string &context = "",
                       AnalysisMode mode = AnalysisMode::AUTO);

    std::optional<JobStatus> getStatus(const std::string &job_id) const;

    /**
     * @brief Re-run a failed job from the beginning, discarding its partial results.
     * @return false if the job is unknown, not failed, or its results cannot be cleared
     */
    bool retry(const std::string &job_id);

    /**
     * @brief Ask a job to stop; it fails with "cancelled" at the next stage or frame boundary
     * @return false if the job is unknown or already terminal
     */
    bool cancel(const std::string &job_id);

    /**
     * @brief Block until the job reaches a terminal stage and its task has finished
     * @return false on timeout or unknown job
     */
    bool waitForJob(const std::string &job_id, std::chrono::milliseconds timeout);

    /**
     * @brief Wait for every queued and running job
     */
    void waitAll();

    /**
     * @brief Cancel outstanding jobs and wait for their tasks to finish
     */
    void shutdown();

    static std::string generateJobId();

private:
    struct JobRecord
    {
        PipelineJob job;
        bool running = false;
        bool cancel_requested = false;
        int attempts = 0;
    };

    class Tracker : public JobObserver
    {
    public:
        explicit Tracker(JobManager &owner) : owner_(owner) {}
        void onStageChanged(const std::string &job_id, PipelineStage stage) override;
        void onProgress(const std::string &job_id, const ProgressEntry &entry) override;
        bool isCancelled(const std::string &job_id) const override;

    private:
        JobManager &owner_;
    };

    void enqueue(const std::string &job_id);
    void runJob(const std::string &job_id);

    PipelineServices services_;
    AnalysisPipeline pipeline_;
    Tracker tracker_;
    tbb::task_arena arena_;

    mutable std::mutex mutex_;
    std::condition_variable finished_;
    std::map<std::string, JobRecord> jobs_;
    size_t outstanding_ = 0;
    bool accepting_ = true;
};
