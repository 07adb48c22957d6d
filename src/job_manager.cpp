#include "core/job_manager.hpp"
#include "logging/logger.hpp"
#include <openssl/rand.h>
#include <cstdio>
#include <stdexcept>

namespace
{
    int arenaConcurrency(int max_concurrent_jobs)
    {
        return max_concurrent_jobs > 0 ? max_concurrent_jobs : 1;
    }
}

JobManager::JobManager(PipelineServices services, const PipelineConfig &config)
    : services_(services), pipeline_(std::move(services), config), tracker_(*this),
      arena_(arenaConcurrency(config.max_concurrent_jobs), 0)
{
    Logger::info("Job manager ready with " + std::to_string(arenaConcurrency(config.max_concurrent_jobs)) +
                 " concurrent job slots");
}

JobManager::~JobManager()
{
    shutdown();
}

std::string JobManager::generateJobId()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
    {
        throw std::runtime_error("Failed to generate job id");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char id[37];
    std::snprintf(id, sizeof(id), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7], bytes[8],
                  bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return id;
}

std::string JobManager::submit(const std::string &media_path, const std::string &context, AnalysisMode mode)
{
    PipelineJob job;
    job.job_id = generateJobId();
    job.media_path = media_path;
    job.context = context;
    job.analysis_mode = mode;
    job.media_kind = PipelineStages::kindFromPath(media_path);
    job.stage = PipelineStage::EXTRACTING_AUDIO;
    job.created_at = std::chrono::system_clock::now();
    job.updated_at = job.created_at;

    DBOpResult result = services_.store->saveJob(job);
    if (!result.success)
    {
        Logger::warn("Could not persist new job " + job.job_id + ": " + result.error_message);
    }

    const std::string job_id = job.job_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_)
        {
            throw std::runtime_error("Job manager is shut down");
        }
        JobRecord record;
        record.job = std::move(job);
        record.attempts = 1;
        jobs_.emplace(job_id, std::move(record));
    }

    Logger::info("Submitted job " + job_id + " (" + PipelineStages::kindName(PipelineStages::kindFromPath(media_path)) +
                 ", mode " + PipelineStages::modeName(mode) + "): " + media_path);
    enqueue(job_id);
    return job_id;
}

std::optional<JobStatus> JobManager::getStatus(const std::string &job_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end())
        return std::nullopt;

    const JobRecord &record = it->second;
    JobStatus status;
    status.job_id = job_id;
    status.stage = record.job.stage;
    status.progress_log = record.job.progress_log;
    status.error_message = record.job.error_message;
    status.attempts = record.attempts;
    return status;
}

bool JobManager::retry(const std::string &job_id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end())
        {
            Logger::warn("Retry requested for unknown job " + job_id);
            return false;
        }
        if (it->second.running || it->second.job.stage != PipelineStage::FAILED || !accepting_)
        {
            Logger::warn("Retry rejected for job " + job_id + " in stage " +
                         PipelineStages::stageName(it->second.job.stage));
            return false;
        }
        // Reserve the job so a second retry cannot race this one
        it->second.running = true;
    }

    DBOpResult result = services_.store->clearResults(job_id);
    bool cleared = result.success;
    if (cleared)
    {
        try
        {
            services_.storage->removePrefix("jobs/" + job_id);
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to remove published keyframes of job " + job_id + ": " + e.what());
            cleared = false;
        }
    }
    else
    {
        Logger::error("Failed to clear results of job " + job_id + ": " + result.error_message);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord &record = jobs_.at(job_id);
    if (!cleared)
    {
        record.running = false;
        finished_.notify_all();
        return false;
    }

    ProgressEntry entry{std::chrono::system_clock::now(), LogLevel::INFO,
                        "Retry requested (attempt " + std::to_string(record.attempts + 1) + ")"};
    record.job.progress_log.push_back(entry);
    DBOpResult logged = services_.store->appendProgress(job_id, entry);
    if (!logged.success)
    {
        Logger::warn("Could not persist progress entry for job " + job_id + ": " + logged.error_message);
    }

    record.attempts++;
    record.cancel_requested = false;
    record.running = false;
    record.job.stage = PipelineStage::EXTRACTING_AUDIO;
    record.job.error_message.clear();
    record.job.updated_at = std::chrono::system_clock::now();
    outstanding_++;

    Logger::info("Retrying job " + job_id);
    arena_.enqueue([this, job_id]
                   { runJob(job_id); });
    return true;
}

bool JobManager::cancel(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || PipelineStages::isTerminal(it->second.job.stage))
        return false;
    it->second.cancel_requested = true;
    Logger::info("Cancellation requested for job " + job_id);
    return true;
}

bool JobManager::waitForJob(const std::string &job_id, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_.wait_for(lock, timeout, [this, &job_id]
                              {
        auto it = jobs_.find(job_id);
        if (it == jobs_.end())
            return true;
        return !it->second.running && PipelineStages::isTerminal(it->second.job.stage); }) &&
           jobs_.count(job_id) > 0;
}

void JobManager::waitAll()
{
    std::unique_lock<std::mutex> lock(mutex_);
    finished_.wait(lock, [this]
                   { return outstanding_ == 0; });
}

void JobManager::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ && outstanding_ == 0)
            return;
        accepting_ = false;
        for (auto &entry : jobs_)
        {
            if (!PipelineStages::isTerminal(entry.second.job.stage))
                entry.second.cancel_requested = true;
        }
    }
    waitAll();
    Logger::info("Job manager shut down");
}

void JobManager::enqueue(const std::string &job_id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_++;
    }
    arena_.enqueue([this, job_id]
                   { runJob(job_id); });
}

void JobManager::runJob(const std::string &job_id)
{
    PipelineJob working;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobRecord &record = jobs_.at(job_id);
        record.running = true;
        working = record.job;
    }

    pipeline_.execute(working, &tracker_);

    std::lock_guard<std::mutex> lock(mutex_);
    JobRecord &record = jobs_.at(job_id);
    record.job = std::move(working);
    record.running = false;
    outstanding_--;
    finished_.notify_all();
}

void JobManager::Tracker::onStageChanged(const std::string &job_id, PipelineStage stage)
{
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    auto it = owner_.jobs_.find(job_id);
    if (it == owner_.jobs_.end())
        return;
    it->second.job.stage = stage;
    it->second.job.updated_at = std::chrono::system_clock::now();
}

void JobManager::Tracker::onProgress(const std::string &job_id, const ProgressEntry &entry)
{
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    auto it = owner_.jobs_.find(job_id);
    if (it != owner_.jobs_.end())
        it->second.job.progress_log.push_back(entry);
}

bool JobManager::Tracker::isCancelled(const std::string &job_id) const
{
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    auto it = owner_.jobs_.find(job_id);
    return it != owner_.jobs_.end() && it->second.cancel_requested;
}
