#pragma once

#include "core/media_types.hpp"
#include "core/pipeline_job.hpp"
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Persistence boundary of the pipeline
 */
class ResultStore
{
public:
    virtual ~ResultStore() = default;

    // Insert or update the job row (stage, error, timestamps)
    virtual DBOpResult saveJob(const PipelineJob &job) = 0;
    virtual DBOpResult appendProgress(const std::string &job_id, const ProgressEntry &entry) = 0;
    virtual DBOpResult saveTranscript(const std::string &job_id, const EnrichedTranscript &transcript) = 0;
    virtual DBOpResult saveFrame(const std::string &job_id, const FrameRecord &frame) = 0;
    virtual DBOpResult saveAnalysis(const std::string &job_id, const nlohmann::json &analysis) = 0;

    /**
     * @brief Delete transcript, frames and analysis of a job. The job row and its progress log are kept.
     */
    virtual DBOpResult clearResults(const std::string &job_id) = 0;
};
