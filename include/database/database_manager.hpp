#pragma once

#include "database/result_store.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Job row as stored in the database
 */
struct StoredJob
{
    std::string job_id;
    std::string media_path;
    std::string context;
    std::string analysis_mode;
    std::string media_kind;
    std::string stage;
    std::string error_message;
    std::string created_at;
    std::string updated_at;
};

/**
 * @brief SQLite result store for jobs, progress log, transcripts, keyframes and analyses
 *
 * One connection in WAL mode with foreign keys enabled; every statement runs under db_mutex_.
 */
class DatabaseManager : public ResultStore
{
public:
    /**
     * @param db_path SQLite file path, or ":memory:"
     */
    explicit DatabaseManager(const std::string &db_path);
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    /**
     * @brief Whether the connection opened and the schema was created
     */
    bool isValid() const { return db_ != nullptr && initialized_; }

    DBOpResult saveJob(const PipelineJob &job) override;
    DBOpResult appendProgress(const std::string &job_id, const ProgressEntry &entry) override;
    DBOpResult saveTranscript(const std::string &job_id, const EnrichedTranscript &transcript) override;
    DBOpResult saveFrame(const std::string &job_id, const FrameRecord &frame) override;
    DBOpResult saveAnalysis(const std::string &job_id, const nlohmann::json &analysis) override;
    DBOpResult clearResults(const std::string &job_id) override;

    std::optional<StoredJob> getJob(const std::string &job_id);

    /**
     * @brief Progress messages of a job in insertion order, as "level: message"
     */
    std::vector<std::string> getProgressMessages(const std::string &job_id);

    /**
     * @brief Stored transcript as JSON ({full_text, language, segments, enriched, ...})
     */
    std::optional<nlohmann::json> getTranscript(const std::string &job_id);

    std::vector<FrameRecord> getFrames(const std::string &job_id);
    std::optional<nlohmann::json> getAnalysis(const std::string &job_id);

private:
    bool initialize();
    DBOpResult executeStatement(const std::string &sql);

    sqlite3 *db_;
    std::string db_path_;
    bool initialized_ = false;
    std::mutex db_mutex_;
};
