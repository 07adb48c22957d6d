#include "database/database_manager.hpp"
#include "logging/logger.hpp"

using json = nlohmann::json;

namespace
{
    const char *kCreateTablesSql = R"SQL(
CREATE TABLE IF NOT EXISTS jobs (
    job_id TEXT PRIMARY KEY,
    media_path TEXT NOT NULL,
    context TEXT,
    analysis_mode TEXT NOT NULL,
    media_kind TEXT NOT NULL,
    stage TEXT NOT NULL,
    error_message TEXT,
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS progress_log (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    job_id TEXT NOT NULL REFERENCES jobs(job_id) ON DELETE CASCADE,
    created_at TEXT NOT NULL,
    level TEXT NOT NULL,
    message TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS transcripts (
    job_id TEXT PRIMARY KEY REFERENCES jobs(job_id) ON DELETE CASCADE,
    full_text TEXT,
    language TEXT,
    segments TEXT,
    enrichment TEXT
);
CREATE TABLE IF NOT EXISTS keyframes (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    job_id TEXT NOT NULL REFERENCES jobs(job_id) ON DELETE CASCADE,
    sequence INTEGER NOT NULL,
    frame_index INTEGER NOT NULL,
    timestamp_seconds REAL NOT NULL,
    image_url TEXT,
    extraction_method TEXT,
    scene_change_score REAL,
    description TEXT,
    fallback INTEGER NOT NULL DEFAULT 0,
    external_calls INTEGER NOT NULL DEFAULT 1,
    UNIQUE(job_id, sequence)
);
CREATE TABLE IF NOT EXISTS analyses (
    job_id TEXT PRIMARY KEY REFERENCES jobs(job_id) ON DELETE CASCADE,
    document TEXT NOT NULL,
    created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_progress_job ON progress_log(job_id);
CREATE INDEX IF NOT EXISTS idx_keyframes_job ON keyframes(job_id, sequence);
)SQL";

    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    json enrichmentDocument(const EnrichedTranscript &transcript)
    {
        json topics = json::array();
        for (const auto &span : transcript.topics)
        {
            topics.push_back({{"topic", span.topic}, {"start_time", span.start_time}, {"end_time", span.end_time}});
        }
        json doc{{"enriched", transcript.enriched},
                 {"semantic_summary", transcript.semantic_summary},
                 {"topics", topics},
                 {"keywords", transcript.keywords},
                 {"tone", transcript.tone}};
        if (!transcript.enrichment_error.empty())
            doc["enrichment_error"] = transcript.enrichment_error;
        return doc;
    }
}

DatabaseManager::DatabaseManager(const std::string &db_path)
    : db_(nullptr), db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(db_)));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Logger::info("Database opened successfully: " + db_path);

    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    rc = sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::warn("Failed to enable foreign keys: " + std::string(sqlite3_errmsg(db_)));
    }

    initialized_ = initialize();
}

DatabaseManager::~DatabaseManager()
{
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::initialize()
{
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, kCreateTablesSql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to create tables: " + std::string(err_msg ? err_msg : "unknown error"));
        sqlite3_free(err_msg);
        return false;
    }
    Logger::debug("Database schema ready: " + db_path_);
    return true;
}

DBOpResult DatabaseManager::executeStatement(const std::string &sql)
{
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string error = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        return DBOpResult(false, error);
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::saveJob(const PipelineJob &job)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    const std::string sql =
        "INSERT INTO jobs (job_id, media_path, context, analysis_mode, media_kind, stage, error_message, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(job_id) DO UPDATE SET stage = excluded.stage, error_message = excluded.error_message, "
        "updated_at = excluded.updated_at";

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, job.job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, job.media_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, job.context.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, PipelineStages::modeName(job.analysis_mode).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, PipelineStages::kindName(job.media_kind).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, PipelineStages::stageName(job.stage).c_str(), -1, SQLITE_TRANSIENT);
    if (job.error_message.empty())
        sqlite3_bind_null(stmt, 7);
    else
        sqlite3_bind_text(stmt, 7, job.error_message.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, formatTimePoint(job.created_at).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, formatTimePoint(job.updated_at).c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to save job: " + std::string(sqlite3_errmsg(db_)));
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::appendProgress(const std::string &job_id, const ProgressEntry &entry)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    const std::string sql = "INSERT INTO progress_log (job_id, created_at, level, message) VALUES (?, ?, ?, ?)";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, formatTimePoint(entry.timestamp).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, logLevelName(entry.level).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, entry.message.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to append progress: " + std::string(sqlite3_errmsg(db_)));
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::saveTranscript(const std::string &job_id, const EnrichedTranscript &transcript)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    json segments = json::array();
    for (const auto &segment : transcript.transcript.segments)
    {
        segments.push_back({{"start", segment.start}, {"end", segment.end}, {"text", segment.text}});
    }

    const std::string sql =
        "INSERT OR REPLACE INTO transcripts (job_id, full_text, language, segments, enrichment) "
        "VALUES (?, ?, ?, ?, ?)";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    const std::string segments_text = segments.dump(-1, ' ', false, json::error_handler_t::replace);
    const std::string enrichment_text =
        enrichmentDocument(transcript).dump(-1, ' ', false, json::error_handler_t::replace);
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, transcript.transcript.full_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, transcript.transcript.language.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, segments_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, enrichment_text.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to save transcript: " + std::string(sqlite3_errmsg(db_)));
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::saveFrame(const std::string &job_id, const FrameRecord &frame)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    const std::string sql =
        "INSERT INTO keyframes (job_id, sequence, frame_index, timestamp_seconds, image_url, extraction_method, "
        "scene_change_score, description, fallback, external_calls) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, frame.sequence);
    sqlite3_bind_int64(stmt, 3, frame.frame_index);
    sqlite3_bind_double(stmt, 4, frame.timestamp_seconds);
    sqlite3_bind_text(stmt, 5, frame.image_url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, frame.extraction_method.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 7, frame.scene_change_score);
    sqlite3_bind_text(stmt, 8, frame.description.content.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 9, frame.description.fallback ? 1 : 0);
    sqlite3_bind_int(stmt, 10, frame.description.external_calls);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to save keyframe: " + std::string(sqlite3_errmsg(db_)));
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::saveAnalysis(const std::string &job_id, const json &analysis)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    const std::string sql = "INSERT OR REPLACE INTO analyses (job_id, document, created_at) VALUES (?, ?, ?)";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    const std::string document = analysis.dump(-1, ' ', false, json::error_handler_t::replace);
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, document.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, formatTimePoint(std::chrono::system_clock::now()).c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to save analysis: " + std::string(sqlite3_errmsg(db_)));
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::clearResults(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    DBOpResult begin = executeStatement("BEGIN IMMEDIATE TRANSACTION;");
    if (!begin.success)
        return begin;

    for (const char *table : {"transcripts", "keyframes", "analyses"})
    {
        const std::string sql = std::string("DELETE FROM ") + table + " WHERE job_id = ?";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::string error = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_));
            executeStatement("ROLLBACK;");
            return DBOpResult(false, error);
        }
        sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            std::string error = "Failed to clear " + std::string(table) + ": " + sqlite3_errmsg(db_);
            executeStatement("ROLLBACK;");
            return DBOpResult(false, error);
        }
    }

    DBOpResult commit = executeStatement("COMMIT;");
    if (!commit.success)
    {
        executeStatement("ROLLBACK;");
        return commit;
    }
    Logger::info("Cleared previous results for job " + job_id);
    return DBOpResult(true);
}

std::optional<StoredJob> DatabaseManager::getJob(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return std::nullopt;

    const std::string sql =
        "SELECT job_id, media_path, context, analysis_mode, media_kind, stage, error_message, created_at, updated_at "
        "FROM jobs WHERE job_id = ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare job query: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<StoredJob> job;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        StoredJob row;
        row.job_id = columnText(stmt, 0);
        row.media_path = columnText(stmt, 1);
        row.context = columnText(stmt, 2);
        row.analysis_mode = columnText(stmt, 3);
        row.media_kind = columnText(stmt, 4);
        row.stage = columnText(stmt, 5);
        row.error_message = columnText(stmt, 6);
        row.created_at = columnText(stmt, 7);
        row.updated_at = columnText(stmt, 8);
        job = row;
    }
    sqlite3_finalize(stmt);
    return job;
}

std::vector<std::string> DatabaseManager::getProgressMessages(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<std::string> messages;
    if (!db_)
        return messages;

    const std::string sql = "SELECT level, message FROM progress_log WHERE job_id = ? ORDER BY id";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare progress query: " + std::string(sqlite3_errmsg(db_)));
        return messages;
    }
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        messages.push_back(columnText(stmt, 0) + ": " + columnText(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return messages;
}

std::optional<json> DatabaseManager::getTranscript(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return std::nullopt;

    const std::string sql = "SELECT full_text, language, segments, enrichment FROM transcripts WHERE job_id = ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare transcript query: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<json> transcript;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        json doc = json::parse(columnText(stmt, 3), nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
            doc = json::object();
        doc["full_text"] = columnText(stmt, 0);
        doc["language"] = columnText(stmt, 1);
        json segments = json::parse(columnText(stmt, 2), nullptr, false);
        doc["segments"] = segments.is_discarded() ? json::array() : segments;
        transcript = doc;
    }
    sqlite3_finalize(stmt);
    return transcript;
}

std::vector<FrameRecord> DatabaseManager::getFrames(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<FrameRecord> frames;
    if (!db_)
        return frames;

    const std::string sql =
        "SELECT sequence, frame_index, timestamp_seconds, image_url, extraction_method, scene_change_score, "
        "description, fallback, external_calls FROM keyframes WHERE job_id = ? ORDER BY sequence";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare keyframe query: " + std::string(sqlite3_errmsg(db_)));
        return frames;
    }
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        FrameRecord record;
        record.sequence = sqlite3_column_int(stmt, 0);
        record.frame_index = sqlite3_column_int64(stmt, 1);
        record.timestamp_seconds = sqlite3_column_double(stmt, 2);
        record.image_url = columnText(stmt, 3);
        record.extraction_method = columnText(stmt, 4);
        record.scene_change_score = sqlite3_column_double(stmt, 5);
        record.description.content = columnText(stmt, 6);
        record.description.fallback = sqlite3_column_int(stmt, 7) != 0;
        record.description.external_calls = sqlite3_column_int(stmt, 8);
        frames.push_back(record);
    }
    sqlite3_finalize(stmt);
    return frames;
}

std::optional<json> DatabaseManager::getAnalysis(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return std::nullopt;

    const std::string sql = "SELECT document FROM analyses WHERE job_id = ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare analysis query: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<json> analysis;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        json doc = json::parse(columnText(stmt, 0), nullptr, false);
        if (!doc.is_discarded())
            analysis = doc;
    }
    sqlite3_finalize(stmt);
    return analysis;
}
