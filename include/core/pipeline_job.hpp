#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

enum class PipelineStage
{
    EXTRACTING_AUDIO,
    TRANSCRIBING,
    ENRICHING,
    SAMPLING_FRAMES,
    DEDUPLICATING,
    ANALYZING_FRAMES,
    SYNTHESIZING,
    PERSISTING,
    COMPLETED,
    FAILED
};

enum class AnalysisMode
{
    AUTO,
    REVERSE_ENGINEERING,
    MEETING,
    DEBRIEF,
    BRAINSTORMING,
    NOTES
};

enum class MediaKind
{
    VIDEO,
    AUDIO
};

/**
 * @brief Name/parse helpers for the job enums (names are the lowercase wire strings)
 */
class PipelineStages
{
public:
    static std::string stageName(PipelineStage stage);
    static std::optional<PipelineStage> parseStage(const std::string &name);
    static bool isTerminal(PipelineStage stage)
    {
        return stage == PipelineStage::COMPLETED || stage == PipelineStage::FAILED;
    }

    static std::string modeName(AnalysisMode mode);

    /**
     * @throws std::invalid_argument for an unknown mode name
     */
    static AnalysisMode parseMode(const std::string &name);

    static std::string kindName(MediaKind kind);

    /**
     * @brief Audio-only by extension (.mp3, .wav, .m4a, .aac, .flac, .ogg, .opus, .wma)
     */
    static MediaKind kindFromPath(const std::string &media_path);
};

enum class LogLevel
{
    INFO,
    WARNING,
    ERROR
};

std::string logLevelName(LogLevel level);

struct ProgressEntry
{
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::INFO;
    std::string message;
};

/**
 * @brief Orchestration state of one submitted media file
 */
struct PipelineJob
{
    std::string job_id;
    std::string media_path;
    std::string context;
    AnalysisMode analysis_mode = AnalysisMode::AUTO;
    MediaKind media_kind = MediaKind::VIDEO;
    PipelineStage stage = PipelineStage::EXTRACTING_AUDIO;
    std::vector<ProgressEntry> progress_log;
    std::string error_message;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief Snapshot returned to callers polling a job
 */
struct JobStatus
{
    std::string job_id;
    PipelineStage stage = PipelineStage::EXTRACTING_AUDIO;
    std::vector<ProgressEntry> progress_log;
    std::string error_message;
    int attempts = 0;
};

// ISO-8601 UTC with milliseconds
std::string formatTimePoint(std::chrono::system_clock::time_point tp);
