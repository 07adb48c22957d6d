#include "core/pipeline_job.hpp"
#include "core/transcript_utils.hpp"
#include <array>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace
{
    const std::array<PipelineStage, 10> kAllStages = {
        PipelineStage::EXTRACTING_AUDIO, PipelineStage::TRANSCRIBING, PipelineStage::ENRICHING,
        PipelineStage::SAMPLING_FRAMES, PipelineStage::DEDUPLICATING, PipelineStage::ANALYZING_FRAMES,
        PipelineStage::SYNTHESIZING, PipelineStage::PERSISTING, PipelineStage::COMPLETED,
        PipelineStage::FAILED};

    const std::array<AnalysisMode, 6> kAllModes = {
        AnalysisMode::AUTO, AnalysisMode::REVERSE_ENGINEERING, AnalysisMode::MEETING,
        AnalysisMode::DEBRIEF, AnalysisMode::BRAINSTORMING, AnalysisMode::NOTES};
}

std::string PipelineStages::stageName(PipelineStage stage)
{
    switch (stage)
    {
    case PipelineStage::EXTRACTING_AUDIO:
        return "extracting_audio";
    case PipelineStage::TRANSCRIBING:
        return "transcribing";
    case PipelineStage::ENRICHING:
        return "enriching";
    case PipelineStage::SAMPLING_FRAMES:
        return "sampling_frames";
    case PipelineStage::DEDUPLICATING:
        return "deduplicating";
    case PipelineStage::ANALYZING_FRAMES:
        return "analyzing_frames";
    case PipelineStage::SYNTHESIZING:
        return "synthesizing";
    case PipelineStage::PERSISTING:
        return "persisting";
    case PipelineStage::COMPLETED:
        return "completed";
    case PipelineStage::FAILED:
        return "failed";
    default:
        return "unknown";
    }
}

std::optional<PipelineStage> PipelineStages::parseStage(const std::string &name)
{
    for (PipelineStage stage : kAllStages)
    {
        if (stageName(stage) == name)
            return stage;
    }
    return std::nullopt;
}

std::string PipelineStages::modeName(AnalysisMode mode)
{
    switch (mode)
    {
    case AnalysisMode::AUTO:
        return "auto";
    case AnalysisMode::REVERSE_ENGINEERING:
        return "reverse_engineering";
    case AnalysisMode::MEETING:
        return "meeting";
    case AnalysisMode::DEBRIEF:
        return "debrief";
    case AnalysisMode::BRAINSTORMING:
        return "brainstorming";
    case AnalysisMode::NOTES:
        return "notes";
    default:
        return "auto";
    }
}

AnalysisMode PipelineStages::parseMode(const std::string &name)
{
    const std::string lower = transcript_utils::toLower(name);
    for (AnalysisMode mode : kAllModes)
    {
        if (modeName(mode) == lower)
            return mode;
    }
    if (lower == "descriptive")
        return AnalysisMode::AUTO;
    throw std::invalid_argument("Unknown analysis mode: " + name);
}

std::string PipelineStages::kindName(MediaKind kind)
{
    return kind == MediaKind::AUDIO ? "audio" : "video";
}

MediaKind PipelineStages::kindFromPath(const std::string &media_path)
{
    static const std::array<const char *, 8> audio_extensions = {
        ".mp3", ".wav", ".m4a", ".aac", ".flac", ".ogg", ".opus", ".wma"};
    const std::string ext = transcript_utils::toLower(std::filesystem::path(media_path).extension().string());
    for (const char *audio_ext : audio_extensions)
    {
        if (ext == audio_ext)
            return MediaKind::AUDIO;
    }
    return MediaKind::VIDEO;
}

std::string logLevelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::WARNING:
        return "warning";
    case LogLevel::ERROR:
        return "error";
    default:
        return "info";
    }
}

std::string formatTimePoint(std::chrono::system_clock::time_point tp)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return oss.str();
}
