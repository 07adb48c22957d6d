#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Opaque handle to a stored frame image (see FrameStore)
 */
using ImageRef = std::string;

enum class ExtractionMethod
{
    UNIFORM,
    SCENE_CHANGE
};

inline std::string extractionMethodName(ExtractionMethod method)
{
    switch (method)
    {
    case ExtractionMethod::UNIFORM:
        return "uniform";
    case ExtractionMethod::SCENE_CHANGE:
        return "scene_change";
    default:
        return "unknown";
    }
}

/**
 * @brief Frame picked by the sampler, before deduplication
 */
struct CandidateFrame
{
    int64_t frame_index = 0;
    double timestamp_seconds = 0.0;
    ImageRef image_ref;
    ExtractionMethod extraction_method = ExtractionMethod::UNIFORM;
    double scene_change_score = 0.0; // 0-100, only meaningful for SCENE_CHANGE
};

/**
 * @brief Candidate that survived deduplication, enriched with transcript context
 */
struct SampledFrame
{
    CandidateFrame frame;
    std::string transcript_window;
    std::vector<std::string> topics_in_window;
    std::vector<std::string> keywords;
    std::optional<std::string> continuity_hint;
};

/**
 * @brief Result of describing one SampledFrame
 */
struct FrameDescription
{
    std::string content; // JSON document text (provider output or local fallback)
    bool fallback = false;
    int external_calls = 0;
};

struct TranscriptSegment
{
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

struct Transcript
{
    std::string full_text;
    std::string language;
    std::vector<TranscriptSegment> segments;
};

struct TopicSpan
{
    std::string topic;
    double start_time = 0.0;
    double end_time = 9999.0;
};

/**
 * @brief Transcript plus the semantic enrichment produced by the text-analysis model
 */
struct EnrichedTranscript
{
    Transcript transcript;
    bool enriched = false;
    std::string semantic_summary;
    std::vector<TopicSpan> topics;
    std::vector<std::string> keywords;
    std::string tone = "unknown";
    std::string enrichment_error;
};

/**
 * @brief Persisted record for one analyzed frame
 */
struct FrameRecord
{
    int sequence = 0;
    int64_t frame_index = 0;
    double timestamp_seconds = 0.0;
    std::string image_url;
    std::string extraction_method;
    double scene_change_score = 0.0;
    FrameDescription description;
};
