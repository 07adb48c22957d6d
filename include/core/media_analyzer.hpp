#pragma once

#include "core/media_types.hpp"
#include "core/pipeline_job.hpp"
#include "providers/ai_providers.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Frame description reduced to what the synthesis prompt needs
 */
struct FrameSummaryInput
{
    double timestamp_seconds = 0.0;
    std::string description;
};

/**
 * @brief Text-analysis steps of the pipeline: transcript enrichment, content type inference
 * and final synthesis
 */
class MediaAnalyzer
{
public:
    /**
     * @param analysis Model used for synthesis
     * @param enrichment Model used for enrichment and content type inference
     * @param max_transcript_chars Transcript cut-off for the synthesis prompt
     * @param max_keyframes Frame summaries included in the synthesis prompt
     */
    MediaAnalyzer(AnalysisProvider &analysis, AnalysisProvider &enrichment, size_t max_transcript_chars = 8000,
                  size_t max_keyframes = 15);

    /**
     * @brief Add semantic summary, topics with time spans, keywords and tone to a transcript.
     *
     * Never throws: a provider failure yields enriched=false with enrichment_error set.
     */
    EnrichedTranscript enrich(const Transcript &transcript, double duration_seconds, const std::string &media_name);

    /**
     * @brief Content type of an audio recording; NOTES when inference fails or is out of range
     */
    AnalysisMode inferContentType(const std::string &transcript_text, const std::string &user_context);

    /**
     * @brief Synthesize the report of a video from its transcript and frame descriptions
     * @throws TransportFailure if the analysis provider fails
     */
    nlohmann::json synthesizeVideo(const std::string &transcript_text, const std::vector<FrameSummaryInput> &frames,
                                   double duration_seconds, const std::string &media_name);

    /**
     * @brief Synthesize the report of an audio-only recording, using the template of the analysis mode
     * (AUTO infers the mode first). The mode used is recorded as "_analysis_type".
     * @throws TransportFailure if the analysis provider fails
     */
    nlohmann::json synthesizeAudio(const EnrichedTranscript &transcript, double duration_seconds,
                                   const std::string &media_name, const std::string &user_context, AnalysisMode mode);

    static constexpr size_t kAudioTranscriptChars = 10000;
    static constexpr size_t kInferenceTranscriptChars = 4000;

private:
    AnalysisProvider &analysis_;
    AnalysisProvider &enrichment_;
    size_t max_transcript_chars_;
    size_t max_keyframes_;
};
