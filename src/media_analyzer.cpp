#include "core/media_analyzer.hpp"
#include "core/analysis_prompts.hpp"
#include "core/pipeline_errors.hpp"
#include "core/transcript_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace
{
    std::string fixed1(double value)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << value;
        return oss.str();
    }

    std::string truncated(const std::string &text, size_t max_chars, const std::string &note)
    {
        const size_t length = transcript_utils::utf8Length(text);
        if (length <= max_chars)
            return text;
        Logger::warn("Transcript truncated from " + std::to_string(length) + " to " +
                     std::to_string(max_chars) + " chars");
        return transcript_utils::truncateUtf8(text, max_chars) + "\n... [" + note + "]";
    }

    std::string systemMessageFor(AnalysisMode mode)
    {
        switch (mode)
        {
        case AnalysisMode::MEETING:
            return prompts::kMeetingSystem;
        case AnalysisMode::DEBRIEF:
            return prompts::kDebriefSystem;
        case AnalysisMode::BRAINSTORMING:
            return prompts::kBrainstormingSystem;
        case AnalysisMode::REVERSE_ENGINEERING:
            return prompts::kAudioContentSystem;
        default:
            return prompts::kNotesSystem;
        }
    }
}

MediaAnalyzer::MediaAnalyzer(AnalysisProvider &analysis, AnalysisProvider &enrichment, size_t max_transcript_chars,
                             size_t max_keyframes)
    : analysis_(analysis), enrichment_(enrichment), max_transcript_chars_(max_transcript_chars),
      max_keyframes_(max_keyframes)
{
}

EnrichedTranscript MediaAnalyzer::enrich(const Transcript &transcript, double duration_seconds,
                                         const std::string &media_name)
{
    EnrichedTranscript result;
    result.transcript = transcript;

    if (transcript.full_text.empty())
    {
        Logger::warn("No transcription text to enrich");
        return result;
    }

    std::string prompt = "Analyze this audio transcript of an application demo video.\n\n";
    prompt += "VIDEO:\n- File: " + media_name + "\n- Duration: " + fixed1(duration_seconds) + " seconds\n\n";
    prompt += "FULL TRANSCRIPT:\n" + transcript.full_text + "\n\nTIMESTAMPED SEGMENTS:\n";
    for (const auto &segment : transcript.segments)
    {
        prompt += "[" + fixed1(segment.start) + "s - " + fixed1(segment.end) + "s]: " + segment.text + "\n";
    }
    prompt += "\n";
    prompt += prompts::kEnrichInstructions;

    try
    {
        json enrichment = transcript_utils::extractJson(enrichment_.analyze(prompt, prompts::kEnrichSystem, 2000));

        result.enriched = true;
        if (enrichment.contains("semantic_summary") && enrichment["semantic_summary"].is_string())
            result.semantic_summary = enrichment["semantic_summary"].get<std::string>();
        if (enrichment.contains("tone") && enrichment["tone"].is_string())
            result.tone = enrichment["tone"].get<std::string>();

        if (enrichment.contains("topics") && enrichment["topics"].is_array())
        {
            for (const auto &item : enrichment["topics"])
            {
                if (!item.is_object())
                    continue;
                TopicSpan span;
                span.topic = item.value("topic", "");
                if (item.contains("start_time") && item["start_time"].is_number())
                    span.start_time = item["start_time"].get<double>();
                if (item.contains("end_time") && item["end_time"].is_number())
                    span.end_time = item["end_time"].get<double>();
                result.topics.push_back(span);
            }
        }
        if (enrichment.contains("keywords") && enrichment["keywords"].is_array())
        {
            for (const auto &keyword : enrichment["keywords"])
            {
                if (keyword.is_string())
                    result.keywords.push_back(keyword.get<std::string>());
            }
        }

        Logger::info("Transcription enriched: " + std::to_string(result.topics.size()) + " topics, " +
                     std::to_string(result.keywords.size()) + " keywords");
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Transcription enrichment failed: ") + e.what());
        result.enriched = false;
        result.enrichment_error = e.what();
    }
    return result;
}

AnalysisMode MediaAnalyzer::inferContentType(const std::string &transcript_text, const std::string &user_context)
{
    Logger::info("Inferring content type from transcript...");

    std::string prompt = std::string(prompts::kInferContentTypeInstructions) + "\n\nUSER CONTEXT: " +
                         (user_context.empty() ? std::string("(none)") : user_context) + "\n\nTRANSCRIPT:\n" +
                         truncated(transcript_text, kInferenceTranscriptChars, "truncated");

    try
    {
        json result = transcript_utils::extractJson(
            enrichment_.analyze(prompt, prompts::kInferContentTypeSystem, 500, "json_object"));
        const std::string content_type = result.value("content_type", "notes");
        AnalysisMode mode = AnalysisMode::NOTES;
        try
        {
            mode = PipelineStages::parseMode(content_type);
        }
        catch (const std::invalid_argument &)
        {
            Logger::warn("Unknown content type '" + content_type + "', using notes");
        }
        if (mode == AnalysisMode::AUTO)
            mode = AnalysisMode::NOTES;
        Logger::info("Inferred content type: " + PipelineStages::modeName(mode));
        return mode;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Content type inference failed: ") + e.what());
        return AnalysisMode::NOTES;
    }
}

json MediaAnalyzer::synthesizeVideo(const std::string &transcript_text, const std::vector<FrameSummaryInput> &frames,
                                    double duration_seconds, const std::string &media_name)
{
    Logger::info("Starting full flow analysis...");

    const std::string transcript_part = truncated(transcript_text, max_transcript_chars_, "transcript truncated");

    std::string keyframes_part;
    const size_t used = std::min(frames.size(), max_keyframes_);
    for (size_t i = 0; i < used; i++)
    {
        keyframes_part += "[" + fixed1(frames[i].timestamp_seconds) + "s] " +
                          transcript_utils::summarizeDescription(frames[i].description) + "\n";
    }
    if (frames.size() > max_keyframes_)
    {
        keyframes_part += "... [+ " + std::to_string(frames.size() - max_keyframes_) + " more keyframes not shown]\n";
        Logger::warn("Keyframes limited from " + std::to_string(frames.size()) + " to " +
                     std::to_string(max_keyframes_));
    }

    std::string prompt = std::string(prompts::kFullFlowInstructions) + "\n\n";
    if (!media_name.empty())
        prompt += "File: " + media_name + "\n";
    prompt += "Duration: " + fixed1(duration_seconds) + " seconds\n\nTRANSCRIPT:\n" +
              (transcript_part.empty() ? std::string("(no transcript available)") : transcript_part) +
              "\n\nSCREENS:\n" + (keyframes_part.empty() ? std::string("(no screens available)") : keyframes_part);

    Logger::info("Final prompt size: transcript=" + std::to_string(transcript_part.size()) +
                 " chars, keyframes=" + std::to_string(used));

    std::string response;
    try
    {
        response = analysis_.analyze(prompt, prompts::kFullFlowSystem, 4000);
    }
    catch (const TransportFailure &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw TransportFailure(std::string("Synthesis failed: ") + e.what());
    }

    json analysis = transcript_utils::extractJson(response);
    Logger::info("Full flow analysis completed");
    return analysis;
}

json MediaAnalyzer::synthesizeAudio(const EnrichedTranscript &transcript, double duration_seconds,
                                    const std::string &media_name, const std::string &user_context, AnalysisMode mode)
{
    if (mode == AnalysisMode::AUTO)
    {
        mode = inferContentType(transcript.transcript.full_text, user_context);
        Logger::info("Auto-detected content type: " + PipelineStages::modeName(mode));
    }
    Logger::info("Starting audio content analysis (type: " + PipelineStages::modeName(mode) + ")...");

    const std::string transcript_part =
        truncated(transcript.transcript.full_text, kAudioTranscriptChars, "transcript truncated");

    std::string topics_part;
    const size_t max_topics = 10;
    for (size_t i = 0; i < transcript.topics.size() && i < max_topics; i++)
    {
        const auto &span = transcript.topics[i];
        topics_part += "- [" + std::to_string(static_cast<int>(span.start_time)) + "s - " +
                       std::to_string(static_cast<int>(span.end_time)) + "s] " + span.topic + "\n";
    }
    if (transcript.topics.size() > max_topics)
        topics_part += "... [+ " + std::to_string(transcript.topics.size() - max_topics) + " more topics]\n";

    std::string keywords_part;
    for (size_t i = 0; i < transcript.keywords.size() && i < 20; i++)
    {
        if (i > 0)
            keywords_part += ", ";
        keywords_part += transcript.keywords[i];
    }

    std::string prompt = std::string(prompts::kAudioInstructions) + "\n\n";
    prompt += "File: " + (media_name.empty() ? std::string("audio recording") : media_name) + "\n";
    prompt += "Duration: " + transcript_utils::formatTimestamp(duration_seconds) + "\n";
    prompt += "Tone: " + transcript.tone + "\n";
    if (!user_context.empty())
        prompt += "USER CONTEXT: " + user_context + "\n";
    prompt += "\nSEMANTIC SUMMARY:\n" + transcript_utils::truncateUtf8(transcript.semantic_summary, 1500) + "\n";
    prompt += "\nTOPICS:\n" + (topics_part.empty() ? std::string("(no topics identified)\n") : topics_part);
    prompt += "\nKEYWORDS: " + (keywords_part.empty() ? std::string("(none)") : keywords_part) + "\n";
    prompt += "\nTRANSCRIPT:\n" + (transcript_part.empty() ? std::string("(no transcript available)") : transcript_part);

    std::string response;
    try
    {
        response = analysis_.analyze(prompt, systemMessageFor(mode), 4000);
    }
    catch (const TransportFailure &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw TransportFailure(std::string("Audio synthesis failed: ") + e.what());
    }

    json analysis = transcript_utils::extractJson(response);
    if (analysis.is_object())
        analysis["_analysis_type"] = PipelineStages::modeName(mode);
    Logger::info("Audio content analysis completed (template: " + PipelineStages::modeName(mode) + ")");
    return analysis;
}
