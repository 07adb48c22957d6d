#include "core/media_analyzer.hpp"
#include "core/pipeline_errors.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace
{
    ScriptedAnalysisProvider::Handler answer(const std::string &text)
    {
        return [text](const std::string &, const std::string &, const std::string &)
        { return text; };
    }

    Transcript shortTranscript()
    {
        Transcript transcript;
        transcript.language = "en";
        transcript.full_text = "We review the sprint. Next we plan the release.";
        transcript.segments = {{0.0, 4.0, "We review the sprint."}, {4.0, 9.0, "Next we plan the release."}};
        return transcript;
    }
}

TEST(MediaAnalyzerTest, EnrichParsesTopicsAndKeywords)
{
    ScriptedAnalysisProvider analysis(answer("{}"));
    ScriptedAnalysisProvider enrichment(answer(R"(```json
{"semantic_summary": "Sprint review", "tone": "formal",
 "topics": [{"topic": "review", "start_time": 0, "end_time": 4}, "bogus"],
 "keywords": ["sprint", 7, "release"]}
```)"));
    MediaAnalyzer analyzer(analysis, enrichment);

    EnrichedTranscript result = analyzer.enrich(shortTranscript(), 9.0, "standup.mp3");

    EXPECT_TRUE(result.enriched);
    EXPECT_EQ(result.semantic_summary, "Sprint review");
    EXPECT_EQ(result.tone, "formal");
    ASSERT_EQ(result.topics.size(), 1u);
    EXPECT_EQ(result.topics[0].topic, "review");
    EXPECT_DOUBLE_EQ(result.topics[0].end_time, 4.0);
    EXPECT_EQ(result.keywords, (std::vector<std::string>{"sprint", "release"}));

    ASSERT_EQ(enrichment.prompts().size(), 1u);
    EXPECT_NE(enrichment.prompts()[0].find("[4.0s - 9.0s]: Next we plan the release."), std::string::npos);
    EXPECT_NE(enrichment.prompts()[0].find("standup.mp3"), std::string::npos);
}

TEST(MediaAnalyzerTest, EnrichFailureKeepsRawTranscript)
{
    ScriptedAnalysisProvider analysis(answer("{}"));
    ScriptedAnalysisProvider enrichment([](const std::string &, const std::string &, const std::string &) -> std::string
                                        { throw TransportFailure("connection reset"); });
    MediaAnalyzer analyzer(analysis, enrichment);

    EnrichedTranscript result = analyzer.enrich(shortTranscript(), 9.0, "standup.mp3");

    EXPECT_FALSE(result.enriched);
    EXPECT_NE(result.enrichment_error.find("connection reset"), std::string::npos);
    EXPECT_EQ(result.transcript.segments.size(), 2u);
    EXPECT_EQ(result.tone, "unknown");
}

TEST(MediaAnalyzerTest, EmptyTranscriptIsNotSentForEnrichment)
{
    ScriptedAnalysisProvider analysis(answer("{}"));
    ScriptedAnalysisProvider enrichment(answer("{}"));
    MediaAnalyzer analyzer(analysis, enrichment);

    EnrichedTranscript result = analyzer.enrich(Transcript{}, 5.0, "silence.wav");

    EXPECT_FALSE(result.enriched);
    EXPECT_TRUE(enrichment.prompts().empty());
}

TEST(MediaAnalyzerTest, ContentTypeFallsBackToNotes)
{
    ScriptedAnalysisProvider analysis(answer("{}"));

    ScriptedAnalysisProvider brainstorm(answer(R"({"content_type": "Brainstorming"})"));
    EXPECT_EQ(MediaAnalyzer(analysis, brainstorm).inferContentType("ideas", ""), AnalysisMode::BRAINSTORMING);

    ScriptedAnalysisProvider unknown(answer(R"({"content_type": "podcast"})"));
    EXPECT_EQ(MediaAnalyzer(analysis, unknown).inferContentType("ideas", ""), AnalysisMode::NOTES);

    ScriptedAnalysisProvider automatic(answer(R"({"content_type": "auto"})"));
    EXPECT_EQ(MediaAnalyzer(analysis, automatic).inferContentType("ideas", ""), AnalysisMode::NOTES);

    ScriptedAnalysisProvider failing([](const std::string &, const std::string &, const std::string &) -> std::string
                                     { throw std::runtime_error("timeout"); });
    EXPECT_EQ(MediaAnalyzer(analysis, failing).inferContentType("ideas", ""), AnalysisMode::NOTES);
}

TEST(MediaAnalyzerTest, VideoSynthesisLimitsKeyframes)
{
    ScriptedAnalysisProvider analysis(answer(R"({"summary": "Flow"})"));
    ScriptedAnalysisProvider enrichment(answer("{}"));
    MediaAnalyzer analyzer(analysis, enrichment, 8000, 2);

    std::vector<FrameSummaryInput> frames = {{1.0, R"({"summary": "login"})"},
                                             {5.0, R"({"summary": "orders"})"},
                                             {9.0, R"({"summary": "payment"})"}};
    nlohmann::json report = analyzer.synthesizeVideo("", frames, 12.0, "demo.mp4");

    EXPECT_EQ(report["summary"], "Flow");
    ASSERT_EQ(analysis.prompts().size(), 1u);
    const std::string &prompt = analysis.prompts()[0];
    EXPECT_NE(prompt.find("(no transcript available)"), std::string::npos);
    EXPECT_NE(prompt.find("[+ 1 more keyframes not shown]"), std::string::npos);
    EXPECT_EQ(prompt.find("payment"), std::string::npos);
}

TEST(MediaAnalyzerTest, SynthesisErrorsBecomeTransportFailures)
{
    ScriptedAnalysisProvider analysis([](const std::string &, const std::string &, const std::string &) -> std::string
                                      { throw std::runtime_error("HTTP 500"); });
    ScriptedAnalysisProvider enrichment(answer("{}"));
    MediaAnalyzer analyzer(analysis, enrichment);

    EXPECT_THROW(analyzer.synthesizeVideo("text", {}, 3.0, "demo.mp4"), TransportFailure);
    EnrichedTranscript transcript;
    transcript.transcript = shortTranscript();
    EXPECT_THROW(analyzer.synthesizeAudio(transcript, 9.0, "standup.mp3", "", AnalysisMode::MEETING),
                 TransportFailure);
}

TEST(MediaAnalyzerTest, AudioSynthesisRecordsTemplate)
{
    ScriptedAnalysisProvider analysis(answer(R"({"summary": "Standup"})"));
    ScriptedAnalysisProvider enrichment(answer(R"({"content_type": "debrief"})"));
    MediaAnalyzer analyzer(analysis, enrichment);

    EnrichedTranscript transcript;
    transcript.transcript = shortTranscript();
    transcript.keywords = {"sprint"};
    nlohmann::json report = analyzer.synthesizeAudio(transcript, 9.0, "standup.mp3", "Team sync", AnalysisMode::AUTO);

    EXPECT_EQ(report["_analysis_type"], "debrief");
    ASSERT_EQ(analysis.prompts().size(), 1u);
    EXPECT_NE(analysis.prompts()[0].find("USER CONTEXT: Team sync"), std::string::npos);
    EXPECT_NE(analysis.prompts()[0].find("KEYWORDS: sprint"), std::string::npos);
}
