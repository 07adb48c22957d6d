#include "core/transcript_utils.hpp"
#include <gtest/gtest.h>

using namespace transcript_utils;

namespace
{
    std::vector<TranscriptSegment> sampleSegments()
    {
        return {
            {0.0, 4.0, " Welcome to the demo. "},
            {4.0, 9.5, "Here is the order list."},
            {9.5, 15.0, "   "},
            {15.0, 21.0, "Now we pay the bill."},
            {40.0, 45.0, "Closing remarks."}};
    }
}

TEST(TranscriptWindowTest, JoinsOverlappingSegments)
{
    EXPECT_EQ(transcriptWindow(sampleSegments(), 6.0), "Welcome to the demo. Here is the order list.");
    EXPECT_EQ(transcriptWindow(sampleSegments(), 12.0, 3.0), "Here is the order list. Now we pay the bill.");
    EXPECT_EQ(transcriptWindow(sampleSegments(), 42.0, 2.0), "Closing remarks.");
}

TEST(TranscriptWindowTest, EmptyWhenNothingOverlaps)
{
    EXPECT_EQ(transcriptWindow(sampleSegments(), 30.0), "");
    EXPECT_EQ(transcriptWindow({}, 3.0), "");
}

TEST(TranscriptWindowTest, WindowIsClampedAtZero)
{
    EXPECT_EQ(transcriptWindow(sampleSegments(), 1.0, 2.0), "Welcome to the demo.");
}

TEST(TopicsAtTest, ReturnsEveryTopicCoveringTimestamp)
{
    std::vector<TopicSpan> topics = {{"intro", 0.0, 10.0}, {"orders", 5.0, 30.0}, {"payments", 30.0, 60.0}};
    EXPECT_EQ(topicsAt(topics, 7.0), (std::vector<std::string>{"intro", "orders"}));
    EXPECT_EQ(topicsAt(topics, 30.0), (std::vector<std::string>{"orders", "payments"}));
    EXPECT_TRUE(topicsAt(topics, 90.0).empty());
}

TEST(FormatTimestampTest, UsesHoursOnlyWhenNeeded)
{
    EXPECT_EQ(formatTimestamp(0.0), "00:00");
    EXPECT_EQ(formatTimestamp(75.9), "01:15");
    EXPECT_EQ(formatTimestamp(3725.0), "01:02:05");
    EXPECT_EQ(formatTimestamp(-3.0), "00:00");
}

TEST(ExtractJsonTest, ParsesPlainAndFencedDocuments)
{
    EXPECT_EQ(extractJson(R"({"a": 1})")["a"], 1);
    EXPECT_EQ(extractJson("Here you go:\n```json\n{\"a\": 2}\n```\nThanks")["a"], 2);
    EXPECT_EQ(extractJson("```\n{\"a\": 3}\n```")["a"], 3);
}

TEST(ExtractJsonTest, KeepsRawTextOnParseError)
{
    nlohmann::json result = extractJson("not json at all");
    EXPECT_EQ(result["raw_response"], "not json at all");
    EXPECT_TRUE(result.contains("parse_error"));
}

TEST(SummarizeDescriptionTest, BuildsCompactLine)
{
    const std::string description =
        R"({"screen_type": "form", "module_name": "Billing", "summary": "Invoice editor", "audio_correlation": "talks about VAT"})";
    EXPECT_EQ(summarizeDescription(description), "[form] | Module: Billing | Invoice editor | Audio: talks about VAT");
}

TEST(SummarizeDescriptionTest, FlattensNonJsonText)
{
    EXPECT_EQ(summarizeDescription("line one\nline two"), "line one line two");
    EXPECT_EQ(summarizeDescription(std::string(600, 'z')).size(), 400u);
    EXPECT_EQ(summarizeDescription(""), "Description not available");
}

TEST(SummarizeDescriptionTest, CapsLength)
{
    nlohmann::json doc = {{"screen_type", std::string(300, 's')},
                          {"module_name", std::string(300, 'm')},
                          {"summary", std::string(300, 'x')}};
    EXPECT_EQ(summarizeDescription(doc.dump()).size(), 500u);
}

TEST(TruncateUtf8Test, NeverSplitsMultibyteSequence)
{
    const std::string text = "caff\xC3\xA8 latte"; // "caffè latte"
    EXPECT_EQ(truncateUtf8(text, 4), "caff");
    EXPECT_EQ(truncateUtf8(text, 5), "caff\xC3\xA8");
    EXPECT_EQ(truncateUtf8(text, 11), text);
    EXPECT_EQ(truncateUtf8(text, 100), text);
}

TEST(TruncateUtf8Test, LimitsCountCharactersNotBytes)
{
    // Ten two-byte characters
    std::string accents;
    for (int i = 0; i < 10; i++)
        accents += "\xC3\xA0";

    EXPECT_EQ(utf8Length(accents), 10u);
    EXPECT_EQ(utf8Length(""), 0u);
    EXPECT_EQ(truncateUtf8(accents, 10), accents);
    EXPECT_EQ(truncateUtf8(accents, 3), "\xC3\xA0\xC3\xA0\xC3\xA0");
    EXPECT_EQ(truncateUtf8(accents, 0), "");
}
