#pragma once

#include "core/media_types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace transcript_utils
{
    /**
     * @brief Text of all segments overlapping [timestamp - window, timestamp + window], space-joined
     */
    std::string transcriptWindow(const std::vector<TranscriptSegment> &segments, double timestamp,
                                 double window_seconds = 5.0);

    /**
     * @brief Topics whose [start_time, end_time] span contains the timestamp, in input order
     */
    std::vector<std::string> topicsAt(const std::vector<TopicSpan> &topics, double timestamp);

    // MM:SS, or HH:MM:SS past one hour
    std::string formatTimestamp(double seconds);

    /**
     * @brief Parse a JSON object out of model output, tolerating markdown code fences.
     * @return The parsed document, or {"raw_response": text, "parse_error": message} on failure
     */
    nlohmann::json extractJson(const std::string &text);

    /**
     * @brief Compact one-line summary of a frame description (at most 500 characters)
     *
     * Format: "[screen_type] | Module: name | summary | Audio: correlation". Non-JSON input is
     * flattened to one line and cut at 400 characters.
     */
    std::string summarizeDescription(const std::string &description);

    /**
     * @brief Number of characters (code points) in UTF-8 text
     */
    size_t utf8Length(const std::string &text);

    /**
     * @brief Keep the first max_chars characters of UTF-8 text, never splitting a multi-byte sequence
     */
    std::string truncateUtf8(const std::string &text, size_t max_chars);

    std::string toLower(const std::string &text);
}
