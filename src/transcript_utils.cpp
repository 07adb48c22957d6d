#include "core/transcript_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace transcript_utils
{
    namespace
    {
        std::string trim(const std::string &text)
        {
            const auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            const auto end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        std::string stringField(const nlohmann::json &doc, const char *key)
        {
            auto it = doc.find(key);
            if (it == doc.end() || !it->is_string())
                return "";
            return it->get<std::string>();
        }
    }

    std::string transcriptWindow(const std::vector<TranscriptSegment> &segments, double timestamp,
                                 double window_seconds)
    {
        const double start_window = std::max(0.0, timestamp - window_seconds);
        const double end_window = timestamp + window_seconds;

        std::string joined;
        for (const auto &segment : segments)
        {
            if (segment.start <= end_window && segment.end >= start_window)
            {
                const std::string text = trim(segment.text);
                if (text.empty())
                    continue;
                if (!joined.empty())
                    joined += " ";
                joined += text;
            }
        }
        return joined;
    }

    std::vector<std::string> topicsAt(const std::vector<TopicSpan> &topics, double timestamp)
    {
        std::vector<std::string> current;
        for (const auto &span : topics)
        {
            if (span.start_time <= timestamp && timestamp <= span.end_time && !span.topic.empty())
                current.push_back(span.topic);
        }
        return current;
    }

    std::string formatTimestamp(double seconds)
    {
        const int total = static_cast<int>(std::max(0.0, seconds));
        const int hours = total / 3600;
        const int minutes = (total % 3600) / 60;
        const int secs = total % 60;

        std::ostringstream oss;
        oss << std::setfill('0');
        if (hours > 0)
            oss << std::setw(2) << hours << ":";
        oss << std::setw(2) << minutes << ":" << std::setw(2) << secs;
        return oss.str();
    }

    nlohmann::json extractJson(const std::string &text)
    {
        std::string json_part = text;
        const auto fenced_json = text.find("```json");
        if (fenced_json != std::string::npos)
        {
            json_part = text.substr(fenced_json + 7);
            json_part = json_part.substr(0, json_part.find("```"));
        }
        else
        {
            const auto fence = text.find("```");
            if (fence != std::string::npos)
            {
                json_part = text.substr(fence + 3);
                json_part = json_part.substr(0, json_part.find("```"));
            }
        }
        json_part = trim(json_part);

        try
        {
            return nlohmann::json::parse(json_part);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            Logger::warn(std::string("JSON parse error: ") + e.what());
            return nlohmann::json{{"raw_response", text}, {"parse_error", e.what()}};
        }
    }

    std::string summarizeDescription(const std::string &description)
    {
        if (description.empty())
            return "Description not available";

        std::string text = trim(description);
        const auto json_start = text.find('{');
        const auto json_end = text.rfind('}');
        if (json_start != std::string::npos && json_end != std::string::npos && json_end > json_start)
        {
            text = text.substr(json_start, json_end - json_start + 1);
        }

        nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
        {
            std::string clean = description;
            std::replace(clean.begin(), clean.end(), '\n', ' ');
            return truncateUtf8(clean, 400);
        }

        const std::string summary = stringField(doc, "summary");
        const std::string screen_type = stringField(doc, "screen_type");
        const std::string module_name = stringField(doc, "module_name");
        const std::string audio = stringField(doc, "audio_correlation");

        std::vector<std::string> parts;
        if (!screen_type.empty())
            parts.push_back("[" + screen_type + "]");
        if (!module_name.empty())
            parts.push_back("Module: " + module_name);
        if (!summary.empty())
            parts.push_back(truncateUtf8(summary, 250));
        if (!audio.empty())
            parts.push_back("Audio: " + truncateUtf8(audio, 100));

        if (parts.empty())
            return truncateUtf8(summary, 400);

        std::string joined;
        for (size_t i = 0; i < parts.size(); i++)
        {
            if (i > 0)
                joined += " | ";
            joined += parts[i];
        }
        return truncateUtf8(joined, 500);
    }

    size_t utf8Length(const std::string &text)
    {
        size_t count = 0;
        for (unsigned char byte : text)
        {
            // Continuation bytes (10xxxxxx) belong to the preceding character
            if ((byte & 0xC0) != 0x80)
                count++;
        }
        return count;
    }

    std::string truncateUtf8(const std::string &text, size_t max_chars)
    {
        if (text.size() <= max_chars)
            return text;
        size_t chars = 0;
        for (size_t i = 0; i < text.size(); i++)
        {
            if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80)
                continue;
            if (chars == max_chars)
                return text.substr(0, i);
            chars++;
        }
        return text;
    }

    std::string toLower(const std::string &text)
    {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lower;
    }
}
