#include "core/vision_retry_machine.hpp"
#include "core/analysis_prompts.hpp"
#include "core/transcript_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace
{
    const std::array<const char *, 7> kRefusalMarkers = {
        "i'm sorry",
        "i can't assist",
        "i'm unable",
        "cannot assist",
        "content policy",
        "i cannot",
        "i'm not able"};

    struct FeatureKeywords
    {
        const char *feature;
        std::vector<const char *> keywords;
    };

    const std::vector<FeatureKeywords> kFeatureKeywords = {
        {"order management", {"order", "ordini", "comande"}},
        {"payments", {"payment", "checkout", "pagament", "cassa"}},
        {"inventory", {"inventory", "stock", "warehouse", "magazzino"}},
        {"customers", {"customer", "client"}},
        {"invoicing", {"invoice", "billing", "fattur"}},
        {"reporting", {"report", "statistic", "analytics"}}};

    bool containsAny(const std::string &haystack, const std::vector<const char *> &needles)
    {
        return std::any_of(needles.begin(), needles.end(),
                           [&](const char *needle)
                           { return haystack.find(needle) != std::string::npos; });
    }

    // "M:SS" as used in prompts and fallback summaries
    std::string minuteSecond(double timestamp)
    {
        const int total = static_cast<int>(std::max(0.0, timestamp));
        std::ostringstream oss;
        oss << total / 60 << ":" << std::setw(2) << std::setfill('0') << total % 60;
        return oss.str();
    }

    std::string join(const std::vector<std::string> &items, size_t limit)
    {
        std::string joined;
        for (size_t i = 0; i < items.size() && i < limit; i++)
        {
            if (i > 0)
                joined += ", ";
            joined += items[i];
        }
        return joined;
    }

    std::string continuitySection(const std::string &previous_description)
    {
        nlohmann::json previous = nlohmann::json::parse(previous_description, nullptr, false);
        if (!previous.is_discarded() && previous.is_object())
        {
            std::string section;
            auto summary = previous.find("summary");
            if (summary != previous.end() && summary->is_string() && !summary->get<std::string>().empty())
                section += "**Previous frame - summary**: " +
                           transcript_utils::truncateUtf8(summary->get<std::string>(), 200) + "\n";
            auto module_name = previous.find("module_name");
            if (module_name != previous.end() && module_name->is_string() && !module_name->get<std::string>().empty())
                section += "**Previous frame - module**: " + module_name->get<std::string>() + "\n";
            return section;
        }
        std::string clipped = transcript_utils::utf8Length(previous_description) > 300
                                  ? transcript_utils::truncateUtf8(previous_description, 300) + "..."
                                  : previous_description;
        return "**Previous frame**: " + clipped + "\n";
    }
}

bool looksLikeRefusal(const std::string &text)
{
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        return true;
    const std::string lower = transcript_utils::toLower(text);
    return std::any_of(kRefusalMarkers.begin(), kRefusalMarkers.end(),
                       [&](const char *marker)
                       { return lower.find(marker) != std::string::npos; });
}

VisionRetryMachine::VisionRetryMachine(VisionProvider &vision, const FrameStore &store, RefusalPolicy is_refusal)
    : vision_(vision), store_(store), is_refusal_(std::move(is_refusal))
{
}

std::string VisionRetryMachine::buildContextBlock(const SampledFrame &frame, const std::string &domain_context)
{
    std::string block;
    if (!domain_context.empty())
    {
        block += "**Application**: " + domain_context + "\n";

        const std::string lower = transcript_utils::toLower(domain_context);
        std::vector<std::string> features;
        for (const auto &entry : kFeatureKeywords)
        {
            if (containsAny(lower, entry.keywords))
                features.push_back(entry.feature);
        }
        if (!features.empty())
            block += "**Key features mentioned in the context**: " + join(features, features.size()) + "\n";
    }

    const double timestamp = frame.frame.timestamp_seconds;
    std::ostringstream ts;
    ts << std::fixed << std::setprecision(1) << timestamp;
    block += "**Timestamp**: " + minuteSecond(timestamp) + " (" + ts.str() + "s)\n";

    if (!frame.transcript_window.empty())
        block += "**Narration at this moment**:\n\"" + frame.transcript_window + "\"\n";
    if (!frame.topics_in_window.empty())
        block += "**Topics discussed**: " + join(frame.topics_in_window, frame.topics_in_window.size()) + "\n";
    if (!frame.keywords.empty())
        block += "**Keywords**: " + join(frame.keywords, 10) + "\n";
    if (frame.continuity_hint && !frame.continuity_hint->empty())
        block += continuitySection(*frame.continuity_hint);

    return block;
}

nlohmann::json VisionRetryMachine::requestContext(const SampledFrame &frame, const std::string &domain_context) const
{
    return nlohmann::json{
        {"timestamp", frame.frame.timestamp_seconds},
        {"transcript_segment", frame.transcript_window},
        {"topics", frame.topics_in_window},
        {"keywords", frame.keywords},
        {"previous_frame_description", frame.continuity_hint ? nlohmann::json(*frame.continuity_hint) : nlohmann::json()},
        {"context", domain_context}};
}

FrameDescription VisionRetryMachine::describe(const SampledFrame &frame, const std::string &domain_context)
{
    const std::string image_path = store_.location(frame.frame.image_ref);
    const nlohmann::json context = requestContext(frame, domain_context);
    const std::string timestamp = std::to_string(frame.frame.timestamp_seconds);

    Logger::info("Contextual frame analysis at " + timestamp + "s");

    FrameDescription description;

    // Primary attempt
    const std::string prompt = std::string(prompts::kFrameInstructions) + "\n\n" +
                               buildContextBlock(frame, domain_context);
    try
    {
        description.external_calls++;
        std::string result = vision_.describeFrame(image_path, prompt, context);
        if (!is_refusal_(result))
        {
            description.content = std::move(result);
            return description;
        }
        Logger::warn("Vision response at " + timestamp + "s looks like a refusal, retrying with a neutral prompt");
    }
    catch (const std::exception &e)
    {
        Logger::warn("Vision call failed at " + timestamp + "s: " + e.what() + ", retrying with a neutral prompt");
    }

    // Single retry
    try
    {
        description.external_calls++;
        std::string result = vision_.describeFrame(image_path, prompts::kFrameRetry, context);
        if (!is_refusal_(result))
        {
            description.content = std::move(result);
            return description;
        }
        Logger::warn("Retry at " + timestamp + "s also refused, using fallback description");
    }
    catch (const std::exception &e)
    {
        Logger::warn("Retry at " + timestamp + "s failed: " + e.what() + ", using fallback description");
    }

    // The context comes from the caller and is not guaranteed to be valid UTF-8
    description.content =
        buildFallback(frame, domain_context).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    description.fallback = true;
    return description;
}

std::string VisionRetryMachine::inferScreenType(const std::string &domain_context)
{
    const std::string lower = transcript_utils::toLower(domain_context);
    if (containsAny(lower, {"order", "ordini", "comande"}))
        return "order_management";
    if (containsAny(lower, {"payment", "pagament", "cassa", "pago", "checkout"}))
        return "payment";
    if (containsAny(lower, {"dashboard"}))
        return "dashboard";
    return "unknown";
}

nlohmann::json VisionRetryMachine::buildFallback(const SampledFrame &frame, const std::string &domain_context)
{
    std::vector<std::string> summary_parts;
    if (!domain_context.empty())
        summary_parts.push_back("Screen of the application " + domain_context);
    summary_parts.push_back("at timestamp " + minuteSecond(frame.frame.timestamp_seconds));
    if (!frame.transcript_window.empty())
        summary_parts.push_back("while narrating: \"" + transcript_utils::truncateUtf8(frame.transcript_window, 100) +
                                "...\"");

    std::string summary;
    for (size_t i = 0; i < summary_parts.size(); i++)
    {
        if (i > 0)
            summary += ". ";
        summary += summary_parts[i];
    }
    summary += ".";

    const nlohmann::json empty_array = nlohmann::json::array();
    return nlohmann::json{
        {"fallback", true},
        {"error", "Detailed analysis not available - fallback description generated"},
        {"summary", summary},
        {"screen_type", inferScreenType(domain_context)},
        {"module_name", ""},
        {"audio_correlation", frame.transcript_window.empty()
                                  ? std::string("Not available")
                                  : transcript_utils::truncateUtf8(frame.transcript_window, 200)},
        {"ocr_extracted_texts", {{"headers", empty_array}, {"buttons", empty_array}, {"labels", empty_array}, {"menu_items", empty_array}, {"data_values", empty_array}, {"messages", empty_array}}},
        {"layout_architecture", {{"grid_system", "unknown"}, {"header_height", ""}, {"navigation_type", ""}, {"main_area", ""}, {"color_scheme", ""}, {"spacing_pattern", ""}}},
        {"components", empty_array},
        {"inferred_data_model", {{"entities", empty_array}}},
        {"inferred_api", {{"get_endpoints", empty_array}, {"post_endpoints", empty_array}, {"put_endpoints", empty_array}, {"delete_endpoints", empty_array}}},
        {"current_state", {{"mode", "unknown"}, {"loaded_data", ""}, {"active_selection", ""}, {"active_filters", ""}, {"modal_open", ""}}},
        {"current_action", {{"action", "unknown"}, {"target_element", ""}, {"user_intent", ""}, {"next_step", ""}}},
        {"technology_hints", {{"ui_framework", "unknown"}, {"frontend_framework", "unknown"}, {"css_approach", "unknown"}, {"platform", "unknown"}, {"design_patterns", empty_array}}},
        {"transition_from_previous", {{"changed_elements", empty_array}, {"new_elements", empty_array}, {"removed_elements", empty_array}, {"animation_detected", ""}}},
        {"reconstruction_notes", {{"key_components", empty_array}, {"complex_interactions", empty_array}, {"state_management", ""}, {"styling_notes", empty_array}}},
        {"detected_features", empty_array},
        {"confidence", "low"},
        {"analysis_notes", "Fallback description generated after a provider error or refusal"}};
}
