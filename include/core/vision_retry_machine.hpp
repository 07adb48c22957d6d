#pragma once

#include "core/frame_store.hpp"
#include "core/media_types.hpp"
#include "providers/ai_providers.hpp"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Classifier deciding whether a vision response is a refusal instead of a description
 */
using RefusalPolicy = std::function<bool(const std::string &)>;

/**
 * @brief Default refusal heuristic: case-insensitive match against known refusal phrases.
 * Empty or blank responses also count as refusals.
 */
bool looksLikeRefusal(const std::string &text);

/**
 * @brief Per-frame description with refusal detection, a single retry and a local fallback.
 *
 * describe() never throws for provider failures or refusals. It makes one primary call and at
 * most one retry, so every frame costs one or two external calls.
 */
class VisionRetryMachine
{
public:
    VisionRetryMachine(VisionProvider &vision, const FrameStore &store, RefusalPolicy is_refusal = looksLikeRefusal);

    /**
     * @brief Describe one frame
     * @param frame Frame with its transcript window, topics, keywords and continuity hint
     * @param domain_context Job context supplied by the user (application name etc.), may be empty
     */
    FrameDescription describe(const SampledFrame &frame, const std::string &domain_context);

    /**
     * @brief Markdown-ish context section of the primary prompt
     */
    static std::string buildContextBlock(const SampledFrame &frame, const std::string &domain_context);

    /**
     * @brief Fallback document: full description schema with fallback=true and confidence="low"
     */
    static nlohmann::json buildFallback(const SampledFrame &frame, const std::string &domain_context);

    /**
     * @brief Guess the screen type from keywords in the domain context ("unknown" if nothing matches)
     */
    static std::string inferScreenType(const std::string &domain_context);

private:
    nlohmann::json requestContext(const SampledFrame &frame, const std::string &domain_context) const;

    VisionProvider &vision_;
    const FrameStore &store_;
    RefusalPolicy is_refusal_;
};
