#pragma once

#include "core/pipeline_config.hpp"
#include "providers/ai_providers.hpp"
#include "providers/http_support.hpp"
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Client for OpenAI-style REST APIs (OpenAI, Groq, Together AI)
 *
 * Transcription uses POST {base}/audio/transcriptions (multipart, verbose_json with segment
 * timestamps). Vision and text analysis use POST {base}/chat/completions.
 */
class OpenAICompatibleProvider : public TranscriptionProvider, public VisionProvider, public AnalysisProvider
{
public:
    /**
     * @param label Provider family name used in logs and errors ("openai", "groq", "together")
     * @param settings Model, key, base URL and timeout; base_url must not be empty
     * @throws std::invalid_argument on a malformed base URL
     */
    OpenAICompatibleProvider(const std::string &label, const ProviderSettings &settings);

    Transcript transcribe(const std::string &audio_path, const std::string &language) override;
    std::string describeFrame(const std::string &image_path, const std::string &prompt,
                              const nlohmann::json &context) override;
    std::string analyze(const std::string &prompt, const std::string &system_message, int max_tokens = 4000,
                        const std::string &response_format = "") override;

    std::string name() const override { return label_ + ":" + settings_.model; }

    /**
     * @brief Request body for a chat completion with one image
     */
    nlohmann::json buildVisionRequest(const std::string &image_path, const std::string &prompt) const;

    /**
     * @brief Text of the first choice of a chat completion response
     * @throws TransportFailure if the response has no message content
     */
    static std::string parseChatContent(const nlohmann::json &response);

    /**
     * @brief Transcript from a verbose_json transcription response
     */
    static Transcript parseTranscription(const nlohmann::json &response, const std::string &language);

    static constexpr int kVisionMaxTokens = 3000;

private:
    nlohmann::json postJson(const std::string &path, const nlohmann::json &body);

    std::string label_;
    ProviderSettings settings_;
    HttpEndpoint endpoint_;
};
