#pragma once

#include "core/pipeline_config.hpp"
#include "providers/ai_providers.hpp"
#include <memory>
#include <string>

enum class ProviderKind
{
    OPENAI,
    GROQ,
    TOGETHER,
    OLLAMA
};

/**
 * @brief Resolves provider names from configuration into concrete clients, once at startup
 */
class ProviderFactory
{
public:
    /**
     * @throws std::invalid_argument for an unknown provider name
     */
    static ProviderKind parseKind(const std::string &name);
    static std::string kindName(ProviderKind kind);

    static std::string defaultBaseUrl(ProviderKind kind);

    /**
     * @brief Environment variable consulted when no API key is configured (empty for Ollama)
     */
    static std::string apiKeyEnvVar(ProviderKind kind);

    /**
     * @brief Fill in base URL and API key defaults for a provider
     */
    static ProviderSettings resolve(const ProviderSettings &settings);

    /**
     * @throws std::invalid_argument if the provider family has no transcription API
     */
    static std::shared_ptr<TranscriptionProvider> createTranscription(const ProviderSettings &settings);
    static std::shared_ptr<VisionProvider> createVision(const ProviderSettings &settings);
    static std::shared_ptr<AnalysisProvider> createAnalysis(const ProviderSettings &settings);
};
