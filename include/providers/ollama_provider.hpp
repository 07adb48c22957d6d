#pragma once

#include "core/pipeline_config.hpp"
#include "providers/ai_providers.hpp"
#include "providers/http_support.hpp"

/**
 * @brief Local Ollama server (POST /api/generate, non-streaming)
 */
class OllamaProvider : public VisionProvider, public AnalysisProvider
{
public:
    explicit OllamaProvider(const ProviderSettings &settings);

    std::string describeFrame(const std::string &image_path, const std::string &prompt,
                              const nlohmann::json &context) override;
    std::string analyze(const std::string &prompt, const std::string &system_message, int max_tokens = 4000,
                        const std::string &response_format = "") override;

    std::string name() const override { return "ollama:" + settings_.model; }

private:
    std::string generate(const nlohmann::json &body);

    ProviderSettings settings_;
    HttpEndpoint endpoint_;
};
