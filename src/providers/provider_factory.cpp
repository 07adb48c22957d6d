#include "providers/provider_factory.hpp"
#include "core/transcript_utils.hpp"
#include "logging/logger.hpp"
#include "providers/ollama_provider.hpp"
#include "providers/openai_compatible_provider.hpp"
#include <cstdlib>
#include <stdexcept>

ProviderKind ProviderFactory::parseKind(const std::string &name)
{
    const std::string lower = transcript_utils::toLower(name);
    if (lower == "openai")
        return ProviderKind::OPENAI;
    if (lower == "groq")
        return ProviderKind::GROQ;
    if (lower == "together")
        return ProviderKind::TOGETHER;
    if (lower == "ollama")
        return ProviderKind::OLLAMA;
    throw std::invalid_argument("Unsupported provider: " + name + ". Supported: openai, groq, together, ollama");
}

std::string ProviderFactory::kindName(ProviderKind kind)
{
    switch (kind)
    {
    case ProviderKind::OPENAI:
        return "openai";
    case ProviderKind::GROQ:
        return "groq";
    case ProviderKind::TOGETHER:
        return "together";
    case ProviderKind::OLLAMA:
        return "ollama";
    default:
        return "unknown";
    }
}

std::string ProviderFactory::defaultBaseUrl(ProviderKind kind)
{
    switch (kind)
    {
    case ProviderKind::OPENAI:
        return "https://api.openai.com/v1";
    case ProviderKind::GROQ:
        return "https://api.groq.com/openai/v1";
    case ProviderKind::TOGETHER:
        return "https://api.together.xyz/v1";
    case ProviderKind::OLLAMA:
        return "http://localhost:11434";
    default:
        return "";
    }
}

std::string ProviderFactory::apiKeyEnvVar(ProviderKind kind)
{
    switch (kind)
    {
    case ProviderKind::OPENAI:
        return "OPENAI_API_KEY";
    case ProviderKind::GROQ:
        return "GROQ_API_KEY";
    case ProviderKind::TOGETHER:
        return "TOGETHER_API_KEY";
    default:
        return "";
    }
}

ProviderSettings ProviderFactory::resolve(const ProviderSettings &settings)
{
    const ProviderKind kind = parseKind(settings.provider);
    ProviderSettings resolved = settings;
    if (resolved.base_url.empty())
    {
        resolved.base_url = defaultBaseUrl(kind);
    }
    const std::string env_var = apiKeyEnvVar(kind);
    if (resolved.api_key.empty() && !env_var.empty())
    {
        const char *env_key = std::getenv(env_var.c_str());
        if (env_key)
            resolved.api_key = env_key;
    }
    return resolved;
}

std::shared_ptr<TranscriptionProvider> ProviderFactory::createTranscription(const ProviderSettings &settings)
{
    const ProviderSettings resolved = resolve(settings);
    const ProviderKind kind = parseKind(resolved.provider);
    if (kind == ProviderKind::OLLAMA)
    {
        throw std::invalid_argument("Ollama does not provide transcription");
    }
    Logger::info("Transcription provider: " + kindName(kind) + " (" + resolved.model + ")");
    return std::make_shared<OpenAICompatibleProvider>(kindName(kind), resolved);
}

std::shared_ptr<VisionProvider> ProviderFactory::createVision(const ProviderSettings &settings)
{
    const ProviderSettings resolved = resolve(settings);
    const ProviderKind kind = parseKind(resolved.provider);
    Logger::info("Vision provider: " + kindName(kind) + " (" + resolved.model + ")");
    if (kind == ProviderKind::OLLAMA)
    {
        return std::make_shared<OllamaProvider>(resolved);
    }
    return std::make_shared<OpenAICompatibleProvider>(kindName(kind), resolved);
}

std::shared_ptr<AnalysisProvider> ProviderFactory::createAnalysis(const ProviderSettings &settings)
{
    const ProviderSettings resolved = resolve(settings);
    const ProviderKind kind = parseKind(resolved.provider);
    Logger::info("Analysis provider: " + kindName(kind) + " (" + resolved.model + ")");
    if (kind == ProviderKind::OLLAMA)
    {
        return std::make_shared<OllamaProvider>(resolved);
    }
    return std::make_shared<OpenAICompatibleProvider>(kindName(kind), resolved);
}
