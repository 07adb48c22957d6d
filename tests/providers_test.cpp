#include "core/pipeline_errors.hpp"
#include "providers/http_support.hpp"
#include "providers/openai_compatible_provider.hpp"
#include "providers/provider_factory.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

TEST(ProviderFactoryTest, ParsesKnownProvidersCaseInsensitively)
{
    EXPECT_EQ(ProviderFactory::parseKind("openai"), ProviderKind::OPENAI);
    EXPECT_EQ(ProviderFactory::parseKind("Groq"), ProviderKind::GROQ);
    EXPECT_EQ(ProviderFactory::parseKind("TOGETHER"), ProviderKind::TOGETHER);
    EXPECT_EQ(ProviderFactory::parseKind("ollama"), ProviderKind::OLLAMA);
    EXPECT_THROW(ProviderFactory::parseKind("azure"), std::invalid_argument);
}

TEST(ProviderFactoryTest, ResolveFillsBaseUrlAndEnvironmentKey)
{
    setenv("GROQ_API_KEY", "gsk-test", 1);
    ProviderSettings settings;
    settings.provider = "groq";
    settings.model = "whisper-large-v3";

    ProviderSettings resolved = ProviderFactory::resolve(settings);
    EXPECT_EQ(resolved.base_url, "https://api.groq.com/openai/v1");
    EXPECT_EQ(resolved.api_key, "gsk-test");

    settings.api_key = "configured";
    settings.base_url = "http://proxy:8080/v1";
    resolved = ProviderFactory::resolve(settings);
    EXPECT_EQ(resolved.api_key, "configured");
    EXPECT_EQ(resolved.base_url, "http://proxy:8080/v1");
    unsetenv("GROQ_API_KEY");
}

TEST(ProviderFactoryTest, OllamaHasNoTranscription)
{
    ProviderSettings settings;
    settings.provider = "ollama";
    settings.model = "llava";
    EXPECT_THROW(ProviderFactory::createTranscription(settings), std::invalid_argument);
    EXPECT_EQ(ProviderFactory::createVision(settings)->name(), "ollama:llava");
    EXPECT_TRUE(ProviderFactory::apiKeyEnvVar(ProviderKind::OLLAMA).empty());
}

TEST(ProviderFactoryTest, OpenAIFamilyCoversAllCapabilities)
{
    ProviderSettings settings;
    settings.provider = "together";
    settings.model = "meta-llama/Llama-Vision";
    settings.api_key = "k";
    EXPECT_EQ(ProviderFactory::createTranscription(settings)->name(), "together:meta-llama/Llama-Vision");
    EXPECT_EQ(ProviderFactory::createVision(settings)->name(), "together:meta-llama/Llama-Vision");
    EXPECT_EQ(ProviderFactory::createAnalysis(settings)->name(), "together:meta-llama/Llama-Vision");
}

TEST(ChatResponseTest, ReturnsMessageContent)
{
    nlohmann::json response = {{"choices", {{{"message", {{"role", "assistant"}, {"content", "{\"a\":1}"}}}}}}};
    EXPECT_EQ(OpenAICompatibleProvider::parseChatContent(response), "{\"a\":1}");
}

TEST(ChatResponseTest, NullContentYieldsRefusalText)
{
    nlohmann::json response = {
        {"choices", {{{"message", {{"content", nullptr}, {"refusal", "I'm sorry, I can't help with that."}}}}}}};
    EXPECT_EQ(OpenAICompatibleProvider::parseChatContent(response), "I'm sorry, I can't help with that.");

    nlohmann::json empty = {{"choices", {{{"message", {{"content", nullptr}, {"refusal", nullptr}}}}}}};
    EXPECT_EQ(OpenAICompatibleProvider::parseChatContent(empty), "");
}

TEST(ChatResponseTest, MissingChoicesIsTransportFailure)
{
    EXPECT_THROW(OpenAICompatibleProvider::parseChatContent({{"error", "rate limited"}}), TransportFailure);
    EXPECT_THROW(OpenAICompatibleProvider::parseChatContent({{"choices", nlohmann::json::array()}}), TransportFailure);
}

TEST(TranscriptionResponseTest, ParsesVerboseJsonSegments)
{
    nlohmann::json response = {
        {"text", "Buongiorno a tutti. Oggi vediamo gli ordini."},
        {"segments", {{{"start", 0.0}, {"end", 2.456}, {"text", " Buongiorno a tutti."}},
                      {{"start", 2.456}, {"end", 5.0}, {"text", " Oggi vediamo gli ordini. "}}}}};

    Transcript transcript = OpenAICompatibleProvider::parseTranscription(response, "it");

    EXPECT_EQ(transcript.language, "it");
    EXPECT_EQ(transcript.full_text, "Buongiorno a tutti. Oggi vediamo gli ordini.");
    ASSERT_EQ(transcript.segments.size(), 2u);
    EXPECT_DOUBLE_EQ(transcript.segments[0].end, 2.46);
    EXPECT_EQ(transcript.segments[1].text, "Oggi vediamo gli ordini.");
}

TEST(HttpSupportTest, SplitsBaseUrl)
{
    HttpEndpoint openai = parseEndpoint("https://api.openai.com/v1/");
    EXPECT_EQ(openai.scheme_host_port, "https://api.openai.com");
    EXPECT_EQ(openai.path_prefix, "/v1");

    HttpEndpoint ollama = parseEndpoint("http://localhost:11434");
    EXPECT_EQ(ollama.scheme_host_port, "http://localhost:11434");
    EXPECT_EQ(ollama.path_prefix, "");

    EXPECT_THROW(parseEndpoint("localhost:11434"), std::invalid_argument);
    EXPECT_THROW(parseEndpoint("ftp://files.example.com"), std::invalid_argument);
}

TEST(HttpSupportTest, Base64MatchesRfc4648Vectors)
{
    auto bytes = [](const std::string &text)
    { return std::vector<uint8_t>(text.begin(), text.end()); };
    EXPECT_EQ(base64Encode(bytes("")), "");
    EXPECT_EQ(base64Encode(bytes("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(HttpSupportTest, ReadsFilesAndGuessesImageType)
{
    const auto path = std::filesystem::temp_directory_path() / "media_insight_http_support.jpg";
    {
        std::ofstream out(path, std::ios::binary);
        out << "\xFF\xD8\xFF";
    }
    EXPECT_EQ(readBinaryFile(path.string()).size(), 3u);
    EXPECT_EQ(imageMediaType(path.string()), "image/jpeg");
    EXPECT_EQ(imageMediaType("frame.PNG"), "image/png");
    std::filesystem::remove(path);

    EXPECT_THROW(readBinaryFile("/nonexistent/frame.jpg"), std::runtime_error);
}

TEST(HttpSupportTest, ErrorBodyIsCutOnCharacterBoundary)
{
    // "é" occupies bytes 499 and 500 of the body
    const std::string body = std::string(499, 'x') + "\xC3\xA9" + "rror details that are dropped";

    const std::string message = apiErrorMessage("groq", 400, body);

    EXPECT_EQ(message, "groq API error 400: " + std::string(499, 'x') + "\xC3\xA9");
    EXPECT_NO_THROW(nlohmann::json({{"error", message}}).dump());
    EXPECT_EQ(apiErrorMessage("Ollama", 404, "model not found"), "Ollama API error 404: model not found");
}
