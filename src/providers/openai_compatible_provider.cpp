#include "providers/openai_compatible_provider.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <httplib.h>

namespace
{
    void configureClient(httplib::Client &client, const ProviderSettings &settings)
    {
        client.set_connection_timeout(30, 0);
        client.set_read_timeout(settings.timeout_seconds, 0);
        client.set_write_timeout(settings.timeout_seconds, 0);
        client.set_bearer_token_auth(settings.api_key);
    }

    std::string responseError(const std::string &label, const httplib::Result &res)
    {
        if (!res)
            return label + " request failed: " + httplib::to_string(res.error());
        return apiErrorMessage(label, res->status, res->body);
    }

    double round2(double value)
    {
        return std::round(value * 100.0) / 100.0;
    }
}

OpenAICompatibleProvider::OpenAICompatibleProvider(const std::string &label, const ProviderSettings &settings)
    : label_(label), settings_(settings), endpoint_(parseEndpoint(settings.base_url))
{
    if (settings_.api_key.empty())
    {
        Logger::warn("No API key configured for " + label_ + " provider");
    }
}

nlohmann::json OpenAICompatibleProvider::postJson(const std::string &path, const nlohmann::json &body)
{
    httplib::Client client(endpoint_.scheme_host_port);
    configureClient(client, settings_);

    const std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto res = client.Post(endpoint_.path_prefix + path, payload, "application/json");
    if (!res || res->status != 200)
    {
        throw TransportFailure(responseError(label_, res));
    }

    nlohmann::json parsed = nlohmann::json::parse(res->body, nullptr, false);
    if (parsed.is_discarded())
    {
        throw TransportFailure(label_ + " returned a non-JSON response");
    }
    return parsed;
}

Transcript OpenAICompatibleProvider::transcribe(const std::string &audio_path, const std::string &language)
{
    Logger::info("Starting transcription: " + audio_path + " (" + name() + ")");

    std::vector<uint8_t> audio;
    try
    {
        audio = readBinaryFile(audio_path);
    }
    catch (const std::runtime_error &e)
    {
        throw SourceUnreadable(std::string("Audio file not readable: ") + e.what());
    }

    const std::string filename = std::filesystem::path(audio_path).filename().string();
    httplib::MultipartFormDataItems items = {
        {"file", std::string(audio.begin(), audio.end()), filename, "audio/wav"},
        {"model", settings_.model, "", ""},
        {"language", language, "", ""},
        {"response_format", "verbose_json", "", ""},
        {"timestamp_granularities[]", "segment", "", ""},
    };

    httplib::Client client(endpoint_.scheme_host_port);
    configureClient(client, settings_);
    auto res = client.Post(endpoint_.path_prefix + "/audio/transcriptions", items);
    if (!res || res->status != 200)
    {
        throw TransportFailure(responseError(label_, res));
    }

    nlohmann::json parsed = nlohmann::json::parse(res->body, nullptr, false);
    if (parsed.is_discarded())
    {
        throw TransportFailure(label_ + " returned a non-JSON transcription");
    }

    Transcript transcript = parseTranscription(parsed, language);
    Logger::info("Transcription complete: " + std::to_string(transcript.segments.size()) + " segments");
    return transcript;
}

Transcript OpenAICompatibleProvider::parseTranscription(const nlohmann::json &response, const std::string &language)
{
    Transcript transcript;
    transcript.language = language;
    transcript.full_text = response.value("text", "");

    auto segments = response.find("segments");
    if (segments != response.end() && segments->is_array())
    {
        for (const auto &seg : *segments)
        {
            TranscriptSegment segment;
            segment.start = round2(seg.value("start", 0.0));
            segment.end = round2(seg.value("end", segment.start));
            segment.text = seg.value("text", "");
            const auto begin = segment.text.find_first_not_of(" \t\n");
            const auto end = segment.text.find_last_not_of(" \t\n");
            segment.text = begin == std::string::npos ? "" : segment.text.substr(begin, end - begin + 1);
            transcript.segments.push_back(segment);
        }
    }
    return transcript;
}

nlohmann::json OpenAICompatibleProvider::buildVisionRequest(const std::string &image_path,
                                                            const std::string &prompt) const
{
    const std::string image_data = base64Encode(readBinaryFile(image_path));
    const std::string data_url = "data:" + imageMediaType(image_path) + ";base64," + image_data;

    nlohmann::json content = nlohmann::json::array();
    content.push_back({{"type", "image_url"}, {"image_url", {{"url", data_url}, {"detail", "high"}}}});
    content.push_back({{"type", "text"}, {"text", prompt}});

    return nlohmann::json{
        {"model", settings_.model},
        {"max_completion_tokens", kVisionMaxTokens},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", content}}})}};
}

std::string OpenAICompatibleProvider::describeFrame(const std::string &image_path, const std::string &prompt,
                                                    const nlohmann::json & /*context*/)
{
    nlohmann::json body;
    try
    {
        body = buildVisionRequest(image_path, prompt);
    }
    catch (const std::runtime_error &e)
    {
        throw TransportFailure(std::string("Cannot prepare frame image: ") + e.what());
    }
    return parseChatContent(postJson("/chat/completions", body));
}

std::string OpenAICompatibleProvider::analyze(const std::string &prompt, const std::string &system_message,
                                              int max_tokens, const std::string &response_format)
{
    nlohmann::json body{
        {"model", settings_.model},
        {"max_completion_tokens", max_tokens},
        {"messages", nlohmann::json::array({{{"role", "system"}, {"content", system_message}},
                                            {{"role", "user"}, {"content", prompt}}})}};
    if (!response_format.empty())
    {
        body["response_format"] = {{"type", response_format}};
    }
    return parseChatContent(postJson("/chat/completions", body));
}

std::string OpenAICompatibleProvider::parseChatContent(const nlohmann::json &response)
{
    auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty())
    {
        throw TransportFailure("Chat completion response has no choices");
    }
    const auto &message = (*choices)[0].value("message", nlohmann::json::object());
    auto content = message.find("content");
    if (content == message.end() || content->is_null())
    {
        // Refusals arrive with null content and a separate refusal field
        auto refusal = message.find("refusal");
        return (refusal != message.end() && refusal->is_string()) ? refusal->get<std::string>() : "";
    }
    if (!content->is_string())
    {
        throw TransportFailure("Chat completion content is not text");
    }
    return content->get<std::string>();
}
