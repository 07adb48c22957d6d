#include "providers/ollama_provider.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <httplib.h>

OllamaProvider::OllamaProvider(const ProviderSettings &settings)
    : settings_(settings), endpoint_(parseEndpoint(settings.base_url))
{
}

std::string OllamaProvider::generate(const nlohmann::json &body)
{
    httplib::Client client(endpoint_.scheme_host_port);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(settings_.timeout_seconds, 0);
    client.set_write_timeout(settings_.timeout_seconds, 0);

    const std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto res = client.Post(endpoint_.path_prefix + "/api/generate", payload, "application/json");
    if (!res)
    {
        throw TransportFailure("Ollama request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200)
    {
        throw TransportFailure(apiErrorMessage("Ollama", res->status, res->body));
    }

    nlohmann::json parsed = nlohmann::json::parse(res->body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        throw TransportFailure("Ollama returned a non-JSON response");
    }
    auto response = parsed.find("response");
    return (response != parsed.end() && response->is_string()) ? response->get<std::string>() : "";
}

std::string OllamaProvider::describeFrame(const std::string &image_path, const std::string &prompt,
                                          const nlohmann::json & /*context*/)
{
    std::string image_data;
    try
    {
        image_data = base64Encode(readBinaryFile(image_path));
    }
    catch (const std::runtime_error &e)
    {
        throw TransportFailure(std::string("Cannot prepare frame image: ") + e.what());
    }

    return generate({{"model", settings_.model},
                     {"prompt", prompt},
                     {"images", nlohmann::json::array({image_data})},
                     {"stream", false}});
}

std::string OllamaProvider::analyze(const std::string &prompt, const std::string &system_message, int max_tokens,
                                    const std::string &response_format)
{
    nlohmann::json body{{"model", settings_.model},
                        {"prompt", prompt},
                        {"system", system_message},
                        {"stream", false},
                        {"options", {{"num_predict", max_tokens}}}};
    if (response_format == "json_object")
    {
        body["format"] = "json";
    }
    return generate(body);
}
