#include "providers/http_support.hpp"
#include "core/transcript_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <openssl/evp.h>

HttpEndpoint parseEndpoint(const std::string &base_url)
{
    const auto scheme_end = base_url.find("://");
    if (scheme_end == std::string::npos)
    {
        throw std::invalid_argument("Base URL must start with http:// or https://: " + base_url);
    }
    const std::string scheme = base_url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
    {
        throw std::invalid_argument("Unsupported URL scheme: " + scheme);
    }

    HttpEndpoint endpoint;
    const auto path_start = base_url.find('/', scheme_end + 3);
    if (path_start == std::string::npos)
    {
        endpoint.scheme_host_port = base_url;
    }
    else
    {
        endpoint.scheme_host_port = base_url.substr(0, path_start);
        endpoint.path_prefix = base_url.substr(path_start);
    }
    while (!endpoint.path_prefix.empty() && endpoint.path_prefix.back() == '/')
        endpoint.path_prefix.pop_back();
    return endpoint;
}

std::string base64Encode(const std::vector<uint8_t> &data)
{
    if (data.empty())
        return "";
    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminating NUL
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded[0]), data.data(),
                                        static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

std::vector<uint8_t> readBinaryFile(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("File not found: " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string imageMediaType(const std::string &path)
{
    const std::string ext = transcript_utils::toLower(std::filesystem::path(path).extension().string());
    return (ext == ".jpg" || ext == ".jpeg") ? "image/jpeg" : "image/png";
}

std::string apiErrorMessage(const std::string &label, int status, const std::string &body)
{
    return label + " API error " + std::to_string(status) + ": " + transcript_utils::truncateUtf8(body, 500);
}
