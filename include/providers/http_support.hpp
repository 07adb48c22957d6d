#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Base URL split into the part httplib connects to and the path prefix of every request
 */
struct HttpEndpoint
{
    std::string scheme_host_port; // e.g. "https://api.openai.com"
    std::string path_prefix;      // e.g. "/v1"
};

/**
 * @throws std::invalid_argument if the URL has no http:// or https:// scheme
 */
HttpEndpoint parseEndpoint(const std::string &base_url);

/**
 * @brief Standard base64 (RFC 4648) via OpenSSL
 */
std::string base64Encode(const std::vector<uint8_t> &data);

/**
 * @throws std::runtime_error if the file cannot be read
 */
std::vector<uint8_t> readBinaryFile(const std::string &path);

// "image/jpeg" for .jpg/.jpeg, "image/png" otherwise
std::string imageMediaType(const std::string &path);

/**
 * @brief "<label> API error <status>: <body>" with the body cut to its first 500 characters
 */
std::string apiErrorMessage(const std::string &label, int status, const std::string &body);
