/**
 * @file http_message.hpp
 * @brief Minimal HTTP/1.x request parsing and response formatting.
 *
 * Only what a static document server needs: the request line, header
 * fields, and a fixed-length response.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/net/export.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dmsd {
namespace net {

/**
 * @struct HttpRequest
 * @brief Parsed request head. Header names are lowercased.
 */
struct DMSD_NET_API HttpRequest {
    std::string method;
    std::string target;     ///< Request target as sent (path + query)
    std::string version;    ///< e.g. "HTTP/1.1"
    std::map<std::string, std::string> headers;

    /**
     * @brief Target without any query string.
     */
    std::string path() const;

    /**
     * @brief Header value by case-insensitive name, empty if absent.
     */
    std::string header(const std::string& name) const;
};

/**
 * @brief Offset just past the blank line ending the header block.
 * @return std::string::npos if the block is incomplete.
 */
DMSD_NET_API size_t findHeaderEnd(const std::string& data);

/**
 * @brief Parse a request head (request line plus header fields).
 *
 * Accepts CRLF or bare LF line endings.
 * @return False if the request line is malformed.
 */
DMSD_NET_API bool parseHttpRequest(const std::string& head, HttpRequest& request);

/**
 * @struct HttpResponse
 * @brief Response with an explicit Content-Length.
 */
struct DMSD_NET_API HttpResponse {
    int status;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    bool omitBody;          ///< HEAD: send headers only

    HttpResponse() : status(200), omitBody(false) {}

    /**
     * @brief Wire form: status line, headers, Content-Length, body.
     */
    std::string serialize() const;
};

/**
 * @brief Reason phrase for a status code ("OK", "Not Found", ...).
 */
DMSD_NET_API const char* httpReasonPhrase(int status);

}  // namespace net
}  // namespace dmsd
