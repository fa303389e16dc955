/**
 * @file http_message.cpp
 * @brief HTTP request parsing and response formatting.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/net/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace dmsd {
namespace net {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

}  // namespace

std::string HttpRequest::path() const {
    return target.substr(0, target.find('?'));
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : "";
}

size_t findHeaderEnd(const std::string& data) {
    size_t crlf = data.find("\r\n\r\n");
    size_t lf = data.find("\n\n");

    if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) {
        return crlf + 4;
    }
    if (lf != std::string::npos) {
        return lf + 2;
    }
    return std::string::npos;
}

bool parseHttpRequest(const std::string& head, HttpRequest& request) {
    std::istringstream stream(head);
    std::string line;

    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::istringstream requestLine(line);
    std::string extra;
    requestLine >> request.method >> request.target >> request.version;
    if (requestLine.fail() || (requestLine >> extra)) {
        return false;
    }
    if (request.target.empty() || request.version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }

    request.headers.clear();
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        request.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    return true;
}

std::string HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << httpReasonPhrase(status) << "\r\n";
    for (const auto& field : headers) {
        oss << field.first << ": " << field.second << "\r\n";
    }
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "\r\n";
    if (!omitBody) {
        oss << body;
    }
    return oss.str();
}

const char* httpReasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

}  // namespace net
}  // namespace dmsd
