#pragma once

#include "chunkd/core/result.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace chunkd {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,   // DELETE clashes with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    REQUEST_TIMEOUT = 408,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

/**
 * @brief URL helpers: split path and query, percent-decoding
 */
class UrlUtils {
public:
    /// "/download/a%20b?x=1" -> "/download/a%20b"
    static std::string path_of(const std::string& url) {
        const auto pos = url.find('?');
        return pos == std::string::npos ? url : url.substr(0, pos);
    }

    /// "/search/?file_name=x" -> "file_name=x"
    static std::string query_of(const std::string& url) {
        const auto pos = url.find('?');
        return pos == std::string::npos ? std::string() : url.substr(pos + 1);
    }

    /**
     * @brief Percent-decode @p text; '+' becomes a space only in query strings
     *
     * Malformed escapes ("%zz", a trailing '%') are kept literally.
     */
    static std::string decode(const std::string& text, bool plus_is_space) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (c == '%' && i + 2 < text.size() &&
                std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
                out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
                i += 2;
            } else if (c == '+' && plus_is_space) {
                out.push_back(' ');
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    /**
     * @brief Parse "a=1&b=two" into decoded pairs; later duplicates win
     */
    static std::unordered_map<std::string, std::string> parse_query(const std::string& query) {
        std::unordered_map<std::string, std::string> params;
        size_t start = 0;
        while (start <= query.size()) {
            auto end = query.find('&', start);
            if (end == std::string::npos) {
                end = query.size();
            }
            const std::string pair = query.substr(start, end - start);
            if (!pair.empty()) {
                const auto eq = pair.find('=');
                if (eq == std::string::npos) {
                    params[decode(pair, true)] = "";
                } else {
                    params[decode(pair.substr(0, eq), true)] = decode(pair.substr(eq + 1), true);
                }
            }
            start = end + 1;
        }
        return params;
    }

private:
    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return c - 'A' + 10;
    }
};

/**
 * @brief Case-insensitive header comparison (RFC 7230)
 */
inline bool header_name_equals(const std::string& a, const std::string& b) {
#ifdef _WIN32
    return _stricmp(a.c_str(), b.c_str()) == 0;
#else
    return strcasecmp(a.c_str(), b.c_str()) == 0;
#endif
}

/**
 * @brief Parsed HTTP request
 *
 * Body is kept as bytes; uploads carry binary data.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;   // raw request target, query included
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (header_name_equals(key, name)) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        for (const auto& entry : headers) {
            if (header_name_equals(entry.first, name)) {
                return true;
            }
        }
        return false;
    }

    std::string path() const { return UrlUtils::path_of(url); }
    std::string query() const { return UrlUtils::query_of(url); }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Pull-style body producer for streamed responses
 *
 * Each call fills @p chunk with the next piece of the body and returns true,
 * or returns false once the body is exhausted. An error aborts the response.
 */
using BodySource = std::function<Result<bool>(std::vector<uint8_t>& chunk)>;

/**
 * @brief HTTP response, either buffered (body) or streamed (body_source)
 *
 * A streamed response must declare its Content-Length up front through
 * set_stream(); the server closes the connection after each response.
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    BodySource body_source;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_stream(uint64_t content_length, BodySource source) {
        body.clear();
        body_source = std::move(source);
        headers["Content-Length"] = std::to_string(content_length);
    }

    bool is_streamed() const { return static_cast<bool>(body_source); }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (header_name_equals(key, name)) {
                return value;
            }
        }
        return "";
    }

    /// Status line and headers, terminated by the empty line
    std::vector<uint8_t> serialize_head() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";
        const std::string head = oss.str();
        return std::vector<uint8_t>(head.begin(), head.end());
    }

    /// Head plus buffered body
    std::vector<uint8_t> serialize() const {
        auto result = serialize_head();
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::REQUEST_TIMEOUT: return "Request Timeout";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            default: return "HTTP/1.1";
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace chunkd
