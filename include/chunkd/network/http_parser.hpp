#pragma once

#include "chunkd/core/result.hpp"
#include "chunkd/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>

namespace chunkd {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR   // ERROR clashes with a Windows macro
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data can be fed in arbitrary pieces as it arrives from the socket.
 * Request line and headers are consumed byte by byte; the body is copied
 * in bulk.
 *
 * Limits:
 * - a request or header line longer than kMaxLineLength is an error
 * - more than kMaxHeaderCount headers is an error
 * - a Content-Length above max_body_size completes parsing early with
 *   body_too_large() set; the body is not read
 *
 * Only Content-Length framing is understood; a chunked body is an error.
 */
class HttpParser {
public:
    static constexpr size_t kMaxLineLength = 8192;
    static constexpr size_t kMaxHeaderCount = 100;

    explicit HttpParser(uint64_t max_body_size = std::numeric_limits<uint64_t>::max())
        : max_body_size_(max_body_size) {
        reset();
    }

    /**
     * @return true once the request is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>(std::string("Parser in error state"));
            }

            if (state_ == ParseState::BODY) {
                const uint64_t remaining = content_length_ - request_.body.size();
                const size_t take = static_cast<size_t>(std::min<uint64_t>(remaining, len - i));
                request_.body.insert(request_.body.end(), data + i, data + i + take);
                i += take;
                if (request_.body.size() >= content_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            if (!step(c)) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(error_ + " at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    const HttpRequest& get_request() const { return request_; }

    /// Move the parsed request out; the parser must be reset() before reuse
    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    /// Headers are in and the body is still arriving
    bool in_body() const { return state_ == ParseState::BODY; }

    /// Declared Content-Length exceeded the configured maximum
    bool body_too_large() const { return body_too_large_; }

    uint64_t content_length() const { return content_length_; }

    /// Client sent "Expect: 100-continue" and is waiting before sending the body
    bool expects_continue() const {
        if (state_ != ParseState::BODY || !request_.body.empty()) {
            return false;
        }
        std::string expect = request_.get_header("Expect");
        std::transform(expect.begin(), expect.end(), expect.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return expect == "100-continue";
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        content_length_ = 0;
        header_count_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    bool fail(const std::string& message) {
        error_ = message;
        return false;
    }

    bool append(char c) {
        if (buffer_.size() >= kMaxLineLength) {
            return fail("Line too long");
        }
        buffer_ += c;
        return true;
    }

    bool step(char c) {
        switch (state_) {
            case ParseState::METHOD: return parse_method(c);
            case ParseState::URL: return parse_url(c);
            case ParseState::VERSION: return parse_version(c);
            case ParseState::HEADER_NAME: return parse_header_name(c);
            case ParseState::HEADER_VALUE: return parse_header_value(c);
            default: return fail("Unexpected parser state");
        }
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return fail("Empty HTTP method");
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return fail("Unsupported HTTP method " + buffer_);
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return fail("Failed to parse HTTP method");
        }
        return append(c);
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return fail("Empty URL");
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return fail("Failed to parse URL");
        }
        return append(c);
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return fail("Unsupported HTTP version");
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        return append(c);
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (!buffer_.empty()) {
                return fail("Header line without colon");
            }
            return finish_headers();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("Failed to parse header name");
        }
        return append(c);
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            if (++header_count_ > kMaxHeaderCount) {
                return fail("Too many headers");
            }
            // A repeated Content-Length must agree with the first; the body length
            // may not depend on which spelling the header map yields
            if (header_name_equals(current_header_name_, "Content-Length") &&
                request_.has_header("Content-Length")) {
                if (request_.get_header("Content-Length") != buffer_) {
                    return fail("Duplicate Content-Length");
                }
            } else {
                request_.headers[current_header_name_] = buffer_;
            }
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        return append(c);
    }

    bool finish_headers() {
        const std::string transfer_encoding = request_.get_header("Transfer-Encoding");
        if (!transfer_encoding.empty() && transfer_encoding != "identity") {
            return fail("Transfer-Encoding " + transfer_encoding + " is not supported");
        }

        if (!request_.has_header("Content-Length")) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        const std::string value = request_.get_header("Content-Length");
        if (value.empty()) {
            return fail("Invalid Content-Length");
        }
        uint64_t length = 0;
        for (char digit : value) {
            if (!std::isdigit(static_cast<unsigned char>(digit))) {
                return fail("Invalid Content-Length");
            }
            const uint64_t d = static_cast<uint64_t>(digit - '0');
            if (length > (std::numeric_limits<uint64_t>::max() - d) / 10) {
                return fail("Invalid Content-Length");
            }
            length = length * 10 + d;
        }
        content_length_ = length;

        if (length > max_body_size_) {
            body_too_large_ = true;
            state_ = ParseState::COMPLETE;
            return true;
        }

        if (length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        request_.body.reserve(static_cast<size_t>(length));
        state_ = ParseState::BODY;
        return true;
    }

    uint64_t max_body_size_;
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;                // current token
    std::string current_header_name_;
    std::string error_;
    uint64_t content_length_;
    size_t header_count_;
    size_t line_;                       // for error reporting
    bool last_char_was_cr_;
    bool body_too_large_;
};

} // namespace network
} // namespace chunkd
