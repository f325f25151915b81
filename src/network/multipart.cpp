#include "chunkd/network/multipart.hpp"

#include "chunkd/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace chunkd {
namespace network {

namespace {

std::string trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string unquote(const std::string& value) {
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return value;
    }
    std::string out;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
        if (value[i] == '\\' && i + 2 < value.size()) {
            ++i;
        }
        out.push_back(value[i]);
    }
    return out;
}

/**
 * @brief Split "form-data; name=\"a\"; filename=\"b;c\"" into parameters
 *
 * Semicolons inside quotes do not split.
 */
std::vector<std::pair<std::string, std::string>> header_parameters(const std::string& value) {
    std::vector<std::string> pieces;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '"' && (i == 0 || value[i - 1] != '\\')) {
            quoted = !quoted;
        }
        if (c == ';' && !quoted) {
            pieces.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    pieces.push_back(current);

    std::vector<std::pair<std::string, std::string>> params;
    for (size_t i = 1; i < pieces.size(); ++i) {
        const auto eq = pieces[i].find('=');
        if (eq == std::string::npos) {
            continue;
        }
        params.emplace_back(to_lower(trim(std::string_view(pieces[i]).substr(0, eq))),
                            unquote(trim(std::string_view(pieces[i]).substr(eq + 1))));
    }
    return params;
}

Result<MultipartPart> parse_part(std::string_view headers, std::string_view data) {
    MultipartPart part;
    bool has_disposition = false;

    size_t start = 0;
    while (start < headers.size()) {
        auto end = headers.find("\r\n", start);
        if (end == std::string_view::npos) {
            end = headers.size();
        }
        const std::string_view line = headers.substr(start, end - start);
        start = end + 2;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        const std::string name = trim(line.substr(0, colon));
        const std::string value = trim(line.substr(colon + 1));

        if (header_name_equals(name, "Content-Disposition")) {
            has_disposition = true;
            for (const auto& [key, param] : header_parameters(value)) {
                if (key == "name") {
                    part.name = param;
                } else if (key == "filename") {
                    part.filename = param;
                }
            }
        } else if (header_name_equals(name, "Content-Type")) {
            part.content_type = value;
        }
    }

    if (!has_disposition || part.name.empty()) {
        return Err<MultipartPart>(std::string("Multipart section without a field name"));
    }

    part.data.assign(data.begin(), data.end());
    return Ok(std::move(part));
}

} // namespace

bool is_multipart_form(const std::string& content_type) {
    const auto lowered = to_lower(content_type);
    return lowered.rfind("multipart/form-data", 0) == 0;
}

std::optional<std::string> extract_boundary(const std::string& content_type) {
    for (const auto& [key, value] : header_parameters(content_type)) {
        if (key == "boundary" && !value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

Result<MultipartForm> MultipartForm::parse(const std::string& content_type, const std::vector<uint8_t>& body) {
    if (!is_multipart_form(content_type)) {
        return Err<MultipartForm>(std::string("Content-Type is not multipart/form-data"));
    }
    const auto boundary = extract_boundary(content_type);
    if (!boundary) {
        return Err<MultipartForm>(std::string("Missing multipart boundary"));
    }

    const std::string_view text(reinterpret_cast<const char*>(body.data()), body.size());
    const std::string delimiter = "--" + *boundary;
    const std::string next_delimiter = "\r\n" + delimiter;

    auto pos = text.find(delimiter);
    if (pos == std::string_view::npos) {
        return Err<MultipartForm>(std::string("Multipart body has no opening boundary"));
    }
    pos += delimiter.size();

    MultipartForm form;
    for (;;) {
        if (text.substr(pos, 2) == "--") {
            return Ok(std::move(form));
        }
        if (text.substr(pos, 2) != "\r\n") {
            return Err<MultipartForm>(std::string("Malformed multipart boundary line"));
        }
        pos += 2;

        const auto headers_end = text.find("\r\n\r\n", pos);
        if (headers_end == std::string_view::npos) {
            return Err<MultipartForm>(std::string("Unterminated multipart headers"));
        }
        const auto data_start = headers_end + 4;

        const auto data_end = text.find(next_delimiter, data_start);
        if (data_end == std::string_view::npos) {
            return Err<MultipartForm>(std::string("Multipart body has no closing boundary"));
        }

        auto part = parse_part(text.substr(pos, headers_end - pos), text.substr(data_start, data_end - data_start));
        if (part.is_error()) {
            return Err<MultipartForm>(part.error());
        }
        form.parts_.push_back(std::move(part.value()));

        pos = data_end + next_delimiter.size();
    }
}

const MultipartPart* MultipartForm::find(const std::string& name) const {
    for (const auto& part : parts_) {
        if (part.name == name) {
            return &part;
        }
    }
    return nullptr;
}

std::optional<std::string> MultipartForm::field(const std::string& name) const {
    const auto* part = find(name);
    if (part == nullptr || part->filename) {
        return std::nullopt;
    }
    return part->data_as_string();
}

} // namespace network
} // namespace chunkd
