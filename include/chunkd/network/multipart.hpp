#pragma once

#include "chunkd/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkd {
namespace network {

/**
 * @brief One part of a multipart/form-data body
 */
struct MultipartPart {
    std::string name;                       // form field name
    std::optional<std::string> filename;    // set for file inputs
    std::string content_type;
    std::vector<uint8_t> data;

    std::string data_as_string() const { return std::string(data.begin(), data.end()); }
};

/**
 * @brief Decoded multipart/form-data body (RFC 7578)
 *
 * Usage:
 * ```cpp
 * auto form = MultipartForm::parse(request.get_header("Content-Type"), request.body);
 * if (form.is_ok()) {
 *     const MultipartPart* file = form.value().find("file");
 *     auto part_number = form.value().field("part_number");
 * }
 * ```
 */
class MultipartForm {
public:
    /**
     * @param content_type Full Content-Type header, boundary parameter included
     */
    static Result<MultipartForm> parse(const std::string& content_type, const std::vector<uint8_t>& body);

    /// First part with this field name, nullptr if absent
    const MultipartPart* find(const std::string& name) const;

    /// Text value of a non-file field
    std::optional<std::string> field(const std::string& name) const;

    const std::vector<MultipartPart>& parts() const { return parts_; }

private:
    std::vector<MultipartPart> parts_;
};

/// Boundary parameter of a multipart Content-Type, unquoted
std::optional<std::string> extract_boundary(const std::string& content_type);

/// True for "multipart/form-data" regardless of case and parameters
bool is_multipart_form(const std::string& content_type);

} // namespace network
} // namespace chunkd
