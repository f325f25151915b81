#include "chunkd/network/multipart.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using chunkd::network::extract_boundary;
using chunkd::network::is_multipart_form;
using chunkd::network::MultipartForm;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

const std::string kContentType = "multipart/form-data; boundary=----chunkdBoundary42";

std::string upload_body(const std::string& filename, const std::string& payload) {
    return "------chunkdBoundary42\r\n"
           "Content-Disposition: form-data; name=\"part_number\"\r\n"
           "\r\n"
           "2\r\n"
           "------chunkdBoundary42\r\n"
           "Content-Disposition: form-data; name=\"total_parts\"\r\n"
           "\r\n"
           "5\r\n"
           "------chunkdBoundary42\r\n"
           "Content-Disposition: form-data; name=\"file\"; filename=\"" + filename + "\"\r\n"
           "Content-Type: application/octet-stream\r\n"
           "\r\n" +
           payload + "\r\n"
           "------chunkdBoundary42--\r\n";
}

} // namespace

TEST(MultipartTest, DetectsFormContentType) {
    EXPECT_TRUE(is_multipart_form("multipart/form-data; boundary=x"));
    EXPECT_TRUE(is_multipart_form("Multipart/Form-Data;boundary=x"));
    EXPECT_FALSE(is_multipart_form("application/octet-stream"));
    EXPECT_FALSE(is_multipart_form(""));
}

TEST(MultipartTest, ExtractsBoundary) {
    EXPECT_EQ(extract_boundary("multipart/form-data; boundary=abc"), std::optional<std::string>("abc"));
    EXPECT_EQ(extract_boundary("multipart/form-data; boundary=\"a;b\""), std::optional<std::string>("a;b"));
    EXPECT_FALSE(extract_boundary("multipart/form-data").has_value());
}

TEST(MultipartTest, ParsesFieldsAndFile) {
    auto form = MultipartForm::parse(kContentType, bytes(upload_body("report.pdf", "PDFDATA")));
    ASSERT_TRUE(form.is_ok()) << form.error();

    EXPECT_EQ(form.value().parts().size(), 3u);
    EXPECT_EQ(form.value().field("part_number"), std::optional<std::string>("2"));
    EXPECT_EQ(form.value().field("total_parts"), std::optional<std::string>("5"));

    const auto* file = form.value().find("file");
    ASSERT_NE(file, nullptr);
    ASSERT_TRUE(file->filename.has_value());
    EXPECT_EQ(*file->filename, "report.pdf");
    EXPECT_EQ(file->content_type, "application/octet-stream");
    EXPECT_EQ(file->data_as_string(), "PDFDATA");

    // File parts are not text fields
    EXPECT_FALSE(form.value().field("file").has_value());
    EXPECT_EQ(form.value().find("missing"), nullptr);
}

TEST(MultipartTest, BinaryPayloadMayContainCrLf) {
    const std::string payload("line1\r\nline2\r\n--not-a-boundary\x00\xff", 32);
    auto form = MultipartForm::parse(kContentType, bytes(upload_body("blob.bin", payload)));
    ASSERT_TRUE(form.is_ok()) << form.error();

    const auto* file = form.value().find("file");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->data_as_string(), payload);
}

TEST(MultipartTest, FilenameWithSemicolon) {
    auto form = MultipartForm::parse(kContentType, bytes(upload_body("a;b.txt", "x")));
    ASSERT_TRUE(form.is_ok()) << form.error();
    EXPECT_EQ(*form.value().find("file")->filename, "a;b.txt");
}

TEST(MultipartTest, RejectsMalformedBodies) {
    EXPECT_TRUE(MultipartForm::parse("application/json", bytes("{}")).is_error());
    EXPECT_TRUE(MultipartForm::parse("multipart/form-data", bytes("x")).is_error());
    EXPECT_TRUE(MultipartForm::parse(kContentType, bytes("no boundary here")).is_error());

    const std::string unterminated =
        "------chunkdBoundary42\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"a\"\r\n"
        "\r\n"
        "data without end";
    EXPECT_TRUE(MultipartForm::parse(kContentType, bytes(unterminated)).is_error());

    const std::string nameless =
        "------chunkdBoundary42\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "x\r\n"
        "------chunkdBoundary42--\r\n";
    EXPECT_TRUE(MultipartForm::parse(kContentType, bytes(nameless)).is_error());
}
