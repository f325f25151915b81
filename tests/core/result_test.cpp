#include "chunkd/core/error.hpp"
#include "chunkd/core/result.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using chunkd::Err;
using chunkd::Error;
using chunkd::ErrorKind;
using chunkd::Fail;
using chunkd::Ok;
using chunkd::Result;

namespace {

Result<int> parse_digit(char c) {
    if (c < '0' || c > '9') {
        return Err<int>(std::string("not a digit"));
    }
    return Ok(c - '0');
}

Result<void, Error> require_positive(int value) {
    if (value <= 0) {
        return Fail<void>(ErrorKind::InvalidArgument, "must be positive");
    }
    return Ok();
}

} // namespace

TEST(ResultTest, HoldsValue) {
    auto result = parse_digit('7');
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 7);
}

TEST(ResultTest, HoldsError) {
    auto result = parse_digit('x');
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), "not a digit");
    EXPECT_EQ(result.value_or(-1), -1);
}

TEST(ResultTest, SameValueAndErrorTypeStaysUnambiguous) {
    Result<std::string> ok = Ok(std::string("payload"));
    Result<std::string> err = Err<std::string>(std::string("failure"));

    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "payload");
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "failure");
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(require_positive(3).is_ok());

    auto failed = require_positive(0);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(failed.error().detail, "must be positive");
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::vector<int>, Error> result = Ok(std::vector<int>{1, 2, 3});
    ASSERT_TRUE(result.is_ok());
    auto taken = std::move(result.value());
    EXPECT_EQ(taken.size(), 3u);
}

TEST(ErrorKindTest, WireNames) {
    EXPECT_STREQ(chunkd::to_string(ErrorKind::InvalidArgument), "invalid-argument");
    EXPECT_STREQ(chunkd::to_string(ErrorKind::PartTooLarge), "part-too-large");
    EXPECT_STREQ(chunkd::to_string(ErrorKind::MalformedPart), "malformed-part");
    EXPECT_STREQ(chunkd::to_string(ErrorKind::CountLimit), "count-limit");
    EXPECT_STREQ(chunkd::to_string(ErrorKind::QuotaExceeded), "quota-exceeded");
    EXPECT_STREQ(chunkd::to_string(ErrorKind::Conflict), "conflict");
    EXPECT_STREQ(chunkd::to_string(ErrorKind::NotFound), "not-found");
    EXPECT_STREQ(chunkd::to_string(ErrorKind::IoError), "io-error");
}

TEST(ErrorKindTest, ErrorTakesOwnershipOfDetail) {
    std::string detail(64, 'x');
    Error error(ErrorKind::Conflict, std::move(detail));

    EXPECT_EQ(error.kind, ErrorKind::Conflict);
    EXPECT_EQ(error.detail, std::string(64, 'x'));

    Error fallback;
    EXPECT_EQ(fallback.kind, ErrorKind::IoError);
    EXPECT_TRUE(fallback.detail.empty());
}
