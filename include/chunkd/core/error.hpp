#pragma once

#include "chunkd/core/result.hpp"

#include <string>
#include <utility>

namespace chunkd {

/**
 * @brief Machine-readable failure categories of the transfer core
 *
 * Everything except NotFound and IoError is a client fault and is reported
 * before any byte reaches storage.
 */
enum class ErrorKind {
    InvalidArgument,
    PartTooLarge,
    MalformedPart,
    CountLimit,
    QuotaExceeded,
    Conflict,
    NotFound,
    IoError
};

/**
 * @brief Structured error: a kind plus a human-readable detail
 *
 * The detail is shown to clients, so it never carries filesystem paths.
 */
struct Error {
    ErrorKind kind = ErrorKind::IoError;
    std::string detail;

    Error() = default;
    Error(ErrorKind k, std::string d) : kind(k), detail(std::move(d)) {}
};

/// Wire name of an error kind, e.g. "part-too-large"
inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "invalid-argument";
        case ErrorKind::PartTooLarge: return "part-too-large";
        case ErrorKind::MalformedPart: return "malformed-part";
        case ErrorKind::CountLimit: return "count-limit";
        case ErrorKind::QuotaExceeded: return "quota-exceeded";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::IoError: return "io-error";
    }
    return "io-error";
}

/// Shorthand for building a failed Result<T, Error>
template<typename T>
Result<T, Error> Fail(ErrorKind kind, std::string detail) {
    return Err<T>(Error{kind, std::move(detail)});
}

} // namespace chunkd
