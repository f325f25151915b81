#pragma once

#include "chunkd/core/error.hpp"

#include <filesystem>
#include <string>

namespace chunkd::storage {

/// Longest destination name accepted (typical filesystem component limit)
inline constexpr std::size_t kMaxNameLength = 255;

/**
 * @brief Check that a client-supplied destination name is a single safe path component
 *
 * Rejects empty names, "." and "..", names longer than kMaxNameLength and
 * names containing '/', '\\', NUL or other control characters.
 */
Result<void, Error> check_destination_name(const std::string& name);

/**
 * @brief Resolve a destination name below @p root after checking it
 */
Result<std::filesystem::path, Error> resolve_destination(const std::filesystem::path& root,
                                                         const std::string& name);

} // namespace chunkd::storage
