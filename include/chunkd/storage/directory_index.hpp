#pragma once

#include "chunkd/core/error.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace chunkd::storage {

/**
 * @brief Read-only view of the names stored in the upload directory
 *
 * Only regular files are reported; names come back sorted.
 */
class DirectoryIndex {
public:
    explicit DirectoryIndex(std::filesystem::path root);

    /// All stored names (empty when nothing has been uploaded)
    Result<std::vector<std::string>, Error> list() const;

    /**
     * @brief Names containing @p query, ignoring ASCII case
     *
     * InvalidArgument for an empty query, NotFound when nothing matches.
     */
    Result<std::vector<std::string>, Error> search(const std::string& query) const;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace chunkd::storage
