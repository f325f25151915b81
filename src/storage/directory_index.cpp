#include "chunkd/storage/directory_index.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace chunkd::storage {
namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

DirectoryIndex::DirectoryIndex(fs::path root)
    : root_(std::move(root)) {
}

Result<std::vector<std::string>, Error> DirectoryIndex::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Ok(std::move(names));
        }
        spdlog::error("Failed to list {}: {}", root_.string(), ec.message());
        return Fail<std::vector<std::string>>(ErrorKind::IoError, "Failed to list stored files");
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        spdlog::error("Failed to list {}: {}", root_.string(), ec.message());
        return Fail<std::vector<std::string>>(ErrorKind::IoError, "Failed to list stored files");
    }

    std::sort(names.begin(), names.end());
    return Ok(std::move(names));
}

Result<std::vector<std::string>, Error> DirectoryIndex::search(const std::string& query) const {
    if (query.empty()) {
        return Fail<std::vector<std::string>>(ErrorKind::InvalidArgument, "File name parameter is required");
    }

    auto listed = list();
    if (listed.is_error()) {
        return listed;
    }

    const auto needle = to_lower(query);
    std::vector<std::string> matches;
    for (const auto& name : listed.value()) {
        if (to_lower(name).find(needle) != std::string::npos) {
            matches.push_back(name);
        }
    }

    if (matches.empty()) {
        return Fail<std::vector<std::string>>(ErrorKind::NotFound, "No matching files found.");
    }
    return Ok(std::move(matches));
}

} // namespace chunkd::storage
