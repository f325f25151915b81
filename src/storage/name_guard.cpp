#include "chunkd/storage/name_guard.hpp"

namespace chunkd::storage {

Result<void, Error> check_destination_name(const std::string& name) {
    if (name.empty()) {
        return Fail<void>(ErrorKind::InvalidArgument, "File name is required");
    }
    if (name.size() > kMaxNameLength) {
        return Fail<void>(ErrorKind::InvalidArgument, "File name is too long");
    }
    if (name == "." || name == "..") {
        return Fail<void>(ErrorKind::InvalidArgument, "File name must not be a directory reference");
    }
    for (char c : name) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\') {
            return Fail<void>(ErrorKind::InvalidArgument, "File name must not contain path separators");
        }
        if (byte < 0x20 || byte == 0x7f) {
            return Fail<void>(ErrorKind::InvalidArgument, "File name must not contain control characters");
        }
    }
    return Ok();
}

Result<std::filesystem::path, Error> resolve_destination(const std::filesystem::path& root,
                                                         const std::string& name) {
    auto checked = check_destination_name(name);
    if (checked.is_error()) {
        return Err<std::filesystem::path>(checked.error());
    }
    return Ok(root / name);
}

} // namespace chunkd::storage
