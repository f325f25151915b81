#include "chunkd/transfer/part_validator.hpp"

#include <string>

namespace chunkd::transfer {

PartValidator::PartValidator(const TransferConfig& config)
    : chunk_size_(config.chunk_size)
    , max_file_size_(config.max_file_size)
    , max_parts_(config.max_parts) {
}

Result<void, Error> PartValidator::validate(std::uint64_t part_length,
                                            std::uint32_t part_number,
                                            std::uint32_t total_parts,
                                            std::uint64_t current_size) const {
    if (part_number == 0 || total_parts == 0) {
        return Fail<void>(ErrorKind::InvalidArgument, "Invalid part number or total parts");
    }
    if (part_number > total_parts) {
        return Fail<void>(ErrorKind::InvalidArgument,
                          "Part number " + std::to_string(part_number) +
                          " exceeds total parts " + std::to_string(total_parts));
    }

    if (total_parts > max_parts_) {
        return Fail<void>(ErrorKind::CountLimit,
                          "Total parts " + std::to_string(total_parts) +
                          " exceeds the limit of " + std::to_string(max_parts_));
    }

    if (part_length > chunk_size_) {
        return Fail<void>(ErrorKind::PartTooLarge,
                          "Part of " + std::to_string(part_length) +
                          " bytes exceeds the chunk size of " + std::to_string(chunk_size_));
    }

    // Only the last part may be short; a short middle part means the client truncated it
    if (part_number < total_parts && part_length != chunk_size_) {
        return Fail<void>(ErrorKind::MalformedPart,
                          "Part " + std::to_string(part_number) + "/" + std::to_string(total_parts) +
                          " has " + std::to_string(part_length) + " bytes, expected " +
                          std::to_string(chunk_size_));
    }

    if (part_length > max_file_size_ || current_size > max_file_size_ - part_length) {
        return Fail<void>(ErrorKind::QuotaExceeded,
                          "File would exceed the maximum size of " + std::to_string(max_file_size_) + " bytes");
    }

    return Ok();
}

} // namespace chunkd::transfer
