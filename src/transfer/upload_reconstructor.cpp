#include "chunkd/transfer/upload_reconstructor.hpp"

#include "chunkd/storage/name_guard.hpp"

#include <spdlog/spdlog.h>

namespace chunkd::transfer {
namespace fs = std::filesystem;

UploadReconstructor::UploadReconstructor(TransferConfig config, const storage::ChunkIoExecutor& io)
    : config_(std::move(config))
    , io_(io)
    , validator_(config_)
    , sessions_(config_.chunk_size) {
}

Result<PartReceipt, Error> UploadReconstructor::store(const PartRequest& part) {
    auto destination = storage::resolve_destination(config_.upload_directory, part.file_name);
    if (destination.is_error()) {
        return Err<PartReceipt>(destination.error());
    }
    const fs::path& path = destination.value();

    auto guard = locks_.acquire(part.file_name);

    auto size = current_size(path);
    if (size.is_error()) {
        return Err<PartReceipt>(size.error());
    }

    if (auto valid = validator_.validate(part.data.size(), part.part_number, part.total_parts, size.value());
        valid.is_error()) {
        return Err<PartReceipt>(valid.error());
    }

    if (config_.strict_part_order) {
        if (auto ordered = sessions_.check(part.file_name, part.part_number, part.total_parts, size.value());
            ordered.is_error()) {
            return Err<PartReceipt>(ordered.error());
        }
    }

    auto appended = io_.append(path, part.data);
    if (appended.is_error()) {
        return Err<PartReceipt>(appended.error());
    }

    sessions_.record(part.file_name, part.part_number, part.total_parts, appended.value());

    PartReceipt receipt;
    receipt.file_name = part.file_name;
    receipt.part_number = part.part_number;
    receipt.total_parts = part.total_parts;
    receipt.stored_size = appended.value();
    receipt.complete = part.part_number == part.total_parts;
    receipt.message = progress_message(part.part_number, part.total_parts);

    spdlog::debug("Appended {} bytes to {} (now {} bytes)", part.data.size(), part.file_name, receipt.stored_size);
    return Ok(std::move(receipt));
}

std::string UploadReconstructor::progress_message(std::uint32_t part_number, std::uint32_t total_parts) {
    if (part_number == total_parts) {
        return "Upload complete";
    }
    return "Part " + std::to_string(part_number) + "/" + std::to_string(total_parts) + " uploaded";
}

Result<std::uint64_t, Error> UploadReconstructor::current_size(const fs::path& path) const {
    auto size = storage::ChunkIoExecutor::stored_size(path);
    if (size.is_error() && size.error().kind == ErrorKind::NotFound) {
        return Ok(std::uint64_t{0});
    }
    return size;
}

} // namespace chunkd::transfer
