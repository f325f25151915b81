#include "chunkd/transfer/resume_calculator.hpp"

#include "chunkd/storage/chunk_io.hpp"
#include "chunkd/storage/name_guard.hpp"

namespace chunkd::transfer {

ResumeCalculator::ResumeCalculator(TransferConfig config)
    : config_(std::move(config)) {
}

Result<ResumePoint, Error> ResumeCalculator::resume_point(const std::string& file_name) const {
    auto destination = storage::resolve_destination(config_.upload_directory, file_name);
    if (destination.is_error()) {
        return Err<ResumePoint>(destination.error());
    }

    auto size = storage::ChunkIoExecutor::stored_size(destination.value());
    if (size.is_error()) {
        if (size.error().kind == ErrorKind::NotFound) {
            return Fail<ResumePoint>(ErrorKind::NotFound, "File not found");
        }
        return Err<ResumePoint>(size.error());
    }

    ResumePoint point;
    point.file_name = file_name;
    point.stored_size = size.value();
    point.chunk_index = chunk_index_for(point.stored_size, config_.chunk_size);
    point.message = "Resume from chunk " + std::to_string(point.chunk_index);
    return Ok(std::move(point));
}

} // namespace chunkd::transfer
