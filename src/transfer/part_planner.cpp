#include "chunkd/transfer/part_planner.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace chunkd::transfer {
namespace fs = std::filesystem;

PartPlanner::PartPlanner(std::uint64_t chunk_size)
    : chunk_size_(chunk_size) {
}

std::uint32_t PartPlanner::total_parts_for(std::uint64_t size, std::uint64_t chunk_size) noexcept {
    if (size == 0) {
        return 1;
    }
    return static_cast<std::uint32_t>((size + chunk_size - 1) / chunk_size);
}

Result<std::uint32_t, Error> PartPlanner::split(const fs::path& source,
                                                const std::string& destination_name,
                                                std::uint64_t start_index,
                                                const Sink& sink) const {
    if (chunk_size_ == 0) {
        return Fail<std::uint32_t>(ErrorKind::InvalidArgument, "chunk_size must be > 0");
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Fail<std::uint32_t>(ErrorKind::NotFound, "Source file not found: " + source.filename().string());
    }

    const auto file_size = fs::file_size(source, ec);
    if (ec) {
        return Fail<std::uint32_t>(ErrorKind::IoError, "Failed to read size of " + source.filename().string());
    }

    const std::uint32_t total_parts = total_parts_for(file_size, chunk_size_);
    if (start_index >= total_parts) {
        return Fail<std::uint32_t>(ErrorKind::InvalidArgument,
                                   "Start chunk " + std::to_string(start_index) +
                                   " is beyond the last part (" + std::to_string(total_parts) + " parts)");
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Fail<std::uint32_t>(ErrorKind::IoError, "Failed to open " + source.filename().string());
    }

    input.seekg(static_cast<std::streamoff>(start_index * chunk_size_));
    if (!input) {
        return Fail<std::uint32_t>(ErrorKind::IoError, "Failed to seek in " + source.filename().string());
    }

    std::uint32_t emitted = 0;
    for (std::uint64_t index = start_index; index < total_parts; ++index) {
        const std::uint64_t offset = index * chunk_size_;
        const std::uint64_t length = file_size > offset ? std::min(chunk_size_, file_size - offset) : 0;

        PartRequest part;
        part.file_name = destination_name;
        part.part_number = static_cast<std::uint32_t>(index + 1);
        part.total_parts = total_parts;
        part.data.resize(static_cast<std::size_t>(length));

        input.read(reinterpret_cast<char*>(part.data.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(input.gcount()) != length) {
            return Fail<std::uint32_t>(ErrorKind::IoError, "Source file changed while splitting");
        }

        auto result = sink(std::move(part));
        if (result.is_error()) {
            return Err<std::uint32_t>(result.error());
        }
        ++emitted;
    }

    return Ok(emitted);
}

} // namespace chunkd::transfer
