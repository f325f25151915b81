#include "chunkd/storage/chunk_io.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace chunkd::storage {
namespace fs = std::filesystem;

ChunkIoExecutor::ChunkIoExecutor(WorkerPool* pool)
    : pool_(pool) {
}

template<typename T, typename F>
Result<T, Error> ChunkIoExecutor::dispatch(F&& operation) const {
    if (pool_ == nullptr) {
        return operation();
    }

    auto submitted = pool_->submit(std::forward<F>(operation));
    if (submitted.is_error()) {
        spdlog::error("Disk I/O dispatch failed: {}", submitted.error());
        return Fail<T>(ErrorKind::IoError, "Storage is unavailable");
    }
    return submitted.value().get();
}

Result<std::uint64_t, Error> ChunkIoExecutor::append(const fs::path& path,
                                                     const std::vector<std::uint8_t>& data) const {
    return dispatch<std::uint64_t>([&path, &data]() { return append_blocking(path, data); });
}

Result<std::vector<std::uint8_t>, Error> ChunkIoExecutor::read_range(const fs::path& path,
                                                                    transfer::ChunkRange range) const {
    return dispatch<std::vector<std::uint8_t>>([&path, range]() { return read_range_blocking(path, range); });
}

Result<std::uint64_t, Error> ChunkIoExecutor::stored_size(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        spdlog::error("stat {} failed: {}", path.string(), ec.message());
        return Fail<std::uint64_t>(ErrorKind::IoError, "Failed to inspect stored file");
    }
    if (!fs::exists(status)) {
        return Fail<std::uint64_t>(ErrorKind::NotFound, "File not found");
    }
    if (!fs::is_regular_file(status)) {
        return Fail<std::uint64_t>(ErrorKind::NotFound, "File not found");
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        spdlog::error("file_size {} failed: {}", path.string(), ec.message());
        return Fail<std::uint64_t>(ErrorKind::IoError, "Failed to inspect stored file");
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<std::uint64_t, Error> ChunkIoExecutor::append_blocking(const fs::path& path,
                                                              const std::vector<std::uint8_t>& data) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        if (!out) {
            spdlog::error("Failed to open {} for append", path.string());
            return Fail<std::uint64_t>(ErrorKind::IoError, "Failed to open file for writing");
        }

        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            spdlog::error("Short write of {} bytes to {}", data.size(), path.string());
            return Fail<std::uint64_t>(ErrorKind::IoError, "Failed to write part");
        }
    }

    return stored_size(path);
}

Result<std::vector<std::uint8_t>, Error> ChunkIoExecutor::read_range_blocking(const fs::path& path,
                                                                             transfer::ChunkRange range) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open {} for reading", path.string());
        return Fail<std::vector<std::uint8_t>>(ErrorKind::IoError, "Failed to open file for reading");
    }

    in.seekg(static_cast<std::streamoff>(range.offset));
    if (!in) {
        spdlog::error("Seek to {} failed on {}", range.offset, path.string());
        return Fail<std::vector<std::uint8_t>>(ErrorKind::IoError, "Failed to read chunk");
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(range.length));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(range.length));
    if (in.bad()) {
        spdlog::error("Read of {} bytes at {} failed on {}", range.length, range.offset, path.string());
        return Fail<std::vector<std::uint8_t>>(ErrorKind::IoError, "Failed to read chunk");
    }

    buffer.resize(static_cast<std::size_t>(in.gcount()));
    return Ok(std::move(buffer));
}

} // namespace chunkd::storage
