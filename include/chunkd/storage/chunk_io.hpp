#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/storage/worker_pool.hpp"
#include "chunkd/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace chunkd::storage {

/**
 * @brief Executes single-chunk reads and appends against stored files
 *
 * Every call opens the file, performs one operation and closes it again;
 * no handle outlives a call. With a WorkerPool the blocking part runs on a
 * pool thread and the caller waits for it, without one it runs inline.
 */
class ChunkIoExecutor {
public:
    explicit ChunkIoExecutor(WorkerPool* pool = nullptr);

    /**
     * @brief Append @p data to @p path, creating the file if needed
     * @return File size after the append
     */
    Result<std::uint64_t, Error> append(const std::filesystem::path& path,
                                        const std::vector<std::uint8_t>& data) const;

    /**
     * @brief Read up to range.length bytes starting at range.offset
     *
     * The result is shorter than requested only when the file ends early.
     */
    Result<std::vector<std::uint8_t>, Error> read_range(const std::filesystem::path& path,
                                                        transfer::ChunkRange range) const;

    /// Current size of a stored file; NotFound if it does not exist
    static Result<std::uint64_t, Error> stored_size(const std::filesystem::path& path);

    bool offloads() const { return pool_ != nullptr; }

private:
    template<typename T, typename F>
    Result<T, Error> dispatch(F&& operation) const;

    static Result<std::uint64_t, Error> append_blocking(const std::filesystem::path& path,
                                                        const std::vector<std::uint8_t>& data);

    static Result<std::vector<std::uint8_t>, Error> read_range_blocking(const std::filesystem::path& path,
                                                                        transfer::ChunkRange range);

    WorkerPool* pool_;
};

} // namespace chunkd::storage
