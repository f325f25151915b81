#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/storage/chunk_io.hpp"
#include "chunkd/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chunkd::transfer {

using Chunk = std::vector<std::uint8_t>;

/**
 * @brief How a download stream ended
 */
struct DownloadOutcome {
    std::string file_name;
    std::uint64_t size = 0;
    std::uint64_t bytes_sent = 0;
    bool completed = false;
    std::string reason;   ///< empty when completed
};

/**
 * @brief Lazy, finite, ordered sequence of chunks covering [0, size)
 *
 * Every next() performs its own open-seek-read-close; no handle is kept
 * between calls. The stream is not restartable. If it is dropped before
 * the end the finish hook reports it as aborted.
 */
class ChunkStream {
public:
    using FinishHook = std::function<void(const DownloadOutcome&)>;

    ChunkStream(std::string file_name,
                std::filesystem::path path,
                std::uint64_t size,
                std::uint64_t chunk_size,
                const storage::ChunkIoExecutor& io,
                FinishHook on_finish = {});
    ~ChunkStream();

    ChunkStream(ChunkStream&& other) noexcept;
    ChunkStream& operator=(ChunkStream&& other) = delete;
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    /**
     * @brief Produce the next chunk
     * @return std::nullopt once every byte has been produced; IoError if the
     *         file can no longer supply the bytes it had at open time
     */
    Result<std::optional<Chunk>, Error> next();

    const std::string& file_name() const noexcept { return file_name_; }
    std::uint64_t size() const noexcept { return size_; }
    std::uint64_t position() const noexcept { return position_; }
    std::uint64_t chunk_count() const noexcept;
    bool finished() const noexcept { return finished_; }

    /// Content-Disposition value suggesting the stored name as save-as name
    std::string disposition() const;

private:
    void finish(bool completed, std::string reason);

    std::string file_name_;
    std::filesystem::path path_;
    std::uint64_t size_;
    std::uint64_t chunk_size_;
    std::uint64_t position_ = 0;
    bool finished_ = false;
    const storage::ChunkIoExecutor* io_;
    FinishHook on_finish_;
};

/**
 * @brief Opens stored files as ChunkStreams
 */
class DownloadStreamer {
public:
    DownloadStreamer(TransferConfig config, const storage::ChunkIoExecutor& io);

    /// NotFound if the file does not exist
    Result<ChunkStream, Error> open(const std::string& file_name,
                                    ChunkStream::FinishHook on_finish = {}) const;

    /// Fixed windows covering [0, size); the last one may be shorter
    static std::vector<ChunkRange> plan(std::uint64_t size, std::uint64_t chunk_size);

private:
    TransferConfig config_;
    const storage::ChunkIoExecutor& io_;
};

/**
 * @brief attachment; filename="..." with quotes and backslashes escaped
 *
 * Non-ASCII names additionally get an RFC 5987 filename* parameter.
 */
std::string attachment_disposition(const std::string& file_name);

} // namespace chunkd::transfer
