#include "chunkd/transfer/download_streamer.hpp"

#include "chunkd/storage/name_guard.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace chunkd::transfer {
namespace fs = std::filesystem;

ChunkStream::ChunkStream(std::string file_name,
                         fs::path path,
                         std::uint64_t size,
                         std::uint64_t chunk_size,
                         const storage::ChunkIoExecutor& io,
                         FinishHook on_finish)
    : file_name_(std::move(file_name))
    , path_(std::move(path))
    , size_(size)
    , chunk_size_(chunk_size)
    , io_(&io)
    , on_finish_(std::move(on_finish)) {
}

ChunkStream::ChunkStream(ChunkStream&& other) noexcept
    : file_name_(std::move(other.file_name_))
    , path_(std::move(other.path_))
    , size_(other.size_)
    , chunk_size_(other.chunk_size_)
    , position_(other.position_)
    , finished_(std::exchange(other.finished_, true))
    , io_(other.io_)
    , on_finish_(std::move(other.on_finish_)) {
    other.on_finish_ = nullptr;
}

ChunkStream::~ChunkStream() {
    if (!finished_) {
        finish(false, "stream dropped before the last chunk");
    }
}

Result<std::optional<Chunk>, Error> ChunkStream::next() {
    if (finished_) {
        if (position_ < size_) {
            return Fail<std::optional<Chunk>>(ErrorKind::IoError, "Download stream was aborted");
        }
        return Ok(std::optional<Chunk>{});
    }

    if (position_ >= size_) {
        finish(true, {});
        return Ok(std::optional<Chunk>{});
    }

    const ChunkRange range{position_, std::min(chunk_size_, size_ - position_)};
    auto bytes = io_->read_range(path_, range);
    if (bytes.is_error()) {
        finish(false, bytes.error().detail);
        return Err<std::optional<Chunk>>(bytes.error());
    }

    if (bytes.value().size() != range.length) {
        spdlog::warn("{} shrank during download: wanted {} bytes at {}, got {}",
                     file_name_, range.length, range.offset, bytes.value().size());
        finish(false, "file truncated during download");
        return Fail<std::optional<Chunk>>(ErrorKind::IoError, "File changed during download");
    }

    position_ += range.length;
    if (position_ >= size_) {
        finish(true, {});
    }
    return Ok(std::optional<Chunk>(std::move(bytes.value())));
}

std::uint64_t ChunkStream::chunk_count() const noexcept {
    return (size_ + chunk_size_ - 1) / chunk_size_;
}

std::string ChunkStream::disposition() const {
    return attachment_disposition(file_name_);
}

void ChunkStream::finish(bool completed, std::string reason) {
    finished_ = true;
    if (!on_finish_) {
        return;
    }

    DownloadOutcome outcome;
    outcome.file_name = file_name_;
    outcome.size = size_;
    outcome.bytes_sent = position_;
    outcome.completed = completed;
    outcome.reason = std::move(reason);

    auto hook = std::move(on_finish_);
    on_finish_ = nullptr;
    hook(outcome);
}

DownloadStreamer::DownloadStreamer(TransferConfig config, const storage::ChunkIoExecutor& io)
    : config_(std::move(config))
    , io_(io) {
}

Result<ChunkStream, Error> DownloadStreamer::open(const std::string& file_name,
                                                  ChunkStream::FinishHook on_finish) const {
    auto destination = storage::resolve_destination(config_.upload_directory, file_name);
    if (destination.is_error()) {
        return Err<ChunkStream>(destination.error());
    }

    auto size = storage::ChunkIoExecutor::stored_size(destination.value());
    if (size.is_error()) {
        return Err<ChunkStream>(size.error());
    }

    return Ok(ChunkStream(file_name, std::move(destination.value()), size.value(),
                          config_.chunk_size, io_, std::move(on_finish)));
}

std::vector<ChunkRange> DownloadStreamer::plan(std::uint64_t size, std::uint64_t chunk_size) {
    std::vector<ChunkRange> ranges;
    if (chunk_size == 0) {
        return ranges;
    }
    for (std::uint64_t offset = 0; offset < size; offset += chunk_size) {
        ranges.push_back(ChunkRange{offset, std::min(chunk_size, size - offset)});
    }
    return ranges;
}

std::string attachment_disposition(const std::string& file_name) {
    std::string quoted;
    bool ascii = true;
    for (char c : file_name) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80) {
            ascii = false;
        }
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }

    std::string header = "attachment; filename=\"" + quoted + "\"";
    if (!ascii) {
        static const char* hex = "0123456789ABCDEF";
        std::string encoded;
        for (char c : file_name) {
            const auto byte = static_cast<unsigned char>(c);
            if (std::isalnum(byte) || c == '.' || c == '-' || c == '_' || c == '~') {
                encoded.push_back(c);
            } else {
                encoded.push_back('%');
                encoded.push_back(hex[byte >> 4]);
                encoded.push_back(hex[byte & 0x0F]);
            }
        }
        header += "; filename*=UTF-8''" + encoded;
    }
    return header;
}

} // namespace chunkd::transfer
