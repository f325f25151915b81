#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/storage/chunk_io.hpp"
#include "chunkd/transfer/destination_locks.hpp"
#include "chunkd/transfer/part_validator.hpp"
#include "chunkd/transfer/session_tracker.hpp"
#include "chunkd/transfer/types.hpp"

namespace chunkd::transfer {

/**
 * @brief Rebuilds uploaded files by appending validated parts in order
 *
 * For one part, under the destination's lock:
 * 1. Resolve the name below the upload directory
 * 2. Read the current on-disk size (missing file counts as 0)
 * 3. PartValidator, then SessionTracker when strict ordering is on
 * 4. Append through the ChunkIoExecutor
 * 5. Record progress and build the receipt
 *
 * A rejected part never touches storage. A failed append is neither retried
 * nor rolled back; whatever prefix reached disk stays there and the upload
 * resumes from the resulting size.
 */
class UploadReconstructor {
public:
    UploadReconstructor(TransferConfig config, const storage::ChunkIoExecutor& io);

    Result<PartReceipt, Error> store(const PartRequest& part);

    const SessionTracker& sessions() const noexcept { return sessions_; }

    static std::string progress_message(std::uint32_t part_number, std::uint32_t total_parts);

private:
    Result<std::uint64_t, Error> current_size(const std::filesystem::path& path) const;

    TransferConfig config_;
    const storage::ChunkIoExecutor& io_;
    PartValidator validator_;
    SessionTracker sessions_;
    DestinationLocks locks_;
};

} // namespace chunkd::transfer
