#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/events/event_bus.hpp"
#include "chunkd/events/events.hpp"
#include "chunkd/storage/chunk_io.hpp"
#include "chunkd/storage/directory_index.hpp"
#include "chunkd/storage/worker_pool.hpp"
#include "chunkd/transfer/download_streamer.hpp"
#include "chunkd/transfer/resume_calculator.hpp"
#include "chunkd/transfer/types.hpp"
#include "chunkd/transfer/upload_reconstructor.hpp"

#include <string>
#include <vector>

namespace chunkd::transfer {

/**
 * @brief The five transfer operations behind one facade
 *
 * Wires the components to a shared ChunkIoExecutor and publishes an event
 * for every stored or rejected part and every finished download. The web
 * layer only ever talks to this class.
 *
 * The worker pool is borrowed; its owner shuts it down after the HTTP
 * server has stopped.
 */
class TransferService {
public:
    TransferService(TransferConfig config, events::EventBus& bus, storage::WorkerPool* pool = nullptr);

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    Result<PartReceipt, Error> upload_part(const PartRequest& part);

    /// Opens a lazy chunk sequence; events fire as the stream starts and ends
    Result<ChunkStream, Error> download_file(const std::string& file_name);

    Result<ResumePoint, Error> resume_point(const std::string& file_name) const;

    Result<std::vector<std::string>, Error> list_files() const;

    Result<std::vector<std::string>, Error> search_files(const std::string& query) const;

    const TransferConfig& config() const noexcept { return config_; }
    const SessionTracker& sessions() const noexcept { return reconstructor_.sessions(); }

private:
    void publish_download_outcome(const DownloadOutcome& outcome);

    TransferConfig config_;
    events::EventBus& event_bus_;
    storage::ChunkIoExecutor io_;
    UploadReconstructor reconstructor_;
    ResumeCalculator resume_;
    DownloadStreamer streamer_;
    storage::DirectoryIndex index_;
};

} // namespace chunkd::transfer
