#include "chunkd/transfer/service.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace chunkd::transfer {
namespace fs = std::filesystem;

TransferService::TransferService(TransferConfig config, events::EventBus& bus, storage::WorkerPool* pool)
    : config_(std::move(config)),
      event_bus_(bus),
      io_(config_.offload_io ? pool : nullptr),
      reconstructor_(config_, io_),
      resume_(config_),
      streamer_(config_, io_),
      index_(config_.upload_directory) {

    std::error_code ec;
    fs::create_directories(config_.upload_directory, ec);
    if (ec) {
        spdlog::error("Cannot create upload directory {}: {}", config_.upload_directory.string(), ec.message());
    }
}

Result<PartReceipt, Error> TransferService::upload_part(const PartRequest& part) {
    auto stored = reconstructor_.store(part);
    if (stored.is_error()) {
        event_bus_.emit(events::PartRejectedEvent{part.file_name, part.part_number, part.total_parts, stored.error()});
        return stored;
    }

    const auto& receipt = stored.value();
    event_bus_.emit(events::PartStoredEvent{receipt.file_name, receipt.part_number, receipt.total_parts,
                                            part.data.size(), receipt.stored_size});
    if (receipt.complete) {
        event_bus_.emit(events::UploadCompletedEvent{receipt.file_name, receipt.total_parts, receipt.stored_size});
    }
    return stored;
}

Result<ChunkStream, Error> TransferService::download_file(const std::string& file_name) {
    auto stream = streamer_.open(file_name, [this](const DownloadOutcome& outcome) {
        publish_download_outcome(outcome);
    });
    if (stream.is_error()) {
        return stream;
    }

    event_bus_.emit(events::DownloadStartedEvent{file_name, stream.value().size()});
    return stream;
}

Result<ResumePoint, Error> TransferService::resume_point(const std::string& file_name) const {
    return resume_.resume_point(file_name);
}

Result<std::vector<std::string>, Error> TransferService::list_files() const {
    return index_.list();
}

Result<std::vector<std::string>, Error> TransferService::search_files(const std::string& query) const {
    return index_.search(query);
}

void TransferService::publish_download_outcome(const DownloadOutcome& outcome) {
    if (outcome.completed) {
        event_bus_.emit(events::DownloadCompletedEvent{outcome.file_name, outcome.bytes_sent});
    } else {
        event_bus_.emit(events::DownloadAbortedEvent{outcome.file_name, outcome.bytes_sent,
                                                     outcome.size, outcome.reason});
    }
}

} // namespace chunkd::transfer
