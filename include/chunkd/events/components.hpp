/**
 * @file components.hpp
 * @brief Event-driven observers of the transfer service
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // ... serve requests ...
 * metrics.print_stats();
 */

#pragma once

#include "chunkd/events/event_bus.hpp"
#include "chunkd/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunkd::events {

/**
 * @brief Logs every transfer event through spdlog
 *
 * Per-part traffic goes to debug, lifecycle events to info, rejections
 * and aborted downloads to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<PartStoredEvent>([this](const PartStoredEvent& e) {
            on_part_stored(e);
        });

        bus_.subscribe<PartRejectedEvent>([this](const PartRejectedEvent& e) {
            on_part_rejected(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<DownloadStartedEvent>([this](const DownloadStartedEvent& e) {
            on_download_started(e);
        });

        bus_.subscribe<DownloadCompletedEvent>([this](const DownloadCompletedEvent& e) {
            on_download_completed(e);
        });

        bus_.subscribe<DownloadAbortedEvent>([this](const DownloadAbortedEvent& e) {
            on_download_aborted(e);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_part_stored(const PartStoredEvent& e) {
        spdlog::debug("[PartStored] file={} part={}/{} bytes={} stored={}",
                      e.file_name, e.part_number, e.total_parts, e.bytes, e.stored_size);
    }

    void on_part_rejected(const PartRejectedEvent& e) {
        spdlog::warn("[PartRejected] file={} part={}/{} error={} detail={}",
                     e.file_name, e.part_number, e.total_parts,
                     to_string(e.error.kind), e.error.detail);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] file={} parts={} bytes={}", e.file_name, e.total_parts, e.size);
    }

    void on_download_started(const DownloadStartedEvent& e) {
        spdlog::debug("[DownloadStarted] file={} bytes={}", e.file_name, e.size);
    }

    void on_download_completed(const DownloadCompletedEvent& e) {
        spdlog::info("[DownloadCompleted] file={} bytes={}", e.file_name, e.bytes);
    }

    void on_download_aborted(const DownloadAbortedEvent& e) {
        spdlog::warn("[DownloadAborted] file={} sent={}/{} reason={}",
                     e.file_name, e.bytes_sent, e.size, e.reason);
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("chunkd listening on port {}", e.port);
        spdlog::info("Storing uploads in {}", e.upload_directory);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Counts parts, uploads and downloads for the shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> parts_stored{0};
        std::atomic<uint64_t> parts_rejected{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> downloads_started{0};
        std::atomic<uint64_t> downloads_completed{0};
        std::atomic<uint64_t> downloads_aborted{0};
        std::atomic<uint64_t> bytes_downloaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<PartStoredEvent>([this](const PartStoredEvent& e) {
            stats_.parts_stored++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<PartRejectedEvent>([this](const PartRejectedEvent&) {
            stats_.parts_rejected++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<DownloadStartedEvent>([this](const DownloadStartedEvent&) {
            stats_.downloads_started++;
        });

        bus_.subscribe<DownloadCompletedEvent>([this](const DownloadCompletedEvent& e) {
            stats_.downloads_completed++;
            stats_.bytes_downloaded += e.bytes;
        });

        bus_.subscribe<DownloadAbortedEvent>([this](const DownloadAbortedEvent& e) {
            stats_.downloads_aborted++;
            stats_.bytes_downloaded += e.bytes_sent;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Parts stored:        {}", stats_.parts_stored.load());
        spdlog::info("  Parts rejected:      {}", stats_.parts_rejected.load());
        spdlog::info("  Bytes uploaded:      {}", stats_.bytes_uploaded.load());
        spdlog::info("  Uploads completed:   {}", stats_.uploads_completed.load());
        spdlog::info("  Downloads started:   {}", stats_.downloads_started.load());
        spdlog::info("  Downloads completed: {}", stats_.downloads_completed.load());
        spdlog::info("  Downloads aborted:   {}", stats_.downloads_aborted.load());
        spdlog::info("  Bytes downloaded:    {}", stats_.bytes_downloaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace chunkd::events
