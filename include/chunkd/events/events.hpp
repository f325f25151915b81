/**
 * @file events.hpp
 * @brief Event types emitted by the transfer service and the server
 *
 * NAMING CONVENTION:
 * Events are past-tense: PartStoredEvent, DownloadAbortedEvent
 */

#pragma once

#include "chunkd/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkd::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after a part has been appended to its destination
 *
 * WHO EMITS: TransferService::upload_part
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct PartStoredEvent {
    std::string file_name;
    uint32_t part_number;
    uint32_t total_parts;
    uint64_t bytes;         // size of this part
    uint64_t stored_size;   // file size after the append
    std::chrono::system_clock::time_point timestamp;

    PartStoredEvent(std::string name, uint32_t part, uint32_t total, uint64_t b, uint64_t stored)
        : file_name(std::move(name)),
          part_number(part),
          total_parts(total),
          bytes(b),
          stored_size(stored),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when a part is refused; nothing was written
 */
struct PartRejectedEvent {
    std::string file_name;
    uint32_t part_number;
    uint32_t total_parts;
    Error error;
    std::chrono::system_clock::time_point timestamp;

    PartRejectedEvent(std::string name, uint32_t part, uint32_t total, Error err)
        : file_name(std::move(name)),
          part_number(part),
          total_parts(total),
          error(std::move(err)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted once the final part of an upload has been stored
 */
struct UploadCompletedEvent {
    std::string file_name;
    uint32_t total_parts;
    uint64_t size;
    std::chrono::system_clock::time_point timestamp;

    UploadCompletedEvent(std::string name, uint32_t total, uint64_t s)
        : file_name(std::move(name)),
          total_parts(total),
          size(s),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Download Events
// ════════════════════════════════════════════════════════

struct DownloadStartedEvent {
    std::string file_name;
    uint64_t size;
    std::chrono::system_clock::time_point timestamp;

    DownloadStartedEvent(std::string name, uint64_t s)
        : file_name(std::move(name)),
          size(s),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct DownloadCompletedEvent {
    std::string file_name;
    uint64_t bytes;
    std::chrono::system_clock::time_point timestamp;

    DownloadCompletedEvent(std::string name, uint64_t b)
        : file_name(std::move(name)),
          bytes(b),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when a download stops before the last byte
 *
 * Either a chunk read failed or the stream was dropped early (client gone).
 */
struct DownloadAbortedEvent {
    std::string file_name;
    uint64_t bytes_sent;
    uint64_t size;
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    DownloadAbortedEvent(std::string name, uint64_t sent, uint64_t s, std::string why)
        : file_name(std::move(name)),
          bytes_sent(sent),
          size(s),
          reason(std::move(why)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the server starts listening
 *
 * WHO EMITS: main() startup
 */
struct ServerStartedEvent {
    uint16_t port;
    std::string upload_directory;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(uint16_t p, std::string dir)
        : port(p),
          upload_directory(std::move(dir)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when the server is shutting down
 *
 * WHO EMITS: main() shutdown
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace chunkd::events
