#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkd::transfer {

/**
 * @brief Limits and storage location shared by every transfer component
 *
 * Built once at startup and handed to each component by value.
 */
struct TransferConfig {
    std::filesystem::path upload_directory = "uploads";
    std::uint64_t chunk_size = 1024 * 1024;            ///< bytes per part / per download window
    std::uint64_t max_file_size = 100 * 1024 * 1024;   ///< cumulative limit per stored file
    std::uint32_t max_parts = 100;                     ///< upper bound for declared total_parts
    std::size_t worker_pool_size = 5;                  ///< threads for blocking disk I/O
    bool offload_io = true;                            ///< dispatch disk I/O to the worker pool
    bool strict_part_order = true;                     ///< reject duplicate/out-of-order parts
};

/**
 * @brief One uploaded part as handed over by the web layer
 */
struct PartRequest {
    std::string file_name;
    std::vector<std::uint8_t> data;
    std::uint32_t part_number = 0;   ///< 1-based
    std::uint32_t total_parts = 0;   ///< declared by the client
};

/**
 * @brief Outcome of a stored part
 */
struct PartReceipt {
    std::string file_name;
    std::uint32_t part_number = 0;
    std::uint32_t total_parts = 0;
    std::uint64_t stored_size = 0;   ///< on-disk size after the append
    bool complete = false;
    std::string message;             ///< "Upload complete" or "Part i/n uploaded"
};

struct ResumePoint {
    std::string file_name;
    std::uint64_t stored_size = 0;
    std::uint64_t chunk_index = 0;   ///< next chunk the client should send (0-based)
    std::string message;
};

/**
 * @brief A window inside a stored file
 */
struct ChunkRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    bool operator==(const ChunkRange& other) const {
        return offset == other.offset && length == other.length;
    }
};

} // namespace chunkd::transfer
