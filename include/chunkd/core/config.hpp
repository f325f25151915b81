#pragma once

#include "chunkd/core/result.hpp"
#include "chunkd/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkd {

/**
 * @brief Complete runtime configuration of chunkd_server
 *
 * Sources, lowest to highest precedence:
 * 1. Built-in defaults (below)
 * 2. JSON file passed with --config
 * 3. Command-line flags
 *
 * Example JSON:
 * @code
 * {
 *   "upload_directory": "/var/lib/chunkd",
 *   "chunk_size": 1048576,
 *   "max_file_size": 104857600,
 *   "max_parts": 100,
 *   "worker_pool_size": 5,
 *   "port": 8000,
 *   "log_level": "debug"
 * }
 * @endcode
 */
struct ServerConfig {
    transfer::TransferConfig transfer;

    std::string host = "0.0.0.0";
    std::uint16_t port = 8000;
    std::size_t http_threads = 8;
    std::size_t max_pending_connections = 256;
    int io_timeout_seconds = 30;
    std::string log_level = "info";

    /// Largest request body the HTTP layer buffers (one part plus form overhead)
    std::size_t max_request_body() const {
        return static_cast<std::size_t>(transfer.chunk_size) + 64 * 1024;
    }

    /// Check value ranges; returns a description of the first problem found
    Result<void> validate() const;
};

/**
 * @brief Merge a JSON configuration file into @p config
 *
 * Keys that are absent keep their current value. Unknown keys are logged and
 * ignored; a key with the wrong JSON type is an error.
 */
Result<void> load_config_file(const std::filesystem::path& path, ServerConfig& config);

/**
 * @brief Apply command-line flags on top of @p config
 *
 * Recognizes --config before any other flag so that flags always win over
 * the file. Returns an error for unknown flags or malformed values.
 * Sets @p show_help when -h/--help is present.
 */
Result<void> apply_command_line(int argc, char* argv[], ServerConfig& config, bool& show_help);

/// Usage text printed for --help
std::string usage(const std::string& program);

} // namespace chunkd
