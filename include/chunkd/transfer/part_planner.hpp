#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace chunkd::transfer {

/**
 * @brief Client-side splitter: turns a local file into ordered PartRequests
 *
 * total_parts = ceil(size / chunk_size), or 1 for an empty file. Every
 * payload is exactly chunk_size bytes except the last one. Emission starts
 * at @p start_index (0-based, as returned by a resume query) and stops at
 * the first sink error.
 */
class PartPlanner {
public:
    using Sink = std::function<Result<void, Error>(PartRequest&&)>;

    explicit PartPlanner(std::uint64_t chunk_size);

    /**
     * @return Number of parts handed to @p sink
     */
    Result<std::uint32_t, Error> split(const std::filesystem::path& source,
                                       const std::string& destination_name,
                                       std::uint64_t start_index,
                                       const Sink& sink) const;

    static std::uint32_t total_parts_for(std::uint64_t size, std::uint64_t chunk_size) noexcept;

private:
    std::uint64_t chunk_size_;
};

} // namespace chunkd::transfer
