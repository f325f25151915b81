#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/transfer/types.hpp"

#include <cstdint>
#include <string>

namespace chunkd::transfer {

/**
 * @brief Tells a client which chunk to send next
 *
 * chunk_index = floor(size / chunk_size). A missing file is reported as
 * NotFound instead of being treated as "start from 0".
 */
class ResumeCalculator {
public:
    explicit ResumeCalculator(TransferConfig config);

    Result<ResumePoint, Error> resume_point(const std::string& file_name) const;

    static std::uint64_t chunk_index_for(std::uint64_t stored_size, std::uint64_t chunk_size) noexcept {
        return stored_size / chunk_size;
    }

private:
    TransferConfig config_;
};

} // namespace chunkd::transfer
