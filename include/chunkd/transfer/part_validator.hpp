#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/transfer/types.hpp"

#include <cstdint>

namespace chunkd::transfer {

/**
 * @brief Accept/reject decision for one part, taken before anything is written
 *
 * Rules, checked in this order:
 * 1. part_number >= 1, total_parts >= 1, part_number <= total_parts  (InvalidArgument)
 * 2. total_parts <= max_parts                                        (CountLimit)
 * 3. part length <= chunk_size                                       (PartTooLarge)
 * 4. a non-final part is exactly chunk_size bytes                    (MalformedPart)
 * 5. current size + part length <= max_file_size                     (QuotaExceeded)
 *
 * Pure function of its inputs; holds no state besides the limits.
 */
class PartValidator {
public:
    explicit PartValidator(const TransferConfig& config);

    Result<void, Error> validate(std::uint64_t part_length,
                                 std::uint32_t part_number,
                                 std::uint32_t total_parts,
                                 std::uint64_t current_size) const;

private:
    std::uint64_t chunk_size_;
    std::uint64_t max_file_size_;
    std::uint32_t max_parts_;
};

} // namespace chunkd::transfer
