#pragma once

#include "chunkd/core/error.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunkd::transfer {

/**
 * @brief Progress of one upload as the server last saw it
 */
struct UploadSession {
    std::uint32_t total_parts = 0;   ///< 0 while unknown (rebuilt from disk)
    std::uint32_t next_part = 1;
    std::uint64_t stored_size = 0;
    bool complete = false;
};

/**
 * @brief In-memory registry enforcing in-order, non-duplicated parts
 *
 * An entry is trusted only while its stored_size matches the size on disk.
 * Otherwise (restart, file replaced by hand) the expectation is rebuilt
 * from the size alone:
 * - size 0                        -> next part is 1
 * - size a multiple of chunk_size -> next part is size / chunk_size + 1
 * - anything else                 -> a short final part was stored, upload complete
 *
 * The table holds at most max_entries names. When a new name arrives at a
 * full table, the least recently updated completed upload is dropped first,
 * and only if none is complete the least recently updated upload in progress.
 * A dropped name falls back to the rebuild above; a completed upload whose
 * size is a multiple of chunk_size then looks resumable again.
 *
 * Callers hold the destination lock around check() and record().
 */
class SessionTracker {
public:
    static constexpr std::size_t kDefaultMaxEntries = 4096;

    explicit SessionTracker(std::uint64_t chunk_size, std::size_t max_entries = kDefaultMaxEntries);

    /**
     * @brief Accept or refuse a part given the current on-disk size
     * @return Conflict for a duplicate, a gap, a changed total or a finished upload
     */
    Result<void, Error> check(const std::string& file_name,
                              std::uint32_t part_number,
                              std::uint32_t total_parts,
                              std::uint64_t stored_size) const;

    /// Remember a stored part; stored_size is the size after the append
    void record(const std::string& file_name,
                std::uint32_t part_number,
                std::uint32_t total_parts,
                std::uint64_t stored_size);

    [[nodiscard]] std::optional<UploadSession> find(const std::string& file_name) const;
    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] UploadSession expected_for(const std::string& file_name, std::uint64_t stored_size) const;
    [[nodiscard]] UploadSession infer(std::uint64_t stored_size) const noexcept;

    // Caller holds mutex_
    void evict_one();

    struct Slot {
        UploadSession session;
        std::uint64_t touched = 0;   ///< value of clock_ at the last record()
    };

    std::uint64_t chunk_size_;
    std::size_t max_entries_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> sessions_;
    std::uint64_t clock_ = 0;
};

} // namespace chunkd::transfer
