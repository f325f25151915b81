#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkd::transfer {

/**
 * @brief One exclusive lock per destination name
 *
 * Appends to the same file are serialized; appends to different files never
 * contend. An entry lives only while someone holds or waits for it.
 *
 * Usage:
 * @code
 * DestinationLocks locks;
 * {
 *     auto guard = locks.acquire("report.pdf");
 *     // read size, validate, append
 * }   // released here, on every exit path
 * @endcode
 */
class DestinationLocks {
    struct Entry {
        std::mutex mutex;
        std::size_t users = 0;   ///< holders plus waiters
    };

public:
    /**
     * @brief Scoped ownership of one destination's lock
     */
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        const std::string& name() const noexcept { return name_; }

    private:
        friend class DestinationLocks;
        Guard(DestinationLocks* owner, std::string name, Entry* entry);

        void release();

        DestinationLocks* owner_;
        std::string name_;
        Entry* entry_;
    };

    DestinationLocks() = default;

    DestinationLocks(const DestinationLocks&) = delete;
    DestinationLocks& operator=(const DestinationLocks&) = delete;

    /// Block until the lock for @p name is free, then take it
    Guard acquire(const std::string& name);

    /// Number of names currently held or waited on
    std::size_t active() const;

private:
    void release(const std::string& name, Entry* entry);

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace chunkd::transfer
