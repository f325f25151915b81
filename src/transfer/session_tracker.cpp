#include "chunkd/transfer/session_tracker.hpp"

namespace chunkd::transfer {

SessionTracker::SessionTracker(std::uint64_t chunk_size, std::size_t max_entries)
    : chunk_size_(chunk_size)
    , max_entries_(max_entries == 0 ? 1 : max_entries) {
}

Result<void, Error> SessionTracker::check(const std::string& file_name,
                                          std::uint32_t part_number,
                                          std::uint32_t total_parts,
                                          std::uint64_t stored_size) const {
    const auto expected = expected_for(file_name, stored_size);

    if (expected.complete) {
        return Fail<void>(ErrorKind::Conflict, "Upload of " + file_name + " is already complete");
    }

    if (expected.total_parts != 0 && expected.total_parts != total_parts) {
        return Fail<void>(ErrorKind::Conflict,
                          "Total parts changed from " + std::to_string(expected.total_parts) +
                          " to " + std::to_string(total_parts));
    }

    if (part_number != expected.next_part) {
        return Fail<void>(ErrorKind::Conflict,
                          "Expected part " + std::to_string(expected.next_part) +
                          ", got part " + std::to_string(part_number));
    }

    return Ok();
}

void SessionTracker::record(const std::string& file_name,
                            std::uint32_t part_number,
                            std::uint32_t total_parts,
                            std::uint64_t stored_size) {
    UploadSession session;
    session.total_parts = total_parts;
    session.next_part = part_number + 1;
    session.stored_size = stored_size;
    session.complete = part_number == total_parts;

    std::lock_guard lock(mutex_);
    auto it = sessions_.find(file_name);
    if (it == sessions_.end()) {
        if (sessions_.size() >= max_entries_) {
            evict_one();
        }
        it = sessions_.emplace(file_name, Slot{}).first;
    }
    it->second.session = session;
    it->second.touched = ++clock_;
}

std::optional<UploadSession> SessionTracker::find(const std::string& file_name) const {
    std::lock_guard lock(mutex_);
    const auto it = sessions_.find(file_name);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.session;
}

std::size_t SessionTracker::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

UploadSession SessionTracker::expected_for(const std::string& file_name, std::uint64_t stored_size) const {
    {
        std::lock_guard lock(mutex_);
        const auto it = sessions_.find(file_name);
        if (it != sessions_.end() && it->second.session.stored_size == stored_size) {
            return it->second.session;
        }
    }
    return infer(stored_size);
}

void SessionTracker::evict_one() {
    auto victim = sessions_.end();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        if (victim == sessions_.end()) {
            victim = it;
            continue;
        }
        const bool it_complete = it->second.session.complete;
        const bool victim_complete = victim->second.session.complete;
        if (it_complete != victim_complete) {
            if (it_complete) {
                victim = it;
            }
        } else if (it->second.touched < victim->second.touched) {
            victim = it;
        }
    }
    if (victim != sessions_.end()) {
        sessions_.erase(victim);
    }
}

UploadSession SessionTracker::infer(std::uint64_t stored_size) const noexcept {
    UploadSession session;
    session.stored_size = stored_size;
    if (stored_size % chunk_size_ != 0) {
        session.complete = true;
    } else {
        session.next_part = static_cast<std::uint32_t>(stored_size / chunk_size_) + 1;
    }
    return session;
}

} // namespace chunkd::transfer
