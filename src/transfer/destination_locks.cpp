#include "chunkd/transfer/destination_locks.hpp"

#include <utility>

namespace chunkd::transfer {

DestinationLocks::Guard::Guard(DestinationLocks* owner, std::string name, Entry* entry)
    : owner_(owner)
    , name_(std::move(name))
    , entry_(entry) {
}

DestinationLocks::Guard::Guard(Guard&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr))
    , name_(std::move(other.name_))
    , entry_(std::exchange(other.entry_, nullptr)) {
}

DestinationLocks::Guard& DestinationLocks::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
        name_ = std::move(other.name_);
        entry_ = std::exchange(other.entry_, nullptr);
    }
    return *this;
}

DestinationLocks::Guard::~Guard() {
    release();
}

void DestinationLocks::Guard::release() {
    if (owner_ != nullptr && entry_ != nullptr) {
        owner_->release(name_, entry_);
    }
    owner_ = nullptr;
    entry_ = nullptr;
}

DestinationLocks::Guard DestinationLocks::acquire(const std::string& name) {
    Entry* entry = nullptr;
    {
        std::lock_guard lock(table_mutex_);
        auto& slot = entries_[name];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        ++slot->users;
        entry = slot.get();
    }

    // Wait outside the table lock so other names stay available
    entry->mutex.lock();
    return Guard(this, name, entry);
}

std::size_t DestinationLocks::active() const {
    std::lock_guard lock(table_mutex_);
    return entries_.size();
}

void DestinationLocks::release(const std::string& name, Entry* entry) {
    entry->mutex.unlock();

    std::lock_guard lock(table_mutex_);
    if (--entry->users == 0) {
        entries_.erase(name);
    }
}

} // namespace chunkd::transfer
