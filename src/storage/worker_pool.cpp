#include "chunkd/storage/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace chunkd::storage {

WorkerPool::WorkerPool(std::size_t threads)
    : size_(threads == 0 ? 1 : threads)
    , pool_(size_)
    , running_(true) {
    spdlog::debug("Disk I/O worker pool started with {} threads", size_);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::unique_lock lock(state_mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }

    // join() returns once every queued task has run
    pool_.join();
    spdlog::debug("Disk I/O worker pool drained");
}

} // namespace chunkd::storage
