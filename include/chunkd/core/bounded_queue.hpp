/**
 * @file bounded_queue.hpp
 * @brief Thread-safe FIFO queue with a fixed capacity
 *
 * Producers never block: try_push() refuses the item when the queue is
 * full so the caller can shed load (the HTTP acceptor answers 503).
 * Consumers block in pop() until an item arrives or shutdown() is called.
 *
 * EXAMPLE:
 * BoundedQueue<Connection> queue(256);
 * if (!queue.try_push(conn)) { reject(conn); }   // Producer
 * auto next = queue.pop();                       // Consumer
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace chunkd {

template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push unless full or shut down
     *
     * RETURNS: false if the item was refused (it is left untouched)
     */
    bool try_push(T& item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Pop item (blocking)
     *
     * After shutdown() the remaining items are still handed out; nullopt
     * only once the queue is both shut down and empty.
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Refuse further pushes and wake every waiting consumer
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::unique_lock lock(mutex_);
        shutdown_ = false;
    }

private:
    std::queue<T> queue_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace chunkd
