#pragma once

#include "chunkd/core/result.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <shared_mutex>
#include <type_traits>

namespace chunkd::storage {

/**
 * @brief Fixed-size pool of threads for blocking disk I/O
 *
 * Request handlers submit one chunk read or write at a time and wait on the
 * returned future, so the number of concurrently open files is bounded by
 * the pool size rather than by the number of in-flight requests.
 *
 * Lifecycle:
 * - Threads start in the constructor
 * - shutdown() refuses new work, runs everything already queued and joins
 * - The destructor calls shutdown()
 *
 * The pool gives no ordering guarantee between tasks; callers that need
 * ordering for one file serialize on their own (see DestinationLocks).
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task and get a future for its result
     *
     * @return Error once shutdown() has been called
     */
    template<typename F>
    Result<std::future<std::invoke_result_t<std::decay_t<F>>>> submit(F&& task) {
        using R = std::invoke_result_t<std::decay_t<F>>;

        std::shared_lock lock(state_mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return Err<std::future<R>>(std::string("Worker pool is shut down"));
        }

        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        boost::asio::post(pool_, [packaged]() { (*packaged)(); });
        return Ok(std::move(future));
    }

    /// Stop accepting work, drain the queue and join all threads
    void shutdown();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    std::size_t size() const { return size_; }

private:
    std::size_t size_;
    boost::asio::thread_pool pool_;
    std::atomic<bool> running_;
    std::shared_mutex state_mutex_;
};

} // namespace chunkd::storage
