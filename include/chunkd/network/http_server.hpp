#pragma once

#include "chunkd/core/bounded_queue.hpp"
#include "chunkd/core/result.hpp"
#include "chunkd/network/http_parser.hpp"
#include "chunkd/network/http_types.hpp"
#include "chunkd/network/socket.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace chunkd {
namespace network {

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Multi-threaded HTTP/1.1 server with a fixed worker pool
 *
 * Architecture:
 * - serve_forever() runs the accept loop on the calling thread
 * - Accepted connections go into a bounded queue; when it is full the
 *   acceptor answers 503 itself and closes the connection
 * - Worker threads pop connections, read one request, answer it and close
 *
 * Request bodies larger than max_body_size are answered with 413 without
 * being read. Streamed responses pull their first chunk before the status
 * line is sent, so a failure there still becomes a proper error response;
 * a later failure can only cut the connection short.
 *
 * stop() only flips a flag and shuts the listening socket down, so it may
 * be called from a signal handler. serve_forever() then drains the queue,
 * joins the workers and returns.
 *
 * Usage:
 * ```cpp
 * HttpServer server(8, 256);
 * server.set_handler([&router](const HttpRequest& req) { return router.handle_request(req); });
 * if (server.listen(8000).is_ok()) {
 *     server.serve_forever();
 * }
 * ```
 */
class HttpServer {
public:
    explicit HttpServer(size_t thread_pool_size = 8, size_t max_queue_size = 256);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    /// May be called concurrently from all worker threads
    void set_handler(HttpRequestHandler handler);

    /// Seconds a worker waits for the peer before giving up (0 = forever)
    void set_receive_timeout(int seconds) { receive_timeout_seconds_ = seconds; }

    void set_max_body_size(uint64_t bytes) { max_body_size_ = bytes; }

    /// Bind and listen; port 0 picks a free port (see get_port())
    Result<void> listen(uint16_t port, const std::string& address = "0.0.0.0");

    /// Blocking accept loop; returns after stop()
    Result<void> serve_forever();

    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    uint16_t get_port() const { return port_; }

    size_t get_active_connections() const { return active_connections_.load(std::memory_order_relaxed); }
    size_t get_total_processed() const { return total_processed_.load(std::memory_order_relaxed); }
    size_t get_total_rejected() const { return total_rejected_.load(std::memory_order_relaxed); }

private:
    void worker_thread();

    Result<void> handle_connection(Socket& client);

    /// Reads one request; body_too_large is reported through the parser
    Result<void> read_request(Socket& socket, HttpParser& parser);

    Result<void> send_response(Socket& socket, HttpResponse& response);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    Socket listener_;
    HttpRequestHandler handler_;
    uint16_t port_;

    std::vector<std::thread> worker_threads_;
    size_t thread_pool_size_;
    BoundedQueue<std::unique_ptr<Socket>> connections_;

    int receive_timeout_seconds_;
    uint64_t max_body_size_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<size_t> active_connections_;
    std::atomic<size_t> total_processed_;
    std::atomic<size_t> total_rejected_;
};

} // namespace network
} // namespace chunkd
