#include "chunkd/network/http_server.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace chunkd {
namespace network {

namespace {

constexpr size_t kReceiveBufferSize = 64 * 1024;

const char* status_kind(HttpStatus status) {
    switch (status) {
        case HttpStatus::BAD_REQUEST: return "bad-request";
        case HttpStatus::PAYLOAD_TOO_LARGE: return "payload-too-large";
        case HttpStatus::SERVICE_UNAVAILABLE: return "service-unavailable";
        default: return "internal-error";
    }
}

} // namespace

HttpServer::HttpServer(size_t thread_pool_size, size_t max_queue_size)
    : port_(0)
    , thread_pool_size_(std::max<size_t>(1, thread_pool_size))
    , connections_(std::max<size_t>(1, max_queue_size))
    , receive_timeout_seconds_(30)
    , max_body_size_(std::numeric_limits<uint64_t>::max())
    , running_(false)
    , stop_requested_(false)
    , active_connections_(0)
    , total_processed_(0)
    , total_rejected_(0) {
}

HttpServer::~HttpServer() {
    stop();
    connections_.shutdown();
    for (auto& worker : worker_threads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void HttpServer::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

Result<void> HttpServer::listen(uint16_t port, const std::string& address) {
    auto create_result = listener_.create();
    if (create_result.is_error()) {
        return Err<void>("Failed to create listener socket: " + create_result.error());
    }

    auto reuse_result = listener_.set_reuse_address(true);
    if (reuse_result.is_error()) {
        spdlog::warn("Failed to set SO_REUSEADDR: {}", reuse_result.error());
    }

    auto bind_result = listener_.bind(address, port);
    if (bind_result.is_error()) {
        return Err<void>(bind_result.error());
    }

    auto listen_result = listener_.listen(128);
    if (listen_result.is_error()) {
        return Err<void>(listen_result.error());
    }

    auto bound_port = listener_.local_port();
    port_ = bound_port.is_ok() ? bound_port.value() : port;

    spdlog::info("HTTP server listening on {}:{}", address, port_);
    return Ok();
}

Result<void> HttpServer::serve_forever() {
    if (!listener_.is_valid()) {
        return Err<void>(std::string("Server not initialized. Call listen() first."));
    }
    if (!handler_) {
        return Err<void>(std::string("No request handler set. Call set_handler() first."));
    }

    running_.store(true, std::memory_order_release);
    connections_.reset();

    worker_threads_.reserve(thread_pool_size_);
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&HttpServer::worker_thread, this);
    }
    spdlog::info("Serving with {} worker threads (queue limit {})", thread_pool_size_, connections_.capacity());

    while (!stop_requested_.load(std::memory_order_acquire)) {
        auto accept_result = listener_.accept();
        if (accept_result.is_error()) {
            if (stop_requested_.load(std::memory_order_acquire)) {
                break;
            }
            spdlog::error("{}", accept_result.error());
            continue;
        }

        auto client = std::move(accept_result.value());
        if (!connections_.try_push(client)) {
            total_rejected_++;
            spdlog::warn("Connection queue full, answering 503");
            auto response = create_error_response(HttpStatus::SERVICE_UNAVAILABLE, "Server is busy, retry later");
            auto sent = send_response(*client, response);
            if (sent.is_error()) {
                spdlog::debug("Failed to send 503: {}", sent.error());
            }
            client->close();
        }
    }

    // Workers finish what is already queued, then exit
    connections_.shutdown();
    for (auto& worker : worker_threads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    worker_threads_.clear();
    listener_.close();

    running_.store(false, std::memory_order_release);
    spdlog::info("Server stopped ({} requests processed, {} rejected)",
                 total_processed_.load(), total_rejected_.load());
    return Ok();
}

void HttpServer::stop() {
    if (!stop_requested_.exchange(true)) {
        listener_.shutdown();
    }
}

void HttpServer::worker_thread() {
    while (auto client = connections_.pop()) {
        active_connections_++;
        auto result = handle_connection(**client);
        if (result.is_error()) {
            spdlog::debug("Connection ended with error: {}", result.error());
        }
        (*client)->close();
        active_connections_--;
        total_processed_++;
    }
}

Result<void> HttpServer::handle_connection(Socket& client) {
    if (receive_timeout_seconds_ > 0) {
        auto timeout = client.set_receive_timeout(receive_timeout_seconds_);
        if (timeout.is_error()) {
            spdlog::warn("{}", timeout.error());
        }
    }

    HttpParser parser(max_body_size_);
    auto read_result = read_request(client, parser);
    if (read_result.is_error()) {
        if (read_result.error() == "Client closed connection") {
            return read_result;
        }
        auto response = create_error_response(HttpStatus::BAD_REQUEST, read_result.error());
        auto sent = send_response(client, response);
        if (sent.is_error()) {
            spdlog::debug("Failed to send 400: {}", sent.error());
        }
        return read_result;
    }

    if (parser.body_too_large()) {
        spdlog::warn("Rejected request body of {} bytes (limit {})", parser.content_length(), max_body_size_);
        auto response = create_error_response(HttpStatus::PAYLOAD_TOO_LARGE,
                                              "Request body exceeds " + std::to_string(max_body_size_) + " bytes");
        return send_response(client, response);
    }

    HttpRequest request = parser.take_request();
    spdlog::info("{} {}", HttpMethodUtils::to_string(request.method), request.url);

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }

    return send_response(client, response);
}

Result<void> HttpServer::read_request(Socket& socket, HttpParser& parser) {
    bool continue_sent = false;

    while (!parser.is_complete()) {
        auto recv_result = socket.receive(kReceiveBufferSize);
        if (recv_result.is_error()) {
            return Err<void>(recv_result.error());
        }

        const auto& data = recv_result.value();
        if (data.empty()) {
            return Err<void>(std::string("Client closed connection"));
        }

        auto parse_result = parser.parse(reinterpret_cast<const char*>(data.data()), data.size());
        if (parse_result.is_error()) {
            return Err<void>(parse_result.error());
        }

        if (!continue_sent && parser.expects_continue()) {
            static const std::string kContinue = "HTTP/1.1 100 Continue\r\n\r\n";
            auto sent = socket.send_all(reinterpret_cast<const uint8_t*>(kContinue.data()), kContinue.size());
            if (sent.is_error()) {
                return sent;
            }
            continue_sent = true;
        }
    }

    return Ok();
}

Result<void> HttpServer::send_response(Socket& socket, HttpResponse& response) {
    response.set_header("Connection", "close");

    if (!response.is_streamed()) {
        return socket.send_all(response.serialize());
    }

    std::vector<uint8_t> chunk;
    auto first = response.body_source(chunk);
    if (first.is_error()) {
        spdlog::error("Response body failed before headers were sent: {}", first.error());
        auto error_response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Failed to read file");
        error_response.set_header("Connection", "close");
        return socket.send_all(error_response.serialize());
    }

    if (auto head = socket.send_all(response.serialize_head()); head.is_error()) {
        return head;
    }

    bool has_chunk = first.value();
    uint64_t sent_bytes = 0;
    while (has_chunk) {
        if (auto sent = socket.send_all(chunk); sent.is_error()) {
            return sent;
        }
        sent_bytes += chunk.size();

        chunk.clear();
        auto next = response.body_source(chunk);
        if (next.is_error()) {
            return Err<void>("Response stream aborted after " + std::to_string(sent_bytes) +
                             " bytes: " + next.error());
        }
        has_chunk = next.value();
    }

    spdlog::debug("Streamed {} bytes", sent_bytes);
    return Ok();
}

HttpResponse HttpServer::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    nlohmann::json body = {
        {"error", status_kind(status)},
        {"detail", message}
    };
    response.set_body(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    response.set_header("Content-Type", "application/json");
    return response;
}

} // namespace network
} // namespace chunkd
