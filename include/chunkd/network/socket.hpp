#pragma once

#include "chunkd/core/platform.hpp"
#include "chunkd/core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkd::network {

#ifdef CHUNKD_PLATFORM_WINDOWS
    using socket_t = SOCKET;
    constexpr socket_t INVALID_SOCKET_VALUE = INVALID_SOCKET;
#else
    using socket_t = int;
    constexpr socket_t INVALID_SOCKET_VALUE = -1;
#endif

/**
 * @brief Blocking TCP socket owning one descriptor
 */
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    Result<void> create();
    Result<void> bind(const std::string& address, uint16_t port);
    Result<void> listen(int backlog = 128);
    Result<std::unique_ptr<Socket>> accept();
    Result<void> connect(const std::string& address, uint16_t port);

    /// Send the whole buffer, looping over partial writes
    Result<void> send_all(const uint8_t* data, size_t size);
    Result<void> send_all(const std::vector<uint8_t>& data) { return send_all(data.data(), data.size()); }

    /// Empty result means the peer closed the connection
    Result<std::vector<uint8_t>> receive(size_t max_size);

    Result<void> set_reuse_address(bool enable);
    Result<void> set_receive_timeout(int seconds);

    /// Port actually bound (useful after binding port 0)
    Result<uint16_t> local_port() const;

    /// Wake up a thread blocked in accept()/receive() on this socket
    void shutdown();
    void close();

    bool is_valid() const { return socket_ != INVALID_SOCKET_VALUE; }
    socket_t native_handle() const { return socket_; }

private:
    explicit Socket(socket_t socket);

    static Result<void> initialize_platform();

    socket_t socket_;
};

} // namespace chunkd::network
