#include "chunkd/network/socket.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <mutex>

#ifdef CHUNKD_PLATFORM_WINDOWS
    #define close_socket closesocket
    #define CHUNKD_SEND_FLAGS 0
    #define CHUNKD_SHUT_BOTH SD_BOTH
    using socklen_t = int;
#else
    #define close_socket ::close
    #define CHUNKD_SEND_FLAGS MSG_NOSIGNAL
    #define CHUNKD_SHUT_BOTH SHUT_RDWR
#endif

namespace chunkd::network {

namespace {

std::string last_error() {
#ifdef CHUNKD_PLATFORM_WINDOWS
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

} // namespace

Result<void> Socket::initialize_platform() {
#ifdef CHUNKD_PLATFORM_WINDOWS
    static std::once_flag once;
    static int startup_result = 0;
    std::call_once(once, []() {
        WSADATA wsa_data;
        startup_result = WSAStartup(MAKEWORD(2, 2), &wsa_data);
    });
    if (startup_result != 0) {
        return Err<void>(std::string("Failed to initialize Winsock"));
    }
#endif
    return Ok();
}

Socket::Socket()
    : socket_(INVALID_SOCKET_VALUE) {
}

Socket::Socket(socket_t socket)
    : socket_(socket) {
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : socket_(other.socket_) {
    other.socket_ = INVALID_SOCKET_VALUE;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        other.socket_ = INVALID_SOCKET_VALUE;
    }
    return *this;
}

Result<void> Socket::create() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket already created"));
    }

    if (auto init = initialize_platform(); init.is_error()) {
        return init;
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>("Failed to create socket: " + last_error());
    }

    spdlog::debug("Socket created: fd={}", socket_);
    return Ok();
}

Result<void> Socket::bind(const std::string& address, uint16_t port) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
        return Err<void>("Invalid address: " + address);
    }

    if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Err<void>("Failed to bind to " + address + ":" + std::to_string(port) + ": " + last_error());
    }

    spdlog::debug("Socket bound to {}:{}", address, port);
    return Ok();
}

Result<void> Socket::listen(int backlog) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    if (::listen(socket_, backlog) < 0) {
        return Err<void>("Failed to listen: " + last_error());
    }

    spdlog::debug("Socket listening with backlog={}", backlog);
    return Ok();
}

Result<std::unique_ptr<Socket>> Socket::accept() {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>(std::string("Socket not created"));
    }

    sockaddr_in client_addr{};
    socklen_t addr_len = sizeof(client_addr);

    socket_t client_socket = ::accept(socket_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>("Failed to accept connection: " + last_error());
    }

    char addr_str[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, INET_ADDRSTRLEN);
    spdlog::debug("Accepted connection from {}:{}", addr_str, ntohs(client_addr.sin_port));

    return Ok(std::unique_ptr<Socket>(new Socket(client_socket)));
}

Result<void> Socket::connect(const std::string& address, uint16_t port) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
        return Err<void>("Invalid address: " + address);
    }

    if (::connect(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Err<void>("Failed to connect to " + address + ":" + std::to_string(port) + ": " + last_error());
    }

    return Ok();
}

Result<void> Socket::send_all(const uint8_t* data, size_t size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    size_t total_sent = 0;
    while (total_sent < size) {
        auto sent = ::send(socket_,
                           reinterpret_cast<const char*>(data + total_sent),
                           static_cast<int>(size - total_sent),
                           CHUNKD_SEND_FLAGS);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>("Failed to send data: " + last_error());
        }
        total_sent += static_cast<size_t>(sent);
    }
    return Ok();
}

Result<std::vector<uint8_t>> Socket::receive(size_t max_size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::vector<uint8_t>>(std::string("Socket not created"));
    }

    std::vector<uint8_t> buffer(max_size);
    for (;;) {
        auto received = ::recv(socket_, reinterpret_cast<char*>(buffer.data()), static_cast<int>(max_size), 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return Err<std::vector<uint8_t>>(std::string("Timed out waiting for data"));
            }
            return Err<std::vector<uint8_t>>("Failed to receive data: " + last_error());
        }
        buffer.resize(static_cast<size_t>(received));
        return Ok(std::move(buffer));
    }
}

Result<void> Socket::set_reuse_address(bool enable) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

    int opt = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt)) < 0) {
        return Err<void>(std::string("Failed to set SO_REUSEADDR"));
    }
    return Ok();
}

Result<void> Socket::set_receive_timeout(int seconds) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not created"));
    }

#ifdef CHUNKD_PLATFORM_WINDOWS
    DWORD timeout = static_cast<DWORD>(seconds) * 1000;
    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&timeout), sizeof(timeout)) < 0) {
        return Err<void>(std::string("Failed to set SO_RCVTIMEO"));
    }
#else
    timeval timeout{};
    timeout.tv_sec = seconds;
    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        return Err<void>(std::string("Failed to set SO_RCVTIMEO"));
    }
#endif
    return Ok();
}

Result<uint16_t> Socket::local_port() const {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<uint16_t>(std::string("Socket not created"));
    }

    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
        return Err<uint16_t>("getsockname failed: " + last_error());
    }
    return Ok(static_cast<uint16_t>(ntohs(addr.sin_port)));
}

void Socket::shutdown() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        ::shutdown(socket_, CHUNKD_SHUT_BOTH);
    }
}

void Socket::close() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
}

} // namespace chunkd::network
