/**
 * @file tcp_listener.cpp
 * @brief TcpListener and TcpConnection implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/net/tcp_listener.hpp"
#include "dmsd/utils/logger.hpp"

#include <sys/time.h>

namespace dmsd {
namespace net {

// =============================================================================
// TcpConnection
// =============================================================================

TcpConnection::TcpConnection()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
}

TcpConnection::TcpConnection(SocketHandle handle, const SocketAddress& peer)
    : socket_(handle)
    , peer_(peer)
    , lastError_(0)
{
}

TcpConnection::~TcpConnection() {
    close();
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept
    : socket_(other.socket_)
    , peer_(std::move(other.peer_))
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        peer_ = std::move(other.peer_);
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool TcpConnection::connect(const SocketAddress& address) {
    close();

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);
    if (inet_pton(AF_INET, address.ip.c_str(), &addr.sin_addr) != 1) {
        lastError_ = EINVAL;
        return false;
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        lastError_ = getLastSocketError();
        return false;
    }

    if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        lastError_ = getLastSocketError();
        close();
        return false;
    }

    peer_ = address;
    return true;
}

bool TcpConnection::setReceiveTimeout(int timeoutMs) {
    if (!isValid()) {
        return false;
    }

    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        lastError_ = getLastSocketError();
        return false;
    }
    return true;
}

int TcpConnection::waitReadable(int timeoutMs) {
    if (!isValid()) {
        return -1;
    }

    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(socket_, &readSet);

    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

    int selectResult = ::select(socket_ + 1, &readSet, nullptr, nullptr, &tv);
    if (selectResult < 0) {
        lastError_ = getLastSocketError();
        return lastError_ == EINTR ? 0 : -1;
    }
    return selectResult > 0 ? 1 : 0;
}

int TcpConnection::receive(void* buffer, size_t length) {
    if (!isValid()) {
        return -1;
    }

    ssize_t result;
    do {
        result = ::recv(socket_, buffer, length, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        lastError_ = getLastSocketError();
        return -1;
    }
    return static_cast<int>(result);
}

bool TcpConnection::sendAll(const void* data, size_t length) {
    if (!isValid()) {
        return false;
    }

    const char* cursor = static_cast<const char*>(data);
    size_t remaining = length;

    while (remaining > 0) {
        ssize_t sent = ::send(socket_, cursor, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            lastError_ = getLastSocketError();
            return false;
        }
        cursor += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

void TcpConnection::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

// =============================================================================
// TcpListener
// =============================================================================

TcpListener::TcpListener()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("TcpListener", "Failed to create socket: {}", socketErrorString(lastError_));
    }
}

TcpListener::~TcpListener() {
    close();
}

bool TcpListener::setReuseAddress(bool enable) {
    if (!isValid()) {
        return false;
    }

    int optval = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool TcpListener::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("TcpListener", "Invalid bind address: {}", address);
        lastError_ = EINVAL;
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("TcpListener", "Failed to bind to {}:{} - {}",
                  address, port, socketErrorString(lastError_));
        return false;
    }

    return true;
}

bool TcpListener::listen(int backlog) {
    if (!isValid()) {
        return false;
    }

    if (::listen(socket_, backlog) != 0) {
        setLastError();
        LOG_ERROR("TcpListener", "listen() failed: {}", socketErrorString(lastError_));
        return false;
    }
    return true;
}

uint16_t TcpListener::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);

    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }

    return ntohs(addr.sin_port);
}

int TcpListener::accept(int timeoutMs, TcpConnection& connection) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(socket_, &readSet);

        struct timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;

        int selectResult = ::select(socket_ + 1, &readSet, nullptr, nullptr, &tv);
        if (selectResult < 0) {
            setLastError();
            return lastError_ == EINTR ? 0 : -1;
        }
        if (selectResult == 0) {
            return 0;
        }
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);

    SocketHandle client = ::accept(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
    if (client == INVALID_SOCKET_HANDLE) {
        setLastError();
        return -1;
    }

    char ipStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));

    connection = TcpConnection(client, SocketAddress(ipStr, ntohs(addr.sin_port)));
    return 1;
}

void TcpListener::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void TcpListener::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace dmsd
