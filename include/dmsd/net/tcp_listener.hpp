/**
 * @file tcp_listener.hpp
 * @brief IPv4 TCP listening socket and accepted connection wrappers.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/net/export.hpp"
#include "dmsd/net/platform.hpp"
#include "dmsd/net/udp_socket.hpp"

#include <cstdint>
#include <string>

namespace dmsd {
namespace net {

/**
 * @class TcpConnection
 * @brief RAII wrapper for one accepted (or connected) stream socket.
 */
class DMSD_NET_API TcpConnection {
public:
    TcpConnection();
    TcpConnection(SocketHandle handle, const SocketAddress& peer);
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    SocketHandle handle() const { return socket_; }
    const SocketAddress& peer() const { return peer_; }

    /**
     * @brief Open a client connection (used by tests and tools).
     */
    bool connect(const SocketAddress& address);

    /**
     * @brief Bound blocking receives (SO_RCVTIMEO).
     */
    bool setReceiveTimeout(int timeoutMs);

    /**
     * @brief Wait until data (or EOF) is readable.
     * @param timeoutMs Timeout in milliseconds.
     * @return 1 if readable, 0 on timeout, -1 on error.
     */
    int waitReadable(int timeoutMs);

    /**
     * @brief Receive up to length bytes.
     * @return Bytes received, 0 on orderly shutdown, -1 on error or timeout.
     */
    int receive(void* buffer, size_t length);

    /**
     * @brief Send the whole buffer, retrying short writes.
     * @return False if the peer went away or an error occurred.
     */
    bool sendAll(const void* data, size_t length);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    SocketAddress peer_;
    int lastError_;
};

/**
 * @class TcpListener
 * @brief RAII listening socket with timeout-based accept.
 *
 * Usage:
 * @code
 * TcpListener listener;
 * listener.bind(0);           // OS-assigned port
 * listener.listen();
 * uint16_t port = listener.getLocalPort();
 *
 * TcpConnection conn;
 * if (listener.accept(500, conn) > 0) { ... }
 * @endcode
 */
class DMSD_NET_API TcpListener {
public:
    TcpListener();
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    bool setReuseAddress(bool enable);

    /**
     * @brief Bind to a local address.
     * @param port Port (0 for an ephemeral port).
     * @param address Local IPv4 address (default: any).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    bool listen(int backlog = 16);

    /**
     * @brief Port currently bound, read from the kernel on every call.
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Wait for and accept one connection.
     * @param timeoutMs Timeout in milliseconds (-1 = infinite).
     * @param connection Output: the accepted connection.
     * @return 1 on accept, 0 on timeout, -1 on error.
     */
    int accept(int timeoutMs, TcpConnection& connection);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace dmsd
