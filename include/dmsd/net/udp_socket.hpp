/**
 * @file udp_socket.hpp
 * @brief IPv4 UDP socket with per-interface multicast support.
 *
 * Provides a RAII wrapper around UDP sockets with multicast group
 * join/leave bound to an interface index, TTL configuration, and
 * timeout-based receive.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/net/export.hpp"
#include "dmsd/net/platform.hpp"

#include <cstdint>
#include <string>

namespace dmsd {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct DMSD_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper with multicast support.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(1900, "239.255.255.250");
 * sock.joinMulticastGroup("239.255.255.250", ifindex);
 * sock.setMulticastInterface(ifindex);
 * sock.setMulticastTTL(4);
 *
 * sock.sendTo(SocketAddress("239.255.255.250", 1900), data.data(), data.size());
 * @endcode
 */
class DMSD_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     */
    UdpSocket();

    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any). A
     *        multicast group address is accepted and restricts delivery
     *        to datagrams sent to that group.
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to.
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Enable address reuse (SO_REUSEADDR, SO_REUSEPORT).
     * Call before bind().
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Set the multicast TTL (time-to-live / hop limit).
     * @param ttl TTL value (1 = local subnet only).
     */
    bool setMulticastTTL(int ttl);

    /**
     * @brief Enable/disable multicast loopback.
     * When enabled, the sender also receives its own multicast packets.
     */
    bool setMulticastLoopback(bool enable);

    /**
     * @brief Set the outgoing interface for multicast packets.
     * @param interfaceIndex Kernel interface index (0 = routing default).
     */
    bool setMulticastInterface(int interfaceIndex);

    /**
     * @brief Join a multicast group on one interface.
     * @param groupAddress Multicast group IP (e.g., "239.255.255.250").
     * @param interfaceIndex Kernel interface index (0 = any).
     * @return True on success.
     */
    bool joinMulticastGroup(const std::string& groupAddress, int interfaceIndex = 0);

    /**
     * @brief Leave a multicast group previously joined on an interface.
     */
    bool leaveMulticastGroup(const std::string& groupAddress, int interfaceIndex = 0);

    /**
     * @brief Send data to an address.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    void close();

    /**
     * @brief Get the last socket error code (errno).
     */
    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
    bool changeMembership(int option, const std::string& groupAddress, int interfaceIndex);
};

}  // namespace net
}  // namespace dmsd
