/**
 * @file udp_socket.cpp
 * @brief UDP socket implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/net/udp_socket.hpp"
#include "dmsd/utils/logger.hpp"

namespace dmsd {
namespace net {

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to create socket: {}", socketErrorString(lastError_));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to bind to {}:{} - {}",
                  address, port, socketErrorString(lastError_));
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}:{}", address, port);
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
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

bool UdpSocket::setReuseAddress(bool enable) {
    if (!isValid()) {
        return false;
    }

    int optval = enable ? 1 : 0;

    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) != 0) {
        setLastError();
        return false;
    }
#ifdef SO_REUSEPORT
    // Other SSDP stacks on this host commonly hold port 1900 too
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof(optval)) != 0) {
        setLastError();
        LOG_DEBUG("UdpSocket", "SO_REUSEPORT not applied: {}", socketErrorString(lastError_));
    }
#endif

    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    if (!isValid()) {
        return false;
    }

    unsigned char ttlVal = static_cast<unsigned char>(ttl);

    if (setsockopt(socket_, IPPROTO_IP, IP_MULTICAST_TTL, &ttlVal, sizeof(ttlVal)) != 0) {
        setLastError();
        return false;
    }

    return true;
}

bool UdpSocket::setMulticastLoopback(bool enable) {
    if (!isValid()) {
        return false;
    }

    unsigned char loop = enable ? 1 : 0;

    if (setsockopt(socket_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) != 0) {
        setLastError();
        return false;
    }

    return true;
}

bool UdpSocket::setMulticastInterface(int interfaceIndex) {
    if (!isValid()) {
        return false;
    }

    struct ip_mreqn mreq{};
    mreq.imr_address.s_addr = INADDR_ANY;
    mreq.imr_ifindex = interfaceIndex;

    if (setsockopt(socket_, IPPROTO_IP, IP_MULTICAST_IF, &mreq, sizeof(mreq)) != 0) {
        setLastError();
        return false;
    }

    return true;
}

bool UdpSocket::joinMulticastGroup(const std::string& groupAddress, int interfaceIndex) {
    if (!changeMembership(IP_ADD_MEMBERSHIP, groupAddress, interfaceIndex)) {
        LOG_ERROR("UdpSocket", "Failed to join multicast group {} on interface {}: {}",
                  groupAddress, interfaceIndex, socketErrorString(lastError_));
        return false;
    }

    LOG_DEBUG("UdpSocket", "Joined multicast group {} on interface {}",
              groupAddress, interfaceIndex);
    return true;
}

bool UdpSocket::leaveMulticastGroup(const std::string& groupAddress, int interfaceIndex) {
    if (!changeMembership(IP_DROP_MEMBERSHIP, groupAddress, interfaceIndex)) {
        return false;
    }

    LOG_DEBUG("UdpSocket", "Left multicast group {} on interface {}",
              groupAddress, interfaceIndex);
    return true;
}

bool UdpSocket::changeMembership(int option, const std::string& groupAddress,
                                 int interfaceIndex) {
    if (!isValid()) {
        return false;
    }

    struct ip_mreqn mreq{};

    if (inet_pton(AF_INET, groupAddress.c_str(), &mreq.imr_multiaddr) != 1) {
        lastError_ = EINVAL;
        return false;
    }
    mreq.imr_address.s_addr = INADDR_ANY;
    mreq.imr_ifindex = interfaceIndex;

    if (setsockopt(socket_, IPPROTO_IP, option, &mreq, sizeof(mreq)) != 0) {
        setLastError();
        return false;
    }

    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);

    if (inet_pton(AF_INET, dest.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        lastError_ = EINVAL;
        return -1;
    }

    ssize_t result = ::sendto(socket_,
                              data,
                              length,
                              0,
                              reinterpret_cast<struct sockaddr*>(&addr),
                              sizeof(addr));

    if (result < 0) {
        setLastError();
        return -1;
    }

    return static_cast<int>(result);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace dmsd
