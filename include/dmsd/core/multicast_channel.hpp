/**
 * @file multicast_channel.hpp
 * @brief Per-interface SSDP multicast sender.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/core/export.hpp"
#include "dmsd/net/interfaces.hpp"
#include "dmsd/net/udp_socket.hpp"

#include <cstdint>
#include <string>

namespace dmsd {
namespace core {

/**
 * @struct ChannelConfig
 * @brief Multicast group and socket options for announcements.
 */
struct DMSD_CORE_API ChannelConfig {
    std::string groupAddress;   ///< SSDP group
    uint16_t groupPort;         ///< SSDP port
    int multicastTtl;           ///< Hop limit (keeps NOTIFYs near the LAN)
    bool loopback;              ///< Deliver own datagrams locally

    ChannelConfig()
        : groupAddress("239.255.255.250")
        , groupPort(1900)
        , multicastTtl(4)
        , loopback(false)
    {}
};

/**
 * @class MulticastChannel
 * @brief A group membership on one interface that datagrams go out on.
 */
class DMSD_CORE_API MulticastChannel {
public:
    virtual ~MulticastChannel() = default;

    /**
     * @brief Join the group on the interface and apply socket options.
     * @return False on any failure; the reason is logged.
     */
    virtual bool open(const net::NetworkInterface& iface) = 0;

    /**
     * @brief Send one datagram to the group.
     * @return False on socket error or short write.
     */
    virtual bool send(const std::string& datagram) = 0;

    virtual void close() = 0;
};

/**
 * @class UdpMulticastChannel
 * @brief MulticastChannel over a net::UdpSocket.
 */
class DMSD_CORE_API UdpMulticastChannel : public MulticastChannel {
public:
    explicit UdpMulticastChannel(const ChannelConfig& config);
    ~UdpMulticastChannel() override;

    bool open(const net::NetworkInterface& iface) override;
    bool send(const std::string& datagram) override;
    void close() override;

    /**
     * @brief Underlying socket, for option inspection.
     */
    net::SocketHandle handle() const { return socket_.handle(); }

private:
    ChannelConfig config_;
    net::UdpSocket socket_;
    int interfaceIndex_;
    bool joined_;
};

}  // namespace core
}  // namespace dmsd
