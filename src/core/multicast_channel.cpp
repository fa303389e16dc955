/**
 * @file multicast_channel.cpp
 * @brief UdpMulticastChannel implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/core/multicast_channel.hpp"
#include "dmsd/utils/logger.hpp"

namespace dmsd {
namespace core {

UdpMulticastChannel::UdpMulticastChannel(const ChannelConfig& config)
    : config_(config)
    , interfaceIndex_(0)
    , joined_(false)
{
}

UdpMulticastChannel::~UdpMulticastChannel() {
    close();
}

bool UdpMulticastChannel::open(const net::NetworkInterface& iface) {
    if (!socket_.isValid()) {
        LOG_ERROR("Channel", "[{}] Socket not valid", iface.name);
        return false;
    }

    if (!socket_.setReuseAddress(true)) {
        LOG_ERROR("Channel", "[{}] Failed to set SO_REUSEADDR: {}",
                  iface.name, net::socketErrorString(socket_.getLastError()));
        return false;
    }

    // Bound to the group address so unrelated unicast on 1900 is not queued here
    if (!socket_.bind(config_.groupPort, config_.groupAddress)) {
        LOG_ERROR("Channel", "[{}] Failed to bind {}:{}",
                  iface.name, config_.groupAddress, config_.groupPort);
        return false;
    }

    if (!socket_.joinMulticastGroup(config_.groupAddress, iface.index)) {
        LOG_ERROR("Channel", "[{}] Failed to join {}", iface.name, config_.groupAddress);
        return false;
    }
    joined_ = true;
    interfaceIndex_ = iface.index;

    if (!socket_.setMulticastInterface(iface.index)) {
        LOG_ERROR("Channel", "[{}] Failed to select outgoing interface: {}",
                  iface.name, net::socketErrorString(socket_.getLastError()));
        return false;
    }

    if (!socket_.setMulticastTTL(config_.multicastTtl)) {
        LOG_ERROR("Channel", "[{}] Failed to set multicast TTL {}: {}",
                  iface.name, config_.multicastTtl,
                  net::socketErrorString(socket_.getLastError()));
        return false;
    }

    if (!socket_.setMulticastLoopback(config_.loopback)) {
        LOG_WARN("Channel", "[{}] Failed to set multicast loopback", iface.name);
    }

    return true;
}

bool UdpMulticastChannel::send(const std::string& datagram) {
    net::SocketAddress dest(config_.groupAddress, config_.groupPort);
    int sent = socket_.sendTo(dest, datagram.data(), datagram.size());

    if (sent < 0) {
        LOG_ERROR("Channel", "Send to {} failed: {}",
                  dest.toString(), net::socketErrorString(socket_.getLastError()));
        return false;
    }
    if (static_cast<size_t>(sent) != datagram.size()) {
        LOG_ERROR("Channel", "Short write to {}: sent {} < {} bytes",
                  dest.toString(), sent, datagram.size());
        return false;
    }
    return true;
}

void UdpMulticastChannel::close() {
    if (joined_) {
        if (!socket_.leaveMulticastGroup(config_.groupAddress, interfaceIndex_)) {
            LOG_DEBUG("Channel", "Leaving {} on interface {} failed: {}",
                      config_.groupAddress, interfaceIndex_,
                      net::socketErrorString(socket_.getLastError()));
        }
        joined_ = false;
    }
    socket_.close();
}

}  // namespace core
}  // namespace dmsd
