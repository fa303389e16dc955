/**
 * @file interface_announcer.cpp
 * @brief InterfaceAnnouncer implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/core/interface_announcer.hpp"
#include "dmsd/utils/logger.hpp"

namespace dmsd {
namespace core {

InterfaceAnnouncer::InterfaceAnnouncer(const net::NetworkInterface& iface,
                                       std::shared_ptr<const AnnouncerContext> context,
                                       net::InterfaceProvider& provider,
                                       std::unique_ptr<MulticastChannel> channel)
    : iface_(iface)
    , context_(std::move(context))
    , provider_(provider)
    , channel_(std::move(channel))
{
}

InterfaceAnnouncer::~InterfaceAnnouncer() {
    if (channel_) {
        channel_->close();
    }
}

bool InterfaceAnnouncer::join() {
    state_.store(AnnouncerState::JOINING);

    if (!channel_ || !channel_->open(iface_)) {
        LOG_ERROR("Announcer", "[{}] Multicast setup failed, not announcing on this interface",
                  iface_.name);
        state_.store(AnnouncerState::FAILED);
        return false;
    }

    LOG_INFO("Announcer", "[{}] Joined SSDP group (index {})", iface_.name, iface_.index);
    state_.store(AnnouncerState::ANNOUNCING);
    return true;
}

std::vector<std::string> InterfaceAnnouncer::resolveIPv4Addresses() {
    std::vector<net::InterfaceAddress> addresses;
    std::vector<std::string> result;

    if (!provider_.listAddresses(iface_, addresses)) {
        LOG_ERROR("Announcer", "[{}] Address lookup failed, retrying next tick", iface_.name);
        return result;
    }

    for (const auto& address : addresses) {
        auto ipv4 = net::toIPv4(address);
        if (!ipv4) {
            LOG_TRACE("Announcer", "[{}] Skipping non-IPv4 address {}", iface_.name, address.ip);
            continue;
        }
        result.push_back(*ipv4);
    }

    return result;
}

size_t InterfaceAnnouncer::announceOnce() {
    if (state_.load() != AnnouncerState::ANNOUNCING) {
        return 0;
    }

    ticks_.fetch_add(1);

    std::vector<std::string> addresses = resolveIPv4Addresses();
    {
        std::lock_guard<std::mutex> lock(addressMutex_);
        lastAddresses_ = addresses;
    }

    size_t sent = 0;
    for (const auto& host : addresses) {
        LOG_DEBUG("Announcer", "[{}] Announcing from {}", iface_.name, host);

        for (const auto& target : context_->targets) {
            // Read the port per message: it must match the live listener
            std::string datagram = context_->encoder->encode(
                host, context_->httpPort(), target, upnp::kSsdpAlive);

            if (context_->packetLog) {
                context_->packetLog->record(datagram);
            }

            if (channel_->send(datagram)) {
                ++sent;
                messagesSent_.fetch_add(1);
            } else {
                sendFailures_.fetch_add(1);
                LOG_WARN("Announcer", "[{}] NOTIFY {} from {} not sent, retrying next tick",
                         iface_.name, target, host);
            }
        }
    }

    LOG_TRACE("Announcer", "[{}] Tick sent {} datagrams", iface_.name, sent);
    return sent;
}

void InterfaceAnnouncer::run(utils::ShutdownSignal& signal) {
    LOG_DEBUG("Announcer", "[{}] Announcer thread started", iface_.name);

    if (join()) {
        do {
            announceOnce();
        } while (!signal.waitFor(context_->interval));

        state_.store(AnnouncerState::STOPPED);
    }

    LOG_DEBUG("Announcer", "[{}] Announcer thread stopped", iface_.name);
}

InterfaceStatus InterfaceAnnouncer::status() const {
    InterfaceStatus status;
    status.index = iface_.index;
    status.name = iface_.name;
    status.state = state_.load();
    status.messagesSent = messagesSent_.load();
    status.sendFailures = sendFailures_.load();
    status.ticks = ticks_.load();
    {
        std::lock_guard<std::mutex> lock(addressMutex_);
        status.addresses = lastAddresses_;
    }
    return status;
}

}  // namespace core
}  // namespace dmsd
