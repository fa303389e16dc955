/**
 * @file interface_announcer.hpp
 * @brief Periodic ssdp:alive announcements on one network interface.
 *
 * The InterfaceAnnouncer handles:
 * - Joining the SSDP multicast group on its interface
 * - Re-resolving the interface's IPv4 addresses every tick
 * - Sending one NOTIFY per advertised target per address
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/core/export.hpp"
#include "dmsd/core/multicast_channel.hpp"
#include "dmsd/net/interfaces.hpp"
#include "dmsd/upnp/notify.hpp"
#include "dmsd/utils/packet_log.hpp"
#include "dmsd/utils/shutdown_signal.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dmsd {
namespace core {

/**
 * @struct AnnouncerContext
 * @brief Read-only state shared by every announcer.
 */
struct DMSD_CORE_API AnnouncerContext {
    std::shared_ptr<const upnp::NotifyEncoder> encoder;
    std::vector<std::string> targets;           ///< NT values, in send order
    std::function<uint16_t()> httpPort;         ///< Live descriptor server port
    std::shared_ptr<utils::PacketLog> packetLog;///< Optional datagram log
    std::chrono::milliseconds interval{1000};   ///< Tick period
};

enum class AnnouncerState {
    JOINING,     ///< Setting up the multicast channel
    ANNOUNCING,  ///< Sending ssdp:alive every tick
    FAILED,      ///< Channel setup failed; interface skipped
    STOPPED      ///< Shut down
};

inline const char* announcerStateToString(AnnouncerState state) {
    switch (state) {
        case AnnouncerState::JOINING: return "joining";
        case AnnouncerState::ANNOUNCING: return "announcing";
        case AnnouncerState::FAILED: return "failed";
        case AnnouncerState::STOPPED: return "stopped";
        default: return "unknown";
    }
}

/**
 * @struct InterfaceStatus
 * @brief Point-in-time view of one announcer.
 */
struct DMSD_CORE_API InterfaceStatus {
    int index;
    std::string name;
    AnnouncerState state;
    std::vector<std::string> addresses;   ///< IPv4 addresses of the last tick
    uint64_t messagesSent;
    uint64_t sendFailures;
    uint64_t ticks;

    InterfaceStatus()
        : index(0), state(AnnouncerState::JOINING)
        , messagesSent(0), sendFailures(0), ticks(0) {}
};

/**
 * @class InterfaceAnnouncer
 * @brief Announces the device on one interface until shutdown.
 *
 * Failures stay local to this interface: a failed join ends the
 * announcer in FAILED, a failed send is counted and the next
 * datagram is attempted.
 *
 * Usage:
 * @code
 * InterfaceAnnouncer announcer(iface, context, provider,
 *                              std::make_unique<UdpMulticastChannel>(config));
 * announcer.run(signal);  // blocks until signal.requestStop()
 * @endcode
 */
class DMSD_CORE_API InterfaceAnnouncer {
public:
    InterfaceAnnouncer(const net::NetworkInterface& iface,
                       std::shared_ptr<const AnnouncerContext> context,
                       net::InterfaceProvider& provider,
                       std::unique_ptr<MulticastChannel> channel);

    ~InterfaceAnnouncer();

    InterfaceAnnouncer(const InterfaceAnnouncer&) = delete;
    InterfaceAnnouncer& operator=(const InterfaceAnnouncer&) = delete;

    /**
     * @brief Open the multicast channel (JOINING -> ANNOUNCING or FAILED).
     */
    bool join();

    /**
     * @brief Run one tick: resolve addresses and send every NOTIFY.
     * @return Number of datagrams sent successfully.
     */
    size_t announceOnce();

    /**
     * @brief join(), then announce every interval until stop is requested.
     */
    void run(utils::ShutdownSignal& signal);

    AnnouncerState state() const { return state_.load(); }
    const net::NetworkInterface& networkInterface() const { return iface_; }

    InterfaceStatus status() const;

private:
    net::NetworkInterface iface_;
    std::shared_ptr<const AnnouncerContext> context_;
    net::InterfaceProvider& provider_;
    std::unique_ptr<MulticastChannel> channel_;

    std::atomic<AnnouncerState> state_{AnnouncerState::JOINING};
    std::atomic<uint64_t> messagesSent_{0};
    std::atomic<uint64_t> sendFailures_{0};
    std::atomic<uint64_t> ticks_{0};

    mutable std::mutex addressMutex_;
    std::vector<std::string> lastAddresses_;

    std::vector<std::string> resolveIPv4Addresses();
};

}  // namespace core
}  // namespace dmsd
