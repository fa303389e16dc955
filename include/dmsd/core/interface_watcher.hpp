/**
 * @file interface_watcher.hpp
 * @brief Detects usable network interfaces and starts their announcers.
 *
 * The InterfaceWatcher handles:
 * - Enumerating interfaces every scan interval
 * - Starting one InterfaceAnnouncer thread per new usable interface
 * - Tracking announced interface indices (never removed)
 * - Stopping and joining every announcer on shutdown
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/core/export.hpp"
#include "dmsd/core/interface_announcer.hpp"
#include "dmsd/core/multicast_channel.hpp"
#include "dmsd/net/interfaces.hpp"
#include "dmsd/utils/shutdown_signal.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace dmsd {
namespace core {

/**
 * @brief Creates the multicast channel for a newly found interface.
 */
using ChannelFactory =
    std::function<std::unique_ptr<MulticastChannel>(const net::NetworkInterface&)>;

/**
 * @class InterfaceWatcher
 * @brief Owns the active interface set and every announcer thread.
 *
 * Usage:
 * @code
 * net::SystemInterfaceProvider provider;
 * InterfaceWatcher watcher(context, provider,
 *     [&](const net::NetworkInterface&) {
 *         return std::make_unique<UdpMulticastChannel>(channelConfig);
 *     });
 * watcher.start();
 * // ... run ...
 * watcher.stop();
 * @endcode
 */
class DMSD_CORE_API InterfaceWatcher {
public:
    InterfaceWatcher(std::shared_ptr<const AnnouncerContext> context,
                     net::InterfaceProvider& provider,
                     ChannelFactory channelFactory,
                     std::chrono::milliseconds scanInterval = std::chrono::seconds(1));

    /**
     * @brief Destructor - stops the watcher and all announcers.
     */
    ~InterfaceWatcher();

    InterfaceWatcher(const InterfaceWatcher&) = delete;
    InterfaceWatcher& operator=(const InterfaceWatcher&) = delete;

    /**
     * @brief Start the scan thread.
     *
     * Announcer state from an earlier run is discarded, so every usable
     * interface is announced again after a stop()/start() cycle.
     * @return False if already running.
     */
    bool start();

    /**
     * @brief Stop scanning and every announcer.
     * Blocks until all threads have terminated.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Enumerate once and start announcers for new usable interfaces.
     * @return Number of announcers started.
     */
    size_t scanOnce();

    /**
     * @brief Whether an announcer was started for this index in the current run.
     */
    bool isActive(int index) const;

    size_t activeCount() const;

    std::vector<InterfaceStatus> snapshot() const;

private:
    struct Worker {
        std::unique_ptr<InterfaceAnnouncer> announcer;
        std::thread thread;
    };

    std::shared_ptr<const AnnouncerContext> context_;
    net::InterfaceProvider& provider_;
    ChannelFactory channelFactory_;
    std::chrono::milliseconds scanInterval_;

    utils::ShutdownSignal signal_;
    std::atomic<bool> running_{false};
    std::thread scanThread_;

    mutable std::mutex mutex_;
    std::set<int> active_;
    std::vector<std::unique_ptr<Worker>> workers_;

    void scanLoop();
    void spawn(const net::NetworkInterface& iface);
};

}  // namespace core
}  // namespace dmsd
