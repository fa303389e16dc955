/**
 * @file interface_watcher.cpp
 * @brief InterfaceWatcher implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/core/interface_watcher.hpp"
#include "dmsd/utils/logger.hpp"

namespace dmsd {
namespace core {

InterfaceWatcher::InterfaceWatcher(std::shared_ptr<const AnnouncerContext> context,
                                   net::InterfaceProvider& provider,
                                   ChannelFactory channelFactory,
                                   std::chrono::milliseconds scanInterval)
    : context_(std::move(context))
    , provider_(provider)
    , channelFactory_(std::move(channelFactory))
    , scanInterval_(scanInterval)
{
}

InterfaceWatcher::~InterfaceWatcher() {
    stop();
}

bool InterfaceWatcher::start() {
    if (running_.load()) {
        LOG_WARN("Watcher", "Watcher already running");
        return false;
    }

    // A restart announces afresh; stop announcers left from scanOnce() calls
    signal_.requestStop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }
        workers_.clear();
        active_.clear();
    }

    signal_.reset();
    running_.store(true);
    scanThread_ = std::thread(&InterfaceWatcher::scanLoop, this);

    LOG_INFO("Watcher", "Watching interfaces every {} ms", scanInterval_.count());
    return true;
}

void InterfaceWatcher::stop() {
    signal_.requestStop();

    if (scanThread_.joinable()) {
        scanThread_.join();
    }

    // Only start() erases workers, so the pointers stay valid after unlocking
    std::vector<Worker*> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                pending.push_back(worker.get());
            }
        }
    }

    for (Worker* worker : pending) {
        worker->thread.join();
    }

    if (running_.exchange(false)) {
        LOG_INFO("Watcher", "Watcher stopped");
    }
}

void InterfaceWatcher::scanLoop() {
    LOG_DEBUG("Watcher", "Scan thread started");

    do {
        scanOnce();
    } while (!signal_.waitFor(scanInterval_));

    LOG_DEBUG("Watcher", "Scan thread stopped");
}

size_t InterfaceWatcher::scanOnce() {
    std::vector<net::NetworkInterface> interfaces;
    if (!provider_.listInterfaces(interfaces)) {
        LOG_ERROR("Watcher", "Interface enumeration failed, retrying next scan");
        return 0;
    }

    size_t started = 0;
    for (const auto& iface : interfaces) {
        if (!iface.isUsable()) {
            // Left unmarked so it is picked up once it comes up
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_.insert(iface.index).second) {
                continue;
            }
        }

        spawn(iface);
        ++started;
    }

    return started;
}

void InterfaceWatcher::spawn(const net::NetworkInterface& iface) {
    LOG_INFO("Watcher", "Found interface {} (index {}), starting announcer",
             iface.name, iface.index);

    auto worker = std::make_unique<Worker>();
    worker->announcer = std::make_unique<InterfaceAnnouncer>(
        iface, context_, provider_, channelFactory_(iface));

    InterfaceAnnouncer* announcer = worker->announcer.get();
    worker->thread = std::thread([this, announcer]() {
        announcer->run(signal_);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    workers_.push_back(std::move(worker));
}

bool InterfaceWatcher::isActive(int index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(index) != 0;
}

size_t InterfaceWatcher::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::vector<InterfaceStatus> InterfaceWatcher::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<InterfaceStatus> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->announcer->status());
    }
    return result;
}

}  // namespace core
}  // namespace dmsd
