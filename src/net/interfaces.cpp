/**
 * @file interfaces.cpp
 * @brief getifaddrs()-based interface enumeration.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/net/interfaces.hpp"
#include "dmsd/net/platform.hpp"
#include "dmsd/utils/logger.hpp"

#include <ifaddrs.h>

#include <algorithm>
#include <memory>

namespace dmsd {
namespace net {

namespace {

struct IfAddrsDeleter {
    void operator()(struct ifaddrs* list) const { freeifaddrs(list); }
};

using IfAddrsPtr = std::unique_ptr<struct ifaddrs, IfAddrsDeleter>;

bool loadIfAddrs(IfAddrsPtr& list) {
    struct ifaddrs* raw = nullptr;
    if (getifaddrs(&raw) != 0) {
        LOG_ERROR("Interfaces", "getifaddrs failed: {}", socketErrorString(errno));
        return false;
    }
    list.reset(raw);
    return true;
}

}  // namespace

bool NetworkInterface::isUp() const {
    return (flags & IFF_UP) != 0;
}

bool NetworkInterface::isLoopback() const {
    return (flags & IFF_LOOPBACK) != 0;
}

bool NetworkInterface::supportsMulticast() const {
    return (flags & IFF_MULTICAST) != 0;
}

std::optional<std::string> toIPv4(const InterfaceAddress& address) {
    if (address.family == AF_INET) {
        struct in_addr v4{};
        if (inet_pton(AF_INET, address.ip.c_str(), &v4) != 1) {
            return std::nullopt;
        }
        return address.ip;
    }

    if (address.family == AF_INET6) {
        struct in6_addr v6{};
        if (inet_pton(AF_INET6, address.ip.c_str(), &v6) != 1) {
            return std::nullopt;
        }
        if (!IN6_IS_ADDR_V4MAPPED(&v6)) {
            return std::nullopt;
        }

        struct in_addr v4{};
        std::memcpy(&v4, &v6.s6_addr[12], sizeof(v4));

        char ipStr[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &v4, ipStr, sizeof(ipStr));
        return std::string(ipStr);
    }

    return std::nullopt;
}

bool SystemInterfaceProvider::listInterfaces(std::vector<NetworkInterface>& interfaces) {
    IfAddrsPtr list;
    if (!loadIfAddrs(list)) {
        return false;
    }

    interfaces.clear();
    for (struct ifaddrs* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr) {
            continue;
        }

        // getifaddrs() yields one entry per address; collapse by name
        auto existing = std::find_if(interfaces.begin(), interfaces.end(),
            [ifa](const NetworkInterface& iface) { return iface.name == ifa->ifa_name; });
        if (existing != interfaces.end()) {
            existing->flags |= ifa->ifa_flags;
            continue;
        }

        unsigned index = if_nametoindex(ifa->ifa_name);
        if (index == 0) {
            LOG_DEBUG("Interfaces", "Skipping {}: no interface index", ifa->ifa_name);
            continue;
        }

        interfaces.emplace_back(static_cast<int>(index), ifa->ifa_name, ifa->ifa_flags);
    }

    std::sort(interfaces.begin(), interfaces.end(),
        [](const NetworkInterface& a, const NetworkInterface& b) { return a.index < b.index; });
    return true;
}

bool SystemInterfaceProvider::listAddresses(const NetworkInterface& iface,
                                            std::vector<InterfaceAddress>& addresses) {
    IfAddrsPtr list;
    if (!loadIfAddrs(list)) {
        return false;
    }

    addresses.clear();
    for (struct ifaddrs* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_name == nullptr) {
            continue;
        }
        if (iface.name != ifa->ifa_name) {
            continue;
        }

        char ipStr[INET6_ADDRSTRLEN];
        int family = ifa->ifa_addr->sa_family;

        if (family == AF_INET) {
            auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
            inet_ntop(AF_INET, &sin->sin_addr, ipStr, sizeof(ipStr));
        } else if (family == AF_INET6) {
            auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
            inet_ntop(AF_INET6, &sin6->sin6_addr, ipStr, sizeof(ipStr));
        } else {
            continue;
        }

        addresses.emplace_back(family, ipStr);
    }

    return true;
}

}  // namespace net
}  // namespace dmsd
