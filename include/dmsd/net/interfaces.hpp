/**
 * @file interfaces.hpp
 * @brief Network interface and address enumeration.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/net/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dmsd {
namespace net {

/**
 * @struct NetworkInterface
 * @brief One kernel network interface.
 */
struct DMSD_NET_API NetworkInterface {
    int index;          ///< Kernel interface index (if_nametoindex)
    std::string name;   ///< Interface name, e.g. "eth0"
    unsigned flags;     ///< IFF_* flags

    NetworkInterface() : index(0), flags(0) {}
    NetworkInterface(int index_, const std::string& name_, unsigned flags_)
        : index(index_), name(name_), flags(flags_) {}

    bool isUp() const;
    bool isLoopback() const;
    bool supportsMulticast() const;

    /**
     * @brief Up and multicast-capable, i.e. worth announcing on.
     */
    bool isUsable() const { return isUp() && supportsMulticast(); }
};

/**
 * @struct InterfaceAddress
 * @brief An address assigned to an interface, in textual form.
 */
struct DMSD_NET_API InterfaceAddress {
    int family;         ///< AF_INET or AF_INET6
    std::string ip;     ///< inet_ntop() text

    InterfaceAddress() : family(0) {}
    InterfaceAddress(int family_, const std::string& ip_) : family(family_), ip(ip_) {}
};

/**
 * @brief Reduce an address to dotted IPv4 form.
 *
 * IPv4 addresses are returned unchanged, IPv4-mapped IPv6 addresses
 * (::ffff:a.b.c.d) are unwrapped; anything else yields nullopt.
 */
DMSD_NET_API std::optional<std::string> toIPv4(const InterfaceAddress& address);

/**
 * @class InterfaceProvider
 * @brief Source of interface topology.
 *
 * Abstracted so the watcher and announcers can be driven by a fixed
 * topology in tests.
 */
class DMSD_NET_API InterfaceProvider {
public:
    virtual ~InterfaceProvider() = default;

    /**
     * @brief List every interface known to the system.
     * @return False if enumeration failed.
     */
    virtual bool listInterfaces(std::vector<NetworkInterface>& interfaces) = 0;

    /**
     * @brief List the current addresses of one interface.
     * @return False if enumeration failed.
     */
    virtual bool listAddresses(const NetworkInterface& iface,
                               std::vector<InterfaceAddress>& addresses) = 0;
};

/**
 * @class SystemInterfaceProvider
 * @brief getifaddrs()-backed InterfaceProvider.
 */
class DMSD_NET_API SystemInterfaceProvider : public InterfaceProvider {
public:
    bool listInterfaces(std::vector<NetworkInterface>& interfaces) override;
    bool listAddresses(const NetworkInterface& iface,
                       std::vector<InterfaceAddress>& addresses) override;
};

}  // namespace net
}  // namespace dmsd
