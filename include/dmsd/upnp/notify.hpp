/**
 * @file notify.hpp
 * @brief SSDP NOTIFY message encoding.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/upnp/descriptor.hpp"
#include "dmsd/upnp/export.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dmsd {
namespace upnp {

constexpr const char* kSsdpGroupAddress = "239.255.255.250";
constexpr uint16_t kSsdpPort = 1900;
constexpr const char* kSsdpAlive = "ssdp:alive";
constexpr const char* kRootDeviceTarget = "upnp:rootdevice";
constexpr const char* kServerBanner = "Linux/3.4 UPnP/1.1 DMS/1.0";

/**
 * @struct NotifySettings
 * @brief Fixed header values shared by every announcement.
 */
struct DMSD_UPNP_API NotifySettings {
    std::string groupAddress;
    uint16_t groupPort;
    int maxAgeSeconds;
    std::string serverBanner;
    std::string descriptorPath;

    NotifySettings()
        : groupAddress(kSsdpGroupAddress)
        , groupPort(kSsdpPort)
        , maxAgeSeconds(30)
        , serverBanner(kServerBanner)
        , descriptorPath(kDescriptorPath)
    {}
};

/**
 * @brief Unique Service Name for a target.
 * @return udn if target is the udn itself, else "udn::target".
 */
DMSD_UPNP_API std::string usnForTarget(const std::string& udn, const std::string& target);

/**
 * @brief Identities to announce, in order: upnp:rootdevice, the device
 *        type, each service type, the device UDN.
 */
DMSD_UPNP_API std::vector<std::string> announcementTargets(const DeviceInfo& device);

/**
 * @class NotifyEncoder
 * @brief Formats NOTIFY datagrams for one device identity.
 *
 * Encoding is pure: equal arguments always yield identical bytes.
 */
class DMSD_UPNP_API NotifyEncoder {
public:
    NotifyEncoder(const std::string& udn, const NotifySettings& settings);

    /**
     * @brief Encode one notification.
     * @param locationHost Address the LOCATION URL points at.
     * @param httpPort Port of the descriptor server.
     * @param target NT value.
     * @param subtype NTS value, e.g. "ssdp:alive".
     */
    std::string encode(const std::string& locationHost, uint16_t httpPort,
                       const std::string& target, const std::string& subtype) const;

    const std::string& udn() const { return udn_; }
    const NotifySettings& settings() const { return settings_; }

private:
    std::string udn_;
    NotifySettings settings_;
};

}  // namespace upnp
}  // namespace dmsd
