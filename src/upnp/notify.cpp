/**
 * @file notify.cpp
 * @brief NotifyEncoder implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/upnp/notify.hpp"

#include <sstream>
#include <utility>

namespace dmsd {
namespace upnp {

std::string usnForTarget(const std::string& udn, const std::string& target) {
    if (target == udn) {
        return udn;
    }
    return udn + "::" + target;
}

std::vector<std::string> announcementTargets(const DeviceInfo& device) {
    std::vector<std::string> targets;
    targets.reserve(device.services.size() + 3);

    targets.push_back(kRootDeviceTarget);
    targets.push_back(device.deviceType);
    for (const auto& service : device.services) {
        targets.push_back(service.serviceType);
    }
    targets.push_back(device.udn);

    return targets;
}

NotifyEncoder::NotifyEncoder(const std::string& udn, const NotifySettings& settings)
    : udn_(udn)
    , settings_(settings)
{
}

std::string NotifyEncoder::encode(const std::string& locationHost, uint16_t httpPort,
                                  const std::string& target,
                                  const std::string& subtype) const {
    const std::pair<const char*, std::string> fields[] = {
        {"HOST", settings_.groupAddress + ":" + std::to_string(settings_.groupPort)},
        {"CACHE-CONTROL", "max-age = " + std::to_string(settings_.maxAgeSeconds)},
        {"LOCATION", "http://" + locationHost + ":" + std::to_string(httpPort) +
                     settings_.descriptorPath},
        {"NT", target},
        {"NTS", subtype},
        {"SERVER", settings_.serverBanner},
        {"USN", usnForTarget(udn_, target)},
    };

    std::ostringstream oss;
    oss << "NOTIFY * HTTP/1.1\r\n";
    for (const auto& field : fields) {
        oss << field.first << ": " << field.second << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

}  // namespace upnp
}  // namespace dmsd
