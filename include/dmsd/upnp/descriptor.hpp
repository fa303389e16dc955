/**
 * @file descriptor.hpp
 * @brief UPnP root device description document.
 *
 * Models the document served at /rootDesc.xml and serializes it with
 * libxml2's text writer.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/upnp/export.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace dmsd {
namespace upnp {

constexpr const char* kDeviceNamespace = "urn:schemas-upnp-org:device-1-0";
constexpr const char* kXmlDeclaration = "<?xml version=\"1.0\"?>";
constexpr const char* kMediaServerDeviceType = "urn:schemas-upnp-org:device:MediaServer:1";
constexpr const char* kModelName = "dms 1.0";
constexpr const char* kManufacturer = "Matt Joiner <anacrolix@gmail.com>";
constexpr const char* kDescriptorPath = "/rootDesc.xml";
constexpr const char* kDescriptorContentType = "text/xml; charset=\"utf-8\"";

/**
 * @class DescriptorError
 * @brief Thrown when the description document cannot be produced.
 */
class DMSD_UPNP_API DescriptorError : public std::runtime_error {
public:
    explicit DescriptorError(const std::string& what) : std::runtime_error(what) {}
};

struct DMSD_UPNP_API SpecVersion {
    int majorVersion;
    int minorVersion;

    SpecVersion() : majorVersion(1), minorVersion(0) {}
};

/**
 * @struct Icon
 * @brief Entry of the device iconList.
 */
struct DMSD_UPNP_API Icon {
    std::string mimetype;
    int width;
    int height;
    int depth;
    std::string url;

    Icon() : width(0), height(0), depth(0) {}
};

/**
 * @struct ServiceDescriptor
 * @brief Entry of the device serviceList.
 */
struct DMSD_UPNP_API ServiceDescriptor {
    std::string serviceType;
    std::string serviceId;
    std::string scpdUrl;
    std::string controlUrl;
    std::string eventSubUrl;
};

struct DMSD_UPNP_API DeviceInfo {
    std::string deviceType;
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    std::string udn;                        ///< "uuid:..." identity
    std::vector<Icon> icons;
    std::vector<ServiceDescriptor> services;
};

/**
 * @struct DeviceDescriptor
 * @brief The whole root description document.
 */
struct DMSD_UPNP_API DeviceDescriptor {
    unsigned configId;
    SpecVersion specVersion;
    DeviceInfo device;

    DeviceDescriptor() : configId(0) {}
};

/**
 * @brief The services this media server advertises (ContentDirectory).
 */
DMSD_UPNP_API const std::vector<ServiceDescriptor>& mediaServerServices();

/**
 * @brief "<model>: <user> on <host>".
 */
DMSD_UPNP_API std::string makeFriendlyName(const std::string& modelName,
                                           const std::string& userName,
                                           const std::string& hostName);

/**
 * @brief Populate the media server descriptor for one identity.
 * @param udn Device identity, "uuid:" prefixed.
 * @param hostName Local host name, used in the friendly name.
 * @param userName Current user, used in the friendly name.
 */
DMSD_UPNP_API DeviceDescriptor makeMediaServerDescriptor(const std::string& udn,
                                                         const std::string& hostName,
                                                         const std::string& userName);

/**
 * @brief Make a string safe for XML character data.
 *
 * Bytes that do not form valid UTF-8, and code points XML forbids
 * (most C0 controls), are replaced with U+FFFD.
 */
DMSD_UPNP_API std::string toXmlText(const std::string& text);

/**
 * @brief Serialize to XML: declaration line, then 2-space indented body.
 *
 * Every text and attribute value passes through toXmlText().
 * @throws DescriptorError if libxml2 reports a write failure.
 */
DMSD_UPNP_API std::string serializeDescriptor(const DeviceDescriptor& descriptor);

/**
 * @brief makeMediaServerDescriptor() followed by serializeDescriptor().
 */
DMSD_UPNP_API std::string buildDescriptorDocument(const std::string& udn,
                                                  const std::string& hostName,
                                                  const std::string& userName);

}  // namespace upnp
}  // namespace dmsd
