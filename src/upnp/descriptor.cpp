/**
 * @file descriptor.cpp
 * @brief Root device description document construction and serialization.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/upnp/descriptor.hpp"
#include "dmsd/utils/logger.hpp"

#include <libxml/chvalid.h>
#include <libxml/xmlstring.h>
#include <libxml/xmlwriter.h>

#include <algorithm>
#include <memory>

namespace dmsd {
namespace upnp {

namespace {

struct XmlBufferDeleter {
    void operator()(xmlBuffer* buffer) const { xmlBufferFree(buffer); }
};

struct XmlWriterDeleter {
    void operator()(xmlTextWriter* writer) const { xmlFreeTextWriter(writer); }
};

const xmlChar* xml(const char* text) {
    return reinterpret_cast<const xmlChar*>(text);
}

// U+FFFD REPLACEMENT CHARACTER
constexpr char kReplacementChar[] = "\xEF\xBF\xBD";

}  // namespace

std::string toXmlText(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());

    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    size_t pos = 0;

    while (pos < text.size()) {
        int len = static_cast<int>(std::min<size_t>(text.size() - pos, 4));
        int codepoint = xmlGetUTF8Char(bytes + pos, &len);

        if (codepoint < 0 || len <= 0) {
            // One replacement per offending byte, then resync
            clean += kReplacementChar;
            ++pos;
            continue;
        }

        if (xmlIsCharQ(codepoint)) {
            clean.append(text, pos, static_cast<size_t>(len));
        } else {
            clean += kReplacementChar;
        }
        pos += static_cast<size_t>(len);
    }

    return clean;
}

namespace {

/**
 * Thin throwing facade over xmlTextWriter calls.
 */
class DocumentWriter {
public:
    explicit DocumentWriter(xmlTextWriter* writer) : writer_(writer) {}

    void startDocument() {
        check(xmlTextWriterStartDocument(writer_, nullptr, nullptr, nullptr), "start document");
    }

    void endDocument() {
        check(xmlTextWriterEndDocument(writer_), "end document");
    }

    void start(const char* name) {
        check(xmlTextWriterStartElement(writer_, xml(name)), name);
    }

    void end() {
        check(xmlTextWriterEndElement(writer_), "end element");
    }

    void attribute(const char* name, const std::string& value) {
        check(xmlTextWriterWriteAttribute(writer_, xml(name), xml(toXmlText(value).c_str())), name);
    }

    void element(const char* name, const std::string& text) {
        check(xmlTextWriterWriteElement(writer_, xml(name), xml(toXmlText(text).c_str())), name);
    }

    void element(const char* name, long value) {
        element(name, std::to_string(value));
    }

private:
    static void check(int rc, const char* what) {
        if (rc < 0) {
            throw DescriptorError(std::string("XML writer failed at ") + what);
        }
    }

    xmlTextWriter* writer_;
};

void writeDevice(DocumentWriter& out, const DeviceInfo& device) {
    out.start("device");
    out.element("deviceType", device.deviceType);
    out.element("friendlyName", device.friendlyName);
    out.element("manufacturer", device.manufacturer);
    out.element("modelName", device.modelName);
    out.element("UDN", device.udn);

    // UPnP requires at least one icon inside iconList; omit the list when empty
    if (!device.icons.empty()) {
        out.start("iconList");
        for (const auto& icon : device.icons) {
            out.start("icon");
            out.element("mimetype", icon.mimetype);
            out.element("width", icon.width);
            out.element("height", icon.height);
            out.element("depth", icon.depth);
            out.element("url", icon.url);
            out.end();
        }
        out.end();
    }

    out.start("serviceList");
    for (const auto& service : device.services) {
        out.start("service");
        out.element("serviceType", service.serviceType);
        out.element("serviceId", service.serviceId);
        out.element("SCPDURL", service.scpdUrl);
        out.element("controlURL", service.controlUrl);
        out.element("eventSubURL", service.eventSubUrl);
        out.end();
    }
    out.end();

    out.end();
}

}  // namespace

const std::vector<ServiceDescriptor>& mediaServerServices() {
    static const std::vector<ServiceDescriptor> services = {
        {
            "urn:schemas-upnp-org:service:ContentDirectory:1",
            "urn:upnp-org:serviceId:ContentDirectory",
            "/scpd/ContentDirectory.xml",
            "/ctl/ContentDirectory",
            "/evt/ContentDirectory",
        },
    };
    return services;
}

std::string makeFriendlyName(const std::string& modelName,
                             const std::string& userName,
                             const std::string& hostName) {
    return modelName + ": " + userName + " on " + hostName;
}

DeviceDescriptor makeMediaServerDescriptor(const std::string& udn,
                                           const std::string& hostName,
                                           const std::string& userName) {
    DeviceDescriptor descriptor;
    descriptor.device.deviceType = kMediaServerDeviceType;
    descriptor.device.friendlyName = makeFriendlyName(kModelName, userName, hostName);
    descriptor.device.manufacturer = kManufacturer;
    descriptor.device.modelName = kModelName;
    descriptor.device.udn = udn;
    descriptor.device.services = mediaServerServices();
    return descriptor;
}

std::string serializeDescriptor(const DeviceDescriptor& descriptor) {
    std::unique_ptr<xmlBuffer, XmlBufferDeleter> buffer(xmlBufferCreate());
    if (!buffer) {
        throw DescriptorError("Cannot allocate XML buffer");
    }

    std::unique_ptr<xmlTextWriter, XmlWriterDeleter> writer(
        xmlNewTextWriterMemory(buffer.get(), 0));
    if (!writer) {
        throw DescriptorError("Cannot create XML writer");
    }

    xmlTextWriterSetIndent(writer.get(), 1);
    xmlTextWriterSetIndentString(writer.get(), xml("  "));

    DocumentWriter out(writer.get());
    out.startDocument();

    out.start("root");
    out.attribute("xmlns", kDeviceNamespace);
    out.attribute("configId", std::to_string(descriptor.configId));

    out.start("specVersion");
    out.element("major", descriptor.specVersion.majorVersion);
    out.element("minor", descriptor.specVersion.minorVersion);
    out.end();

    writeDevice(out, descriptor.device);

    out.end();
    out.endDocument();

    // Releasing the writer flushes everything into the buffer
    writer.reset();

    std::string document(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())),
                         static_cast<size_t>(xmlBufferLength(buffer.get())));

    if (document.compare(0, std::char_traits<char>::length(kXmlDeclaration),
                         kXmlDeclaration) != 0) {
        throw DescriptorError("Serialized document lacks the XML declaration");
    }

    return document;
}

std::string buildDescriptorDocument(const std::string& udn,
                                    const std::string& hostName,
                                    const std::string& userName) {
    std::string document = serializeDescriptor(
        makeMediaServerDescriptor(udn, hostName, userName));
    LOG_DEBUG("Descriptor", "Built {} byte descriptor for {}", document.size(), udn);
    return document;
}

}  // namespace upnp
}  // namespace dmsd
