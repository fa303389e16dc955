/**
 * @file test_descriptor.cpp
 * @brief Unit tests for the device description document
 *
 * Documents are parsed back with libxml2 and inspected through XPath.
 */

#include <gtest/gtest.h>
#include <dmsd/upnp/descriptor.hpp>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

#include <memory>
#include <string>
#include <vector>

using namespace dmsd::upnp;

namespace {

const char* kUdn = "uuid:aaaaaaaa-bbbb-cccc-dddd-eeeeeeeeeeee";

/**
 * Parsed document with namespace-aware XPath lookups ("d:" prefix).
 */
class ParsedDocument {
public:
    explicit ParsedDocument(const std::string& text)
        : doc_(xmlReadMemory(text.data(), static_cast<int>(text.size()),
                             "rootDesc.xml", nullptr, XML_PARSE_NONET),
               &xmlFreeDoc)
    {
        if (doc_) {
            ctx_.reset(xmlXPathNewContext(doc_.get()));
            xmlXPathRegisterNs(ctx_.get(), BAD_CAST "d", BAD_CAST kDeviceNamespace);
        }
    }

    bool ok() const { return doc_ && ctx_; }

    std::vector<std::string> all(const std::string& expr) const {
        std::vector<std::string> values;
        std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)> result(
            xmlXPathEvalExpression(BAD_CAST expr.c_str(), ctx_.get()), &xmlXPathFreeObject);
        if (!result || !result->nodesetval) {
            return values;
        }
        for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
            xmlChar* content = xmlNodeGetContent(result->nodesetval->nodeTab[i]);
            values.emplace_back(content ? reinterpret_cast<const char*>(content) : "");
            xmlFree(content);
        }
        return values;
    }

    std::string one(const std::string& expr) const {
        auto values = all(expr);
        return values.size() == 1 ? values[0] : "<" + std::to_string(values.size()) + " nodes>";
    }

private:
    std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc_;
    std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)> ctx_{
        nullptr, &xmlXPathFreeContext};
};

}  // namespace

TEST(DescriptorTest, FriendlyName) {
    EXPECT_EQ(makeFriendlyName("dms 1.0", "Alice Doe", "mediabox"),
              "dms 1.0: Alice Doe on mediabox");
}

TEST(DescriptorTest, MediaServerDefaults) {
    DeviceDescriptor descriptor = makeMediaServerDescriptor(kUdn, "mediabox", "alice");

    EXPECT_EQ(descriptor.configId, 0u);
    EXPECT_EQ(descriptor.specVersion.majorVersion, 1);
    EXPECT_EQ(descriptor.specVersion.minorVersion, 0);
    EXPECT_EQ(descriptor.device.deviceType, kMediaServerDeviceType);
    EXPECT_EQ(descriptor.device.friendlyName, "dms 1.0: alice on mediabox");
    EXPECT_EQ(descriptor.device.modelName, kModelName);
    EXPECT_EQ(descriptor.device.udn, kUdn);
    EXPECT_TRUE(descriptor.device.icons.empty());

    ASSERT_EQ(descriptor.device.services.size(), 1u);
    const ServiceDescriptor& cds = descriptor.device.services[0];
    EXPECT_EQ(cds.serviceType, "urn:schemas-upnp-org:service:ContentDirectory:1");
    EXPECT_EQ(cds.serviceId, "urn:upnp-org:serviceId:ContentDirectory");
    EXPECT_EQ(cds.scpdUrl, "/scpd/ContentDirectory.xml");
    EXPECT_EQ(cds.controlUrl, "/ctl/ContentDirectory");
    EXPECT_EQ(cds.eventSubUrl, "/evt/ContentDirectory");
}

TEST(DescriptorTest, StartsWithXmlDeclaration) {
    std::string document = buildDescriptorDocument(kUdn, "mediabox", "alice");
    EXPECT_EQ(document.compare(0, std::string(kXmlDeclaration).size(), kXmlDeclaration), 0)
        << document.substr(0, 40);
}

TEST(DescriptorTest, RoundTripsThroughParser) {
    ParsedDocument parsed(buildDescriptorDocument(kUdn, "mediabox", "alice"));
    ASSERT_TRUE(parsed.ok());

    EXPECT_EQ(parsed.one("/d:root/@configId"), "0");
    EXPECT_EQ(parsed.one("/d:root/d:specVersion/d:major"), "1");
    EXPECT_EQ(parsed.one("/d:root/d:specVersion/d:minor"), "0");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:deviceType"), kMediaServerDeviceType);
    EXPECT_EQ(parsed.one("/d:root/d:device/d:friendlyName"), "dms 1.0: alice on mediabox");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:manufacturer"), kManufacturer);
    EXPECT_EQ(parsed.one("/d:root/d:device/d:modelName"), kModelName);
    EXPECT_EQ(parsed.one("/d:root/d:device/d:UDN"), kUdn);

    EXPECT_EQ(parsed.one("/d:root/d:device/d:serviceList/d:service/d:serviceType"),
              "urn:schemas-upnp-org:service:ContentDirectory:1");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:serviceList/d:service/d:SCPDURL"),
              "/scpd/ContentDirectory.xml");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:serviceList/d:service/d:controlURL"),
              "/ctl/ContentDirectory");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:serviceList/d:service/d:eventSubURL"),
              "/evt/ContentDirectory");

    EXPECT_TRUE(parsed.all("/d:root/d:device/d:iconList").empty());
}

TEST(DescriptorTest, EscapesMarkupInText) {
    // The default manufacturer carries '<' and '>'; names may carry '&'
    std::string document = buildDescriptorDocument(kUdn, "box<1>", "Tom & Jerry");
    EXPECT_EQ(document.find("Tom & Jerry"), std::string::npos);

    ParsedDocument parsed(document);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.one("/d:root/d:device/d:friendlyName"), "dms 1.0: Tom & Jerry on box<1>");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:manufacturer"), kManufacturer);
}

TEST(DescriptorTest, ReplacesInvalidUtf8InNames) {
    // Latin-1 GECOS entry ("René") and a stray control byte in the host name
    std::string document = buildDescriptorDocument(kUdn, "box\x01", "Ren\xe9");

    ParsedDocument parsed(document);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.one("/d:root/d:device/d:friendlyName"),
              "dms 1.0: Ren\xEF\xBF\xBD on box\xEF\xBF\xBD");
}

TEST(DescriptorTest, XmlTextKeepsValidUtf8) {
    EXPECT_EQ(toXmlText("Ren\xC3\xA9 \xE6\x97\xA5\tok\n"), "Ren\xC3\xA9 \xE6\x97\xA5\tok\n");
    EXPECT_EQ(toXmlText("a\xC3"), "a\xEF\xBF\xBD");
    EXPECT_EQ(toXmlText(std::string("a\0b", 3)), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(toXmlText(""), "");
}

TEST(DescriptorTest, WritesIconsAndCustomServices) {
    DeviceDescriptor descriptor = makeMediaServerDescriptor(kUdn, "mediabox", "alice");
    descriptor.configId = 7;

    Icon icon;
    icon.mimetype = "image/png";
    icon.width = 48;
    icon.height = 48;
    icon.depth = 24;
    icon.url = "/icons/48.png";
    descriptor.device.icons.push_back(icon);

    ServiceDescriptor cm;
    cm.serviceType = "urn:schemas-upnp-org:service:ConnectionManager:1";
    cm.serviceId = "urn:upnp-org:serviceId:ConnectionManager";
    cm.scpdUrl = "/scpd/ConnectionManager.xml";
    cm.controlUrl = "/ctl/ConnectionManager";
    cm.eventSubUrl = "/evt/ConnectionManager";
    descriptor.device.services.push_back(cm);

    ParsedDocument parsed(serializeDescriptor(descriptor));
    ASSERT_TRUE(parsed.ok());

    EXPECT_EQ(parsed.one("/d:root/@configId"), "7");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:iconList/d:icon/d:mimetype"), "image/png");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:iconList/d:icon/d:width"), "48");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:iconList/d:icon/d:depth"), "24");
    EXPECT_EQ(parsed.one("/d:root/d:device/d:iconList/d:icon/d:url"), "/icons/48.png");

    auto types = parsed.all("/d:root/d:device/d:serviceList/d:service/d:serviceType");
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0], "urn:schemas-upnp-org:service:ContentDirectory:1");
    EXPECT_EQ(types[1], "urn:schemas-upnp-org:service:ConnectionManager:1");
}

TEST(DescriptorTest, SerializationIsDeterministic) {
    DeviceDescriptor descriptor = makeMediaServerDescriptor(kUdn, "mediabox", "alice");
    EXPECT_EQ(serializeDescriptor(descriptor), serializeDescriptor(descriptor));
}
