/**
 * @file environment.cpp
 * @brief System identity and environment providers.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/core/environment.hpp"
#include "dmsd/utils/logger.hpp"
#include "dmsd/utils/uuid.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <vector>

namespace dmsd {
namespace core {

std::string RandomIdentityProvider::deviceUdn() {
    return "uuid:" + utils::UUIDGenerator::generate();
}

std::optional<std::string> SystemEnvironment::hostName() {
    char name[HOST_NAME_MAX + 1] = {};
    if (gethostname(name, sizeof(name) - 1) != 0) {
        LOG_ERROR("Environment", "gethostname failed: {}", std::strerror(errno));
        return std::nullopt;
    }
    return std::string(name);
}

std::optional<std::string> SystemEnvironment::userName() {
    long suggested = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(suggested > 0 ? static_cast<size_t>(suggested) : 16384);

    struct passwd entry{};
    struct passwd* result = nullptr;

    int rc = getpwuid_r(getuid(), &entry, buffer.data(), buffer.size(), &result);
    if (rc != 0 || result == nullptr) {
        LOG_ERROR("Environment", "No password entry for uid {}: {}",
                  getuid(), rc != 0 ? std::strerror(rc) : "not found");
        return std::nullopt;
    }

    std::string fullName = result->pw_gecos ? result->pw_gecos : "";
    fullName = fullName.substr(0, fullName.find(','));
    if (!fullName.empty()) {
        return fullName;
    }
    return std::string(result->pw_name ? result->pw_name : "");
}

upnp::DeviceDescriptor describeLocalDevice(IdentityProvider& identity,
                                           EnvironmentFacts& environment) {
    std::string udn = identity.deviceUdn();

    auto host = environment.hostName();
    if (!host) {
        throw upnp::DescriptorError("Cannot determine host name");
    }

    auto user = environment.userName();
    if (!user) {
        throw upnp::DescriptorError("Cannot determine current user");
    }

    return upnp::makeMediaServerDescriptor(udn, *host, *user);
}

}  // namespace core
}  // namespace dmsd
