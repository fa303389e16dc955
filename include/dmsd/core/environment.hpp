/**
 * @file environment.hpp
 * @brief Runtime facts the device description depends on.
 *
 * Identity and host facts are read through small interfaces so the
 * descriptor can be produced deterministically in tests.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/core/export.hpp"
#include "dmsd/upnp/descriptor.hpp"

#include <optional>
#include <string>

namespace dmsd {
namespace core {

/**
 * @class IdentityProvider
 * @brief Source of the device UDN ("uuid:" + UUID).
 */
class DMSD_CORE_API IdentityProvider {
public:
    virtual ~IdentityProvider() = default;

    /**
     * @throws std::exception if no identity can be produced.
     */
    virtual std::string deviceUdn() = 0;
};

/**
 * @class RandomIdentityProvider
 * @brief Fresh random UUID v4 per call.
 */
class DMSD_CORE_API RandomIdentityProvider : public IdentityProvider {
public:
    std::string deviceUdn() override;
};

/**
 * @class EnvironmentFacts
 * @brief Host name and user name lookups.
 */
class DMSD_CORE_API EnvironmentFacts {
public:
    virtual ~EnvironmentFacts() = default;

    virtual std::optional<std::string> hostName() = 0;
    virtual std::optional<std::string> userName() = 0;
};

/**
 * @class SystemEnvironment
 * @brief gethostname() and the password database.
 *
 * userName() prefers the account's full name (first GECOS field) and
 * falls back to the login name.
 */
class DMSD_CORE_API SystemEnvironment : public EnvironmentFacts {
public:
    std::optional<std::string> hostName() override;
    std::optional<std::string> userName() override;
};

/**
 * @brief Build the media server descriptor from injected facts.
 * @throws upnp::DescriptorError if host or user cannot be resolved.
 */
DMSD_CORE_API upnp::DeviceDescriptor describeLocalDevice(IdentityProvider& identity,
                                                         EnvironmentFacts& environment);

}  // namespace core
}  // namespace dmsd
