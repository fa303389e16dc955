/**
 * @file status_service.hpp
 * @brief gRPC introspection service for the running announcer.
 *
 * AnnouncerStatus is read-only:
 * - GetDevice: identity, live HTTP port and announcement targets
 * - ListInterfaces: per-interface announcer state and counters
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/services/export.hpp"
#include "dmsd/core/interface_announcer.hpp"
#include "dmsd/upnp/descriptor.hpp"

#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Include generated gRPC service base
#include "dmsd/proto/status.grpc.pb.h"

namespace dmsd {
namespace services {

/**
 * @struct StatusSources
 * @brief Live views the service reads on every call.
 */
struct DMSD_SERVICES_API StatusSources {
    std::function<uint16_t()> httpPort;
    std::function<uint64_t()> httpRequests;
    std::function<std::vector<core::InterfaceStatus>()> interfaces;
};

/**
 * @class StatusServiceImpl
 * @brief Implementation of the AnnouncerStatus gRPC service.
 *
 * Usage:
 * @code
 * StatusSources sources;
 * sources.httpPort = [&] { return server.port(); };
 * sources.httpRequests = [&] { return server.requestCount(); };
 * sources.interfaces = [&] { return watcher.snapshot(); };
 * StatusServiceImpl service(descriptor.device, targets, sources);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("127.0.0.1:50052", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class DMSD_SERVICES_API StatusServiceImpl final : public status::AnnouncerStatus::CallbackService {
public:
    StatusServiceImpl(upnp::DeviceInfo device,
                      std::vector<std::string> targets,
                      StatusSources sources,
                      std::string locationPath = upnp::kDescriptorPath);

    ~StatusServiceImpl() override;

    grpc::ServerUnaryReactor* GetDevice(
        grpc::CallbackServerContext* context,
        const status::GetDeviceRequest* request,
        status::GetDeviceResponse* response) override;

    grpc::ServerUnaryReactor* ListInterfaces(
        grpc::CallbackServerContext* context,
        const status::ListInterfacesRequest* request,
        status::ListInterfacesResponse* response) override;

private:
    upnp::DeviceInfo device_;
    std::vector<std::string> targets_;
    StatusSources sources_;
    std::string locationPath_;
};

}  // namespace services
}  // namespace dmsd
