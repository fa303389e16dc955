/**
 * @file status_service.cpp
 * @brief StatusServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/services/status_service.hpp"
#include "dmsd/utils/logger.hpp"

namespace dmsd {
namespace services {

StatusServiceImpl::StatusServiceImpl(upnp::DeviceInfo device,
                                     std::vector<std::string> targets,
                                     StatusSources sources,
                                     std::string locationPath)
    : device_(std::move(device))
    , targets_(std::move(targets))
    , sources_(std::move(sources))
    , locationPath_(std::move(locationPath))
{
    LOG_DEBUG("StatusService", "Status service created for {}", device_.udn);
}

StatusServiceImpl::~StatusServiceImpl() = default;

// =============================================================================
// GetDevice
// =============================================================================

class GetDeviceReactor : public grpc::ServerUnaryReactor {
public:
    GetDeviceReactor(const upnp::DeviceInfo& device,
                     const std::vector<std::string>& targets,
                     const StatusSources& sources,
                     const std::string& locationPath,
                     status::GetDeviceResponse* response)
    {
        response->set_udn(device.udn);
        response->set_friendly_name(device.friendlyName);
        response->set_device_type(device.deviceType);
        response->set_location_path(locationPath);
        response->set_http_port(sources.httpPort ? sources.httpPort() : 0);
        response->set_http_requests(sources.httpRequests ? sources.httpRequests() : 0);
        for (const auto& target : targets) {
            response->add_targets(target);
        }

        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* StatusServiceImpl::GetDevice(
    grpc::CallbackServerContext* context,
    const status::GetDeviceRequest* /*request*/,
    status::GetDeviceResponse* response) {

    LOG_TRACE("StatusService", "GetDevice from {}", context->peer());
    return new GetDeviceReactor(device_, targets_, sources_, locationPath_, response);
}

// =============================================================================
// ListInterfaces
// =============================================================================

class ListInterfacesReactor : public grpc::ServerUnaryReactor {
public:
    ListInterfacesReactor(const StatusSources& sources,
                          const status::ListInterfacesRequest* request,
                          status::ListInterfacesResponse* response)
    {
        if (!sources.interfaces) {
            Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE, "interface watcher not attached"));
            return;
        }

        for (const auto& iface : sources.interfaces()) {
            if (request->announcing_only() &&
                iface.state != core::AnnouncerState::ANNOUNCING) {
                continue;
            }

            auto* info = response->add_interfaces();
            info->set_index(iface.index);
            info->set_name(iface.name);
            info->set_state(core::announcerStateToString(iface.state));
            for (const auto& address : iface.addresses) {
                info->add_addresses(address);
            }
            info->set_messages_sent(iface.messagesSent);
            info->set_send_failures(iface.sendFailures);
            info->set_ticks(iface.ticks);
        }

        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* StatusServiceImpl::ListInterfaces(
    grpc::CallbackServerContext* context,
    const status::ListInterfacesRequest* request,
    status::ListInterfacesResponse* response) {

    LOG_TRACE("StatusService", "ListInterfaces from {}", context->peer());
    return new ListInterfacesReactor(sources_, request, response);
}

}  // namespace services
}  // namespace dmsd
