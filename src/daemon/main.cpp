/**
 * @file main.cpp
 * @brief dmsd daemon entry point
 *
 * This is the thin executable that wires together all the library components:
 * - Descriptor document built from the host identity
 * - HTTP server publishing the descriptor
 * - Interface watcher starting one SSDP announcer per usable interface
 * - Optional gRPC status service
 */

#include <dmsd/daemon/config.hpp>
#include <dmsd/utils/logger.hpp>
#include <dmsd/utils/packet_log.hpp>
#include <dmsd/net/interfaces.hpp>
#include <dmsd/upnp/descriptor.hpp>
#include <dmsd/upnp/notify.hpp>
#include <dmsd/core/environment.hpp>
#include <dmsd/core/interface_watcher.hpp>
#include <dmsd/core/multicast_channel.hpp>
#include <dmsd/services/descriptor_server.hpp>
#include <dmsd/services/status_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <unistd.h>

#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

using namespace dmsd;
using namespace dmsd::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Configure logging
    utils::LogLevel level;
    if (!utils::parseLogLevel(config.log_level, level)) {
        std::cerr << "Error: Unknown log level " << config.log_level << "\n";
        printUsage(argv[0]);
        return 1;
    }
    utils::Logger::instance().setLevel(level);
    utils::Logger::instance().setColorEnabled(isatty(STDERR_FILENO) != 0);

    LOG_INFO("Daemon", "dmsd starting...");

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        // Device identity and descriptor document
        core::RandomIdentityProvider identity;
        core::SystemEnvironment environment;
        upnp::DeviceDescriptor descriptor = core::describeLocalDevice(identity, environment);
        std::string document = upnp::serializeDescriptor(descriptor);

        LOG_INFO("Daemon", "Device UDN: {}", descriptor.device.udn);
        LOG_INFO("Daemon", "Friendly name: {}", descriptor.device.friendlyName);
        LOG_DEBUG("Daemon", "Descriptor:\n{}", document);

        // HTTP server must be bound before the first announcement
        services::HttpServerConfig http_config;
        http_config.bind_addr = config.http_bind;
        http_config.port = config.http_port;

        services::DescriptorServer http_server(http_config);
        http_server.addDocument(upnp::kDescriptorPath, upnp::kDescriptorContentType, document);

        if (!http_server.start()) {
            LOG_FATAL("Daemon", "Failed to start HTTP server on {}:{}",
                      config.http_bind, config.http_port);
            return 1;
        }
        LOG_INFO("Daemon", "HTTP server on port {}", http_server.port());

        // Packet log
        std::shared_ptr<utils::PacketLog> packet_log;
        if (!config.ssdp_log.empty()) {
            packet_log = std::make_shared<utils::PacketLog>();
            if (!packet_log->open(config.ssdp_log)) {
                LOG_FATAL("Daemon", "Cannot create packet log {}", config.ssdp_log);
                return 1;
            }
            LOG_INFO("Daemon", "Logging SSDP packets to {}", config.ssdp_log);
        }

        // Shared announcer state
        upnp::NotifySettings notify_settings;
        notify_settings.maxAgeSeconds = config.max_age_s;

        auto context = std::make_shared<core::AnnouncerContext>();
        context->encoder = std::make_shared<upnp::NotifyEncoder>(
            descriptor.device.udn, notify_settings);
        context->targets = upnp::announcementTargets(descriptor.device);
        context->httpPort = [&http_server]() { return http_server.port(); };
        context->packetLog = packet_log;
        context->interval = std::chrono::milliseconds(config.interval_ms);

        core::ChannelConfig channel_config;
        channel_config.multicastTtl = config.multicast_ttl;
        channel_config.loopback = config.loopback;

        net::SystemInterfaceProvider interface_provider;
        core::InterfaceWatcher watcher(
            context,
            interface_provider,
            [channel_config](const net::NetworkInterface&) {
                return std::make_unique<core::UdpMulticastChannel>(channel_config);
            });

        watcher.start();
        LOG_INFO("Daemon", "Interface watcher started");

        // Optional status service
        std::unique_ptr<services::StatusServiceImpl> status_service;
        std::unique_ptr<grpc::Server> status_server;
        if (config.status_port != 0) {
            services::StatusSources sources;
            sources.httpPort = [&http_server]() { return http_server.port(); };
            sources.httpRequests = [&http_server]() { return http_server.requestCount(); };
            sources.interfaces = [&watcher]() { return watcher.snapshot(); };

            status_service = std::make_unique<services::StatusServiceImpl>(
                descriptor.device, context->targets, sources);

            std::string status_addr = config.status_bind + ":" + std::to_string(config.status_port);
            grpc::ServerBuilder status_builder;
            status_builder.AddListeningPort(status_addr, grpc::InsecureServerCredentials());
            status_builder.RegisterService(status_service.get());
            status_server = status_builder.BuildAndStart();

            if (!status_server) {
                LOG_FATAL("Daemon", "Failed to start status server on {}", status_addr);
                return 1;
            }
            LOG_INFO("Daemon", "Status server listening on {}", status_addr);
        }

        LOG_INFO("Daemon", "dmsd is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        watcher.stop();
        http_server.stop();

        if (status_server) {
            auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
            status_server->Shutdown(deadline);
        }

        if (packet_log) {
            packet_log->close();
        }

        LOG_INFO("Daemon", "dmsd stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_FATAL("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
