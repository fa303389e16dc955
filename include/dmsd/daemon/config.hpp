/**
 * @file config.hpp
 * @brief dmsd daemon configuration and CLI parsing
 */

#pragma once

#include <string>
#include <cstdint>
#include <iostream>
#include <cstring>
#include <stdexcept>

namespace dmsd {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string log_level = "INFO";
    std::string ssdp_log = "ssdp.log";         ///< Packet log path, empty disables
    std::string http_bind = "0.0.0.0";
    uint16_t http_port = 0;                    ///< 0 = OS-assigned
    int64_t interval_ms = 1000;                ///< Announcement period per interface
    int multicast_ttl = 4;
    int max_age_s = 30;                        ///< CACHE-CONTROL max-age
    bool loopback = false;                     ///< Multicast loopback on SSDP sockets
    uint16_t status_port = 0;                  ///< Status gRPC port, 0 disables
    std::string status_bind = "127.0.0.1";
    bool help = false;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "dmsd - UPnP media server SSDP announcer\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --log-level <level>   Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --ssdp-log <path>     Packet log file, empty to disable (default: ssdp.log)\n"
              << "\nHTTP Options:\n"
              << "  --http-bind <addr>    Bind address for the descriptor server (default: 0.0.0.0)\n"
              << "  --http-port <port>    Descriptor server port, 0 = any (default: 0)\n"
              << "\nSSDP Options:\n"
              << "  --interval-ms <ms>    Announcement interval (default: 1000)\n"
              << "  --ttl <hops>          Multicast TTL (default: 4)\n"
              << "  --max-age <s>         CACHE-CONTROL max-age (default: 30)\n"
              << "  --loopback <0|1>      Multicast loopback (default: 0)\n"
              << "\nStatus Options:\n"
              << "  --status-port <port>  gRPC status port, 0 = disabled (default: 0)\n"
              << "  --status-bind <addr>  gRPC status bind address (default: 127.0.0.1)\n"
              << "\n  --help                Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --http-port 8200 --log-level DEBUG\n"
              << "  " << program_name << " --ssdp-log '' --status-port 50070\n";
}

/**
 * @brief Parse a port number, rejecting values outside 0..65535.
 */
inline uint16_t parsePort(const char* value) {
    int port = std::stoi(value);
    if (port < 0 || port > 65535) {
        throw std::out_of_range("port out of range");
    }
    return static_cast<uint16_t>(port);
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set on error
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--ssdp-log") == 0) {
                config.ssdp_log = value;
            } else if (std::strcmp(arg, "--http-bind") == 0) {
                config.http_bind = value;
            } else if (std::strcmp(arg, "--http-port") == 0) {
                config.http_port = parsePort(value);
            } else if (std::strcmp(arg, "--interval-ms") == 0) {
                config.interval_ms = std::stoll(value);
                if (config.interval_ms <= 0) {
                    throw std::out_of_range("interval must be positive");
                }
            } else if (std::strcmp(arg, "--ttl") == 0) {
                config.multicast_ttl = std::stoi(value);
                if (config.multicast_ttl < 0 || config.multicast_ttl > 255) {
                    throw std::out_of_range("ttl out of range");
                }
            } else if (std::strcmp(arg, "--max-age") == 0) {
                config.max_age_s = std::stoi(value);
                if (config.max_age_s < 0) {
                    throw std::out_of_range("max-age must not be negative");
                }
            } else if (std::strcmp(arg, "--loopback") == 0) {
                if (std::strcmp(value, "0") == 0) {
                    config.loopback = false;
                } else if (std::strcmp(value, "1") == 0) {
                    config.loopback = true;
                } else {
                    throw std::invalid_argument("expected 0 or 1");
                }
            } else if (std::strcmp(arg, "--status-port") == 0) {
                config.status_port = parsePort(value);
            } else if (std::strcmp(arg, "--status-bind") == 0) {
                config.status_bind = value;
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                return config;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid value '" << value << "' for " << arg
                      << " (" << e.what() << ")\n";
            config.help = true;
            return config;
        }
    }

    return config;
}

} // namespace daemon
} // namespace dmsd
