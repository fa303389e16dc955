/**
 * @file platform.hpp
 * @brief POSIX socket type definitions and includes.
 *
 * Interface enumeration and per-interface multicast membership rely on
 * Linux interfaces (getifaddrs, ip_mreqn), so only POSIX is supported.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>
#include <string>

namespace dmsd {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

/**
 * @brief Human readable text for a socket error code.
 */
inline std::string socketErrorString(int error) {
    return std::string(std::strerror(error)) + " (" + std::to_string(error) + ")";
}

}  // namespace net
}  // namespace dmsd
