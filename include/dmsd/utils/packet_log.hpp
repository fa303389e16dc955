/**
 * @file packet_log.hpp
 * @brief Side-channel log of raw outgoing SSDP datagrams.
 *
 * Each record is written as "HH:MM:SS.uuuuuu sending <payload>\n" so
 * the exact bytes put on the wire can be inspected offline.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/utils/export.hpp"

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

namespace dmsd {
namespace utils {

/**
 * @class PacketLog
 * @brief Thread-safe append-only datagram log file.
 */
class DMSD_UTILS_API PacketLog {
public:
    PacketLog() = default;

    PacketLog(const PacketLog&) = delete;
    PacketLog& operator=(const PacketLog&) = delete;

    /**
     * @brief Create (truncate) the log file.
     * @return False if the file cannot be opened for writing.
     */
    bool open(const std::string& path);

    bool isOpen() const;

    /**
     * @brief Append one record for an outgoing datagram.
     *
     * Does nothing if the log is not open.
     */
    void record(const std::string& payload);

    void close();

    /**
     * @brief Format the time-of-day prefix, e.g. "13:04:05.000123".
     */
    static std::string timePrefix(std::chrono::system_clock::time_point when);

private:
    mutable std::mutex mutex_;
    std::ofstream file_;
    std::string path_;
};

}  // namespace utils
}  // namespace dmsd
