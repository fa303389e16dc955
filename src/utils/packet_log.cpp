/**
 * @file packet_log.cpp
 * @brief PacketLog implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/utils/packet_log.hpp"
#include "dmsd/utils/logger.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace dmsd {
namespace utils {

bool PacketLog::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    file_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file_.is_open()) {
        LOG_ERROR("PacketLog", "Failed to create {}", path);
        return false;
    }

    path_ = path;
    LOG_DEBUG("PacketLog", "Recording outgoing datagrams to {}", path_);
    return true;
}

bool PacketLog::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void PacketLog::record(const std::string& payload) {
    std::string prefix = timePrefix(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }

    file_ << prefix << " sending " << payload << '\n';
    file_.flush();
    if (!file_) {
        LOG_WARN("PacketLog", "Write to {} failed", path_);
        file_.clear();
    }
}

void PacketLog::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

std::string PacketLog::timePrefix(std::chrono::system_clock::time_point when) {
    auto time_t_when = std::chrono::system_clock::to_time_t(when);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        when.time_since_epoch()) % 1000000;

    std::tm tm_buf{};
    localtime_r(&time_t_when, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << "." << std::setfill('0') << std::setw(6) << us.count();
    return oss.str();
}

}  // namespace utils
}  // namespace dmsd
