/**
 * @file uuid.cpp
 * @brief UUIDGenerator implementation.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/utils/uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace dmsd {
namespace utils {

std::string UUIDGenerator::generate() {
    std::random_device rd;

    Bytes bytes{};
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t word = rd();
        bytes[i] = static_cast<uint8_t>(word >> 24);
        bytes[i + 1] = static_cast<uint8_t>(word >> 16);
        bytes[i + 2] = static_cast<uint8_t>(word >> 8);
        bytes[i + 3] = static_cast<uint8_t>(word);
    }

    // Version 4 and variant 10xx per RFC 4122
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return format(bytes);
}

std::string UUIDGenerator::format(const Bytes& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }

    return oss.str();
}

bool UUIDGenerator::isValid(const std::string& uuid) {
    if (uuid.length() != 36) {
        return false;
    }

    for (size_t i = 0; i < uuid.length(); ++i) {
        char c = uuid[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else {
            if (!((c >= '0' && c <= '9') ||
                  (c >= 'a' && c <= 'f') ||
                  (c >= 'A' && c <= 'F'))) {
                return false;
            }
        }
    }

    return true;
}

}  // namespace utils
}  // namespace dmsd
