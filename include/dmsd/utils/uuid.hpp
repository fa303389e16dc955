/**
 * @file uuid.hpp
 * @brief UUID v4 generation utilities.
 *
 * Generates random UUIDs from std::random_device. No external
 * dependencies required.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#include "dmsd/utils/export.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace dmsd {
namespace utils {

/**
 * @class UUIDGenerator
 * @brief UUID v4 generator.
 *
 * Generates RFC 4122 compliant version 4 (random) UUIDs.
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 * where x is any hex digit and y is one of 8, 9, a, or b.
 *
 * Usage:
 * @code
 * std::string id = UUIDGenerator::generate();
 * // Returns something like "550e8400-e29b-41d4-a716-446655440000"
 * @endcode
 */
class DMSD_UTILS_API UUIDGenerator {
public:
    using Bytes = std::array<uint8_t, 16>;

    /**
     * @brief Generate a new random UUID v4.
     * @return UUID string in standard lowercase format.
     * @throws std::exception if the system entropy source is unavailable.
     */
    static std::string generate();

    /**
     * @brief Format 16 raw bytes as a UUID string.
     *
     * The bytes are rendered as-is; version and variant bits are
     * not touched.
     */
    static std::string format(const Bytes& bytes);

    /**
     * @brief Validate if a string is a valid UUID format (8-4-4-4-12 hex).
     */
    static bool isValid(const std::string& uuid);

    /**
     * @brief Generate a nil UUID (all zeros).
     * @return "00000000-0000-0000-0000-000000000000"
     */
    static std::string nil() {
        return "00000000-0000-0000-0000-000000000000";
    }
};

}  // namespace utils
}  // namespace dmsd
