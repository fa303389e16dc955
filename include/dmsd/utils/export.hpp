/**
 * @file export.hpp
 * @brief Symbol visibility macros for dmsd_utils shared library.
 *
 * This header provides the DMSD_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#if defined(__GNUC__) || defined(__clang__)
    #if defined(DMSD_UTILS_BUILD)
        #define DMSD_UTILS_API __attribute__((visibility("default")))
    #else
        #define DMSD_UTILS_API
    #endif
#else
    #define DMSD_UTILS_API
#endif
