/**
 * @file export.hpp
 * @brief Symbol visibility macros for dmsd_core shared library.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#if defined(__GNUC__) || defined(__clang__)
    #if defined(DMSD_CORE_BUILD)
        #define DMSD_CORE_API __attribute__((visibility("default")))
    #else
        #define DMSD_CORE_API
    #endif
#else
    #define DMSD_CORE_API
#endif
