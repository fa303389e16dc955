/**
 * @file export.hpp
 * @brief Symbol visibility macros for dmsd_services shared library.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#pragma once

#if defined(__GNUC__) || defined(__clang__)
    #if defined(DMSD_SERVICES_BUILD)
        #define DMSD_SERVICES_API __attribute__((visibility("default")))
    #else
        #define DMSD_SERVICES_API
    #endif
#else
    #define DMSD_SERVICES_API
#endif
