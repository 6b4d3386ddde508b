/**
 * @file export.hpp
 * @brief Symbol visibility macros for camfleet_utils library.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#if defined(__GNUC__) || defined(__clang__)
    #if defined(CAMFLEET_UTILS_BUILD)
        #define CAMFLEET_UTILS_API __attribute__((visibility("default")))
    #else
        #define CAMFLEET_UTILS_API
    #endif
#else
    #define CAMFLEET_UTILS_API
#endif
