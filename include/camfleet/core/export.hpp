/**
 * @file export.hpp
 * @brief Symbol visibility macros for camfleet_core library.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#if defined(__GNUC__) || defined(__clang__)
    #if defined(CAMFLEET_CORE_BUILD)
        #define CAMFLEET_CORE_API __attribute__((visibility("default")))
    #else
        #define CAMFLEET_CORE_API
    #endif
#else
    #define CAMFLEET_CORE_API
#endif
