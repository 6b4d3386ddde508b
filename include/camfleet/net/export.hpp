/**
 * @file export.hpp
 * @brief Symbol visibility macros for camfleet_net library.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#if defined(__GNUC__) || defined(__clang__)
    #if defined(CAMFLEET_NET_BUILD)
        #define CAMFLEET_NET_API __attribute__((visibility("default")))
    #else
        #define CAMFLEET_NET_API
    #endif
#else
    #define CAMFLEET_NET_API
#endif
