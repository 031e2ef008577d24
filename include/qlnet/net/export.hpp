/**
 * @file export.hpp
 * @brief QLNET_NET_API visibility macro for qlnet_net.
 *
 * QLNET_NET_BUILD is defined while compiling the library itself.
 * QLNET_STATIC is defined for static builds, where no import or export
 * decoration applies.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#if defined(QLNET_STATIC)
    #define QLNET_NET_API
#elif defined(_WIN32)
    #if defined(QLNET_NET_BUILD)
        #define QLNET_NET_API __declspec(dllexport)
    #else
        #define QLNET_NET_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #define QLNET_NET_API __attribute__((visibility("default")))
#else
    #define QLNET_NET_API
#endif
