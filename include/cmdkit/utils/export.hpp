/**
 * @file export.hpp
 * @brief Symbol visibility macros for the cmdkit_utils shared library.
 *
 * This header provides the CMDKIT_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(CMDKIT_UTILS_BUILD)
        #define CMDKIT_UTILS_API __declspec(dllexport)
    #else
        #define CMDKIT_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(CMDKIT_UTILS_BUILD)
        #define CMDKIT_UTILS_API __attribute__((visibility("default")))
    #else
        #define CMDKIT_UTILS_API
    #endif
#else
    #define CMDKIT_UTILS_API
#endif
