/**
 * @file common.h
 * @brief Common definitions and utility macros for k1curve library
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef K1CURVE_CORE_COMMON_H
#define K1CURVE_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define K1CURVE_PLATFORM_WINDOWS 1
    #define K1CURVE_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define K1CURVE_PLATFORM_LINUX 1
    #define K1CURVE_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define K1CURVE_PLATFORM_MACOS 1
    #define K1CURVE_PLATFORM_NAME "macOS"
#else
    #define K1CURVE_PLATFORM_UNKNOWN 1
    #define K1CURVE_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef K1CURVE_PLATFORM_WINDOWS
    #ifdef K1CURVE_SHARED_LIBRARY
        #ifdef K1CURVE_BUILDING
            #define K1CURVE_API __declspec(dllexport)
        #else
            #define K1CURVE_API __declspec(dllimport)
        #endif
    #else
        #define K1CURVE_API
    #endif
#else
    #ifdef K1CURVE_SHARED_LIBRARY
        #define K1CURVE_API __attribute__((visibility("default")))
    #else
        #define K1CURVE_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    K1CURVE_SUCCESS = 0,
    K1CURVE_ERROR_INVALID_PARAM = -1,       // Null pointer or bad length
    K1CURVE_ERROR_INVALID_COORDINATE = -2,  // Coordinate >= field prime
    K1CURVE_ERROR_INVALID_POINT = -3,       // Neither infinity nor on curve
    K1CURVE_ERROR_INTERNAL = -10
} k1curve_error_t;

// Field element / coordinate size (secp256k1)
#define K1CURVE_FIELD_BYTES 32

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
K1CURVE_API const char* k1curve_error_string(k1curve_error_t error);

/**
 * @brief Library version string ("major.minor.patch")
 */
K1CURVE_API const char* k1curve_version(void);

/**
 * @brief Name of the platform the library was built for
 */
K1CURVE_API const char* k1curve_platform(void);

#ifdef __cplusplus
}
#endif

#endif // K1CURVE_CORE_COMMON_H
