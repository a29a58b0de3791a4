/**
 * @file version.h
 * @brief Unified Version Information for k1curve Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef K1CURVE_VERSION_H
#define K1CURVE_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define K1CURVE_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define K1CURVE_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define K1CURVE_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define K1CURVE_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define K1CURVE_VERSION_NUMBER ((K1CURVE_VERSION_MAJOR * 10000) + \
                                (K1CURVE_VERSION_MINOR * 100) + \
                                K1CURVE_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define K1CURVE_RELEASE_DATE "2026-10-19"

/** Library name */
#define K1CURVE_LIBRARY_NAME "k1curve"

/** Full library description */
#define K1CURVE_DESCRIPTION "secp256k1 affine point arithmetic"

/** Build type identifier */
#ifdef NDEBUG
#define K1CURVE_BUILD_TYPE "Release"
#else
#define K1CURVE_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 * @param major Major version to check
 * @param minor Minor version to check
 * @param patch Patch version to check
 * @return Non-zero if current version >= specified version
 */
#define K1CURVE_VERSION_AT_LEAST(major, minor, patch) \
    (K1CURVE_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */ // end of Version group

#endif // K1CURVE_VERSION_H
