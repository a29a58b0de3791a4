/**
 * @file export.cpp
 * @brief Library information and error string functions
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "k1curve/core/common.h"
#include "k1curve/version.h"

extern "C" {

const char* k1curve_version(void) {
    return K1CURVE_VERSION_STRING;
}

const char* k1curve_platform(void) {
    return K1CURVE_PLATFORM_NAME;
}

const char* k1curve_error_string(k1curve_error_t error) {
    switch (error) {
        case K1CURVE_SUCCESS:
            return "Success";
        case K1CURVE_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case K1CURVE_ERROR_INVALID_COORDINATE:
            return "Coordinate is not below the field prime";
        case K1CURVE_ERROR_INVALID_POINT:
            return "Point is neither infinity nor on the curve";
        case K1CURVE_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"
