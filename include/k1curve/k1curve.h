/**
 * @file k1curve.h
 * @brief k1curve - secp256k1 point arithmetic
 * 
 * Unified header for the library.
 * 
 * Modules:
 * - Field: mod_pow, mod_inverse and GF(p) helpers (GMP backed)
 * - Point: classification, negate, add, double_point, scalar_multiply
 * - C API: 32-byte big-endian wrappers returning k1curve_error_t
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef K1CURVE_H
#define K1CURVE_H

#include "k1curve/version.h"
#include "k1curve/core/common.h"
#include "k1curve/crypto/ecc/ecc.h"

#ifdef __cplusplus
#include "k1curve/crypto/ecc/ecc_error.h"
#include "k1curve/crypto/ecc/ecc_params.h"
#include "k1curve/crypto/ecc/field.h"
#include "k1curve/crypto/ecc/point.h"
#endif

#endif // K1CURVE_H
