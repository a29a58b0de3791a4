/**
 * @file ecc.h
 * @brief secp256k1 point arithmetic - C interface
 * 
 * Coordinates are K1CURVE_FIELD_BYTES (32) byte big-endian buffers. The
 * point at infinity is the all-zero pair. Output buffers may alias inputs.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef K1CURVE_CRYPTO_ECC_H
#define K1CURVE_CRYPTO_ECC_H

#include "k1curve/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

K1CURVE_API k1curve_error_t k1curve_ec_generator(uint8_t out_x[32], uint8_t out_y[32]);

K1CURVE_API k1curve_error_t k1curve_ec_is_infinity(const uint8_t x[32], const uint8_t y[32], int* result);
K1CURVE_API k1curve_error_t k1curve_ec_is_on_curve(const uint8_t x[32], const uint8_t y[32], int* result);

K1CURVE_API k1curve_error_t k1curve_ec_negate(const uint8_t x[32], const uint8_t y[32],
                                              uint8_t out_x[32], uint8_t out_y[32]);
K1CURVE_API k1curve_error_t k1curve_ec_add(const uint8_t x1[32], const uint8_t y1[32],
                                           const uint8_t x2[32], const uint8_t y2[32],
                                           uint8_t out_x[32], uint8_t out_y[32]);
K1CURVE_API k1curve_error_t k1curve_ec_double(const uint8_t x[32], const uint8_t y[32],
                                              uint8_t out_x[32], uint8_t out_y[32]);

/**
 * @brief out = scalar * (x, y)
 * @param scalar Big-endian scalar, any length; NULL allowed when scalar_len is 0
 */
K1CURVE_API k1curve_error_t k1curve_ec_scalar_mult(const uint8_t x[32], const uint8_t y[32],
                                                   const uint8_t* scalar, size_t scalar_len,
                                                   uint8_t out_x[32], uint8_t out_y[32]);

#ifdef __cplusplus
}
#endif

#endif // K1CURVE_CRYPTO_ECC_H
