/**
 * @file ecc_params.h
 * @brief secp256k1 domain parameters
 * 
 * The curve is fixed: y² = x³ + 7 (mod p), p = 2^256 - 2^32 - 977.
 * Parameters are compile-time constants materialized once on first use and
 * never modified afterwards, so concurrent readers need no locking.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef K1CURVE_CRYPTO_ECC_PARAMS_H
#define K1CURVE_CRYPTO_ECC_PARAMS_H

#include "k1curve/core/common.h"

#include <gmpxx.h>
#include <string>

namespace k1curve {
namespace ecc {

/**
 * @brief Elliptic curve parameters structure
 * 
 * Defines a curve in short Weierstrass form: y² = x³ + ax + b (mod p)
 */
struct CurveParams {
    mpz_class p;        // Prime modulus
    mpz_class a;        // Curve coefficient a
    mpz_class b;        // Curve coefficient b
    mpz_class n;        // Order of the base point G
    mpz_class h;        // Cofactor (n * h = total curve order)
    mpz_class Gx;       // Base point G x-coordinate
    mpz_class Gy;       // Base point G y-coordinate
    std::string name;   // Curve name identifier
    int bit_size;       // Field size in bits
    
    CurveParams() : bit_size(0) {}
};

/**
 * @brief secp256k1 parameters (SEC 2, section 2.4.1)
 * @return Reference to the process-wide immutable parameter set
 */
K1CURVE_API const CurveParams& secp256k1_params();

// Shorthands for the individual constants
inline const mpz_class& field_prime() { return secp256k1_params().p; }
inline const mpz_class& curve_a() { return secp256k1_params().a; }
inline const mpz_class& curve_b() { return secp256k1_params().b; }
inline const mpz_class& group_order() { return secp256k1_params().n; }

} // namespace ecc
} // namespace k1curve

#endif // K1CURVE_CRYPTO_ECC_PARAMS_H
