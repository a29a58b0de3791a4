/**
 * @file field.h
 * @brief Prime field arithmetic over the secp256k1 base field GF(p)
 * 
 * Field elements are GMP integers canonically held in [0, p). All helpers
 * reduce their result with mpz_mod, so the returned value is always in
 * range regardless of the sign or width of the inputs.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef K1CURVE_CRYPTO_ECC_FIELD_H
#define K1CURVE_CRYPTO_ECC_FIELD_H

#include "k1curve/core/common.h"

#include <gmpxx.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace k1curve {
namespace ecc {

/**
 * @brief Element of GF(p), canonical range [0, p)
 */
using FieldElement = mpz_class;

// ============================================================================
// Field Primitives
// ============================================================================

/**
 * @brief Modular exponentiation base^exponent mod p
 * 
 * Right-to-left binary square-and-multiply: the exponent is scanned from
 * its least significant bit, the base squared on every step and multiplied
 * into the accumulator when the bit is set.
 * 
 * @param base Any integer, canonicalized modulo p
 * @param exponent Non-negative exponent; 0 yields 1
 * @return Result in [0, p)
 * @throws std::invalid_argument if exponent is negative
 */
K1CURVE_API FieldElement mod_pow(const mpz_class& base, const mpz_class& exponent);

/**
 * @brief Multiplicative inverse via Fermat's little theorem: value^(p-2)
 * 
 * @param value Non-zero field element
 * @return value^-1 mod p
 * @note value == 0 has no inverse; the result is then 0. Callers never
 *       reach this with a zero denominator.
 */
K1CURVE_API FieldElement mod_inverse(const FieldElement& value);

// ============================================================================
// Modular Helpers
// ============================================================================

K1CURVE_API FieldElement mod_reduce(const mpz_class& value);
K1CURVE_API FieldElement mod_add(const FieldElement& a, const FieldElement& b);
K1CURVE_API FieldElement mod_sub(const FieldElement& a, const FieldElement& b);
K1CURVE_API FieldElement mod_mul(const FieldElement& a, const FieldElement& b);
K1CURVE_API FieldElement mod_neg(const FieldElement& a);

/**
 * @brief Check 0 <= value < p
 */
K1CURVE_API bool is_field_element(const mpz_class& value);

// ============================================================================
// Conversions
// ============================================================================

/**
 * @brief Parse a hexadecimal string, with or without "0x" prefix
 * @throws std::invalid_argument on empty or malformed input
 */
K1CURVE_API mpz_class field_from_hex(const std::string& hex);

/**
 * @brief Lowercase hex, zero-padded to at least 64 digits, no prefix
 */
K1CURVE_API std::string field_to_hex(const mpz_class& value);

/**
 * @brief Decode big-endian bytes (any length; zero length yields 0)
 */
K1CURVE_API mpz_class field_from_bytes(const uint8_t* data, size_t len);

/**
 * @brief Encode as exactly 32 big-endian bytes
 * @throws std::invalid_argument if value is negative or wider than 256 bits
 */
K1CURVE_API void field_to_bytes(const mpz_class& value, uint8_t out[32]);

} // namespace ecc
} // namespace k1curve

#endif // K1CURVE_CRYPTO_ECC_FIELD_H
