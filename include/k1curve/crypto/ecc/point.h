/**
 * @file point.h
 * @brief Affine point arithmetic on secp256k1
 * 
 * Points are immutable (x, y) values. The point at infinity is encoded
 * canonically as (0, 0); no genuine curve point has x = 0 because 7 is not
 * a quadratic residue mod p, so the encoding is unambiguous.
 * 
 * Every operation comes in two flavours:
 * - checked (negate, add, double_point, scalar_multiply): validate all
 *   operands first and throw InvalidCoordinate / InvalidPoint
 * - unchecked (*_unchecked): no validation; operands must already be
 *   infinity or on-curve points with coordinates in [0, p)
 * 
 * Unchecked functions reduce every intermediate modulo p. Out-of-range
 * input is therefore treated as its residue: the result is the same as for
 * the reduced operands, never a raised error.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef K1CURVE_CRYPTO_ECC_POINT_H
#define K1CURVE_CRYPTO_ECC_POINT_H

#include "k1curve/crypto/ecc/field.h"
#include "k1curve/crypto/ecc/ecc_error.h"

#include <string>

namespace k1curve {
namespace ecc {

// ============================================================================
// Point Representation
// ============================================================================

/**
 * @brief Affine point (x, y); (0, 0) is the point at infinity
 */
struct K1CURVE_API AffinePoint {
    FieldElement x;
    FieldElement y;
    
    AffinePoint() : x(0), y(0) {}
    
    AffinePoint(const FieldElement& x_, const FieldElement& y_)
        : x(x_), y(y_) {}
    
    static AffinePoint infinity() { return AffinePoint(); }
    
    bool is_infinity() const {
        return sgn(x) == 0 && sgn(y) == 0;
    }
    
    bool operator==(const AffinePoint& other) const {
        return x == other.x && y == other.y;
    }
    
    bool operator!=(const AffinePoint& other) const {
        return !(*this == other);
    }
    
    /** @brief "infinity" or "(0x<x>, 0x<y>)" */
    std::string to_string() const;
};

/**
 * @brief The secp256k1 base point G
 */
K1CURVE_API AffinePoint generator();

// ============================================================================
// Classification
// ============================================================================

/**
 * @brief True iff x == 0 and y == 0. Never throws.
 */
K1CURVE_API bool is_infinity(const FieldElement& x, const FieldElement& y);

/**
 * @brief Test y² == x³ + 7 (mod p)
 * 
 * The point at infinity (0, 0) does not satisfy the equation and yields
 * false.
 * 
 * @throws InvalidCoordinate if x >= p (checked first) or y >= p
 */
K1CURVE_API bool is_on_curve(const FieldElement& x, const FieldElement& y);
K1CURVE_API bool is_on_curve(const AffinePoint& P);

/**
 * @brief Infinity or on-curve
 * @throws InvalidCoordinate for out-of-range coordinates
 */
K1CURVE_API bool is_valid_point(const AffinePoint& P);

/**
 * @brief Shared guard run at the top of every checked operation
 * @throws InvalidCoordinate if a coordinate is >= p (x before y)
 * @throws InvalidPoint if P is in range but neither infinity nor on curve
 */
K1CURVE_API void validate_point(const AffinePoint& P);

// ============================================================================
// Group Operations
// ============================================================================

/**
 * @brief -P = (x, p - y); infinity maps to itself
 */
K1CURVE_API AffinePoint negate(const AffinePoint& P);
K1CURVE_API AffinePoint negate_unchecked(const AffinePoint& P);

/**
 * @brief P + Q under the group law
 * 
 * Evaluation order: P infinity -> Q; Q infinity -> P; P == Q -> doubling;
 * x equal and y1 + y2 == 0 (mod p) -> infinity; otherwise chord formula.
 */
K1CURVE_API AffinePoint add(const AffinePoint& P, const AffinePoint& Q);
K1CURVE_API AffinePoint add_unchecked(const AffinePoint& P, const AffinePoint& Q);

/**
 * @brief 2P using the tangent slope 3x² / 2y (a = 0)
 * 
 * The unchecked form assumes y != 0, which holds for every point on
 * secp256k1.
 */
K1CURVE_API AffinePoint double_point(const AffinePoint& P);
K1CURVE_API AffinePoint double_point_unchecked(const AffinePoint& P);

/**
 * @brief k * P by right-to-left double-and-add
 * 
 * The scalar is not reduced modulo the group order n; callers that want
 * reduction do it themselves. Infinity or k == 0 yields infinity.
 * 
 * @throws InvalidCoordinate / InvalidPoint for an invalid base point
 * @throws std::invalid_argument if k is negative
 */
K1CURVE_API AffinePoint scalar_multiply(const AffinePoint& P, const mpz_class& k);

} // namespace ecc
} // namespace k1curve

#endif // K1CURVE_CRYPTO_ECC_POINT_H
