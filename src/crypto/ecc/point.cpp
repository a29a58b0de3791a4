/**
 * @file point.cpp
 * @brief secp256k1 affine group law: classification, negation, addition,
 *        doubling and double-and-add scalar multiplication
 * 
 * Implementation details:
 * - Affine coordinates, one field inversion per addition/doubling
 * - Point at infinity encoded as (0, 0)
 * - Subtractions are performed as addition of the modular negation
 * 
 * No constant-time guarantees: branch structure depends on the operands
 * and on the scalar bits.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "k1curve/crypto/ecc/point.h"
#include "k1curve/crypto/ecc/ecc_params.h"

#include <stdexcept>

namespace k1curve {
namespace ecc {

namespace {

void check_coordinate(const FieldElement& value) {
    if (!is_field_element(value)) {
        throw InvalidCoordinate(value);
    }
}

// Unchecked paths operate on residues
AffinePoint reduce_point(const AffinePoint& P) {
    return AffinePoint(mod_reduce(P.x), mod_reduce(P.y));
}

} // anonymous namespace

std::string AffinePoint::to_string() const {
    if (is_infinity()) {
        return "infinity";
    }
    return "(0x" + field_to_hex(x) + ", 0x" + field_to_hex(y) + ")";
}

AffinePoint generator() {
    const CurveParams& params = secp256k1_params();
    return AffinePoint(params.Gx, params.Gy);
}

// ============================================================================
// Classification
// ============================================================================

bool is_infinity(const FieldElement& x, const FieldElement& y) {
    return sgn(x) == 0 && sgn(y) == 0;
}

bool is_on_curve(const FieldElement& x, const FieldElement& y) {
    check_coordinate(x);
    check_coordinate(y);
    
    if (is_infinity(x, y)) {
        return false;
    }
    
    // y^2 = x^3 + b (mod p), a = 0
    FieldElement lhs = mod_mul(y, y);
    FieldElement rhs = mod_add(mod_mul(mod_mul(x, x), x), curve_b());
    return lhs == rhs;
}

bool is_on_curve(const AffinePoint& P) {
    return is_on_curve(P.x, P.y);
}

bool is_valid_point(const AffinePoint& P) {
    check_coordinate(P.x);
    check_coordinate(P.y);
    return P.is_infinity() || is_on_curve(P.x, P.y);
}

void validate_point(const AffinePoint& P) {
    if (!is_valid_point(P)) {
        throw InvalidPoint(P.x, P.y);
    }
}

// ============================================================================
// Negation
// ============================================================================

AffinePoint negate(const AffinePoint& P) {
    validate_point(P);
    return negate_unchecked(P);
}

AffinePoint negate_unchecked(const AffinePoint& P) {
    AffinePoint R = reduce_point(P);
    if (R.is_infinity()) {
        return R;
    }
    return AffinePoint(R.x, mod_neg(R.y));
}

// ============================================================================
// Addition
// ============================================================================

AffinePoint add(const AffinePoint& P, const AffinePoint& Q) {
    validate_point(P);
    validate_point(Q);
    return add_unchecked(P, Q);
}

AffinePoint add_unchecked(const AffinePoint& P_in, const AffinePoint& Q_in) {
    AffinePoint P = reduce_point(P_in);
    AffinePoint Q = reduce_point(Q_in);
    
    if (P.is_infinity()) return Q;
    if (Q.is_infinity()) return P;
    
    if (P.x == Q.x) {
        if (P.y == Q.y) {
            // Chord slope has a zero denominator here
            return double_point_unchecked(P);
        }
        if (sgn(mod_add(P.y, Q.y)) == 0) {
            // P == -Q
            return AffinePoint::infinity();
        }
    }
    
    // m = (y2 - y1) / (x2 - x1)
    FieldElement m = mod_mul(mod_sub(Q.y, P.y), mod_inverse(mod_sub(Q.x, P.x)));
    
    AffinePoint result;
    result.x = mod_sub(mod_sub(mod_mul(m, m), P.x), Q.x);
    result.y = mod_sub(mod_mul(m, mod_sub(P.x, result.x)), P.y);
    return result;
}

// ============================================================================
// Doubling
// ============================================================================

AffinePoint double_point(const AffinePoint& P) {
    validate_point(P);
    return double_point_unchecked(P);
}

AffinePoint double_point_unchecked(const AffinePoint& P_in) {
    AffinePoint P = reduce_point(P_in);
    if (P.is_infinity()) {
        return P;
    }
    
    // m = 3x^2 / 2y
    FieldElement xx = mod_mul(P.x, P.x);
    FieldElement m = mod_mul(mod_mul(3, xx), mod_inverse(mod_mul(2, P.y)));
    
    AffinePoint result;
    result.x = mod_sub(mod_mul(m, m), mod_mul(2, P.x));
    result.y = mod_sub(mod_mul(m, mod_sub(P.x, result.x)), P.y);
    return result;
}

// ============================================================================
// Scalar Multiplication
// ============================================================================

AffinePoint scalar_multiply(const AffinePoint& P, const mpz_class& k) {
    validate_point(P);
    if (sgn(k) < 0) {
        throw std::invalid_argument("scalar_multiply: scalar must be non-negative");
    }
    
    if (P.is_infinity() || sgn(k) == 0) {
        return AffinePoint::infinity();
    }
    
    AffinePoint acc;            // infinity
    AffinePoint running = P;
    mpz_class e = k;
    
    while (sgn(e) > 0) {
        if (mpz_odd_p(e.get_mpz_t())) {
            acc = add_unchecked(acc, running);
        }
        running = double_point_unchecked(running);
        mpz_fdiv_q_2exp(e.get_mpz_t(), e.get_mpz_t(), 1);
    }
    
    return acc;
}

} // namespace ecc
} // namespace k1curve
