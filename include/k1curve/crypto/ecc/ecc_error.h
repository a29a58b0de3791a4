/**
 * @file ecc_error.h
 * @brief Exception types raised by the validated point operations
 * 
 * Two failure kinds exist:
 * - InvalidCoordinate: a coordinate is not below the field prime p
 * - InvalidPoint: in-range coordinates that are neither infinity nor on the curve
 * 
 * Both derive from std::invalid_argument so callers may catch either the
 * precise type or the standard base.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef K1CURVE_CRYPTO_ECC_ERROR_H
#define K1CURVE_CRYPTO_ECC_ERROR_H

#include "k1curve/core/common.h"

#include <gmpxx.h>
#include <stdexcept>

namespace k1curve {
namespace ecc {

/**
 * @brief A coordinate is >= the field prime p
 */
class K1CURVE_API InvalidCoordinate : public std::invalid_argument {
public:
    explicit InvalidCoordinate(const mpz_class& value);

    /** @brief The offending coordinate value */
    const mpz_class& value() const noexcept { return value_; }

private:
    mpz_class value_;
};

/**
 * @brief An in-range coordinate pair that is not a valid curve point
 */
class K1CURVE_API InvalidPoint : public std::invalid_argument {
public:
    InvalidPoint(const mpz_class& x, const mpz_class& y);

    const mpz_class& x() const noexcept { return x_; }
    const mpz_class& y() const noexcept { return y_; }

private:
    mpz_class x_;
    mpz_class y_;
};

} // namespace ecc
} // namespace k1curve

#endif // K1CURVE_CRYPTO_ECC_ERROR_H
