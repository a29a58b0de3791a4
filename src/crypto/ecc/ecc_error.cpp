/**
 * @file ecc_error.cpp
 * @brief InvalidCoordinate / InvalidPoint message formatting
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "k1curve/crypto/ecc/ecc_error.h"
#include "k1curve/crypto/ecc/field.h"

#include <string>

namespace k1curve {
namespace ecc {

InvalidCoordinate::InvalidCoordinate(const mpz_class& value)
    : std::invalid_argument("invalid coordinate: 0x" + field_to_hex(value) +
                            " is not below the field prime"),
      value_(value) {}

InvalidPoint::InvalidPoint(const mpz_class& x, const mpz_class& y)
    : std::invalid_argument("invalid point: (0x" + field_to_hex(x) + ", 0x" +
                            field_to_hex(y) + ") is not on secp256k1"),
      x_(x), y_(y) {}

} // namespace ecc
} // namespace k1curve
