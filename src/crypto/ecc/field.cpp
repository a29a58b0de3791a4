/**
 * @file field.cpp
 * @brief GF(p) arithmetic for secp256k1 on top of GMP
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "k1curve/crypto/ecc/field.h"
#include "k1curve/crypto/ecc/ecc_params.h"

#include <cstring>
#include <stdexcept>

namespace k1curve {
namespace ecc {

// ============================================================================
// Field Primitives
// ============================================================================

FieldElement mod_pow(const mpz_class& base, const mpz_class& exponent) {
    if (sgn(exponent) < 0) {
        throw std::invalid_argument("mod_pow: exponent must be non-negative");
    }

    FieldElement result = 1;
    FieldElement b = mod_reduce(base);
    mpz_class e = exponent;

    while (sgn(e) > 0) {
        if (mpz_odd_p(e.get_mpz_t())) {
            result = mod_mul(result, b);
        }
        b = mod_mul(b, b);
        mpz_fdiv_q_2exp(e.get_mpz_t(), e.get_mpz_t(), 1);
    }

    return result;
}

FieldElement mod_inverse(const FieldElement& value) {
    return mod_pow(value, field_prime() - 2);
}

// ============================================================================
// Modular Helpers
// ============================================================================

FieldElement mod_reduce(const mpz_class& value) {
    FieldElement r;
    // mpz_mod result is always non-negative
    mpz_mod(r.get_mpz_t(), value.get_mpz_t(), field_prime().get_mpz_t());
    return r;
}

FieldElement mod_add(const FieldElement& a, const FieldElement& b) {
    return mod_reduce(a + b);
}

FieldElement mod_sub(const FieldElement& a, const FieldElement& b) {
    return mod_add(a, mod_neg(b));
}

FieldElement mod_mul(const FieldElement& a, const FieldElement& b) {
    return mod_reduce(a * b);
}

FieldElement mod_neg(const FieldElement& a) {
    return mod_reduce(field_prime() - mod_reduce(a));
}

bool is_field_element(const mpz_class& value) {
    return sgn(value) >= 0 && value < field_prime();
}

// ============================================================================
// Conversions
// ============================================================================

mpz_class field_from_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty()) {
        throw std::invalid_argument("empty hex string");
    }
    for (char c : digits) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!ok) {
            throw std::invalid_argument("invalid hex string: " + hex);
        }
    }
    return mpz_class(digits, 16);
}

std::string field_to_hex(const mpz_class& value) {
    std::string hex = value.get_str(16);
    bool negative = !hex.empty() && hex[0] == '-';
    if (negative) {
        hex.erase(0, 1);
    }
    if (hex.size() < 64) {
        hex.insert(0, 64 - hex.size(), '0');
    }
    return negative ? "-" + hex : hex;
}

mpz_class field_from_bytes(const uint8_t* data, size_t len) {
    mpz_class value;
    if (len > 0) {
        // order=1 (most significant word first), size=1, endian=1, nails=0
        mpz_import(value.get_mpz_t(), len, 1, 1, 1, 0, data);
    }
    return value;
}

void field_to_bytes(const mpz_class& value, uint8_t out[32]) {
    if (sgn(value) < 0) {
        throw std::invalid_argument("field_to_bytes: negative value");
    }
    size_t bits = mpz_sizeinbase(value.get_mpz_t(), 2);
    if (sgn(value) != 0 && bits > 256) {
        throw std::invalid_argument("field_to_bytes: value exceeds 256 bits");
    }

    std::memset(out, 0, 32);
    if (sgn(value) == 0) {
        return;
    }

    size_t count = 0;
    uint8_t buf[32];
    mpz_export(buf, &count, 1, 1, 1, 0, value.get_mpz_t());
    std::memcpy(out + (32 - count), buf, count);
}

} // namespace ecc
} // namespace k1curve
