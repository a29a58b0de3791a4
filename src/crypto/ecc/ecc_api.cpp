/**
 * @file ecc_api.cpp
 * @brief C API wrappers over k1curve::ecc point operations
 * 
 * Exceptions never cross this boundary; each is mapped to a k1curve_error_t.
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "k1curve/crypto/ecc/ecc.h"
#include "k1curve/crypto/ecc/point.h"

#include <exception>

using namespace k1curve::ecc;

namespace {

AffinePoint load_point(const uint8_t x[32], const uint8_t y[32]) {
    return AffinePoint(field_from_bytes(x, K1CURVE_FIELD_BYTES),
                       field_from_bytes(y, K1CURVE_FIELD_BYTES));
}

void store_point(const AffinePoint& P, uint8_t out_x[32], uint8_t out_y[32]) {
    field_to_bytes(P.x, out_x);
    field_to_bytes(P.y, out_y);
}

template <typename Fn>
k1curve_error_t guarded(Fn&& fn) {
    try {
        fn();
        return K1CURVE_SUCCESS;
    } catch (const InvalidCoordinate&) {
        return K1CURVE_ERROR_INVALID_COORDINATE;
    } catch (const InvalidPoint&) {
        return K1CURVE_ERROR_INVALID_POINT;
    } catch (const std::exception&) {
        return K1CURVE_ERROR_INTERNAL;
    }
}

} // anonymous namespace

extern "C" {

k1curve_error_t k1curve_ec_generator(uint8_t out_x[32], uint8_t out_y[32]) {
    if (!out_x || !out_y) {
        return K1CURVE_ERROR_INVALID_PARAM;
    }
    return guarded([&] { store_point(generator(), out_x, out_y); });
}

k1curve_error_t k1curve_ec_is_infinity(const uint8_t x[32], const uint8_t y[32], int* result) {
    if (!x || !y || !result) {
        return K1CURVE_ERROR_INVALID_PARAM;
    }
    return guarded([&] {
        AffinePoint P = load_point(x, y);
        *result = is_infinity(P.x, P.y) ? 1 : 0;
    });
}

k1curve_error_t k1curve_ec_is_on_curve(const uint8_t x[32], const uint8_t y[32], int* result) {
    if (!x || !y || !result) {
        return K1CURVE_ERROR_INVALID_PARAM;
    }
    return guarded([&] {
        AffinePoint P = load_point(x, y);
        *result = is_on_curve(P.x, P.y) ? 1 : 0;
    });
}

k1curve_error_t k1curve_ec_negate(const uint8_t x[32], const uint8_t y[32],
                                  uint8_t out_x[32], uint8_t out_y[32]) {
    if (!x || !y || !out_x || !out_y) {
        return K1CURVE_ERROR_INVALID_PARAM;
    }
    return guarded([&] { store_point(negate(load_point(x, y)), out_x, out_y); });
}

k1curve_error_t k1curve_ec_add(const uint8_t x1[32], const uint8_t y1[32],
                               const uint8_t x2[32], const uint8_t y2[32],
                               uint8_t out_x[32], uint8_t out_y[32]) {
    if (!x1 || !y1 || !x2 || !y2 || !out_x || !out_y) {
        return K1CURVE_ERROR_INVALID_PARAM;
    }
    return guarded([&] {
        AffinePoint P = load_point(x1, y1);
        AffinePoint Q = load_point(x2, y2);
        store_point(add(P, Q), out_x, out_y);
    });
}

k1curve_error_t k1curve_ec_double(const uint8_t x[32], const uint8_t y[32],
                                  uint8_t out_x[32], uint8_t out_y[32]) {
    if (!x || !y || !out_x || !out_y) {
        return K1CURVE_ERROR_INVALID_PARAM;
    }
    return guarded([&] { store_point(double_point(load_point(x, y)), out_x, out_y); });
}

k1curve_error_t k1curve_ec_scalar_mult(const uint8_t x[32], const uint8_t y[32],
                                       const uint8_t* scalar, size_t scalar_len,
                                       uint8_t out_x[32], uint8_t out_y[32]) {
    if (!x || !y || !out_x || !out_y || (!scalar && scalar_len != 0)) {
        return K1CURVE_ERROR_INVALID_PARAM;
    }
    return guarded([&] {
        mpz_class k = field_from_bytes(scalar, scalar_len);
        store_point(scalar_multiply(load_point(x, y), k), out_x, out_y);
    });
}

} // extern "C"
