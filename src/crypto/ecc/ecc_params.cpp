/**
 * @file ecc_params.cpp
 * @brief secp256k1 domain parameter table
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "k1curve/crypto/ecc/ecc_params.h"

namespace k1curve {
namespace ecc {

namespace {

// SEC 2 v2, section 2.4.1 (big-endian hex)
constexpr const char* SECP256K1_P =
    "FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F";
constexpr const char* SECP256K1_N =
    "FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141";
constexpr const char* SECP256K1_GX =
    "79BE667EF9DCBBAC55A06295CE870B07029BFCDB2DCE28D959F2815B16F81798";
constexpr const char* SECP256K1_GY =
    "483ADA7726A3C4655DA4FBFC0E1108A8FD17B448A68554199C47D08FFB10D4B8";

CurveParams make_secp256k1_params() {
    CurveParams params;
    params.p = mpz_class(SECP256K1_P, 16);
    params.a = 0;
    params.b = 7;
    params.n = mpz_class(SECP256K1_N, 16);
    params.h = 1;
    params.Gx = mpz_class(SECP256K1_GX, 16);
    params.Gy = mpz_class(SECP256K1_GY, 16);
    params.name = "secp256k1";
    params.bit_size = 256;
    return params;
}

} // anonymous namespace

const CurveParams& secp256k1_params() {
    static const CurveParams params = make_secp256k1_params();
    return params;
}

} // namespace ecc
} // namespace k1curve
