/**
 * @file benchmark_point.cpp
 * @brief secp256k1 Point Arithmetic Benchmark: k1curve vs OpenSSL
 *
 * Benchmarks affine point operations on secp256k1:
 * - Point addition (P + Q)
 * - Point doubling (2P)
 * - Scalar multiplication (k * G, 256-bit random k)
 *
 * Every k1curve result is cross-checked against OpenSSL's EC_POINT
 * implementation before timing.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <iomanip>
#include <vector>
#include <cstring>
#include <cstdint>

#include "benchmark_common.hpp"

// OpenSSL headers
#include <openssl/ec.h>
#include <openssl/bn.h>
#include <openssl/rand.h>
#include <openssl/obj_mac.h>

#include "k1curve/crypto/ecc/point.h"

using namespace k1curve_bench;
namespace ecc = k1curve::ecc;

// Benchmark configuration
constexpr size_t WARMUP_ITERATIONS = 5;
constexpr size_t BENCHMARK_ITERATIONS = 50;
constexpr size_t CROSS_CHECK_ROUNDS = 16;

namespace {

/**
 * @brief OpenSSL objects shared by all secp256k1 benchmarks
 */
struct OpenSSLContext {
    EC_GROUP* group = nullptr;
    BN_CTX* bn_ctx = nullptr;

    OpenSSLContext() {
        group = EC_GROUP_new_by_curve_name(NID_secp256k1);
        bn_ctx = BN_CTX_new();
    }

    ~OpenSSLContext() {
        BN_CTX_free(bn_ctx);
        EC_GROUP_free(group);
    }

    OpenSSLContext(const OpenSSLContext&) = delete;
    OpenSSLContext& operator=(const OpenSSLContext&) = delete;

    bool ok() const { return group != nullptr && bn_ctx != nullptr; }
};

BIGNUM* to_bn(const mpz_class& value) {
    uint8_t buf[32];
    ecc::field_to_bytes(value, buf);
    return BN_bin2bn(buf, sizeof(buf), nullptr);
}

mpz_class from_bn(const BIGNUM* bn) {
    uint8_t buf[32];
    if (BN_bn2binpad(bn, buf, sizeof(buf)) != static_cast<int>(sizeof(buf))) {
        return mpz_class(0);
    }
    return ecc::field_from_bytes(buf, sizeof(buf));
}

EC_POINT* to_openssl(const OpenSSLContext& ctx, const ecc::AffinePoint& P) {
    EC_POINT* point = EC_POINT_new(ctx.group);
    if (!point) return nullptr;

    if (P.is_infinity()) {
        EC_POINT_set_to_infinity(ctx.group, point);
        return point;
    }

    BIGNUM* x = to_bn(P.x);
    BIGNUM* y = to_bn(P.y);
    int rc = EC_POINT_set_affine_coordinates(ctx.group, point, x, y, ctx.bn_ctx);
    BN_free(x);
    BN_free(y);

    if (rc != 1) {
        EC_POINT_free(point);
        return nullptr;
    }
    return point;
}

bool from_openssl(const OpenSSLContext& ctx, const EC_POINT* point, ecc::AffinePoint& out) {
    if (EC_POINT_is_at_infinity(ctx.group, point)) {
        out = ecc::AffinePoint::infinity();
        return true;
    }

    BIGNUM* x = BN_new();
    BIGNUM* y = BN_new();
    bool ok = EC_POINT_get_affine_coordinates(ctx.group, point, x, y, ctx.bn_ctx) == 1;
    if (ok) {
        out = ecc::AffinePoint(from_bn(x), from_bn(y));
    }
    BN_free(x);
    BN_free(y);
    return ok;
}

mpz_class random_scalar() {
    uint8_t buf[32];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
        return mpz_class(0);
    }
    return ecc::field_from_bytes(buf, sizeof(buf));
}

/**
 * @brief Compare k1curve and OpenSSL on k*G, P+Q and 2P for random inputs
 */
bool cross_check(const OpenSSLContext& ctx) {
    const ecc::AffinePoint G = ecc::generator();

    for (size_t round = 0; round < CROSS_CHECK_ROUNDS; ++round) {
        mpz_class k1 = random_scalar();
        mpz_class k2 = random_scalar();

        ecc::AffinePoint P = ecc::scalar_multiply(G, k1);
        ecc::AffinePoint Q = ecc::scalar_multiply(G, k2);

        EC_POINT* ref = EC_POINT_new(ctx.group);
        BIGNUM* bk = to_bn(k1);
        bool ok = ref && bk && EC_POINT_mul(ctx.group, ref, bk, nullptr, nullptr, ctx.bn_ctx) == 1;

        ecc::AffinePoint ref_P;
        ok = ok && from_openssl(ctx, ref, ref_P) && ref_P == P;

        EC_POINT* op = to_openssl(ctx, P);
        EC_POINT* oq = to_openssl(ctx, Q);
        ecc::AffinePoint ref_sum;
        ecc::AffinePoint ref_dbl;
        ok = ok && op && oq &&
             EC_POINT_add(ctx.group, ref, op, oq, ctx.bn_ctx) == 1 &&
             from_openssl(ctx, ref, ref_sum) && ref_sum == ecc::add(P, Q) &&
             EC_POINT_dbl(ctx.group, ref, op, ctx.bn_ctx) == 1 &&
             from_openssl(ctx, ref, ref_dbl) && ref_dbl == ecc::double_point(P);

        EC_POINT_free(oq);
        EC_POINT_free(op);
        BN_free(bk);
        EC_POINT_free(ref);

        if (!ok) {
            std::cerr << "[ERROR] Mismatch against OpenSSL in round " << round << "\n";
            return false;
        }
    }
    return true;
}

} // anonymous namespace

/**
 * @brief Run secp256k1 point benchmarks
 * @return 0 on success, non-zero if OpenSSL setup or the cross-check failed
 */
int benchmark_point_ops() {
    std::cout << "\n";
    std::cout << "======================================================================\n";
    std::cout << "  secp256k1 point arithmetic: k1curve vs OpenSSL\n";
    std::cout << "======================================================================\n";

    OpenSSLContext ctx;
    if (!ctx.ok()) {
        std::cerr << "[ERROR] OpenSSL does not provide secp256k1\n";
        return 1;
    }

    if (!cross_check(ctx)) {
        return 1;
    }
    std::cout << "  Cross-check: " << CROSS_CHECK_ROUNDS << " rounds match OpenSSL\n\n";

    std::cout << std::left << std::setw(25) << "Operation"
              << std::setw(12) << "Impl"
              << std::right << std::setw(13) << "Avg"
              << std::setw(13) << "Min"
              << std::setw(15) << "Throughput" << "\n";
    std::cout << std::string(78, '-') << "\n";

    const ecc::AffinePoint G = ecc::generator();
    const ecc::AffinePoint P = ecc::scalar_multiply(G, random_scalar());
    const ecc::AffinePoint Q = ecc::scalar_multiply(G, random_scalar());
    const mpz_class k = random_scalar();

    EC_POINT* op = to_openssl(ctx, P);
    EC_POINT* oq = to_openssl(ctx, Q);
    EC_POINT* out = EC_POINT_new(ctx.group);
    BIGNUM* bk = to_bn(k);
    if (!op || !oq || !out || !bk) {
        std::cerr << "[ERROR] OpenSSL allocation failed\n";
        BN_free(bk);
        EC_POINT_free(out);
        EC_POINT_free(oq);
        EC_POINT_free(op);
        return 1;
    }

    // Point addition
    auto k1_add = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        return time_once([&] { ecc::add_unchecked(P, Q); });
    });
    auto ossl_add = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        ecc::AffinePoint r;
        return time_once([&] {
            EC_POINT_add(ctx.group, out, op, oq, ctx.bn_ctx);
            from_openssl(ctx, out, r);
        });
    });
    print_result("Point Add", "k1curve", k1_add);
    print_result("Point Add", "OpenSSL", ossl_add);
    print_ratio(k1_add.avg_ms, ossl_add.avg_ms);

    // Point doubling
    auto k1_dbl = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        return time_once([&] { ecc::double_point_unchecked(P); });
    });
    auto ossl_dbl = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        ecc::AffinePoint r;
        return time_once([&] {
            EC_POINT_dbl(ctx.group, out, op, ctx.bn_ctx);
            from_openssl(ctx, out, r);
        });
    });
    print_result("Point Double", "k1curve", k1_dbl);
    print_result("Point Double", "OpenSSL", ossl_dbl);
    print_ratio(k1_dbl.avg_ms, ossl_dbl.avg_ms);

    // Scalar multiplication k * P
    auto k1_mul = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        return time_once([&] { ecc::scalar_multiply(P, k); });
    });
    auto ossl_mul = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
        ecc::AffinePoint r;
        return time_once([&] {
            EC_POINT_mul(ctx.group, out, nullptr, op, bk, ctx.bn_ctx);
            from_openssl(ctx, out, r);
        });
    });
    print_result("Scalar Mult (k*P)", "k1curve", k1_mul);
    print_result("Scalar Mult (k*P)", "OpenSSL", ossl_mul);
    print_ratio(k1_mul.avg_ms, ossl_mul.avg_ms);

    BN_free(bk);
    EC_POINT_free(out);
    EC_POINT_free(oq);
    EC_POINT_free(op);
    return 0;
}
