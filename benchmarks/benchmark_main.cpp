/**
 * @file benchmark_main.cpp
 * @brief k1curve vs OpenSSL Performance Benchmark Suite
 *
 * Usage:
 *   k1curve_benchmark
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>

#include <openssl/opensslv.h>

#include "k1curve/k1curve.h"

// Forward declarations for benchmark functions
int benchmark_point_ops();

int main() {
    std::cout << "\n";
    std::cout << "k1curve " << k1curve_version() << " (" << K1CURVE_BUILD_TYPE << ")\n";
    std::cout << "GMP     " << gmp_version << "\n";
    std::cout << "OpenSSL " << OPENSSL_VERSION_TEXT << "\n";

    int rc = benchmark_point_ops();
    if (rc != 0) {
        std::cerr << "[ERROR] Benchmark aborted\n";
    }
    return rc;
}
