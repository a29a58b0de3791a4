/**
 * @file benchmark_common.hpp
 * @brief Common utilities for k1curve benchmarks with ratio comparison
 * 
 * Provides unified benchmark output format with:
 * - Performance metrics (avg, min, throughput)
 * - OpenSSL vs k1curve ratio comparison
 * 
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef K1CURVE_BENCHMARK_COMMON_HPP
#define K1CURVE_BENCHMARK_COMMON_HPP

#include <iostream>
#include <iomanip>
#include <string>
#include <functional>
#include <vector>
#include <algorithm>
#include <numeric>
#include <chrono>

namespace k1curve_bench {

/**
 * @brief High-resolution timer types
 */
using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

/**
 * @brief Benchmark result containing timing and throughput data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average time in milliseconds
    double min_ms;          ///< Minimum time in milliseconds
    double throughput;      ///< Throughput in ops/s
    bool valid;             ///< Whether benchmark completed successfully
    
    BenchmarkResult() : avg_ms(0), min_ms(0), throughput(0), valid(false) {}
    BenchmarkResult(double avg, double min_t, double tp) 
        : avg_ms(avg), min_ms(min_t), throughput(tp), valid(true) {}
};

/**
 * @brief Time a single call of func in milliseconds
 */
template <typename Fn>
double time_once(Fn&& func) {
    auto start = Clock::now();
    func();
    Duration elapsed = Clock::now() - start;
    return elapsed.count();
}

/**
 * @brief Print ratio comparison between k1curve and OpenSSL (time based)
 * 
 * ratio = openssl_time / k1curve_time; ratio > 1.0 means k1curve is FASTER
 */
inline void print_ratio(double k1curve_time, double openssl_time) {
    if (openssl_time <= 0 || k1curve_time <= 0) {
        std::cout << std::left << std::setw(25) << "  ==> Ratio"
                  << std::setw(12) << ""
                  << "  (comparison not available)" << std::endl;
        return;
    }
    
    double ratio = openssl_time / k1curve_time;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";
    const char* symbol = ratio >= 1.0 ? "+" : "";
    double diff_percent = (ratio - 1.0) * 100.0;
    
    std::cout << std::left << std::setw(25) << "  ==> Ratio"
              << std::setw(12) << ""
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << ratio << "x"
              << "    (" << symbol << std::setprecision(1) << diff_percent << "% " << status << ")"
              << std::endl;
}

/**
 * @brief Run benchmark and return result with statistics
 * 
 * @param warmup_iters Number of warmup iterations
 * @param bench_iters Number of benchmark iterations
 * @param benchmark_func Function returning execution time in ms (negative on error)
 * @return BenchmarkResult with statistics
 */
inline BenchmarkResult run_benchmark_ex(
    size_t warmup_iters,
    size_t bench_iters,
    std::function<double()> benchmark_func
) {
    std::vector<double> times;
    times.reserve(bench_iters);
    
    // Warmup
    for (size_t i = 0; i < warmup_iters; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();  // Error during warmup
    }
    
    // Benchmark
    for (size_t i = 0; i < bench_iters; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();  // Error during benchmark
        times.push_back(t);
    }
    
    if (times.empty()) return BenchmarkResult();

    double avg = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
    double min_t = *std::min_element(times.begin(), times.end());
    double ops_per_sec = avg > 0 ? 1000.0 / avg : 0.0;
    
    return BenchmarkResult(avg, min_t, ops_per_sec);
}

/**
 * @brief Print benchmark result line
 */
inline void print_result(
    const std::string& name,
    const std::string& impl,
    const BenchmarkResult& result
) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(12) << impl
                  << "  (benchmark failed)" << std::endl;
        return;
    }
    
    std::cout << std::left << std::setw(25) << name
              << std::setw(12) << impl
              << std::right << std::fixed << std::setprecision(3)
              << std::setw(10) << result.avg_ms << " ms"
              << std::setw(10) << result.min_ms << " ms"
              << std::setw(10) << std::setprecision(1) << result.throughput << " op/s"
              << std::endl;
}

} // namespace k1curve_bench

#endif // K1CURVE_BENCHMARK_COMMON_HPP
