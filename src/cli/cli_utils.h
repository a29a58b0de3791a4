/**
 * @file cli_utils.h
 * @brief Common utility functions for k1curve CLI commands
 *
 * @author k1curve Development Team
 * @date 2026-10-19
 */

#ifndef K1CURVE_CLI_UTILS_H
#define K1CURVE_CLI_UTILS_H

#include <iostream>
#include <string>

#include "k1curve/crypto/ecc/point.h"

namespace k1curve {
namespace cli {

// Exit codes shared by all subcommands
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_INVALID_INPUT = 2;

/**
 * @brief Parse a hex number argument (optional 0x prefix)
 */
inline mpz_class parse_number(const std::string& arg) {
    return k1curve::ecc::field_from_hex(arg);
}

/**
 * @brief Print a point as x=/y= lines, or "infinity"
 */
inline void print_point(const k1curve::ecc::AffinePoint& P) {
    if (P.is_infinity()) {
        std::cout << "infinity\n";
        return;
    }
    std::cout << "x=0x" << k1curve::ecc::field_to_hex(P.x) << "\n";
    std::cout << "y=0x" << k1curve::ecc::field_to_hex(P.y) << "\n";
}

} // namespace cli
} // namespace k1curve

#endif // K1CURVE_CLI_UTILS_H
