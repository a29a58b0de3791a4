/**
 * @file cmd_point.cpp
 * @brief Point subcommand implementation for k1curve CLI
 *
 * Supports:
 *   - oncurve   curve membership test
 *   - negate    -P
 *   - add       P + Q
 *   - double    2P
 *   - mul       k * P (P may be given as G)
 *
 * Usage:
 *   k1curve point add <x1> <y1> <x2> <y2>
 *   k1curve point mul G <scalar>
 *
 * @author k1curve Development Team
 * @date 2026-10-19
 */

#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>

#include "k1curve/crypto/ecc/point.h"
#include "cli_utils.h"

using k1curve::cli::parse_number;
using k1curve::cli::print_point;
using k1curve::cli::EXIT_OK;
using k1curve::cli::EXIT_USAGE;
using k1curve::cli::EXIT_INVALID_INPUT;
namespace ecc = k1curve::ecc;

/**
 * @brief Print point subcommand help
 */
void print_point_help() {
    std::cout << "\nUsage: k1curve point <operation> [arguments]\n\n";
    std::cout << "Operations:\n";
    std::cout << "  oncurve <x> <y>              Test y^2 = x^3 + 7 (mod p)\n";
    std::cout << "  negate  <x> <y>              Compute -P\n";
    std::cout << "  add     <x1> <y1> <x2> <y2>  Compute P + Q\n";
    std::cout << "  double  <x> <y>              Compute 2P\n";
    std::cout << "  mul     <x> <y> <k>          Compute k * P\n";
    std::cout << "  mul     G <k>                Compute k * G\n";
    std::cout << "  --help                       Show this help message\n\n";
    std::cout << "All numbers are hexadecimal (optional 0x prefix).\n";
    std::cout << "The point at infinity is written as 0 0.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  k1curve point mul G 2\n";
    std::cout << "  k1curve point negate 79BE667E...16F81798 483ADA77...FB10D4B8\n\n";
}

namespace {

ecc::AffinePoint point_arg(const std::vector<std::string>& args, size_t at) {
    return ecc::AffinePoint(parse_number(args[at]), parse_number(args[at + 1]));
}

int run_operation(const std::string& op, const std::vector<std::string>& args) {
    if (op == "oncurve" && args.size() == 2) {
        std::cout << (ecc::is_on_curve(parse_number(args[0]), parse_number(args[1])) ? "true" : "false") << "\n";
        return EXIT_OK;
    }
    if (op == "negate" && args.size() == 2) {
        print_point(ecc::negate(point_arg(args, 0)));
        return EXIT_OK;
    }
    if (op == "add" && args.size() == 4) {
        print_point(ecc::add(point_arg(args, 0), point_arg(args, 2)));
        return EXIT_OK;
    }
    if (op == "double" && args.size() == 2) {
        print_point(ecc::double_point(point_arg(args, 0)));
        return EXIT_OK;
    }
    if (op == "mul" && args.size() == 2 && (args[0] == "G" || args[0] == "g")) {
        print_point(ecc::scalar_multiply(ecc::generator(), parse_number(args[1])));
        return EXIT_OK;
    }
    if (op == "mul" && args.size() == 3) {
        print_point(ecc::scalar_multiply(point_arg(args, 0), parse_number(args[2])));
        return EXIT_OK;
    }

    std::cerr << "[ERROR] Unknown operation or wrong number of arguments: " << op << "\n";
    print_point_help();
    return EXIT_USAGE;
}

} // anonymous namespace

/**
 * @brief Point subcommand handler
 */
int cmd_point(int argc, char* argv[]) {
    if (argc < 2) {
        print_point_help();
        return EXIT_USAGE;
    }

    std::string op(argv[1]);
    if (op == "--help" || op == "-h") {
        print_point_help();
        return EXIT_OK;
    }

    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        return run_operation(op, args);
    } catch (const ecc::InvalidCoordinate& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return EXIT_INVALID_INPUT;
    } catch (const ecc::InvalidPoint& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return EXIT_INVALID_INPUT;
    } catch (const std::invalid_argument& e) {
        // Malformed hex or negative scalar
        std::cerr << "[ERROR] " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
