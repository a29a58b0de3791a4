/**
 * @file k1curve_main.cpp
 * @brief k1curve Command-Line Interface - Main Entry Point
 * 
 * Usage:
 *   k1curve <command> [options]
 * 
 * Commands:
 *   point        secp256k1 point operations (oncurve, negate, add, double, mul)
 *   version      Display version information
 *   help         Show help message
 * 
 * @author k1curve Development Team
 * @date 2026-10-19
 * @copyright Apache License 2.0
 */

#include <iostream>
#include <string>
#include <algorithm>
#include <cctype>

#include "k1curve/k1curve.h"

// Subcommand handlers (forward declarations)
int cmd_point(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: k1curve <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  point        secp256k1 point operations (oncurve, negate, add, double, mul)\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  k1curve point mul G 3\n";
    std::cout << "  k1curve point oncurve 0x1 0x2\n\n";
    std::cout << "For command-specific help, use: k1curve <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << K1CURVE_LIBRARY_NAME << " - " << K1CURVE_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << k1curve_version() << "\n";
    std::cout << "Release Date: " << K1CURVE_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << K1CURVE_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << k1curve_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Curve:        " << k1curve::ecc::secp256k1_params().name
              << " (y^2 = x^3 + 7 mod p)\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - GMP " << gmp_version << " (GNU Multiple Precision Arithmetic)\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    // No arguments - print help
    if (argc < 2) {
        print_usage();
        return 0;
    }

    // Parse command
    std::string command(argv[1]);
    
    // Convert to lowercase for case-insensitive matching
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Route to appropriate subcommand handler
    if (command == "point" || command == "ec") {
        return cmd_point(argc - 1, argv + 1);
    } 
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    } 
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    } 
    else {
        std::cerr << "[ERROR] Unknown command: " << argv[1] << "\n";
        print_usage();
        return 1;
    }
}
