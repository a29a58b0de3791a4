/**
 * @file test_ecc_error.cpp
 * @brief InvalidCoordinate / InvalidPoint exception object tests
 * 
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "k1curve/crypto/ecc/ecc_error.h"
#include "k1curve/crypto/ecc/ecc_params.h"

using namespace k1curve::ecc;

TEST(EccErrorTest, InvalidCoordinateCarriesValue) {
    InvalidCoordinate err(field_prime());
    EXPECT_EQ(err.value(), field_prime());
    EXPECT_EQ(std::string(err.what()),
              "invalid coordinate: 0xfffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f"
              " is not below the field prime");
}

TEST(EccErrorTest, InvalidPointCarriesCoordinates) {
    InvalidPoint err(1, 2);
    EXPECT_EQ(err.x(), 1);
    EXPECT_EQ(err.y(), 2);
    std::string msg = err.what();
    EXPECT_NE(msg.find("invalid point"), std::string::npos);
    EXPECT_NE(msg.find("0x0000000000000000000000000000000000000000000000000000000000000002"),
              std::string::npos);
}

TEST(EccErrorTest, CatchableAsInvalidArgument) {
    EXPECT_THROW(throw InvalidCoordinate(mpz_class(0)), std::invalid_argument);
    EXPECT_THROW(throw InvalidPoint(mpz_class(1), mpz_class(1)), std::invalid_argument);
}
