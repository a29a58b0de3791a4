/**
 * @file test_ecc_api.cpp
 * @brief C API (k1curve_ec_*) unit tests
 * 
 * Tests cover:
 * - Error code mapping (invalid param / coordinate / point)
 * - Big-endian coordinate buffers and in-place output
 * - Library info functions
 * 
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <array>
#include <cstring>
#include <string>

#include "k1curve/k1curve.h"
#include "../ecc/test_vectors.h"

namespace {

using Bytes32 = std::array<uint8_t, K1CURVE_FIELD_BYTES>;

Bytes32 from_hex(const char* hex) {
    Bytes32 out{};
    k1curve::ecc::field_to_bytes(mpz_class(hex, 16), out.data());
    return out;
}

Bytes32 zero() {
    return Bytes32{};
}

} // anonymous namespace

class EccApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        gx_ = from_hex(k1curve_test::GX_HEX);
        gy_ = from_hex(k1curve_test::GY_HEX);
        p_ = from_hex(k1curve_test::P_HEX);
    }

    Bytes32 gx_, gy_, p_;
    Bytes32 out_x_{}, out_y_{};
};

TEST_F(EccApiTest, Generator) {
    ASSERT_EQ(k1curve_ec_generator(out_x_.data(), out_y_.data()), K1CURVE_SUCCESS);
    EXPECT_EQ(out_x_, gx_);
    EXPECT_EQ(out_y_, gy_);
}

TEST_F(EccApiTest, IsInfinity) {
    Bytes32 z = zero();
    int result = -1;
    ASSERT_EQ(k1curve_ec_is_infinity(z.data(), z.data(), &result), K1CURVE_SUCCESS);
    EXPECT_EQ(result, 1);
    ASSERT_EQ(k1curve_ec_is_infinity(gx_.data(), gy_.data(), &result), K1CURVE_SUCCESS);
    EXPECT_EQ(result, 0);
}

TEST_F(EccApiTest, IsOnCurve) {
    int result = -1;
    ASSERT_EQ(k1curve_ec_is_on_curve(gx_.data(), gy_.data(), &result), K1CURVE_SUCCESS);
    EXPECT_EQ(result, 1);

    Bytes32 z = zero();
    ASSERT_EQ(k1curve_ec_is_on_curve(z.data(), z.data(), &result), K1CURVE_SUCCESS);
    EXPECT_EQ(result, 0);

    EXPECT_EQ(k1curve_ec_is_on_curve(p_.data(), gy_.data(), &result),
              K1CURVE_ERROR_INVALID_COORDINATE);
}

TEST_F(EccApiTest, Negate) {
    ASSERT_EQ(k1curve_ec_negate(gx_.data(), gy_.data(), out_x_.data(), out_y_.data()),
              K1CURVE_SUCCESS);
    EXPECT_EQ(out_x_, gx_);
    EXPECT_EQ(out_y_, from_hex(k1curve_test::NEG_GY_HEX));
}

TEST_F(EccApiTest, AddGeneratorTwice) {
    ASSERT_EQ(k1curve_ec_add(gx_.data(), gy_.data(), gx_.data(), gy_.data(),
                             out_x_.data(), out_y_.data()),
              K1CURVE_SUCCESS);
    EXPECT_EQ(out_x_, from_hex(k1curve_test::MULTIPLES_OF_G[1].x));
    EXPECT_EQ(out_y_, from_hex(k1curve_test::MULTIPLES_OF_G[1].y));
}

TEST_F(EccApiTest, AddInverseGivesZeroBuffers) {
    Bytes32 neg_y = from_hex(k1curve_test::NEG_GY_HEX);
    ASSERT_EQ(k1curve_ec_add(gx_.data(), gy_.data(), gx_.data(), neg_y.data(),
                             out_x_.data(), out_y_.data()),
              K1CURVE_SUCCESS);
    EXPECT_EQ(out_x_, zero());
    EXPECT_EQ(out_y_, zero());
}

TEST_F(EccApiTest, DoubleInPlace) {
    Bytes32 x = gx_;
    Bytes32 y = gy_;
    ASSERT_EQ(k1curve_ec_double(x.data(), y.data(), x.data(), y.data()), K1CURVE_SUCCESS);
    EXPECT_EQ(x, from_hex(k1curve_test::MULTIPLES_OF_G[1].x));
    EXPECT_EQ(y, from_hex(k1curve_test::MULTIPLES_OF_G[1].y));
}

TEST_F(EccApiTest, ScalarMult) {
    const uint8_t scalar[] = {0xDE, 0xAD, 0xBE, 0xEF};
    ASSERT_EQ(k1curve_ec_scalar_mult(gx_.data(), gy_.data(), scalar, sizeof(scalar),
                                     out_x_.data(), out_y_.data()),
              K1CURVE_SUCCESS);
    EXPECT_EQ(out_x_, from_hex(k1curve_test::MULTIPLES_OF_G[7].x));
    EXPECT_EQ(out_y_, from_hex(k1curve_test::MULTIPLES_OF_G[7].y));
}

TEST_F(EccApiTest, ScalarMultEmptyScalarIsInfinity) {
    ASSERT_EQ(k1curve_ec_scalar_mult(gx_.data(), gy_.data(), nullptr, 0,
                                     out_x_.data(), out_y_.data()),
              K1CURVE_SUCCESS);
    EXPECT_EQ(out_x_, zero());
    EXPECT_EQ(out_y_, zero());
}

TEST_F(EccApiTest, InvalidPointReported) {
    Bytes32 one = from_hex("1");
    EXPECT_EQ(k1curve_ec_negate(one.data(), one.data(), out_x_.data(), out_y_.data()),
              K1CURVE_ERROR_INVALID_POINT);
    EXPECT_EQ(k1curve_ec_add(gx_.data(), gy_.data(), one.data(), one.data(),
                             out_x_.data(), out_y_.data()),
              K1CURVE_ERROR_INVALID_POINT);
    EXPECT_EQ(k1curve_ec_double(one.data(), one.data(), out_x_.data(), out_y_.data()),
              K1CURVE_ERROR_INVALID_POINT);
}

TEST_F(EccApiTest, InvalidCoordinateReported) {
    const uint8_t scalar[] = {0x02};
    EXPECT_EQ(k1curve_ec_scalar_mult(gx_.data(), p_.data(), scalar, sizeof(scalar),
                                     out_x_.data(), out_y_.data()),
              K1CURVE_ERROR_INVALID_COORDINATE);
}

TEST_F(EccApiTest, NullPointersRejected) {
    int result = 0;
    EXPECT_EQ(k1curve_ec_generator(nullptr, out_y_.data()), K1CURVE_ERROR_INVALID_PARAM);
    EXPECT_EQ(k1curve_ec_is_on_curve(gx_.data(), gy_.data(), nullptr), K1CURVE_ERROR_INVALID_PARAM);
    EXPECT_EQ(k1curve_ec_is_infinity(nullptr, gy_.data(), &result), K1CURVE_ERROR_INVALID_PARAM);
    EXPECT_EQ(k1curve_ec_add(gx_.data(), gy_.data(), nullptr, gy_.data(),
                             out_x_.data(), out_y_.data()),
              K1CURVE_ERROR_INVALID_PARAM);
    EXPECT_EQ(k1curve_ec_scalar_mult(gx_.data(), gy_.data(), nullptr, 4,
                                     out_x_.data(), out_y_.data()),
              K1CURVE_ERROR_INVALID_PARAM);
}

TEST(LibraryInfoTest, VersionAndErrorStrings) {
    EXPECT_EQ(std::string(k1curve_version()), K1CURVE_VERSION_STRING);
    EXPECT_NE(std::string(k1curve_platform()), "");
    EXPECT_EQ(std::string(k1curve_error_string(K1CURVE_SUCCESS)), "Success");
    EXPECT_EQ(std::string(k1curve_error_string(K1CURVE_ERROR_INVALID_POINT)),
              "Point is neither infinity nor on the curve");
    EXPECT_EQ(std::string(k1curve_error_string(static_cast<k1curve_error_t>(42))), "Unknown error");
    EXPECT_TRUE(K1CURVE_VERSION_AT_LEAST(1, 0, 0));
}
