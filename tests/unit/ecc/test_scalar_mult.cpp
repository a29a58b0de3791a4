/**
 * @file test_scalar_mult.cpp
 * @brief Double-and-add scalar multiplication unit tests
 * 
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "k1curve/crypto/ecc/point.h"
#include "k1curve/crypto/ecc/ecc_params.h"
#include "test_vectors.h"

using namespace k1curve::ecc;

class ScalarMultTest : public ::testing::Test {
protected:
    void SetUp() override {
        G_ = generator();
        n_ = group_order();
    }

    AffinePoint G_;
    mpz_class n_;
};

TEST_F(ScalarMultTest, KnownMultiplesOfGenerator) {
    for (const auto& v : k1curve_test::MULTIPLES_OF_G) {
        AffinePoint expected(mpz_class(v.x, 16), mpz_class(v.y, 16));
        EXPECT_EQ(scalar_multiply(G_, mpz_class(v.k, 16)), expected) << "k=0x" << v.k;
    }
}

TEST_F(ScalarMultTest, TwoTimesGeneratorEqualsAdd) {
    EXPECT_EQ(scalar_multiply(G_, 2), add(G_, G_));
}

TEST_F(ScalarMultTest, ZeroScalarIsInfinity) {
    EXPECT_TRUE(scalar_multiply(G_, 0).is_infinity());
}

TEST_F(ScalarMultTest, OneIsIdentityMap) {
    EXPECT_EQ(scalar_multiply(G_, 1), G_);
}

TEST_F(ScalarMultTest, InfinityBaseIsInfinity) {
    EXPECT_TRUE(scalar_multiply(AffinePoint::infinity(), 12345).is_infinity());
    EXPECT_TRUE(scalar_multiply(AffinePoint::infinity(), 0).is_infinity());
}

TEST_F(ScalarMultTest, GroupOrderAnnihilatesGenerator) {
    EXPECT_TRUE(scalar_multiply(G_, n_).is_infinity());
}

TEST_F(ScalarMultTest, OrderMinusOneIsNegation) {
    EXPECT_EQ(scalar_multiply(G_, n_ - 1), negate(G_));
}

TEST_F(ScalarMultTest, ScalarIsNotReducedButWrapsByGroupLaw) {
    // (n + 5)G == 5G through the algebra, not through explicit reduction
    EXPECT_EQ(scalar_multiply(G_, n_ + 5), scalar_multiply(G_, 5));
    // Scalars wider than 256 bits are accepted
    mpz_class wide = n_ * 3 + 7;
    EXPECT_EQ(scalar_multiply(G_, wide), scalar_multiply(G_, 7));
}

TEST_F(ScalarMultTest, Linearity) {
    mpz_class a("1F3A5C7E9B2D4F6081A3C5E7092B4D6F", 16);
    mpz_class b("FEDCBA98765432100123456789ABCDEF", 16);
    AffinePoint aG = scalar_multiply(G_, a);
    AffinePoint bG = scalar_multiply(G_, b);
    EXPECT_EQ(add(aG, bG), scalar_multiply(G_, a + b));
}

TEST_F(ScalarMultTest, Composition) {
    // a * (b * G) == (a * b) * G
    mpz_class a(0xABCDEFu);
    mpz_class b("123456789ABCDEF", 16);
    EXPECT_EQ(scalar_multiply(scalar_multiply(G_, b), a), scalar_multiply(G_, a * b));
}

TEST_F(ScalarMultTest, NonGeneratorBase) {
    AffinePoint P(1, mpz_class(k1curve_test::X1_SQRT8_HEX, 16));
    AffinePoint three_p = add(add(P, P), P);
    EXPECT_EQ(scalar_multiply(P, 3), three_p);
    EXPECT_TRUE(is_on_curve(scalar_multiply(P, mpz_class("DEADBEEFCAFEBABE", 16))));
}

TEST_F(ScalarMultTest, ResultIsOnCurve) {
    mpz_class k("C0FFEE0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF01234567", 16);
    EXPECT_TRUE(is_on_curve(scalar_multiply(G_, k)));
}

TEST_F(ScalarMultTest, RejectsInvalidBasePoint) {
    EXPECT_THROW(scalar_multiply(AffinePoint(1, 1), 2), InvalidPoint);
    EXPECT_THROW(scalar_multiply(AffinePoint(field_prime(), 1), 2), InvalidCoordinate);
    // Validation runs even for a zero scalar
    EXPECT_THROW(scalar_multiply(AffinePoint(1, 1), 0), InvalidPoint);
}

TEST_F(ScalarMultTest, RejectsNegativeScalar) {
    EXPECT_THROW(scalar_multiply(G_, -1), std::invalid_argument);
}
