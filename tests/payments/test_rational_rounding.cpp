/// @file tests/payments/test_rational_rounding.cpp
/// @brief Tests for round_rational in both rounding modes.

#include "swapsettle/payments.hpp"

#include <gtest/gtest.h>

using namespace swapsettle;
using namespace swapsettle::payments;

namespace {

Rational q(long n, long d) { return Rational(n) / d; }

} // namespace

// ─── Exact integers ───────────────────────────────────────────────────────────

TEST(RoundRational, IntegerIsUnchanged) {
    EXPECT_EQ(round_rational(q(1'025'000, 1), RoundingMode::HalfEven), 1'025'000);
    EXPECT_EQ(round_rational(q(-7, 1), RoundingMode::HalfAwayFromZero), -7);
    EXPECT_EQ(round_rational(q(0, 1), RoundingMode::HalfEven), 0);
}

// ─── Non-ties: both modes agree ───────────────────────────────────────────────

TEST(RoundRational, BelowHalfRoundsDown) {
    EXPECT_EQ(round_rational(q(7, 3), RoundingMode::HalfEven), 2);          // 2.333…
    EXPECT_EQ(round_rational(q(7, 3), RoundingMode::HalfAwayFromZero), 2);
}

TEST(RoundRational, AboveHalfRoundsUp) {
    EXPECT_EQ(round_rational(q(8, 3), RoundingMode::HalfEven), 3);          // 2.666…
    EXPECT_EQ(round_rational(q(8, 3), RoundingMode::HalfAwayFromZero), 3);
}

TEST(RoundRational, NegativeNonTies) {
    EXPECT_EQ(round_rational(q(-7, 3), RoundingMode::HalfEven), -2);        // −2.333…
    EXPECT_EQ(round_rational(q(-8, 3), RoundingMode::HalfEven), -3);        // −2.666…
    EXPECT_EQ(round_rational(q(-1, 3), RoundingMode::HalfAwayFromZero), 0);
}

// ─── Ties: modes differ ───────────────────────────────────────────────────────

TEST(RoundRational, HalfEvenTiesGoToEvenNeighbour) {
    EXPECT_EQ(round_rational(q(1, 2), RoundingMode::HalfEven), 0);
    EXPECT_EQ(round_rational(q(3, 2), RoundingMode::HalfEven), 2);
    EXPECT_EQ(round_rational(q(5, 2), RoundingMode::HalfEven), 2);
    EXPECT_EQ(round_rational(q(7, 2), RoundingMode::HalfEven), 4);
    EXPECT_EQ(round_rational(q(-5, 2), RoundingMode::HalfEven), -2);
    EXPECT_EQ(round_rational(q(-7, 2), RoundingMode::HalfEven), -4);
    EXPECT_EQ(round_rational(q(-1, 2), RoundingMode::HalfEven), 0);
}

TEST(RoundRational, HalfAwayTiesGoAwayFromZero) {
    EXPECT_EQ(round_rational(q(1, 2), RoundingMode::HalfAwayFromZero), 1);
    EXPECT_EQ(round_rational(q(5, 2), RoundingMode::HalfAwayFromZero), 3);
    EXPECT_EQ(round_rational(q(-1, 2), RoundingMode::HalfAwayFromZero), -1);
    EXPECT_EQ(round_rational(q(-5, 2), RoundingMode::HalfAwayFromZero), -3);
}

TEST(RoundRational, SettlementTieDiffersByOneUnit) {
    // 2 000 001 / 2 = 1 000 000.5: the only place the mode choice matters.
    const Rational half_unit = q(2'000'001, 2);
    EXPECT_EQ(round_rational(half_unit, RoundingMode::HalfEven), 1'000'000);
    EXPECT_EQ(round_rational(half_unit, RoundingMode::HalfAwayFromZero), 1'000'001);
}

// ─── Large magnitudes ─────────────────────────────────────────────────────────

TEST(RoundRational, BeyondInt64IsExact) {
    const Integer big = Integer(1) << 100;
    const Rational x  = Rational(Integer(big * 2 + 1)) / 2;  // 2^100 + 1/2
    EXPECT_EQ(round_rational(x, RoundingMode::HalfEven), big);
    EXPECT_EQ(round_rational(x, RoundingMode::HalfAwayFromZero), Integer(big + 1));
}

// ─── to_string ────────────────────────────────────────────────────────────────

TEST(RoundRational, ModeNames) {
    EXPECT_STREQ(to_string(RoundingMode::HalfEven), "half-even");
    EXPECT_STREQ(to_string(RoundingMode::HalfAwayFromZero), "half-away");
    EXPECT_STREQ(to_string(ClampMode::Literal), "literal");
    EXPECT_STREQ(to_string(ClampMode::Bounded), "bounded");
}
