/// @file tests/transaction/test_shape_matcher.cpp
/// @brief Tests for ShapeMatcher — margin inputs and payout outputs.

#include "swapsettle/transaction.hpp"
#include "../support/settlement_fixture.hpp"

#include <gtest/gtest.h>

using namespace swapsettle;
using namespace swapsettle::contract;
using namespace swapsettle::transaction;
using namespace swapsettle::testing;

namespace {

const PartyIdentities PARTIES = make_parties();
const PartyId         STRANGER = make_party(0x55);

} // namespace

// ─── TxInput::signedBy ────────────────────────────────────────────────────────

TEST(TxInputSignedBy, MatchesAnyListedSigner) {
    const TxInput in{MARGIN, {STRANGER, PARTIES.fixed_leg}};
    EXPECT_TRUE(in.signedBy(PARTIES.fixed_leg));
    EXPECT_TRUE(in.signedBy(STRANGER));
    EXPECT_FALSE(in.signedBy(PARTIES.floating_leg));
}

TEST(TxInputSignedBy, UnsignedInputMatchesNobody) {
    const TxInput in{MARGIN, {}};
    EXPECT_FALSE(in.signedBy(PARTIES.fixed_leg));
}

// ─── is_margin_input ──────────────────────────────────────────────────────────

TEST(ShapeMatcherMarginInput, SignedAndExactAmount) {
    EXPECT_TRUE(ShapeMatcher::is_margin_input(margin_input(PARTIES.fixed_leg),
                                              PARTIES.fixed_leg, MARGIN));
}

TEST(ShapeMatcherMarginInput, AmountMustBeExact) {
    EXPECT_FALSE(ShapeMatcher::is_margin_input(margin_input(PARTIES.fixed_leg, MARGIN - 1),
                                               PARTIES.fixed_leg, MARGIN));
    EXPECT_FALSE(ShapeMatcher::is_margin_input(margin_input(PARTIES.fixed_leg, MARGIN + 1),
                                               PARTIES.fixed_leg, MARGIN));
}

TEST(ShapeMatcherMarginInput, WrongSignerRejected) {
    EXPECT_FALSE(ShapeMatcher::is_margin_input(margin_input(STRANGER),
                                               PARTIES.fixed_leg, MARGIN));
}

// ─── is_payout_output ─────────────────────────────────────────────────────────

TEST(ShapeMatcherPayoutOutput, AtOrBelowRemainderAccepted) {
    const Integer remainder(MARGIN);
    EXPECT_TRUE(ShapeMatcher::is_payout_output(payout(PARTIES.fixed_leg, MARGIN),
                                               PARTIES.fixed_leg, remainder));
    EXPECT_TRUE(ShapeMatcher::is_payout_output(payout(PARTIES.fixed_leg, 0),
                                               PARTIES.fixed_leg, remainder));
}

TEST(ShapeMatcherPayoutOutput, OneUnitOverRemainderRejected) {
    EXPECT_FALSE(ShapeMatcher::is_payout_output(payout(PARTIES.fixed_leg, MARGIN + 1),
                                                PARTIES.fixed_leg, Integer(MARGIN)));
}

TEST(ShapeMatcherPayoutOutput, WrongPayeeRejected) {
    EXPECT_FALSE(ShapeMatcher::is_payout_output(payout(STRANGER, 1),
                                                PARTIES.fixed_leg, Integer(MARGIN)));
}

TEST(ShapeMatcherPayoutOutput, ScriptOutputNeverMatches) {
    const TxOutput script_out{1, std::nullopt};
    EXPECT_FALSE(script_out.destination().has_value());
    EXPECT_FALSE(ShapeMatcher::is_payout_output(script_out, PARTIES.fixed_leg, Integer(MARGIN)));
}

// ─── inputs_match ─────────────────────────────────────────────────────────────

TEST(ShapeMatcherInputs, EitherOrderAccepted) {
    const auto fixed = margin_input(PARTIES.fixed_leg);
    const auto flt   = margin_input(PARTIES.floating_leg);
    EXPECT_TRUE(ShapeMatcher::inputs_match(fixed, flt, PARTIES, MARGIN));
    EXPECT_TRUE(ShapeMatcher::inputs_match(flt, fixed, PARTIES, MARGIN));
}

TEST(ShapeMatcherInputs, SamePartyTwiceRejected) {
    const auto fixed = margin_input(PARTIES.fixed_leg);
    EXPECT_FALSE(ShapeMatcher::inputs_match(fixed, fixed, PARTIES, MARGIN));
}

TEST(ShapeMatcherInputs, WrongSignerRejectedInBothOrders) {
    const auto fixed    = margin_input(PARTIES.fixed_leg);
    const auto stranger = margin_input(STRANGER);
    EXPECT_FALSE(ShapeMatcher::inputs_match(fixed, stranger, PARTIES, MARGIN));
    EXPECT_FALSE(ShapeMatcher::inputs_match(stranger, fixed, PARTIES, MARGIN));
}

TEST(ShapeMatcherInputs, InputSignedByBothPartiesCanFillEitherRole) {
    const TxInput both{MARGIN, {PARTIES.fixed_leg, PARTIES.floating_leg}};
    EXPECT_TRUE(ShapeMatcher::inputs_match(both, margin_input(PARTIES.fixed_leg), PARTIES, MARGIN));
}

// ─── outputs_match ────────────────────────────────────────────────────────────

TEST(ShapeMatcherOutputs, EitherOrderAccepted) {
    const auto to_fixed = payout(PARTIES.fixed_leg, 10);
    const auto to_float = payout(PARTIES.floating_leg, 20);
    EXPECT_TRUE(ShapeMatcher::outputs_match(to_fixed, to_float, PARTIES, Integer(10), Integer(20)));
    EXPECT_TRUE(ShapeMatcher::outputs_match(to_float, to_fixed, PARTIES, Integer(10), Integer(20)));
}

TEST(ShapeMatcherOutputs, RemaindersAreNotInterchangeable) {
    // Fixed leg is owed at most 10, floating at most 20.
    const auto to_fixed = payout(PARTIES.fixed_leg, 20);
    const auto to_float = payout(PARTIES.floating_leg, 10);
    EXPECT_FALSE(ShapeMatcher::outputs_match(to_fixed, to_float, PARTIES, Integer(10), Integer(20)));
}

TEST(ShapeMatcherOutputs, BothPaidToOnePartyRejected) {
    const auto a = payout(PARTIES.fixed_leg, 1);
    const auto b = payout(PARTIES.fixed_leg, 1);
    EXPECT_FALSE(ShapeMatcher::outputs_match(a, b, PARTIES, Integer(10), Integer(10)));
}
