/// @file src/transaction/shape_matcher.cpp
/// @brief ShapeMatcher — order-insensitive input/output pairing.

#include "swapsettle/transaction.hpp"

#include <algorithm>

namespace swapsettle::transaction {

// ─── TxInput ──────────────────────────────────────────────────────────────────

bool TxInput::signedBy(const PartyId& party) const noexcept {
    return std::find(signers.begin(), signers.end(), party) != signers.end();
}

// ─── Single-element predicates ────────────────────────────────────────────────

bool ShapeMatcher::is_margin_input(const TxInput& in,
                                   const PartyId& party,
                                   Amount margin) noexcept {
    return in.signedBy(party) && in.amount == margin;
}

bool ShapeMatcher::is_payout_output(const TxOutput& out,
                                    const PartyId& party,
                                    const Integer& remainder) {
    const auto& dest = out.destination();
    if (!dest || *dest != party) {
        return false;
    }
    // Upper bound only: paying a party less than its remainder is allowed.
    return Integer(out.amount) <= remainder;
}

// ─── Pair checks ──────────────────────────────────────────────────────────────

bool ShapeMatcher::inputs_match(const TxInput& a,
                                const TxInput& b,
                                const contract::PartyIdentities& parties,
                                Amount margin) noexcept {
    const auto is_fixed = [&](const TxInput& in) {
        return is_margin_input(in, parties.fixed_leg, margin);
    };
    const auto is_float = [&](const TxInput& in) {
        return is_margin_input(in, parties.floating_leg, margin);
    };
    return (is_fixed(a) && is_float(b)) || (is_fixed(b) && is_float(a));
}

bool ShapeMatcher::outputs_match(const TxOutput& a,
                                 const TxOutput& b,
                                 const contract::PartyIdentities& parties,
                                 const Integer& fixed_remainder,
                                 const Integer& float_remainder) {
    const auto is_fixed = [&](const TxOutput& out) {
        return is_payout_output(out, parties.fixed_leg, fixed_remainder);
    };
    const auto is_float = [&](const TxOutput& out) {
        return is_payout_output(out, parties.floating_leg, float_remainder);
    };
    return (is_fixed(a) && is_float(b)) || (is_fixed(b) && is_float(a));
}

} // namespace swapsettle::transaction
