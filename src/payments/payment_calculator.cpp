/// @file src/payments/payment_calculator.cpp
/// @brief PaymentCalculator — net payments and clamped payouts.

#include "swapsettle/payments.hpp"

#include <algorithm>

namespace swapsettle::payments {

// ─── clamp ────────────────────────────────────────────────────────────────────

Integer PaymentCalculator::clamp(const Integer& x,
                                 const Integer& margin,
                                 ClampMode mode) {
    const Integer at_stake = 2 * margin;

    switch (mode) {
        case ClampMode::Literal:
            // Deployed formula, min/max order kept as written.
            return std::min(Integer(0), std::max(at_stake, x));
        case ClampMode::Bounded:
            return std::max(Integer(0), std::min(at_stake, x));
    }
    return Integer(0);
}

// ─── compute ──────────────────────────────────────────────────────────────────

SettlementAmounts
PaymentCalculator::compute(const contract::SwapTerms& terms,
                           const Rational& observed_rate,
                           RoundingMode rounding,
                           ClampMode clamp_mode) {
    SettlementAmounts out;
    out.observed_rate = observed_rate;

    const Rational notional(terms.notional);
    const Integer  margin(terms.margin);

    out.rate_delta = observed_rate - terms.fixed_rate;
    out.delta      = notional * out.rate_delta;

    // Both legs share one formula.
    out.fixed_payment = round_rational(notional + out.delta, rounding);
    out.float_payment = round_rational(notional + out.delta, rounding);

    out.fixed_remainder = clamp((margin - out.fixed_payment) + out.float_payment,
                                margin, clamp_mode);
    out.float_remainder = clamp((margin - out.float_payment) + out.fixed_payment,
                                margin, clamp_mode);
    return out;
}

} // namespace swapsettle::payments
