/// @file src/payments/rational_rounding.cpp
/// @brief Exact rounding of rationals to whole currency units.

#include "swapsettle/payments.hpp"

namespace swapsettle::payments {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(RoundingMode m) noexcept {
    switch (m) {
        case RoundingMode::HalfEven:         return "half-even";
        case RoundingMode::HalfAwayFromZero: return "half-away";
    }
    return "unknown";
}

const char* to_string(ClampMode m) noexcept {
    switch (m) {
        case ClampMode::Literal: return "literal";
        case ClampMode::Bounded: return "bounded";
    }
    return "unknown";
}

// ─── round_rational ───────────────────────────────────────────────────────────

Integer round_rational(const Rational& q, RoundingMode mode) {
    const Integer num = boost::multiprecision::numerator(q);
    const Integer den = boost::multiprecision::denominator(q);  // always > 0

    // Floor division: cpp_int truncates toward zero, so fix up negatives.
    Integer floor = num / den;
    Integer rem   = num % den;
    if (rem < 0) {
        floor -= 1;
        rem   += den;
    }

    // Compare the fractional part rem/den against 1/2 without leaving ℤ.
    const Integer twice_rem = 2 * rem;
    if (twice_rem < den) {
        return floor;
    }
    if (twice_rem > den) {
        return floor + 1;
    }

    // Exact tie: q = floor + 1/2.
    switch (mode) {
        case RoundingMode::HalfEven:
            return (floor % 2 == 0) ? floor : Integer(floor + 1);
        case RoundingMode::HalfAwayFromZero:
            return (floor >= 0) ? Integer(floor + 1) : floor;
    }
    return floor;
}

} // namespace swapsettle::payments
