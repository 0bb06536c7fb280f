#pragma once

/// @file include/swapsettle/payments.hpp
/// @brief Exact payment and payout arithmetic for swap settlement.
///
/// # Module: Payments
///
/// ## Core Formulas
/// ```
/// rate_delta     = observed_rate − fixed_rate
/// delta          = notional · rate_delta
/// fixed_payment  = round(notional + delta)
/// float_payment  = round(notional + delta)
/// fixed_rem      = clamp((margin − fixed_payment) + float_payment)
/// float_rem      = clamp((margin − float_payment) + fixed_payment)
/// ```
/// Both legs use the same payment formula, so with identical rounding the
/// two payments are always equal and both clamp arguments reduce to
/// `margin`. This mirrors the deployed contract exactly.
///
/// ## Clamp
/// `ClampMode::Literal` reproduces the deployed formula
/// `min(0, max(2·margin, x))`, which is 0 for every x whenever margin ≥ 0.
/// `ClampMode::Bounded` is `max(0, min(2·margin, x))`, keeping the payout
/// within the total collateral at stake.
///
/// ## Guarantees
/// - All arithmetic is exact (`Rational`, `Integer`); no floating point
/// - Stateless, deterministic, thread-safe

#include "swapsettle/contract.hpp"
#include "swapsettle/types.hpp"

namespace swapsettle::payments {

// ─── Policy enums ─────────────────────────────────────────────────────────────

/// How a rational payment is rounded to whole currency units.
enum class RoundingMode {
    HalfEven,          ///< Ties go to the even neighbour (banker's rounding)
    HalfAwayFromZero,  ///< Ties go away from zero
};

/// Which payout clamp formula is applied.
enum class ClampMode {
    Literal,  ///< min(0, max(2·margin, x)), as deployed
    Bounded,  ///< max(0, min(2·margin, x))
};

[[nodiscard]] const char* to_string(RoundingMode m) noexcept;
[[nodiscard]] const char* to_string(ClampMode m) noexcept;

/// Round an exact rational to the nearest integer under `mode`.
[[nodiscard]] Integer round_rational(const Rational& q, RoundingMode mode);

// ─── SettlementAmounts ────────────────────────────────────────────────────────

/// Every intermediate quantity of the payment computation.
struct SettlementAmounts {
    Rational observed_rate;
    Rational rate_delta;       ///< observed_rate − fixed_rate
    Rational delta;            ///< notional · rate_delta
    Integer  fixed_payment;
    Integer  float_payment;
    Integer  fixed_remainder;  ///< Upper bound on the fixed leg's payout
    Integer  float_remainder;  ///< Upper bound on the floating leg's payout
};

// ─── PaymentCalculator ────────────────────────────────────────────────────────

/// Stateless payment and clamp arithmetic.
class PaymentCalculator {
public:
    PaymentCalculator() = delete;

    /// Apply the payout clamp selected by `mode` to `x`.
    [[nodiscard]] static Integer clamp(const Integer& x,
                                       const Integer& margin,
                                       ClampMode mode);

    /// Compute payments and remainders for an authenticated observed rate.
    [[nodiscard]] static SettlementAmounts
    compute(const contract::SwapTerms& terms,
            const Rational& observed_rate,
            RoundingMode rounding,
            ClampMode clamp_mode);
};

} // namespace swapsettle::payments
