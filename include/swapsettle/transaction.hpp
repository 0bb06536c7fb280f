#pragma once

/// @file include/swapsettle/transaction.hpp
/// @brief Read-only view of a settlement transaction and the structural
///        checks run against it.
///
/// # Module: Transaction
///
/// ## Responsibility
/// The host ledger presents the transaction being validated as a `TxInfo`:
/// its spent inputs (each with an amount and the identities that authorised
/// spending it) and its outputs (each with an amount and, for outputs paid
/// to a public-key hash, the payee identity). `ShapeMatcher` decides whether
/// a pair of inputs and a pair of outputs have the shape of a settlement.
///
/// ## Pairing Rule
/// Either party's margin may be listed first, so every pair check accepts
/// both assignments:
/// ```
/// (is_fixed(a) && is_float(b)) || (is_fixed(b) && is_float(a))
/// ```
///
/// ## NOT Responsible For
/// - Counting inputs/outputs (the validator aborts on a wrong cardinality
///   before asking for a match)
/// - Building or balancing transactions

#include "swapsettle/contract.hpp"
#include "swapsettle/types.hpp"

#include <optional>
#include <vector>

namespace swapsettle::transaction {

// ─── TxInput ──────────────────────────────────────────────────────────────────

/// A spent input.
struct TxInput {
    Amount               amount = 0;
    std::vector<PartyId> signers;  ///< Identities that authorised the spend

    /// True if `party` authorised spending this input.
    [[nodiscard]] bool signedBy(const PartyId& party) const noexcept;
};

// ─── TxOutput ─────────────────────────────────────────────────────────────────

/// A transaction output.
struct TxOutput {
    Amount                 amount = 0;
    std::optional<PartyId> payee;  ///< nullopt when locked by a script

    /// Identity this output pays, or `nullopt` for a script-locked output.
    [[nodiscard]] const std::optional<PartyId>& destination() const noexcept {
        return payee;
    }
};

// ─── TxInfo ───────────────────────────────────────────────────────────────────

/// The transaction under validation.
struct TxInfo {
    std::vector<TxInput>  inputs;
    std::vector<TxOutput> outputs;
};

// ─── ShapeMatcher ─────────────────────────────────────────────────────────────

/// Order-insensitive structural checks over a two-input, two-output
/// settlement.
class ShapeMatcher {
public:
    ShapeMatcher() = delete;

    /// True if `in` is `party`'s margin: signed by the party and carrying
    /// exactly `margin`.
    [[nodiscard]] static bool is_margin_input(const TxInput& in,
                                              const PartyId& party,
                                              Amount margin) noexcept;

    /// True if `out` pays `party` no more than `remainder`.
    [[nodiscard]] static bool is_payout_output(const TxOutput& out,
                                               const PartyId& party,
                                               const Integer& remainder);

    /// One input is the fixed leg's margin and the other the floating leg's,
    /// in either order.
    [[nodiscard]] static bool inputs_match(const TxInput& a,
                                           const TxInput& b,
                                           const contract::PartyIdentities& parties,
                                           Amount margin) noexcept;

    /// One output pays the fixed leg at most `fixed_remainder` and the
    /// other the floating leg at most `float_remainder`, in either order.
    [[nodiscard]] static bool outputs_match(const TxOutput& a,
                                            const TxOutput& b,
                                            const contract::PartyIdentities& parties,
                                            const Integer& fixed_remainder,
                                            const Integer& float_remainder);
};

} // namespace swapsettle::transaction
