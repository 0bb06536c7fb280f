#pragma once

/// @file include/swapsettle/validator.hpp
/// @brief SettlementValidator — the swap settlement predicate.
///
/// # Module: Settlement Validator
///
/// ## Responsibility
/// Decide whether a transaction closes out a swap, given the contract terms,
/// the current party identities, the oracle's signed rate observation and
/// the transaction itself:
///
///   SignedObservation → OracleVerifier → slot check →
///   PaymentCalculator → ShapeMatcher(inputs) → ShapeMatcher(outputs)
///
/// ## Outcomes
/// - `true`  — the transaction is a valid settlement
/// - `false` — well-formed, but the inputs or outputs do not pair up
///   (wrong signer, wrong margin, wrong payee, payout above remainder)
/// - throws `SettlementAbort` — the evaluation cannot produce a verdict:
///   the oracle signature fails, the observation is for another slot, or
///   the transaction does not have exactly two inputs and two outputs
///
/// ## Trust Assumption
/// The observed slot is not compared against the contract's start or the
/// current slot. The oracle stamps the slot and the oracle is trusted.
///
/// ## Guarantees
/// - Pure: no I/O, no shared state; identical inputs give identical results
/// - Safe to run concurrently, once per spent input of the same transaction

#include "swapsettle/contract.hpp"
#include "swapsettle/oracle.hpp"
#include "swapsettle/payments.hpp"
#include "swapsettle/transaction.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace swapsettle::validator {

// ─── SettlementPolicy ─────────────────────────────────────────────────────────

/// Arithmetic choices applied during settlement.
struct SettlementPolicy {
    payments::RoundingMode rounding = payments::RoundingMode::HalfEven;
    payments::ClampMode    clamp    = payments::ClampMode::Literal;
};

// ─── SettlementAbort ──────────────────────────────────────────────────────────

/// Why an evaluation was aborted.
enum class AbortReason {
    SignatureCheckFailed,  ///< Oracle signature or payload did not verify
    WrongSlot,             ///< Observation slot differs from the contract's
    WrongInputCount,       ///< Transaction does not spend exactly two inputs
    WrongOutputCount,      ///< Transaction does not have exactly two outputs
    SpentInputMissing,     ///< validate_spend index does not address an input
};

/// Convert AbortReason to a human-readable string.
[[nodiscard]] const char* to_string(AbortReason r) noexcept;

/// Hard failure: the surrounding validation must fail without a verdict.
class SettlementAbort : public std::runtime_error {
public:
    SettlementAbort(AbortReason reason, const std::string& message);

    [[nodiscard]] AbortReason reason() const noexcept { return reason_; }

private:
    AbortReason reason_;
};

// ─── SettlementReport ─────────────────────────────────────────────────────────

/// Verdict plus every quantity that led to it.
struct SettlementReport {
    oracle::Observation         observation;
    payments::SettlementAmounts amounts;
    bool                        inputs_ok  = false;
    bool                        outputs_ok = false;

    [[nodiscard]] bool accepted() const noexcept { return inputs_ok && outputs_ok; }
};

// ─── SettlementValidator ──────────────────────────────────────────────────────

/// The settlement predicate. All methods are static and stateless.
class SettlementValidator {
public:
    SettlementValidator() = delete;

    /// Run the full settlement check.
    ///
    /// # Returns
    /// `true` if the transaction settles the swap, `false` otherwise.
    ///
    /// # Throws
    /// `SettlementAbort` on a bad oracle signature, a wrong observation slot,
    /// or a transaction without exactly two inputs and two outputs.
    [[nodiscard]] static bool
    evaluate(const contract::SwapTerms&         terms,
             const contract::PartyIdentities&   parties,
             const oracle::SignedObservation&   observation,
             const transaction::TxInfo&         tx,
             const SettlementPolicy&            policy = SettlementPolicy{});

    /// Same checks and hard failures as `evaluate`, returning the
    /// intermediate amounts and the separate input/output verdicts.
    [[nodiscard]] static SettlementReport
    explain(const contract::SwapTerms&         terms,
            const contract::PartyIdentities&   parties,
            const oracle::SignedObservation&   observation,
            const transaction::TxInfo&         tx,
            const SettlementPolicy&            policy = SettlementPolicy{});

    /// The predicate as run while validating the spend of `tx.inputs[input_index]`.
    ///
    /// The contract locks both margins, so the ledger runs this once per
    /// margin; the verdict does not depend on which input triggered it.
    ///
    /// # Throws
    /// `SettlementAbort{SpentInputMissing}` if `input_index` is out of range,
    /// otherwise as `evaluate`.
    [[nodiscard]] static bool
    validate_spend(const contract::SwapTerms&         terms,
                   const contract::PartyIdentities&   parties,
                   const oracle::SignedObservation&   observation,
                   const transaction::TxInfo&         tx,
                   std::size_t                        input_index,
                   const SettlementPolicy&            policy = SettlementPolicy{});

    /// Authenticate an observation and check it is for the contract's slot.
    ///
    /// # Throws
    /// `SettlementAbort{SignatureCheckFailed}` or `SettlementAbort{WrongSlot}`.
    [[nodiscard]] static oracle::Observation
    verified_observation(const contract::SwapTerms& terms,
                         const oracle::SignedObservation& observation);
};

} // namespace swapsettle::validator
