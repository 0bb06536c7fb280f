/// @file src/validator/settlement_validator.cpp
/// @brief SettlementValidator — authenticate, compute, match.

#include "swapsettle/validator.hpp"
#include "swapsettle/constants.hpp"

#include <utility>

namespace swapsettle::validator {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

void require_shape(const transaction::TxInfo& tx) {
    if (tx.inputs.size() != constants::SETTLEMENT_INPUT_COUNT) {
        throw SettlementAbort(AbortReason::WrongInputCount,
                              "expected 2 inputs, found " +
                                  std::to_string(tx.inputs.size()));
    }
    if (tx.outputs.size() != constants::SETTLEMENT_OUTPUT_COUNT) {
        throw SettlementAbort(AbortReason::WrongOutputCount,
                              "expected 2 outputs, found " +
                                  std::to_string(tx.outputs.size()));
    }
}

} // anonymous namespace

// ─── AbortReason / SettlementAbort ────────────────────────────────────────────

const char* to_string(AbortReason r) noexcept {
    switch (r) {
        case AbortReason::SignatureCheckFailed: return "SignatureCheckFailed";
        case AbortReason::WrongSlot:            return "WrongSlot";
        case AbortReason::WrongInputCount:      return "WrongInputCount";
        case AbortReason::WrongOutputCount:     return "WrongOutputCount";
        case AbortReason::SpentInputMissing:    return "SpentInputMissing";
    }
    return "Unknown";
}

SettlementAbort::SettlementAbort(AbortReason reason, const std::string& message)
    : std::runtime_error(message), reason_(reason) {}

// ─── verified_observation ─────────────────────────────────────────────────────

oracle::Observation
SettlementValidator::verified_observation(const contract::SwapTerms& terms,
                                          const oracle::SignedObservation& observation) {
    oracle::OracleCheck check = oracle::OracleVerifier::verify(terms.oracle, observation);
    if (!check) {
        throw SettlementAbort(AbortReason::SignatureCheckFailed,
                              std::string("checkSignatureAndDecode failed: ") +
                                  to_string(check.error));
    }

    // No check that the slot lies after contract start: the oracle stamps
    // the slot and is trusted to do so.
    if (!(check.observation->slot == terms.observation_slot)) {
        throw SettlementAbort(AbortReason::WrongSlot,
                              "wrong slot: observed " +
                                  std::to_string(check.observation->slot.value) +
                                  ", expected " +
                                  std::to_string(terms.observation_slot.value));
    }
    return std::move(*check.observation);
}

// ─── explain ──────────────────────────────────────────────────────────────────

SettlementReport
SettlementValidator::explain(const contract::SwapTerms&         terms,
                             const contract::PartyIdentities&   parties,
                             const oracle::SignedObservation& observation,
                             const transaction::TxInfo&            tx,
                             const SettlementPolicy&  policy) {
    SettlementReport report;

    // 1. Authenticate the rate.
    report.observation = verified_observation(terms, observation);

    // 2–3. Payments and clamped remainders.
    report.amounts = payments::PaymentCalculator::compute(terms,
                                                          report.observation.value,
                                                          policy.rounding,
                                                          policy.clamp);

    // 4–5. Exactly two inputs and two outputs, then order-free pairing.
    require_shape(tx);

    using transaction::ShapeMatcher;
    report.inputs_ok = ShapeMatcher::inputs_match(tx.inputs[0], tx.inputs[1],
                                                  parties, terms.margin);
    report.outputs_ok = ShapeMatcher::outputs_match(tx.outputs[0], tx.outputs[1],
                                                    parties,
                                                    report.amounts.fixed_remainder,
                                                    report.amounts.float_remainder);
    return report;
}

// ─── evaluate ─────────────────────────────────────────────────────────────────

bool SettlementValidator::evaluate(const contract::SwapTerms&         terms,
                                   const contract::PartyIdentities&   parties,
                                   const oracle::SignedObservation& observation,
                                   const transaction::TxInfo&            tx,
                                   const SettlementPolicy&  policy) {
    return explain(terms, parties, observation, tx, policy).accepted();
}

// ─── validate_spend ───────────────────────────────────────────────────────────

bool SettlementValidator::validate_spend(const contract::SwapTerms&         terms,
                                         const contract::PartyIdentities&   parties,
                                         const oracle::SignedObservation& observation,
                                         const transaction::TxInfo&            tx,
                                         std::size_t              input_index,
                                         const SettlementPolicy&  policy) {
    if (input_index >= tx.inputs.size()) {
        throw SettlementAbort(AbortReason::SpentInputMissing,
                              "spent input " + std::to_string(input_index) +
                                  " not in transaction");
    }
    // The spent input plays no part in the decision.
    return evaluate(terms, parties, observation, tx, policy);
}

} // namespace swapsettle::validator
