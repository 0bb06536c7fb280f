#pragma once

/// @file tests/support/scenario_text.hpp
/// @brief Renders settlement fixtures in the CLI scenario format.

#include "settlement_fixture.hpp"

#include <string>

namespace swapsettle::testing {

/// Scenario text for the canonical swap, settled by `tx`.
inline std::string scenario_text(const PublicKey& oracle_key,
                                 const contract::PartyIdentities& parties,
                                 const oracle::SignedObservation& obs,
                                 const transaction::TxInfo& tx) {
    std::string s;
    s += "# canonical swap\n";
    s += "notional = " + std::to_string(NOTIONAL) + "\n";
    s += "observation_slot = " + std::to_string(OBSERVATION_SLOT.value) + "\n";
    s += "fixed_rate = 1/20\n";
    s += "floating_rate = 1/20\n";
    s += "margin = " + std::to_string(MARGIN) + "\n";
    s += "oracle_key = " + to_hex(oracle_key.bytes) + "\n";
    s += "fixed_party = " + to_hex(parties.fixed_leg.bytes) + "\n";
    s += "floating_party = " + to_hex(parties.floating_leg.bytes) + "\n";
    s += "observation_payload = " + to_hex(obs.payload) + "\n";
    s += "observation_signature = " + to_hex(obs.signature.bytes) + "\n";
    for (const transaction::TxInput& in : tx.inputs) {
        s += "input = " + std::to_string(in.amount);
        for (std::size_t i = 0; i < in.signers.size(); ++i) {
            s += (i == 0 ? " " : ",") + to_hex(in.signers[i].bytes);
        }
        s += "\n";
    }
    for (const transaction::TxOutput& out : tx.outputs) {
        s += "output = " + std::to_string(out.amount) + " " +
             (out.payee ? to_hex(out.payee->bytes) : std::string("script")) + "\n";
    }
    return s;
}

} // namespace swapsettle::testing
