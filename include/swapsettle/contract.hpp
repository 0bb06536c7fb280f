#pragma once

/// @file include/swapsettle/contract.hpp
/// @brief Swap contract parameters and the identities of its two parties.
///
/// # Module: Contract
///
/// ## Responsibility
/// Plain value types describing one interest-rate swap. `SwapTerms` is fixed
/// when the contract is created and never changes. `PartyIdentities` may be
/// reassigned over the contract's life when a party sells its position, but
/// that happens outside this library; here both are read-only inputs.
///
/// ## NOT Responsible For
/// - Serialising the terms into the contract's on-chain data record
/// - Deciding whether a contract may be opened

#include "swapsettle/types.hpp"

namespace swapsettle::contract {

// ─── SwapTerms ────────────────────────────────────────────────────────────────

/// Immutable parameters of a swap.
struct SwapTerms {
    Amount    notional;          ///< Principal the interest is computed on (never transferred)
    Slot      observation_slot;  ///< Slot at which the floating rate must be observed
    Rational  fixed_rate;        ///< Rate agreed at contract start
    Rational  floating_rate;     ///< Contractual placeholder; settlement uses the observed rate
    Amount    margin;            ///< Collateral each party posts
    PublicKey oracle;            ///< Key the rate observation must be signed with
};

// ─── PartyIdentities ──────────────────────────────────────────────────────────

/// Who receives each leg's payout.
struct PartyIdentities {
    PartyId fixed_leg;     ///< Holder of the fixed-rate leg
    PartyId floating_leg;  ///< Holder of the floating-rate leg
};

} // namespace swapsettle::contract
