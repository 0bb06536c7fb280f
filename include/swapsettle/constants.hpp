#pragma once

#include <cstddef>
#include <string_view>

/// @file include/swapsettle/constants.hpp
/// @brief Sizes, codec limits and defaults for the settlement library.

namespace swapsettle::constants {

// ─── Identity and Key Sizes ───────────────────────────────────────────────────

/// Byte length of a public-key hash (Blake2b-224 in the host ledger).
static constexpr std::size_t PARTY_ID_SIZE = 28;

/// Byte length of a raw Ed25519 public key.
static constexpr std::size_t PUBLIC_KEY_SIZE = 32;

/// Byte length of an Ed25519 signature.
static constexpr std::size_t SIGNATURE_SIZE = 64;

// ─── Observation Codec ────────────────────────────────────────────────────────

/// Domain tag prefixed to every signed observation payload. Binds a
/// signature to this message type so an oracle signature over some other
/// structure can never be replayed as a rate observation.
static constexpr std::string_view OBSERVATION_DOMAIN_TAG = "swapsettle/obs/v1";

/// Upper bound on the byte length of an encoded numerator or denominator.
/// 64 bytes = 512 bits, far beyond any meaningful interest rate.
static constexpr std::size_t MAX_OBSERVATION_MAGNITUDE_BYTES = 64;

// ─── Settlement Shape ─────────────────────────────────────────────────────────

/// A settlement spends exactly one margin input per party.
static constexpr std::size_t SETTLEMENT_INPUT_COUNT = 2;

/// A settlement pays exactly one remainder output per party.
static constexpr std::size_t SETTLEMENT_OUTPUT_COUNT = 2;

} // namespace swapsettle::constants
