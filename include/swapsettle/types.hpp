#pragma once

/// @file include/swapsettle/types.hpp
/// @brief Shared primitive types for the swap settlement library.
///
/// Every module includes this file. It defines the ledger value types
/// (amounts, slots, identities, keys) and the exact-arithmetic aliases used
/// by the payment pipeline. Nothing in this library touches binary floating
/// point.

#include "swapsettle/constants.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace swapsettle {

// ─── Exact Arithmetic ─────────────────────────────────────────────────────────

/// Arbitrary-precision integer used for all intermediate payment arithmetic.
using Integer = boost::multiprecision::cpp_int;

/// Exact rational number, always held in lowest terms with a positive
/// denominator.
using Rational = boost::multiprecision::cpp_rational;

// ─── Ledger Scalars ───────────────────────────────────────────────────────────

/// Quantity of the base currency in its smallest denomination.
using Amount = std::int64_t;

/// Raw byte string.
using Bytes = std::vector<std::uint8_t>;

/// A point on the ledger's logical clock. Only exact equality is meaningful.
struct Slot {
    std::int64_t value;

    friend bool operator==(const Slot&, const Slot&) = default;
};

// ─── Identities and Keys ──────────────────────────────────────────────────────

/// Public-key hash identifying a party (signer of inputs, payee of outputs).
struct PartyId {
    std::array<std::uint8_t, constants::PARTY_ID_SIZE> bytes{};

    friend bool operator==(const PartyId&, const PartyId&) = default;
};

/// Ed25519 public key of the rate oracle.
struct PublicKey {
    std::array<std::uint8_t, constants::PUBLIC_KEY_SIZE> bytes{};

    friend bool operator==(const PublicKey&, const PublicKey&) = default;
};

/// Ed25519 signature.
struct Signature {
    std::array<std::uint8_t, constants::SIGNATURE_SIZE> bytes{};

    friend bool operator==(const Signature&, const Signature&) = default;
};

// ─── Formatting helpers ───────────────────────────────────────────────────────

/// Render a rational as "n/d" (or "n" when the denominator is 1).
[[nodiscard]] std::string to_string(const Rational& q);

/// Lowercase hex rendering of raw bytes (identities, keys, payloads).
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

} // namespace swapsettle
