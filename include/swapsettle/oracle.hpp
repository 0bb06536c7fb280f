#pragma once

/// @file include/swapsettle/oracle.hpp
/// @brief Oracle rate observations: canonical payload codec and Ed25519
///        signature verification.
///
/// # Module: Oracle
///
/// ## Responsibility
/// An oracle attests to an interest rate observed at a given slot by signing
/// the canonical encoding of an `Observation`. This module turns a
/// `SignedObservation` back into a trusted `Observation`, or reports why it
/// cannot.
///
/// ## Payload Layout (big-endian)
/// ```
/// tag          17 bytes  "swapsettle/obs/v1"
/// slot          8 bytes  two's-complement int64
/// num sign      1 byte   0x00 = non-negative, 0x01 = negative
/// num length    2 bytes  magnitude byte count
/// num bytes     N bytes  magnitude, no leading zero byte
/// den length    2 bytes
/// den bytes     M bytes  strictly positive, no leading zero byte
/// ```
///
/// ## Guarantees
/// - `decode` and `verify` are `noexcept`; failures are values
/// - The payload is decoded only after its signature has verified
/// - Exactly one encoding exists per observation
///
/// ## NOT Responsible For
/// - Checking that the observation is for the contract's slot
///   (see validator.hpp)
/// - Producing signatures (oracle-side key management is out of scope)

#include "swapsettle/types.hpp"

#include <optional>
#include <span>

namespace swapsettle::oracle {

// ─── Observation ──────────────────────────────────────────────────────────────

/// A rate value observed at a slot.
struct Observation {
    Rational value;  ///< Observed floating rate
    Slot     slot;   ///< Slot the oracle stamped the observation with

    friend bool operator==(const Observation&, const Observation&) = default;
};

/// Observation payload plus the oracle's signature over exactly those bytes.
struct SignedObservation {
    Bytes     payload;    ///< ObservationCodec::encode output
    Signature signature;  ///< Ed25519 signature over `payload`
};

// ─── ObservationCodec ─────────────────────────────────────────────────────────

/// Canonical byte encoding of an `Observation`.
class ObservationCodec {
public:
    ObservationCodec() = delete;

    /// Encode an observation. The rational is normalised by construction, so
    /// the output is the unique canonical encoding.
    [[nodiscard]] static Bytes encode(const Observation& obs);

    /// Decode a payload.
    ///
    /// # Returns
    /// - `nullopt` on a wrong tag, truncation, trailing bytes, a leading zero
    ///   magnitude byte, a zero denominator, negative zero, a value not in
    ///   lowest terms, or a magnitude longer than
    ///   MAX_OBSERVATION_MAGNITUDE_BYTES
    [[nodiscard]] static std::optional<Observation>
    decode(std::span<const std::uint8_t> payload) noexcept;
};

// ─── OracleVerifier ───────────────────────────────────────────────────────────

/// Why a signed observation could not be turned into an observation.
///
/// OpenSSL imports any 32 bytes as an Ed25519 key; a key that is not a
/// valid curve point is only caught at verification time and is reported
/// as `SignatureMismatch`.
enum class VerificationError {
    None,                 ///< Verification succeeded
    SignatureMismatch,    ///< Signature does not verify over the payload under the key
    DecodingFailed,       ///< Signature is valid but the payload is malformed
    VerifierUnavailable,  ///< OpenSSL could not set up verification (allocation, provider)
};

/// Convert VerificationError to a human-readable string.
[[nodiscard]] const char* to_string(VerificationError e) noexcept;

/// Outcome of `OracleVerifier::verify`: either an observation or an error.
struct OracleCheck {
    std::optional<Observation> observation;
    VerificationError          error = VerificationError::None;

    [[nodiscard]] explicit operator bool() const noexcept {
        return observation.has_value();
    }
};

/// Verifies oracle signatures with OpenSSL's Ed25519 implementation.
class OracleVerifier {
public:
    OracleVerifier() = delete;

    /// Check `signed_obs.signature` against `oracle` over the payload bytes,
    /// then decode the payload.
    [[nodiscard]] static OracleCheck
    verify(const PublicKey& oracle, const SignedObservation& signed_obs) noexcept;
};

} // namespace swapsettle::oracle
