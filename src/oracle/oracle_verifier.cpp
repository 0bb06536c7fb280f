/// @file src/oracle/oracle_verifier.cpp
/// @brief OracleVerifier — Ed25519 verification of signed rate observations.

#include "swapsettle/oracle.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>
#include <utility>

namespace swapsettle::oracle {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const noexcept { EVP_MD_CTX_free(c); }
};

using PkeyPtr  = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

[[nodiscard]] OracleCheck failure(VerificationError e) noexcept {
    // Leave no stale entries behind for the next caller on this thread.
    ERR_clear_error();
    return OracleCheck{std::nullopt, e};
}

} // anonymous namespace

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(VerificationError e) noexcept {
    switch (e) {
        case VerificationError::None:                return "None";
        case VerificationError::SignatureMismatch:   return "SignatureMismatch";
        case VerificationError::DecodingFailed:      return "DecodingFailed";
        case VerificationError::VerifierUnavailable: return "VerifierUnavailable";
    }
    return "Unknown";
}

// ─── verify ───────────────────────────────────────────────────────────────────

OracleCheck
OracleVerifier::verify(const PublicKey& oracle,
                       const SignedObservation& signed_obs) noexcept {
    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                            oracle.bytes.data(),
                                            oracle.bytes.size()));
    if (!key) {
        return failure(VerificationError::VerifierUnavailable);
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return failure(VerificationError::VerifierUnavailable);
    }

    // Ed25519 hashes internally: the digest argument must be null.
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return failure(VerificationError::VerifierUnavailable);
    }

    const int ok = EVP_DigestVerify(ctx.get(),
                                    signed_obs.signature.bytes.data(),
                                    signed_obs.signature.bytes.size(),
                                    signed_obs.payload.data(),
                                    signed_obs.payload.size());
    if (ok != 1) {
        return failure(VerificationError::SignatureMismatch);
    }

    auto obs = ObservationCodec::decode(signed_obs.payload);
    if (!obs) {
        return failure(VerificationError::DecodingFailed);
    }

    return OracleCheck{std::move(obs), VerificationError::None};
}

} // namespace swapsettle::oracle
