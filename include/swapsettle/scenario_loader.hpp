#pragma once

/// @file include/swapsettle/scenario_loader.hpp
/// @brief Text loader for settlement scenarios used by the CLI harness.
///
/// # Module: ScenarioLoader
///
/// ## Responsibility
/// Parse a line-oriented `key = value` file describing one settlement
/// attempt (terms, parties, signed observation, transaction) into the
/// library's value types. This is a host-side harness format for exercising
/// the validator from the command line, not the contract's on-chain
/// encoding.
///
/// ## Format
/// ```
/// # comment
/// notional              = 1000000
/// observation_slot      = 42
/// fixed_rate            = 1/20
/// floating_rate         = 1/20
/// margin                = 100000
/// oracle_key            = <64 hex chars>
/// fixed_party           = <56 hex chars>
/// floating_party        = <56 hex chars>
/// observation_payload   = <hex>
/// observation_signature = <128 hex chars>
/// input                 = 100000 <party-hex>[,<party-hex>...]
/// output                = 100000 <party-hex>|script
/// ```
/// `input` and `output` may repeat; every other key must appear once.
///
/// ## Guarantees
/// - Never throws; failures carry a message naming the offending line
/// - `notional`, `margin` and every input and output amount are non-negative

#include "swapsettle/contract.hpp"
#include "swapsettle/oracle.hpp"
#include "swapsettle/transaction.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace swapsettle::core {

/// One settlement attempt.
struct Scenario {
    contract::SwapTerms         terms;
    contract::PartyIdentities   parties;
    oracle::SignedObservation   observation;
    transaction::TxInfo         tx;
};

/// Outcome of a load: either a scenario or an error message.
struct ScenarioLoadResult {
    std::optional<Scenario> scenario;
    std::string             error;

    [[nodiscard]] explicit operator bool() const noexcept {
        return scenario.has_value();
    }
};

/// Loads settlement scenarios from files and strings.
class ScenarioLoader {
public:
    ScenarioLoader() = delete;

    /// Load a scenario file from disk.
    [[nodiscard]] static ScenarioLoadResult
    load_file(const std::string& filepath) noexcept;

    /// Parse scenario text (useful for testing).
    [[nodiscard]] static ScenarioLoadResult
    parse_string(std::string_view content) noexcept;

    /// Parse "n/d" or "n" into an exact rational. Denominator must be > 0.
    [[nodiscard]] static std::optional<Rational>
    parse_rational(std::string_view text) noexcept;

    /// Parse a hex string of any even length.
    [[nodiscard]] static std::optional<Bytes>
    parse_hex(std::string_view text) noexcept;
};

} // namespace swapsettle::core
