/**
 * @file  fuzz_scenario_loader.cpp
 * @brief libFuzzer target for ScenarioLoader::parse_string and the validator
 *
 * Build:
 *   cmake -DSWAPSETTLE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_scenario_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_scenario_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. parse_string never throws and never crashes.
 *   2. A failed load always carries a non-empty error message.
 *   3. A loaded scenario either evaluates to a verdict or raises
 *      SettlementAbort; no other exception type escapes the validator.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "swapsettle/scenario_loader.hpp"
#include "swapsettle/validator.hpp"

using namespace swapsettle;
using namespace swapsettle::payments;
using namespace swapsettle::validator;
using namespace swapsettle::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);

    const auto loaded = ScenarioLoader::parse_string(text);
    if (!loaded) {
        assert(!loaded.error.empty());
        return 0;
    }

    const Scenario& sc = *loaded.scenario;
    for (ClampMode clamp : {ClampMode::Literal, ClampMode::Bounded}) {
        try {
            (void)SettlementValidator::evaluate(sc.terms, sc.parties, sc.observation, sc.tx,
                                                SettlementPolicy{RoundingMode::HalfEven, clamp});
        } catch (const SettlementAbort&) {
            // Hard failures are a valid outcome.
        }
    }

    return 0;
}
