/**
 * @file  fuzz_observation_codec.cpp
 * @brief libFuzzer target for ObservationCodec::decode
 *
 * Build:
 *   cmake -DSWAPSETTLE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_observation_codec
 *
 * Run for 60 seconds:
 *   ./fuzz_observation_codec -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception escapes decode.
 *   2. If an observation is returned, its denominator is positive.
 *   3. If an observation is returned, re-encoding yields the input bytes.
 *
 * Fuzzer strategy:
 *   Half of the inputs are prefixed with the domain tag so the mutator
 *   spends its time on the slot and magnitude fields rather than the tag.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "swapsettle/constants.hpp"
#include "swapsettle/oracle.hpp"

using namespace swapsettle;
using namespace swapsettle::oracle;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    Bytes input;
    if (size > 0 && (data[0] & 1u) != 0) {
        input.assign(constants::OBSERVATION_DOMAIN_TAG.begin(),
                     constants::OBSERVATION_DOMAIN_TAG.end());
        input.insert(input.end(), data + 1, data + size);
    } else {
        input.assign(data, data + size);
    }

    const auto decoded = ObservationCodec::decode(input);
    if (decoded.has_value()) {
        assert(denominator(decoded->value) > 0);
        assert(ObservationCodec::encode(*decoded) == input);
    }

    return 0;
}
