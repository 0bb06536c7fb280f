/**
 * @file  bench/bench_settlement.cpp
 * @brief Google Benchmark suite for the settlement predicate.
 *
 * Benchmarks
 * ----------
 *   BM_ObservationCodec_Decode   — canonical payload parse
 *   BM_OracleVerifier_Verify     — Ed25519 verify + decode
 *   BM_PaymentCalculator_Compute — exact payments, by rate denominator size
 *   BM_Settlement_Evaluate       — full predicate, accepted transaction
 *
 * Build (CMake):
 *   cmake -DSWAPSETTLE_BENCH=ON ..
 *   cmake --build build --target bench_settlement
 *   ./build/bench_settlement --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "swapsettle/oracle.hpp"
#include "swapsettle/payments.hpp"
#include "swapsettle/validator.hpp"
#include "support/settlement_fixture.hpp"

#include <cstdint>

using namespace swapsettle;
using namespace swapsettle::contract;
using namespace swapsettle::oracle;
using namespace swapsettle::payments;
using namespace swapsettle::transaction;
using namespace swapsettle::validator;
using namespace swapsettle::testing;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const TestOracle& bench_oracle() {
    static const TestOracle oracle;
    return oracle;
}

/// Observed rate 3/40 scaled by a denominator of roughly `bits` bits.
static Rational make_rate(std::int64_t bits) {
    const Integer den = (Integer(1) << static_cast<unsigned>(bits)) + 1;
    return Rational(Integer(den * 3 / 40)) / Rational(den);
}

// ── Oracle ─────────────────────────────────────────────────────────────────────

static void BM_ObservationCodec_Decode(benchmark::State& state) {
    const Bytes payload = ObservationCodec::encode(observed_rate(Rational(3) / 40));
    for (auto _ : state) {
        auto obs = ObservationCodec::decode(payload);
        benchmark::DoNotOptimize(obs);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ObservationCodec_Decode);

static void BM_OracleVerifier_Verify(benchmark::State& state) {
    const auto& oracle = bench_oracle();
    const auto signed_obs = oracle.sign(observed_rate(Rational(3) / 40));
    for (auto _ : state) {
        auto check = OracleVerifier::verify(oracle.public_key(), signed_obs);
        benchmark::DoNotOptimize(check);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_OracleVerifier_Verify)->Unit(benchmark::kMicrosecond);

// ── Payments ───────────────────────────────────────────────────────────────────

static void BM_PaymentCalculator_Compute(benchmark::State& state) {
    const SwapTerms terms = make_terms(PublicKey{});
    const Rational  rate  = make_rate(state.range(0));
    for (auto _ : state) {
        auto amounts = PaymentCalculator::compute(terms, rate, RoundingMode::HalfEven,
                                                  ClampMode::Bounded);
        benchmark::DoNotOptimize(amounts);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_PaymentCalculator_Compute)->RangeMultiplier(8)->Range(8, 512);

// ── Full predicate ─────────────────────────────────────────────────────────────

static void BM_Settlement_Evaluate(benchmark::State& state) {
    const auto& oracle = bench_oracle();
    const SwapTerms       terms   = make_terms(oracle.public_key());
    const PartyIdentities parties = make_parties();
    const auto signed_obs = oracle.sign(observed_rate(Rational(3) / 40));
    const TxInfo tx = settlement_tx(parties, MARGIN, MARGIN);
    const SettlementPolicy policy{RoundingMode::HalfEven, ClampMode::Bounded};

    for (auto _ : state) {
        bool ok = SettlementValidator::evaluate(terms, parties, signed_obs, tx, policy);
        benchmark::DoNotOptimize(ok);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Settlement_Evaluate)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
