/// @file src/main.cpp
/// @brief swapsettle CLI entry point.
///
/// Usage:
///   swapsettle --evaluate <scenario> [--rounding half-even|half-away]
///                                    [--clamp literal|bounded] [--explain]
///   swapsettle --help
///
/// Exit codes: 0 accepted, 1 rejected, 2 aborted, 3 usage or load error.

#include "swapsettle/scenario_loader.hpp"
#include "swapsettle/validator.hpp"

#include <fmt/core.h>

#include <exception>
#include <optional>
#include <string>

namespace {

constexpr int EXIT_ACCEPTED = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_ABORTED  = 2;
constexpr int EXIT_USAGE    = 3;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  swapsettle --evaluate <scenario> [options]   Evaluate a settlement\n"
        "  swapsettle --help                            Show this help\n"
        "\n"
        "Options:\n"
        "  --rounding half-even|half-away   Payment rounding (default half-even)\n"
        "  --clamp literal|bounded          Payout clamp (default literal)\n"
        "  --explain                        Print every intermediate amount\n"
    );
}

std::optional<swapsettle::payments::RoundingMode> parse_rounding(const std::string& s) {
    if (s == "half-even") return swapsettle::payments::RoundingMode::HalfEven;
    if (s == "half-away") return swapsettle::payments::RoundingMode::HalfAwayFromZero;
    return std::nullopt;
}

std::optional<swapsettle::payments::ClampMode> parse_clamp(const std::string& s) {
    if (s == "literal") return swapsettle::payments::ClampMode::Literal;
    if (s == "bounded") return swapsettle::payments::ClampMode::Bounded;
    return std::nullopt;
}

void print_report(const swapsettle::core::Scenario& sc,
                  const swapsettle::validator::SettlementReport& r,
                  const swapsettle::validator::SettlementPolicy& policy) {
    using swapsettle::to_string;
    using swapsettle::payments::to_string;
    const auto& a = r.amounts;
    fmt::print("policy:          rounding={} clamp={}\n",
               to_string(policy.rounding), to_string(policy.clamp));
    fmt::print("fixed party:     {}\n", swapsettle::to_hex(sc.parties.fixed_leg.bytes));
    fmt::print("floating party:  {}\n", swapsettle::to_hex(sc.parties.floating_leg.bytes));
    fmt::print("observed rate:   {} @ slot {}\n",
               to_string(r.observation.value), r.observation.slot.value);
    fmt::print("rate delta:      {}\n", to_string(a.rate_delta));
    fmt::print("delta:           {}\n", to_string(a.delta));
    fmt::print("fixed payment:   {}\n", a.fixed_payment.str());
    fmt::print("float payment:   {}\n", a.float_payment.str());
    fmt::print("fixed remainder: {}\n", a.fixed_remainder.str());
    fmt::print("float remainder: {}\n", a.float_remainder.str());
    fmt::print("inputs:          {}\n", r.inputs_ok ? "ok" : "mismatch");
    fmt::print("outputs:         {}\n", r.outputs_ok ? "ok" : "mismatch");
}

/// Load and evaluate one scenario file.
int run_evaluate(const std::string& path,
                 const swapsettle::validator::SettlementPolicy& policy,
                 bool explain) {
    auto loaded = swapsettle::core::ScenarioLoader::load_file(path);
    if (!loaded) {
        fmt::print(stderr, "Error: {}: {}\n", path, loaded.error);
        return EXIT_USAGE;
    }
    const auto& sc = *loaded.scenario;

    try {
        const auto report = swapsettle::validator::SettlementValidator::explain(
            sc.terms, sc.parties, sc.observation, sc.tx, policy);
        if (explain) {
            print_report(sc, report, policy);
        }
        fmt::print("{}\n", report.accepted() ? "ACCEPT" : "REJECT");
        return report.accepted() ? EXIT_ACCEPTED : EXIT_REJECTED;
    } catch (const swapsettle::validator::SettlementAbort& ex) {
        fmt::print(stderr, "[ABORT] {}: {}\n", to_string(ex.reason()), ex.what());
        return EXIT_ABORTED;
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_USAGE;
    }

    std::optional<std::string> scenario;
    swapsettle::validator::SettlementPolicy policy;
    bool explain = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return EXIT_ACCEPTED;
        }
        if (arg == "--explain") {
            explain = true;
            continue;
        }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", arg);
            print_usage();
            return EXIT_USAGE;
        }
        const std::string value(argv[++i]);

        if (arg == "--evaluate") {
            scenario = value;
        } else if (arg == "--rounding") {
            auto mode = parse_rounding(value);
            if (!mode) {
                fmt::print(stderr, "Error: unknown rounding mode '{}'\n", value);
                return EXIT_USAGE;
            }
            policy.rounding = *mode;
        } else if (arg == "--clamp") {
            auto mode = parse_clamp(value);
            if (!mode) {
                fmt::print(stderr, "Error: unknown clamp mode '{}'\n", value);
                return EXIT_USAGE;
            }
            policy.clamp = *mode;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            print_usage();
            return EXIT_USAGE;
        }
    }

    if (!scenario) {
        fmt::print(stderr, "Error: --evaluate <scenario> is required\n");
        print_usage();
        return EXIT_USAGE;
    }

    try {
        return run_evaluate(*scenario, policy, explain);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return EXIT_ABORTED;
    }
}
