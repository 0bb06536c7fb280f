/// @file src/core/scenario_loader.cpp
/// @brief ScenarioLoader — key/value settlement scenarios for the CLI.

#include "swapsettle/scenario_loader.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>

namespace swapsettle::core {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool all_digits(std::string_view s) noexcept {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::optional<std::int64_t> parse_int64(std::string_view s) noexcept {
    std::int64_t v = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return v;
}

template <std::size_t N>
std::optional<std::array<std::uint8_t, N>> parse_fixed_hex(std::string_view s) noexcept {
    auto bytes = ScenarioLoader::parse_hex(s);
    if (!bytes || bytes->size() != N) {
        return std::nullopt;
    }
    std::array<std::uint8_t, N> out{};
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return out;
}

/// Ledger amounts are whole units and never negative.
std::optional<std::int64_t> parse_amount(std::string_view s) noexcept {
    auto v = parse_int64(s);
    if (!v || *v < 0) return std::nullopt;
    return v;
}

std::optional<PartyId> parse_party(std::string_view s) noexcept {
    auto raw = parse_fixed_hex<constants::PARTY_ID_SIZE>(s);
    if (!raw) return std::nullopt;
    return PartyId{*raw};
}

/// "<amount> <party>[,<party>...]"; the signer list may be omitted.
std::optional<transaction::TxInput> parse_input(std::string_view s) noexcept {
    const auto sep    = s.find_first_of(" \t");
    const auto amount = parse_amount(s.substr(0, sep));
    if (!amount) return std::nullopt;

    transaction::TxInput in;
    in.amount = *amount;
    if (sep == std::string_view::npos) {
        return in;
    }

    std::string_view rest = trim(s.substr(sep));
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        auto party = parse_party(trim(rest.substr(0, comma)));
        if (!party) return std::nullopt;
        in.signers.push_back(*party);
        if (comma == std::string_view::npos) break;
        rest = rest.substr(comma + 1);
    }
    return in;
}

/// "<amount> <party>|script"
std::optional<transaction::TxOutput> parse_output(std::string_view s) noexcept {
    const auto sep = s.find_first_of(" \t");
    if (sep == std::string_view::npos) return std::nullopt;

    const auto amount = parse_amount(s.substr(0, sep));
    if (!amount) return std::nullopt;

    transaction::TxOutput out;
    out.amount = *amount;

    const std::string_view dest = trim(s.substr(sep));
    if (dest == "script") {
        return out;
    }
    auto party = parse_party(dest);
    if (!party) return std::nullopt;
    out.payee = *party;
    return out;
}

ScenarioLoadResult fail(std::size_t line_no, const std::string& what) {
    ScenarioLoadResult r;
    r.error = (line_no > 0 ? "line " + std::to_string(line_no) + ": " : std::string{}) + what;
    return r;
}

} // anonymous namespace

// ─── parse_rational ───────────────────────────────────────────────────────────

std::optional<Rational>
ScenarioLoader::parse_rational(std::string_view text) noexcept {
    text = trim(text);
    const auto slash = text.find('/');
    std::string_view num_text = trim(text.substr(0, slash));
    std::string_view den_text = slash == std::string_view::npos
                                    ? std::string_view("1")
                                    : trim(text.substr(slash + 1));

    bool negative = false;
    if (!num_text.empty() && num_text.front() == '-') {
        negative = true;
        num_text.remove_prefix(1);
    }
    // Digits are checked first so the cpp_int string constructor cannot throw.
    if (!all_digits(num_text) || !all_digits(den_text)) {
        return std::nullopt;
    }

    const std::string num_str(num_text);
    const std::string den_str(den_text);
    Integer num(num_str.c_str());
    const Integer den(den_str.c_str());
    if (den == 0) {
        return std::nullopt;
    }
    if (negative) {
        num = -num;
    }
    return Rational(num) / Rational(den);
}

// ─── parse_hex ────────────────────────────────────────────────────────────────

std::optional<Bytes> ScenarioLoader::parse_hex(std::string_view text) noexcept {
    text = trim(text);
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }

    const auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = nibble(text[i]);
        const int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

// ─── parse_string ─────────────────────────────────────────────────────────────

ScenarioLoadResult ScenarioLoader::parse_string(std::string_view content) noexcept {
    std::map<std::string, std::pair<std::string, std::size_t>> scalars;
    std::vector<transaction::TxInput>  inputs;
    std::vector<transaction::TxOutput> outputs;

    static const char* const SCALAR_KEYS[] = {
        "notional", "observation_slot", "fixed_rate", "floating_rate", "margin",
        "oracle_key", "fixed_party", "floating_party",
        "observation_payload", "observation_signature",
    };

    std::istringstream stream{std::string(content)};
    std::string raw_line;
    std::size_t line_no = 0;

    while (std::getline(stream, raw_line)) {
        ++line_no;
        const std::string_view line = trim(raw_line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            return fail(line_no, "expected 'key = value'");
        }
        const std::string key(trim(line.substr(0, eq)));
        const std::string_view value = trim(line.substr(eq + 1));

        if (key == "input") {
            auto in = parse_input(value);
            if (!in) return fail(line_no, "malformed input");
            inputs.push_back(std::move(*in));
            continue;
        }
        if (key == "output") {
            auto out = parse_output(value);
            if (!out) return fail(line_no, "malformed output");
            outputs.push_back(std::move(*out));
            continue;
        }

        const bool known = std::any_of(std::begin(SCALAR_KEYS), std::end(SCALAR_KEYS),
                                       [&](const char* k) { return key == k; });
        if (!known) {
            return fail(line_no, "unknown key '" + key + "'");
        }
        if (scalars.count(key) != 0) {
            return fail(line_no, "duplicate key '" + key + "'");
        }
        scalars.emplace(key, std::make_pair(std::string(value), line_no));
    }

    for (const char* k : SCALAR_KEYS) {
        if (scalars.count(k) == 0) {
            return fail(0, std::string("missing key '") + k + "'");
        }
    }

    const auto value_of = [&](const char* k) -> std::string_view { return scalars.at(k).first; };
    const auto line_of  = [&](const char* k) { return scalars.at(k).second; };

    const auto notional = parse_amount(value_of("notional"));
    if (!notional) return fail(line_of("notional"), "notional must be a non-negative integer");
    const auto slot = parse_int64(value_of("observation_slot"));
    if (!slot) return fail(line_of("observation_slot"), "bad observation_slot");
    const auto margin = parse_amount(value_of("margin"));
    if (!margin) return fail(line_of("margin"), "margin must be a non-negative integer");
    auto fixed_rate = parse_rational(value_of("fixed_rate"));
    if (!fixed_rate) return fail(line_of("fixed_rate"), "bad fixed_rate");
    auto floating_rate = parse_rational(value_of("floating_rate"));
    if (!floating_rate) return fail(line_of("floating_rate"), "bad floating_rate");
    const auto oracle_key = parse_fixed_hex<constants::PUBLIC_KEY_SIZE>(value_of("oracle_key"));
    if (!oracle_key) return fail(line_of("oracle_key"), "oracle_key must be 32 bytes of hex");
    const auto fixed_party = parse_party(value_of("fixed_party"));
    if (!fixed_party) return fail(line_of("fixed_party"), "fixed_party must be 28 bytes of hex");
    const auto floating_party = parse_party(value_of("floating_party"));
    if (!floating_party) return fail(line_of("floating_party"), "floating_party must be 28 bytes of hex");
    auto payload = parse_hex(value_of("observation_payload"));
    if (!payload) return fail(line_of("observation_payload"), "bad observation_payload hex");
    const auto signature = parse_fixed_hex<constants::SIGNATURE_SIZE>(value_of("observation_signature"));
    if (!signature) return fail(line_of("observation_signature"), "observation_signature must be 64 bytes of hex");

    Scenario sc{
        .terms = contract::SwapTerms{
            .notional         = *notional,
            .observation_slot = Slot{*slot},
            .fixed_rate       = std::move(*fixed_rate),
            .floating_rate    = std::move(*floating_rate),
            .margin           = *margin,
            .oracle           = PublicKey{*oracle_key},
        },
        .parties = contract::PartyIdentities{*fixed_party, *floating_party},
        .observation = oracle::SignedObservation{std::move(*payload), Signature{*signature}},
        .tx = transaction::TxInfo{std::move(inputs), std::move(outputs)},
    };

    ScenarioLoadResult r;
    r.scenario = std::move(sc);
    return r;
}

// ─── load_file ────────────────────────────────────────────────────────────────

ScenarioLoadResult ScenarioLoader::load_file(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return fail(0, "cannot open file '" + filepath + "'");
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_string(contents.str());
}

} // namespace swapsettle::core
