/// @file src/oracle/observation_codec.cpp
/// @brief ObservationCodec — canonical byte encoding of oracle observations.

#include "swapsettle/oracle.hpp"
#include "swapsettle/constants.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace swapsettle::oracle {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

constexpr std::uint8_t SIGN_NON_NEGATIVE = 0x00;
constexpr std::uint8_t SIGN_NEGATIVE     = 0x01;

void append_u16_be(Bytes& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void append_i64_be(Bytes& out, std::int64_t v) {
    const auto u = static_cast<std::uint64_t>(v);
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((u >> shift) & 0xFF));
    }
}

/// Append a length-prefixed big-endian magnitude. Zero has length 0.
void append_magnitude(Bytes& out, const Integer& magnitude) {
    Bytes digits;
    if (magnitude != 0) {
        boost::multiprecision::export_bits(magnitude, std::back_inserter(digits), 8);
    }
    if (digits.size() > constants::MAX_OBSERVATION_MAGNITUDE_BYTES) {
        throw std::length_error("observation magnitude exceeds codec limit");
    }
    append_u16_be(out, static_cast<std::uint16_t>(digits.size()));
    out.insert(out.end(), digits.begin(), digits.end());
}

/// Forward-only reader over the payload. Every read checks bounds.
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] bool read_u8(std::uint8_t& v) noexcept {
        if (remaining() < 1) return false;
        v = data_[pos_++];
        return true;
    }

    [[nodiscard]] bool read_u16_be(std::uint16_t& v) noexcept {
        if (remaining() < 2) return false;
        v = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    [[nodiscard]] bool read_i64_be(std::int64_t& v) noexcept {
        if (remaining() < 8) return false;
        std::uint64_t u = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            u = (u << 8) | data_[pos_ + i];
        }
        pos_ += 8;
        v = static_cast<std::int64_t>(u);
        return true;
    }

    /// Read a length-prefixed magnitude, rejecting leading zero bytes.
    [[nodiscard]] bool read_magnitude(Integer& v) noexcept {
        std::uint16_t len = 0;
        if (!read_u16_be(len)) return false;
        if (len > constants::MAX_OBSERVATION_MAGNITUDE_BYTES) return false;
        if (remaining() < len) return false;
        if (len == 0) {
            v = 0;
            return true;
        }
        const std::uint8_t* first = data_.data() + pos_;
        if (*first == 0) return false;  // non-canonical
        boost::multiprecision::import_bits(v, first, first + len, 8);
        pos_ += len;
        return true;
    }

    [[nodiscard]] bool consume_tag(std::string_view tag) noexcept {
        if (remaining() < tag.size()) return false;
        if (!std::equal(tag.begin(), tag.end(), data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                        [](char c, std::uint8_t b) { return static_cast<std::uint8_t>(c) == b; })) {
            return false;
        }
        pos_ += tag.size();
        return true;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t                   pos_ = 0;
};

} // anonymous namespace

// ─── encode ───────────────────────────────────────────────────────────────────

Bytes ObservationCodec::encode(const Observation& obs) {
    Bytes out;
    out.reserve(constants::OBSERVATION_DOMAIN_TAG.size() + 8 + 1 + 2 + 2 + 16);

    out.insert(out.end(),
               constants::OBSERVATION_DOMAIN_TAG.begin(),
               constants::OBSERVATION_DOMAIN_TAG.end());
    append_i64_be(out, obs.slot.value);

    // cpp_rational keeps itself normalised: gcd(num, den) == 1, den > 0.
    const Integer num = boost::multiprecision::numerator(obs.value);
    const Integer den = boost::multiprecision::denominator(obs.value);

    out.push_back(num < 0 ? SIGN_NEGATIVE : SIGN_NON_NEGATIVE);
    append_magnitude(out, boost::multiprecision::abs(num));
    append_magnitude(out, den);
    return out;
}

// ─── decode ───────────────────────────────────────────────────────────────────

std::optional<Observation>
ObservationCodec::decode(std::span<const std::uint8_t> payload) noexcept {
    Reader reader(payload);

    if (!reader.consume_tag(constants::OBSERVATION_DOMAIN_TAG)) {
        return std::nullopt;
    }

    std::int64_t slot = 0;
    if (!reader.read_i64_be(slot)) {
        return std::nullopt;
    }

    std::uint8_t sign = 0;
    if (!reader.read_u8(sign)) {
        return std::nullopt;
    }
    if (sign != SIGN_NON_NEGATIVE && sign != SIGN_NEGATIVE) {
        return std::nullopt;
    }

    Integer num;
    Integer den;
    if (!reader.read_magnitude(num) || !reader.read_magnitude(den)) {
        return std::nullopt;
    }
    if (reader.remaining() != 0) {
        return std::nullopt;
    }

    if (den == 0) {
        return std::nullopt;
    }
    if (sign == SIGN_NEGATIVE && num == 0) {
        return std::nullopt;
    }
    // Lowest terms only; 0 must be written as 0/1.
    if (num == 0 ? den != 1 : boost::multiprecision::gcd(num, den) != 1) {
        return std::nullopt;
    }

    if (sign == SIGN_NEGATIVE) {
        num = -num;
    }

    return Observation{Rational(num) / Rational(den), Slot{slot}};
}

} // namespace swapsettle::oracle
