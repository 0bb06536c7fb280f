/// @file src/core/types.cpp
/// @brief Formatting helpers for the shared value types.

#include "swapsettle/types.hpp"

namespace swapsettle {

std::string to_string(const Rational& q) {
    const Integer num = boost::multiprecision::numerator(q);
    const Integer den = boost::multiprecision::denominator(q);
    if (den == 1) {
        return num.str();
    }
    return num.str() + "/" + den.str();
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace swapsettle
