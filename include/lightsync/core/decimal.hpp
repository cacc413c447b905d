#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>

#include <boost/multiprecision/cpp_dec_float.hpp>


namespace lightsync {

/*
===============================================================================
 Decimal
===============================================================================

Exact base-10 number used for every price, size and balance carried by the
venue. Values arrive as decimal strings ("0.500000") and are kept in decimal
form so that equality, ordering and "is zero" decisions are exact.

Floating point is never used for quantities: a remaining amount of "0.000000"
must compare equal to zero, and "0.1" + "0.2" must equal "0.3".
===============================================================================
*/
using Decimal = boost::multiprecision::cpp_dec_float_50;


namespace decimal {

// Validates the textual form accepted by the venue:
//   [+-]digits[.digits][(e|E)[+-]digits]  or  [+-].digits
[[nodiscard]]
inline bool is_well_formed(std::string_view s) noexcept {
    std::size_t i = 0;
    const std::size_t n = s.size();
    if (n == 0) {
        return false;
    }
    if (s[i] == '+' || s[i] == '-') {
        ++i;
    }
    std::size_t int_digits = 0;
    while (i < n && s[i] >= '0' && s[i] <= '9') { ++i; ++int_digits; }
    std::size_t frac_digits = 0;
    if (i < n && s[i] == '.') {
        ++i;
        while (i < n && s[i] >= '0' && s[i] <= '9') { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) {
        return false;
    }
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) {
            ++i;
        }
        std::size_t exp_digits = 0;
        while (i < n && s[i] >= '0' && s[i] <= '9') { ++i; ++exp_digits; }
        if (exp_digits == 0) {
            return false;
        }
    }
    return i == n;
}

// Parses a decimal string. Returns false (and leaves `out` untouched) on
// malformed input.
[[nodiscard]]
inline bool parse(std::string_view s, Decimal& out) noexcept {
    if (!is_well_formed(s)) {
        return false;
    }
    try {
        out = Decimal(std::string(s));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

[[nodiscard]]
inline std::optional<Decimal> parse(std::string_view s) noexcept {
    Decimal d;
    if (!parse(s, d)) {
        return std::nullopt;
    }
    return d;
}

// Exact zero check on an already parsed value
[[nodiscard]]
inline bool is_zero(const Decimal& d) noexcept {
    return d.is_zero();
}

// Exact zero check on the textual form. Malformed text is never zero.
[[nodiscard]]
inline bool is_zero(std::string_view s) noexcept {
    Decimal d;
    return parse(s, d) && d.is_zero();
}

// Plain (non-scientific) rendering for logs and wire output
[[nodiscard]]
inline std::string to_string(const Decimal& d) {
    std::string s = d.str(0, std::ios_base::fixed);
    // Trim trailing zeros of the fractional part
    const auto dot = s.find('.');
    if (dot != std::string::npos) {
        auto last = s.find_last_not_of('0');
        if (last == dot) {
            --last;
        }
        s.erase(last + 1);
    }
    if (s == "-0") {
        s = "0";
    }
    return s;
}

} // namespace decimal
} // namespace lightsync
