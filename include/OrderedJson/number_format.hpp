#pragma once

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace OrderedJson::number_format {

// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
constexpr bool is_valid_number_literal(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    auto digit = [&](std::size_t k) { return k < n && s[k] >= '0' && s[k] <= '9'; };
    if(i < n && s[i] == '-') i ++;
    if(!digit(i)) return false;
    if(s[i] == '0') {
        i ++;
    } else {
        while(digit(i)) i ++;
    }
    if(i < n && s[i] == '.') {
        i ++;
        if(!digit(i)) return false;
        while(digit(i)) i ++;
    }
    if(i < n && (s[i] == 'e' || s[i] == 'E')) {
        i ++;
        if(i < n && (s[i] == '+' || s[i] == '-')) i ++;
        if(!digit(i)) return false;
        while(digit(i)) i ++;
    }
    return i == n;
}

template<std::integral T>
constexpr void append_integer(std::string & out, T v) {
    char buf[24];
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    out.append(buf, p);
}

namespace detail {

struct Decimal {
    bool negative = false;
    std::string_view digits;  // shortest significant digits, no dot
    int exp10 = 0;            // value = d.ddd * 10^exp10
};

// Splits std::to_chars scientific output ("-1.25e+07") into parts
inline Decimal split_scientific(std::string_view sci, std::string & digitsStorage) {
    Decimal d;
    std::size_t i = 0;
    if(sci[i] == '-') {
        d.negative = true;
        i ++;
    }
    const std::size_t e = sci.find('e', i);
    digitsStorage.clear();
    for(std::size_t k = i; k < e; k ++) {
        if(sci[k] != '.') digitsStorage.push_back(sci[k]);
    }
    d.digits = digitsStorage;
    std::from_chars(sci.data() + e + (sci[e + 1] == '+' ? 2 : 1), sci.data() + sci.size(), d.exp10);
    return d;
}

inline void append_fixed(std::string & out, const Decimal & d) {
    if(d.negative) out.push_back('-');
    const int nd = static_cast<int>(d.digits.size());
    if(d.exp10 >= 0) {
        const int intLen = d.exp10 + 1;
        if(nd <= intLen) {
            out.append(d.digits);
            out.append(static_cast<std::size_t>(intLen - nd), '0');
        } else {
            out.append(d.digits.substr(0, intLen));
            out.push_back('.');
            out.append(d.digits.substr(intLen));
        }
    } else {
        out += "0.";
        out.append(static_cast<std::size_t>(-d.exp10 - 1), '0');
        out.append(d.digits);
    }
}

} // namespace detail

// Shortest round-trip text at the bit width of T, in the layout of the wire reference:
// exponent form below 1e-6 and from 1e21 on, fixed form otherwise. False for NaN and infinities.
template<std::floating_point T>
bool append_float(std::string & out, T v) {
    if(!std::isfinite(v)) {
        return false;
    }
    const T a = std::fabs(v);
    const bool exponentForm = a != 0 && (a < T(1e-6) || a >= T(1e21));

    char buf[64];
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string_view sci(buf, static_cast<std::size_t>(p - buf));

    if(exponentForm) {
        const std::size_t n = sci.size();
        if(n >= 4 && sci[n-4] == 'e' && sci[n-3] == '-' && sci[n-2] == '0') {
            out.append(sci.substr(0, n - 2));
            out.push_back(sci[n-1]);
        } else {
            out.append(sci);
        }
        return true;
    }
    std::string digits;
    detail::append_fixed(out, detail::split_scientific(sci, digits));
    return true;
}

enum class IntegerParseStatus {
    ok,
    not_integral,
    out_of_range
};

// literal must already satisfy is_valid_number_literal
template<std::integral T>
IntegerParseStatus parse_integer(std::string_view literal, T & out, bool allow_integral_exponent) {
    const bool plain = literal.find_first_of(".eE") == std::string_view::npos;
    if(plain) {
        auto [p, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), out);
        if(ec != std::errc{} || p != literal.data() + literal.size()) {
            return IntegerParseStatus::out_of_range;
        }
        return IntegerParseStatus::ok;
    }
    if(!allow_integral_exponent) {
        return IntegerParseStatus::not_integral;
    }

    std::size_t i = 0;
    const bool negative = literal[0] == '-';
    if(negative) i ++;
    std::string digits;
    int fracLen = 0;
    bool inFraction = false;
    for(; i < literal.size() && literal[i] != 'e' && literal[i] != 'E'; i ++) {
        if(literal[i] == '.') {
            inFraction = true;
            continue;
        }
        digits.push_back(literal[i]);
        if(inFraction) fracLen ++;
    }
    long exp = 0;
    if(i < literal.size()) {
        i ++;
        const bool expNeg = literal[i] == '-';
        if(literal[i] == '+' || literal[i] == '-') i ++;
        for(; i < literal.size(); i ++) {
            exp = exp * 10 + (literal[i] - '0');
            if(exp > 100000) break;
        }
        if(expNeg) exp = -exp;
    }
    const auto firstNonZero = digits.find_first_not_of('0');
    if(firstNonZero == std::string::npos) {
        out = 0;
        return IntegerParseStatus::ok;
    }
    digits.erase(0, firstNonZero);
    long shift = exp - fracLen;
    while(shift < 0 && !digits.empty() && digits.back() == '0') {
        digits.pop_back();
        shift ++;
    }
    if(shift < 0) {
        return IntegerParseStatus::not_integral;
    }
    if(static_cast<long>(digits.size()) + shift > 40) {
        return IntegerParseStatus::out_of_range;
    }
    digits.append(static_cast<std::size_t>(shift), '0');
    if(negative) digits.insert(digits.begin(), '-');
    auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    if(ec != std::errc{} || p != digits.data() + digits.size()) {
        return IntegerParseStatus::out_of_range;
    }
    return IntegerParseStatus::ok;
}

// Correctly rounded conversion; false when the value overflows T. Underflow yields zero.
template<std::floating_point T>
bool parse_float(std::string_view literal, T & out) {
    T v{};
    auto [p, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), v);
    if(ec == std::errc{}) {
        out = v;
        return true;
    }
    if(ec != std::errc::result_out_of_range) {
        return false;
    }
    const std::string copy(literal);
    char * endp = nullptr;
    if constexpr (std::is_same_v<T, float>) {
        v = std::strtof(copy.c_str(), &endp);
    } else if constexpr (std::is_same_v<T, double>) {
        v = std::strtod(copy.c_str(), &endp);
    } else {
        v = std::strtold(copy.c_str(), &endp);
    }
    if(std::isinf(v)) {
        return false;
    }
    out = v;
    return true;
}

} // namespace OrderedJson::number_format
