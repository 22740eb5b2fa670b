#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace OrderedJson::base64 {

namespace detail {

inline constexpr char alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t invalid = 0xFF;

constexpr std::uint8_t value_of(char c) {
    if(c >= 'A' && c <= 'Z') return static_cast<std::uint8_t>(c - 'A');
    if(c >= 'a' && c <= 'z') return static_cast<std::uint8_t>(c - 'a' + 26);
    if(c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0' + 52);
    if(c == '+') return 62;
    if(c == '/') return 63;
    return invalid;
}

template<class ByteT>
constexpr std::uint32_t octet(ByteT b) {
    return static_cast<std::uint8_t>(b);
}

} // namespace detail

// RFC 4648 standard alphabet with '=' padding, single line
template<class ByteT>
constexpr void append_encoded(std::string & out, const ByteT * data, std::size_t size) {
    std::size_t i = 0;
    for(; i + 3 <= size; i += 3) {
        const std::uint32_t v = (detail::octet(data[i]) << 16) | (detail::octet(data[i+1]) << 8) | detail::octet(data[i+2]);
        out.push_back(detail::alphabet[(v >> 18) & 0x3F]);
        out.push_back(detail::alphabet[(v >> 12) & 0x3F]);
        out.push_back(detail::alphabet[(v >> 6) & 0x3F]);
        out.push_back(detail::alphabet[v & 0x3F]);
    }
    const std::size_t rest = size - i;
    if(rest == 1) {
        const std::uint32_t v = detail::octet(data[i]) << 16;
        out.push_back(detail::alphabet[(v >> 18) & 0x3F]);
        out.push_back(detail::alphabet[(v >> 12) & 0x3F]);
        out += "==";
    } else if(rest == 2) {
        const std::uint32_t v = (detail::octet(data[i]) << 16) | (detail::octet(data[i+1]) << 8);
        out.push_back(detail::alphabet[(v >> 18) & 0x3F]);
        out.push_back(detail::alphabet[(v >> 12) & 0x3F]);
        out.push_back(detail::alphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
}

// Padding is mandatory; CR and LF are skipped. False on malformed input.
template<class ByteT>
constexpr bool decode(std::string_view text, std::vector<ByteT> & out) {
    std::string clean;
    clean.reserve(text.size());
    for(char c : text) {
        if(c != '\r' && c != '\n') clean.push_back(c);
    }
    if(clean.size() % 4 != 0) {
        return false;
    }
    out.clear();
    out.reserve(clean.size() / 4 * 3);
    for(std::size_t i = 0; i < clean.size(); i += 4) {
        const bool last = i + 4 == clean.size();
        std::size_t pad = 0;
        if(last && clean[i+3] == '=') pad = (clean[i+2] == '=') ? 2 : 1;
        std::uint32_t v = 0;
        for(std::size_t k = 0; k < 4 - pad; k ++) {
            const std::uint8_t d = detail::value_of(clean[i+k]);
            if(d == detail::invalid) {
                return false;
            }
            v = (v << 6) | d;
        }
        v <<= 6 * pad;
        out.push_back(static_cast<ByteT>((v >> 16) & 0xFF));
        if(pad < 2) out.push_back(static_cast<ByteT>((v >> 8) & 0xFF));
        if(pad < 1) out.push_back(static_cast<ByteT>(v & 0xFF));
    }
    return true;
}

} // namespace OrderedJson::base64
