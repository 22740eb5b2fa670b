#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace OrderedJson {

namespace escape_detail {

inline constexpr char hex_upper[] = "0123456789ABCDEF";
inline constexpr char32_t rune_error = 0xFFFD;

struct DecodedRune {
    char32_t rune;
    std::size_t size;
    bool valid;
};

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
constexpr DecodedRune decode_rune(std::string_view s, std::size_t i) {
    const std::uint8_t b0 = static_cast<std::uint8_t>(s[i]);
    if(b0 < 0x80) {
        return {b0, 1, true};
    }
    std::size_t n = 0;
    std::uint8_t lo = 0x80, hi = 0xBF;
    if(b0 >= 0xC2 && b0 <= 0xDF) {
        n = 2;
    } else if(b0 == 0xE0) {
        n = 3; lo = 0xA0;
    } else if(b0 == 0xED) {
        n = 3; hi = 0x9F;
    } else if(b0 >= 0xE1 && b0 <= 0xEF) {
        n = 3;
    } else if(b0 == 0xF0) {
        n = 4; lo = 0x90;
    } else if(b0 >= 0xF1 && b0 <= 0xF3) {
        n = 4;
    } else if(b0 == 0xF4) {
        n = 4; hi = 0x8F;
    } else {
        return {rune_error, 1, false};
    }
    if(s.size() - i < n) {
        return {rune_error, 1, false};
    }
    const std::uint8_t b1 = static_cast<std::uint8_t>(s[i + 1]);
    if(b1 < lo || b1 > hi) {
        return {rune_error, 1, false};
    }
    char32_t r = (n == 2) ? (b0 & 0x1F) : (n == 3) ? (b0 & 0x0F) : (b0 & 0x07);
    r = (r << 6) | (b1 & 0x3F);
    for(std::size_t k = 2; k < n; k ++) {
        const std::uint8_t bk = static_cast<std::uint8_t>(s[i + k]);
        if(bk < 0x80 || bk > 0xBF) {
            return {rune_error, 1, false};
        }
        r = (r << 6) | (bk & 0x3F);
    }
    return {r, n, true};
}

constexpr void append_utf8(std::string & out, char32_t r) {
    if(r < 0x80) {
        out.push_back(static_cast<char>(r));
    } else if(r < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (r >> 6)));
        out.push_back(static_cast<char>(0x80 | (r & 0x3F)));
    } else if(r < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (r >> 12)));
        out.push_back(static_cast<char>(0x80 | ((r >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (r & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (r >> 18)));
        out.push_back(static_cast<char>(0x80 | ((r >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((r >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (r & 0x3F)));
    }
}

constexpr void append_u_escape(std::string & out, std::uint32_t unit) {
    out += "\\u";
    out.push_back(hex_upper[(unit >> 12) & 0xF]);
    out.push_back(hex_upper[(unit >> 8) & 0xF]);
    out.push_back(hex_upper[(unit >> 4) & 0xF]);
    out.push_back(hex_upper[unit & 0xF]);
}

constexpr void append_rune_escape(std::string & out, char32_t r) {
    if(r > 0xFFFF) {
        const std::uint32_t v = static_cast<std::uint32_t>(r) - 0x10000;
        append_u_escape(out, 0xD800 + (v >> 10));
        append_u_escape(out, 0xDC00 + (v & 0x3FF));
    } else {
        append_u_escape(out, static_cast<std::uint32_t>(r));
    }
}

constexpr bool is_html_sensitive(std::uint8_t c) {
    return c == '&' || c == '\'' || c == '+' || c == '<' || c == '>' || c == '`';
}

constexpr bool is_safe_ascii(std::uint8_t c, bool escape_html) {
    if(c < 0x20 || c >= 0x7F || c == '"' || c == '\\') {
        return false;
    }
    return !(escape_html && is_html_sensitive(c));
}

} // namespace escape_detail

// Appends the escaped content of s without the surrounding quotes.
// Splitting s at rune boundaries and escaping the pieces gives the same bytes.
constexpr void append_escaped_chars(std::string & out, std::string_view s, bool escape_html = true) {
    using namespace escape_detail;
    std::size_t start = 0;
    std::size_t i = 0;
    while(i < s.size()) {
        const std::uint8_t b = static_cast<std::uint8_t>(s[i]);
        if(b < 0x80) {
            if(is_safe_ascii(b, escape_html)) {
                i ++;
                continue;
            }
            out.append(s.substr(start, i - start));
            switch(b) {
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default:
                append_u_escape(out, b);
            }
            i ++;
            start = i;
            continue;
        }
        const DecodedRune dr = decode_rune(s, i);
        if(!dr.valid) {
            out.append(s.substr(start, i - start));
            append_u_escape(out, b);
            i ++;
            start = i;
            continue;
        }
        if(escape_html || dr.rune == 0x2028 || dr.rune == 0x2029) {
            out.append(s.substr(start, i - start));
            append_rune_escape(out, dr.rune);
            i += dr.size;
            start = i;
            continue;
        }
        i += dr.size;
    }
    out.append(s.substr(start));
}

// Appends the quoted JSON form of the byte string s
constexpr void append_escaped_string(std::string & out, std::string_view s, bool escape_html = true) {
    out.push_back('"');
    append_escaped_chars(out, s, escape_html);
    out.push_back('"');
}

constexpr std::string escaped_string(std::string_view s, bool escape_html = true) {
    std::string out;
    append_escaped_string(out, s, escape_html);
    return out;
}

} // namespace OrderedJson
