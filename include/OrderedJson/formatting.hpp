#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "escape.hpp"
#include "json.hpp"
#include "result.hpp"

namespace OrderedJson {

namespace formatting_detail {

// Writes the HTML-safe form of byte c at s[i], returns bytes consumed or 0 if c is left alone
inline std::size_t append_html_escape(std::string & out, std::string_view s, std::size_t i) {
    const auto c = static_cast<std::uint8_t>(s[i]);
    if(c == '<' || c == '>' || c == '&') {
        escape_detail::append_u_escape(out, c);
        return 1;
    }
    // U+2028 and U+2029 are E2 80 A8 and E2 80 A9
    if(c == 0xE2 && i + 2 < s.size() && static_cast<std::uint8_t>(s[i + 1]) == 0x80
       && (static_cast<std::uint8_t>(s[i + 2]) & ~1u) == 0xA8) {
        escape_detail::append_u_escape(out, 0x2028u | (static_cast<std::uint8_t>(s[i + 2]) & 1u));
        return 3;
    }
    return 0;
}

inline DecodeResult check_value(std::string_view json) {
    JsonReader reader(json);
    if(!reader.skip_value() || !reader.finish()) {
        return DecodeResult(reader.getError(), reader.errorOffset(), {}, {});
    }
    return {};
}

inline void newline(std::string & out, std::string_view prefix, std::string_view indent, std::size_t depth) {
    out.push_back('\n');
    out.append(prefix);
    for(std::size_t i = 0; i < depth; i ++) {
        out.append(indent);
    }
}

} // namespace formatting_detail

// Syntactic validity of a single JSON value
inline bool Valid(std::string_view json) {
    return static_cast<bool>(formatting_detail::check_value(json));
}

// Appends json without insignificant whitespace. On a syntax error nothing is appended.
inline DecodeResult Compact(std::string & out, std::string_view json, bool escape_html = false) {
    DecodeResult res = formatting_detail::check_value(json);
    if(!res) {
        return res;
    }
    bool inString = false;
    for(std::size_t i = 0; i < json.size(); i ++) {
        const char c = json[i];
        if(inString) {
            if(escape_html) {
                const std::size_t used = formatting_detail::append_html_escape(out, json, i);
                if(used != 0) {
                    i += used - 1;
                    continue;
                }
            }
            out.push_back(c);
            if(c == '\\') {
                out.push_back(json[++ i]);
            } else if(c == '"') {
                inString = false;
            }
            continue;
        }
        if(JsonReader::isSpace(c)) {
            continue;
        }
        if(c == '"') {
            inString = true;
        }
        out.push_back(c);
    }
    return res;
}

// Appends json with one element per line. Nested lines start with prefix followed by
// indent repeated per level; the first line carries no prefix. Empty {} and [] stay compact.
inline DecodeResult Indent(std::string & out, std::string_view json, std::string_view prefix, std::string_view indent) {
    DecodeResult res = formatting_detail::check_value(json);
    if(!res) {
        return res;
    }
    std::size_t depth = 0;
    bool needIndent = false;
    bool inString = false;
    bool started = false;
    for(std::size_t i = 0; i < json.size(); i ++) {
        const char c = json[i];
        if(inString) {
            out.push_back(c);
            if(c == '\\') {
                out.push_back(json[++ i]);
            } else if(c == '"') {
                inString = false;
            }
            continue;
        }
        if(JsonReader::isSpace(c)) {
            // whitespace after the top-level value is kept as is
            if(started && depth == 0 && !needIndent) {
                out.push_back(c);
            }
            continue;
        }
        started = true;
        if(needIndent && c != '}' && c != ']') {
            needIndent = false;
            depth ++;
            formatting_detail::newline(out, prefix, indent, depth);
        }
        switch(c) {
        case '{':
        case '[':
            needIndent = true;
            out.push_back(c);
            break;
        case ',':
            out.push_back(c);
            formatting_detail::newline(out, prefix, indent, depth);
            break;
        case ':':
            out.push_back(c);
            out.push_back(' ');
            break;
        case '}':
        case ']':
            if(needIndent) {
                needIndent = false;
            } else {
                depth --;
                formatting_detail::newline(out, prefix, indent, depth);
            }
            out.push_back(c);
            break;
        case '"':
            inString = true;
            out.push_back(c);
            break;
        default:
            out.push_back(c);
        }
    }
    return res;
}

// Appends json with < > & and U+2028/U+2029 escaped, so it can sit inside an HTML script tag
inline void HTMLEscape(std::string & out, std::string_view json) {
    for(std::size_t i = 0; i < json.size(); i ++) {
        const std::size_t used = formatting_detail::append_html_escape(out, json, i);
        if(used != 0) {
            i += used - 1;
            continue;
        }
        out.push_back(json[i]);
    }
}

} // namespace OrderedJson
