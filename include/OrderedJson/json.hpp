#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "escape.hpp"
#include "number_format.hpp"

#ifndef ORDEREDJSON_MAX_NESTING_DEPTH
#define ORDEREDJSON_MAX_NESTING_DEPTH 10000
#endif

namespace OrderedJson {

inline constexpr std::size_t MaxNestingDepth = ORDEREDJSON_MAX_NESTING_DEPTH;

namespace reader {

enum class TryParseStatus {
    error,
    no_match,
    ok
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

} // namespace reader

// Kind of the next value, as announced by its first byte
enum class JsonToken {
    End,
    Invalid,
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

// Reader over a complete in-memory document. Strings are unquoted with the
// conventions of the wire reference: bad UTF-8 and unpaired surrogates become U+FFFD.
class JsonReader {
public:
    struct ArrayFrame {};
    struct MapFrame {};

    using error_type = DecodeError;

    explicit JsonReader(std::string_view input, std::size_t maxDepth = MaxNestingDepth)
        : m_input(input), m_maxDepth(maxDepth) {}

    DecodeError getError() const {
        return m_error;
    }
    std::size_t errorOffset() const {
        return m_errorPos;
    }
    std::size_t offset() const {
        return m_pos;
    }
    std::string_view input() const {
        return m_input;
    }

    JsonToken peek_token() {
        skip_whitespace();
        if(atEnd()) {
            return JsonToken::End;
        }
        switch(m_input[m_pos]) {
        case 'n': return JsonToken::Null;
        case 't':
        case 'f': return JsonToken::Bool;
        case '"': return JsonToken::String;
        case '[': return JsonToken::Array;
        case '{': return JsonToken::Object;
        case '-': return JsonToken::Number;
        default:
            if(m_input[m_pos] >= '0' && m_input[m_pos] <= '9') {
                return JsonToken::Number;
            }
            return JsonToken::Invalid;
        }
    }

    reader::TryParseStatus start_value_and_try_read_null() {
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if(m_input[m_pos] != 'n') {
            return reader::TryParseStatus::no_match;
        }
        if(!match_literal("null")) {
            return reader::TryParseStatus::error;
        }
        return reader::TryParseStatus::ok;
    }

    reader::TryParseStatus read_bool(bool & b) {
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        switch(m_input[m_pos]) {
        case 't':
            if(!match_literal("true")) return reader::TryParseStatus::error;
            b = true;
            return reader::TryParseStatus::ok;
        case 'f':
            if(!match_literal("false")) return reader::TryParseStatus::error;
            b = false;
            return reader::TryParseStatus::ok;
        default:
            return reader::TryParseStatus::no_match;
        }
    }

    // Span of the number literal, checked against the JSON grammar
    reader::TryParseStatus read_number_token(std::string_view & token) {
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        const char c = m_input[m_pos];
        if(c != '-' && (c < '0' || c > '9')) {
            return reader::TryParseStatus::no_match;
        }
        const std::size_t start = m_pos;
        if(!scan_number()) {
            return reader::TryParseStatus::error;
        }
        token = m_input.substr(start, m_pos - start);
        return reader::TryParseStatus::ok;
    }

    reader::TryParseStatus read_string(std::string & out) {
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if(m_input[m_pos] != '"') {
            return reader::TryParseStatus::no_match;
        }
        const std::size_t start = m_pos;
        if(!scan_string()) {
            return reader::TryParseStatus::error;
        }
        out.clear();
        unquote(m_input.substr(start + 1, m_pos - start - 2), out);
        return reader::TryParseStatus::ok;
    }

    reader::IterationStatus read_array_begin(ArrayFrame&) {
        reader::IterationStatus ret;
        skip_whitespace();
        if(atEnd() || m_input[m_pos] != '[') {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }
        m_pos ++;
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(m_input[m_pos] == ']') {
            m_pos ++;
        } else {
            ret.has_value = true;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    reader::IterationStatus read_map_begin(MapFrame&) {
        reader::IterationStatus ret;
        skip_whitespace();
        if(atEnd() || m_input[m_pos] != '{') {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }
        m_pos ++;
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(m_input[m_pos] == '}') {
            m_pos ++;
        } else if(m_input[m_pos] != '"') {
            setError(DecodeError::ILLFORMED_OBJECT);
            return ret;
        } else {
            ret.has_value = true;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    reader::IterationStatus advance_after_value(ArrayFrame&) {
        reader::IterationStatus ret;
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(m_input[m_pos] == ']') {
            m_pos ++;
            ret.status = reader::TryParseStatus::ok;
            return ret;
        }
        if(m_input[m_pos] != ',') {
            setError(DecodeError::ILLFORMED_ARRAY);
            return ret;
        }
        m_pos ++;
        ret.has_value = true;
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    reader::IterationStatus advance_after_value(MapFrame&) {
        reader::IterationStatus ret;
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(m_input[m_pos] == '}') {
            m_pos ++;
            ret.status = reader::TryParseStatus::ok;
            return ret;
        }
        if(m_input[m_pos] != ',') {
            setError(DecodeError::ILLFORMED_OBJECT);
            return ret;
        }
        m_pos ++;
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(m_input[m_pos] != '"') {
            setError(DecodeError::ILLFORMED_OBJECT);
            return ret;
        }
        ret.has_value = true;
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    bool read_key(MapFrame&, std::string & key) {
        if(read_string(key) != reader::TryParseStatus::ok) {
            if(m_error == DecodeError::NO_ERROR) setError(DecodeError::ILLFORMED_OBJECT);
            return false;
        }
        return true;
    }

    bool move_to_value(MapFrame&) {
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(m_input[m_pos] != ':') {
            setError(DecodeError::ILLFORMED_OBJECT);
            return false;
        }
        m_pos ++;
        return true;
    }

    // Validates and steps over one complete value
    bool skip_value() {
        std::string_view raw;
        return capture_value(raw);
    }

    // Validates one complete value and returns its exact span, whitespace excluded
    bool capture_value(std::string_view & raw) {
        std::vector<char> stack;
        skip_whitespace();
        const std::size_t start = m_pos;
        for(;;) {
            // Expecting a value
            skip_whitespace();
            if(atEnd()) {
                setError(DecodeError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char c = m_input[m_pos];
            bool valueDone = true;
            if(c == '{' || c == '[') {
                if(stack.size() >= m_maxDepth) {
                    setError(DecodeError::NESTING_TOO_DEEP);
                    return false;
                }
                m_pos ++;
                stack.push_back(c);
                skip_whitespace();
                if(atEnd()) {
                    setError(DecodeError::UNEXPECTED_END_OF_DATA);
                    return false;
                }
                if(m_input[m_pos] == (c == '{' ? '}' : ']')) {
                    m_pos ++;
                    stack.pop_back();
                } else if(c == '{') {
                    if(!scan_member_key()) return false;
                    valueDone = false;
                } else {
                    valueDone = false;
                }
            } else if(c == '"') {
                if(!scan_string()) return false;
            } else if(c == '-' || (c >= '0' && c <= '9')) {
                if(!scan_number()) return false;
            } else if(c == 't') {
                if(!match_literal("true")) return false;
            } else if(c == 'f') {
                if(!match_literal("false")) return false;
            } else if(c == 'n') {
                if(!match_literal("null")) return false;
            } else {
                setError(DecodeError::INVALID_CHARACTER);
                return false;
            }
            if(!valueDone) {
                continue;
            }
            // After a value: close containers or move to the next element
            bool expectValue = false;
            while(!stack.empty() && !expectValue) {
                skip_whitespace();
                if(atEnd()) {
                    setError(DecodeError::UNEXPECTED_END_OF_DATA);
                    return false;
                }
                const char top = stack.back();
                const char d = m_input[m_pos];
                if(d == ',') {
                    m_pos ++;
                    if(top == '{') {
                        skip_whitespace();
                        if(!scan_member_key()) return false;
                    }
                    expectValue = true;
                } else if((top == '[' && d == ']') || (top == '{' && d == '}')) {
                    m_pos ++;
                    stack.pop_back();
                } else {
                    setError(top == '[' ? DecodeError::ILLFORMED_ARRAY : DecodeError::ILLFORMED_OBJECT);
                    return false;
                }
            }
            if(stack.empty()) {
                raw = m_input.substr(start, m_pos - start);
                return true;
            }
        }
    }

    // Only whitespace may remain
    bool finish() {
        skip_whitespace();
        if(!atEnd()) {
            setError(DecodeError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

    bool at_end() {
        skip_whitespace();
        return atEnd();
    }

    static constexpr bool isSpace(char c) noexcept {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

private:
    std::string_view m_input;
    std::size_t m_pos = 0;
    std::size_t m_maxDepth;
    DecodeError m_error = DecodeError::NO_ERROR;
    std::size_t m_errorPos = 0;

    void setError(DecodeError e) {
        m_error = e;
        m_errorPos = m_pos;
    }

    bool atEnd() const {
        return m_pos >= m_input.size();
    }

    void skip_whitespace() {
        while(!atEnd() && isSpace(m_input[m_pos])) {
            m_pos ++;
        }
    }

    bool isDigit() const {
        return !atEnd() && m_input[m_pos] >= '0' && m_input[m_pos] <= '9';
    }

    bool match_literal(std::string_view lit) {
        for(char c : lit) {
            if(atEnd()) {
                setError(DecodeError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if(m_input[m_pos] != c) {
                setError(DecodeError::ILLFORMED_LITERAL);
                return false;
            }
            m_pos ++;
        }
        return true;
    }

    bool expectDigit() {
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(!isDigit()) {
            setError(DecodeError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    // Longest prefix matching the number grammar; the byte after it is the caller's business
    bool scan_number() {
        if(m_input[m_pos] == '-') {
            m_pos ++;
            if(!expectDigit()) return false;
        }
        if(m_input[m_pos] == '0') {
            m_pos ++;
        } else {
            while(isDigit()) m_pos ++;
        }
        if(!atEnd() && m_input[m_pos] == '.') {
            m_pos ++;
            if(!expectDigit()) return false;
            while(isDigit()) m_pos ++;
        }
        if(!atEnd() && (m_input[m_pos] == 'e' || m_input[m_pos] == 'E')) {
            m_pos ++;
            if(!atEnd() && (m_input[m_pos] == '+' || m_input[m_pos] == '-')) m_pos ++;
            if(!expectDigit()) return false;
            while(isDigit()) m_pos ++;
        }
        return true;
    }

    static constexpr int hexValue(char h) {
        if(h >= '0' && h <= '9') return h - '0';
        if(h >= 'a' && h <= 'f') return h - 'a' + 10;
        if(h >= 'A' && h <= 'F') return h - 'A' + 10;
        return -1;
    }

    // Validates a quoted string; control bytes are rejected, non-ASCII bytes are not
    bool scan_string() {
        m_pos ++;
        for(;;) {
            if(atEnd()) {
                setError(DecodeError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const auto c = static_cast<std::uint8_t>(m_input[m_pos]);
            if(c == '"') {
                m_pos ++;
                return true;
            }
            if(c < 0x20) {
                setError(DecodeError::ILLFORMED_STRING);
                return false;
            }
            if(c != '\\') {
                m_pos ++;
                continue;
            }
            m_pos ++;
            if(atEnd()) {
                setError(DecodeError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            switch(m_input[m_pos]) {
            case '"': case '\\': case '/': case 'b':
            case 'f': case 'n': case 'r': case 't':
                m_pos ++;
                break;
            case 'u':
                m_pos ++;
                for(int i = 0; i < 4; i ++) {
                    if(atEnd()) {
                        setError(DecodeError::UNEXPECTED_END_OF_DATA);
                        return false;
                    }
                    if(hexValue(m_input[m_pos]) < 0) {
                        setError(DecodeError::ILLFORMED_STRING);
                        return false;
                    }
                    m_pos ++;
                }
                break;
            default:
                setError(DecodeError::ILLFORMED_STRING);
                return false;
            }
        }
    }

    bool scan_member_key() {
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(m_input[m_pos] != '"') {
            setError(DecodeError::ILLFORMED_OBJECT);
            return false;
        }
        if(!scan_string()) return false;
        skip_whitespace();
        if(atEnd()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(m_input[m_pos] != ':') {
            setError(DecodeError::ILLFORMED_OBJECT);
            return false;
        }
        m_pos ++;
        return true;
    }

    static int read_hex4(std::string_view s, std::size_t i) {
        if(s.size() < i + 4) return -1;
        int v = 0;
        for(std::size_t k = 0; k < 4; k ++) {
            const int h = hexValue(s[i + k]);
            if(h < 0) return -1;
            v = (v << 4) | h;
        }
        return v;
    }

    // body is the already validated content between the quotes
    static void unquote(std::string_view body, std::string & out) {
        std::size_t i = 0;
        while(i < body.size()) {
            const auto c = static_cast<std::uint8_t>(body[i]);
            if(c == '\\') {
                const char e = body[i + 1];
                i += 2;
                switch(e) {
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    char32_t r = static_cast<char32_t>(read_hex4(body, i));
                    i += 4;
                    if(r >= 0xD800 && r < 0xE000) {
                        char32_t combined = escape_detail::rune_error;
                        if(r < 0xDC00 && i + 6 <= body.size() && body[i] == '\\' && body[i + 1] == 'u') {
                            const int lo = read_hex4(body, i + 2);
                            if(lo >= 0xDC00 && lo < 0xE000) {
                                combined = 0x10000 + ((r - 0xD800) << 10) + (static_cast<char32_t>(lo) - 0xDC00);
                                i += 6;
                            }
                        }
                        r = combined;
                    }
                    escape_detail::append_utf8(out, r);
                    break;
                }
                default:
                    out.push_back(e);
                }
                continue;
            }
            if(c < 0x80) {
                out.push_back(static_cast<char>(c));
                i ++;
                continue;
            }
            const auto dr = escape_detail::decode_rune(body, i);
            if(!dr.valid) {
                escape_detail::append_utf8(out, escape_detail::rune_error);
                i ++;
            } else {
                out.append(body.substr(i, dr.size));
                i += dr.size;
            }
        }
    }
};

// Compact writer appending to a string
class JsonWriter {
public:
    struct ArrayFrame {
        bool first = true;
    };
    struct MapFrame {
        bool first = true;
    };

    explicit JsonWriter(std::string & out, bool escapeHtml = true)
        : m_out(out), m_escapeHtml(escapeHtml) {}

    std::string & buffer() {
        return m_out;
    }
    bool escapeHtml() const {
        return m_escapeHtml;
    }

    bool write_null() {
        m_out += "null";
        return true;
    }
    bool write_bool(bool b) {
        m_out += b ? "true" : "false";
        return true;
    }

    template<std::integral T>
    bool write_integer(T v) {
        number_format::append_integer(m_out, v);
        return true;
    }

    // False for NaN and infinities, nothing is written then
    template<std::floating_point T>
    bool write_float(T v) {
        return number_format::append_float(m_out, v);
    }

    bool write_string(std::string_view s) {
        append_escaped_string(m_out, s, m_escapeHtml);
        return true;
    }

    // Caller guarantees s is valid compact JSON
    bool write_raw(std::string_view s) {
        m_out.append(s);
        return true;
    }

    bool write_array_begin(ArrayFrame & frame) {
        frame.first = true;
        m_out.push_back('[');
        return true;
    }
    bool advance_to_element(ArrayFrame & frame) {
        if(!frame.first) m_out.push_back(',');
        frame.first = false;
        return true;
    }
    bool write_array_end(ArrayFrame &) {
        m_out.push_back(']');
        return true;
    }

    bool write_map_begin(MapFrame & frame) {
        frame.first = true;
        m_out.push_back('{');
        return true;
    }
    bool write_key(MapFrame & frame, std::string_view key) {
        if(!frame.first) m_out.push_back(',');
        frame.first = false;
        write_string(key);
        m_out.push_back(':');
        return true;
    }
    bool write_map_end(MapFrame &) {
        m_out.push_back('}');
        return true;
    }

private:
    std::string & m_out;
    bool m_escapeHtml;
};

} // namespace OrderedJson
