#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "json.hpp"
#include "parser.hpp"
#include "result.hpp"
#include "serializer.hpp"

namespace OrderedJson {

// Reads a sequence of JSON values from a stream. Values may be concatenated with
// optional whitespace in between. Error offsets count from the start of the stream.
class StreamDecoder {
public:
    static constexpr std::size_t ChunkSize = 4096;

    explicit StreamDecoder(std::istream & in, DecodeOptions options = {}):
        m_in(in), m_options(options)
    {}

    template<class T>
    DecodeResult decode(T & obj) {
        if(failed()) {
            return m_error;
        }
        std::string_view span;
        if(!readValue(span)) {
            return m_error;
        }
        const std::size_t valueStart = static_cast<std::size_t>(span.data() - m_buf.data());
        m_scanp = valueStart + span.size();
        DecodeResult res = Decode(obj, span, m_options);
        if(!res) {
            return DecodeResult(res.error(), m_consumed + valueStart + res.offset(), res.field(), res.detail());
        }
        return res;
    }

    // Whether another value follows, before a closing bracket or the end of input
    bool more() {
        if(!skipSpace()) {
            return false;
        }
        const char c = m_buf[m_scanp];
        return c != ']' && c != '}';
    }

    // Stream offset just past the last decoded value
    std::size_t input_offset() const {
        return m_consumed + m_scanp;
    }

    // Data read from the stream but not decoded yet
    std::string_view buffered() const {
        return std::string_view(m_buf).substr(m_scanp);
    }

private:
    std::istream & m_in;
    DecodeOptions m_options;
    std::string m_buf;
    std::size_t m_scanp = 0;
    std::size_t m_consumed = 0;
    bool m_eof = false;
    DecodeResult m_error;

    bool refill() {
        if(m_eof) {
            return false;
        }
        // drop decoded data once it makes up most of the buffer
        if(m_scanp > m_buf.size() / 2) {
            m_buf.erase(0, m_scanp);
            m_consumed += m_scanp;
            m_scanp = 0;
        }
        char chunk[ChunkSize];
        m_in.read(chunk, ChunkSize);
        const std::streamsize n = m_in.gcount();
        if(n > 0) {
            m_buf.append(chunk, static_cast<std::size_t>(n));
        }
        if(m_in.bad()) {
            m_error = DecodeResult(DecodeError::STREAM_READ_ERROR, m_consumed + m_buf.size(), {}, {});
            m_eof = true;
            return false;
        }
        if(m_in.eof()) {
            m_eof = true;
        }
        return n > 0;
    }

    // False at the end of input
    bool skipSpace() {
        for(;;) {
            while(m_scanp < m_buf.size() && JsonReader::isSpace(m_buf[m_scanp])) {
                m_scanp ++;
            }
            if(m_scanp < m_buf.size()) {
                return true;
            }
            if(!refill() && m_scanp >= m_buf.size()) {
                return false;
            }
        }
    }

    bool readValue(std::string_view & span) {
        if(!skipSpace()) {
            if(!failed()) {
                return fail(DecodeResult(DecodeError::END_OF_STREAM, input_offset(), {}, {}));
            }
            return false;
        }
        for(;;) {
            const std::string_view avail = std::string_view(m_buf).substr(m_scanp);
            JsonReader reader(avail);
            const bool isNumber = reader.peek_token() == JsonToken::Number;
            if(reader.capture_value(span)) {
                // a number at the end of the buffer may continue in the next chunk
                if(!(isNumber && reader.offset() == avail.size() && !m_eof)) {
                    return true;
                }
            } else if(reader.getError() != DecodeError::UNEXPECTED_END_OF_DATA || m_eof) {
                return fail(DecodeResult(reader.getError(), m_consumed + m_scanp + reader.errorOffset(), {}, {}));
            }
            if(!refill() && failed()) {
                return false;
            }
        }
    }

    bool failed() const {
        return m_error.error() != DecodeError::NO_ERROR;
    }

    bool fail(DecodeResult res) {
        m_error = std::move(res);
        return false;
    }
};

// Writes each value followed by a newline
class StreamEncoder {
public:
    explicit StreamEncoder(std::ostream & out): m_out(out) {}

    template<class T>
    EncodeResult encode(const T & obj) {
        std::string buf;
        EncodeResult res = (m_prefix.empty() && m_indent.empty())
            ? Encode(obj, buf, m_options)
            : EncodeIndent(obj, buf, m_prefix, m_indent, m_options);
        if(!res) {
            return res;
        }
        buf.push_back('\n');
        m_out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
        if(!m_out) {
            return EncodeResult(EncodeError::STREAM_WRITE_ERROR, {});
        }
        return res;
    }

    void set_indent(std::string prefix, std::string indent) {
        m_prefix = std::move(prefix);
        m_indent = std::move(indent);
    }

    void set_escape_html(bool on) {
        m_options.escape_html = on;
    }

private:
    std::ostream & m_out;
    EncodeOptions m_options;
    std::string m_prefix;
    std::string m_indent;
};

} // namespace OrderedJson
