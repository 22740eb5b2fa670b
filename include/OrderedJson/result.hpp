#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"

namespace OrderedJson {

class EncodeResult {
    EncodeError m_error = EncodeError::NO_ERROR;
    std::string m_detail;

public:
    EncodeResult() = default;
    EncodeResult(EncodeError err, std::string detail):
        m_error(err), m_detail(std::move(detail))
    {}
    operator bool() const {
        return m_error == EncodeError::NO_ERROR;
    }
    EncodeError error() const {
        return m_error;
    }
    ErrorKind kind() const {
        return error_kind(m_error);
    }
    // Offending value or hook output, when there is one
    const std::string & detail() const {
        return m_detail;
    }
};

class DecodeResult {
    DecodeError m_error = DecodeError::NO_ERROR;
    std::size_t m_offset = 0;
    std::string m_field;
    std::string m_detail;

public:
    DecodeResult() = default;
    DecodeResult(DecodeError err, std::size_t offset, std::string field, std::string detail):
        m_error(err), m_offset(offset), m_field(std::move(field)), m_detail(std::move(detail))
    {}
    operator bool() const {
        return m_error == DecodeError::NO_ERROR;
    }
    DecodeError error() const {
        return m_error;
    }
    ErrorKind kind() const {
        return error_kind(m_error);
    }
    // Byte offset into the input where the error was detected
    std::size_t offset() const {
        return m_offset;
    }
    // Dotted path of JSON member names leading to the failing value, empty at top level
    const std::string & field() const {
        return m_field;
    }
    // JSON value description for type errors ("string", "number 1.5"), or the unknown key
    const std::string & detail() const {
        return m_detail;
    }
};

} // namespace OrderedJson
