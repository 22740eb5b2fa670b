#pragma once

#include <string_view>
namespace OrderedJson {

// Error families, mirroring the error types of the wire reference
enum class ErrorKind {
    None,
    Syntax,           // malformed input, carries a byte offset
    UnmarshalType,    // JSON value does not fit the target
    UnsupportedValue, // NaN, infinities, cycles, bad number literals
    UnsupportedType,  // map key without a string form
    Marshaler,        // user hook failed or produced invalid JSON
    Io                // stream read/write failure or end of stream
};

enum class EncodeError {
    NO_ERROR,
    UNSUPPORTED_FLOAT_VALUE,
    CYCLIC_VALUE,
    INVALID_NUMBER_LITERAL,
    UNSUPPORTED_MAP_KEY,
    MARSHALER_FAILED,
    MARSHALER_INVALID_OUTPUT,
    TEXT_MARSHALER_FAILED,
    INVALID_RAW_VALUE,
    STREAM_WRITE_ERROR
};

enum class DecodeError {
    NO_ERROR,

    UNEXPECTED_END_OF_DATA,
    INVALID_CHARACTER,
    ILLFORMED_LITERAL,
    ILLFORMED_NUMBER,
    ILLFORMED_STRING,
    ILLFORMED_ARRAY,
    ILLFORMED_OBJECT,
    NESTING_TOO_DEEP,
    EXCESS_CHARACTERS,

    WRONG_JSON_TYPE,
    NUMBER_OUT_OF_RANGE,
    NON_INTEGRAL_NUMBER,
    INVALID_STRING_OPTION,
    INVALID_BASE64,
    INVALID_MAP_KEY,
    UNKNOWN_FIELD,

    UNMARSHALER_FAILED,
    TEXT_UNMARSHALER_FAILED,

    STREAM_READ_ERROR,
    END_OF_STREAM
};

constexpr std::string_view error_to_string(EncodeError e) {
    switch(e) {
    case EncodeError::NO_ERROR: return "NO_ERROR";
    case EncodeError::UNSUPPORTED_FLOAT_VALUE: return "UNSUPPORTED_FLOAT_VALUE";
    case EncodeError::CYCLIC_VALUE: return "CYCLIC_VALUE";
    case EncodeError::INVALID_NUMBER_LITERAL: return "INVALID_NUMBER_LITERAL";
    case EncodeError::UNSUPPORTED_MAP_KEY: return "UNSUPPORTED_MAP_KEY";
    case EncodeError::MARSHALER_FAILED: return "MARSHALER_FAILED";
    case EncodeError::MARSHALER_INVALID_OUTPUT: return "MARSHALER_INVALID_OUTPUT";
    case EncodeError::TEXT_MARSHALER_FAILED: return "TEXT_MARSHALER_FAILED";
    case EncodeError::INVALID_RAW_VALUE: return "INVALID_RAW_VALUE";
    case EncodeError::STREAM_WRITE_ERROR: return "STREAM_WRITE_ERROR";
    }
    return "N/A";
}

constexpr std::string_view error_to_string(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR: return "NO_ERROR";
    case DecodeError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA";
    case DecodeError::INVALID_CHARACTER: return "INVALID_CHARACTER";
    case DecodeError::ILLFORMED_LITERAL: return "ILLFORMED_LITERAL";
    case DecodeError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER";
    case DecodeError::ILLFORMED_STRING: return "ILLFORMED_STRING";
    case DecodeError::ILLFORMED_ARRAY: return "ILLFORMED_ARRAY";
    case DecodeError::ILLFORMED_OBJECT: return "ILLFORMED_OBJECT";
    case DecodeError::NESTING_TOO_DEEP: return "NESTING_TOO_DEEP";
    case DecodeError::EXCESS_CHARACTERS: return "EXCESS_CHARACTERS";
    case DecodeError::WRONG_JSON_TYPE: return "WRONG_JSON_TYPE";
    case DecodeError::NUMBER_OUT_OF_RANGE: return "NUMBER_OUT_OF_RANGE";
    case DecodeError::NON_INTEGRAL_NUMBER: return "NON_INTEGRAL_NUMBER";
    case DecodeError::INVALID_STRING_OPTION: return "INVALID_STRING_OPTION";
    case DecodeError::INVALID_BASE64: return "INVALID_BASE64";
    case DecodeError::INVALID_MAP_KEY: return "INVALID_MAP_KEY";
    case DecodeError::UNKNOWN_FIELD: return "UNKNOWN_FIELD";
    case DecodeError::UNMARSHALER_FAILED: return "UNMARSHALER_FAILED";
    case DecodeError::TEXT_UNMARSHALER_FAILED: return "TEXT_UNMARSHALER_FAILED";
    case DecodeError::STREAM_READ_ERROR: return "STREAM_READ_ERROR";
    case DecodeError::END_OF_STREAM: return "END_OF_STREAM";
    }
    return "N/A";
}

constexpr ErrorKind error_kind(EncodeError e) {
    switch(e) {
    case EncodeError::NO_ERROR:
        return ErrorKind::None;
    case EncodeError::UNSUPPORTED_FLOAT_VALUE:
    case EncodeError::CYCLIC_VALUE:
    case EncodeError::INVALID_NUMBER_LITERAL:
        return ErrorKind::UnsupportedValue;
    case EncodeError::UNSUPPORTED_MAP_KEY:
        return ErrorKind::UnsupportedType;
    case EncodeError::MARSHALER_FAILED:
    case EncodeError::MARSHALER_INVALID_OUTPUT:
    case EncodeError::TEXT_MARSHALER_FAILED:
    case EncodeError::INVALID_RAW_VALUE:
        return ErrorKind::Marshaler;
    case EncodeError::STREAM_WRITE_ERROR:
        return ErrorKind::Io;
    }
    return ErrorKind::None;
}

constexpr ErrorKind error_kind(DecodeError e) {
    switch(e) {
    case DecodeError::NO_ERROR:
        return ErrorKind::None;
    case DecodeError::UNEXPECTED_END_OF_DATA:
    case DecodeError::INVALID_CHARACTER:
    case DecodeError::ILLFORMED_LITERAL:
    case DecodeError::ILLFORMED_NUMBER:
    case DecodeError::ILLFORMED_STRING:
    case DecodeError::ILLFORMED_ARRAY:
    case DecodeError::ILLFORMED_OBJECT:
    case DecodeError::NESTING_TOO_DEEP:
    case DecodeError::EXCESS_CHARACTERS:
        return ErrorKind::Syntax;
    case DecodeError::WRONG_JSON_TYPE:
    case DecodeError::NUMBER_OUT_OF_RANGE:
    case DecodeError::NON_INTEGRAL_NUMBER:
    case DecodeError::INVALID_STRING_OPTION:
    case DecodeError::INVALID_BASE64:
    case DecodeError::INVALID_MAP_KEY:
    case DecodeError::UNKNOWN_FIELD:
        return ErrorKind::UnmarshalType;
    case DecodeError::UNMARSHALER_FAILED:
    case DecodeError::TEXT_UNMARSHALER_FAILED:
        return ErrorKind::Marshaler;
    case DecodeError::STREAM_READ_ERROR:
    case DecodeError::END_OF_STREAM:
        return ErrorKind::Io;
    }
    return ErrorKind::None;
}

constexpr std::string_view kind_to_string(ErrorKind k) {
    switch(k) {
    case ErrorKind::None: return "None";
    case ErrorKind::Syntax: return "SyntaxError";
    case ErrorKind::UnmarshalType: return "UnmarshalTypeError";
    case ErrorKind::UnsupportedValue: return "UnsupportedValueError";
    case ErrorKind::UnsupportedType: return "UnsupportedTypeError";
    case ErrorKind::Marshaler: return "MarshalerError";
    case ErrorKind::Io: return "IoError";
    }
    return "N/A";
}

} // namespace OrderedJson
