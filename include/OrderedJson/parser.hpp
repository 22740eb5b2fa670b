#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "base64.hpp"
#include "errors.hpp"
#include "field_plan.hpp"
#include "json.hpp"
#include "number_format.hpp"
#include "options.hpp"
#include "result.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"

namespace OrderedJson {

struct DecodeOptions {
    // Keys that match no field are recorded as UNKNOWN_FIELD instead of being ignored
    bool disallow_unknown_fields = false;
    // Integer targets accept integral literals written with a fraction or exponent (1e2, 3.0)
    bool allow_integral_exponent = false;
};

namespace parser_details {

class DecodeContext {
    DecodeError m_error = DecodeError::NO_ERROR;
    std::size_t m_offset = 0;
    std::string m_field;
    std::string m_detail;
    std::vector<std::string_view> m_fields;

public:
    JsonReader reader;
    const DecodeOptions & options;

    DecodeContext(std::string_view input, const DecodeOptions & opts):
        reader(input), options(opts)
    {}

    // Type errors are kept, the first one wins, and decoding goes on
    bool saveError(DecodeError err, std::size_t offset, std::string detail) {
        if(m_error == DecodeError::NO_ERROR) {
            setError(err, offset, std::move(detail));
        }
        return true;
    }

    // Aborts decoding; replaces any saved type error
    bool withError(DecodeError err, std::size_t offset, std::string detail = {}) {
        setError(err, offset, std::move(detail));
        return false;
    }

    bool withReaderError() {
        return withError(reader.getError(), reader.errorOffset());
    }

    void pushField(std::string_view name) {
        m_fields.push_back(name);
    }
    void popField() {
        m_fields.pop_back();
    }

    DecodeResult result() const {
        return DecodeResult(m_error, m_offset, m_field, m_detail);
    }

private:
    void setError(DecodeError err, std::size_t offset, std::string detail) {
        m_error = err;
        m_offset = offset;
        m_detail = std::move(detail);
        m_field.clear();
        for(std::size_t i = 0; i < m_fields.size(); i ++) {
            if(i != 0) m_field.push_back('.');
            m_field.append(m_fields[i]);
        }
    }
};

constexpr std::string_view describe(JsonToken t) {
    switch(t) {
    case JsonToken::Null: return "null";
    case JsonToken::Bool: return "bool";
    case JsonToken::Number: return "number";
    case JsonToken::String: return "string";
    case JsonToken::Array: return "array";
    case JsonToken::Object: return "object";
    default: return "value";
    }
}

inline bool TypeMismatch(JsonToken t, DecodeContext & ctx, DecodeError err = DecodeError::WRONG_JSON_TYPE) {
    if(!ctx.reader.skip_value()) {
        return ctx.withReaderError();
    }
    return ctx.saveError(err, ctx.reader.offset(), std::string(describe(t)));
}

inline bool SkipNull(DecodeContext & ctx) {
    if(ctx.reader.start_value_and_try_read_null() != reader::TryParseStatus::ok) {
        return ctx.withReaderError();
    }
    return true;
}

template<class F>
bool ForEachElement(DecodeContext & ctx, F && onElement) {
    JsonReader::ArrayFrame fr;
    reader::IterationStatus st = ctx.reader.read_array_begin(fr);
    while(true) {
        if(st.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        if(!st.has_value) {
            return true;
        }
        if(!onElement()) {
            return false;
        }
        st = ctx.reader.advance_after_value(fr);
    }
}

template<class F>
bool ForEachMember(DecodeContext & ctx, F && onMember) {
    JsonReader::MapFrame fr;
    reader::IterationStatus st = ctx.reader.read_map_begin(fr);
    while(true) {
        if(st.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        if(!st.has_value) {
            return true;
        }
        std::string key;
        if(!ctx.reader.read_key(fr, key) || !ctx.reader.move_to_value(fr)) {
            return ctx.withReaderError();
        }
        if(!onMember(std::move(key))) {
            return false;
        }
        st = ctx.reader.advance_after_value(fr);
    }
}

template<class T>
bool DecodeValue(T & obj, DecodeContext & ctx, bool quoted = false);

/* ######## Scalars from literal text ######## */

template<class T>
    requires static_schema::JsonInteger<T>
bool StoreNumber(std::string_view literal, T & obj, DecodeContext & ctx, DecodeError mismatch = DecodeError::NO_ERROR) {
    T v{};
    switch(number_format::parse_integer(literal, v, ctx.options.allow_integral_exponent)) {
    case number_format::IntegerParseStatus::ok:
        obj = v;
        return true;
    case number_format::IntegerParseStatus::not_integral:
        return ctx.saveError(mismatch == DecodeError::NO_ERROR ? DecodeError::NON_INTEGRAL_NUMBER : mismatch,
                             ctx.reader.offset(), "number " + std::string(literal));
    case number_format::IntegerParseStatus::out_of_range:
        break;
    }
    return ctx.saveError(mismatch == DecodeError::NO_ERROR ? DecodeError::NUMBER_OUT_OF_RANGE : mismatch,
                         ctx.reader.offset(), "number " + std::string(literal));
}

template<class T>
    requires static_schema::JsonFloat<T>
bool StoreNumber(std::string_view literal, T & obj, DecodeContext & ctx, DecodeError mismatch = DecodeError::NO_ERROR) {
    if(!number_format::parse_float(literal, obj)) {
        return ctx.saveError(mismatch == DecodeError::NO_ERROR ? DecodeError::NUMBER_OUT_OF_RANGE : mismatch,
                             ctx.reader.offset(), "number " + std::string(literal));
    }
    return true;
}

// Content of a string decoded with as_string: the JSON text of a scalar
template<class T>
bool StoreQuoted(std::string_view inner, T & obj, DecodeContext & ctx) {
    const auto invalid = [&] {
        return ctx.saveError(DecodeError::INVALID_STRING_OPTION, ctx.reader.offset(), std::string(inner));
    };
    if constexpr (static_schema::JsonBool<T>) {
        if(inner == "true") {
            obj = true;
        } else if(inner == "false") {
            obj = false;
        } else {
            return invalid();
        }
        return true;
    } else if constexpr (static_schema::JsonInteger<T> || static_schema::JsonFloat<T>) {
        if(!number_format::is_valid_number_literal(inner)) {
            return invalid();
        }
        return StoreNumber(inner, obj, ctx, DecodeError::INVALID_STRING_OPTION);
    } else if constexpr (std::is_same_v<T, Number>) {
        if(!number_format::is_valid_number_literal(inner)) {
            return invalid();
        }
        obj = Number(std::string(inner));
        return true;
    } else if constexpr (std::is_same_v<T, std::string>) {
        JsonReader sub(inner);
        std::string s;
        if(sub.read_string(s) != reader::TryParseStatus::ok || !sub.finish()) {
            return invalid();
        }
        obj = std::move(s);
        return true;
    } else {
        return invalid();
    }
}

template<class T>
bool DecodeQuoted(T & obj, DecodeContext & ctx) {
    const JsonToken t = ctx.reader.peek_token();
    if(t == JsonToken::Null || t == JsonToken::String) {
        std::string inner = "null";
        if(t == JsonToken::Null) {
            if(!SkipNull(ctx)) return false;
        } else if(ctx.reader.read_string(inner) != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        if(inner == "null") {
            if constexpr (static_schema::JsonAllocatableNullable<T>) {
                static_schema::nullable_traits<T>::reset(obj);
            }
            return true;
        }
        if constexpr (static_schema::JsonAllocatableNullable<T>) {
            return StoreQuoted(inner, static_schema::nullable_traits<T>::emplace(obj), ctx);
        } else {
            return StoreQuoted(inner, obj, ctx);
        }
    }
    return TypeMismatch(t, ctx, DecodeError::INVALID_STRING_OPTION);
}

/* ######## Value model ######## */

inline bool DecodeModel(Value & v, DecodeContext & ctx);

inline bool DecodeModel(Array & arr, DecodeContext & ctx) {
    const JsonToken t = ctx.reader.peek_token();
    if(t == JsonToken::Null) {
        return SkipNull(ctx);
    }
    if(t != JsonToken::Array) {
        return TypeMismatch(t, ctx);
    }
    arr.clear();
    return ForEachElement(ctx, [&] {
        return DecodeModel(arr.emplace_back(), ctx);
    });
}

inline bool DecodeModel(Object & obj, DecodeContext & ctx) {
    const JsonToken t = ctx.reader.peek_token();
    if(t == JsonToken::Null) {
        return SkipNull(ctx);
    }
    if(t != JsonToken::Object) {
        return TypeMismatch(t, ctx);
    }
    obj.clear();
    return ForEachMember(ctx, [&](std::string key) {
        return DecodeModel(obj.emplace_back(std::move(key), Value()).value, ctx);
    });
}

inline bool DecodeModel(Number & n, DecodeContext & ctx) {
    const JsonToken t = ctx.reader.peek_token();
    if(t == JsonToken::Null) {
        return SkipNull(ctx);
    }
    if(t == JsonToken::Number) {
        std::string_view literal;
        if(ctx.reader.read_number_token(literal) != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        n = Number(std::string(literal));
        return true;
    }
    if(t == JsonToken::String) {
        std::string s;
        if(ctx.reader.read_string(s) != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        if(!number_format::is_valid_number_literal(s)) {
            return ctx.saveError(DecodeError::WRONG_JSON_TYPE, ctx.reader.offset(), "string");
        }
        n = Number(std::move(s));
        return true;
    }
    return TypeMismatch(t, ctx);
}

inline bool DecodeModel(RawValue & raw, DecodeContext & ctx) {
    std::string_view span;
    if(!ctx.reader.capture_value(span)) {
        return ctx.withReaderError();
    }
    raw.assign(span);
    return true;
}

inline bool DecodeModel(Value & v, DecodeContext & ctx) {
    switch(ctx.reader.peek_token()) {
    case JsonToken::Null:
        v = Value(nullptr);
        return SkipNull(ctx);
    case JsonToken::Bool: {
        bool b = false;
        if(ctx.reader.read_bool(b) != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        v = Value(b);
        return true;
    }
    case JsonToken::Number: {
        std::string_view literal;
        if(ctx.reader.read_number_token(literal) != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        v = Value(Number(std::string(literal)));
        return true;
    }
    case JsonToken::String: {
        std::string s;
        if(ctx.reader.read_string(s) != reader::TryParseStatus::ok) {
            return ctx.withReaderError();
        }
        v = Value(std::move(s));
        return true;
    }
    case JsonToken::Array: {
        Array arr;
        const bool ok = DecodeModel(arr, ctx);
        v = Value(std::move(arr));
        return ok;
    }
    case JsonToken::Object: {
        Object obj;
        const bool ok = DecodeModel(obj, ctx);
        v = Value(std::move(obj));
        return ok;
    }
    default:
        // input was validated before decoding starts
        ctx.reader.skip_value();
        return ctx.withReaderError();
    }
}

/* ######## Hooks ######## */

template<class T>
bool DecodeJsonHook(T & obj, DecodeContext & ctx) {
    std::string_view span;
    if(!ctx.reader.capture_value(span)) {
        return ctx.withReaderError();
    }
    if(!obj.unmarshal_json(span)) {
        return ctx.withError(DecodeError::UNMARSHALER_FAILED, ctx.reader.offset(), std::string(span));
    }
    return true;
}

template<class T>
bool DecodeTextHook(T & obj, DecodeContext & ctx) {
    const JsonToken t = ctx.reader.peek_token();
    if(t == JsonToken::Null) {
        return SkipNull(ctx);
    }
    if(t != JsonToken::String) {
        return TypeMismatch(t, ctx);
    }
    std::string s;
    if(ctx.reader.read_string(s) != reader::TryParseStatus::ok) {
        return ctx.withReaderError();
    }
    if(!obj.unmarshal_text(s)) {
        return ctx.withError(DecodeError::TEXT_UNMARSHALER_FAILED, ctx.reader.offset(), std::move(s));
    }
    return true;
}

/* ######## Structural kinds ######## */

template<class ObjT>
    requires static_schema::JsonBool<ObjT>
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    if(t != JsonToken::Bool) {
        return TypeMismatch(t, ctx);
    }
    bool b = false;
    if(ctx.reader.read_bool(b) != reader::TryParseStatus::ok) {
        return ctx.withReaderError();
    }
    obj = b;
    return true;
}

template<class ObjT>
    requires (static_schema::JsonInteger<ObjT> || static_schema::JsonFloat<ObjT>)
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    if(t != JsonToken::Number) {
        return TypeMismatch(t, ctx);
    }
    std::string_view literal;
    if(ctx.reader.read_number_token(literal) != reader::TryParseStatus::ok) {
        return ctx.withReaderError();
    }
    return StoreNumber(literal, obj, ctx);
}

template<class ObjT>
    requires std::same_as<ObjT, std::string>
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    if(t != JsonToken::String) {
        return TypeMismatch(t, ctx);
    }
    if(ctx.reader.read_string(obj) != reader::TryParseStatus::ok) {
        return ctx.withReaderError();
    }
    return true;
}

template<class ObjT>
    requires static_schema::JsonBytes<ObjT>
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    // Byte sequences also take an array of small integers
    if(t == JsonToken::Array) {
        obj.clear();
        return ForEachElement(ctx, [&] {
            std::uint8_t b = 0;
            const bool ok = DecodeValue(b, ctx);
            obj.push_back(static_cast<typename ObjT::value_type>(b));
            return ok;
        });
    }
    if(t != JsonToken::String) {
        return TypeMismatch(t, ctx);
    }
    std::string s;
    if(ctx.reader.read_string(s) != reader::TryParseStatus::ok) {
        return ctx.withReaderError();
    }
    ObjT decoded;
    if(!base64::decode(s, decoded)) {
        return ctx.saveError(DecodeError::INVALID_BASE64, ctx.reader.offset(), std::move(s));
    }
    obj = std::move(decoded);
    return true;
}

// Sequences are replaced
template<class ObjT>
    requires static_schema::DynamicSequence<ObjT>
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    if(t != JsonToken::Array) {
        return TypeMismatch(t, ctx);
    }
    obj.clear();
    return ForEachElement(ctx, [&] {
        return DecodeValue(obj.emplace_back(), ctx);
    });
}

// Extra elements are dropped, missing ones are reset
template<class ObjT>
    requires static_schema::FixedSequence<ObjT>
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    using E = typename static_schema::fixed_sequence_traits<ObjT>::element_type;
    constexpr std::size_t N = static_schema::fixed_sequence_traits<ObjT>::size;
    if(t != JsonToken::Array) {
        return TypeMismatch(t, ctx);
    }
    std::size_t index = 0;
    const bool ok = ForEachElement(ctx, [&] {
        if(index < N) {
            return DecodeValue(obj[index ++], ctx);
        }
        if(!ctx.reader.skip_value()) {
            return ctx.withReaderError();
        }
        return true;
    });
    for(; index < N; index ++) {
        obj[index] = E{};
    }
    return ok;
}

// False aborts decoding. usable is cleared for a key with no valid form, whose entry is left out.
template<class K>
bool ResolveMapKey(std::string && text, K & key, bool & usable, DecodeContext & ctx) {
    usable = true;
    if constexpr (std::same_as<K, std::string>) {
        key = std::move(text);
        return true;
    } else if constexpr (static_schema::TextUnmarshaler<K>) {
        if(!key.unmarshal_text(text)) {
            return ctx.withError(DecodeError::TEXT_UNMARSHALER_FAILED, ctx.reader.offset(), std::move(text));
        }
        return true;
    } else {
        if(!number_format::is_valid_number_literal(text) ||
            number_format::parse_integer(text, key, false) != number_format::IntegerParseStatus::ok) {
            usable = false;
            return ctx.saveError(DecodeError::INVALID_MAP_KEY, ctx.reader.offset(), "number " + text);
        }
        return true;
    }
}

// Maps are merged; every entry is decoded from a fresh mapped value
template<class ObjT>
    requires static_schema::JsonMap<ObjT>
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    using K = typename ObjT::key_type;
    using M = typename ObjT::mapped_type;
    if(t != JsonToken::Object) {
        return TypeMismatch(t, ctx);
    }
    if constexpr (!static_schema::JsonDecodableMapKey<K>) {
        return TypeMismatch(t, ctx, DecodeError::INVALID_MAP_KEY);
    } else {
        return ForEachMember(ctx, [&](std::string text) {
            K key{};
            bool usable = true;
            if(!ResolveMapKey(std::move(text), key, usable, ctx)) {
                return false;
            }
            if(!usable) {
                if(!ctx.reader.skip_value()) {
                    return ctx.withReaderError();
                }
                return true;
            }
            M value{};
            if(!DecodeValue(value, ctx)) {
                return false;
            }
            obj.insert_or_assign(std::move(key), std::move(value));
            return true;
        });
    }
}

/* ######## Aggregates ######## */

template<class T, std::size_t Depth>
bool DecodeStructPath(T & obj, const PlannedField & f, std::size_t pos, DecodeContext & ctx);

template<class T, std::size_t Depth, std::size_t Index>
bool DecodeStructMember(T & obj, const PlannedField & f, std::size_t pos, DecodeContext & ctx) {
    using FieldOpts = options::detail::aggregate_field_opts<T, Index>;
    using Meta = typename FieldOpts::Meta;
    using V = typename FieldOpts::value_t;

    auto & member = Meta::getRef(introspection::getStructElementByIndex<Index>(obj));
    if(pos + 1 == f.path.size()) {
        return DecodeValue(member, ctx, f.quoted);
    }
    if constexpr (static_schema::is_promoted_member<T, Index>() && Depth < MaxEmbeddingDepth) {
        using Target = static_schema::embedded_target_t<V>;
        if constexpr (static_schema::JsonNullable<V>) {
            return DecodeStructPath<Target, Depth + 1>(static_schema::nullable_traits<V>::emplace(member), f, pos + 1, ctx);
        } else {
            return DecodeStructPath<Target, Depth + 1>(member, f, pos + 1, ctx);
        }
    } else {
        return true;
    }
}

template<class T, std::size_t Depth, std::size_t... Index>
bool DecodeStructPathImpl(T & obj, const PlannedField & f, std::size_t pos, DecodeContext & ctx,
                          std::index_sequence<Index...>) {
    const std::size_t target = f.path[pos];
    bool ok = true;
    ((Index == target ? (ok = DecodeStructMember<T, Depth, Index>(obj, f, pos, ctx), true) : false) || ...);
    return ok;
}

template<class T, std::size_t Depth>
bool DecodeStructPath(T & obj, const PlannedField & f, std::size_t pos, DecodeContext & ctx) {
    return DecodeStructPathImpl<T, Depth>(obj, f, pos, ctx,
        std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

template<class ObjT>
    requires static_schema::JsonObject<ObjT>
bool DecodeNonNullValue(ObjT & obj, JsonToken t, DecodeContext & ctx) {
    if(t != JsonToken::Object) {
        return TypeMismatch(t, ctx);
    }
    const FieldPlan & plan = plan_for<ObjT>();
    return ForEachMember(ctx, [&](std::string key) {
        const PlannedField * f = plan.find(key);
        if(f == nullptr) {
            if(!ctx.reader.skip_value()) {
                return ctx.withReaderError();
            }
            if(ctx.options.disallow_unknown_fields) {
                return ctx.saveError(DecodeError::UNKNOWN_FIELD, ctx.reader.offset(), std::move(key));
            }
            return true;
        }
        ctx.pushField(f->name);
        const bool ok = DecodeStructPath<ObjT, 0>(obj, *f, 0, ctx);
        ctx.popField();
        return ok;
    });
}

/* ######## Dispatch ######## */

// null resets an allocatable wrapper and leaves any other target as it is
template<class T>
bool DecodeUnquoted(T & obj, DecodeContext & ctx) {
    const JsonToken t = ctx.reader.peek_token();
    if constexpr (static_schema::JsonNullable<T>) {
        static_assert(static_schema::JsonAllocatableNullable<T>,
                      "[[[ OrderedJson ]]] raw pointers can be encoded but not decoded, use std::unique_ptr or std::optional");
        using Traits = static_schema::nullable_traits<T>;
        if(t == JsonToken::Null) {
            Traits::reset(obj);
            return SkipNull(ctx);
        }
        return DecodeValue(Traits::emplace(obj), ctx);
    } else if constexpr (requires { DecodeNonNullValue(obj, t, ctx); }) {
        if(t == JsonToken::Null) {
            return SkipNull(ctx);
        }
        return DecodeNonNullValue(obj, t, ctx);
    } else {
        static_assert(static_schema::detail::always_false<T>::value,
                      "[[[ OrderedJson ]]] T is not a supported OrderedJson decode target.\n"
                      "see static_schema.hpp for the supported kinds");
        return false;
    }
}

template<class T>
bool DecodeValue(T & obj, DecodeContext & ctx, bool quoted) {
    if constexpr (static_schema::is_annotated_v<T>) {
        return DecodeValue(obj.value, ctx, quoted);
    } else if constexpr (static_schema::ValueModelType<T>) {
        if constexpr (std::is_same_v<T, Number>) {
            if(quoted) return DecodeQuoted(obj, ctx);
        }
        return DecodeModel(obj, ctx);
    } else if constexpr (static_schema::JsonUnmarshaler<T>) {
        return DecodeJsonHook(obj, ctx);
    } else if constexpr (static_schema::TextUnmarshaler<T>) {
        return DecodeTextHook(obj, ctx);
    } else if constexpr (static_schema::JsonQuotable<T> &&
                         !(static_schema::JsonNullable<T> && !static_schema::JsonAllocatableNullable<T>)) {
        if(quoted) {
            return DecodeQuoted(obj, ctx);
        }
        return DecodeUnquoted(obj, ctx);
    } else {
        return DecodeUnquoted(obj, ctx);
    }
}

} // namespace parser_details

// Checks the whole input first, so a syntax error leaves obj untouched. Type errors are
// reported after the rest of the input has been applied.
template<class T>
DecodeResult Decode(T & obj, std::string_view input, const DecodeOptions & options = {}) {
    {
        JsonReader check(input);
        if(!check.skip_value() || !check.finish()) {
            return DecodeResult(check.getError(), check.errorOffset(), {}, {});
        }
    }
    parser_details::DecodeContext ctx(input, options);
    parser_details::DecodeValue(obj, ctx);
    return ctx.result();
}

} // namespace OrderedJson
