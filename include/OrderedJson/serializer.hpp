#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "base64.hpp"
#include "errors.hpp"
#include "field_plan.hpp"
#include "formatting.hpp"
#include "json.hpp"
#include "options.hpp"
#include "result.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"

namespace OrderedJson {

struct EncodeOptions {
    // Escape & ' + < > ` and every non-ASCII rune, so output is safe inside HTML
    bool escape_html = true;
};

namespace serializer_details {

class EncodeContext {
    EncodeError m_error = EncodeError::NO_ERROR;
    std::string m_detail;
    std::vector<const void *> m_active;

public:
    JsonWriter writer;
    const EncodeOptions & options;

    EncodeContext(std::string & out, const EncodeOptions & opts):
        writer(out, opts.escape_html), options(opts)
    {}

    bool withError(EncodeError err, std::string detail = {}) {
        if(m_error == EncodeError::NO_ERROR) {
            m_error = err;
            m_detail = std::move(detail);
        }
        return false;
    }

    // Tracks pointers currently being written; meeting one again means a cycle
    bool enter(const void * p) {
        if(std::find(m_active.begin(), m_active.end(), p) != m_active.end()) {
            return withError(EncodeError::CYCLIC_VALUE);
        }
        m_active.push_back(p);
        return true;
    }
    void leave() {
        m_active.pop_back();
    }

    EncodeResult result() const {
        return EncodeResult(m_error, m_detail);
    }
};

template<class T>
bool SerializeValue(const T & obj, EncodeContext & ctx, bool quoted = false);

// Hook output goes through Compact so that it is validated and HTML-escaped like the rest
inline bool WriteMarshalerOutput(const std::string & json, EncodeContext & ctx) {
    std::string & out = ctx.writer.buffer();
    if(!Compact(out, json, ctx.options.escape_html)) {
        return ctx.withError(EncodeError::MARSHALER_INVALID_OUTPUT, json);
    }
    return true;
}

template<class T>
bool SerializeJsonHook(const T * obj, EncodeContext & ctx) {
    std::string buf;
    bool ok;
    if constexpr (static_schema::JsonMarshalerNilSafe<T>) {
        ok = T::marshal_json(obj, buf);
    } else {
        ok = obj->marshal_json(buf);
    }
    if(!ok) {
        return ctx.withError(EncodeError::MARSHALER_FAILED);
    }
    return WriteMarshalerOutput(buf, ctx);
}

template<class T>
bool SerializeTextHook(const T & obj, EncodeContext & ctx) {
    std::string buf;
    if(!obj.marshal_text(buf)) {
        return ctx.withError(EncodeError::TEXT_MARSHALER_FAILED);
    }
    return ctx.writer.write_string(buf);
}

/* ######## Value model ######## */

inline bool SerializeModel(const Value & v, EncodeContext & ctx, bool quoted);

inline bool SerializeModel(const Number & n, EncodeContext & ctx, bool quoted) {
    std::string_view text = n.text();
    if(text.empty()) {
        text = "0";
    } else if(!n.valid()) {
        return ctx.withError(EncodeError::INVALID_NUMBER_LITERAL, n.text());
    }
    if(quoted) ctx.writer.buffer().push_back('"');
    ctx.writer.write_raw(text);
    if(quoted) ctx.writer.buffer().push_back('"');
    return true;
}

inline bool SerializeModel(const RawValue & raw, EncodeContext & ctx, bool) {
    if(!raw.present()) {
        return ctx.writer.write_null();
    }
    std::string & out = ctx.writer.buffer();
    if(!Compact(out, raw.json(), ctx.options.escape_html)) {
        return ctx.withError(EncodeError::INVALID_RAW_VALUE, std::string(raw.json()));
    }
    return true;
}

inline bool SerializeModel(const Array & arr, EncodeContext & ctx, bool) {
    JsonWriter::ArrayFrame fr;
    ctx.writer.write_array_begin(fr);
    for(const Value & v : arr) {
        ctx.writer.advance_to_element(fr);
        if(!SerializeModel(v, ctx, false)) {
            return false;
        }
    }
    return ctx.writer.write_array_end(fr);
}

inline bool SerializeModel(const Object & obj, EncodeContext & ctx, bool) {
    JsonWriter::MapFrame fr;
    ctx.writer.write_map_begin(fr);
    for(const Member & m : obj) {
        ctx.writer.write_key(fr, m.key);
        if(!SerializeModel(m.value, ctx, false)) {
            return false;
        }
    }
    return ctx.writer.write_map_end(fr);
}

inline bool SerializeModel(const Value & v, EncodeContext & ctx, bool quoted) {
    return std::visit([&](const auto & alt) -> bool {
        using A = std::remove_cvref_t<decltype(alt)>;
        if constexpr (std::is_same_v<A, std::nullptr_t>) {
            return ctx.writer.write_null();
        } else if constexpr (std::is_same_v<A, bool>) {
            return ctx.writer.write_bool(alt);
        } else if constexpr (std::is_same_v<A, std::string>) {
            return ctx.writer.write_string(alt);
        } else {
            return SerializeModel(alt, ctx, quoted);
        }
    }, v.storage());
}

/* ######## Structural kinds ######## */

template<class ObjT>
    requires static_schema::JsonBool<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool quoted) {
    if(quoted) {
        ctx.writer.write_raw(obj ? "\"true\"" : "\"false\"");
        return true;
    }
    return ctx.writer.write_bool(obj);
}

template<class ObjT>
    requires static_schema::JsonInteger<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool quoted) {
    if(quoted) ctx.writer.buffer().push_back('"');
    ctx.writer.write_integer(obj);
    if(quoted) ctx.writer.buffer().push_back('"');
    return true;
}

template<class ObjT>
    requires static_schema::JsonFloat<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool quoted) {
    std::string & out = ctx.writer.buffer();
    const std::size_t mark = out.size();
    if(quoted) out.push_back('"');
    if(!ctx.writer.write_float(obj)) {
        out.resize(mark);
        std::string repr;
        if(obj != obj) {
            repr = "NaN";
        } else {
            repr = obj > 0 ? "+Inf" : "-Inf";
        }
        return ctx.withError(EncodeError::UNSUPPORTED_FLOAT_VALUE, repr);
    }
    if(quoted) out.push_back('"');
    return true;
}

// A quoted string is the JSON string of its own JSON text.
// Only the inner text follows the HTML setting.
template<class ObjT>
    requires static_schema::JsonString<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool quoted) {
    if(quoted) {
        append_escaped_string(ctx.writer.buffer(), escaped_string(obj, ctx.writer.escapeHtml()), false);
        return true;
    }
    return ctx.writer.write_string(obj);
}

template<class ObjT>
    requires static_schema::JsonBytes<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool) {
    std::string & out = ctx.writer.buffer();
    out.push_back('"');
    base64::append_encoded(out, obj.data(), obj.size());
    out.push_back('"');
    return true;
}

template<class ObjT>
    requires static_schema::JsonSequence<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool) {
    JsonWriter::ArrayFrame fr;
    ctx.writer.write_array_begin(fr);
    for(const auto & el : obj) {
        ctx.writer.advance_to_element(fr);
        if(!SerializeValue(el, ctx)) {
            return false;
        }
    }
    return ctx.writer.write_array_end(fr);
}

template<class K>
bool ResolveMapKey(const K & key, std::string & out, EncodeContext & ctx) {
    if constexpr (static_schema::JsonString<K>) {
        out.assign(key);
        return true;
    } else if constexpr (static_schema::TextMarshaler<K>) {
        if(!key.marshal_text(out)) {
            return ctx.withError(EncodeError::TEXT_MARSHALER_FAILED);
        }
        return true;
    } else {
        number_format::append_integer(out, key);
        return true;
    }
}

// Entries are written in byte order of their resolved keys
template<class ObjT>
    requires static_schema::JsonMap<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool) {
    using K = typename ObjT::key_type;
    if constexpr (!static_schema::JsonMapKey<K>) {
        return ctx.withError(EncodeError::UNSUPPORTED_MAP_KEY);
    } else {
        using Entry = std::pair<std::string, const typename ObjT::mapped_type *>;
        std::vector<Entry> entries;
        entries.reserve(obj.size());
        for(const auto & [k, v] : obj) {
            std::string key;
            if(!ResolveMapKey(k, key, ctx)) {
                return false;
            }
            entries.emplace_back(std::move(key), &v);
        }
        std::sort(entries.begin(), entries.end(), [](const Entry & a, const Entry & b) {
            return a.first < b.first;
        });

        JsonWriter::MapFrame fr;
        ctx.writer.write_map_begin(fr);
        for(const Entry & e : entries) {
            ctx.writer.write_key(fr, e.first);
            if(!SerializeValue(*e.second, ctx)) {
                return false;
            }
        }
        return ctx.writer.write_map_end(fr);
    }
}

/* ######## Aggregates ######## */

template<class T>
bool IsEmptyValue(const T & obj) {
    if constexpr (static_schema::is_annotated_v<T>) {
        return IsEmptyValue(obj.value);
    } else if constexpr (std::is_same_v<T, Value>) {
        return obj.is_null();
    } else if constexpr (std::is_same_v<T, Number>) {
        return obj.empty();
    } else if constexpr (std::is_same_v<T, RawValue>) {
        return obj.empty();
    } else if constexpr (std::is_same_v<T, Object> || std::is_same_v<T, Array>) {
        return obj.empty();
    } else if constexpr (static_schema::is_specialization_of_v<T, std::optional>) {
        // an optional container stands for a nil-able slice or map: empty when null or empty
        using E = typename T::value_type;
        if constexpr (static_schema::JsonSequence<E> || static_schema::JsonMap<E>) {
            return !obj.has_value() || IsEmptyValue(*obj);
        } else {
            return !obj.has_value();
        }
    } else if constexpr (static_schema::JsonNullable<T>) {
        return static_schema::nullable_traits<T>::isNull(obj);
    } else if constexpr (static_schema::JsonBool<T>) {
        return !obj;
    } else if constexpr (static_schema::JsonInteger<T> || static_schema::JsonFloat<T>) {
        return obj == 0;
    } else if constexpr (static_schema::JsonString<T> || static_schema::JsonBytes<T>) {
        return obj.empty();
    } else if constexpr (static_schema::FixedSequence<T>) {
        return static_schema::fixed_sequence_traits<T>::size == 0;
    } else if constexpr (static_schema::JsonSequence<T> || static_schema::JsonMap<T>) {
        return std::ranges::empty(obj);
    } else {
        return false;
    }
}

// Walks the members of an aggregate in declaration order, descending into promoted
// embedded members, and writes those named by the plan. Plan entries are sorted by
// path, so a single cursor suffices: entries before the current path belong to
// members already passed or to empty embedded pointers.
struct PlanCursor {
    const std::vector<PlannedField> & fields;
    std::size_t pos = 0;
    std::vector<std::size_t> path;

    const PlannedField * seek() {
        while(pos < fields.size() && fields[pos].path < path) {
            pos ++;
        }
        if(pos < fields.size() && fields[pos].path == path) {
            return &fields[pos];
        }
        return nullptr;
    }
};

template<class T, std::size_t Depth>
bool SerializeStructFields(const T & obj, PlanCursor & cursor, JsonWriter::MapFrame & fr, EncodeContext & ctx);

template<class T, std::size_t Depth, std::size_t Index>
bool SerializeOneStructField(const T & obj, PlanCursor & cursor, JsonWriter::MapFrame & fr, EncodeContext & ctx) {
    using FieldOpts = options::detail::aggregate_field_opts<T, Index>;
    using Meta = typename FieldOpts::Meta;
    using V = typename FieldOpts::value_t;

    const auto & member = Meta::getRef(introspection::getStructElementByIndex<Index>(obj));

    cursor.path.push_back(Index);
    bool ok = true;
    if(const PlannedField * f = cursor.seek()) {
        if(!(f->omit_empty && IsEmptyValue(member))) {
            ctx.writer.write_key(fr, f->name);
            ok = SerializeValue(member, ctx, f->quoted);
        }
    } else if constexpr (static_schema::is_promoted_member<T, Index>() && Depth < MaxEmbeddingDepth) {
        using Target = static_schema::embedded_target_t<V>;
        if constexpr (static_schema::JsonNullable<V>) {
            if(member != nullptr) {
                ok = SerializeStructFields<Target, Depth + 1>(*member, cursor, fr, ctx);
            }
        } else {
            ok = SerializeStructFields<Target, Depth + 1>(member, cursor, fr, ctx);
        }
    }
    cursor.path.pop_back();
    return ok;
}

template<class T, std::size_t Depth, std::size_t... Index>
bool SerializeStructFieldsImpl(const T & obj, PlanCursor & cursor, JsonWriter::MapFrame & fr, EncodeContext & ctx,
                               std::index_sequence<Index...>) {
    return (SerializeOneStructField<T, Depth, Index>(obj, cursor, fr, ctx) && ...);
}

template<class T, std::size_t Depth>
bool SerializeStructFields(const T & obj, PlanCursor & cursor, JsonWriter::MapFrame & fr, EncodeContext & ctx) {
    return SerializeStructFieldsImpl<T, Depth>(obj, cursor, fr, ctx,
        std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

template<class ObjT>
    requires static_schema::JsonObject<ObjT>
bool SerializeNonNullValue(const ObjT & obj, EncodeContext & ctx, bool) {
    PlanCursor cursor{plan_for<ObjT>().fields()};
    JsonWriter::MapFrame fr;
    ctx.writer.write_map_begin(fr);
    if(!SerializeStructFields<ObjT, 0>(obj, cursor, fr, ctx)) {
        return false;
    }
    return ctx.writer.write_map_end(fr);
}

/* ######## Dispatch ######## */

template<class T>
bool SerializeValue(const T & obj, EncodeContext & ctx, bool quoted) {
    if constexpr (static_schema::is_annotated_v<T>) {
        return SerializeValue(obj.value, ctx, quoted);
    } else if constexpr (static_schema::ValueModelType<T>) {
        return SerializeModel(obj, ctx, quoted);
    } else if constexpr (static_schema::JsonMarshaler<T>) {
        return SerializeJsonHook(&obj, ctx);
    } else if constexpr (static_schema::TextMarshaler<T>) {
        return SerializeTextHook(obj, ctx);
    } else if constexpr (static_schema::JsonNullable<T>) {
        using Traits = static_schema::nullable_traits<T>;
        using E = typename Traits::element_type;
        if(Traits::isNull(obj)) {
            if constexpr (static_schema::JsonMarshalerNilSafe<E>) {
                return SerializeJsonHook<E>(nullptr, ctx);
            } else {
                return ctx.writer.write_null();
            }
        }
        const E & target = Traits::get(obj);
        if constexpr (Traits::is_reference) {
            if(!ctx.enter(&target)) {
                return false;
            }
            const bool ok = SerializeValue(target, ctx, quoted);
            ctx.leave();
            return ok;
        } else {
            return SerializeValue(target, ctx, quoted);
        }
    } else if constexpr (requires { SerializeNonNullValue(obj, ctx, quoted); }) {
        return SerializeNonNullValue(obj, ctx, quoted);
    } else {
        static_assert(static_schema::detail::always_false<T>::value,
                      "[[[ OrderedJson ]]] T is not a supported OrderedJson host type.\n"
                      "see static_schema.hpp for the supported kinds");
        return false;
    }
}

} // namespace serializer_details

// Writes the compact encoding of obj into out. On error out is left empty.
template<class InputObjectT>
EncodeResult Encode(const InputObjectT & obj, std::string & out, const EncodeOptions & options = {}) {
    out.clear();
    serializer_details::EncodeContext ctx(out, options);
    if(!serializer_details::SerializeValue(obj, ctx)) {
        out.clear();
        return ctx.result();
    }
    return {};
}

template<class InputObjectT>
EncodeResult EncodeIndent(const InputObjectT & obj, std::string & out, std::string_view prefix,
                          std::string_view indent, const EncodeOptions & options = {}) {
    out.clear();
    std::string compact;
    EncodeResult res = Encode(obj, compact, options);
    if(!res) {
        return res;
    }
    if(!Indent(out, compact, prefix, indent)) {
        out.clear();
        return EncodeResult(EncodeError::MARSHALER_INVALID_OUTPUT, std::move(compact));
    }
    return res;
}

} // namespace OrderedJson
