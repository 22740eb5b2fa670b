#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "number_format.hpp"

namespace OrderedJson {

// JSON number kept as its decimal text
class Number {
    std::string m_text;
public:
    Number() = default;
    explicit Number(std::string text): m_text(std::move(text)) {}

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    static Number from(T v) {
        std::string s;
        number_format::append_integer(s, v);
        return Number(std::move(s));
    }

    const std::string & text() const { return m_text; }
    bool empty() const { return m_text.empty(); }
    bool valid() const { return number_format::is_valid_number_literal(m_text); }

    bool to_double(double & out) const {
        return valid() && number_format::parse_float(m_text, out);
    }
    bool to_int64(std::int64_t & out) const {
        return valid() && number_format::parse_integer(m_text, out, false) == number_format::IntegerParseStatus::ok;
    }

    bool operator==(const Number &) const = default;
};

// Pre-encoded JSON text. A default constructed RawValue is absent and encodes as null
class RawValue {
    std::optional<std::string> m_json;
public:
    RawValue() = default;
    explicit RawValue(std::string json): m_json(std::move(json)) {}

    bool present() const { return m_json.has_value(); }
    bool empty() const { return !m_json || m_json->empty(); }
    std::string_view json() const {
        return m_json ? std::string_view(*m_json) : std::string_view{};
    }
    void assign(std::string_view json) { m_json.emplace(json); }
    void reset() { m_json.reset(); }

    bool operator==(const RawValue &) const = default;
};

class Value;
struct Member;

using Array = std::vector<Value>;

// Object members in insertion order; keys may repeat
class Object {
    std::vector<Member> m_members;
public:
    using iterator = std::vector<Member>::iterator;
    using const_iterator = std::vector<Member>::const_iterator;

    Object() = default;
    Object(std::initializer_list<Member> members);

    void push_back(Member m);
    Member & emplace_back(std::string key, Value value);

    std::size_t size() const { return m_members.size(); }
    bool empty() const { return m_members.empty(); }
    void clear() { m_members.clear(); }

    Member & operator[](std::size_t i) { return m_members[i]; }
    const Member & operator[](std::size_t i) const { return m_members[i]; }

    // First member with the given key, nullptr if there is none
    const Value * find(std::string_view key) const;
    Value * find(std::string_view key);

    iterator begin() { return m_members.begin(); }
    iterator end() { return m_members.end(); }
    const_iterator begin() const { return m_members.begin(); }
    const_iterator end() const { return m_members.end(); }

    const std::vector<Member> & members() const { return m_members; }

    bool operator==(const Object & other) const;
};

enum class ValueKind {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

class Value {
public:
    using Storage = std::variant<std::nullptr_t, bool, Number, std::string, Array, Object>;

    Value(): m_data(nullptr) {}
    Value(std::nullptr_t): m_data(nullptr) {}
    Value(bool b): m_data(b) {}
    Value(Number n): m_data(std::move(n)) {}
    Value(std::string s): m_data(std::move(s)) {}
    Value(std::string_view s): m_data(std::string(s)) {}
    Value(const char * s): m_data(std::string(s)) {}
    Value(Array a): m_data(std::move(a)) {}
    Value(Object o): m_data(std::move(o)) {}

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T v): m_data(Number::from(v)) {}

    // Floats go through Number so that NaN and infinities stay out of the model
    template<std::floating_point T>
    Value(T) = delete;

    ValueKind kind() const { return static_cast<ValueKind>(m_data.index()); }

    bool is_null() const { return kind() == ValueKind::Null; }
    bool is_bool() const { return kind() == ValueKind::Bool; }
    bool is_number() const { return kind() == ValueKind::Number; }
    bool is_string() const { return kind() == ValueKind::String; }
    bool is_array() const { return kind() == ValueKind::Array; }
    bool is_object() const { return kind() == ValueKind::Object; }

    // Accessors require the matching kind
    bool as_bool() const { return std::get<bool>(m_data); }
    const Number & as_number() const { return std::get<Number>(m_data); }
    const std::string & as_string() const { return std::get<std::string>(m_data); }
    const Array & as_array() const { return std::get<Array>(m_data); }
    Array & as_array() { return std::get<Array>(m_data); }
    const Object & as_object() const { return std::get<Object>(m_data); }
    Object & as_object() { return std::get<Object>(m_data); }

    const Storage & storage() const { return m_data; }
    Storage & storage() { return m_data; }

    bool operator==(const Value & other) const { return m_data == other.m_data; }

private:
    Storage m_data;
};

struct Member {
    std::string key;
    Value value;

    bool operator==(const Member &) const = default;
};

inline Object::Object(std::initializer_list<Member> members): m_members(members) {}

inline void Object::push_back(Member m) {
    m_members.push_back(std::move(m));
}

inline Member & Object::emplace_back(std::string key, Value value) {
    return m_members.emplace_back(Member{std::move(key), std::move(value)});
}

inline const Value * Object::find(std::string_view key) const {
    for(const Member & m : m_members) {
        if(m.key == key) return &m.value;
    }
    return nullptr;
}

inline Value * Object::find(std::string_view key) {
    for(Member & m : m_members) {
        if(m.key == key) return &m.value;
    }
    return nullptr;
}

inline bool Object::operator==(const Object & other) const {
    return m_members == other.m_members;
}

} // namespace OrderedJson
