#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "annotated.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"

namespace OrderedJson {

namespace static_schema {

namespace detail {

template<class T>
struct always_false : std::false_type {};

} // namespace detail

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template<class T>
struct is_annotated : std::false_type {};

template<class T, class... Opts>
struct is_annotated<Annotated<T, Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_annotated_v = is_annotated<std::remove_cvref_t<T>>::value;

using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


/* ######## Value model ######## */

template<class T>
concept ValueModelType =
    std::same_as<T, Value>  ||
    std::same_as<T, Object> ||
    std::same_as<T, Array>  ||
    std::same_as<T, Number> ||
    std::same_as<T, RawValue>;


/* ######## Hooks ######## */

template<class T>
concept JsonMarshalerMember = requires(const T & t, std::string & out) {
    { t.marshal_json(out) } -> std::convertible_to<bool>;
};

// Static form, called with nullptr for an empty pointer
template<class T>
concept JsonMarshalerNilSafe = requires(const T * self, std::string & out) {
    { T::marshal_json(self, out) } -> std::convertible_to<bool>;
};

template<class T>
concept JsonMarshaler = JsonMarshalerMember<T> || JsonMarshalerNilSafe<T>;

template<class T>
concept TextMarshaler = requires(const T & t, std::string & out) {
    { t.marshal_text(out) } -> std::convertible_to<bool>;
};

template<class T>
concept JsonUnmarshaler = requires(T & t, std::string_view json) {
    { t.unmarshal_json(json) } -> std::convertible_to<bool>;
};

template<class T>
concept TextUnmarshaler = requires(T & t, std::string_view text) {
    { t.unmarshal_text(text) } -> std::convertible_to<bool>;
};


/* ######## Nullable wrappers ######## */

template<class T>
struct nullable_traits {
    static constexpr bool is_nullable = false;
};

template<class U>
struct nullable_traits<std::optional<U>> {
    static constexpr bool is_nullable = true;
    static constexpr bool can_allocate = true;
    static constexpr bool is_reference = false;
    using element_type = U;

    static bool isNull(const std::optional<U> & o) { return !o.has_value(); }
    static const U & get(const std::optional<U> & o) { return *o; }
    static U & emplace(std::optional<U> & o) {
        if(!o) o.emplace();
        return *o;
    }
    static void reset(std::optional<U> & o) { o.reset(); }
};

template<class U>
struct nullable_traits<std::unique_ptr<U>> {
    static constexpr bool is_nullable = true;
    static constexpr bool can_allocate = true;
    static constexpr bool is_reference = false;
    using element_type = U;

    static bool isNull(const std::unique_ptr<U> & p) { return p == nullptr; }
    static const U & get(const std::unique_ptr<U> & p) { return *p; }
    static U & emplace(std::unique_ptr<U> & p) {
        if(!p) p = std::make_unique<U>();
        return *p;
    }
    static void reset(std::unique_ptr<U> & p) { p.reset(); }
};

// Shared and raw pointers may alias, so they take part in cycle detection
template<class U>
struct nullable_traits<std::shared_ptr<U>> {
    static constexpr bool is_nullable = true;
    static constexpr bool can_allocate = true;
    static constexpr bool is_reference = true;
    using element_type = U;

    static bool isNull(const std::shared_ptr<U> & p) { return p == nullptr; }
    static const U & get(const std::shared_ptr<U> & p) { return *p; }
    static U & emplace(std::shared_ptr<U> & p) {
        if(!p) p = std::make_shared<U>();
        return *p;
    }
    static void reset(std::shared_ptr<U> & p) { p.reset(); }
};

template<class U>
struct nullable_traits<U*> {
    static constexpr bool is_nullable = true;
    static constexpr bool can_allocate = false;
    static constexpr bool is_reference = true;
    using element_type = std::remove_const_t<U>;

    static bool isNull(U * const & p) { return p == nullptr; }
    static const element_type & get(U * const & p) { return *p; }
};

template<class T>
concept JsonNullable = nullable_traits<std::remove_cv_t<T>>::is_nullable;

template<class T>
concept JsonAllocatableNullable = JsonNullable<T> && nullable_traits<std::remove_cv_t<T>>::can_allocate;

template<class T>
using nullable_element_t = typename nullable_traits<std::remove_cv_t<T>>::element_type;


/* ######## Scalars ######## */

template<class T>
concept JsonBool = std::same_as<T, bool>;

template<class T>
concept JsonInteger = std::integral<T> && !JsonBool<T>;

template<class T>
concept JsonFloat = std::floating_point<T>;

template<class T>
concept JsonString = std::same_as<T, std::string> || std::same_as<T, std::string_view>;

template<class T>
concept JsonBytes = std::same_as<T, std::vector<std::uint8_t>> || std::same_as<T, std::vector<std::byte>>;

template<class T>
concept JsonScalar = JsonBool<T> || JsonInteger<T> || JsonFloat<T> || JsonString<T>;

// as_string applies to scalars, Number, and nullable wrappers around them
template<class T>
concept JsonQuotable = JsonScalar<T> || std::same_as<T, Number> ||
    (JsonNullable<T> && (JsonScalar<nullable_element_t<T>> || std::same_as<nullable_element_t<T>, Number>));


/* ######## Maps ######## */

template<class M>
concept JsonMap =
    !ValueModelType<M> &&
    requires(const M & m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.begin() } -> std::same_as<typename M::const_iterator>;
        { m.end() } -> std::same_as<typename M::const_iterator>;
    };

// Keys that have a string form, in the order the forms are tried
template<class K>
concept JsonMapKey = JsonString<K> || TextMarshaler<K> || JsonInteger<K>;

template<class K>
concept JsonDecodableMapKey = std::same_as<K, std::string> || TextUnmarshaler<K> || JsonInteger<K>;


/* ######## Sequences ######## */

template<class C>
concept JsonSequence =
    !ValueModelType<C> &&
    !JsonString<C> &&
    !JsonBytes<C> &&
    !JsonMap<C> &&
    std::ranges::range<const C>;

template<class C>
concept DynamicSequence = JsonSequence<C> && requires(C & c) {
    typename C::value_type;
    { c.emplace_back() } -> std::same_as<typename C::value_type &>;
    c.clear();
};

template<class C>
struct fixed_sequence_traits {
    static constexpr bool is_fixed = false;
};

template<class T, std::size_t N>
struct fixed_sequence_traits<std::array<T, N>> {
    static constexpr bool is_fixed = true;
    static constexpr std::size_t size = N;
    using element_type = T;
};

template<class T, std::size_t N>
struct fixed_sequence_traits<T[N]> {
    static constexpr bool is_fixed = true;
    static constexpr std::size_t size = N;
    using element_type = T;
};

template<class C>
concept FixedSequence = JsonSequence<C> && fixed_sequence_traits<C>::is_fixed;


/* ######## Object type detection ######## */

template<typename T>
struct is_json_object {
    static constexpr bool value = [] {
        if constexpr (ValueModelType<T> || JsonScalar<T> || JsonBytes<T> || JsonNullable<T>) {
            return false;
        } else if constexpr (is_annotated_v<T>) {
            return false;
        } else if constexpr (introspection::has_explicit_fields<T>) {
            return true;
        } else if constexpr (JsonMap<T> || std::ranges::range<T>) {
            return false;
        } else if constexpr (!std::is_class_v<T> || !std::is_aggregate_v<T>) {
            return false;
        } else {
            return true;
        }
    }();
};

template<class C>
concept JsonObject = is_json_object<std::remove_cv_t<C>>::value;

// Target of an embedded member: the aggregate itself or the aggregate behind a unique_ptr
template<class T>
struct embedded_target {
    using type = T;
};

template<class U>
struct embedded_target<std::unique_ptr<U>> {
    using type = U;
};

template<class T>
using embedded_target_t = typename embedded_target<T>::type;

template<class T>
concept EmbeddableAggregate = JsonObject<embedded_target_t<T>>;

// Member of aggregate T at Index whose fields are promoted into T
template<class T, std::size_t Index>
constexpr bool is_promoted_member() {
    using FieldOpts = options::detail::aggregate_field_opts<T, Index>;
    using Opts = typename FieldOpts::options;
    if constexpr (Opts::template has_option<options::detail::skip_tag> ||
                  !Opts::template has_option<options::detail::embedded_tag>) {
        return false;
    } else if constexpr (Opts::template has_option<options::detail::key_tag>) {
        return Opts::template get_option<options::detail::key_tag>::desc.Length == 0
               && EmbeddableAggregate<typename FieldOpts::value_t>;
    } else {
        return EmbeddableAggregate<typename FieldOpts::value_t>;
    }
}

} // namespace static_schema

} // namespace OrderedJson
