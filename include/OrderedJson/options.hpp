#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace OrderedJson {


namespace options {

namespace detail {

struct key_tag{};
struct omitempty_tag{};
struct as_string_tag{};
struct skip_tag{};
struct embedded_tag{};
struct unexported_tag{};

}

// Renames the field; a renamed field is "tagged" for dominance resolution
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ OrderedJson ]]] key contains characters not allowed in a field name");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Field is left out when it holds the zero value of its type
struct omitempty {
    using tag = detail::omitempty_tag;
    static constexpr std::string_view to_string() {
        return "omitempty";
    }
};

// Scalar is written as a JSON string holding its JSON text
struct as_string {
    using tag = detail::as_string_tag;
    static constexpr std::string_view to_string() {
        return "as_string";
    }
};

// Field never takes part in encoding or decoding
struct skip {
    using tag = detail::skip_tag;
    static constexpr std::string_view to_string() {
        return "skip";
    }
};

// Anonymous member: fields of an embedded aggregate are promoted into the parent object
struct embedded {
    using tag = detail::embedded_tag;
    static constexpr std::string_view to_string() {
        return "embedded";
    }
};

// Member that is not externally visible. Ignored, unless it embeds an aggregate
struct unexported {
    using tag = detail::unexported_tag;
    static constexpr std::string_view to_string() {
        return "unexported";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};

using no_options = field_options<OptionsPack<>>;


template<class Field>
struct annotation_meta;

template<class T>
struct annotation_meta {
    using value_t = T;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ OrderedJson ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ OrderedJson ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;
    using value_t = T;
    using options      = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta fields: the member itself is passed, options come from the Field entry
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using Meta = annotation_meta_getter<Field>;
    using value_t = typename Meta::value_t;
    using options = typename Meta::options;
};

} // namespace detail


} //namespace options


} // namespace OrderedJson
