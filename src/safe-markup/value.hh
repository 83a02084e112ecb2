#pragma once

#include <cstdint>
#include <type_traits>
#include <utility>

#include <clean-core/always_false.hh>
#include <clean-core/map.hh>
#include <clean-core/optional.hh>
#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

/**
 * Rendering protocol
 *
 * A type is a *trusted fragment* if it has a member
 *
 *     T html() const;   // T: cc::string, cc::string_view, char const* or safe::markup
 *
 * Its result is embedded verbatim (never escaped). If it additionally has
 *
 *     T html_format(cc::string_view spec) const;
 *
 * it is *format-aware*: markup::format calls html_format with the field's format specification.
 * An implementation must throw (e.g. safe::format_error) for specifications it does not support.
 *
 * Exceptions thrown by html() and html_format() are never caught by this library.
 */

namespace safe
{
struct markup;

/// runtime-polymorphic trusted fragment
struct renderable
{
    virtual ~renderable() = default;

    virtual cc::string html() const = 0;

    /// the default implementation only supports an empty spec
    virtual cc::string html_format(cc::string_view spec) const;
};

enum class value_kind
{
    none,
    boolean,
    signed_integer,
    unsigned_integer,
    floating,
    text,
    markup,
    fragment,
    format_fragment,
};

namespace detail
{
template <class T, class = void>
struct has_html_t : std::false_type
{
};
template <class T>
struct has_html_t<T, std::void_t<decltype(std::declval<T const&>().html())>> : std::true_type
{
};

template <class T, class = void>
struct has_html_format_t : std::false_type
{
};
template <class T>
struct has_html_format_t<T, std::void_t<decltype(std::declval<T const&>().html_format(cc::string_view()))>> : std::true_type
{
};

template <class T, class = void>
struct is_optional_t : std::false_type
{
};
template <class T>
struct is_optional_t<cc::optional<T>> : std::true_type
{
};

template <class T, class = void>
struct is_map_t : std::false_type
{
};
template <class A, class B, class HashT, class EqualT>
struct is_map_t<cc::map<A, B, HashT, EqualT>> : std::true_type
{
};

template <class T>
constexpr bool is_char_pointer = std::is_same_v<T, char const*> || std::is_same_v<T, char*>;

/// text-like, markup, or trusted fragment (the operands markup can be concatenated with)
template <class T>
constexpr bool is_markup_operand
    = std::is_same_v<T, markup> || has_html_t<T>::value || std::is_same_v<T, char> || std::is_constructible_v<cc::string_view, T const&>;

// implemented in markup.cc
cc::string owned_html(cc::string_view s);
cc::string owned_html(markup const& m);

template <class T>
cc::string render_html(void const* obj)
{
    return owned_html(static_cast<T const*>(obj)->html());
}
template <class T>
cc::string render_html_format(void const* obj, cc::string_view spec)
{
    return owned_html(static_cast<T const*>(obj)->html_format(spec));
}
}

/// a non-owning, type-erased view on a value that is about to be escaped, formatted, or interpolated
/// NOTE: - references the original object, which must outlive the value_ref
///       - construction decides at compile time whether a value is plain data or a trusted fragment
struct value_ref
{
    value_kind kind = value_kind::none;

    bool boolean = false;
    int64_t signed_integer = 0;
    uint64_t unsigned_integer = 0;
    double floating = 0;
    cc::string_view text;                    ///< only valid for text
    markup const* markup_value = nullptr;    ///< only valid for markup
    void const* object = nullptr;            ///< only valid for fragments
    cc::string (*render)(void const*) = nullptr;
    cc::string (*render_format)(void const*, cc::string_view) = nullptr;

    value_ref() = default;

    template <class T>
    value_ref(T const& v)
    {
        if constexpr (std::is_same_v<T, value_ref>)
        {
            *this = v;
        }
        else if constexpr (std::is_same_v<T, markup>)
        {
            kind = value_kind::markup;
            markup_value = &v;
        }
        else if constexpr (detail::has_html_format_t<T>::value)
        {
            static_assert(detail::has_html_t<T>::value, "types with html_format() must also provide html()");
            kind = value_kind::format_fragment;
            object = &v;
            render = &detail::render_html<T>;
            render_format = &detail::render_html_format<T>;
        }
        else if constexpr (detail::has_html_t<T>::value)
        {
            kind = value_kind::fragment;
            object = &v;
            render = &detail::render_html<T>;
        }
        else if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, cc::nullopt_t>)
        {
            kind = value_kind::none;
        }
        else if constexpr (detail::is_optional_t<T>::value)
        {
            if (v.has_value())
                *this = value_ref(v.value());
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            kind = value_kind::boolean;
            boolean = v;
        }
        else if constexpr (std::is_same_v<T, char>)
        {
            kind = value_kind::text;
            text = cc::string_view(&v, 1);
        }
        else if constexpr (std::is_enum_v<T>)
        {
            using int_t = std::underlying_type_t<T>;
            if constexpr (std::is_signed_v<int_t>)
            {
                kind = value_kind::signed_integer;
                signed_integer = int64_t(v);
            }
            else
            {
                kind = value_kind::unsigned_integer;
                unsigned_integer = uint64_t(v);
            }
        }
        else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
        {
            kind = value_kind::signed_integer;
            signed_integer = v;
        }
        else if constexpr (std::is_integral_v<T>)
        {
            kind = value_kind::unsigned_integer;
            unsigned_integer = v;
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            kind = value_kind::floating;
            floating = double(v);
        }
        else if constexpr (detail::is_char_pointer<T>)
        {
            if (v != nullptr)
            {
                kind = value_kind::text;
                text = cc::string_view(v);
            }
        }
        else if constexpr (std::is_constructible_v<cc::string_view, T const&>)
        {
            kind = value_kind::text;
            text = cc::string_view(v);
        }
        else
            static_assert(cc::always_false<T>, "type is neither text, a number, optional, nor provides html()");
    }

    bool is_none() const { return kind == value_kind::none; }
    bool is_trusted() const { return kind == value_kind::markup || kind == value_kind::fragment || kind == value_kind::format_fragment; }
    bool is_number() const { return kind >= value_kind::boolean && kind <= value_kind::floating; }
};

/// a positional (empty name) or named argument for markup::format
struct format_arg
{
    cc::string_view name;
    value_ref value;
};

/// a named format argument, see safe::arg
template <class T>
struct named_arg
{
    cc::string_view name;
    T const& value;
};

/// names a format argument: markup("{user}").format(safe::arg("user", name))
template <class T>
named_arg<T> arg(cc::string_view name, T const& value)
{
    return {name, value};
}

namespace detail
{
template <class T>
format_arg make_format_arg(T const& v)
{
    return {{}, value_ref(v)};
}
template <class T>
format_arg make_format_arg(named_arg<T> const& v)
{
    return {v.name, value_ref(v.value)};
}

/// natural text representation of a value (without escaping)
/// text as-is, True/False, decimal integers, shortest round-trip floats, None
/// trusted values render their html
cc::string to_text(value_ref const& v);

/// repr-like representation of a value (without escaping): text is quoted
cc::string to_repr(value_ref const& v);

/// shortest representation that round-trips, e.g. 3.14, 1e+20, inf
cc::string repr_double(double v);
}
}
