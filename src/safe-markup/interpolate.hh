#pragma once

#include <cstdint>

#include <clean-core/string.hh>
#include <clean-core/string_view.hh>
#include <clean-core/vector.hh>

#include <safe-markup/detail/mapping.hh>
#include <safe-markup/errors.hh>
#include <safe-markup/escape.hh>
#include <safe-markup/markup.hh>
#include <safe-markup/value.hh>

/**
 * printf-style interpolation
 *
 *   safe::markup("<em>%s</em>") % name
 *   safe::markup("%s: %05.1f") % safe::args(label, value)
 *   safe::markup("%(user)s") % settings   // settings: cc::map<cc::string, T> or introspectable
 *
 * Syntax: %[(key)][flags][width][.precision][length]code
 *   flags:     - (left align), + (sign), ' ' (space for positive), # (alternate form), 0 (zero padding)
 *   width:     digits or * (taken from the next argument)
 *   precision: digits or * (taken from the next argument)
 *   length:    h, l, L are accepted and ignored (with a warning)
 *   codes:     s (text), r (quoted representation), a (ASCII-only representation),
 *              d i u (decimal), o x X (octal, hex), e E f F g G (floating point), c (character), %% (literal %)
 *
 * Text codes escape the value (trusted values are embedded verbatim by %s),
 * numeric codes read the original value (%i of 3.14 is 3, %d of text is an error).
 *
 * NOTE: - precision truncates text before escaping, it is an error for trusted values
 *       - a mapping can only be used with %(key) codes
 */

namespace safe
{
/// the arguments of one interpolation
/// NOTE: references the arguments, only use within the expression that creates it
struct interpolation_args
{
    cc::vector<value_ref> positional;
    cc::vector<format_arg> named;
    bool is_mapping = false;
};

/// multiple positional arguments: markup("%s and %s") % safe::args(a, b)
template <class... Args>
interpolation_args args(Args const&... values)
{
    interpolation_args r;
    r.positional.reserve(sizeof...(Args));
    (r.positional.push_back(value_ref(values)), ...);
    return r;
}

[[nodiscard]] markup operator%(markup const& m, interpolation_args const& a);

/// a single positional argument or a mapping
template <class T>
[[nodiscard]] markup operator%(markup const& m, T const& v)
{
    interpolation_args a;
    if constexpr (detail::is_mapping<T>)
    {
        a.is_mapping = true;
        detail::collect_named_args(a.named, v);
    }
    else
        a.positional.push_back(value_ref(v));
    return m.interpolate(a);
}

namespace detail
{
/// wraps one interpolation argument
/// escapes only when the value is converted to text, numeric conversions read the original value
struct escape_proxy
{
    value_ref const& value;
    escape_policy const& policy;

    /// escaped text, trusted values verbatim
    /// max_code_points truncates plain text before escaping (-1 for no limit)
    cc::string text(int max_code_points = -1) const;

    /// escaped repr, ascii_only additionally replaces non-ASCII characters by \x, \u, or \U escapes
    cc::string repr(int max_code_points = -1, bool ascii_only = false) const;

    /// returns false if the value is not a number
    /// floating point values are truncated toward zero if allow_floating is true
    bool to_integer(bool& negative, uint64_t& magnitude, bool allow_floating) const;

    /// returns false if the value is not a number
    bool to_floating(double& v) const;
};
}
}
