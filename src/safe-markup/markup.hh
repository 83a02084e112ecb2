#pragma once

#include <cstdint>
#include <initializer_list>
#include <type_traits>

#include <clean-core/span.hh>
#include <clean-core/string.hh>
#include <clean-core/string_view.hh>
#include <clean-core/vector.hh>

#include <safe-markup/detail/mapping.hh>
#include <safe-markup/errors.hh>
#include <safe-markup/escape.hh>
#include <safe-markup/value.hh>

/**
 * safe::markup is text that is known to be safe to embed verbatim in HTML or XML
 *
 * Usage:
 *
 *   auto m = safe::escape(user_name);                  // "<b>" -> "&lt;b&gt;"
 *   auto p = safe::markup("<p>{}</p>").format(user_name);
 *   auto q = safe::markup("<em>") + user_name + safe::markup("</em>");
 *
 * Every operation that combines a markup with foreign text escapes that text first
 * (using the policy of the markup, see escape_policy).
 * Markup and types with html() (see value.hh) are combined verbatim.
 *
 * NOTE: - text is UTF-8, indices and sizes are in bytes, widths count code points
 *         (at and slice never split a code point)
 *       - case mapping and whitespace are ASCII-only
 */

namespace safe
{
struct markup_partition;
struct interpolation_args;

struct markup
{
    // construction
public:
    markup() = default;

    /// wraps trusted text without escaping it
    explicit markup(cc::string s) : _text(cc::move(s)) {}
    markup(cc::string s, escape_policy const& policy) : _text(cc::move(s)), _policy(&policy) {}

    /// wraps the text representation of v without escaping it
    /// (numbers become their text, fragments their html())
    template <class T, class = std::enable_if_t<!std::is_same_v<T, markup>>>
    explicit markup(T const& v) : _text(detail::to_text(value_ref(v)))
    {
    }

    /// escapes v with the default policy (markup is returned unchanged)
    [[nodiscard]] static markup escape(value_ref v);

    // access
public:
    cc::string const& str() const { return _text; }
    cc::string_view view() const { return cc::string_view(_text); }
    char const* c_str() const { return _text.c_str(); }
    size_t size() const { return _text.size(); }
    bool empty() const { return _text.empty(); }
    escape_policy const& policy() const { return *_policy; }

    markup const& html() const { return *this; }

    /// markup can only be formatted with an empty specification
    markup html_format(cc::string_view spec) const;

    // concatenation
public:
    template <class T>
    markup& operator+=(T const& v)
    {
        static_assert(detail::is_markup_operand<T>, "only text, markup, and types with html() can be concatenated with markup");
        append(value_ref(v));
        return *this;
    }

    /// escapes v (unless trusted) and appends it
    void append(value_ref const& v);

    // joining and splitting
public:
    /// escapes all elements and joins them with this markup as separator
    template <class Range>
    [[nodiscard]] markup join(Range const& range) const
    {
        markup r(cc::string(), *_policy);
        auto first = true;
        for (auto const& v : range)
        {
            if (!first)
                r._text += _text;
            first = false;
            r.append(value_ref(v));
        }
        return r;
    }
    [[nodiscard]] markup join(std::initializer_list<value_ref> items) const;

    /// splits at sep (matched verbatim), at most maxsplit times if non-negative
    /// NOTE: sep must not be empty
    [[nodiscard]] cc::vector<markup> split(cc::string_view sep, int64_t maxsplit = -1) const;
    /// splits at whitespace runs, ignoring leading and trailing whitespace
    [[nodiscard]] cc::vector<markup> split(int64_t maxsplit = -1) const;
    /// same as split but splitting from the right
    [[nodiscard]] cc::vector<markup> rsplit(cc::string_view sep, int64_t maxsplit = -1) const;
    [[nodiscard]] cc::vector<markup> rsplit(int64_t maxsplit = -1) const;

    /// splits at \n, \r, \r\n, \v, \f, \x1c, \x1d, \x1e
    [[nodiscard]] cc::vector<markup> splitlines(bool keepends = false) const;

    /// splits at the first (last) occurrence of the escaped sep
    [[nodiscard]] markup_partition partition(value_ref sep) const;
    [[nodiscard]] markup_partition rpartition(value_ref sep) const;

    // case mapping
public:
    [[nodiscard]] markup upper() const;
    [[nodiscard]] markup lower() const;
    [[nodiscard]] markup title() const;
    [[nodiscard]] markup capitalize() const;
    [[nodiscard]] markup swapcase() const;

    // whitespace and padding
public:
    [[nodiscard]] markup strip() const;
    [[nodiscard]] markup lstrip() const;
    [[nodiscard]] markup rstrip() const;

    /// removes all leading/trailing code points contained in the escaped chars
    [[nodiscard]] markup strip(value_ref chars) const;
    [[nodiscard]] markup lstrip(value_ref chars) const;
    [[nodiscard]] markup rstrip(value_ref chars) const;

    /// pads to width code points, each missing code point is filled with the escaped fill
    [[nodiscard]] markup center(int64_t width, value_ref fill = " ") const;
    [[nodiscard]] markup ljust(int64_t width, value_ref fill = " ") const;
    [[nodiscard]] markup rjust(int64_t width, value_ref fill = " ") const;

    /// pads with zeros on the left (after a leading sign)
    [[nodiscard]] markup zfill(int64_t width) const;

    [[nodiscard]] markup expandtabs(int64_t tabsize = 8) const;

    // replacing
public:
    /// replaces the escaped old by the escaped new, at most count times if non-negative
    /// an empty old inserts new before every code point and at the end
    [[nodiscard]] markup replace(value_ref old_value, value_ref new_value, int64_t count = -1) const;

    /// maps the i-th code point of from to the escaped i-th code point of to
    /// and removes all code points contained in remove
    /// NOTE: from and to must contain the same number of code points
    [[nodiscard]] markup translate(cc::string_view from, cc::string_view to, cc::string_view remove = {}) const;

    [[nodiscard]] markup removeprefix(value_ref prefix) const;
    [[nodiscard]] markup removesuffix(value_ref suffix) const;

    // indexing
public:
    /// the code point containing byte i (negative i counts from the end)
    [[nodiscard]] markup at(int64_t i) const;

    /// bytes [start, end), negative indices count from the end, out-of-range indices are clamped
    /// NOTE: an index inside a UTF-8 sequence moves back to the start of that code point,
    ///       e.g. markup("\xc3\xa9x").slice(1) == "\xc3\xa9x" and slice(0, 1) is empty
    [[nodiscard]] markup slice(int64_t start, int64_t end = INT64_MAX) const;

    /// searching (needles are matched verbatim)
    /// find returns -1 if needle is not contained
    int64_t find(cc::string_view needle) const;
    int64_t rfind(cc::string_view needle) const;
    size_t count(cc::string_view needle) const;
    bool starts_with(cc::string_view prefix) const;
    bool ends_with(cc::string_view suffix) const;
    bool contains(cc::string_view needle) const;

    // formatting
public:
    /// replaces {} {0} {name} fields by the escaped arguments, see format.hh
    /// e.g. markup("<em>{}</em>").format("<x>") == "<em>&lt;x&gt;</em>"
    ///      markup("{user}").format(safe::arg("user", name))
    template <class... Args>
    [[nodiscard]] markup format(Args const&... args) const
    {
        format_arg const list[sizeof...(Args) + 1] = {detail::make_format_arg(args)..., format_arg{}};
        return vformat(cc::span<format_arg const>(list, sizeof...(Args)));
    }

    [[nodiscard]] markup vformat(cc::span<format_arg const> args, error_handler on_error = default_error_handler) const;

    /// like format, but named fields are looked up in a mapping:
    /// a cc::map with string-like keys or an introspectable struct (see reflector)
    template <class Map>
    [[nodiscard]] markup format_map(Map const& map, error_handler on_error = default_error_handler) const
    {
        cc::vector<format_arg> args;
        detail::collect_named_args(args, map);
        return vformat(cc::span<format_arg const>(args.data(), args.size()), on_error);
    }

    /// printf-style interpolation, see interpolate.hh
    [[nodiscard]] markup interpolate(interpolation_args const& args, error_handler on_error = default_error_handler) const;

    // conversion to plain text
public:
    /// decodes character references, see safe::unescape
    [[nodiscard]] cc::string unescape() const;

    /// removes comments and tags, collapses whitespace and decodes references, see safe::striptags
    [[nodiscard]] cc::string striptags() const;

private:
    markup derived(cc::string s) const { return markup(cc::move(s), *_policy); }
    cc::string escaped(value_ref const& v) const;

    cc::string _text;
    escape_policy const* _policy = &html_policy();
};

/// result of partition and rpartition
struct markup_partition
{
    markup before;
    markup separator;
    markup after;
};

// escaping
/// escapes v: text is escaped, markup is returned unchanged, types with html() are trusted
/// numbers and other values use their natural text representation (e.g. True, 3.14, None)
template <class T>
[[nodiscard]] markup escape(T const& v)
{
    return markup::escape(value_ref(v));
}

/// escapes v with a custom policy
template <class T>
[[nodiscard]] markup escape(T const& v, escape_policy const& policy)
{
    value_ref const ref(v);
    if (ref.kind == value_kind::markup)
        return *ref.markup_value;
    markup r(cc::string(), policy);
    r.append(ref);
    return r;
}

/// like escape, but absent values (cc::nullopt, empty optionals, null C strings) become an empty markup
template <class T>
[[nodiscard]] markup escape_or_empty(T const& v)
{
    value_ref const ref(v);
    if (ref.is_none())
        return {};
    return markup::escape(ref);
}

// concatenation
[[nodiscard]] markup operator+(markup const& a, markup const& b);

template <class T>
[[nodiscard]] markup operator+(markup const& a, T const& b)
{
    static_assert(detail::is_markup_operand<T>, "only text, markup, and types with html() can be concatenated with markup");
    markup r = a;
    r.append(value_ref(b));
    return r;
}

template <class T>
[[nodiscard]] markup operator+(T const& a, markup const& b)
{
    static_assert(detail::is_markup_operand<T>, "only text, markup, and types with html() can be concatenated with markup");
    markup r(cc::string(), b.policy());
    r.append(value_ref(a));
    r.append(value_ref(b));
    return r;
}

// repetition (n <= 0 yields an empty markup)
[[nodiscard]] markup operator*(markup const& m, int64_t n);
[[nodiscard]] markup operator*(int64_t n, markup const& m);

// comparison (by content)
inline bool operator==(markup const& a, markup const& b) { return a.view() == b.view(); }
inline bool operator!=(markup const& a, markup const& b) { return !(a == b); }
inline bool operator==(markup const& a, cc::string_view b) { return a.view() == b; }
inline bool operator!=(markup const& a, cc::string_view b) { return !(a == b); }
inline bool operator==(cc::string_view a, markup const& b) { return a == b.view(); }
inline bool operator!=(cc::string_view a, markup const& b) { return !(a == b); }
bool operator<(markup const& a, markup const& b);

inline cc::string to_string(markup const& m) { return m.str(); }

namespace detail
{
/// appends v to out: trusted values verbatim, everything else escaped with policy
void append_escaped(cc::string& out, value_ref const& v, escape_policy const& policy);
}
}
