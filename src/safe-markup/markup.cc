#include "markup.hh"

#include <cstring>

#include <clean-core/assert.hh>
#include <clean-core/format.hh>

#include <safe-markup/detail/text.hh>
#include <safe-markup/entities.hh>
#include <safe-markup/format_error.hh>
#include <safe-markup/striptags.hh>

using namespace safe::detail;

namespace
{
/// byte size of the code point starting at i (a lead byte plus its continuation bytes)
size_t code_point_size(cc::string_view s, size_t i)
{
    auto j = i + 1;
    while (j < s.size() && (uint8_t(s[j]) & 0xC0) == 0x80)
        ++j;
    return j - i;
}

cc::vector<cc::string_view> code_points(cc::string_view s)
{
    cc::vector<cc::string_view> r;
    for (size_t i = 0; i < s.size();)
    {
        auto const n = code_point_size(s, i);
        r.push_back(subview(s, i, i + n));
        i += n;
    }
    return r;
}

/// moves i back to the lead byte of the code point containing it
size_t code_point_start(cc::string_view s, size_t i)
{
    while (i > 0 && i < s.size() && (uint8_t(s[i]) & 0xC0) == 0x80)
        --i;
    return i;
}

bool contains_code_point(cc::vector<cc::string_view> const& set, cc::string_view cp)
{
    for (auto const& c : set)
        if (c == cp)
            return true;
    return false;
}

/// removes whole code points contained in set from the ends of s
cc::string_view trim_code_points(cc::string_view s, bool left, bool right, cc::string_view set)
{
    auto const cps = code_points(set);
    size_t start = 0;
    auto end = s.size();
    if (left)
        while (start < end)
        {
            auto const n = code_point_size(s, start);
            if (!contains_code_point(cps, subview(s, start, start + n)))
                break;
            start += n;
        }
    if (right)
        while (end > start)
        {
            auto cp_start = code_point_start(s, end - 1);
            if (cp_start < start)
                cp_start = start;
            if (!contains_code_point(cps, subview(s, cp_start, end)))
                break;
            end = cp_start;
        }
    return subview(s, start, end);
}

template <class Pred>
cc::string_view trim(cc::string_view s, bool left, bool right, Pred&& is_trimmed)
{
    size_t start = 0;
    auto end = s.size();
    if (left)
        while (start < end && is_trimmed(s[start]))
            ++start;
    if (right)
        while (end > start && is_trimmed(s[end - 1]))
            --end;
    return subview(s, start, end);
}

template <class T>
cc::vector<T> reversed(cc::vector<T> v)
{
    cc::vector<T> r;
    r.reserve(v.size());
    for (auto i = v.size(); i > 0; --i)
        r.push_back(cc::move(v[i - 1]));
    return r;
}
}

cc::string safe::detail::owned_html(cc::string_view s) { return cc::string(s); }
cc::string safe::detail::owned_html(markup const& m) { return m.str(); }

void safe::detail::append_escaped(cc::string& out, value_ref const& v, escape_policy const& policy)
{
    switch (v.kind)
    {
    case value_kind::markup:
        out += v.markup_value->view();
        break;
    case value_kind::fragment:
    case value_kind::format_fragment:
        out += v.render(v.object);
        break;
    case value_kind::text:
        policy.escape_to(out, v.text);
        break;
    default:
        policy.escape_to(out, to_text(v));
        break;
    }
}

safe::markup safe::markup::escape(value_ref v)
{
    if (v.kind == value_kind::markup)
        return *v.markup_value;

    markup r;
    r.append(v);
    return r;
}

safe::markup safe::markup::html_format(cc::string_view spec) const
{
    if (!spec.empty())
        throw format_error(0, cc::format("markup does not support the format specification '{}'", spec));
    return *this;
}

void safe::markup::append(value_ref const& v) { append_escaped(_text, v, *_policy); }

cc::string safe::markup::escaped(value_ref const& v) const
{
    cc::string r;
    append_escaped(r, v, *_policy);
    return r;
}

safe::markup safe::markup::join(std::initializer_list<value_ref> items) const
{
    markup r(cc::string(), *_policy);
    auto first = true;
    for (auto const& v : items)
    {
        if (!first)
            r._text += _text;
        first = false;
        r.append(v);
    }
    return r;
}

cc::vector<safe::markup> safe::markup::split(cc::string_view sep, int64_t maxsplit) const
{
    CC_ASSERT(!sep.empty() && "empty separator");

    auto const v = view();
    cc::vector<markup> r;
    size_t start = 0;
    while (maxsplit != 0)
    {
        auto const p = detail::find(v, sep, start);
        if (p == npos)
            break;
        r.push_back(derived(cc::string(subview(v, start, p))));
        start = p + sep.size();
        if (maxsplit > 0)
            --maxsplit;
    }
    r.push_back(derived(cc::string(subview(v, start))));
    return r;
}

cc::vector<safe::markup> safe::markup::split(int64_t maxsplit) const
{
    auto const v = view();
    cc::vector<markup> r;
    size_t i = 0;
    while (true)
    {
        while (i < v.size() && is_whitespace(v[i]))
            ++i;
        if (i == v.size())
            break;

        // the remainder keeps its trailing whitespace
        if (maxsplit == 0)
        {
            r.push_back(derived(cc::string(subview(v, i))));
            break;
        }

        auto j = i;
        while (j < v.size() && !is_whitespace(v[j]))
            ++j;
        r.push_back(derived(cc::string(subview(v, i, j))));
        i = j;
        if (maxsplit > 0)
            --maxsplit;
    }
    return r;
}

cc::vector<safe::markup> safe::markup::rsplit(cc::string_view sep, int64_t maxsplit) const
{
    CC_ASSERT(!sep.empty() && "empty separator");

    auto const v = view();
    cc::vector<markup> r;
    auto end = v.size();
    while (maxsplit != 0)
    {
        auto const p = detail::rfind(v, sep, end);
        if (p == npos)
            break;
        r.push_back(derived(cc::string(subview(v, p + sep.size(), end))));
        end = p;
        if (maxsplit > 0)
            --maxsplit;
    }
    r.push_back(derived(cc::string(subview(v, 0, end))));
    return reversed(cc::move(r));
}

cc::vector<safe::markup> safe::markup::rsplit(int64_t maxsplit) const
{
    auto const v = view();
    cc::vector<markup> r;
    auto end = v.size();
    while (true)
    {
        while (end > 0 && is_whitespace(v[end - 1]))
            --end;
        if (end == 0)
            break;

        if (maxsplit == 0)
        {
            r.push_back(derived(cc::string(subview(v, 0, end))));
            break;
        }

        auto start = end;
        while (start > 0 && !is_whitespace(v[start - 1]))
            --start;
        r.push_back(derived(cc::string(subview(v, start, end))));
        end = start;
        if (maxsplit > 0)
            --maxsplit;
    }
    return reversed(cc::move(r));
}

cc::vector<safe::markup> safe::markup::splitlines(bool keepends) const
{
    auto const v = view();
    cc::vector<markup> r;
    size_t i = 0;
    while (i < v.size())
    {
        auto j = i;
        while (j < v.size() && !is_line_break(v[j]))
            ++j;

        auto const line_end = j;
        if (j < v.size())
        {
            if (v[j] == '\r' && j + 1 < v.size() && v[j + 1] == '\n')
                j += 2;
            else
                ++j;
        }

        r.push_back(derived(cc::string(subview(v, i, keepends ? j : line_end))));
        i = j;
    }
    return r;
}

safe::markup_partition safe::markup::partition(value_ref sep) const
{
    auto s = escaped(sep);
    CC_ASSERT(!s.empty() && "empty separator");

    auto const v = view();
    auto const p = detail::find(v, s);
    if (p == npos)
        return {*this, derived({}), derived({})};

    return {derived(cc::string(subview(v, 0, p))), derived(s), derived(cc::string(subview(v, p + s.size())))};
}

safe::markup_partition safe::markup::rpartition(value_ref sep) const
{
    auto s = escaped(sep);
    CC_ASSERT(!s.empty() && "empty separator");

    auto const v = view();
    auto const p = detail::rfind(v, s, v.size());
    if (p == npos)
        return {derived({}), derived({}), *this};

    return {derived(cc::string(subview(v, 0, p))), derived(s), derived(cc::string(subview(v, p + s.size())))};
}

safe::markup safe::markup::upper() const
{
    auto r = _text;
    for (auto& c : r)
        c = to_ascii_upper(c);
    return derived(cc::move(r));
}

safe::markup safe::markup::lower() const
{
    auto r = _text;
    for (auto& c : r)
        c = to_ascii_lower(c);
    return derived(cc::move(r));
}

safe::markup safe::markup::title() const
{
    auto r = _text;
    auto prev_cased = false;
    for (auto& c : r)
    {
        if (is_ascii_alpha(c))
        {
            c = prev_cased ? to_ascii_lower(c) : to_ascii_upper(c);
            prev_cased = true;
        }
        else
            prev_cased = false;
    }
    return derived(cc::move(r));
}

safe::markup safe::markup::capitalize() const
{
    auto r = _text;
    for (size_t i = 0; i < r.size(); ++i)
        r[i] = i == 0 ? to_ascii_upper(r[i]) : to_ascii_lower(r[i]);
    return derived(cc::move(r));
}

safe::markup safe::markup::swapcase() const
{
    auto r = _text;
    for (auto& c : r)
        c = is_ascii_upper(c) ? to_ascii_lower(c) : to_ascii_upper(c);
    return derived(cc::move(r));
}

safe::markup safe::markup::strip() const { return derived(cc::string(trim(view(), true, true, is_whitespace))); }
safe::markup safe::markup::lstrip() const { return derived(cc::string(trim(view(), true, false, is_whitespace))); }
safe::markup safe::markup::rstrip() const { return derived(cc::string(trim(view(), false, true, is_whitespace))); }

safe::markup safe::markup::strip(value_ref chars) const { return derived(cc::string(trim_code_points(view(), true, true, escaped(chars)))); }
safe::markup safe::markup::lstrip(value_ref chars) const { return derived(cc::string(trim_code_points(view(), true, false, escaped(chars)))); }
safe::markup safe::markup::rstrip(value_ref chars) const { return derived(cc::string(trim_code_points(view(), false, true, escaped(chars)))); }

safe::markup safe::markup::center(int64_t width, value_ref fill) const
{
    auto const len = int64_t(utf8_length(view()));
    if (width <= len)
        return *this;

    auto const f = escaped(fill);
    auto const marg = width - len;
    auto const left = marg / 2 + (marg & width & 1);

    cc::string r;
    append_repeated(r, f, size_t(left));
    r += _text;
    append_repeated(r, f, size_t(marg - left));
    return derived(cc::move(r));
}

safe::markup safe::markup::ljust(int64_t width, value_ref fill) const
{
    auto const len = int64_t(utf8_length(view()));
    if (width <= len)
        return *this;

    auto r = _text;
    append_repeated(r, escaped(fill), size_t(width - len));
    return derived(cc::move(r));
}

safe::markup safe::markup::rjust(int64_t width, value_ref fill) const
{
    auto const len = int64_t(utf8_length(view()));
    if (width <= len)
        return *this;

    cc::string r;
    append_repeated(r, escaped(fill), size_t(width - len));
    r += _text;
    return derived(cc::move(r));
}

safe::markup safe::markup::zfill(int64_t width) const
{
    auto const len = int64_t(utf8_length(view()));
    if (width <= len)
        return *this;

    auto const v = view();
    auto const has_sign = !v.empty() && (v[0] == '+' || v[0] == '-');

    cc::string r;
    if (has_sign)
        r += v[0];
    append_repeated(r, "0", size_t(width - len));
    r += has_sign ? subview(v, 1) : v;
    return derived(cc::move(r));
}

safe::markup safe::markup::expandtabs(int64_t tabsize) const
{
    cc::string r;
    r.reserve(_text.size());
    int64_t column = 0;
    for (auto c : _text)
    {
        if (c == '\t')
        {
            if (tabsize > 0)
            {
                auto const spaces = tabsize - column % tabsize;
                append_repeated(r, " ", size_t(spaces));
                column += spaces;
            }
        }
        else if (c == '\n' || c == '\r')
        {
            r += c;
            column = 0;
        }
        else
        {
            r += c;
            if ((uint8_t(c) & 0xC0) != 0x80)
                ++column;
        }
    }
    return derived(cc::move(r));
}

safe::markup safe::markup::replace(value_ref old_value, value_ref new_value, int64_t count) const
{
    auto const o = escaped(old_value);
    auto const n = escaped(new_value);
    auto const v = view();

    cc::string r;
    int64_t done = 0;

    if (o.empty())
    {
        size_t i = 0;
        while (true)
        {
            if (count >= 0 && done >= count)
            {
                r += subview(v, i);
                break;
            }
            r += n;
            ++done;
            if (i == v.size())
                break;
            auto const cp = code_point_size(v, i);
            r += subview(v, i, i + cp);
            i += cp;
        }
        return derived(cc::move(r));
    }

    size_t start = 0;
    while (count < 0 || done < count)
    {
        auto const p = detail::find(v, o, start);
        if (p == npos)
            break;
        r += subview(v, start, p);
        r += n;
        start = p + o.size();
        ++done;
    }
    r += subview(v, start);
    return derived(cc::move(r));
}

safe::markup safe::markup::translate(cc::string_view from, cc::string_view to, cc::string_view remove) const
{
    auto const from_cps = code_points(from);
    auto const to_cps = code_points(to);
    auto const remove_cps = code_points(remove);
    CC_ASSERT(from_cps.size() == to_cps.size() && "translate requires from and to of equal length");

    auto const v = view();
    cc::string r;
    r.reserve(v.size());
    for (size_t i = 0; i < v.size();)
    {
        auto const n = code_point_size(v, i);
        auto const cp = subview(v, i, i + n);
        i += n;

        auto removed = false;
        for (auto const& rc : remove_cps)
            if (rc == cp)
                removed = true;
        if (removed)
            continue;

        auto mapped = false;
        for (size_t k = 0; k < from_cps.size() && !mapped; ++k)
            if (from_cps[k] == cp)
            {
                _policy->escape_to(r, to_cps[k]);
                mapped = true;
            }
        if (!mapped)
            r += cp;
    }
    return derived(cc::move(r));
}

safe::markup safe::markup::removeprefix(value_ref prefix) const
{
    auto const p = escaped(prefix);
    if (!detail::starts_with(view(), p))
        return *this;
    return derived(cc::string(subview(view(), p.size())));
}

safe::markup safe::markup::removesuffix(value_ref suffix) const
{
    auto const s = escaped(suffix);
    if (!detail::ends_with(view(), s))
        return *this;
    return derived(cc::string(subview(view(), 0, _text.size() - s.size())));
}

safe::markup safe::markup::at(int64_t i) const
{
    auto const n = int64_t(_text.size());
    if (i < 0)
        i += n;
    CC_ASSERT(0 <= i && i < n && "index out of range");
    auto const start = code_point_start(view(), size_t(i));
    return derived(cc::string(subview(view(), start, start + code_point_size(view(), start))));
}

safe::markup safe::markup::slice(int64_t start, int64_t end) const
{
    auto const n = int64_t(_text.size());
    auto const clamp = [n](int64_t i) {
        if (i < 0)
            i += n;
        return i < 0 ? 0 : (i > n ? n : i);
    };
    start = clamp(start);
    end = clamp(end);
    if (end < start)
        end = start;
    auto const from = code_point_start(view(), size_t(start));
    auto const to = code_point_start(view(), size_t(end));
    return derived(cc::string(subview(view(), from, to)));
}

int64_t safe::markup::find(cc::string_view needle) const
{
    auto const p = detail::find(view(), needle);
    return p == npos ? -1 : int64_t(p);
}

int64_t safe::markup::rfind(cc::string_view needle) const
{
    auto const p = detail::rfind(view(), needle, _text.size());
    return p == npos ? -1 : int64_t(p);
}

size_t safe::markup::count(cc::string_view needle) const { return detail::count(view(), needle); }
bool safe::markup::starts_with(cc::string_view prefix) const { return detail::starts_with(view(), prefix); }
bool safe::markup::ends_with(cc::string_view suffix) const { return detail::ends_with(view(), suffix); }
bool safe::markup::contains(cc::string_view needle) const { return detail::find(view(), needle) != npos; }

cc::string safe::markup::unescape() const { return safe::unescape(view()); }

cc::string safe::markup::striptags() const { return safe::striptags(view()); }

safe::markup safe::operator+(markup const& a, markup const& b)
{
    markup r = a;
    r.append(value_ref(b));
    return r;
}

safe::markup safe::operator*(markup const& m, int64_t n)
{
    cc::string r;
    if (n > 0)
        append_repeated(r, m.view(), size_t(n));
    return markup(cc::move(r), m.policy());
}

safe::markup safe::operator*(int64_t n, markup const& m) { return m * n; }

bool safe::operator<(markup const& a, markup const& b)
{
    auto const n = a.size() < b.size() ? a.size() : b.size();
    auto const c = std::memcmp(a.c_str(), b.c_str(), n);
    if (c != 0)
        return c < 0;
    return a.size() < b.size();
}
