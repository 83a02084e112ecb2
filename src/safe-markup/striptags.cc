#include "striptags.hh"

#include <safe-markup/detail/text.hh>
#include <safe-markup/entities.hh>

namespace
{
/// removes all [open ... close] ranges, earliest open first, earliest close after it
/// removing a range can join text into a new opener, so the search resumes just before the join
cc::string remove_ranges(cc::string s, cc::string_view open, cc::string_view close)
{
    size_t from = 0;
    while (true)
    {
        auto const start = safe::detail::find(s, open, from);
        if (start == safe::detail::npos)
            break;

        auto const end = safe::detail::find(s, close, start + 1);
        if (end == safe::detail::npos)
            break;

        cc::string joined;
        joined.reserve(s.size() - (end + close.size() - start));
        joined += safe::detail::subview(s, 0, start);
        joined += safe::detail::subview(s, end + close.size());
        s = cc::move(joined);

        from = start >= open.size() - 1 ? start - (open.size() - 1) : 0;
    }
    return s;
}

cc::string collapse_whitespace(cc::string_view s)
{
    cc::string r;
    r.reserve(s.size());

    auto pending_space = false;
    for (auto c : s)
    {
        if (safe::detail::is_whitespace(c))
        {
            pending_space = !r.empty();
            continue;
        }
        if (pending_space)
        {
            r += ' ';
            pending_space = false;
        }
        r += c;
    }
    return r;
}
}

cc::string safe::striptags(cc::string_view s)
{
    auto v = remove_ranges(cc::string(s), "<!--", "-->");
    v = remove_ranges(cc::move(v), "<", ">");
    return unescape(collapse_whitespace(v));
}
