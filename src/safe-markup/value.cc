#include "value.hh"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include <clean-core/assert.hh>
#include <clean-core/format.hh>

#include <safe-markup/detail/text.hh>
#include <safe-markup/format_error.hh>
#include <safe-markup/markup.hh>

namespace
{
cc::string decimal(bool negative, uint64_t magnitude)
{
    char buf[24];
    size_t n = 0;
    do
    {
        buf[n++] = char('0' + magnitude % 10);
        magnitude /= 10;
    } while (magnitude != 0);

    cc::string r;
    r.reserve(n + 1);
    if (negative)
        r += '-';
    while (n > 0)
        r += buf[--n];
    return r;
}

/// quotes text like a string literal
/// uses single quotes unless the text contains ' but no "
cc::string quoted(cc::string_view s)
{
    auto const has_single = safe::detail::find(s, "'") != safe::detail::npos;
    auto const has_double = safe::detail::find(s, "\"") != safe::detail::npos;
    auto const quote = has_single && !has_double ? '"' : '\'';

    cc::string r;
    r.reserve(s.size() + 2);
    r += quote;
    for (auto c : s)
    {
        switch (c)
        {
        case '\\':
            r += "\\\\";
            break;
        case '\n':
            r += "\\n";
            break;
        case '\r':
            r += "\\r";
            break;
        case '\t':
            r += "\\t";
            break;
        default:
            if (c == quote)
            {
                r += '\\';
                r += c;
            }
            else if ((c >= 0 && c < 0x20) || c == 0x7f)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", unsigned(uint8_t(c)));
                r += buf;
            }
            else
                r += c;
            break;
        }
    }
    r += quote;
    return r;
}
}

cc::string safe::renderable::html_format(cc::string_view spec) const
{
    if (!spec.empty())
        throw format_error(0, cc::format("unsupported format specification '{}' for a renderable", spec));
    return html();
}

cc::string safe::detail::to_text(value_ref const& v)
{
    switch (v.kind)
    {
    case value_kind::none:
        return "None";
    case value_kind::boolean:
        return v.boolean ? "True" : "False";
    case value_kind::signed_integer:
        return decimal(v.signed_integer < 0, v.signed_integer < 0 ? uint64_t(0) - uint64_t(v.signed_integer) : uint64_t(v.signed_integer));
    case value_kind::unsigned_integer:
        return decimal(false, v.unsigned_integer);
    case value_kind::floating:
        return repr_double(v.floating);
    case value_kind::text:
        return cc::string(v.text);
    case value_kind::markup:
        return v.markup_value->str();
    case value_kind::fragment:
    case value_kind::format_fragment:
        return v.render(v.object);
    }
    CC_UNREACHABLE("unknown value kind");
}

cc::string safe::detail::to_repr(value_ref const& v)
{
    switch (v.kind)
    {
    case value_kind::text:
        return quoted(v.text);
    case value_kind::markup:
    {
        cc::string r = "markup(";
        r += quoted(v.markup_value->view());
        r += ')';
        return r;
    }
    case value_kind::fragment:
    case value_kind::format_fragment:
        return quoted(v.render(v.object));
    default:
        return to_text(v);
    }
}

cc::string safe::detail::repr_double(double v)
{
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v < 0 ? "-inf" : "inf";

    // shortest precision that round-trips
    char buf[40];
    for (auto p = 1; p <= 17; ++p)
    {
        std::snprintf(buf, sizeof(buf), "%.*e", p - 1, v);
        if (std::strtod(buf, nullptr) == v)
            break;
    }

    // buf is [-]d[.ddd]e(+|-)xx
    cc::string_view s = buf;
    auto const negative = s[0] == '-';
    if (negative)
        s = subview(s, 1);

    auto const e = find(s, "e");
    cc::string digits;
    for (auto c : subview(s, 0, e))
        if (c != '.')
            digits += c;
    while (digits.size() > 1 && digits[digits.size() - 1] == '0')
        digits.pop_back();
    auto const exp = std::atoi(s.data() + e + 1);

    cc::string r;
    if (negative)
        r += '-';

    if (exp >= -4 && exp < 16)
    {
        if (exp >= 0)
        {
            auto const int_size = size_t(exp) + 1;
            if (digits.size() <= int_size)
            {
                r += digits;
                append_repeated(r, "0", int_size - digits.size());
                r += ".0";
            }
            else
            {
                r += subview(digits, 0, int_size);
                r += '.';
                r += subview(digits, int_size);
            }
        }
        else
        {
            r += "0.";
            append_repeated(r, "0", size_t(-exp - 1));
            r += digits;
        }
    }
    else
    {
        r += digits[0];
        if (digits.size() > 1)
        {
            r += '.';
            r += subview(digits, 1);
        }
        r += 'e';
        r += exp < 0 ? '-' : '+';
        auto const abs_exp = exp < 0 ? -exp : exp;
        if (abs_exp < 10)
            r += '0';
        r += decimal(false, uint64_t(abs_exp));
    }
    return r;
}
