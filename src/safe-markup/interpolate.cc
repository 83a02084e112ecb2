#include "interpolate.hh"

#include <cmath>
#include <cstdio>

#include <clean-core/format.hh>

#include <safe-markup/detail/format_spec.hh>
#include <safe-markup/detail/text.hh>

namespace
{
cc::string truncated(cc::string s, int max_code_points)
{
    if (max_code_points < 0)
        return s;
    s.resize(safe::detail::utf8_prefix_size(s, size_t(max_code_points)));
    return s;
}

/// replaces non-ASCII code points by \xNN, \uNNNN, or \UNNNNNNNN
cc::string ascii_escaped(cc::string_view s)
{
    cc::string r;
    r.reserve(s.size());
    for (size_t i = 0; i < s.size();)
    {
        if (uint8_t(s[i]) < 0x80)
        {
            r += s[i++];
            continue;
        }

        size_t n = 0;
        auto const cp = safe::detail::decode_utf8(safe::detail::subview(s, i), n);
        char buf[16];
        if (cp < 0)
        {
            // invalid UTF-8: escape the raw byte
            std::snprintf(buf, sizeof(buf), "\\x%02x", unsigned(uint8_t(s[i])));
            n = 1;
        }
        else if (cp < 0x100)
            std::snprintf(buf, sizeof(buf), "\\x%02x", unsigned(cp));
        else if (cp < 0x10000)
            std::snprintf(buf, sizeof(buf), "\\u%04x", unsigned(cp));
        else
            std::snprintf(buf, sizeof(buf), "\\U%08x", unsigned(cp));
        r += buf;
        i += n;
    }
    return r;
}

struct percent_formatter
{
    cc::string_view source;
    safe::interpolation_args const& args;
    safe::escape_policy const& policy;
    safe::error_handler on_error;
    cc::string& out;

    size_t next_arg = 0;

    bool error(cc::string_view pos, cc::string_view message)
    {
        on_error(source, pos, message, safe::severity::error);
        return false;
    }

    static cc::string_view view_of(char const* begin, char const* end) { return cc::string_view(begin, size_t(end - begin)); }

    /// reads the next positional argument as * width or precision
    bool star_argument(cc::string_view pos, int64_t& v)
    {
        if (args.is_mapping || next_arg >= args.positional.size())
            return error(pos, "* requires a positional argument");

        auto const& arg = args.positional[next_arg++];
        bool negative = false;
        uint64_t magnitude = 0;
        if (arg.kind == safe::value_kind::floating || !safe::detail::escape_proxy{arg, policy}.to_integer(negative, magnitude, false))
            return error(pos, "* wants an integer");
        if (magnitude > 1'000'000)
            return error(pos, "width or precision too large");
        v = negative ? -int64_t(magnitude) : int64_t(magnitude);
        return true;
    }

    bool run()
    {
        auto const end = source.end();
        auto run_start = source.begin();
        auto p = source.begin();
        while (p != end)
        {
            if (*p != '%')
            {
                ++p;
                continue;
            }

            out += view_of(run_start, p);
            auto const start = p;
            ++p;

            if (p == end)
                return error(view_of(start, end), "incomplete format");

            if (*p == '%')
            {
                out += '%';
                ++p;
                run_start = p;
                continue;
            }

            // mapping key, parentheses may nest
            cc::string_view key;
            auto has_key = false;
            if (*p == '(')
            {
                auto depth = 1;
                auto q = p + 1;
                while (q != end && depth > 0)
                {
                    if (*q == '(')
                        ++depth;
                    else if (*q == ')')
                        --depth;
                    ++q;
                }
                if (depth > 0)
                    return error(view_of(start, end), "incomplete format key");
                key = view_of(p + 1, q - 1);
                has_key = true;
                p = q;
            }

            safe::detail::format_spec spec;
            auto left = false;
            auto zero = false;
            for (; p != end; ++p)
            {
                if (*p == '-')
                    left = true;
                else if (*p == '+')
                    spec.sign = '+';
                else if (*p == ' ')
                {
                    if (spec.sign != '+')
                        spec.sign = ' ';
                }
                else if (*p == '#')
                    spec.alternate = true;
                else if (*p == '0')
                    zero = true;
                else
                    break;
            }

            if (p != end && *p == '*')
            {
                int64_t w = 0;
                if (!star_argument(view_of(start, p + 1), w))
                    return false;
                if (w < 0)
                {
                    left = true;
                    w = -w;
                }
                spec.width = int(w);
                ++p;
            }
            else
            {
                while (p != end && *p >= '0' && *p <= '9')
                {
                    spec.width = spec.width * 10 + (*p - '0');
                    if (spec.width > 1'000'000)
                        return error(view_of(start, p + 1), "width too large");
                    ++p;
                }
            }

            if (p != end && *p == '.')
            {
                ++p;
                spec.precision = 0;
                if (p != end && *p == '*')
                {
                    int64_t prec = 0;
                    if (!star_argument(view_of(start, p + 1), prec))
                        return false;
                    spec.precision = prec < 0 ? 0 : int(prec);
                    ++p;
                }
                else
                {
                    while (p != end && *p >= '0' && *p <= '9')
                    {
                        spec.precision = spec.precision * 10 + (*p - '0');
                        if (spec.precision > 1'000'000)
                            return error(view_of(start, p + 1), "precision too large");
                        ++p;
                    }
                }
            }

            if (p != end && (*p == 'h' || *p == 'l' || *p == 'L'))
            {
                auto const modifier_start = p;
                while (p != end && (*p == 'h' || *p == 'l' || *p == 'L'))
                    ++p;
                on_error(source, view_of(modifier_start, p), "length modifiers have no effect and are ignored", safe::severity::warning);
            }

            if (p == end)
                return error(view_of(start, end), "incomplete format");

            auto const code = *p++;
            auto const directive = view_of(start, p);

            if (left)
                spec.align = '<';
            else if (zero)
                spec.zero_pad = true;

            safe::value_ref const* value = nullptr;
            if (has_key)
            {
                if (!args.is_mapping)
                    return error(directive, "format requires a mapping");
                for (auto const& a : args.named)
                    if (a.name == key)
                    {
                        value = &a.value;
                        break;
                    }
                if (value == nullptr)
                    return error(directive, cc::format("unknown key '{}'", key));
            }
            else
            {
                if (args.is_mapping)
                    return error(directive, "a mapping argument can only be used with %(key) codes");
                if (next_arg >= args.positional.size())
                    return error(directive, "not enough arguments for format string");
                value = &args.positional[next_arg++];
            }

            if (!convert(directive, code, safe::detail::escape_proxy{*value, policy}, spec))
                return false;

            run_start = p;
        }
        out += view_of(run_start, end);

        if (!args.is_mapping && next_arg < args.positional.size())
            return error({}, "not all arguments converted during string formatting");

        return true;
    }

    /// pads the already escaped text (width counts code points of the escaped text)
    void append_padded(cc::string_view escaped, safe::detail::format_spec const& spec)
    {
        auto s = spec;
        s.zero_pad = false;
        safe::detail::append_aligned(out, {}, escaped, s, '>');
    }

    bool convert(cc::string_view directive, char code, safe::detail::escape_proxy const& proxy, safe::detail::format_spec spec)
    {
        switch (code)
        {
        case 's':
            if (proxy.value.is_trusted() && spec.precision >= 0)
                return error(directive, "precision cannot be used with trusted markup");
            append_padded(proxy.text(spec.precision), spec);
            return true;

        case 'r':
        case 'a':
            append_padded(proxy.repr(spec.precision, code == 'a'), spec);
            return true;

        case 'c':
            return character(directive, proxy, spec);

        case 'd':
        case 'i':
        case 'u':
        case 'o':
        case 'x':
        case 'X':
            return integer(directive, code, proxy, spec);

        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
        {
            double v = 0;
            if (!proxy.to_floating(v))
                return error(directive, cc::format("format code '{}' requires a real number", code));

            spec.type = code;
            cc::string formatted;
            if (auto const msg = safe::detail::format_floating(formatted, v, spec))
                return error(directive, msg);
            policy.escape_to(out, formatted);
            return true;
        }

        default:
            return error(directive, cc::format("unsupported format character '{}'", code));
        }
    }

    bool integer(cc::string_view directive, char code, safe::detail::escape_proxy const& proxy, safe::detail::format_spec const& spec)
    {
        auto const is_decimal = code == 'd' || code == 'i' || code == 'u';

        bool negative = false;
        uint64_t magnitude = 0;
        if (!proxy.to_integer(negative, magnitude, is_decimal))
            return error(directive, cc::format("format code '{}' requires {}", code, is_decimal ? "a real number" : "an integer"));

        // bare digits
        safe::detail::format_spec digit_spec;
        digit_spec.type = is_decimal ? 'd' : code;
        cc::string digits;
        if (auto const msg = safe::detail::format_integer(digits, false, magnitude, digit_spec))
            return error(directive, msg);

        // precision is the minimum number of digits
        if (spec.precision > 0 && size_t(spec.precision) > digits.size())
        {
            cc::string padded;
            safe::detail::append_repeated(padded, "0", size_t(spec.precision) - digits.size());
            padded += digits;
            digits = cc::move(padded);
        }

        cc::string prefix;
        if (negative)
            prefix += '-';
        else if (spec.sign != 0)
            prefix += spec.sign;
        if (spec.alternate && code == 'o')
            prefix += "0o";
        else if (spec.alternate && code == 'x')
            prefix += "0x";
        else if (spec.alternate && code == 'X')
            prefix += "0X";

        auto s = spec;
        if (s.zero_pad)
        {
            s.fill = "0";
            s.align = '=';
        }

        cc::string formatted;
        safe::detail::append_aligned(formatted, prefix, digits, s, '>');
        policy.escape_to(out, formatted);
        return true;
    }

    bool character(cc::string_view directive, safe::detail::escape_proxy const& proxy, safe::detail::format_spec const& spec)
    {
        cc::string ch;
        auto const& v = proxy.value;
        if (v.kind == safe::value_kind::text)
        {
            size_t n = 0;
            if (safe::detail::decode_utf8(v.text, n) < 0 || n != v.text.size())
                return error(directive, "%c requires an integer or a single character");
            ch = cc::string(v.text);
        }
        else
        {
            bool negative = false;
            uint64_t magnitude = 0;
            if (v.kind == safe::value_kind::floating || !proxy.to_integer(negative, magnitude, false))
                return error(directive, "%c requires an integer or a single character");
            if (negative || magnitude > 0x10FFFF || !safe::detail::append_utf8(ch, int64_t(magnitude)))
                return error(directive, "%c argument not in range(0x110000)");
        }

        cc::string escaped;
        policy.escape_to(escaped, ch);
        append_padded(escaped, spec);
        return true;
    }
};
}

cc::string safe::detail::escape_proxy::text(int max_code_points) const
{
    if (value.is_trusted())
        return to_text(value);

    cc::string r;
    if (value.kind == value_kind::text && max_code_points < 0)
        policy.escape_to(r, value.text);
    else
        policy.escape_to(r, truncated(to_text(value), max_code_points));
    return r;
}

cc::string safe::detail::escape_proxy::repr(int max_code_points, bool ascii_only) const
{
    auto s = to_repr(value);
    if (ascii_only)
        s = ascii_escaped(s);

    cc::string r;
    policy.escape_to(r, truncated(cc::move(s), max_code_points));
    return r;
}

bool safe::detail::escape_proxy::to_integer(bool& negative, uint64_t& magnitude, bool allow_floating) const
{
    switch (value.kind)
    {
    case value_kind::boolean:
        negative = false;
        magnitude = value.boolean ? 1 : 0;
        return true;
    case value_kind::signed_integer:
        negative = value.signed_integer < 0;
        magnitude = negative ? uint64_t(0) - uint64_t(value.signed_integer) : uint64_t(value.signed_integer);
        return true;
    case value_kind::unsigned_integer:
        negative = false;
        magnitude = value.unsigned_integer;
        return true;
    case value_kind::floating:
    {
        if (!allow_floating || !std::isfinite(value.floating))
            return false;
        auto const t = std::trunc(value.floating);
        if (std::fabs(t) >= 18446744073709551616.0)
            return false;
        negative = t < 0;
        magnitude = uint64_t(std::fabs(t));
        return true;
    }
    default:
        return false;
    }
}

bool safe::detail::escape_proxy::to_floating(double& v) const
{
    switch (value.kind)
    {
    case value_kind::boolean:
        v = value.boolean ? 1 : 0;
        return true;
    case value_kind::signed_integer:
        v = double(value.signed_integer);
        return true;
    case value_kind::unsigned_integer:
        v = double(value.unsigned_integer);
        return true;
    case value_kind::floating:
        v = value.floating;
        return true;
    default:
        return false;
    }
}

safe::markup safe::markup::interpolate(interpolation_args const& args, error_handler on_error) const
{
    cc::string out;
    if (!percent_formatter{view(), args, *_policy, on_error, out}.run())
        return derived({});
    return derived(cc::move(out));
}

safe::markup safe::operator%(markup const& m, interpolation_args const& a) { return m.interpolate(a); }
