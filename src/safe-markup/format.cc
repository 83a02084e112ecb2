#include "format.hh"

#include <clean-core/assert.hh>
#include <clean-core/format.hh>
#include <clean-core/to_string.hh>

#include <safe-markup/detail/format_spec.hh>
#include <safe-markup/detail/text.hh>
#include <safe-markup/markup.hh>

namespace
{
bool is_digits(cc::string_view s)
{
    if (s.empty())
        return false;
    for (auto c : s)
        if (c < '0' || c > '9')
            return false;
    return true;
}

cc::string_view view_of(char const* begin, char const* end) { return cc::string_view(begin, size_t(end - begin)); }

struct brace_formatter
{
    cc::string_view source;
    cc::span<safe::format_arg const> args;
    safe::escape_policy const& policy;
    safe::error_handler on_error;
    cc::string& out;

    enum class numbering
    {
        unknown,
        automatic,
        manual
    };
    numbering mode = numbering::unknown;
    size_t next_index = 0;

    bool error(cc::string_view pos, cc::string_view message)
    {
        on_error(source, pos, message, safe::severity::error);
        return false;
    }

    bool run()
    {
        auto const end = source.end();
        auto run_start = source.begin();
        auto p = source.begin();
        while (p != end)
        {
            if (*p == '{')
            {
                out += view_of(run_start, p);
                if (p + 1 != end && p[1] == '{')
                {
                    out += '{';
                    p += 2;
                    run_start = p;
                    continue;
                }

                auto q = p + 1;
                while (q != end && *q != '}' && *q != '{')
                    ++q;
                if (q == end)
                    return error(view_of(p, end), "expected '}' before end of string");
                if (*q == '{')
                    return error(view_of(p, q + 1), "nested replacement fields are not supported");

                if (!field(view_of(p, q + 1), view_of(p + 1, q)))
                    return false;

                p = q + 1;
                run_start = p;
            }
            else if (*p == '}')
            {
                out += view_of(run_start, p);
                if (p + 1 != end && p[1] == '}')
                {
                    out += '}';
                    p += 2;
                    run_start = p;
                    continue;
                }
                return error(view_of(p, p + 1), "single '}' encountered in format string");
            }
            else
                ++p;
        }
        out += view_of(run_start, end);
        return true;
    }

    safe::format_arg const* positional(size_t index) const
    {
        size_t i = 0;
        for (auto const& a : args)
            if (a.name.empty())
            {
                if (i == index)
                    return &a;
                ++i;
            }
        return nullptr;
    }

    safe::format_arg const* named(cc::string_view name) const
    {
        for (auto const& a : args)
            if (!a.name.empty() && a.name == name)
                return &a;
        return nullptr;
    }

    bool field(cc::string_view full, cc::string_view inner)
    {
        // split into name [!conversion] [:spec]
        size_t name_end = 0;
        while (name_end < inner.size() && inner[name_end] != '!' && inner[name_end] != ':')
            ++name_end;
        auto const name = safe::detail::subview(inner, 0, name_end);

        char conversion = 0;
        cc::string_view spec;
        auto rest = safe::detail::subview(inner, name_end);
        if (!rest.empty() && rest[0] == '!')
        {
            if (rest.size() < 2 || (rest.size() > 2 && rest[2] != ':'))
                return error(full, "expected ':' after conversion specifier");
            conversion = rest[1];
            if (conversion != 's' && conversion != 'r')
                return error(full, cc::format("unknown conversion specifier '{}'", conversion));
            rest = safe::detail::subview(rest, 2);
        }
        if (!rest.empty())
            spec = safe::detail::subview(rest, 1);

        for (auto c : name)
            if (c == '.' || c == '[')
                return error(full, "attribute and index access in replacement fields is not supported");

        safe::format_arg const* arg = nullptr;
        if (name.empty())
        {
            if (mode == numbering::manual)
                return error(full, "cannot switch from manual field numbering to automatic field numbering");
            mode = numbering::automatic;

            auto const index = next_index++;
            arg = positional(index);
            if (arg == nullptr)
            {
                auto const index_name = cc::to_string(int64_t(index));
                arg = named(index_name);
                if (arg == nullptr)
                    return error(full, cc::format("positional argument {} is missing", index));
            }
        }
        else if (is_digits(name))
        {
            if (mode == numbering::automatic)
                return error(full, "cannot switch from automatic field numbering to manual field numbering");
            mode = numbering::manual;

            size_t index = 0;
            for (auto c : name)
            {
                index = index * 10 + size_t(c - '0');
                if (index > args.size())
                    return error(full, cc::format("positional argument {} is missing", name));
            }
            arg = positional(index);
            if (arg == nullptr)
                return error(full, cc::format("positional argument {} is missing", name));
        }
        else
        {
            arg = named(name);
            if (arg == nullptr)
                return error(full, cc::format("unknown field '{}'", name));
        }

        return value(full, arg->value, conversion, spec);
    }

    bool value(cc::string_view full, safe::value_ref const& v, char conversion, cc::string_view spec_text)
    {
        using safe::value_kind;

        if (conversion == 'r')
            return escaped_text(full, safe::detail::to_repr(v), spec_text);

        switch (v.kind)
        {
        case value_kind::format_fragment:
            out += v.render_format(v.object, spec_text);
            return true;

        case value_kind::markup:
        case value_kind::fragment:
            if (!spec_text.empty())
                return error(full, "format specification given for a value that only provides html()");
            out += safe::detail::to_text(v);
            return true;

        case value_kind::text:
            return escaped_text(full, v.text, spec_text);

        case value_kind::none:
            return escaped_text(full, "None", spec_text);

        default:
            break;
        }

        safe::detail::format_spec spec;
        if (auto const msg = safe::detail::parse_format_spec(spec_text, spec))
            return error(full, msg);

        cc::string formatted;
        char const* msg = nullptr;
        switch (v.kind)
        {
        case value_kind::boolean:
            if (spec_text.empty())
                formatted = v.boolean ? "True" : "False";
            else
                msg = safe::detail::format_integer(formatted, false, v.boolean ? 1 : 0, spec);
            break;
        case value_kind::signed_integer:
            msg = safe::detail::format_integer(formatted, v.signed_integer < 0,
                                               v.signed_integer < 0 ? uint64_t(0) - uint64_t(v.signed_integer) : uint64_t(v.signed_integer), spec);
            break;
        case value_kind::unsigned_integer:
            msg = safe::detail::format_integer(formatted, false, v.unsigned_integer, spec);
            break;
        case value_kind::floating:
            msg = safe::detail::format_floating(formatted, v.floating, spec);
            break;
        default:
            CC_UNREACHABLE("unhandled value kind");
        }

        if (msg != nullptr)
            return error(full, msg);

        policy.escape_to(out, formatted);
        return true;
    }

    bool escaped_text(cc::string_view full, cc::string_view text, cc::string_view spec_text)
    {
        if (spec_text.empty())
        {
            policy.escape_to(out, text);
            return true;
        }

        safe::detail::format_spec spec;
        if (auto const msg = safe::detail::parse_format_spec(spec_text, spec))
            return error(full, msg);

        cc::string formatted;
        if (auto const msg = safe::detail::format_text(formatted, text, spec))
            return error(full, msg);

        policy.escape_to(out, formatted);
        return true;
    }
};
}

bool safe::format_to(cc::string& out, cc::string_view fmt, cc::span<format_arg const> args, escape_policy const& policy, error_handler on_error)
{
    return brace_formatter{fmt, args, policy, on_error, out}.run();
}

safe::markup safe::markup::vformat(cc::span<format_arg const> args, error_handler on_error) const
{
    cc::string out;
    if (!safe::format_to(out, view(), args, *_policy, on_error))
        return derived({});
    return derived(cc::move(out));
}
