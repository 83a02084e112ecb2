#include <cmath>
#include <limits>

#include <nexus/test.hh>

#include <clean-core/map.hh>
#include <clean-core/string.hh>
#include <clean-core/vector.hh>

#include <safe-markup/format.hh>
#include <safe-markup/format_error.hh>
#include <safe-markup/markup.hh>

namespace
{
struct user
{
    cc::string name = "<admin>";
    int age = 42;
};
template <class I>
constexpr void introspect(I&& i, user& v)
{
    i(v.name, "name");
    i(v.age, "age");
}

struct link
{
    cc::string html() const { return "<a href=\"/\">home</a>"; }
};

/// a format-aware fragment: the spec selects the tag
struct tagged
{
    cc::string text;

    cc::string html() const { return html_format(""); }
    cc::string html_format(cc::string_view spec) const
    {
        if (spec.empty())
            return text;
        if (spec == "em" || spec == "strong")
            return "<" + cc::string(spec) + ">" + text + "</" + cc::string(spec) + ">";
        throw safe::format_error(0, "unsupported tag");
    }
};

struct widget : safe::renderable
{
    cc::string html() const override { return "<hr>"; }
};

struct recorded_error
{
    cc::string message;
    cc::string pos;
    safe::severity severity = safe::severity::warning;
    int count = 0;
};

/// formats with a handler that records the error instead of throwing
safe::markup format_recorded(recorded_error& err, safe::markup const& m, cc::vector<safe::format_arg> const& args)
{
    auto handler = [&](cc::string_view, cc::string_view pos, cc::string_view message, safe::severity s) {
        err.message = cc::string(message);
        err.pos = cc::string(pos);
        err.severity = s;
        ++err.count;
    };
    return m.vformat(cc::span<safe::format_arg const>(args.data(), args.size()), handler);
}

template <class F>
bool throws_format_error(F&& f)
{
    try
    {
        f();
    }
    catch (safe::format_error const&)
    {
        return true;
    }
    return false;
}
}

TEST("format escapes arguments")
{
    CHECK(safe::markup("<em>{}</em>").format("<x>").str() == "<em>&lt;x&gt;</em>");
    CHECK(safe::markup("<em>{awesome}</em>").format(safe::arg("awesome", "<awesome>")).str() == "<em>&lt;awesome&gt;</em>");
    CHECK(safe::markup("{0}{1}{0}").format("<", ">").str() == "&lt;&gt;&lt;");
    CHECK(safe::markup("{} and {}").format(1, true).str() == "1 and True");
    CHECK(safe::markup("{}").format(cc::nullopt).str() == "None");
    CHECK(safe::markup("{}").format(2.5).str() == "2.5");
    CHECK(safe::markup("no fields").format().str() == "no fields");
    CHECK(safe::markup("{{}} {{{}}}").format("<").str() == "{} {&lt;}");
}

TEST("format trusted arguments")
{
    CHECK(safe::markup("<p>{}</p>").format(safe::markup("<br>")).str() == "<p><br></p>");
    CHECK(safe::markup("<p>{}</p>").format(link{}).str() == "<p><a href=\"/\">home</a></p>");
    CHECK(safe::markup("{}").format(widget{}).str() == "<hr>");

    CHECK(safe::markup("{}|{:em}|{:strong}").format(tagged{"a"}, tagged{"b"}, tagged{"c"}).str() == "a|<em>b</em>|<strong>c</strong>");

    // html_format decides about unsupported specifications
    CHECK(throws_format_error([] { (void)safe::markup("{:blink}").format(tagged{"x"}); }));
    CHECK(throws_format_error([] { (void)safe::markup("{:>5}").format(widget{}); }));
}

TEST("format specifications")
{
    CHECK(safe::markup("{:>6}").format(3.5).str() == "   3.5");
    CHECK(safe::markup("{:05.1f}").format(3.14159).str() == "003.1");
    CHECK(safe::markup("{:,}").format(1234567).str() == "1,234,567");
    CHECK(safe::markup("{:_x}").format(0xabcdef).str() == "ab_cdef");
    CHECK(safe::markup("{:x}").format(255).str() == "ff");
    CHECK(safe::markup("{:#X}").format(255).str() == "0XFF");
    CHECK(safe::markup("{:#b}").format(5).str() == "0b101");
    CHECK(safe::markup("{:o}").format(8).str() == "10");
    CHECK(safe::markup("{:+d}").format(5).str() == "+5");
    CHECK(safe::markup("{: d}").format(5).str() == " 5");
    CHECK(safe::markup("{:=+6}").format(-42).str() == "-   42");
    CHECK(safe::markup("{:06}").format(-42).str() == "-00042");
    CHECK(safe::markup("{:c}").format(60).str() == "&lt;");
    CHECK(safe::markup("{:d}").format(true).str() == "1");

    CHECK(safe::markup("{:.3}").format(3.14159).str() == "3.14");
    CHECK(safe::markup("{:.3}").format(2.0).str() == "2.0");
    CHECK(safe::markup("{:.3}").format(1234.5).str() == "1.23e+03");
    CHECK(safe::markup("{:e}").format(1234.5).str() == "1.234500e+03");
    CHECK(safe::markup("{:.2E}").format(1234.5).str() == "1.23E+03");
    CHECK(safe::markup("{:g}").format(0.0001).str() == "0.0001");
    CHECK(safe::markup("{:.1%}").format(0.25).str() == "25.0%");
    CHECK(safe::markup("{:,.2f}").format(1234567.891).str() == "1,234,567.89");
    CHECK(safe::markup("{:f}").format(std::numeric_limits<double>::infinity()).str() == "inf");
    CHECK(safe::markup("{:F}").format(-std::numeric_limits<double>::infinity()).str() == "-INF");
    CHECK(safe::markup("{:.2f}").format(3).str() == "3.00");

    CHECK(safe::markup("{:<5}|").format("ab").str() == "ab   |");
    CHECK(safe::markup("{:^6}|").format("ab").str() == "  ab  |");
    CHECK(safe::markup("{:*^7}").format("<").str() == "***&lt;***");
    CHECK(safe::markup("{:.2}").format("<abc").str() == "&lt;a");
    CHECK(safe::markup("{:\xc3\xa4>3}").format("x").str() == "\xc3\xa4\xc3\xa4x");
}

TEST("format conversions")
{
    CHECK(safe::markup("{!s}").format("<").str() == "&lt;");
    CHECK(safe::markup("{!r}").format("<x>").str() == "&#39;&lt;x&gt;&#39;");
    CHECK(safe::markup("{!r}").format("it's").str() == "&#34;it&#39;s&#34;");
    CHECK(safe::markup("{!r}").format(safe::markup("<b>")).str() == "markup(&#39;&lt;b&gt;&#39;)");
    CHECK(safe::markup("{!r}").format(42).str() == "42");
    CHECK(safe::markup("{!r:>6}").format("a").str() == "   &#39;a&#39;");
}

TEST("format positional fallback to named")
{
    CHECK(safe::markup("{} {}").format(1, safe::arg("1", "<x>")).str() == "1 &lt;x&gt;");
    CHECK(safe::markup("{name}: {}").format(safe::arg("name", "a"), 7).str() == "a: 7");
}

TEST("format map")
{
    cc::map<cc::string, cc::string> m;
    m["user"] = "<b>";
    m["site"] = "x&y";
    CHECK(safe::markup("{user}@{site}").format_map(m).str() == "&lt;b&gt;@x&amp;y");

    cc::map<cc::string, int> counts;
    counts["n"] = 3;
    CHECK(safe::markup("{n:03}").format_map(counts).str() == "003");

    CHECK(safe::markup("<td>{name}</td><td>{age}</td>").format_map(user{}).str() == "<td>&lt;admin&gt;</td><td>42</td>");
}

TEST("format errors")
{
    recorded_error err;

    auto r = format_recorded(err, safe::markup("a {"), {});
    CHECK(r.empty());
    CHECK(err.count == 1);
    CHECK((err.severity == safe::severity::error));
    CHECK(err.pos == "{");

    r = format_recorded(err, safe::markup("a } b"), {});
    CHECK(r.empty());
    CHECK(err.pos == "}");

    r = format_recorded(err, safe::markup("{x}"), {});
    CHECK(r.empty());
    CHECK(err.pos == "{x}");

    r = format_recorded(err, safe::markup("{1}"), {safe::detail::make_format_arg(0)});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{} {1}"), {safe::detail::make_format_arg(0), safe::detail::make_format_arg(1)});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{0} {}"), {safe::detail::make_format_arg(0), safe::detail::make_format_arg(1)});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{:>5}"), {safe::detail::make_format_arg(safe::markup("<b>"))});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{:{w}}"), {safe::detail::make_format_arg(1)});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{0.x} {0[1]}"), {safe::detail::make_format_arg(1)});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{!x}"), {safe::detail::make_format_arg(1)});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{:d}"), {safe::detail::make_format_arg(1.5)});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{:+}"), {safe::detail::make_format_arg("text")});
    CHECK(r.empty());

    r = format_recorded(err, safe::markup("{:.2d}"), {safe::detail::make_format_arg(1)});
    CHECK(r.empty());

    CHECK(err.count == 13);
}

TEST("format rejects huge field indices")
{
    recorded_error err;

    auto r = format_recorded(err, safe::markup("{18446744073709551616}"), {safe::detail::make_format_arg("a")});
    CHECK(r.empty());
    CHECK(err.count == 1);

    r = format_recorded(err, safe::markup("{99999999999999999999999}"), {safe::detail::make_format_arg("a")});
    CHECK(r.empty());
    CHECK(err.count == 2);

    CHECK(safe::markup("{0}{00}").format("<").str() == "&lt;&lt;");
}

TEST("format negative nan")
{
    auto const nan = std::copysign(std::numeric_limits<double>::quiet_NaN(), -1.0);
    CHECK(safe::markup("{}").format(nan).str() == "nan");
    CHECK(safe::markup("{:f}").format(nan).str() == "nan");
    CHECK(safe::markup("{:F}").format(nan).str() == "NAN");
    CHECK(safe::markup("{:.2}").format(nan).str() == "nan");
}

TEST("format default error handler throws")
{
    CHECK(throws_format_error([] { (void)safe::markup("{").format(); }));
    CHECK(throws_format_error([] { (void)safe::markup("{}").format(); }));
    CHECK(throws_format_error([] { (void)safe::markup("{unknown}").format(1); }));

    try
    {
        (void)safe::markup("ab{x}").format();
    }
    catch (safe::format_error const& e)
    {
        CHECK(e.pos() == 2);
        CHECK(!e.message().empty());
    }
}

TEST("format to string")
{
    cc::string out = "<kept>";
    safe::format_arg const args[] = {safe::detail::make_format_arg("<")};
    CHECK(safe::format_to(out, "{}!", cc::span<safe::format_arg const>(args, 1)));
    CHECK(out == "<kept>&lt;!");
}
