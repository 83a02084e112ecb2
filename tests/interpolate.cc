#include <nexus/test.hh>

#include <clean-core/map.hh>
#include <clean-core/string.hh>

#include <safe-markup/format_error.hh>
#include <safe-markup/interpolate.hh>

namespace
{
struct settings
{
    cc::string title = "<untitled>";
    int width = 80;
    double ratio = 0.5;
};
template <class I>
constexpr void introspect(I&& i, settings& v)
{
    i(v.title, "title");
    i(v.width, "width");
    i(v.ratio, "ratio");
}

struct icon
{
    cc::string html() const { return "<i class=\"icon\"></i>"; }
};

struct recorded_error
{
    cc::string message;
    safe::severity severity = safe::severity::warning;
    int errors = 0;
    int warnings = 0;
};

safe::markup interpolate_recorded(recorded_error& err, safe::markup const& m, safe::interpolation_args const& args)
{
    auto handler = [&](cc::string_view, cc::string_view, cc::string_view message, safe::severity s) {
        err.message = cc::string(message);
        err.severity = s;
        if (s == safe::severity::error)
            ++err.errors;
        else
            ++err.warnings;
    };
    return m.interpolate(args, handler);
}
}

TEST("interpolate text")
{
    CHECK((safe::markup("<em>%s</em>") % "<bad user>").str() == "<em>&lt;bad user&gt;</em>");
    CHECK((safe::markup("<em>%s:%s</em>") % safe::args("<foo>", "<bar>")).str() == "<em>&lt;foo&gt;:&lt;bar&gt;</em>");
    CHECK((safe::markup("%s") % 42).str() == "42");
    CHECK((safe::markup("%s") % true).str() == "True");
    CHECK((safe::markup("%s") % cc::nullopt).str() == "None");
    CHECK((safe::markup("100%%") % safe::args()).str() == "100%");
    CHECK((safe::markup("no codes") % safe::args()).str() == "no codes");

    CHECK((safe::markup("%5s|") % "ab").str() == "   ab|");
    CHECK((safe::markup("%-5s|") % "ab").str() == "ab   |");
    CHECK((safe::markup("%.2s") % "<abc").str() == "&lt;a");
}

TEST("interpolate trusted values")
{
    CHECK((safe::markup("<p>%s</p>") % safe::markup("<br>")).str() == "<p><br></p>");
    CHECK((safe::markup("%s %s") % safe::args(icon{}, "<")).str() == "<i class=\"icon\"></i> &lt;");

    // repr always escapes
    CHECK((safe::markup("%r") % safe::markup("<br>")).str() == "markup(&#39;&lt;br&gt;&#39;)");
}

TEST("interpolate repr")
{
    CHECK((safe::markup("%r") % "<x>").str() == "&#39;&lt;x&gt;&#39;");
    CHECK((safe::markup("%r") % "a\nb").str() == "&#39;a\\nb&#39;");
    CHECK((safe::markup("%r") % 3).str() == "3");
    CHECK((safe::markup("%a") % "\xc3\xa9").str() == "&#39;\\xe9&#39;");
    CHECK((safe::markup("%a") % "\xe2\x82\xac").str() == "&#39;\\u20ac&#39;");
}

TEST("interpolate numbers")
{
    CHECK((safe::markup("%i") % 3.14).str() == "3");
    CHECK((safe::markup("%d") % -3.9).str() == "-3");
    CHECK((safe::markup("%u") % 7).str() == "7");
    CHECK((safe::markup("%d") % true).str() == "1");
    CHECK((safe::markup("%.2f") % 3.14159).str() == "3.14");
    CHECK((safe::markup("%5.1f|") % 3.14159).str() == "  3.1|");
    CHECK((safe::markup("%-6.1f|") % 3.14159).str() == "3.1   |");
    CHECK((safe::markup("%05d") % 42).str() == "00042");
    CHECK((safe::markup("%05d") % -42).str() == "-0042");
    CHECK((safe::markup("%+d") % 5).str() == "+5");
    CHECK((safe::markup("% d") % 5).str() == " 5");
    CHECK((safe::markup("%.3d") % 5).str() == "005");
    CHECK((safe::markup("%x") % 255).str() == "ff");
    CHECK((safe::markup("%#x") % 255).str() == "0xff");
    CHECK((safe::markup("%#X") % 255).str() == "0XFF");
    CHECK((safe::markup("%#o") % 8).str() == "0o10");
    CHECK((safe::markup("%e") % 1234.5).str() == "1.234500e+03");
    CHECK((safe::markup("%E") % 1234.5).str() == "1.234500E+03");
    CHECK((safe::markup("%g") % 0.0001).str() == "0.0001");
    CHECK((safe::markup("%G") % 1e-10).str() == "1E-10");
    CHECK((safe::markup("%f") % 2).str() == "2.000000");
    CHECK((safe::markup("%c") % 60).str() == "&lt;");
    CHECK((safe::markup("%c") % "x").str() == "x");
    CHECK((safe::markup("%c") % 8364).str() == "\xe2\x82\xac");
}

TEST("interpolate star width and precision")
{
    CHECK((safe::markup("%*d") % safe::args(5, 42)).str() == "   42");
    CHECK((safe::markup("%-*d|") % safe::args(4, 7)).str() == "7   |");
    CHECK((safe::markup("%*d|") % safe::args(-4, 7)).str() == "7   |");
    CHECK((safe::markup("%.*f") % safe::args(1, 2.25)).str() == "2.2");
    CHECK((safe::markup("%*.*f") % safe::args(6, 2, 3.14159)).str() == "  3.14");
}

TEST("interpolate mappings")
{
    cc::map<cc::string, cc::string> m;
    m["foo"] = "<foo>";
    CHECK((safe::markup("<em>%(foo)s</em>") % m).str() == "<em>&lt;foo&gt;</em>");

    settings s;
    CHECK((safe::markup("<h1>%(title)s</h1> %(width)04d %(ratio).2f") % s).str() == "<h1>&lt;untitled&gt;</h1> 0080 0.50");
    CHECK((safe::markup("%(title)s %(title)r") % s).str() == "&lt;untitled&gt; &#39;&lt;untitled&gt;&#39;");
}

TEST("interpolate errors")
{
    recorded_error err;

    CHECK(interpolate_recorded(err, safe::markup("%d"), safe::args("text")).empty());
    CHECK((err.severity == safe::severity::error));
    CHECK(interpolate_recorded(err, safe::markup("%x"), safe::args(1.5)).empty());
    CHECK(interpolate_recorded(err, safe::markup("%s %s"), safe::args("a")).empty());
    CHECK(interpolate_recorded(err, safe::markup("%s"), safe::args(1, 2)).empty());
    CHECK(interpolate_recorded(err, safe::markup("%(x)s"), safe::args(5)).empty());
    CHECK(interpolate_recorded(err, safe::markup("%q"), safe::args(5)).empty());
    CHECK(interpolate_recorded(err, safe::markup("%"), safe::args()).empty());
    CHECK(interpolate_recorded(err, safe::markup("%(x"), safe::args()).empty());
    CHECK(interpolate_recorded(err, safe::markup("%.2s"), safe::args(safe::markup("<b>"))).empty());
    CHECK(interpolate_recorded(err, safe::markup("%c"), safe::args("ab")).empty());
    CHECK(interpolate_recorded(err, safe::markup("%c"), safe::args(0x110000)).empty());
    CHECK(interpolate_recorded(err, safe::markup("%*d"), safe::args("x", 1)).empty());
    CHECK(err.errors == 12);
    CHECK(err.warnings == 0);
}

TEST("interpolate mapping used positionally")
{
    recorded_error err;
    cc::map<cc::string, int> m;
    m["a"] = 1;

    safe::interpolation_args args;
    args.is_mapping = true;
    safe::detail::collect_named_args(args.named, m);

    CHECK(interpolate_recorded(err, safe::markup("%s"), args).empty());
    CHECK(err.errors == 1);
    CHECK(interpolate_recorded(err, safe::markup("%(a)d"), args).str() == "1");
    CHECK(err.errors == 1);
}

TEST("interpolate length modifiers warn")
{
    recorded_error err;
    CHECK(interpolate_recorded(err, safe::markup("%ld"), safe::args(5)).str() == "5");
    CHECK(err.warnings == 1);
    CHECK(err.errors == 0);
    CHECK((err.severity == safe::severity::warning));
}

TEST("interpolate default error handler throws")
{
    auto caught = false;
    try
    {
        (void)(safe::markup("%d") % "text");
    }
    catch (safe::format_error const& e)
    {
        caught = e.pos() == 0;
    }
    CHECK(caught);
}
