#include <nexus/fuzz_test.hh>
#include <nexus/test.hh>

#include <clean-core/string.hh>
#include <clean-core/string_view.hh>

#include <safe-markup/escape.hh>

namespace
{
struct escape_case
{
    char const* input;
    char const* expected;
};

constexpr escape_case escape_cases[] = {
    {"", ""},
    {"abcd&><'\"efgh", "abcd&amp;&gt;&lt;&#39;&#34;efgh"},
    {"&><'\"efgh", "&amp;&gt;&lt;&#39;&#34;efgh"},
    {"abcd&><'\"", "abcd&amp;&gt;&lt;&#39;&#34;"},
    {"\xe3\x81\x93\xe3\x82\x93&><'\"\xe3\x81\xb0\xe3\x82\x93", "\xe3\x81\x93\xe3\x82\x93&amp;&gt;&lt;&#39;&#34;\xe3\x81\xb0\xe3\x82\x93"},
    {"\xf0\x9f\x98\x83&><'\"", "\xf0\x9f\x98\x83&amp;&gt;&lt;&#39;&#34;"},
    {"no reserved characters here, just a longer run of text", "no reserved characters here, just a longer run of text"},
    {"\t\n\x01\x7f", "\t\n\x01\x7f"},
};

bool is_well_formed(cc::string_view escaped)
{
    for (size_t i = 0; i < escaped.size(); ++i)
    {
        auto const c = escaped[i];
        if (c == '<' || c == '>' || c == '\'' || c == '"')
            return false;
        if (c != '&')
            continue;

        auto const rest = cc::string_view(escaped.data() + i, escaped.size() - i);
        auto matches = false;
        for (auto e : {"&amp;", "&lt;", "&gt;", "&#39;", "&#34;"})
        {
            auto const ev = cc::string_view(e);
            if (rest.size() >= ev.size() && cc::string_view(rest.data(), ev.size()) == ev)
                matches = true;
        }
        if (!matches)
            return false;
    }
    return true;
}
}

TEST("escape text")
{
    for (auto const& c : escape_cases)
    {
        CHECK(safe::escape_text(c.input) == c.expected);
        CHECK(safe::escape_text(c.input, safe::backend::reference) == c.expected);
        CHECK(safe::escape_text(c.input, safe::backend::accelerated) == c.expected);
    }

    CHECK(safe::escape_text("\"<>&'") == "&#34;&lt;&gt;&amp;&#39;");
}

TEST("escape text appends")
{
    cc::string s = "<kept>";
    safe::escape_text_to(s, "<added>");
    CHECK(s == "<kept>&lt;added&gt;");

    safe::escape_text_to(s, "", safe::backend::accelerated);
    CHECK(s == "<kept>&lt;added&gt;");
}

TEST("needs escaping")
{
    CHECK(!safe::needs_escaping(""));
    CHECK(!safe::needs_escaping("plain text"));
    CHECK(safe::needs_escaping("a & b"));
    CHECK(safe::needs_escaping("quote'"));
}

TEST("backend selection")
{
    auto const b = safe::active_backend();
    CHECK((b == safe::backend::reference || b == safe::backend::accelerated));
    CHECK(safe::active_backend() == b);

    CHECK(cc::string_view(safe::backend_name(safe::backend::reference)) == "reference");
    CHECK(cc::string_view(safe::backend_name(safe::backend::accelerated)) == "accelerated");

    CHECK(cc::string_view(safe::html_policy().name) == "html");
}

FUZZ_TEST("escape backends agree")(tg::rng& rng)
{
    // biased towards reserved characters, word boundaries and multi-byte sequences
    auto const alphabet = cc::string_view("ab &<>'\"\xc3\xa4\xe2\x82\xac");

    auto cnt = uniform(rng, 0, 20);
    if (uniform(rng))
        cnt = uniform(rng, 20, 300);

    cc::string s;
    for (auto i = 0; i < cnt; ++i)
    {
        if (uniform(rng, 0, 9) == 0)
            s += char(uniform(rng, 0, 255));
        else
            s += alphabet[uniform(rng, 0, int(alphabet.size()) - 1)];
    }

    auto const ref = safe::escape_text(s, safe::backend::reference);
    auto const acc = safe::escape_text(s, safe::backend::accelerated);
    CHECK(ref == acc);
    CHECK(is_well_formed(acc));
    CHECK(safe::needs_escaping(s) == (ref != s));
}
