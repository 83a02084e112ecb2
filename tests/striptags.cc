#include <nexus/test.hh>

#include <clean-core/string.hh>

#include <safe-markup/striptags.hh>

TEST("striptags")
{
    CHECK(safe::striptags("") == "");
    CHECK(safe::striptags("<em>Foo &amp; Bar</em>") == "Foo & Bar");
    CHECK(safe::striptags("Main &raquo;\t<em>About</em>") == "Main \xc2\xbb About");
    CHECK(safe::striptags("  leading\n\n and   trailing  ") == "leading and trailing");

    CHECK(safe::striptags("<em>Foo &amp; Bar <!-- inner comment about <em> -->\n </em>"
                          "<!-- comment\nwith\nnewlines\n-->"
                          "<meta content='tag\nwith\nnewlines'>")
          == "Foo & Bar");
}

TEST("striptags removes joined tags")
{
    // removing a comment joins the text around it into a new comment
    CHECK(safe::striptags("<<!-- -->!-- comment -->x") == "x");
    CHECK(safe::striptags("<<!---->!---->x") == "x");

    // a tag ends at the first '>'
    CHECK(safe::striptags("<<em>b>x") == "b>x");
}

TEST("striptags unterminated")
{
    CHECK(safe::striptags("a <b c") == "a <b c");
    CHECK(safe::striptags("a <!-- b") == "a <!-- b");
    CHECK(safe::striptags("<em>a</em> <!-- b") == "a <!-- b");
}
