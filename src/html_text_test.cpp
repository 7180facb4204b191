#include <gtest/gtest.h>

#include "html_text.hpp"

TEST(HtmlTextTest, BasicText)
{
    EXPECT_EQ(HtmlText::toPlainText("Hello World"), "Hello World");
    EXPECT_EQ(HtmlText::toPlainText(""), "");
}

TEST(HtmlTextTest, ParagraphsBecomeBlankLines)
{
    EXPECT_EQ(HtmlText::toPlainText("<p>a</p><p>b &amp; c</p>"),
              "a\n\nb & c");
}

TEST(HtmlTextTest, LineBreaks)
{
    EXPECT_EQ(HtmlText::toPlainText("<p>one<br>two<br/>three<br />four</p>"),
              "one\ntwo\nthree\nfour");
}

TEST(HtmlTextTest, TagsAreStripped)
{
    std::string input =
        "<p>Hi <span class=\"h-card\"><a href=\"https://m.s/@bob\" "
        "class=\"u-url mention\">@<span>bob</span></a></span>!</p>";
    EXPECT_EQ(HtmlText::toPlainText(input), "Hi @bob!");
}

TEST(HtmlTextTest, EntitiesAreDecoded)
{
    EXPECT_EQ(HtmlText::toPlainText("&lt;3 &quot;x&quot; &#39;y&#39;"),
              "<3 \"x\" 'y'");
}

TEST(HtmlTextTest, ScriptContentIsDropped)
{
    EXPECT_EQ(HtmlText::toPlainText("<script>alert(1)</script><p>Safe</p>"),
              "Safe");
}
