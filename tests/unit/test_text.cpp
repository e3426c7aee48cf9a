#include <gtest/gtest.h>
#include "../../src/utils/text/converter.hpp"
#include "../../src/utils/text/string_utils.hpp"

using namespace Spinner::Utils::Text;

TEST(TextTest, MarkdownConversionComplex) {
    std::string html = R"html(
        <h1>Main Title</h1>
        <p>This is <b>bold</b> and <i>italic</i>.</p>
        <ul>
            <li>Item 1</li>
            <li>Item 2 with <a href="http://link.com">link</a></li>
        </ul>
        <pre><code>code block</code></pre>
        <blockquote>Quote here</blockquote>
    )html";
    std::string md = Converter::to_markdown(html);
    EXPECT_FALSE(md.empty());
    EXPECT_NE(md.find("# Main Title"), std::string::npos);
    EXPECT_NE(md.find("**bold**"), std::string::npos);
    EXPECT_NE(md.find("*italic*"), std::string::npos);
    EXPECT_NE(md.find("Item 1"), std::string::npos);
}

TEST(TextTest, EmptyHtml) {
    EXPECT_EQ(Converter::to_markdown(""), "");
    EXPECT_EQ(Converter::to_markdown("   \n\t "), "");
}

TEST(TextTest, UnicodeHandling) {
    std::string html = "<h1>你好</h1><p>Café</p>";
    std::string md = Converter::to_markdown(html);
    EXPECT_NE(md.find("你好"), std::string::npos);
    EXPECT_NE(md.find("Café"), std::string::npos);
}

TEST(TextTest, CleanMarkdownCollapsesBlankLines) {
    std::string md = "line1\n\n\n\n\n\nline2";
    EXPECT_EQ(Converter::clean_markdown(md), "line1\n\n\nline2");
}

TEST(TextTest, CleanMarkdownStripsCarriageReturns) {
    EXPECT_EQ(Converter::clean_markdown("a\r\nb\r\n"), "a\nb");
}

TEST(TextTest, CleanMarkdownTrims) {
    EXPECT_EQ(Converter::clean_markdown("\n\n  text  \n\n"), "text");
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  a b \t\r\n"), "a b");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim(" \n "), "");
}

TEST(StringUtilsTest, Prefixes) {
    EXPECT_TRUE(starts_with("http://x", "http://"));
    EXPECT_FALSE(starts_with("HTTP://x", "http://"));
    EXPECT_TRUE(istarts_with("HTTP://x", "http://"));
    EXPECT_FALSE(istarts_with("ht", "http://"));
    EXPECT_TRUE(ends_with("example.com:80", ":80"));
    EXPECT_FALSE(ends_with("80", ":80"));
}

TEST(StringUtilsTest, Split) {
    auto parts = split("/a//b", '/');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "");
    EXPECT_EQ(parts[1], "a");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "b");
}
