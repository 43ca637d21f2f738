/**
 * @file collectors_test.cpp
 * @brief Tests for comment and quote collectors and their helpers.
 */

#include <gtest/gtest.h>
#include "collectors.h"

#include <string>

using namespace dsvkit;

//-----------------------------------------------------------------------------
// Helpers
//-----------------------------------------------------------------------------

TEST(CollectorHelpersTest, RemoveTerminator) {
    EXPECT_EQ(remove_terminator("abc,"), "abc");
    EXPECT_EQ(remove_terminator("abc\n"), "abc");
    EXPECT_EQ(remove_terminator("abc\r\n"), "abc");
    EXPECT_EQ(remove_terminator("\n"), "");
    EXPECT_EQ(remove_terminator("\r\n"), "");
    EXPECT_EQ(remove_terminator("a\r,"), "a\r");
    EXPECT_EQ(remove_terminator(""), "");
}

TEST(CollectorHelpersTest, EndsWithUnescapedQuote) {
    EXPECT_TRUE(ends_with_unescaped_quote("abc\"", '"', '"'));
    EXPECT_FALSE(ends_with_unescaped_quote("ab\"\"", '"', '"'));
    EXPECT_TRUE(ends_with_unescaped_quote("ab\"\"\"", '"', '"'));
    EXPECT_TRUE(ends_with_unescaped_quote("\"", '"', '"'));
    EXPECT_FALSE(ends_with_unescaped_quote("", '"', '"'));
    EXPECT_FALSE(ends_with_unescaped_quote("abc", '"', '"'));

    EXPECT_FALSE(ends_with_unescaped_quote("ab\\\"", '"', '\\'));
    EXPECT_TRUE(ends_with_unescaped_quote("ab\\\\\"", '"', '\\'));
}

TEST(CollectorHelpersTest, UnescapeDoubledQuotes) {
    std::string v = "\"\" x\"\"\"\"y \"\"";
    unescape_quotes(v, '"', '"');
    EXPECT_EQ(v, "\" x\"\"y \"");
}

TEST(CollectorHelpersTest, UnescapeBackslash) {
    std::string v = " \"x\\\"y\" ";
    unescape_quotes(v, '"', '\\');
    EXPECT_EQ(v, " \"x\"y\" ");
}

TEST(CollectorHelpersTest, UnescapeIsSinglePass) {
    std::string v = "a\"\"b";
    unescape_quotes(v, '"', '"');
    EXPECT_EQ(v, "a\"b");
    unescape_quotes(v, '"', '"');
    EXPECT_EQ(v, "a\"b");
}

TEST(CollectorHelpersTest, UnescapeDisabled) {
    std::string v = "a\"\"b";
    unescape_quotes(v, '"', '\0');
    EXPECT_EQ(v, "a\"\"b");

    std::string empty;
    unescape_quotes(empty, '"', '"');
    EXPECT_TRUE(empty.empty());
}

//-----------------------------------------------------------------------------
// Comment collector
//-----------------------------------------------------------------------------

TEST(CommentCollectorTest, Start) {
    Collector c = Collector::comment("//");
    EXPECT_EQ(c.kind(), CollectorKind::COMMENT);

    CollectResult r = c.start("// note\n");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, " note\n");

    r = c.start("/ note\n");
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.data, "/ note\n");
}

TEST(CommentCollectorTest, EndAtLineBreakOnly) {
    Collector c = Collector::comment("#");

    CollectResult r = c.end("note\n");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "note");

    r = c.end("note\r\n");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "note");

    // A separator does not end a comment; the piece is kept whole
    r = c.end("a,");
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.data, "a,");
}

//-----------------------------------------------------------------------------
// Strict quote collector
//-----------------------------------------------------------------------------

TEST(StrictQuoteCollectorTest, Start) {
    Collector c = Collector::quote(QuoteMode::STRICT, '"', '"');
    EXPECT_EQ(c.kind(), CollectorKind::STRICT_QUOTE);

    CollectResult r = c.start("\"abc\",");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "abc\",");

    r = c.start(" \"abc\",");
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.data, " \"abc\",");
}

TEST(StrictQuoteCollectorTest, End) {
    Collector c = Collector::quote(QuoteMode::STRICT, '"', '"');

    CollectResult r = c.end("abc\",");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "abc");

    r = c.end("abc\"\r\n");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "abc");

    // Blank after the closing quote: not closed in strict mode
    r = c.end("abc\" ,");
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.data, "abc\" ,");

    // Escaped quote before the terminator
    r = c.end("ab\"\"\n");
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.data, "ab\"\"\n");
}

TEST(StrictQuoteCollectorTest, BackslashEscape) {
    Collector c = Collector::quote(QuoteMode::STRICT, '"', '\\');

    CollectResult r = c.end("a\\\",");
    EXPECT_FALSE(r.matched);

    r = c.end("a\\\\\",");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "a\\\\");
}

TEST(StrictQuoteCollectorTest, ClosedEarly) {
    Collector c = Collector::quote(QuoteMode::STRICT, '"', '"');

    EXPECT_TRUE(c.closed_early("x\" ,"));
    EXPECT_TRUE(c.closed_early("a\"b\n"));
    // Doubled quotes are content, not a closing quote
    EXPECT_FALSE(c.closed_early("a\"\"b,"));
    EXPECT_FALSE(c.closed_early("ab\"\"\n"));
    EXPECT_FALSE(c.closed_early("abc,"));

    Collector backslash = Collector::quote(QuoteMode::STRICT, '"', '\\');
    EXPECT_FALSE(backslash.closed_early("a\\\"b,"));
    EXPECT_TRUE(backslash.closed_early("a\"b,"));

    Collector fuzzy = Collector::quote(QuoteMode::FUZZY, '"', '"');
    EXPECT_FALSE(fuzzy.closed_early("x\" y,"));
    EXPECT_FALSE(Collector::comment("#").closed_early("x\" y,"));
}

//-----------------------------------------------------------------------------
// Fuzzy quote collector
//-----------------------------------------------------------------------------

TEST(FuzzyQuoteCollectorTest, StartSkipsBlanks) {
    Collector c = Collector::quote(QuoteMode::FUZZY, '\'', '\'');
    EXPECT_EQ(c.kind(), CollectorKind::FUZZY_QUOTE);

    CollectResult r = c.start(" \t 'abc'  ,");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "abc'  ,");

    r = c.start("  x'abc',");
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.data, "  x'abc',");

    r = c.start("   \n");
    EXPECT_FALSE(r.matched);
}

TEST(FuzzyQuoteCollectorTest, EndTrimsBlanks) {
    Collector c = Collector::quote(QuoteMode::FUZZY, '\'', '\'');

    CollectResult r = c.end("abc' \t,");
    EXPECT_TRUE(r.matched);
    EXPECT_EQ(r.data, "abc");

    r = c.end("abc' x,");
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.data, "abc' x,");
}

TEST(FuzzyQuoteCollectorTest, CollectorsAreStateless) {
    Collector c = Collector::quote(QuoteMode::FUZZY, '"', '"');
    for (int i = 0; i < 3; ++i) {
        CollectResult r = c.start("\"x\"\n");
        ASSERT_TRUE(r.matched);
        r = c.end(r.data);
        EXPECT_TRUE(r.matched);
        EXPECT_EQ(r.data, "x");
    }
}
