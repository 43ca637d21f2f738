/**
 * @file tokenizer_test.cpp
 * @brief Tests for the streaming field tokenizer.
 */

#include <gtest/gtest.h>
#include "tokenizer.h"
#include "test_helpers.h"

#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

using namespace dsvkit;

namespace {

struct Token {
    std::string data;
    size_t offset;
    bool row_start;
    bool row_end;
    bool comment;
    bool quoted;
    bool empty_line;
};

std::vector<Token> tokenize(const std::string& data,
                            const DialectParameters& dialect = DialectParameters::csv(),
                            size_t chunk_size = DSVKIT_CHUNK_SIZE) {
    std::istringstream input(data);
    TokenizerOptions options;
    options.chunk_size = chunk_size;
    Tokenizer tok(input, dialect, options);
    std::vector<Token> tokens;
    while (tok.next()) {
        tokens.push_back({tok.bytes(), tok.offset(), tok.at_row_start(), tok.at_row_end(),
                          tok.is_comment(), tok.is_quoted(), tok.is_empty_line()});
    }
    EXPECT_FALSE(tok.has_error());
    return tokens;
}

std::vector<std::string> contents(const std::vector<Token>& tokens) {
    std::vector<std::string> out;
    for (const auto& t : tokens) {
        out.push_back(t.data);
    }
    return out;
}

} // namespace

//-----------------------------------------------------------------------------
// Field classification
//-----------------------------------------------------------------------------

TEST(TokenizerTest, MixedDocument) {
    const std::string csv =
        "# This, is a comment\n"
        " foo ,  bar  ,  baz, # This is not a comment\n"
        "\n"
        "\", foo \",  \"b'ar,\",\" b\"\",az \" ,\n";

    auto tokens = tokenize(csv);
    ASSERT_EQ(tokens.size(), 10u);

    EXPECT_TRUE(tokens[0].comment);
    EXPECT_EQ(tokens[0].data, " This, is a comment");

    EXPECT_EQ(tokens[1].data, " foo ");
    EXPECT_TRUE(tokens[1].row_start);
    EXPECT_EQ(tokens[2].data, "  bar  ");
    EXPECT_EQ(tokens[3].data, "  baz");
    EXPECT_EQ(tokens[4].data, " # This is not a comment");
    EXPECT_FALSE(tokens[4].comment);
    EXPECT_TRUE(tokens[4].row_end);

    EXPECT_TRUE(tokens[5].empty_line);

    EXPECT_TRUE(tokens[6].row_start);
    EXPECT_TRUE(tokens[6].quoted);
    EXPECT_EQ(tokens[6].data, ", foo ");
    EXPECT_TRUE(tokens[7].quoted);
    EXPECT_EQ(tokens[7].data, "b'ar,");
    EXPECT_TRUE(tokens[8].quoted);
    EXPECT_EQ(tokens[8].data, " b\",az ");
    EXPECT_FALSE(tokens[9].quoted);
    EXPECT_EQ(tokens[9].data, "");
    EXPECT_TRUE(tokens[9].row_end);
    EXPECT_FALSE(tokens[9].empty_line);
}

TEST(TokenizerTest, Offsets) {
    auto tokens = tokenize("a,bb\n\"c\",d");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].offset, 0u);
    EXPECT_EQ(tokens[1].offset, 2u);
    EXPECT_EQ(tokens[2].offset, 5u);
    EXPECT_EQ(tokens[3].offset, 9u);
}

TEST(TokenizerTest, CommentOnlyAtRowStart) {
    auto tokens = tokenize("a,#b\n#c,d\n");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_FALSE(tokens[1].comment);
    EXPECT_EQ(tokens[1].data, "#b");
    EXPECT_TRUE(tokens[2].comment);
    EXPECT_EQ(tokens[2].data, "c,d");
    EXPECT_TRUE(tokens[2].row_start);
    EXPECT_TRUE(tokens[2].row_end);
}

TEST(TokenizerTest, CommentsDisabled) {
    DialectParameters dialect;
    dialect.comment = "";
    auto tokens = tokenize("#a,b\n", dialect);
    EXPECT_EQ(contents(tokens), (std::vector<std::string>{"#a", "b"}));
    EXPECT_FALSE(tokens[0].comment);
}

TEST(TokenizerTest, MultiByteCommentPrefix) {
    DialectParameters dialect;
    dialect.comment = "//";
    auto tokens = tokenize("// x\r\n/a\n", dialect);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_TRUE(tokens[0].comment);
    EXPECT_EQ(tokens[0].data, " x");
    EXPECT_FALSE(tokens[1].comment);
    EXPECT_EQ(tokens[1].data, "/a");
}

TEST(TokenizerTest, QuotedFieldWithEmbeddedLineBreaks) {
    auto tokens = tokenize("\"x\r\ny\",z\r\n");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_TRUE(tokens[0].quoted);
    EXPECT_EQ(tokens[0].data, "x\r\ny");
    EXPECT_FALSE(tokens[0].row_end);
    EXPECT_EQ(tokens[1].data, "z");
    EXPECT_TRUE(tokens[1].row_end);
}

TEST(TokenizerTest, QuotingDisabled) {
    DialectParameters dialect;
    dialect.quote = '\0';
    dialect.escape = '\0';
    auto tokens = tokenize("\"a,b\"\n", dialect);
    EXPECT_EQ(contents(tokens), (std::vector<std::string>{"\"a", "b\""}));
}

TEST(TokenizerTest, BackslashEscape) {
    DialectParameters dialect;
    dialect.escape = '\\';
    auto tokens = tokenize("\"a\\\"b\",\"c\"\"d\"\n", dialect);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].data, "a\"b");
    // Doubled quotes are left alone when the escape is a backslash
    EXPECT_EQ(tokens[1].data, "c\"\"d");
}

TEST(TokenizerTest, EscapeDisabledKeepsDoubledQuotes) {
    DialectParameters dialect;
    dialect.escape = '\0';
    auto tokens = tokenize("\"a\"\"b\"\n", dialect);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].data, "a\"\"b");
}

//-----------------------------------------------------------------------------
// Strict and fuzzy quoting
//-----------------------------------------------------------------------------

TEST(TokenizerTest, StrictQuotingTakesBrokenQuoteLiterally) {
    DialectParameters dialect;
    dialect.quote_mode = QuoteMode::STRICT;
    auto tokens = tokenize("\"x\" ,\"y\"", dialect);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].data, "\"x\" ");
    EXPECT_FALSE(tokens[0].quoted);
    EXPECT_EQ(tokens[1].data, "y");
    EXPECT_TRUE(tokens[1].quoted);
}

TEST(TokenizerTest, FuzzyQuotingDropsBlanks) {
    auto tokens = tokenize("\"x\" ,\"y\"");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].data, "x");
    EXPECT_TRUE(tokens[0].quoted);
    EXPECT_EQ(tokens[1].data, "y");
}

TEST(TokenizerTest, StrictQuoteClosedInLaterPiece) {
    DialectParameters dialect;
    dialect.quote_mode = QuoteMode::STRICT;
    auto tokens = tokenize("\"a,b\" c,d\n", dialect);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].data, "\"a,b\" c");
    EXPECT_FALSE(tokens[0].quoted);
    EXPECT_EQ(tokens[1].data, "d");
}

TEST(TokenizerTest, StrictQuoteRequiresQuoteFirst) {
    DialectParameters dialect;
    dialect.quote_mode = QuoteMode::STRICT;
    auto tokens = tokenize(" \"x\",y\n", dialect);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].data, " \"x\"");
    EXPECT_FALSE(tokens[0].quoted);
}

//-----------------------------------------------------------------------------
// Row ends and recovery
//-----------------------------------------------------------------------------

TEST(TokenizerTest, LastFieldAlwaysEndsRow) {
    for (const std::string data : {"a,b", "a,b\n", "a,", "\"a\"", "a,\"b", "#c"}) {
        auto tokens = tokenize(data);
        ASSERT_FALSE(tokens.empty()) << data;
        EXPECT_TRUE(tokens.back().row_end) << data;
    }
}

TEST(TokenizerTest, TrailingSeparatorGivesEmptyLastField) {
    auto tokens = tokenize("a,");
    EXPECT_EQ(contents(tokens), (std::vector<std::string>{"a", ""}));
}

TEST(TokenizerTest, UnterminatedQuoteIsRecovered) {
    std::istringstream input("a,\"b\nc\n");
    Tokenizer tok(input, DialectParameters::csv());
    ASSERT_TRUE(tok.next());
    EXPECT_EQ(tok.field(), "a");
    ASSERT_TRUE(tok.next());
    EXPECT_TRUE(tok.is_quoted());
    EXPECT_TRUE(tok.at_row_end());
    EXPECT_EQ(tok.field(), "b\nc\n");
    EXPECT_FALSE(tok.next());
    EXPECT_FALSE(tok.has_error());
    EXPECT_FALSE(tok.error().has_value());
}

TEST(TokenizerTest, EmptyInput) {
    EXPECT_TRUE(tokenize("").empty());
}

TEST(TokenizerTest, CrlfLineEndings) {
    auto tokens = tokenize("a,b\r\nc,d\r\n");
    EXPECT_EQ(contents(tokens), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_TRUE(tokens[1].row_end);
    EXPECT_TRUE(tokens[2].row_start);
}

TEST(TokenizerTest, SingleColumnSeparator) {
    DialectParameters dialect;
    dialect.separator = '\n';
    auto tokens = tokenize("a,b\nc;d", dialect);
    EXPECT_EQ(contents(tokens), (std::vector<std::string>{"a,b", "c;d"}));
    EXPECT_TRUE(tokens[0].row_start);
    EXPECT_TRUE(tokens[0].row_end);
}

//-----------------------------------------------------------------------------
// Empty lines
//-----------------------------------------------------------------------------

TEST(TokenizerTest, EmptyLineWithCommaAllowsBlanks) {
    auto tokens = tokenize("a\n \t \n\nb\n");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_FALSE(tokens[0].empty_line);
    EXPECT_TRUE(tokens[1].empty_line);
    EXPECT_TRUE(tokens[2].empty_line);
    EXPECT_FALSE(tokens[3].empty_line);
}

TEST(TokenizerTest, EmptyLineWithTabAllowsSpaces) {
    DialectParameters dialect = DialectParameters::tsv();
    auto tokens = tokenize("a\n  \nb\tc\n", dialect);
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(tokens[1].empty_line);
    EXPECT_FALSE(tokens[2].empty_line);
}

TEST(TokenizerTest, EmptyLineWithSpaceMustBeEmpty) {
    DialectParameters dialect;
    dialect.separator = ' ';
    auto tokens = tokenize("a b\n\n\t\n", dialect);
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(tokens[2].empty_line);
    EXPECT_EQ(tokens[3].data, "\t");
    EXPECT_FALSE(tokens[3].empty_line);
}

TEST(TokenizerTest, QuotedEmptyFieldIsEmptyLine) {
    auto tokens = tokenize("\"\"\n");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].quoted);
    EXPECT_TRUE(tokens[0].empty_line);
}

//-----------------------------------------------------------------------------
// Chunking
//-----------------------------------------------------------------------------

TEST(TokenizerTest, TinyChunksGiveSameFields) {
    const std::string data =
        "# header comment, with separator\n"
        "id,\"name, full\",note\n"
        "1,\"multi\nline\",\"x\"\"y\"\n"
        "\n"
        "2,  \"padded\"  ,last";
    auto expected = tokenize(data);
    ASSERT_EQ(expected.size(), 11u);
    EXPECT_EQ(expected[5].data, "multi\nline");
    EXPECT_EQ(expected[6].data, "x\"y");

    for (size_t chunk : {1u, 2u, 3u, 7u, 16u}) {
        auto tokens = tokenize(data, DialectParameters::csv(), chunk);
        ASSERT_EQ(tokens.size(), expected.size()) << "chunk=" << chunk;
        for (size_t i = 0; i < tokens.size(); ++i) {
            EXPECT_EQ(tokens[i].data, expected[i].data) << "chunk=" << chunk << " i=" << i;
            EXPECT_EQ(tokens[i].offset, expected[i].offset);
            EXPECT_EQ(tokens[i].row_end, expected[i].row_end);
        }
    }
}

TEST(TokenizerTest, BytesReadTracksSource) {
    std::istringstream input("a,b\nc");
    Tokenizer tok(input, DialectParameters::csv());
    while (tok.next()) {
    }
    EXPECT_EQ(tok.bytes_read(), 5u);
}

//-----------------------------------------------------------------------------
// Rows
//-----------------------------------------------------------------------------

TEST(TokenizerTest, NextRowSkipsCommentsAndEmptyLines) {
    std::istringstream input("# c\na,b\n\n\"x\ny\",z\n  \nlast");
    Tokenizer tok(input, DialectParameters::csv());
    std::vector<std::string> row;

    ASSERT_TRUE(tok.next_row(row));
    EXPECT_EQ(row, (std::vector<std::string>{"a", "b"}));
    ASSERT_TRUE(tok.next_row(row));
    EXPECT_EQ(row, (std::vector<std::string>{"x\ny", "z"}));
    ASSERT_TRUE(tok.next_row(row));
    EXPECT_EQ(row, (std::vector<std::string>{"last"}));
    EXPECT_FALSE(tok.next_row(row));
    EXPECT_TRUE(row.empty());
}

TEST(TokenizerTest, FieldViewAndCopy) {
    std::istringstream input("abc,def\n");
    Tokenizer tok(input, DialectParameters::csv());
    ASSERT_TRUE(tok.next());
    std::string kept = tok.current().str();
    EXPECT_EQ(tok.current().data, "abc");
    ASSERT_TRUE(tok.next());
    EXPECT_EQ(kept, "abc");
    EXPECT_EQ(tok.bytes(), "def");
}

//-----------------------------------------------------------------------------
// Errors
//-----------------------------------------------------------------------------

TEST(TokenizerTest, PinnedToItsFieldBuffer) {
    // A moved tokenizer would leave the current field viewing a dead buffer
    EXPECT_FALSE(std::is_copy_constructible<Tokenizer>::value);
    EXPECT_FALSE(std::is_move_constructible<Tokenizer>::value);
    EXPECT_FALSE(std::is_move_assignable<Tokenizer>::value);

    std::istringstream input("\"ab\"\"c\",d\n");
    Tokenizer tok(input, DialectParameters::csv());
    ASSERT_TRUE(tok.next());
    const Field& first = tok.current();
    EXPECT_EQ(first.data, "ab\"c");
    EXPECT_EQ(tok.field().data(), first.data.data());
}

TEST(TokenizerTest, InvalidDialectThrows) {
    std::istringstream input("a,b\n");
    DialectParameters dialect;
    dialect.quote = ',';
    try {
        Tokenizer tok(input, dialect);
        FAIL() << "Expected ParseException";
    } catch (const ParseException& e) {
        EXPECT_EQ(e.error().code, ErrorCode::INVALID_DIALECT);
        EXPECT_EQ(e.error().severity, ErrorSeverity::ERROR);
    }

    DialectParameters newline_comment;
    newline_comment.comment = "\n";
    EXPECT_THROW({ Tokenizer tok(input, newline_comment); }, ParseException);
}

TEST(TokenizerTest, ReadErrorStopsTokenizer) {
    FailingInputBuf buf("a,b\nc,d");
    std::istream input(&buf);
    TokenizerOptions options;
    options.chunk_size = 4;
    Tokenizer tok(input, DialectParameters::csv(), options);

    ASSERT_TRUE(tok.next());
    EXPECT_EQ(tok.field(), "a");
    ASSERT_TRUE(tok.next());
    EXPECT_EQ(tok.field(), "b");
    EXPECT_FALSE(tok.next());
    ASSERT_TRUE(tok.has_error());
    EXPECT_EQ(tok.error()->code, ErrorCode::IO_ERROR);
    // Sticky
    EXPECT_FALSE(tok.next());
    EXPECT_TRUE(tok.has_error());
}

TEST(TokenizerTest, FieldTooLarge) {
    std::istringstream input(std::string(64, 'x'));
    TokenizerOptions options;
    options.chunk_size = 8;
    options.max_piece_size = 16;
    Tokenizer tok(input, DialectParameters::csv(), options);
    EXPECT_FALSE(tok.next());
    ASSERT_TRUE(tok.has_error());
    EXPECT_EQ(tok.error()->code, ErrorCode::FIELD_TOO_LARGE);
}

TEST(TokenizerTest, RecoveryIsTraced) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    std::istringstream input("\"open");
    TokenizerOptions options;
    options.debug.verbose = true;
    options.debug.output = out;
    {
        Tokenizer tok(input, DialectParameters::csv(), options);
        while (tok.next()) {
        }
    }
    fflush(out);
    rewind(out);
    std::string log;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), out)) {
        log += buffer;
    }
    fclose(out);
    EXPECT_NE(log.find("unterminated quoted field"), std::string::npos);
}
