/// @file test_lexer.cpp
/// @brief Unit tests for lexjson::Lexer: token rules, positions, diagnostics.

#include <lexjson/lexjson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace lexjson;

namespace {

std::vector<TokenType> types_of(std::string_view source) {
    std::vector<TokenType> out;
    for (const auto& tok : tokenize(source)) out.push_back(tok.type);
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Token classes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Lexer, EmptySourceHasNoTokens) {
    Lexer lexer("");
    EXPECT_FALSE(lexer.next().has_value());
}

TEST(Lexer, WhitespaceRunIsOneToken) {
    auto toks = tokenize(" \t  \t");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type, TokenType::Whitespace);
    EXPECT_EQ(toks[0].text, " \t  \t");
}

TEST(Lexer, EachNewlineIsOwnToken) {
    EXPECT_EQ(types_of("\n\n"),
              (std::vector<TokenType>{TokenType::Newline, TokenType::Newline}));
}

TEST(Lexer, Punctuation) {
    EXPECT_EQ(types_of("{}[],:"),
              (std::vector<TokenType>{TokenType::LeftBrace, TokenType::RightBrace,
                                      TokenType::LeftBracket, TokenType::RightBracket,
                                      TokenType::Comma, TokenType::Colon}));
}

TEST(Lexer, Keywords) {
    auto toks = tokenize("null true false");
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[0].type, TokenType::Null);
    EXPECT_EQ(toks[2].type, TokenType::Boolean);
    EXPECT_EQ(toks[2].text, "true");
    EXPECT_EQ(toks[4].type, TokenType::Boolean);
    EXPECT_EQ(toks[4].text, "false");
}

TEST(Lexer, KeywordMatchesAsPrefix) {
    auto toks = tokenize("nullx");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].type, TokenType::Null);
    EXPECT_EQ(toks[1].type, TokenType::Error);
    EXPECT_EQ(toks[1].text, "x");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Numbers: [+-]?(\d*\.)?\d+
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LexerNumbers, AcceptedForms) {
    for (const char* text : {"0", "42", "-7", "+5", "3.25", ".5", "-.5", "+0.0", "007"}) {
        auto toks = tokenize(text);
        ASSERT_EQ(toks.size(), 1u) << text;
        EXPECT_EQ(toks[0].type, TokenType::Number) << text;
        EXPECT_EQ(toks[0].text, text);
    }
}

TEST(LexerNumbers, TrailingPointIsNotPartOfNumber) {
    auto toks = tokenize("1.");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].type, TokenType::Number);
    EXPECT_EQ(toks[0].text, "1");
    EXPECT_EQ(toks[1].type, TokenType::Error);
    EXPECT_EQ(toks[1].error, errc::invalid_number);
}

TEST(LexerNumbers, SecondPointStartsNewNumber) {
    auto toks = tokenize("1.2.3");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].text, "1.2");
    EXPECT_EQ(toks[1].text, ".3");
    EXPECT_EQ(toks[1].type, TokenType::Number);
}

TEST(LexerNumbers, NoExponent) {
    auto toks = tokenize("1e5");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].text, "1");
    EXPECT_EQ(toks[1].type, TokenType::Error);
    EXPECT_EQ(toks[1].text, "e5");
}

TEST(LexerNumbers, LoneSignIsInvalidNumber) {
    auto toks = tokenize("-");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type, TokenType::Error);
    EXPECT_EQ(toks[0].error, errc::invalid_number);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Strings
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LexerStrings, ValueHasQuotesStripped) {
    auto toks = tokenize(R"("bob")");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type, TokenType::String);
    EXPECT_EQ(toks[0].text, R"("bob")");
    EXPECT_EQ(toks[0].value, "bob");
}

TEST(LexerStrings, EscapesAreKeptRaw) {
    auto toks = tokenize(R"("say \"hi\" \\ there")");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type, TokenType::String);
    EXPECT_EQ(toks[0].value, R"(say \"hi\" \\ there)");
}

TEST(LexerStrings, EmptyString) {
    auto toks = tokenize(R"("")");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].value, "");
}

TEST(LexerStrings, OtherEscapesAreErrors) {
    auto toks = tokenize(R"("a\nb")");
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks[0].type, TokenType::Error);
    EXPECT_EQ(toks[0].error, errc::invalid_escape);
}

TEST(LexerStrings, NewlineTerminatesString) {
    auto toks = tokenize("\"abc\ndef\"");
    ASSERT_GE(toks.size(), 2u);
    EXPECT_EQ(toks[0].type, TokenType::Error);
    EXPECT_EQ(toks[0].error, errc::unterminated_string);
    EXPECT_EQ(toks[0].text, "\"abc");
    EXPECT_EQ(toks[1].type, TokenType::Newline);
}

TEST(LexerStrings, EndOfInputTerminatesString) {
    auto toks = tokenize("\"abc");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type, TokenType::Error);
    EXPECT_EQ(toks[0].error, errc::unterminated_string);
}

TEST(LexerStrings, TabsAndUtf8AreLiteral) {
    auto toks = tokenize("\"a\tb \xC3\xA9\"");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].type, TokenType::String);
    EXPECT_EQ(toks[0].value, "a\tb \xC3\xA9");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Unmatched input
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Lexer, UnmatchedRunStopsAtBoundary) {
    auto toks = tokenize("not valid");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].type, TokenType::Error);
    EXPECT_EQ(toks[0].text, "not");
    EXPECT_EQ(toks[0].error, errc::invalid_token);
    EXPECT_EQ(toks[1].type, TokenType::Whitespace);
    EXPECT_EQ(toks[2].text, "valid");
}

TEST(Lexer, CarriageReturnIsUnmatched) {
    auto toks = tokenize("1\r\n");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[1].type, TokenType::Error);
    EXPECT_EQ(toks[1].text, "\r");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Positions and diagnostics
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LexerPositions, LineAndColumnTracking) {
    auto toks = tokenize("{\n  \"a\": 1\n}");
    // { NL WS "a" : WS 1 NL }
    ASSERT_EQ(toks.size(), 9u);
    EXPECT_EQ(toks[0].location.line, 1u);
    EXPECT_EQ(toks[0].location.column, 1u);
    EXPECT_EQ(toks[3].type, TokenType::String);
    EXPECT_EQ(toks[3].location.line, 2u);
    EXPECT_EQ(toks[3].location.column, 3u);
    EXPECT_EQ(toks[3].location.offset, 4u);
    EXPECT_EQ(toks[6].type, TokenType::Number);
    EXPECT_EQ(toks[6].location.column, 8u);
    EXPECT_EQ(toks[8].location.line, 3u);
    EXPECT_EQ(toks[8].location.column, 1u);
}

TEST(LexerPositions, LocationPointsAtNextCharacter) {
    Lexer lexer("ab\ncd");
    auto tok = lexer.next();
    ASSERT_TRUE(tok.has_value());
    EXPECT_EQ(lexer.location().column, 3u);
    (void)lexer.next();  // newline
    EXPECT_EQ(lexer.location().line, 2u);
    EXPECT_EQ(lexer.location().column, 1u);
}

TEST(LexerPositions, FormatErrorShowsLineAndCaret) {
    Lexer lexer("[1,\n  2 x]");
    Token bad;
    while (auto tok = lexer.next()) {
        if (tok->type == TokenType::Error) { bad = *tok; break; }
    }
    ASSERT_EQ(bad.type, TokenType::Error);
    EXPECT_EQ(bad.text, "x");
    EXPECT_EQ(lexer.format_error(bad, "boom"), "boom\n  2 x]\n    ^");
}

TEST(LexerPositions, FormatErrorAtEndOfInput) {
    Lexer lexer("[1,");
    EXPECT_EQ(lexer.format_error("eof"), "eof\n[1,\n   ^");
    EXPECT_EQ(lexer.eof_location().column, 4u);
}
