//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_magolor_lexer.cpp
// Purpose: Unit tests for Magolor lexer tokenization and source positions.
// Key invariants: Tokens carry 1-based line/column of their first byte; EOF
//                 repeats once input is exhausted.
// Ownership/Lifetime: N/A (test).
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"

#include <string>
#include <vector>

using namespace magolor::frontend;

namespace
{
std::vector<Token> lexAll(const std::string &src)
{
    Lexer lex(src, 1);
    std::vector<Token> tokens;
    for (Token t = lex.next();; t = lex.next())
    {
        tokens.push_back(t);
        if (t.is(TokenKind::Eof))
            break;
    }
    return tokens;
}

std::vector<TokenKind> kindsOf(const std::string &src)
{
    std::vector<TokenKind> kinds;
    for (const auto &t : lexAll(src))
        kinds.push_back(t.kind);
    return kinds;
}
} // namespace

TEST(MagolorLexer, DeclarationWithComparison)
{
    std::vector<TokenKind> expected = {TokenKind::Type,
                                       TokenKind::Identifier,
                                       TokenKind::Assign,
                                       TokenKind::IntLiteral,
                                       TokenKind::LessEqual,
                                       TokenKind::IntLiteral,
                                       TokenKind::Semicolon,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf("int x = 5 <= 10;"), expected);
}

TEST(MagolorLexer, FunctionHeader)
{
    auto tokens = lexAll("int fn main(int x, string y) {");
    ASSERT_EQ(tokens.size(), 11u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Type);
    EXPECT_EQ(tokens[0].text, "int");
    EXPECT_EQ(tokens[1].kind, TokenKind::KwFunc);
    EXPECT_EQ(tokens[2].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[2].text, "main");
    EXPECT_EQ(tokens[3].kind, TokenKind::LParen);
    EXPECT_EQ(tokens[6].kind, TokenKind::Comma);
    EXPECT_EQ(tokens[7].text, "string");
    EXPECT_EQ(tokens[9].kind, TokenKind::RParen);
    EXPECT_EQ(tokens[10].kind, TokenKind::LBrace);
}

TEST(MagolorLexer, EofIsIdempotent)
{
    Lexer lex("x", 1);
    EXPECT_EQ(lex.next().kind, TokenKind::Identifier);
    EXPECT_EQ(lex.next().kind, TokenKind::Eof);
    EXPECT_EQ(lex.next().kind, TokenKind::Eof);
    EXPECT_EQ(lex.next().kind, TokenKind::Eof);
}

TEST(MagolorLexer, EmptyAndBlankInput)
{
    EXPECT_EQ(kindsOf(""), std::vector<TokenKind>{TokenKind::Eof});
    EXPECT_EQ(kindsOf(" \t\r\n  "), std::vector<TokenKind>{TokenKind::Eof});
}

TEST(MagolorLexer, KeywordTable)
{
    EXPECT_EQ(Lexer::lookupKeyword("fn"), TokenKind::KwFunc);
    EXPECT_EQ(Lexer::lookupKeyword("func"), TokenKind::KwFunc);
    EXPECT_EQ(Lexer::lookupKeyword("void"), TokenKind::Type);
    EXPECT_EQ(Lexer::lookupKeyword("float"), TokenKind::Type);
    EXPECT_EQ(Lexer::lookupKeyword("true"), TokenKind::BoolLiteral);
    EXPECT_EQ(Lexer::lookupKeyword("null"), TokenKind::NilLiteral);
    EXPECT_EQ(Lexer::lookupKeyword("typeof"), TokenKind::KwTypeof);
    EXPECT_EQ(Lexer::lookupKeyword("in"), TokenKind::KwIn);
    EXPECT_FALSE(Lexer::lookupKeyword("function").has_value());
    EXPECT_FALSE(Lexer::lookupKeyword("Int").has_value());
}

TEST(MagolorLexer, IdentifiersMayContainUnderscoreButNotDigits)
{
    auto tokens = lexAll("_foo_bar x1");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].text, "_foo_bar");
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[1].text, "x");
    EXPECT_EQ(tokens[2].kind, TokenKind::IntLiteral);
    EXPECT_EQ(tokens[2].text, "1");
}

TEST(MagolorLexer, NumbersAndFloats)
{
    auto tokens = lexAll("42 3.14 7.");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntLiteral);
    EXPECT_EQ(tokens[0].text, "42");
    EXPECT_EQ(tokens[1].kind, TokenKind::FloatLiteral);
    EXPECT_EQ(tokens[1].text, "3.14");
    EXPECT_EQ(tokens[2].kind, TokenKind::FloatLiteral);
    EXPECT_EQ(tokens[2].text, "7.");
}

TEST(MagolorLexer, StringsHaveNoEscapes)
{
    auto tokens = lexAll(R"("Hello, \n" "")");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[0].text, R"(Hello, \n)");
    EXPECT_EQ(tokens[1].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].text, "");
}

TEST(MagolorLexer, UnterminatedStringIsIllegal)
{
    auto tokens = lexAll("x = \"abc");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].kind, TokenKind::Illegal);
    EXPECT_EQ(tokens[2].text, "\"abc");
    EXPECT_EQ(tokens[3].kind, TokenKind::Eof);
}

TEST(MagolorLexer, TwoCharacterOperators)
{
    std::vector<TokenKind> expected = {TokenKind::EqualEqual,
                                       TokenKind::NotEqual,
                                       TokenKind::GreaterEqual,
                                       TokenKind::AmpAmp,
                                       TokenKind::PipePipe,
                                       TokenKind::Bang,
                                       TokenKind::Less,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf("== != >= && || ! <"), expected);
}

TEST(MagolorLexer, UnknownBytesAreIllegal)
{
    auto tokens = lexAll("& | @");
    ASSERT_EQ(tokens.size(), 4u);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_EQ(tokens[i].kind, TokenKind::Illegal);
    EXPECT_EQ(tokens[0].text, "&");
    EXPECT_EQ(tokens[2].text, "@");
}

TEST(MagolorLexer, TracksLineAndColumn)
{
    auto tokens = lexAll("int\n  x =\n\t5");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].loc.file_id, 1u);
    EXPECT_EQ(tokens[0].loc.line, 1u);
    EXPECT_EQ(tokens[0].loc.column, 1u);
    EXPECT_EQ(tokens[1].loc.line, 2u);
    EXPECT_EQ(tokens[1].loc.column, 3u);
    EXPECT_EQ(tokens[2].loc.column, 5u);
    EXPECT_EQ(tokens[3].loc.line, 3u);
    EXPECT_EQ(tokens[3].loc.column, 2u);
}
