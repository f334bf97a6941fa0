//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_magolor_grammar.cpp
// Purpose: Checks the operator precedence table and token spellings.
// Key invariants: Unlisted token kinds bind at Lowest.
// Ownership/Lifetime: N/A (test).
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/Grammar.hpp"
#include "frontend/Token.hpp"

#include <string>

using namespace magolor::frontend;

static_assert(precedenceOf(TokenKind::Star) > precedenceOf(TokenKind::Plus));
static_assert(precedenceOf(TokenKind::AmpAmp) > precedenceOf(TokenKind::PipePipe));

TEST(MagolorGrammar, PrecedenceLevels)
{
    EXPECT_EQ(precedenceOf(TokenKind::PipePipe), Precedence::Or);
    EXPECT_EQ(precedenceOf(TokenKind::AmpAmp), Precedence::And);
    EXPECT_EQ(precedenceOf(TokenKind::EqualEqual), Precedence::Equals);
    EXPECT_EQ(precedenceOf(TokenKind::NotEqual), Precedence::Equals);
    EXPECT_EQ(precedenceOf(TokenKind::LessEqual), Precedence::LessGreater);
    EXPECT_EQ(precedenceOf(TokenKind::Greater), Precedence::LessGreater);
    EXPECT_EQ(precedenceOf(TokenKind::Minus), Precedence::Sum);
    EXPECT_EQ(precedenceOf(TokenKind::Percent), Precedence::Product);
    EXPECT_EQ(precedenceOf(TokenKind::LParen), Precedence::Call);
}

TEST(MagolorGrammar, UnlistedKindsAreLowest)
{
    EXPECT_EQ(precedenceOf(TokenKind::Assign), Precedence::Lowest);
    EXPECT_EQ(precedenceOf(TokenKind::Semicolon), Precedence::Lowest);
    EXPECT_EQ(precedenceOf(TokenKind::Identifier), Precedence::Lowest);
    EXPECT_EQ(precedenceOf(TokenKind::Bang), Precedence::Lowest);
}

TEST(MagolorGrammar, TokenSpellings)
{
    EXPECT_EQ(std::string(tokenKindToString(TokenKind::Identifier)), "IDENT");
    EXPECT_EQ(std::string(tokenKindToString(TokenKind::Eof)), "EOF");
    EXPECT_EQ(std::string(tokenKindToString(TokenKind::Illegal)), "ILLEGAL");
    EXPECT_EQ(std::string(tokenKindToString(TokenKind::Assign)), "=");
    EXPECT_EQ(std::string(tokenKindToString(TokenKind::KwFunc)), "fn");
    EXPECT_EQ(std::string(tokenKindToString(TokenKind::Type)), "TYPE");
}
