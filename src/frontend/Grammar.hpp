//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Grammar.hpp
/// @brief Operator binding strengths shared by every Magolor parser.
///
/// | Level        | Operators           |
/// |--------------|---------------------|
/// | Call         | `(`                 |
/// | Prefix       | unary `-` `+` `!`   |
/// | Product      | `*` `/` `%`         |
/// | Sum          | `+` `-`             |
/// | LessGreater  | `<` `>` `<=` `>=`   |
/// | Equals       | `==` `!=`           |
/// | And          | `&&`                |
/// | Or           | `||`                |
/// | Lowest       | everything else     |
///
/// The table is a constexpr array; parsers never mutate it, so any number of
/// them may consult it concurrently.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Token.hpp"

#include <algorithm>
#include <array>

namespace magolor::frontend
{

/// @brief Binding strength of an operator; larger binds tighter.
enum class Precedence : int
{
    Lowest = 1,
    Or,
    And,
    Equals,
    LessGreater,
    Sum,
    Product,
    Prefix,
    Call,
};

struct PrecedenceEntry
{
    TokenKind kind;
    Precedence precedence;
};

inline constexpr std::array<PrecedenceEntry, 14> kPrecedenceTable{{
    {TokenKind::PipePipe, Precedence::Or},
    {TokenKind::AmpAmp, Precedence::And},
    {TokenKind::EqualEqual, Precedence::Equals},
    {TokenKind::NotEqual, Precedence::Equals},
    {TokenKind::Less, Precedence::LessGreater},
    {TokenKind::Greater, Precedence::LessGreater},
    {TokenKind::LessEqual, Precedence::LessGreater},
    {TokenKind::GreaterEqual, Precedence::LessGreater},
    {TokenKind::Plus, Precedence::Sum},
    {TokenKind::Minus, Precedence::Sum},
    {TokenKind::Star, Precedence::Product},
    {TokenKind::Slash, Precedence::Product},
    {TokenKind::Percent, Precedence::Product},
    {TokenKind::LParen, Precedence::Call},
}};

/// @brief Look up the binding strength of @p kind.
/// @return The table entry, or Precedence::Lowest for kinds not listed.
[[nodiscard]] constexpr Precedence precedenceOf(TokenKind kind) noexcept
{
    const auto it = std::find_if(kPrecedenceTable.begin(),
                                 kPrecedenceTable.end(),
                                 [kind](const PrecedenceEntry &e) { return e.kind == kind; });
    return it == kPrecedenceTable.end() ? Precedence::Lowest : it->precedence;
}

} // namespace magolor::frontend
