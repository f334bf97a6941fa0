//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the Magolor lexer.
///
/// Tokens fall into six groups:
///
/// 1. **Structural**: parentheses, braces, comma, semicolon
/// 2. **Literal classes**: identifiers and int/float/string/bool/nil literals
/// 3. **Operators**: arithmetic, comparison, logical, and assignment
/// 4. **Keywords**: control flow, `fn`, `typeof`, and the primitive type names
/// 5. **Type**: one kind covering `int`, `string`, `float`, and `void`; the
///    token text tells them apart
/// 6. **Sentinels**: `Illegal` for unrecognized input, `Eof` at end of input
///
/// Tokens are value types that own their text.  The text of a string literal
/// excludes the quotes; every other token carries its exact spelling.  The
/// end-of-file token has empty text.
///
/// @invariant Each token has a valid TokenKind; locations are ambient and
///            used only for diagnostics.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>

namespace magolor::frontend
{

using SourceLoc = magolor::support::SourceLoc;

/// @brief Enumerates every token kind the lexer can produce.
enum class TokenKind
{
    // Sentinels
    Illegal,
    Eof,

    // Literal classes
    Identifier,
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    BoolLiteral,
    NilLiteral,

    // Structural
    LParen,
    RParen,
    LBrace,
    RBrace,
    Comma,
    Semicolon,

    // Operators
    Plus,         ///< `+`
    Minus,        ///< `-`
    Star,         ///< `*`
    Slash,        ///< `/`
    Percent,      ///< `%`
    Assign,       ///< `=`
    EqualEqual,   ///< `==`
    NotEqual,     ///< `!=`
    Less,         ///< `<`
    Greater,      ///< `>`
    LessEqual,    ///< `<=`
    GreaterEqual, ///< `>=`
    Bang,         ///< `!`
    AmpAmp,       ///< `&&`
    PipePipe,     ///< `||`

    // Keywords
    KwIf,
    KwElse,
    KwWhile,
    KwFor,
    KwLoop,
    KwIn,
    KwFunc, ///< `fn` or `func`
    KwReturn,
    Type, ///< `int`, `string`, `float`, `void`
    KwVoid,
    KwTypeof,
    KwBreak,
    KwContinue,
};

/// @brief A single lexical token.
struct Token
{
    TokenKind kind = TokenKind::Eof;

    /// @brief Exact spelling; string literal bodies without quotes.
    std::string text;

    /// @brief Position of the token's first byte.
    SourceLoc loc{};

    /// @brief Check if this token is of the given kind.
    [[nodiscard]] bool is(TokenKind k) const
    {
        return kind == k;
    }

    /// @brief Check if this token is any of the given kinds.
    template <typename... Kinds> [[nodiscard]] bool isOneOf(Kinds... ks) const
    {
        return ((kind == ks) || ...);
    }
};

/// @brief Display name of a token kind as it appears in diagnostics.
/// @details Punctuation and operators use their symbol, literal classes use
///          upper-case class names (`IDENT`, `INT`), keywords use their
///          spelling, and `Type` is `TYPE`.
const char *tokenKindToString(TokenKind kind);

} // namespace magolor::frontend
