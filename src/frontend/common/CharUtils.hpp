//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/common/CharUtils.hpp
// Purpose: Character classification used by the Magolor lexer.
//
// All predicates are ASCII-only; bytes above 0x7F never classify as letters,
// digits, or whitespace and therefore surface as ILLEGAL tokens.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace magolor::frontend::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character belongs to an identifier.
/// @details Magolor identifiers are letters and underscores only; digits end
///          the identifier and start a new number token.
[[nodiscard]] constexpr bool isIdentifierChar(char c) noexcept
{
    return isLetter(c) || c == '_';
}

/// @brief Check if character is skipped between tokens.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace magolor::frontend::char_utils
