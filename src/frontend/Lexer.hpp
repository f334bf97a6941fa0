//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Hand-written scanner turning Magolor source text into tokens.
///
/// @details The lexer is pull-based: each call to next() skips whitespace and
/// returns exactly one token.  It knows nothing about syntax and never
/// reports diagnostics itself; malformed input surfaces as `Illegal` tokens
/// for the parser to report.
///
/// ## Token Rules
///
/// - Identifiers are maximal runs of ASCII letters and `_`.  Digits are not
///   identifier characters.
/// - Numbers are digit runs with an optional `.digits` fraction.  A fraction
///   makes the token a FloatLiteral.
/// - Strings are `"`-delimited with no escape processing.  A string that
///   reaches end of input without its closing quote becomes an `Illegal`
///   token whose text starts with `"`.
/// - `&` and `|` are only valid doubled; a lone one is `Illegal`.
///
/// @invariant After end of input every call returns an Eof token with empty
///            text.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Token.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace magolor::frontend
{

/// @brief Streaming tokenizer over one owned source buffer.
class Lexer
{
  public:
    /// @brief Create a lexer over @p source.
    /// @param source Text to tokenize; the lexer keeps its own copy.
    /// @param fileId SourceManager id stamped into every token location.
    explicit Lexer(std::string source, uint32_t fileId = 0);

    /// @brief Produce the next token, advancing the cursor.
    Token next();

    /// @brief Classify an identifier spelling against the keyword table.
    /// @return The keyword kind, or std::nullopt for plain identifiers.
    static std::optional<TokenKind> lookupKeyword(std::string_view name);

  private:
    [[nodiscard]] char peekChar(size_t offset = 0) const;
    char getChar();
    [[nodiscard]] bool eof() const;
    [[nodiscard]] SourceLoc currentLoc() const;

    void skipWhitespace();
    Token lexIdentifierOrKeyword();
    Token lexNumber();
    Token lexString();

    /// @brief Build a one- or two-byte operator token.
    /// @details Consumes the current byte; when the next byte equals
    ///          @p second it is consumed too and @p pairKind is produced.
    Token lexOperator(char second, TokenKind pairKind, TokenKind singleKind);

    std::string source_;
    size_t pos_ = 0;
    uint32_t fileId_;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
};

} // namespace magolor::frontend
