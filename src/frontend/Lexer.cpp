//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the Magolor lexical analyzer.
///
/// @details Keywords live in a sorted array searched with std::lower_bound.
/// Several spellings share a kind: `fn`/`func` are both KwFunc, `true` and
/// `false` are BoolLiteral, `nil`/`null` are NilLiteral, and the four
/// primitive type names are Type.
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontend/Lexer.hpp"

#include "frontend/common/CharUtils.hpp"

#include <algorithm>
#include <array>

namespace magolor::frontend
{

namespace
{
struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Must stay sorted by key.
constexpr std::array<KeywordEntry, 20> kKeywordTable = {{
    {"break", TokenKind::KwBreak},
    {"continue", TokenKind::KwContinue},
    {"else", TokenKind::KwElse},
    {"false", TokenKind::BoolLiteral},
    {"float", TokenKind::Type},
    {"fn", TokenKind::KwFunc},
    {"for", TokenKind::KwFor},
    {"func", TokenKind::KwFunc},
    {"if", TokenKind::KwIf},
    {"in", TokenKind::KwIn},
    {"int", TokenKind::Type},
    {"loop", TokenKind::KwLoop},
    {"nil", TokenKind::NilLiteral},
    {"null", TokenKind::NilLiteral},
    {"return", TokenKind::KwReturn},
    {"string", TokenKind::Type},
    {"true", TokenKind::BoolLiteral},
    {"typeof", TokenKind::KwTypeof},
    {"void", TokenKind::Type},
    {"while", TokenKind::KwWhile},
}};
} // namespace

Lexer::Lexer(std::string source, uint32_t fileId) : source_(std::move(source)), fileId_(fileId)
{
}

std::optional<TokenKind> Lexer::lookupKeyword(std::string_view name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, std::string_view key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

SourceLoc Lexer::currentLoc() const
{
    return SourceLoc{fileId_, line_, column_};
}

void Lexer::skipWhitespace()
{
    while (!eof() && char_utils::isWhitespace(peekChar()))
        getChar();
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    while (!eof() && char_utils::isIdentifierChar(peekChar()))
        tok.text.push_back(getChar());
    tok.kind = lookupKeyword(tok.text).value_or(TokenKind::Identifier);
    return tok;
}

Token Lexer::lexNumber()
{
    Token tok;
    tok.kind = TokenKind::IntLiteral;
    tok.loc = currentLoc();
    while (!eof() && char_utils::isDigit(peekChar()))
        tok.text.push_back(getChar());

    if (peekChar() == '.')
    {
        tok.kind = TokenKind::FloatLiteral;
        tok.text.push_back(getChar());
        while (!eof() && char_utils::isDigit(peekChar()))
            tok.text.push_back(getChar());
    }
    return tok;
}

Token Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();
    getChar(); // opening quote

    std::string body;
    while (!eof() && peekChar() != '"')
        body.push_back(getChar());

    if (eof())
    {
        tok.kind = TokenKind::Illegal;
        tok.text = "\"" + body;
        return tok;
    }

    getChar(); // closing quote
    tok.kind = TokenKind::StringLiteral;
    tok.text = std::move(body);
    return tok;
}

Token Lexer::lexOperator(char second, TokenKind pairKind, TokenKind singleKind)
{
    Token tok;
    tok.loc = currentLoc();
    tok.text.push_back(getChar());
    if (peekChar() == second)
    {
        tok.text.push_back(getChar());
        tok.kind = pairKind;
    }
    else
    {
        tok.kind = singleKind;
    }
    return tok;
}

Token Lexer::next()
{
    skipWhitespace();

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    const char c = peekChar();
    if (char_utils::isIdentifierChar(c))
        return lexIdentifierOrKeyword();
    if (char_utils::isDigit(c))
        return lexNumber();

    switch (c)
    {
        case '"':
            return lexString();
        case '=':
            return lexOperator('=', TokenKind::EqualEqual, TokenKind::Assign);
        case '!':
            return lexOperator('=', TokenKind::NotEqual, TokenKind::Bang);
        case '<':
            return lexOperator('=', TokenKind::LessEqual, TokenKind::Less);
        case '>':
            return lexOperator('=', TokenKind::GreaterEqual, TokenKind::Greater);
        case '&':
            return lexOperator('&', TokenKind::AmpAmp, TokenKind::Illegal);
        case '|':
            return lexOperator('|', TokenKind::PipePipe, TokenKind::Illegal);
        default:
            break;
    }

    Token tok;
    tok.loc = currentLoc();
    tok.text.push_back(getChar());
    switch (c)
    {
        case '(':
            tok.kind = TokenKind::LParen;
            break;
        case ')':
            tok.kind = TokenKind::RParen;
            break;
        case '{':
            tok.kind = TokenKind::LBrace;
            break;
        case '}':
            tok.kind = TokenKind::RBrace;
            break;
        case ',':
            tok.kind = TokenKind::Comma;
            break;
        case ';':
            tok.kind = TokenKind::Semicolon;
            break;
        case '+':
            tok.kind = TokenKind::Plus;
            break;
        case '-':
            tok.kind = TokenKind::Minus;
            break;
        case '*':
            tok.kind = TokenKind::Star;
            break;
        case '/':
            tok.kind = TokenKind::Slash;
            break;
        case '%':
            tok.kind = TokenKind::Percent;
            break;
        default:
            tok.kind = TokenKind::Illegal;
            break;
    }
    return tok;
}

} // namespace magolor::frontend
