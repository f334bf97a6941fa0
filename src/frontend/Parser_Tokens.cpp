//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token window and error recording for the Magolor parser.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace magolor::frontend
{

Parser::Parser(Lexer &lexer, magolor::support::DiagnosticEngine &diag) : lexer_(lexer), diag_(diag)
{
    for (auto &slot : window_)
        slot = lexer_.next();
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

void Parser::nextToken()
{
    window_[0] = std::move(window_[1]);
    window_[1] = std::move(window_[2]);
    window_[2] = lexer_.next();
}

bool Parser::curIs(TokenKind kind) const
{
    return window_[0].kind == kind;
}

bool Parser::peekIs(TokenKind kind) const
{
    return window_[1].kind == kind;
}

bool Parser::expectPeek(TokenKind kind)
{
    if (peekIs(kind))
    {
        nextToken();
        return true;
    }
    errorAt(peek().loc,
            std::string("expected next token to be ") + tokenKindToString(kind) + ", got " +
                tokenKindToString(peek().kind) + " instead");
    return false;
}

bool Parser::expectEnd()
{
    if (peekIs(TokenKind::Semicolon))
        nextToken();
    if (peekIs(TokenKind::Eof))
        return true;
    errorAt(peek().loc, "unexpected token after expression: " + peek().text, kTrailingInputCode);
    return false;
}

//===----------------------------------------------------------------------===//
// Error Reporting
//===----------------------------------------------------------------------===//

void Parser::errorAt(SourceLoc loc, std::string message, const char *code)
{
    errors_.push_back(message);
    diag_.report({magolor::support::Severity::Error, std::move(message), loc, code});
}

void Parser::skipNestedConstruct()
{
    nestingOverflow_ = true;
    unsigned braces = 0;
    for (;;)
    {
        if (curIs(TokenKind::LBrace))
            ++braces;
        else if (curIs(TokenKind::RBrace) && braces > 0 && --braces == 0)
            return;
        if (peekIs(TokenKind::Eof))
            return;
        if (braces == 0 && (peekIs(TokenKind::Semicolon) || peekIs(TokenKind::RBrace)))
            return;
        nextToken();
    }
}

} // namespace magolor::frontend
