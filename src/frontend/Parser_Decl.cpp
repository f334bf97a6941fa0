//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Decl.cpp
/// @brief Function and variable declarations for the Magolor parser.
///
/// @details A statement starting with a type name is decided by the next two
/// tokens only:
///
/// | peek      | peek-peek | Parsed as                         |
/// |-----------|-----------|-----------------------------------|
/// | `fn`      | any       | function with explicit return type |
/// | IDENT     | `(`       | function                          |
/// | otherwise |           | variable declaration              |
///
/// The declaration rule reports its own expectPeek error when the shape does
/// not match, so `int foo` fails with "expected next token to be =".
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace magolor::frontend
{

StmtPtr Parser::parseTypedStatement()
{
    if (peekIs(TokenKind::KwFunc))
    {
        const SourceLoc loc = current().loc;
        Token returnType = current();
        nextToken();
        return parseFunction(loc, std::move(returnType));
    }
    if (peekIs(TokenKind::Identifier) && peekPeek().is(TokenKind::LParen))
        return parseFunction(current().loc, current());
    return parseVarDecl();
}

StmtPtr Parser::parseVarDecl()
{
    const SourceLoc loc = current().loc;
    Token declaredType = current();
    if (!expectPeek(TokenKind::Identifier))
        return nullptr;
    std::string name = current().text;
    if (!expectPeek(TokenKind::Assign))
        return nullptr;
    nextToken();
    ExprPtr initializer = parseExpression(Precedence::Lowest);
    if (!initializer)
        return nullptr;
    if (peekIs(TokenKind::Semicolon))
        nextToken();
    return std::make_unique<VarDeclStmt>(
        loc, std::move(declaredType), std::move(name), std::move(initializer));
}

StmtPtr Parser::parseFunction(SourceLoc loc, Token returnType)
{
    if (!expectPeek(TokenKind::Identifier))
        return nullptr;
    auto fn = std::make_unique<FunctionStmt>(loc, std::move(returnType), current().text);
    if (!expectPeek(TokenKind::LParen))
        return nullptr;
    if (!parseParams(fn->params))
        return nullptr;
    if (!expectPeek(TokenKind::LBrace))
        return nullptr;
    fn->body = parseBlock();
    return fn;
}

/// Entered on `(`; returns positioned on `)`.
bool Parser::parseParams(std::vector<Param> &params)
{
    if (peekIs(TokenKind::RParen))
    {
        nextToken();
        return true;
    }

    nextToken();
    if (!parseParam(params))
        return false;

    while (peekIs(TokenKind::Comma))
    {
        nextToken();
        nextToken();
        if (!parseParam(params))
            return false;
    }
    return expectPeek(TokenKind::RParen);
}

bool Parser::parseParam(std::vector<Param> &params)
{
    if (!curIs(TokenKind::Type))
    {
        errorAt(current().loc,
                std::string("expected parameter type, got ") + tokenKindToString(current().kind));
        return false;
    }
    Param param;
    param.type = current();
    param.loc = current().loc;
    if (!expectPeek(TokenKind::Identifier))
        return false;
    param.name = current().text;
    params.push_back(std::move(param));
    return true;
}

} // namespace magolor::frontend
