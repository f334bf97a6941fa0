//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for the Magolor parser.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace magolor::frontend
{

Program Parser::parseProgram()
{
    Program program;
    while (!curIs(TokenKind::Eof))
    {
        if (auto stmt = parseStatement())
            program.statements.push_back(std::move(stmt));
        nextToken();
    }
    return program;
}

StmtPtr Parser::parseStatement()
{
    if (curIs(TokenKind::RBrace) || curIs(TokenKind::Semicolon) || curIs(TokenKind::Eof))
        return nullptr;

    if (++stmtDepth_ > kMaxStmtDepth)
    {
        --stmtDepth_;
        errorAt(current().loc, "statement nesting too deep (limit: 256)");
        skipNestedConstruct();
        return nullptr;
    }
    struct DepthGuard
    {
        unsigned &d;
        ~DepthGuard() { --d; }
    } stmtGuard_{stmtDepth_};

    switch (current().kind)
    {
        case TokenKind::KwIf:
            return parseIf();
        case TokenKind::KwReturn:
            return parseReturn();
        case TokenKind::KwBreak:
            return parseBreak();
        case TokenKind::KwContinue:
            return parseContinue();
        case TokenKind::KwWhile:
            return parseWhile();
        case TokenKind::KwLoop:
            return parseLoop();
        case TokenKind::KwFor:
            return parseFor();
        case TokenKind::KwFunc:
        {
            const SourceLoc loc = current().loc;
            return parseFunction(loc, Token{TokenKind::KwVoid, "void", loc});
        }
        case TokenKind::Type:
        case TokenKind::KwVoid:
            return parseTypedStatement();
        case TokenKind::LBrace:
            return parseBlock();
        default:
            return parseExprStatement();
    }
}

StmtPtr Parser::parseExprStatement()
{
    const SourceLoc loc = current().loc;
    nestingOverflow_ = false;
    ExprPtr expr = parseExpression(Precedence::Lowest);
    if (!expr)
    {
        if (nestingOverflow_)
            return nullptr;
        if (!curIs(TokenKind::RBrace) && !curIs(TokenKind::Semicolon) && !curIs(TokenKind::Eof))
            errorAt(current().loc, "unexpected token: " + current().text);
        return nullptr;
    }
    if (peekIs(TokenKind::Semicolon))
        nextToken();
    return std::make_unique<ExprStmt>(loc, std::move(expr));
}

/// `return;`, `return }`, and `return` at end of input carry no value.
StmtPtr Parser::parseReturn()
{
    const SourceLoc loc = current().loc;
    if (peekIs(TokenKind::Semicolon))
    {
        nextToken();
        return std::make_unique<ReturnStmt>(loc, nullptr);
    }
    if (peekIs(TokenKind::RBrace) || peekIs(TokenKind::Eof))
        return std::make_unique<ReturnStmt>(loc, nullptr);

    nextToken();
    ExprPtr value = parseExpression(Precedence::Lowest);
    if (!value)
        return nullptr;
    if (peekIs(TokenKind::Semicolon))
        nextToken();
    return std::make_unique<ReturnStmt>(loc, std::move(value));
}

StmtPtr Parser::parseBreak()
{
    const SourceLoc loc = current().loc;
    if (peekIs(TokenKind::Semicolon))
        nextToken();
    return std::make_unique<BreakStmt>(loc);
}

StmtPtr Parser::parseContinue()
{
    const SourceLoc loc = current().loc;
    if (peekIs(TokenKind::Semicolon))
        nextToken();
    return std::make_unique<ContinueStmt>(loc);
}

BlockPtr Parser::parseBlock()
{
    auto block = std::make_unique<BlockStmt>(current().loc);
    nextToken();

    while (!curIs(TokenKind::RBrace) && !curIs(TokenKind::Eof))
    {
        if (auto stmt = parseStatement())
            block->statements.push_back(std::move(stmt));
        nextToken();
    }

    if (curIs(TokenKind::Eof))
    {
        errorAt(current().loc,
                std::string("expected next token to be ") + tokenKindToString(TokenKind::RBrace) +
                    ", got " + tokenKindToString(TokenKind::Eof) + " instead");
    }
    return block;
}

BlockPtr Parser::parseBranchBody()
{
    if (peekIs(TokenKind::LBrace))
    {
        nextToken();
        return parseBlock();
    }
    // A branch needs a body; `}` or end of input here is an error.
    if (peekIs(TokenKind::Eof) || peekIs(TokenKind::RBrace))
    {
        expectPeek(TokenKind::LBrace);
        return nullptr;
    }

    nextToken();
    auto block = std::make_unique<BlockStmt>(current().loc);
    const size_t errorsBefore = errors_.size();
    StmtPtr stmt = parseStatement();
    if (!stmt)
    {
        if (errors_.size() != errorsBefore)
            return nullptr;
        return block;
    }
    block->statements.push_back(std::move(stmt));
    return block;
}

StmtPtr Parser::parseIf()
{
    const SourceLoc loc = current().loc;
    if (!expectPeek(TokenKind::LParen))
        return nullptr;
    nextToken();
    ExprPtr condition = parseExpression(Precedence::Lowest);
    if (!condition)
        return nullptr;
    if (!expectPeek(TokenKind::RParen))
        return nullptr;
    BlockPtr thenBlock = parseBranchBody();
    if (!thenBlock)
        return nullptr;

    auto stmt = std::make_unique<IfStmt>(loc, std::move(condition), std::move(thenBlock));

    while (peekIs(TokenKind::KwElse))
    {
        nextToken();
        if (!peekIs(TokenKind::KwIf))
        {
            stmt->elseBlock = parseBranchBody();
            if (!stmt->elseBlock)
                return nullptr;
            break;
        }

        nextToken();
        ElseIfClause clause;
        clause.loc = current().loc;
        if (!expectPeek(TokenKind::LParen))
            return nullptr;
        nextToken();
        clause.condition = parseExpression(Precedence::Lowest);
        if (!clause.condition)
            return nullptr;
        if (!expectPeek(TokenKind::RParen))
            return nullptr;
        clause.block = parseBranchBody();
        if (!clause.block)
            return nullptr;
        stmt->elseIfs.push_back(std::move(clause));
    }
    return stmt;
}

StmtPtr Parser::parseWhile()
{
    const SourceLoc loc = current().loc;
    if (!expectPeek(TokenKind::LParen))
        return nullptr;
    nextToken();
    ExprPtr condition = parseExpression(Precedence::Lowest);
    if (!condition)
        return nullptr;
    if (!expectPeek(TokenKind::RParen))
        return nullptr;
    if (!expectPeek(TokenKind::LBrace))
        return nullptr;
    BlockPtr body = parseBlock();
    return std::make_unique<WhileStmt>(loc, std::move(condition), std::move(body));
}

StmtPtr Parser::parseLoop()
{
    const SourceLoc loc = current().loc;
    if (!expectPeek(TokenKind::LBrace))
        return nullptr;
    BlockPtr body = parseBlock();
    return std::make_unique<LoopStmt>(loc, std::move(body));
}

StmtPtr Parser::parseFor()
{
    const SourceLoc loc = current().loc;
    if (!expectPeek(TokenKind::LParen))
        return nullptr;
    if (!expectPeek(TokenKind::Identifier))
        return nullptr;
    std::string variable = current().text;
    if (!expectPeek(TokenKind::KwIn))
        return nullptr;
    nextToken();
    ExprPtr iterable = parseExpression(Precedence::Lowest);
    if (!iterable)
        return nullptr;
    if (!expectPeek(TokenKind::RParen))
        return nullptr;
    if (!expectPeek(TokenKind::LBrace))
        return nullptr;
    BlockPtr body = parseBlock();
    return std::make_unique<ForStmt>(loc, std::move(variable), std::move(iterable), std::move(body));
}

} // namespace magolor::frontend
