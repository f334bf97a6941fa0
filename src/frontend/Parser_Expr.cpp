//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Pratt expression parsing for the Magolor parser.
///
/// @details parseExpression() parses one prefix term, then folds infix
/// operators while the peek token binds tighter than the caller's minimum.
/// The right operand of an infix operator is parsed at the operator's own
/// precedence, which makes every binary operator left-associative.
///
/// `(` has Call precedence in the grammar table but no infix parselet, so a
/// parenthesis after a complete operand ends the expression.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

#include "frontend/common/NumberParsing.hpp"

#include <algorithm>
#include <array>

namespace magolor::frontend
{

namespace
{
struct InfixParselet
{
    TokenKind kind;
    BinaryOp op;
};

struct PrefixParselet
{
    TokenKind kind;
    UnaryOp op;
};

constexpr std::array<InfixParselet, 13> infixParselets{{
    {TokenKind::Plus, BinaryOp::Add},
    {TokenKind::Minus, BinaryOp::Sub},
    {TokenKind::Star, BinaryOp::Mul},
    {TokenKind::Slash, BinaryOp::Div},
    {TokenKind::Percent, BinaryOp::Mod},
    {TokenKind::EqualEqual, BinaryOp::Eq},
    {TokenKind::NotEqual, BinaryOp::Ne},
    {TokenKind::Less, BinaryOp::Lt},
    {TokenKind::Greater, BinaryOp::Gt},
    {TokenKind::LessEqual, BinaryOp::Le},
    {TokenKind::GreaterEqual, BinaryOp::Ge},
    {TokenKind::AmpAmp, BinaryOp::And},
    {TokenKind::PipePipe, BinaryOp::Or},
}};

constexpr std::array<PrefixParselet, 3> prefixParselets{{
    {TokenKind::Minus, UnaryOp::Neg},
    {TokenKind::Plus, UnaryOp::Plus},
    {TokenKind::Bang, UnaryOp::Not},
}};

inline const InfixParselet *findInfix(TokenKind kind)
{
    const auto it =
        std::find_if(infixParselets.begin(),
                     infixParselets.end(),
                     [kind](const InfixParselet &parselet) { return parselet.kind == kind; });
    return it == infixParselets.end() ? nullptr : &*it;
}

inline const PrefixParselet *findPrefix(TokenKind kind)
{
    const auto it =
        std::find_if(prefixParselets.begin(),
                     prefixParselets.end(),
                     [kind](const PrefixParselet &parselet) { return parselet.kind == kind; });
    return it == prefixParselets.end() ? nullptr : &*it;
}

} // namespace

ExprPtr Parser::parseExpression(Precedence minPrec)
{
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        errorAt(current().loc, "expression nesting too deep (limit: 256)");
        skipNestedConstruct();
        return nullptr;
    }
    struct DepthGuard
    {
        unsigned &d;
        ~DepthGuard() { --d; }
    } exprGuard_{exprDepth_};

    ExprPtr left = parsePrefix();
    if (!left)
        return nullptr;

    // Each operator folded into `left` deepens the tree by one.
    unsigned chain = 0;
    while (!peekIs(TokenKind::Semicolon) && !peekIs(TokenKind::Eof) &&
           minPrec < precedenceOf(peek().kind))
    {
        const auto *parselet = findInfix(peek().kind);
        if (parselet == nullptr)
            return left;

        if (exprDepth_ + ++chain > kMaxExprDepth)
        {
            errorAt(peek().loc, "expression nesting too deep (limit: 256)");
            skipNestedConstruct();
            return nullptr;
        }
        nextToken();
        left = parseInfix(std::move(left), parselet->op);
        if (!left)
            return nullptr;
    }
    return left;
}

ExprPtr Parser::parseInfix(ExprPtr left, BinaryOp op)
{
    const SourceLoc loc = current().loc;
    const Precedence prec = precedenceOf(current().kind);
    nextToken();

    ExprPtr right = parseExpression(prec);
    if (!right)
        return nullptr;
    return std::make_unique<InfixExpr>(loc, op, std::move(left), std::move(right));
}

ExprPtr Parser::parsePrefix()
{
    const Token &tok = current();

    if (const auto *unary = findPrefix(tok.kind))
        return parseUnary(unary->op);

    switch (tok.kind)
    {
        case TokenKind::Identifier:
            return std::make_unique<IdentifierExpr>(tok.loc, tok.text);
        case TokenKind::IntLiteral:
            return parseIntLiteral();
        case TokenKind::FloatLiteral:
            return parseFloatLiteral();
        case TokenKind::StringLiteral:
            return std::make_unique<StringLiteralExpr>(tok.loc, tok.text);
        case TokenKind::BoolLiteral:
            return std::make_unique<BoolLiteralExpr>(tok.loc, tok.text == "true");
        case TokenKind::NilLiteral:
            return std::make_unique<NilLiteralExpr>(tok.loc, tok.text);
        case TokenKind::KwVoid:
            return std::make_unique<VoidLiteralExpr>(tok.loc);
        case TokenKind::LParen:
            return parseGrouped();
        case TokenKind::KwTypeof:
            return parseTypeOf();
        default:
            return reportNoPrefix();
    }
}

ExprPtr Parser::reportNoPrefix()
{
    const Token &tok = current();
    if (tok.kind == TokenKind::Eof)
    {
        errorAt(tok.loc, "unexpected end of input, expected an expression");
        return nullptr;
    }
    if (tok.kind == TokenKind::Illegal)
    {
        if (!tok.text.empty() && tok.text.front() == '"')
            errorAt(tok.loc, "unterminated string literal", kLexicalErrorCode);
        else
            errorAt(tok.loc, "no prefix parse function for ILLEGAL found", kLexicalErrorCode);
        return nullptr;
    }
    errorAt(tok.loc,
            std::string("no prefix parse function for ") + tokenKindToString(tok.kind) + " found");
    return nullptr;
}

ExprPtr Parser::parseIntLiteral()
{
    const Token &tok = current();
    auto value = number_parsing::parseIntegerLiteral(tok.text);
    if (!value)
    {
        errorAt(tok.loc, "could not parse \"" + tok.text + "\" as integer");
        return nullptr;
    }
    return std::make_unique<IntLiteralExpr>(tok.loc, *value, tok.text);
}

ExprPtr Parser::parseFloatLiteral()
{
    const Token &tok = current();
    auto value = number_parsing::parseFloatLiteral(tok.text);
    if (!value)
    {
        errorAt(tok.loc, "could not parse \"" + tok.text + "\" as float");
        return nullptr;
    }
    return std::make_unique<FloatLiteralExpr>(tok.loc, *value, tok.text);
}

/// `( expr )` yields the inner expression; grouping is not kept in the tree.
ExprPtr Parser::parseGrouped()
{
    nextToken();
    ExprPtr inner = parseExpression(Precedence::Lowest);
    if (!inner)
        return nullptr;
    if (!expectPeek(TokenKind::RParen))
        return nullptr;
    return inner;
}

ExprPtr Parser::parseUnary(UnaryOp op)
{
    const SourceLoc loc = current().loc;
    nextToken();
    ExprPtr operand = parseExpression(Precedence::Prefix);
    if (!operand)
        return nullptr;
    return std::make_unique<PrefixExpr>(loc, op, std::move(operand));
}

ExprPtr Parser::parseTypeOf()
{
    const SourceLoc loc = current().loc;
    if (!expectPeek(TokenKind::LParen))
        return nullptr;
    nextToken();
    ExprPtr operand = parseExpression(Precedence::Lowest);
    if (!operand)
        return nullptr;
    if (!expectPeek(TokenKind::RParen))
        return nullptr;
    return std::make_unique<TypeOfExpr>(loc, std::move(operand));
}

} // namespace magolor::frontend
