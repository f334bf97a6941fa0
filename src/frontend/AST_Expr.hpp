//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes for the Magolor AST.
///
/// @details Every expression records the location of the token that
/// introduced it: the operator token for prefix and infix nodes, the
/// `typeof` keyword for TypeOfExpr, and the literal or name otherwise.
/// Literal nodes other than strings keep their source spelling so the
/// renderer can reproduce it exactly (`007`, `1.50`, `null`).
///
/// @invariant Every Expr has a `kind` matching its concrete type.
/// @invariant Operands of PrefixExpr, InfixExpr, and TypeOfExpr are non-null.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Fwd.hpp"

#include <cstdint>
#include <string>

namespace magolor::frontend
{

/// @brief Enumerates all kinds of expression nodes.
enum class ExprKind
{
    Identifier,
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    BoolLiteral,
    NilLiteral,
    VoidLiteral,
    Prefix,
    Infix,
    TypeOf,
};

/// @brief Prefix operators.
enum class UnaryOp
{
    Neg,  ///< `-x`
    Plus, ///< `+x`
    Not,  ///< `!x`
};

/// @brief Infix operators, all left-associative.
enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Eq,
    Ne,
    Lt,
    Gt,
    Le,
    Ge,
    And,
    Or,
};

/// @brief Source spelling of @p op, e.g. "-".
const char *unaryOpSpelling(UnaryOp op);

/// @brief Source spelling of @p op, e.g. "<=".
const char *binaryOpSpelling(BinaryOp op);

/// @brief Base class for all expression nodes.
struct Expr
{
    ExprKind kind;
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

struct IdentifierExpr : Expr
{
    std::string name;

    IdentifierExpr(SourceLoc l, std::string n) : Expr(ExprKind::Identifier, l), name(std::move(n))
    {
    }
};

struct IntLiteralExpr : Expr
{
    int64_t value;
    std::string spelling;

    IntLiteralExpr(SourceLoc l, int64_t v, std::string s)
        : Expr(ExprKind::IntLiteral, l), value(v), spelling(std::move(s))
    {
    }
};

struct FloatLiteralExpr : Expr
{
    double value;
    std::string spelling;

    FloatLiteralExpr(SourceLoc l, double v, std::string s)
        : Expr(ExprKind::FloatLiteral, l), value(v), spelling(std::move(s))
    {
    }
};

/// @brief String literal; @ref value excludes the quotes.
struct StringLiteralExpr : Expr
{
    std::string value;

    StringLiteralExpr(SourceLoc l, std::string v)
        : Expr(ExprKind::StringLiteral, l), value(std::move(v))
    {
    }
};

struct BoolLiteralExpr : Expr
{
    bool value;

    BoolLiteralExpr(SourceLoc l, bool v) : Expr(ExprKind::BoolLiteral, l), value(v) {}
};

/// @brief `nil` or `null`; @ref spelling records which.
struct NilLiteralExpr : Expr
{
    std::string spelling;

    NilLiteralExpr(SourceLoc l, std::string s) : Expr(ExprKind::NilLiteral, l), spelling(std::move(s))
    {
    }
};

/// @brief The `void` keyword used as a value.
struct VoidLiteralExpr : Expr
{
    explicit VoidLiteralExpr(SourceLoc l) : Expr(ExprKind::VoidLiteral, l) {}
};

struct PrefixExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    PrefixExpr(SourceLoc l, UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Prefix, l), op(o), operand(std::move(e))
    {
    }
};

struct InfixExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    InfixExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Infix, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief `typeof(expr)`.
struct TypeOfExpr : Expr
{
    ExprPtr operand;

    TypeOfExpr(SourceLoc l, ExprPtr e) : Expr(ExprKind::TypeOf, l), operand(std::move(e)) {}
};

} // namespace magolor::frontend
