//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement nodes for the Magolor AST.
///
/// @details Statements own their expressions and nested blocks.  Bodies of
/// loops, functions, and conditional branches are always BlockStmt; a
/// brace-less `if` branch is wrapped in a synthesized one-statement block.
///
/// Type positions (declaration types, parameter types, function return
/// types) keep the whole token so consumers can tell an explicit `int` from
/// the `void` return type synthesized for `fn name(...)`.
///
/// @invariant Required children (conditions, bodies, initializers) are
///            non-null; ReturnStmt::value and IfStmt::elseBlock are optional.
/// @invariant elseIfs and parameter lists keep source order.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Expr.hpp"
#include "frontend/Token.hpp"

#include <string>
#include <vector>

namespace magolor::frontend
{

/// @brief Enumerates all kinds of statement nodes.
enum class StmtKind
{
    Expr,
    VarDecl,
    Return,
    Break,
    Continue,
    Block,
    If,
    While,
    Loop,
    For,
    Function,
};

/// @brief Base class for all statement nodes.
struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expr, l), expr(std::move(e)) {}
};

/// @brief `T name = init;`
struct VarDeclStmt : Stmt
{
    Token declaredType;
    std::string name;
    ExprPtr initializer;

    VarDeclStmt(SourceLoc l, Token t, std::string n, ExprPtr init)
        : Stmt(StmtKind::VarDecl, l), declaredType(std::move(t)), name(std::move(n)),
          initializer(std::move(init))
    {
    }
};

/// @brief `return [value];`; @ref value is null for a bare return.
struct ReturnStmt : Stmt
{
    ExprPtr value;

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

struct ContinueStmt : Stmt
{
    explicit ContinueStmt(SourceLoc l) : Stmt(StmtKind::Continue, l) {}
};

struct BlockStmt : Stmt
{
    std::vector<StmtPtr> statements;

    explicit BlockStmt(SourceLoc l) : Stmt(StmtKind::Block, l) {}
};

/// @brief One `else if (cond) body` link of an if chain.
struct ElseIfClause
{
    SourceLoc loc;
    ExprPtr condition;
    BlockPtr block;
};

struct IfStmt : Stmt
{
    ExprPtr condition;
    BlockPtr thenBlock;
    std::vector<ElseIfClause> elseIfs;
    BlockPtr elseBlock;

    IfStmt(SourceLoc l, ExprPtr c, BlockPtr t)
        : Stmt(StmtKind::If, l), condition(std::move(c)), thenBlock(std::move(t))
    {
    }
};

struct WhileStmt : Stmt
{
    ExprPtr condition;
    BlockPtr body;

    WhileStmt(SourceLoc l, ExprPtr c, BlockPtr b)
        : Stmt(StmtKind::While, l), condition(std::move(c)), body(std::move(b))
    {
    }
};

/// @brief Unconditional `loop { ... }`.
struct LoopStmt : Stmt
{
    BlockPtr body;

    LoopStmt(SourceLoc l, BlockPtr b) : Stmt(StmtKind::Loop, l), body(std::move(b)) {}
};

/// @brief `for (variable in iterable) { ... }`.
struct ForStmt : Stmt
{
    std::string variable;
    ExprPtr iterable;
    BlockPtr body;

    ForStmt(SourceLoc l, std::string v, ExprPtr it, BlockPtr b)
        : Stmt(StmtKind::For, l), variable(std::move(v)), iterable(std::move(it)), body(std::move(b))
    {
    }
};

/// @brief Function parameter `T name`.
struct Param
{
    Token type;
    std::string name;
    SourceLoc loc;
};

struct FunctionStmt : Stmt
{
    Token returnType;
    std::string name;
    std::vector<Param> params;
    BlockPtr body;

    FunctionStmt(SourceLoc l, Token ret, std::string n)
        : Stmt(StmtKind::Function, l), returnType(std::move(ret)), name(std::move(n))
    {
    }
};

} // namespace magolor::frontend
