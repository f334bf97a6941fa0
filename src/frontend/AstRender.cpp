//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstRender.cpp
/// @brief Implementation of the canonical AST rendering.
///
//===----------------------------------------------------------------------===//

#include "frontend/AstRender.hpp"

#include <sstream>

namespace magolor::frontend
{

namespace
{
void renderExpr(const Expr &expr, std::ostream &os, unsigned depth);
void renderStmt(const Stmt &stmt, std::ostream &os, unsigned depth);

void renderBlock(const BlockStmt &block, std::ostream &os, unsigned depth)
{
    os << "{ ";
    for (const auto &stmt : block.statements)
    {
        renderStmt(*stmt, os, depth + 1);
        os << ' ';
    }
    os << '}';
}

void renderExpr(const Expr &expr, std::ostream &os, unsigned depth)
{
    if (depth > kMaxTreeDepth)
    {
        os << "...";
        return;
    }

    switch (expr.kind)
    {
        case ExprKind::Identifier:
            os << static_cast<const IdentifierExpr &>(expr).name;
            break;
        case ExprKind::IntLiteral:
            os << static_cast<const IntLiteralExpr &>(expr).spelling;
            break;
        case ExprKind::FloatLiteral:
            os << static_cast<const FloatLiteralExpr &>(expr).spelling;
            break;
        case ExprKind::StringLiteral:
            os << '"' << static_cast<const StringLiteralExpr &>(expr).value << '"';
            break;
        case ExprKind::BoolLiteral:
            os << (static_cast<const BoolLiteralExpr &>(expr).value ? "true" : "false");
            break;
        case ExprKind::NilLiteral:
            os << static_cast<const NilLiteralExpr &>(expr).spelling;
            break;
        case ExprKind::VoidLiteral:
            os << "void";
            break;
        case ExprKind::Prefix:
        {
            const auto &e = static_cast<const PrefixExpr &>(expr);
            os << '(' << unaryOpSpelling(e.op);
            renderExpr(*e.operand, os, depth + 1);
            os << ')';
            break;
        }
        case ExprKind::Infix:
        {
            const auto &e = static_cast<const InfixExpr &>(expr);
            os << '(';
            renderExpr(*e.left, os, depth + 1);
            os << ' ' << binaryOpSpelling(e.op) << ' ';
            renderExpr(*e.right, os, depth + 1);
            os << ')';
            break;
        }
        case ExprKind::TypeOf:
            os << "typeof(";
            renderExpr(*static_cast<const TypeOfExpr &>(expr).operand, os, depth + 1);
            os << ')';
            break;
    }
}

void renderStmt(const Stmt &stmt, std::ostream &os, unsigned depth)
{
    if (depth > kMaxTreeDepth)
    {
        os << "...";
        return;
    }

    switch (stmt.kind)
    {
        case StmtKind::Expr:
            renderExpr(*static_cast<const ExprStmt &>(stmt).expr, os, depth + 1);
            break;
        case StmtKind::VarDecl:
        {
            const auto &s = static_cast<const VarDeclStmt &>(stmt);
            os << s.declaredType.text << ' ' << s.name << " = ";
            renderExpr(*s.initializer, os, depth + 1);
            os << ';';
            break;
        }
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            os << "return";
            if (s.value)
            {
                os << ' ';
                renderExpr(*s.value, os, depth + 1);
            }
            os << ';';
            break;
        }
        case StmtKind::Break:
            os << "break;";
            break;
        case StmtKind::Continue:
            os << "continue;";
            break;
        case StmtKind::Block:
            renderBlock(static_cast<const BlockStmt &>(stmt), os, depth);
            break;
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            os << "if (";
            renderExpr(*s.condition, os, depth + 1);
            os << ") ";
            renderBlock(*s.thenBlock, os, depth + 1);
            for (const auto &clause : s.elseIfs)
            {
                os << " else if (";
                renderExpr(*clause.condition, os, depth + 1);
                os << ") ";
                renderBlock(*clause.block, os, depth + 1);
            }
            if (s.elseBlock)
            {
                os << " else ";
                renderBlock(*s.elseBlock, os, depth + 1);
            }
            break;
        }
        case StmtKind::While:
        {
            const auto &s = static_cast<const WhileStmt &>(stmt);
            os << "while (";
            renderExpr(*s.condition, os, depth + 1);
            os << ") ";
            renderBlock(*s.body, os, depth + 1);
            break;
        }
        case StmtKind::Loop:
            os << "loop ";
            renderBlock(*static_cast<const LoopStmt &>(stmt).body, os, depth + 1);
            break;
        case StmtKind::For:
        {
            const auto &s = static_cast<const ForStmt &>(stmt);
            os << "for (" << s.variable << " in ";
            renderExpr(*s.iterable, os, depth + 1);
            os << ") ";
            renderBlock(*s.body, os, depth + 1);
            break;
        }
        case StmtKind::Function:
        {
            const auto &s = static_cast<const FunctionStmt &>(stmt);
            os << s.returnType.text << ' ' << s.name << '(';
            for (size_t i = 0; i < s.params.size(); ++i)
            {
                if (i != 0)
                    os << ", ";
                os << s.params[i].type.text << ' ' << s.params[i].name;
            }
            os << ") ";
            renderBlock(*s.body, os, depth + 1);
            break;
        }
    }
}
} // namespace

std::string render(const Expr &expr)
{
    std::ostringstream os;
    renderExpr(expr, os, 0);
    return os.str();
}

std::string render(const Stmt &stmt)
{
    std::ostringstream os;
    renderStmt(stmt, os, 0);
    return os.str();
}

std::string render(const Program &program)
{
    std::ostringstream os;
    for (const auto &stmt : program.statements)
    {
        renderStmt(*stmt, os, 0);
        os << '\n';
    }
    return os.str();
}

} // namespace magolor::frontend
