//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implementation of the indented AST dump.
///
//===----------------------------------------------------------------------===//

#include "frontend/AstPrinter.hpp"

#include <sstream>

namespace magolor::frontend
{

namespace
{
struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }

    bool tooDeep() const
    {
        return static_cast<unsigned>(indent) > kMaxTreeDepth;
    }
};

void printExpr(const Expr &expr, Printer &p);
void printStmt(const Stmt &stmt, Printer &p);

std::string locStr(const SourceLoc &loc)
{
    std::ostringstream s;
    s << "(" << loc.line << ":" << loc.column << ")";
    return s.str();
}

std::string quoted(const std::string &text)
{
    return "\"" + text + "\"";
}

/// Print a labelled child block, e.g. "Then:" followed by the block.
void printLabelledBlock(const char *label, const BlockStmt &block, Printer &p)
{
    p.line(label);
    p.push();
    printStmt(block, p);
    p.pop();
}

void printExpr(const Expr &expr, Printer &p)
{
    if (p.tooDeep())
    {
        p.line("...");
        return;
    }
    switch (expr.kind)
    {
        case ExprKind::Identifier:
            p.line("IdentifierExpr " + quoted(static_cast<const IdentifierExpr &>(expr).name) + " " +
                   locStr(expr.loc));
            break;
        case ExprKind::IntLiteral:
            p.line("IntLiteral " + std::to_string(static_cast<const IntLiteralExpr &>(expr).value) +
                   " " + locStr(expr.loc));
            break;
        case ExprKind::FloatLiteral:
            p.line("FloatLiteral " + static_cast<const FloatLiteralExpr &>(expr).spelling + " " +
                   locStr(expr.loc));
            break;
        case ExprKind::StringLiteral:
            p.line("StringLiteral " + quoted(static_cast<const StringLiteralExpr &>(expr).value) +
                   " " + locStr(expr.loc));
            break;
        case ExprKind::BoolLiteral:
            p.line(std::string("BoolLiteral ") +
                   (static_cast<const BoolLiteralExpr &>(expr).value ? "true" : "false") + " " +
                   locStr(expr.loc));
            break;
        case ExprKind::NilLiteral:
            p.line("NilLiteral " + locStr(expr.loc));
            break;
        case ExprKind::VoidLiteral:
            p.line("VoidLiteral " + locStr(expr.loc));
            break;
        case ExprKind::Prefix:
        {
            const auto &e = static_cast<const PrefixExpr &>(expr);
            p.line(std::string("PrefixExpr (") + unaryOpSpelling(e.op) + ") " + locStr(e.loc));
            p.push();
            printExpr(*e.operand, p);
            p.pop();
            break;
        }
        case ExprKind::Infix:
        {
            const auto &e = static_cast<const InfixExpr &>(expr);
            p.line(std::string("InfixExpr (") + binaryOpSpelling(e.op) + ") " + locStr(e.loc));
            p.push();
            printExpr(*e.left, p);
            printExpr(*e.right, p);
            p.pop();
            break;
        }
        case ExprKind::TypeOf:
        {
            const auto &e = static_cast<const TypeOfExpr &>(expr);
            p.line("TypeOfExpr " + locStr(e.loc));
            p.push();
            printExpr(*e.operand, p);
            p.pop();
            break;
        }
    }
}

void printStmt(const Stmt &stmt, Printer &p)
{
    if (p.tooDeep())
    {
        p.line("...");
        return;
    }
    switch (stmt.kind)
    {
        case StmtKind::Expr:
            p.line("ExprStmt " + locStr(stmt.loc));
            p.push();
            printExpr(*static_cast<const ExprStmt &>(stmt).expr, p);
            p.pop();
            break;
        case StmtKind::VarDecl:
        {
            const auto &s = static_cast<const VarDeclStmt &>(stmt);
            p.line("VarDeclStmt " + s.declaredType.text + " " + quoted(s.name) + " " +
                   locStr(s.loc));
            p.push();
            printExpr(*s.initializer, p);
            p.pop();
            break;
        }
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            p.line("ReturnStmt " + locStr(s.loc));
            if (s.value)
            {
                p.push();
                printExpr(*s.value, p);
                p.pop();
            }
            break;
        }
        case StmtKind::Break:
            p.line("BreakStmt " + locStr(stmt.loc));
            break;
        case StmtKind::Continue:
            p.line("ContinueStmt " + locStr(stmt.loc));
            break;
        case StmtKind::Block:
        {
            const auto &s = static_cast<const BlockStmt &>(stmt);
            p.line("BlockStmt " + locStr(s.loc));
            p.push();
            for (const auto &child : s.statements)
                printStmt(*child, p);
            p.pop();
            break;
        }
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            p.line("IfStmt " + locStr(s.loc));
            p.push();
            printExpr(*s.condition, p);
            printLabelledBlock("Then:", *s.thenBlock, p);
            for (const auto &clause : s.elseIfs)
            {
                p.line("ElseIf " + locStr(clause.loc));
                p.push();
                printExpr(*clause.condition, p);
                printStmt(*clause.block, p);
                p.pop();
            }
            if (s.elseBlock)
                printLabelledBlock("Else:", *s.elseBlock, p);
            p.pop();
            break;
        }
        case StmtKind::While:
        {
            const auto &s = static_cast<const WhileStmt &>(stmt);
            p.line("WhileStmt " + locStr(s.loc));
            p.push();
            printExpr(*s.condition, p);
            printLabelledBlock("Body:", *s.body, p);
            p.pop();
            break;
        }
        case StmtKind::Loop:
        {
            const auto &s = static_cast<const LoopStmt &>(stmt);
            p.line("LoopStmt " + locStr(s.loc));
            p.push();
            printLabelledBlock("Body:", *s.body, p);
            p.pop();
            break;
        }
        case StmtKind::For:
        {
            const auto &s = static_cast<const ForStmt &>(stmt);
            p.line("ForStmt " + quoted(s.variable) + " " + locStr(s.loc));
            p.push();
            printExpr(*s.iterable, p);
            printLabelledBlock("Body:", *s.body, p);
            p.pop();
            break;
        }
        case StmtKind::Function:
        {
            const auto &s = static_cast<const FunctionStmt &>(stmt);
            p.line("FunctionStmt " + quoted(s.name) + " -> " + s.returnType.text + " " +
                   locStr(s.loc));
            p.push();
            for (const auto &param : s.params)
                p.line("Param " + param.type.text + " " + quoted(param.name) + " " +
                       locStr(param.loc));
            printLabelledBlock("Body:", *s.body, p);
            p.pop();
            break;
        }
    }
}
} // namespace

std::string AstPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer p{os};
    p.line("Program");
    p.push();
    for (const auto &stmt : program.statements)
        printStmt(*stmt, p);
    p.pop();
    return os.str();
}

std::string AstPrinter::dump(const Expr &expr)
{
    std::ostringstream os;
    Printer p{os};
    printExpr(expr, p);
    return os.str();
}

} // namespace magolor::frontend
