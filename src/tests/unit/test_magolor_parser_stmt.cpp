//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_magolor_parser_stmt.cpp
// Purpose: Statement and declaration parsing for Magolor programs.
// Key invariants: A type keyword followed by `IDENT (` or `fn` starts a
//                 function; otherwise it starts a variable declaration.
// Ownership/Lifetime: N/A (test).
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/AstRender.hpp"
#include "frontend/Parser.hpp"
#include "support/diagnostics.hpp"

#include <string>
#include <vector>

using namespace magolor::frontend;
using magolor::support::DiagnosticEngine;

namespace
{
struct ParsedProgram
{
    Program program;
    std::vector<std::string> errors;
};

ParsedProgram parse(const std::string &src)
{
    Lexer lexer(src, 1);
    DiagnosticEngine de;
    Parser parser(lexer, de);
    ParsedProgram out;
    out.program = parser.parseProgram();
    out.errors = parser.errors();
    return out;
}

std::string renderClean(const std::string &src)
{
    auto parsed = parse(src);
    EXPECT_TRUE(parsed.errors.empty()) << src;
    return render(parsed.program);
}

template <typename T> const T &only(const ParsedProgram &parsed, StmtKind kind)
{
    EXPECT_EQ(parsed.program.statements.size(), 1u);
    const Stmt &stmt = *parsed.program.statements.at(0);
    EXPECT_EQ(stmt.kind, kind);
    return static_cast<const T &>(stmt);
}
} // namespace

TEST(MagolorParserStmt, VoidFunctionWithBareReturn)
{
    auto parsed = parse("void test() { return; }");
    EXPECT_TRUE(parsed.errors.empty());
    const auto &fn = only<FunctionStmt>(parsed, StmtKind::Function);
    EXPECT_EQ(fn.name, "test");
    EXPECT_EQ(fn.returnType.text, "void");
    EXPECT_TRUE(fn.params.empty());
    ASSERT_TRUE(fn.body);
    ASSERT_EQ(fn.body->statements.size(), 1u);
    ASSERT_EQ(fn.body->statements[0]->kind, StmtKind::Return);
    EXPECT_EQ(static_cast<const ReturnStmt &>(*fn.body->statements[0]).value, nullptr);
}

TEST(MagolorParserStmt, TypedFunctionWithoutParameters)
{
    auto parsed = parse("int foo() { return 1; }");
    EXPECT_TRUE(parsed.errors.empty());
    const auto &fn = only<FunctionStmt>(parsed, StmtKind::Function);
    EXPECT_EQ(fn.name, "foo");
    EXPECT_EQ(fn.returnType.kind, TokenKind::Type);
    EXPECT_TRUE(fn.params.empty());
}

TEST(MagolorParserStmt, VariableDeclaration)
{
    auto parsed = parse("int foo = 1;");
    EXPECT_TRUE(parsed.errors.empty());
    const auto &decl = only<VarDeclStmt>(parsed, StmtKind::VarDecl);
    EXPECT_EQ(decl.declaredType.text, "int");
    EXPECT_EQ(decl.name, "foo");
    ASSERT_TRUE(decl.initializer);
    EXPECT_EQ(render(*decl.initializer), "1");
    EXPECT_EQ(render(parsed.program), "int foo = 1;\n");
}

TEST(MagolorParserStmt, FunctionWithParameters)
{
    auto parsed = parse("int fn main(int x, string y) { return 123 + 4 * 5; }");
    EXPECT_TRUE(parsed.errors.empty());
    const auto &fn = only<FunctionStmt>(parsed, StmtKind::Function);
    EXPECT_EQ(fn.returnType.text, "int");
    ASSERT_EQ(fn.params.size(), 2u);
    EXPECT_EQ(fn.params[0].type.text, "int");
    EXPECT_EQ(fn.params[0].name, "x");
    EXPECT_EQ(fn.params[1].type.text, "string");
    EXPECT_EQ(fn.params[1].name, "y");
    EXPECT_EQ(fn.params[1].loc.column, 20u);
    EXPECT_EQ(render(parsed.program), "int main(int x, string y) { return (123 + (4 * 5)); }\n");
}

TEST(MagolorParserStmt, FnKeywordDefaultsToVoid)
{
    auto parsed = parse("fn helper() { }");
    EXPECT_TRUE(parsed.errors.empty());
    const auto &fn = only<FunctionStmt>(parsed, StmtKind::Function);
    EXPECT_EQ(fn.returnType.kind, TokenKind::KwVoid);
    EXPECT_EQ(render(parsed.program), "void helper() { }\n");

    EXPECT_EQ(renderClean("func run(float f) { return f; }"),
              "void run(float f) { return f; }\n");
}

TEST(MagolorParserStmt, ElseIfChain)
{
    const std::string src = "if (x > 10) { return 1; } else if (x > 5) { return 2; } "
                            "else if (x > 0) { return 3; } else { return 4; }";
    auto parsed = parse(src);
    EXPECT_TRUE(parsed.errors.empty());
    const auto &stmt = only<IfStmt>(parsed, StmtKind::If);
    EXPECT_EQ(stmt.elseIfs.size(), 2u);
    ASSERT_TRUE(stmt.elseBlock);
    EXPECT_EQ(render(parsed.program),
              "if ((x > 10)) { return 1; } else if ((x > 5)) { return 2; } else if ((x > 0)) "
              "{ return 3; } else { return 4; }\n");
}

TEST(MagolorParserStmt, IfWithoutElse)
{
    auto parsed = parse("if (ok) { x; }");
    const auto &stmt = only<IfStmt>(parsed, StmtKind::If);
    EXPECT_TRUE(stmt.elseIfs.empty());
    EXPECT_EQ(stmt.elseBlock, nullptr);
    EXPECT_EQ(render(parsed.program), "if (ok) { x }\n");
}

TEST(MagolorParserStmt, BracelessBranches)
{
    EXPECT_EQ(renderClean("void t() { if (x > 10) return x; else return 0; }"),
              "void t() { if ((x > 10)) { return x; } else { return 0; } }\n");
    EXPECT_EQ(renderClean("if (a) b; else if (c) d; else e;"),
              "if (a) { b } else if (c) { d } else { e }\n");
}

TEST(MagolorParserStmt, Loops)
{
    EXPECT_EQ(renderClean("while (i < 10) { i; }"), "while ((i < 10)) { i }\n");
    EXPECT_EQ(renderClean("loop { break; continue; }"), "loop { break; continue; }\n");
    EXPECT_EQ(renderClean("for (item in items) { return item; }"),
              "for (item in items) { return item; }\n");
}

TEST(MagolorParserStmt, ForLoopFields)
{
    auto parsed = parse("for (item in a + b) { }");
    const auto &stmt = only<ForStmt>(parsed, StmtKind::For);
    EXPECT_EQ(stmt.variable, "item");
    EXPECT_EQ(render(*stmt.iterable), "(a + b)");
    ASSERT_TRUE(stmt.body);
    EXPECT_TRUE(stmt.body->statements.empty());
}

TEST(MagolorParserStmt, ReturnForms)
{
    EXPECT_EQ(renderClean("void f() { return }"), "void f() { return; }\n");
    EXPECT_EQ(renderClean("return"), "return;\n");
    EXPECT_EQ(renderClean("return x * 2;"), "return (x * 2);\n");
}

TEST(MagolorParserStmt, NestedBlocksAndEmptyStatements)
{
    EXPECT_EQ(renderClean("{ x; { y; } }"), "{ x { y } }\n");
    auto parsed = parse(";;  ;");
    EXPECT_TRUE(parsed.errors.empty());
    EXPECT_TRUE(parsed.program.statements.empty());
}

TEST(MagolorParserStmt, SeveralTopLevelStatements)
{
    EXPECT_EQ(renderClean("int a = 1; string s = \"x\"; a + 1;"),
              "int a = 1;\nstring s = \"x\";\n(a + 1)\n");
}

TEST(MagolorParserStmt, StatementLocations)
{
    auto parsed = parse("\n  int x = 1;");
    const auto &decl = only<VarDeclStmt>(parsed, StmtKind::VarDecl);
    EXPECT_EQ(decl.loc.line, 2u);
    EXPECT_EQ(decl.loc.column, 3u);
}
