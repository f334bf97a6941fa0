//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_magolor_ast_output.cpp
// Purpose: Golden output for the canonical renderer and the AST tree dump.
// Key invariants: Rendering is byte-stable; dump indentation is two spaces
//                 per level with `(line:col)` suffixes.
// Ownership/Lifetime: Tests own hand-built nodes via unique_ptr.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/AstPrinter.hpp"
#include "frontend/AstRender.hpp"
#include "frontend/Parser.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <string>

using namespace magolor::frontend;
using magolor::support::DiagnosticEngine;

namespace
{
Program parseClean(const std::string &src)
{
    Lexer lexer(src, 1);
    DiagnosticEngine de;
    Parser parser(lexer, de);
    Program program = parser.parseProgram();
    EXPECT_TRUE(parser.errors().empty()) << src;
    return program;
}

SourceLoc at(uint32_t line, uint32_t column)
{
    return SourceLoc{1, line, column};
}
} // namespace

TEST(MagolorAstOutput, RenderHandBuiltNodes)
{
    auto sum = std::make_unique<InfixExpr>(at(1, 3),
                                           BinaryOp::Add,
                                           std::make_unique<VoidLiteralExpr>(at(1, 1)),
                                           std::make_unique<NilLiteralExpr>(at(1, 5), "nil"));
    EXPECT_EQ(render(*sum), "(void + nil)");

    TypeOfExpr typeOf(at(1, 1), std::make_unique<BoolLiteralExpr>(at(1, 8), false));
    EXPECT_EQ(render(typeOf), "typeof(false)");

    BlockStmt empty(at(1, 1));
    EXPECT_EQ(render(empty), "{ }");

    ReturnStmt bare(at(1, 1), nullptr);
    EXPECT_EQ(render(bare), "return;");
}

TEST(MagolorAstOutput, TreesDeeperThanLimitAreElided)
{
    ExprPtr expr = std::make_unique<IdentifierExpr>(at(1, 1), "innermost");
    for (unsigned i = 0; i < kMaxTreeDepth + 10; ++i)
        expr = std::make_unique<PrefixExpr>(at(1, 1), UnaryOp::Neg, std::move(expr));

    const std::string text = render(*expr);
    EXPECT_NE(text.find("..."), std::string::npos);
    EXPECT_EQ(text.find("innermost"), std::string::npos);

    const std::string tree = AstPrinter().dump(*expr);
    EXPECT_NE(tree.find("...\n"), std::string::npos);
    EXPECT_EQ(tree.find("innermost"), std::string::npos);
}

TEST(MagolorAstOutput, RenderStatementsIndividually)
{
    Program program = parseClean("int x = -1; break; continue;");
    ASSERT_EQ(program.statements.size(), 3u);
    EXPECT_EQ(render(*program.statements[0]), "int x = (-1);");
    EXPECT_EQ(render(*program.statements[1]), "break;");
    EXPECT_EQ(render(*program.statements[2]), "continue;");
}

TEST(MagolorAstOutput, RenderEmptyProgram)
{
    Program program;
    EXPECT_EQ(render(program), "");
}

TEST(MagolorAstOutput, DumpFunction)
{
    Program program = parseClean("int add(int a, int b) { return a + b; }");
    const std::string expected = "Program\n"
                                 "  FunctionStmt \"add\" -> int (1:1)\n"
                                 "    Param int \"a\" (1:9)\n"
                                 "    Param int \"b\" (1:16)\n"
                                 "    Body:\n"
                                 "      BlockStmt (1:23)\n"
                                 "        ReturnStmt (1:25)\n"
                                 "          InfixExpr (+) (1:34)\n"
                                 "            IdentifierExpr \"a\" (1:32)\n"
                                 "            IdentifierExpr \"b\" (1:36)\n";
    EXPECT_EQ(AstPrinter().dump(program), expected);
}

TEST(MagolorAstOutput, DumpIfChain)
{
    Program program = parseClean("if (x) { y; } else if (z) { } else { }");
    const std::string expected = "Program\n"
                                 "  IfStmt (1:1)\n"
                                 "    IdentifierExpr \"x\" (1:5)\n"
                                 "    Then:\n"
                                 "      BlockStmt (1:8)\n"
                                 "        ExprStmt (1:10)\n"
                                 "          IdentifierExpr \"y\" (1:10)\n"
                                 "    ElseIf (1:20)\n"
                                 "      IdentifierExpr \"z\" (1:24)\n"
                                 "      BlockStmt (1:27)\n"
                                 "    Else:\n"
                                 "      BlockStmt (1:36)\n";
    EXPECT_EQ(AstPrinter().dump(program), expected);
}

TEST(MagolorAstOutput, DumpLoopsAndLiterals)
{
    Program program = parseClean("loop { string s = \"hi\"; }\nfor (i in 1.5) { !true; }");
    const std::string expected = "Program\n"
                                 "  LoopStmt (1:1)\n"
                                 "    Body:\n"
                                 "      BlockStmt (1:6)\n"
                                 "        VarDeclStmt string \"s\" (1:8)\n"
                                 "          StringLiteral \"hi\" (1:19)\n"
                                 "  ForStmt \"i\" (2:1)\n"
                                 "    FloatLiteral 1.5 (2:11)\n"
                                 "    Body:\n"
                                 "      BlockStmt (2:16)\n"
                                 "        ExprStmt (2:18)\n"
                                 "          PrefixExpr (!) (2:18)\n"
                                 "            BoolLiteral true (2:19)\n";
    EXPECT_EQ(AstPrinter().dump(program), expected);
}

TEST(MagolorAstOutput, DumpExpressionAlone)
{
    IntLiteralExpr lit(at(3, 4), 42, "42");
    EXPECT_EQ(AstPrinter().dump(lit), "IntLiteral 42 (3:4)\n");
}
