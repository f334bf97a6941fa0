//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_magolor_parser_errors.cpp
// Purpose: Error accumulation and recovery in the Magolor parser.
// Key invariants: Errors are recorded in order and mirrored into the
//                 DiagnosticEngine; parsing always runs to end of input.
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
    DiagnosticEngine diags;
};

void parseInto(const std::string &src, ParsedProgram &out)
{
    Lexer lexer(src, 1);
    Parser parser(lexer, out.diags);
    out.program = parser.parseProgram();
    out.errors = parser.errors();
}
} // namespace

TEST(MagolorParserErrors, DeclarationWithoutInitializer)
{
    ParsedProgram p;
    parseInto("int foo", p);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0], "expected next token to be =, got EOF instead");
    EXPECT_TRUE(p.program.statements.empty());

    ASSERT_EQ(p.diags.diagnostics().size(), 1u);
    const auto &d = p.diags.diagnostics()[0];
    EXPECT_EQ(d.code, kSyntaxErrorCode);
    EXPECT_EQ(d.loc.line, 1u);
    EXPECT_EQ(d.loc.column, 8u);
}

TEST(MagolorParserErrors, TwoMalformedIfHeadersGiveTwoErrors)
{
    ParsedProgram p;
    parseInto("if x > 1 { } if y < 2 { }", p);
    ASSERT_EQ(p.errors.size(), 2u);
    EXPECT_EQ(p.errors[0], "expected next token to be (, got IDENT instead");
    EXPECT_EQ(p.errors[1], "expected next token to be (, got IDENT instead");
    EXPECT_EQ(p.diags.errorCount(), 2u);
}

TEST(MagolorParserErrors, UnterminatedString)
{
    ParsedProgram p;
    parseInto("string s = \"abc", p);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0], "unterminated string literal");
    EXPECT_EQ(p.diags.diagnostics()[0].code, kLexicalErrorCode);
    EXPECT_EQ(p.diags.diagnostics()[0].loc.column, 12u);
}

TEST(MagolorParserErrors, IllegalTokenInStatement)
{
    ParsedProgram p;
    parseInto("@", p);
    ASSERT_EQ(p.errors.size(), 2u);
    EXPECT_EQ(p.errors[0], "no prefix parse function for ILLEGAL found");
    EXPECT_EQ(p.errors[1], "unexpected token: @");
    EXPECT_EQ(p.diags.diagnostics()[0].code, kLexicalErrorCode);
    EXPECT_EQ(p.diags.diagnostics()[1].code, kSyntaxErrorCode);
}

TEST(MagolorParserErrors, IntegerLiteralOutOfRange)
{
    ParsedProgram p;
    parseInto("int x = 99999999999999999999;", p);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0], "could not parse \"99999999999999999999\" as integer");
    EXPECT_TRUE(p.program.statements.empty());
}

TEST(MagolorParserErrors, ParameterWithoutType)
{
    ParsedProgram p;
    parseInto("int f(x) { }", p);
    ASSERT_FALSE(p.errors.empty());
    EXPECT_EQ(p.errors[0], "expected parameter type, got IDENT");
}

TEST(MagolorParserErrors, MissingClosingParen)
{
    ParsedProgram p;
    parseInto("if (x { }", p);
    ASSERT_FALSE(p.errors.empty());
    EXPECT_EQ(p.errors[0], "expected next token to be ), got { instead");
}

TEST(MagolorParserErrors, LoopWithoutBracesRecordsOneError)
{
    ParsedProgram p;
    parseInto("while (x) x;", p);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0], "expected next token to be {, got IDENT instead");

    ParsedProgram q;
    parseInto("loop x;", q);
    ASSERT_EQ(q.errors.size(), 1u);
    EXPECT_EQ(q.errors[0], "expected next token to be {, got IDENT instead");
}

TEST(MagolorParserErrors, BranchBodyAtEndOfInput)
{
    ParsedProgram p;
    parseInto("if (x)", p);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0], "expected next token to be {, got EOF instead");
    EXPECT_TRUE(p.program.statements.empty());
}

TEST(MagolorParserErrors, BranchBodyBeforeClosingBrace)
{
    ParsedProgram p;
    parseInto("fn f() { if (a) } int y = 1;", p);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0], "expected next token to be {, got } instead");
    // The `}` still closes f, so `int y` stays at top level.
    EXPECT_EQ(render(p.program), "void f() { }\nint y = 1;\n");

    ParsedProgram q;
    parseInto("fn g() { if (a) b else } int z = 2;", q);
    ASSERT_EQ(q.errors.size(), 1u);
    EXPECT_EQ(q.errors[0], "expected next token to be {, got } instead");
    EXPECT_EQ(render(q.program), "void g() { }\nint z = 2;\n");
}

TEST(MagolorParserErrors, UnclosedBlockKeepsPartialFunction)
{
    ParsedProgram p;
    parseInto("void f() { return 1;", p);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0], "expected next token to be }, got EOF instead");
    ASSERT_EQ(p.program.statements.size(), 1u);
    const auto &fn = static_cast<const FunctionStmt &>(*p.program.statements[0]);
    ASSERT_TRUE(fn.body);
    EXPECT_EQ(fn.body->statements.size(), 1u);
}

TEST(MagolorParserErrors, GarbageTerminates)
{
    ParsedProgram p;
    parseInto("} } ) ( else , = fn", p);
    EXPECT_FALSE(p.errors.empty());
    EXPECT_EQ(p.diags.errorCount(), p.errors.size());
}

TEST(MagolorParserErrors, NestingTooDeep)
{
    const std::string exprLimit = "expression nesting too deep (limit: 256)";
    const std::string stmtLimit = "statement nesting too deep (limit: 256)";

    ParsedProgram prefix;
    parseInto(std::string(200000, '-') + "1; int ok = 1;", prefix);
    ASSERT_EQ(prefix.errors.size(), 1u);
    EXPECT_EQ(prefix.errors[0], exprLimit);
    EXPECT_EQ(prefix.diags.diagnostics()[0].code, kSyntaxErrorCode);
    EXPECT_EQ(render(prefix.program), "int ok = 1;\n");

    ParsedProgram grouped;
    parseInto(std::string(100000, '(') + "1" + std::string(100000, ')') + "; int ok = 2;",
              grouped);
    ASSERT_EQ(grouped.errors.size(), 1u);
    EXPECT_EQ(grouped.errors[0], exprLimit);
    EXPECT_EQ(render(grouped.program), "int ok = 2;\n");

    ParsedProgram blocks;
    parseInto(std::string(100000, '{') + std::string(100000, '}') + " int ok = 3;", blocks);
    ASSERT_EQ(blocks.errors.size(), 1u);
    EXPECT_EQ(blocks.errors[0], stmtLimit);
    ASSERT_EQ(blocks.program.statements.size(), 2u);
    EXPECT_EQ(blocks.program.statements[0]->kind, StmtKind::Block);
    EXPECT_EQ(render(*blocks.program.statements[1]), "int ok = 3;");

    std::string ifs;
    for (int i = 0; i < 50000; ++i)
        ifs += "if (a) ";
    ParsedProgram branches;
    parseInto(ifs + "b;", branches);
    ASSERT_EQ(branches.errors.size(), 1u);
    EXPECT_EQ(branches.errors[0], stmtLimit);
}

TEST(MagolorParserErrors, LongOperatorChains)
{
    std::string ok = "1";
    for (int i = 0; i < 200; ++i)
        ok += " + 1";
    ParsedProgram fits;
    parseInto(ok + ";", fits);
    EXPECT_TRUE(fits.errors.empty());
    EXPECT_EQ(fits.program.statements.size(), 1u);

    std::string tooLong = "1";
    for (int i = 0; i < 100000; ++i)
        tooLong += "+1";
    ParsedProgram chain;
    parseInto(tooLong + "; int ok = 4;", chain);
    ASSERT_EQ(chain.errors.size(), 1u);
    EXPECT_EQ(chain.errors[0], "expression nesting too deep (limit: 256)");
    EXPECT_EQ(render(chain.program), "int ok = 4;\n");
}
