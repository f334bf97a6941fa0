//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file
/// @brief Built-in showcase for `magolor --demo`.
/// @details Parses a fixed set of sample programs, dumps the tokens of a small
///          function, and evaluates a few typeof expressions against an
///          environment binding `x = 100` and `name = "hello"`.
///
//===----------------------------------------------------------------------===//

#include "tools/magolor/driver.hpp"

#include "eval/Environment.hpp"
#include "eval/Evaluator.hpp"
#include "frontend/AstRender.hpp"
#include "frontend/Frontend.hpp"
#include "support/source_manager.hpp"

#include <array>
#include <string_view>

namespace magolor::tools
{

namespace
{
constexpr std::array<std::string_view, 20> kSamplePrograms = {
    "int fn main(int x, string y) { return 123 + 4 * 5; }",
    "int func main(int x, string y){ return 123 + 4 * 5; }",
    "int main(int x, string y) { return 123 + 4 * 5; }",
    "void test() { return; }",
    "float calculate(int a, float b, string name) { return a + b * -3; }",
    "int test() { return typeof(42); }",
    "void demo() { return typeof(x + y * 2); }",
    "void testIf() { if (x > 10) { return x; } }",
    "void testIfElse() { if (x > 10) { return x; } else { return 0; } }",
    "void testElseIf() { if (x > 10) { return x; } else if (x > 5) { return x + 1; } else { "
    "return 0; } }",
    "void testNoBraces() { if (x > 10) return x; else return 0; }",
    "void testDeclaration() { int x = 10; return x; }",
    "void testLoop() { loop { return 1; } }",
    "void testWhile() { while (x < 10) { return x; } }",
    "void testFor() { for (item in items) { return item; } }",
    "string greet(string name) { return \"Hello, \" + name; }",
    "float addFloats(float a, float b) { return a + b; }",
    "string emptyString() { return \"\"; }",
    "float negativeFloat() { return -3.14; }",
    "void broken( { return 1; }",
};

constexpr std::string_view kLexerSample = "int main(int x) { return x + 42; }";

constexpr std::array<std::string_view, 5> kTypeofSamples = {
    "typeof(42)",
    "typeof(x + 5)",
    "typeof(-10)",
    "typeof(name)",
    "typeof(typeof(x))",
};

void runSamples(std::ostream &out)
{
    frontend::FrontendOptions options{};
    for (size_t i = 0; i < kSamplePrograms.size(); ++i)
    {
        magolor::support::SourceManager sm;
        out << "=== Sample " << (i + 1) << " ===\n";
        out << "Source: " << kSamplePrograms[i] << "\n";

        auto result = frontend::parseSource({kSamplePrograms[i], "<demo>"}, options, sm);
        if (!result.errors.empty())
        {
            out << "Parser errors:\n";
            for (const auto &message : result.errors)
                out << " - " << message << "\n";
        }
        else
        {
            out << "Parsed program:\n" << frontend::render(result.program);
        }
        out << "\n";
    }
}

void runTypeofSamples(std::ostream &out)
{
    eval::Environment env;
    env.set("x", eval::Value::makeInt(100));
    env.set("name", eval::Value::makeString("hello"));

    eval::Evaluator evaluator;
    frontend::FrontendOptions options{};
    for (std::string_view text : kTypeofSamples)
    {
        magolor::support::SourceManager sm;
        out << "Evaluating: " << text << "\n";
        auto parsed = frontend::parseExpressionSource({text, "<demo>"}, options, sm);
        if (!parsed.succeeded())
        {
            out << "  Parse errors:\n";
            for (const auto &message : parsed.errors)
                out << "   - " << message << "\n";
            continue;
        }
        auto value = evaluator.eval(*parsed.expr, env);
        if (!value)
            out << "  Error: " << value.error().message << "\n";
        else
            out << "  Result: " << value.value().inspect()
                << " (type: " << eval::typeName(value.value().type()) << ")\n";
    }
}
} // namespace

int runDemo(std::ostream &out)
{
    runSamples(out);

    out << "=== Lexer Demo ===\n";
    out << "Tokenizing: " << kLexerSample << "\n";
    frontend::dumpTokens(kLexerSample, 0, out);

    out << "\n=== Typeof Evaluation Demo ===\n";
    runTypeofSamples(out);
    return 0;
}

} // namespace magolor::tools
