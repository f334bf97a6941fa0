//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file
/// @brief Implements usage and version output for the `magolor` driver.
///
//===----------------------------------------------------------------------===//

#include "tools/magolor/usage.hpp"

#include "magolor/version.hpp"

namespace magolor::tools
{

void printVersion(std::ostream &os)
{
    os << "magolor v" << MAGOLOR_VERSION_STR << "\n";
    os << "Magolor front end\n";
}

void printUsage(std::ostream &os)
{
    os << "magolor v" << MAGOLOR_VERSION_STR << " - Magolor front end\n"
       << "\n"
       << "Usage: magolor [options] <file.mg>\n"
       << "       magolor [options] -e <source>\n"
       << "       magolor --demo\n"
       << "\n"
       << "Usage Modes:\n"
       << "  magolor prog.mg              Parse and print the canonical program\n"
       << "  magolor prog.mg --tree       Print the indented AST dump\n"
       << "  magolor -e 'x + 1' --eval    Evaluate a single expression\n"
       << "\n"
       << "Options:\n"
       << "  -e <source>       Use <source> instead of a file\n"
       << "  --tokens          Dump the token stream before parsing\n"
       << "  --tree            Print the AST as an indented tree\n"
       << "  --eval            Parse the input as one expression and evaluate it\n"
       << "  -D name=value     Bind a variable for --eval (int, float, bool, or string)\n"
       << "  --trace           Print phase progress to stderr\n"
       << "  --demo            Run the built-in parser and typeof showcase\n"
       << "  -h, --help        Show this help\n"
       << "  --version         Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  magolor examples/functions.mg\n"
       << "  magolor -e 'typeof(x + 5)' --eval -D x=100\n";
}

} // namespace magolor::tools
