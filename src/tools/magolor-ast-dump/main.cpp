//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `magolor-ast-dump` developer utility. The program parses a
// Magolor source file with the production front end and prints the indented
// AST, or the collected diagnostics when parsing fails.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the Magolor AST dumper CLI.

#include "frontend/AstPrinter.hpp"
#include "frontend/Frontend.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <iostream>

using namespace magolor::frontend;
using namespace magolor::support;
using magolor::tools::common::loadSourceBuffer;

/// @brief Entry point for the Magolor AST dump tool.
/// @return Zero on success; one when the file cannot be loaded or parsing
///         reports errors.
int main(int argc, char **argv)
{
    if (argc != 2)
    {
        std::cerr << "Usage: magolor-ast-dump <file.mg>\n";
        return 1;
    }

    SourceManager sm;
    auto loaded = loadSourceBuffer(argv[1], sm);
    if (!loaded)
    {
        printDiag(loaded.error(), std::cerr);
        return 1;
    }

    ParseInput input{};
    input.source = loaded.value().buffer;
    input.path = sm.getPath(loaded.value().fileId);
    input.fileId = loaded.value().fileId;

    auto result = parseSource(input, FrontendOptions{}, sm);
    if (!result.succeeded())
    {
        result.diagnostics.printAll(std::cerr, &sm);
        std::cerr << std::flush;
        return 1;
    }

    AstPrinter printer;
    std::cout << printer.dump(result.program);
    return 0;
}
