//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tokenises a Magolor source file and prints one token per line in the form
// `<line>:<column> <kind> [<text>]` for golden tests.
//
//===----------------------------------------------------------------------===//

#include "frontend/Frontend.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <iostream>

using namespace magolor::support;
using magolor::tools::common::loadSourceBuffer;

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        std::cerr << "Usage: magolor-lex-dump <file.mg>\n";
        return 1;
    }

    SourceManager sm;
    auto loaded = loadSourceBuffer(argv[1], sm);
    if (!loaded)
    {
        printDiag(loaded.error(), std::cerr);
        return 1;
    }

    magolor::frontend::dumpTokens(loaded.value().buffer, loaded.value().fileId, std::cout);
    return 0;
}
