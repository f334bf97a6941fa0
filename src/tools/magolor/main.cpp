//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file
/// @brief Entry point for the `magolor` CLI tool.
/// @details Parses arguments, prints usage or version when asked, and hands
///          everything else to runDriver().
///
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "tools/magolor/cli.hpp"
#include "tools/magolor/driver.hpp"
#include "tools/magolor/usage.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    using namespace magolor::tools;

    auto config = parseArgs(argc, argv);
    if (!config)
    {
        magolor::support::printDiag(config.error(), std::cerr);
        std::cerr << "\n";
        printUsage(std::cerr);
        return 1;
    }

    switch (config.value().action)
    {
        case CliAction::Help:
            printUsage(std::cout);
            return 0;
        case CliAction::Version:
            printVersion(std::cout);
            return 0;
        case CliAction::Run:
            break;
    }
    return runDriver(config.value(), std::cout, std::cerr);
}
