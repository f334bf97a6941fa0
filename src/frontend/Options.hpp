//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Options controlling a Magolor front-end run.
///
/// @details Options are usually filled from command-line flags by the
/// `magolor` driver and passed by const reference into parseSource().
///
/// @invariant Default-constructed options produce no output besides
///            diagnostics recorded in the result.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <iostream>
#include <ostream>

namespace magolor::frontend
{

struct FrontendOptions
{
    /// @brief Print phase progress lines to @ref traceStream.
    bool trace{false};

    /// @brief Print the token stream to @ref dumpStream before parsing.
    bool dumpTokens{false};

    /// @brief Destination for trace lines; must outlive the run.
    std::ostream *traceStream{&std::cerr};

    /// @brief Destination for token dumps; must outlive the run.
    std::ostream *dumpStream{&std::cout};
};

} // namespace magolor::frontend
