//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/magolor/driver.hpp
// Purpose: Executes a parsed driver configuration against output streams.
// Key invariants: Results go to @p out, diagnostics and traces to @p err.
// Ownership/Lifetime: Streams are borrowed for the duration of the call.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tools/magolor/cli.hpp"

#include <ostream>

namespace magolor::tools
{

/// @brief Run the driver.
/// @return Process exit status: 0 on success, 1 on any reported error.
int runDriver(const CliConfig &config, std::ostream &out, std::ostream &err);

/// @brief Run the built-in showcase of sample programs, tokens, and typeof.
/// @return 0; individual sample failures are printed, not propagated.
int runDemo(std::ostream &out);

} // namespace magolor::tools
