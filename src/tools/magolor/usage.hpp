//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file
/// @brief Usage and version output for the `magolor` driver.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace magolor::tools
{

void printUsage(std::ostream &os);
void printVersion(std::ostream &os);

} // namespace magolor::tools
