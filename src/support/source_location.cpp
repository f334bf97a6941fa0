//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity check for SourceLoc.  A location is
// valid once it names a registered file; line and column stay optional so the
// lexer can still attach positions to buffers that were never registered.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace magolor::support
{
/// @brief Determine whether the location belongs to a registered buffer.
/// @return True when file_id is non-zero.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace magolor::support
