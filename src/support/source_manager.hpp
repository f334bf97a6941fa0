//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping source file identifiers to paths.
// Key invariants: File ID 0 is invalid; identifiers are dense and start at 1.
// Ownership/Lifetime: Manager owns the normalized path strings.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace magolor::support
{

/// Hands out numeric identifiers for source paths so tokens and diagnostics
/// can carry a 32-bit file id instead of a string.
class SourceManager
{
  public:
    /// @brief Register @p path and return its id.
    /// @details Paths are normalized first; registering the same path twice
    ///          yields the same id.
    /// @return New or existing identifier, or 0 when the id space is exhausted.
    uint32_t addFile(std::string path);

    /// @brief Retrieve the path for @p file_id, or an empty view when unknown.
    [[nodiscard]] std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    [[nodiscard]] size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Index i holds the path of file id i + 1. A deque keeps references stable.
    std::deque<std::string> files_;

    /// Stored as 64-bit so overflow of the 32-bit id space can be detected.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace magolor::support
