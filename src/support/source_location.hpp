//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source position value type attached to tokens, AST
//          nodes, and diagnostics.
// Key invariants: file_id == 0 denotes an unregistered buffer; line/column are
//                 1-based when known and 0 when unknown.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace magolor::support
{

/// @brief Position of a single byte inside a source buffer.
/// @invariant file_id == 0 indicates the buffer was never registered.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 when unknown.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace magolor::support
