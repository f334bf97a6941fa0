//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Shared helpers for loading Magolor source files in the CLI tools.
// Key invariants: A successful LoadedSource always carries a non-zero fileId.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <ios>
#include <string>

namespace magolor::tools::common
{

/// @brief Result of loading a source file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager.
};

/// @brief Largest source file the tools will read.
inline constexpr std::streamoff kMaxSourceSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);

/// @brief Read @p path into memory and register it with @p sm.
/// @return Loaded source, or a diagnostic describing the I/O failure,
///         the size limit, or SourceManager exhaustion.
magolor::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                          magolor::support::SourceManager &sm);

/// @brief Register in-memory text (e.g. from `-e`) under a pseudo path.
magolor::support::Expected<LoadedSource> adoptSourceText(std::string text,
                                                         const std::string &pseudoPath,
                                                         magolor::support::SourceManager &sm);

} // namespace magolor::tools::common
