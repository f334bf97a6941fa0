//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/magolor/version.hpp
// Purpose: Release version of the Magolor front end and its tools.
// Key invariants: MAGOLOR_VERSION_STR matches the numeric components.
// Ownership/Lifetime: Macros only.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#define MAGOLOR_VERSION_MAJOR 0
#define MAGOLOR_VERSION_MINOR 3
#define MAGOLOR_VERSION_PATCH 0
#define MAGOLOR_VERSION_STR "0.3.0"
