//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Umbrella header for the Magolor AST and its root node.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Expr.hpp"
#include "frontend/AST_Fwd.hpp"
#include "frontend/AST_Stmt.hpp"

#include <vector>

namespace magolor::frontend
{

/// @brief Deepest node the tree walkers (renderers, evaluator) descend to.
/// @details Parser output stays well below this; hand-built trees that go
///          deeper are elided or rejected instead of exhausting the stack.
inline constexpr unsigned kMaxTreeDepth = 1024;

/// @brief Root of a parse: the top-level statements in source order.
struct Program
{
    std::vector<StmtPtr> statements;
};

} // namespace magolor::frontend
