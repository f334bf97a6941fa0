//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and shared aliases for Magolor AST nodes.
///
/// @details Statements contain expressions and blocks contain statements, so
/// the node headers reference one another only through the pointer aliases
/// declared here.
///
/// @invariant All pointer aliases are std::unique_ptr; the AST is a tree.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>

namespace magolor::frontend
{

struct Expr;
struct Stmt;
struct BlockStmt;

/// @brief Owning pointer to an expression node; null signals a failed parse.
using ExprPtr = std::unique_ptr<Expr>;

/// @brief Owning pointer to a statement node; null means "no statement".
using StmtPtr = std::unique_ptr<Stmt>;

/// @brief Owning pointer to a block, used for bodies that must be blocks.
using BlockPtr = std::unique_ptr<BlockStmt>;

using SourceLoc = magolor::support::SourceLoc;

} // namespace magolor::frontend
