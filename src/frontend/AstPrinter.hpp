//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Indented tree dump of a Magolor AST for debugging.
///
/// Each node prints on its own line with its kind, key attributes, and
/// `(line:col)`; children are indented two spaces.  Example for
/// `int add(int a, int b) { return a + b; }`:
///
/// @code
///   Program
///     FunctionStmt "add" -> int (1:1)
///       Param int "a" (1:9)
///       Param int "b" (1:16)
///       Body:
///         BlockStmt (1:23)
///           ReturnStmt (1:25)
///             InfixExpr (+) (1:34)
///               IdentifierExpr "a" (1:32)
///               IdentifierExpr "b" (1:36)
/// @endcode
///
/// @invariant Printing never mutates the AST.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"

#include <string>

namespace magolor::frontend
{

class AstPrinter
{
  public:
    /// @brief Dump every top-level statement of @p program.
    std::string dump(const Program &program);

    /// @brief Dump a single expression subtree.
    std::string dump(const Expr &expr);
};

} // namespace magolor::frontend
