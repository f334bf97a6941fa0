//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstRender.hpp
/// @brief Canonical single-line source rendering of Magolor AST nodes.
///
/// @details The rendering fully parenthesizes operators, so it exposes the
/// precedence and associativity the parser chose:
///
/// @code
///   a + b * c            ->  (a + (b * c))
///   -a + b               ->  ((-a) + b)
///   int x = 5;           ->  int x = 5;
///   fn f(int a) { a }    ->  void f(int a) { a }
///   if (a) b else c      ->  if (a) { b } else { c }
/// @endcode
///
/// Blocks render as `{ ` followed by each statement and a space, then `}`;
/// an empty block is `{ }`.  A program renders each top-level statement
/// followed by a newline.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"

#include <string>

namespace magolor::frontend
{

std::string render(const Expr &expr);
std::string render(const Stmt &stmt);
std::string render(const Program &program);

} // namespace magolor::frontend
