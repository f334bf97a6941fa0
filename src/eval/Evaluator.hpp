//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Evaluator.hpp
/// @brief Tree-walking evaluator for Magolor expressions.
///
/// @details Only expressions are evaluated; statements have no runtime
/// semantics here.  Supported forms:
///
/// - literals, with `nil`/`null`/`void` evaluating to Null
/// - identifiers, looked up through the Environment chain
/// - prefix `-` and `+` on numbers, `!` on bools and ints
/// - infix arithmetic and comparison on ints and floats (ints promote when
///   mixed with floats), `+`/`==`/`!=` on strings, logical and equality
///   operators on bools, and equality against Null
/// - `typeof(e)`, which evaluates `e` and yields the name of its type
///
/// Failures come back as an error Expected carrying a diagnostic with code
/// M3001 positioned at the offending node.  Trees nested deeper than
/// frontend::kMaxTreeDepth are rejected the same way.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "eval/Environment.hpp"
#include "eval/Value.hpp"
#include "frontend/AST.hpp"
#include "support/diag_expected.hpp"

namespace magolor::eval
{

/// @brief Diagnostic code for evaluation failures.
inline constexpr const char *kEvalErrorCode = "M3001";

class Evaluator
{
  public:
    /// @brief Evaluate @p expr against @p env.
    magolor::support::Expected<Value> eval(const frontend::Expr &expr, const Environment &env);

  private:
    magolor::support::Expected<Value> evalPrefix(const frontend::PrefixExpr &expr,
                                                 const Environment &env);
    magolor::support::Expected<Value> evalInfix(const frontend::InfixExpr &expr,
                                                const Environment &env);
    magolor::support::Expected<Value> evalLogical(const frontend::InfixExpr &expr,
                                                  const Environment &env);

    unsigned depth_{0};
};

} // namespace magolor::eval
