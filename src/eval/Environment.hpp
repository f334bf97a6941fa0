//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/Environment.hpp
// Purpose: Declares the variable scope chain consulted by the evaluator.
// Key invariants: Lookups search the innermost scope first, then outward.
// Ownership/Lifetime: A scope owns its bindings; the enclosing scope is
//                     borrowed and must outlive every scope nested in it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "eval/Value.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace magolor::eval
{

class Environment
{
  public:
    /// @brief Create an outermost scope.
    Environment() = default;

    /// @brief Create a scope nested inside @p outer.
    explicit Environment(const Environment *outer);

    /// @brief Look up @p name here, then in enclosing scopes.
    [[nodiscard]] std::optional<Value> get(const std::string &name) const;

    /// @brief Bind @p name in this scope, shadowing any outer binding.
    void set(std::string name, Value value);

  private:
    std::unordered_map<std::string, Value> store_;
    const Environment *outer_ = nullptr;
};

} // namespace magolor::eval
