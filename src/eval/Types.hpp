//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/Types.hpp
// Purpose: Declares Magolor's primitive type tags and the name-to-type
//          environment used by tooling that needs declared types without
//          evaluating anything.
// Key invariants: Unbound names report Type::Unknown, never an error.
// Ownership/Lifetime: TypeEnv owns its bindings by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace magolor::eval
{

/// @brief Primitive types of the language.
enum class Type
{
    Int,
    String,
    Void,
    Float,
    Bool,
    Unknown,
};

/// @brief Lower-case spelling: "int", "string", "void", "float", "bool", "unknown".
const char *typeName(Type type);

/// @brief Map a type keyword spelling to its tag; other text maps to Unknown.
Type typeFromName(std::string_view name);

/// @brief Flat map from variable names to declared types.
class TypeEnv
{
  public:
    /// @brief Declared type of @p name, or Type::Unknown when unbound.
    [[nodiscard]] Type get(const std::string &name) const;

    /// @brief Bind or rebind @p name.
    void set(std::string name, Type type);

  private:
    std::unordered_map<std::string, Type> vars_;
};

} // namespace magolor::eval
