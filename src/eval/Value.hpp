//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Value.hpp
/// @brief Runtime values produced by the expression evaluator.
///
/// @details A Value is one of Int, Float, String, Bool, or Null.  Null is what
/// `nil`, `null`, and `void` evaluate to and reports Type::Void.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "eval/Types.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace magolor::eval
{

class Value
{
  public:
    /// @brief Construct Null.
    Value() = default;

    static Value makeInt(int64_t v);
    static Value makeFloat(double v);
    static Value makeString(std::string v);
    static Value makeBool(bool v);
    static Value makeNull();

    [[nodiscard]] Type type() const;

    [[nodiscard]] bool isInt() const
    {
        return std::holds_alternative<int64_t>(data_);
    }

    [[nodiscard]] bool isFloat() const
    {
        return std::holds_alternative<double>(data_);
    }

    [[nodiscard]] bool isString() const
    {
        return std::holds_alternative<std::string>(data_);
    }

    [[nodiscard]] bool isBool() const
    {
        return std::holds_alternative<bool>(data_);
    }

    [[nodiscard]] bool isNull() const
    {
        return std::holds_alternative<std::monostate>(data_);
    }

    /// @brief Int or Float.
    [[nodiscard]] bool isNumeric() const
    {
        return isInt() || isFloat();
    }

    // Accessors require the matching is*() predicate.
    [[nodiscard]] int64_t asInt() const
    {
        return std::get<int64_t>(data_);
    }

    [[nodiscard]] double asFloat() const
    {
        return std::get<double>(data_);
    }

    [[nodiscard]] const std::string &asString() const
    {
        return std::get<std::string>(data_);
    }

    [[nodiscard]] bool asBool() const
    {
        return std::get<bool>(data_);
    }

    /// @brief Numeric value widened to double; requires isNumeric().
    [[nodiscard]] double toDouble() const;

    /// @brief Display form: `42`, `2.5`, `hello`, `true`, `null`.
    /// @details Floats use the shortest round-trip spelling and always show
    ///          a fractional part (`3.0`).
    [[nodiscard]] std::string inspect() const;

    friend bool operator==(const Value &a, const Value &b)
    {
        return a.data_ == b.data_;
    }

  private:
    std::variant<std::monostate, int64_t, double, std::string, bool> data_;
};

} // namespace magolor::eval
