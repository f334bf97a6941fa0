//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Value.cpp
/// @brief Construction, typing, and display of evaluator values.
///
//===----------------------------------------------------------------------===//

#include "eval/Value.hpp"

#include <array>
#include <charconv>

namespace magolor::eval
{

Value Value::makeInt(int64_t v)
{
    Value out;
    out.data_ = v;
    return out;
}

Value Value::makeFloat(double v)
{
    Value out;
    out.data_ = v;
    return out;
}

Value Value::makeString(std::string v)
{
    Value out;
    out.data_ = std::move(v);
    return out;
}

Value Value::makeBool(bool v)
{
    Value out;
    out.data_ = v;
    return out;
}

Value Value::makeNull()
{
    return Value{};
}

Type Value::type() const
{
    if (isInt())
        return Type::Int;
    if (isFloat())
        return Type::Float;
    if (isString())
        return Type::String;
    if (isBool())
        return Type::Bool;
    return Type::Void;
}

double Value::toDouble() const
{
    return isInt() ? static_cast<double>(asInt()) : asFloat();
}

std::string Value::inspect() const
{
    if (isInt())
        return std::to_string(asInt());
    if (isFloat())
    {
        std::array<char, 64> buf{};
        auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), asFloat());
        if (ec != std::errc{})
            return "nan";
        std::string text(buf.data(), end);
        if (text.find_first_of(".eEn") == std::string::npos)
            text += ".0";
        return text;
    }
    if (isString())
        return asString();
    if (isBool())
        return asBool() ? "true" : "false";
    return "null";
}

} // namespace magolor::eval
