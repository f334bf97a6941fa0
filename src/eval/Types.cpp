//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Types.cpp
/// @brief Type tag spellings and the TypeEnv lookup table.
///
//===----------------------------------------------------------------------===//

#include "eval/Types.hpp"

namespace magolor::eval
{

const char *typeName(Type type)
{
    switch (type)
    {
        case Type::Int:
            return "int";
        case Type::String:
            return "string";
        case Type::Void:
            return "void";
        case Type::Float:
            return "float";
        case Type::Bool:
            return "bool";
        case Type::Unknown:
            return "unknown";
    }
    return "unknown";
}

Type typeFromName(std::string_view name)
{
    if (name == "int")
        return Type::Int;
    if (name == "string")
        return Type::String;
    if (name == "void")
        return Type::Void;
    if (name == "float")
        return Type::Float;
    if (name == "bool")
        return Type::Bool;
    return Type::Unknown;
}

Type TypeEnv::get(const std::string &name) const
{
    if (auto it = vars_.find(name); it != vars_.end())
        return it->second;
    return Type::Unknown;
}

void TypeEnv::set(std::string name, Type type)
{
    vars_[std::move(name)] = type;
}

} // namespace magolor::eval
