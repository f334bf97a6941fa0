//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Environment.cpp
/// @brief Scope chain lookups for the evaluator.
///
//===----------------------------------------------------------------------===//

#include "eval/Environment.hpp"

namespace magolor::eval
{

Environment::Environment(const Environment *outer) : outer_(outer)
{
}

std::optional<Value> Environment::get(const std::string &name) const
{
    for (const Environment *scope = this; scope != nullptr; scope = scope->outer_)
    {
        if (auto it = scope->store_.find(name); it != scope->store_.end())
            return it->second;
    }
    return std::nullopt;
}

void Environment::set(std::string name, Value value)
{
    store_[std::move(name)] = std::move(value);
}

} // namespace magolor::eval
