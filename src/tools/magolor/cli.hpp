//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/magolor/cli.hpp
// Purpose: Command-line configuration for the `magolor` driver.
// Key invariants: A Run config has exactly one input (file or inline text)
//                 unless demo mode is selected.
// Ownership/Lifetime: CliConfig is a value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "eval/Value.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace magolor::tools
{

enum class CliAction
{
    Run,
    Help,
    Version,
};

struct CliConfig
{
    CliAction action = CliAction::Run;

    /// @brief Path of a `.mg` file; empty when inline text or demo is used.
    std::string sourcePath;

    /// @brief Text given with `-e`.
    std::optional<std::string> inlineSource;

    bool dumpTokens = false;
    bool dumpTree = false;
    bool trace = false;
    bool evalMode = false;
    bool demo = false;

    /// @brief `-D name=value` bindings in command-line order.
    std::vector<std::pair<std::string, eval::Value>> bindings;
};

/// @brief Parse driver arguments.
/// @return The configuration, or a diagnostic naming the offending argument.
magolor::support::Expected<CliConfig> parseArgs(int argc, const char *const *argv);

/// @brief Convert the value half of `-D name=value`.
/// @details Integers become Int, `true`/`false` Bool, `digits.digits` Float,
///          and anything else String.
eval::Value parseBindingValue(const std::string &text);

} // namespace magolor::tools
