//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file
/// @brief Hand-rolled argument parsing for the `magolor` driver.
///
//===----------------------------------------------------------------------===//

#include "tools/magolor/cli.hpp"

#include "frontend/common/CharUtils.hpp"
#include "frontend/common/NumberParsing.hpp"

#include <string_view>

namespace magolor::tools
{

using magolor::support::Expected;
using magolor::support::makeError;

namespace
{
bool isValidName(std::string_view name)
{
    if (name.empty())
        return false;
    for (char c : name)
    {
        if (!frontend::char_utils::isIdentifierChar(c))
            return false;
    }
    return true;
}

bool isSignedDigits(std::string_view text)
{
    if (!text.empty() && text.front() == '-')
        text.remove_prefix(1);
    if (text.empty())
        return false;
    for (char c : text)
    {
        if (!frontend::char_utils::isDigit(c))
            return false;
    }
    return true;
}
} // namespace

eval::Value parseBindingValue(const std::string &text)
{
    if (text == "true" || text == "false")
        return eval::Value::makeBool(text == "true");

    const bool negative = !text.empty() && text.front() == '-';
    const std::string_view magnitude = std::string_view(text).substr(negative ? 1 : 0);

    if (isSignedDigits(text))
    {
        if (negative)
        {
            // Parse with the sign so INT64_MIN is representable.
            if (auto v = frontend::number_parsing::parseIntegerLiteral("-" + std::string(magnitude)))
                return eval::Value::makeInt(*v);
        }
        else if (auto v = frontend::number_parsing::parseIntegerLiteral(magnitude))
        {
            return eval::Value::makeInt(*v);
        }
        return eval::Value::makeString(text);
    }

    const auto dot = magnitude.find('.');
    if (dot != std::string_view::npos && isSignedDigits(magnitude.substr(0, dot)))
    {
        if (auto v = frontend::number_parsing::parseFloatLiteral(magnitude))
            return eval::Value::makeFloat(negative ? -*v : *v);
    }
    return eval::Value::makeString(text);
}

Expected<CliConfig> parseArgs(int argc, const char *const *argv)
{
    CliConfig config{};

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            config.action = CliAction::Help;
            return config;
        }
        if (arg == "--version")
        {
            config.action = CliAction::Version;
            return config;
        }
        if (arg == "--tokens")
        {
            config.dumpTokens = true;
        }
        else if (arg == "--tree")
        {
            config.dumpTree = true;
        }
        else if (arg == "--trace")
        {
            config.trace = true;
        }
        else if (arg == "--eval")
        {
            config.evalMode = true;
        }
        else if (arg == "--demo")
        {
            config.demo = true;
        }
        else if (arg == "-e")
        {
            if (i + 1 >= argc)
                return makeError({}, "-e requires source text");
            if (config.inlineSource || !config.sourcePath.empty())
                return makeError({}, "multiple inputs not supported");
            config.inlineSource = std::string(argv[++i]);
        }
        else if (arg == "-D")
        {
            if (i + 1 >= argc)
                return makeError({}, "-D requires name=value");
            const std::string_view binding = argv[++i];
            const auto eq = binding.find('=');
            if (eq == std::string_view::npos || !isValidName(binding.substr(0, eq)))
                return makeError({}, "invalid binding '" + std::string(binding) +
                                         "' (expected name=value)");
            config.bindings.emplace_back(std::string(binding.substr(0, eq)),
                                         parseBindingValue(std::string(binding.substr(eq + 1))));
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            return makeError({}, "unknown option: " + std::string(arg));
        }
        else if (arg.size() > 3 && arg.substr(arg.size() - 3) == ".mg")
        {
            if (config.inlineSource || !config.sourcePath.empty())
                return makeError({}, "multiple inputs not supported");
            config.sourcePath = std::string(arg);
        }
        else
        {
            return makeError({}, "unknown argument or file type: " + std::string(arg) +
                                     " (expected .mg file)");
        }
    }

    if (!config.demo && !config.inlineSource && config.sourcePath.empty())
        return makeError({}, "no input file");
    return config;
}

} // namespace magolor::tools
