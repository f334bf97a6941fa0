//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/common/NumberParsing.hpp
// Purpose: Converts numeric literal spellings into int64/double values.
//
// The lexer only classifies INT versus FLOAT; conversion happens in the
// parser so that out-of-range literals become parse errors attached to the
// literal's location.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace magolor::frontend::number_parsing
{

/// @brief Parse a decimal integer literal.
/// @param text Digits only; signs are separate prefix operators.
/// @return Value, or std::nullopt when @p text is empty, malformed, or does
///         not fit in int64_t.
[[nodiscard]] inline std::optional<int64_t> parseIntegerLiteral(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    int64_t value = 0;
    const char *end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc{} || result.ptr != end)
        return std::nullopt;
    return value;
}

/// @brief Parse a decimal floating-point literal of the form `digits.digits`.
/// @return Value, or std::nullopt when the text is not fully consumed or the
///         magnitude overflows to infinity.
[[nodiscard]] inline std::optional<double> parseFloatLiteral(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    // strtod needs a terminated buffer.
    std::string buffer(text);
    char *endPtr = nullptr;
    errno = 0;
    const double value = std::strtod(buffer.c_str(), &endPtr);
    if (endPtr != buffer.c_str() + buffer.size())
        return std::nullopt;
    if (errno == ERANGE && std::isinf(value))
        return std::nullopt;
    return value;
}

} // namespace magolor::frontend::number_parsing
