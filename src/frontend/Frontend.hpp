//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.hpp
/// @brief One-call entry points that lex and parse Magolor source.
///
/// ## Usage
///
/// ```cpp
/// SourceManager sm;
/// FrontendOptions options{};
/// ParseResult result = parseSource({source, "main.mg"}, options, sm);
/// if (!result.succeeded())
///     result.diagnostics.printAll(std::cerr, &sm);
/// ```
///
/// The result owns its DiagnosticEngine; callers print it with the same
/// SourceManager so locations resolve to paths.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "frontend/Options.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace magolor::frontend
{

/// @brief Diagnostic code for unreadable input files.
inline constexpr const char *kIoErrorCode = "M0001";

struct ParseInput
{
    /// @brief Magolor source text.
    std::string_view source;

    /// @brief Path used for diagnostics.
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

/// @brief Program plus everything the parser recorded while building it.
struct ParseResult
{
    magolor::support::DiagnosticEngine diagnostics{};
    uint32_t fileId{0};
    Program program{};

    /// @brief Parser error messages in order, without locations.
    std::vector<std::string> errors{};

    /// @brief True when no error diagnostics were recorded.
    [[nodiscard]] bool succeeded() const;
};

/// @brief Result of parsing input that must be a single expression.
struct ExpressionResult
{
    magolor::support::DiagnosticEngine diagnostics{};
    uint32_t fileId{0};
    ExprPtr expr{};
    std::vector<std::string> errors{};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Lex and parse a whole program.
ParseResult parseSource(const ParseInput &input,
                        const FrontendOptions &options,
                        magolor::support::SourceManager &sm);

/// @brief Read @p path and parse it as a program.
/// @details The file is read with tools::common::loadSourceBuffer, so the
///          64 MB size limit applies.  A load failure yields a result with
///          one M0001 diagnostic carrying the loader's message.
ParseResult parseFile(const std::string &path,
                      const FrontendOptions &options,
                      magolor::support::SourceManager &sm);

/// @brief Parse @p input as exactly one expression, optionally followed by `;`.
/// @details Tokens after the expression are reported as M2002 errors.
ExpressionResult parseExpressionSource(const ParseInput &input,
                                       const FrontendOptions &options,
                                       magolor::support::SourceManager &sm);

/// @brief Write one `line:col KIND [text]` line per token, ending with EOF.
void dumpTokens(std::string_view source, uint32_t fileId, std::ostream &os);

} // namespace magolor::frontend
