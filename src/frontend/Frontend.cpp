//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.cpp
/// @brief Implementation of the parseSource()/parseFile() entry points.
///
/// @details Phases run in order:
/// 1. Register the input with the SourceManager (unless a file id is given)
/// 2. Optionally dump the token stream with a separate lexer
/// 3. Lex and parse with a fresh Lexer/Parser pair
/// 4. Emit a trace summary when tracing is enabled
///
//===----------------------------------------------------------------------===//

#include "frontend/Frontend.hpp"

#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "tools/common/source_loader.hpp"

namespace magolor::frontend
{

namespace
{
uint32_t resolveFileId(const ParseInput &input, magolor::support::SourceManager &sm)
{
    if (input.fileId.has_value())
        return *input.fileId;
    return sm.addFile(std::string(input.path));
}

bool printsText(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Identifier:
        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::BoolLiteral:
        case TokenKind::NilLiteral:
        case TokenKind::Type:
        case TokenKind::Illegal:
            return true;
        default:
            return false;
    }
}
} // namespace

bool ParseResult::succeeded() const
{
    return diagnostics.errorCount() == 0;
}

bool ExpressionResult::succeeded() const
{
    return expr != nullptr && diagnostics.errorCount() == 0;
}

void dumpTokens(std::string_view source, uint32_t fileId, std::ostream &os)
{
    Lexer lexer{std::string(source), fileId};
    for (Token t = lexer.next();; t = lexer.next())
    {
        os << t.loc.line << ":" << t.loc.column << " " << tokenKindToString(t.kind);
        if (printsText(t.kind))
            os << " " << t.text;
        os << "\n";
        if (t.is(TokenKind::Eof))
            break;
    }
}

ParseResult parseSource(const ParseInput &input,
                        const FrontendOptions &options,
                        magolor::support::SourceManager &sm)
{
    ParseResult result{};
    result.fileId = resolveFileId(input, sm);

    if (options.dumpTokens && options.dumpStream)
        dumpTokens(input.source, result.fileId, *options.dumpStream);

    Lexer lexer{std::string(input.source), result.fileId};
    Parser parser(lexer, result.diagnostics);
    result.program = parser.parseProgram();
    result.errors = parser.errors();

    if (options.trace && options.traceStream)
    {
        *options.traceStream << "[trace] lex+parse " << input.path << ": "
                             << result.program.statements.size() << " statements, "
                             << result.errors.size() << " errors\n";
    }
    return result;
}

ParseResult parseFile(const std::string &path,
                      const FrontendOptions &options,
                      magolor::support::SourceManager &sm)
{
    auto loaded = magolor::tools::common::loadSourceBuffer(path, sm);
    if (!loaded)
    {
        ParseResult result{};
        const auto &err = loaded.error();
        result.diagnostics.report(
            {magolor::support::Severity::Error, err.message, err.loc, kIoErrorCode});
        return result;
    }

    ParseInput input;
    input.source = loaded.value().buffer;
    input.path = path;
    input.fileId = loaded.value().fileId;
    return parseSource(input, options, sm);
}

ExpressionResult parseExpressionSource(const ParseInput &input,
                                       const FrontendOptions &options,
                                       magolor::support::SourceManager &sm)
{
    ExpressionResult result{};
    result.fileId = resolveFileId(input, sm);

    if (options.dumpTokens && options.dumpStream)
        dumpTokens(input.source, result.fileId, *options.dumpStream);

    Lexer lexer{std::string(input.source), result.fileId};
    Parser parser(lexer, result.diagnostics);
    result.expr = parser.parseExpression(Precedence::Lowest);

    if (result.expr && !parser.expectEnd())
        result.expr.reset();

    result.errors = parser.errors();
    return result;
}

} // namespace magolor::frontend
