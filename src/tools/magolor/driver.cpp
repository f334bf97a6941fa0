//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file
/// @brief Program and expression modes of the `magolor` driver.
///
//===----------------------------------------------------------------------===//

#include "tools/magolor/driver.hpp"

#include "eval/Environment.hpp"
#include "eval/Evaluator.hpp"
#include "frontend/AstPrinter.hpp"
#include "frontend/AstRender.hpp"
#include "frontend/Frontend.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

namespace magolor::tools
{

namespace
{
int runEval(const CliConfig &config,
            const frontend::ParseInput &input,
            const frontend::FrontendOptions &options,
            magolor::support::SourceManager &sm,
            std::ostream &out,
            std::ostream &err)
{
    auto parsed = frontend::parseExpressionSource(input, options, sm);
    if (!parsed.succeeded())
    {
        parsed.diagnostics.printAll(err, &sm);
        return 1;
    }

    eval::Environment env;
    for (const auto &[name, value] : config.bindings)
        env.set(name, value);

    eval::Evaluator evaluator;
    auto result = evaluator.eval(*parsed.expr, env);
    if (!result)
    {
        magolor::support::printDiag(result.error(), err, &sm);
        return 1;
    }

    const eval::Value &value = result.value();
    out << value.inspect() << " (type: " << eval::typeName(value.type()) << ")\n";
    if (config.trace)
        err << "[trace] eval " << input.path << ": " << eval::typeName(value.type()) << "\n";
    return 0;
}

int runProgram(const CliConfig &config,
               const frontend::ParseInput &input,
               const frontend::FrontendOptions &options,
               magolor::support::SourceManager &sm,
               std::ostream &out,
               std::ostream &err)
{
    auto result = frontend::parseSource(input, options, sm);
    if (!result.succeeded())
    {
        result.diagnostics.printAll(err, &sm);
        return 1;
    }

    if (config.dumpTree)
        out << frontend::AstPrinter().dump(result.program);
    else
        out << frontend::render(result.program);
    return 0;
}
} // namespace

int runDriver(const CliConfig &config, std::ostream &out, std::ostream &err)
{
    if (config.demo)
        return runDemo(out);

    magolor::support::SourceManager sm;
    auto loaded = config.inlineSource
                      ? common::adoptSourceText(*config.inlineSource, "<inline>", sm)
                      : common::loadSourceBuffer(config.sourcePath, sm);
    if (!loaded)
    {
        magolor::support::printDiag(loaded.error(), err);
        return 1;
    }
    const common::LoadedSource &source = loaded.value();

    frontend::FrontendOptions options{};
    options.trace = config.trace;
    options.dumpTokens = config.dumpTokens;
    options.traceStream = &err;
    options.dumpStream = &out;

    frontend::ParseInput input{};
    input.source = source.buffer;
    input.path = sm.getPath(source.fileId);
    input.fileId = source.fileId;

    if (config.evalMode)
        return runEval(config, input, options, sm, out, err);
    return runProgram(config, input, options, sm, out, err);
}

} // namespace magolor::tools
