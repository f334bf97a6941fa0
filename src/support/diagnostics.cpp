//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file diagnostics.cpp
/// @brief Implements the diagnostic engine responsible for collecting messages.
///
/// @details Diagnostics are stored until callers print or inspect them.  The
///          engine only counts; formatting lives in printDiag so single
///          diagnostics returned through Expected print identically.
///
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace magolor::support
{
/// @brief Adds a diagnostic to the engine and updates severity counters.
///
/// Notes are stored but leave both counters untouched.
///
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Writes all stored diagnostics, one per line, in report order.
/// @param os Output stream that receives the formatted diagnostics.
/// @param sm Optional source manager used to translate file identifiers.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace magolor::support
