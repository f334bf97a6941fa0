//===----------------------------------------------------------------------===//
//
// Part of the Magolor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_magolor_diagnostics.cpp
// Purpose: Diagnostic formatting, counting, and source path bookkeeping.
// Key invariants: Printed form is `path:line:col: severity[code]: message`;
//                 location parts are omitted when unknown.
// Ownership/Lifetime: N/A (test).
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace magolor::support;

TEST(MagolorDiagnostics, PrintWithFullLocation)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("prog.mg");
    std::ostringstream os;
    printDiag(makeError({fid, 3, 7}, "expected next token to be =, got EOF instead", "M2001"),
              os,
              &sm);
    EXPECT_EQ(os.str(), "prog.mg:3:7: error[M2001]: expected next token to be =, got EOF instead\n");
}

TEST(MagolorDiagnostics, PrintDropsUnknownLocationParts)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("prog.mg");

    std::ostringstream lineOnly;
    printDiag(makeError({fid, 4, 0}, "oops"), lineOnly, &sm);
    EXPECT_EQ(lineOnly.str(), "prog.mg:4: error: oops\n");

    std::ostringstream noManager;
    printDiag(makeError({fid, 4, 2}, "boom", "M3001"), noManager);
    EXPECT_EQ(noManager.str(), "error[M3001]: boom\n");

    std::ostringstream noFile;
    printDiag(makeError({}, "unable to open x.mg"), noFile, &sm);
    EXPECT_EQ(noFile.str(), "error: unable to open x.mg\n");
}

TEST(MagolorDiagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine de;
    de.report({Severity::Error, "first", {}});
    de.report({Severity::Warning, "second", {}});
    de.report({Severity::Note, "third", {}});
    de.report({Severity::Error, "fourth", {}, "M2001"});
    EXPECT_EQ(de.errorCount(), 2u);
    EXPECT_EQ(de.warningCount(), 1u);
    ASSERT_EQ(de.diagnostics().size(), 4u);

    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(),
              "error: first\n"
              "warning: second\n"
              "note: third\n"
              "error[M2001]: fourth\n");
}

TEST(MagolorDiagnostics, ExpectedCarriesValueOrError)
{
    Expected<int> ok = 5;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 5);

    Expected<int> bad = makeError({}, "nope");
    EXPECT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().message, "nope");
    EXPECT_EQ(bad.error().severity, Severity::Error);

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed = makeError({}, "void failure");
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "void failure");
}

TEST(MagolorSourceManager, NormalizesAndDeduplicatesPaths)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("dir/./prog.mg");
    const uint32_t b = sm.addFile("dir/prog.mg");
    const uint32_t c = sm.addFile("<inline>");
    EXPECT_NE(a, 0u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(sm.fileCount(), 2u);
    EXPECT_EQ(sm.getPath(a), "dir/prog.mg");
    EXPECT_EQ(sm.getPath(c), "<inline>");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(99).empty());
}

TEST(MagolorSourceLocation, ValidityNeedsFile)
{
    EXPECT_TRUE((SourceLoc{1, 2, 5}.isValid()));
    EXPECT_TRUE((SourceLoc{1, 0, 0}.isValid()));
    EXPECT_FALSE((SourceLoc{0, 2, 5}.isValid()));
    EXPECT_FALSE(SourceLoc{}.hasLine());
}
