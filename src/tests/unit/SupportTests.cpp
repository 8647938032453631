//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/SupportTests.cpp
// Purpose: Cover path helpers, line splitting and diagnostic formatting.
// Key invariants: Diagnostics print as "path:line:col: severity: message".
// Ownership/Lifetime: Stack-allocated managers and engines only.
// Links: src/support
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/path_utils.hpp"
#include "support/source_loader.hpp"
#include "support/source_manager.hpp"
#include "tests/TestHarness.hpp"
#include "tests/common/ScratchDir.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace folio::support;

TEST(PathUtils, Normalize)
{
    EXPECT_EQ(normalizePath("./a.md"), std::string("a.md"));
    EXPECT_EQ(normalizePath("doc/../a.md"), std::string("a.md"));
    EXPECT_EQ(normalizePath("doc\\sub\\a.md"), std::string("doc/sub/a.md"));
    EXPECT_EQ(normalizePath(""), std::string("."));
    EXPECT_EQ(normalizePath("doc/"), std::string("doc"));
}

TEST(PathUtils, DirnameAndBasename)
{
    EXPECT_EQ(dirname("doc/a.md"), std::string("doc"));
    EXPECT_EQ(dirname("a.md"), std::string("."));
    EXPECT_EQ(dirname("/a.md"), std::string("/"));
    EXPECT_EQ(basename("doc/a.md"), std::string("a.md"));
    EXPECT_EQ(basename("doc/"), std::string());
}

TEST(PathUtils, ResolveSiblingUsesReferencingDirectory)
{
    EXPECT_EQ(resolveSibling("doc/b.md", "./a.md"), std::string("doc/a.md"));
    EXPECT_EQ(resolveSibling("b.md", "./sub/a.md"), std::string("sub/a.md"));
    EXPECT_EQ(resolveSibling("/x/y/b.md", "./a.md"), std::string("/x/y/a.md"));
    EXPECT_EQ(resolveSibling("doc/b.md", "/abs/a.md"), std::string("/abs/a.md"));
}

TEST(SourceLoader, SplitLinesHandlesCrlfAndMissingNewline)
{
    const std::vector<std::string> expected = {"one", "", "three"};
    EXPECT_EQ(splitLines("one\r\n\r\nthree"), expected);
    EXPECT_EQ(splitLines("one\n\nthree\n"), expected);
    EXPECT_TRUE(splitLines("").empty());
}

TEST(SourceLoader, LoadReportsMissingFile)
{
    folio::tests::ScratchDir dir;
    auto lines = loadSourceLines(dir.path("missing.md"));
    ASSERT_FALSE(lines.hasValue());
    EXPECT_TRUE(lines.error().severity == Severity::Error);

    dir.write("a.md", "x\ny");
    auto loaded = loadSourceLines(dir.path("a.md"));
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().size(), 2u);
}

TEST(SourceManager, StableIdsForNormalizedPaths)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("./doc/a.md");
    const uint32_t again = sm.addFile("doc/a.md");
    const uint32_t b = sm.addFile("doc/b.md");
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(again, a);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(sm.getPath(a), std::string_view("doc/a.md"));
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(9).empty());
    EXPECT_EQ(sm.size(), 2u);
}

TEST(Diagnostics, PrintWithLocation)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("doc/a.md");

    std::ostringstream os;
    printDiag(makeError({id, 3, 7}, "bad link"), os, &sm);
    EXPECT_EQ(os.str(), std::string("doc/a.md:3:7: error: bad link\n"));

    std::ostringstream bare;
    printDiag(makeNote({}, "context"), bare, &sm);
    EXPECT_EQ(bare.str(), std::string("note: context\n"));

    std::ostringstream lineOnly;
    printDiag(makeWarning({id, 2, 0}, "heads up"), lineOnly, &sm);
    EXPECT_EQ(lineOnly.str(), std::string("doc/a.md:2: warning: heads up\n"));
}

TEST(Diagnostics, ColorWrapsErrorsAndWarningsOnly)
{
    std::ostringstream err;
    printDiag(makeError({}, "x"), err, nullptr, true);
    EXPECT_EQ(err.str(), std::string("\033[31merror\033[0m: x\n"));

    std::ostringstream warn;
    printDiag(makeWarning({}, "y"), warn, nullptr, true);
    EXPECT_EQ(warn.str(), std::string("\033[33mwarning\033[0m: y\n"));

    std::ostringstream note;
    printDiag(makeNote({}, "z"), note, nullptr, true);
    EXPECT_EQ(note.str(), std::string("note: z\n"));
}

TEST(Diagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report(makeWarning({}, "w"));
    engine.report(makeNote({}, "n"));
    engine.report(makeError({}, "e"));
    engine.report(makeError({}, "e2"));
    EXPECT_EQ(engine.errorCount(), 2u);
    EXPECT_EQ(engine.warningCount(), 1u);
    EXPECT_EQ(engine.size(), 4u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(), std::string("warning: w\nnote: n\nerror: e\nerror: e2\n"));
}

TEST(Expected, CarriesValueOrDiagnostic)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), 42);

    Expected<int> failed(makeError({}, "nope"));
    EXPECT_FALSE(failed.hasValue());
    EXPECT_EQ(failed.error().message, std::string("nope"));

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> broken(makeError({}, "broken"));
    EXPECT_FALSE(static_cast<bool>(broken));
}

int main(int argc, char **argv)
{
    folio_test::init(&argc, argv);
    return folio_test::run_all_tests();
}
