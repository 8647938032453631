//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/MergerTests.cpp
// Purpose: Check heading anchors, link retargeting and the merged layout.
// Key invariants: Anchors carry the owning file's prefix; inputs are emitted
//                 in order, each followed by a page break.
// Ownership/Lifetime: Tests own scratch files and a table resolver.
// Links: src/doc/Merger.cpp
//
//===----------------------------------------------------------------------===//

#include "doc/Merger.hpp"
#include "tests/TestHarness.hpp"
#include "tests/common/ScratchDir.hpp"
#include "tests/common/TableResolver.hpp"

#include <sstream>
#include <string>

using folio::doc::MergeSettings;
using folio::doc::MergeStats;
using folio::doc::Merger;

TEST(Merger, HeadingGetsPrefixedAnchor)
{
    folio::tests::TableResolver resolver;
    Merger merger(resolver, MergeSettings{});

    auto line = merger.rewriteLine("a.md", "n10", "## Getting Started  ");
    ASSERT_TRUE(line.hasValue());
    EXPECT_EQ(line.value(), std::string("## Getting Started {#n10-getting-started}"));

    auto plain = merger.rewriteLine("a.md", "n10", "plain text");
    ASSERT_TRUE(plain.hasValue());
    EXPECT_EQ(plain.value(), std::string("plain text"));
}

TEST(Merger, HeadingWithoutLabelIsUnchanged)
{
    folio::tests::TableResolver resolver;
    Merger merger(resolver, MergeSettings{});
    auto line = merger.rewriteLine("a.md", "n10", "## ...");
    ASSERT_TRUE(line.hasValue());
    EXPECT_EQ(line.value(), std::string("## ..."));
}

TEST(Merger, CrossFileLinkPointsAtTargetPrefix)
{
    folio::tests::TableResolver resolver;
    resolver.add("doc/b.md", 20);
    Merger merger(resolver, MergeSettings{});

    MergeStats stats;
    auto line = merger.rewriteLine("doc/a.md", "n10", "see [b](./b.md#usage) now", &stats);
    ASSERT_TRUE(line.hasValue());
    EXPECT_EQ(line.value(), std::string("see [b](#n20-usage) now"));
    EXPECT_EQ(stats.links, 1u);
    EXPECT_EQ(stats.anchors, 0u);
}

TEST(Merger, HeadingLinksAndAnchorTogether)
{
    folio::tests::TableResolver resolver;
    resolver.add("b.md", 20);
    Merger merger(resolver, MergeSettings{});

    MergeStats stats;
    auto line = merger.rewriteLine("a.md", "n10", "# About [b](./b.md#x)", &stats);
    ASSERT_TRUE(line.hasValue());
    EXPECT_EQ(line.value(), std::string("# About [b](#n20-x) {#n10-about-[b](-bmd#x)}"));
    EXPECT_EQ(stats.links, 1u);
    EXPECT_EQ(stats.anchors, 1u);
}

TEST(Merger, LocalLinksFollowSetting)
{
    folio::tests::TableResolver resolver;

    Merger keep(resolver, MergeSettings{});
    auto kept = keep.rewriteLine("a.md", "n10", "[up](#intro)");
    ASSERT_TRUE(kept.hasValue());
    EXPECT_EQ(kept.value(), std::string("[up](#intro)"));

    MergeSettings settings;
    settings.rewriteLocalLinks = true;
    Merger rewrite(resolver, settings);
    auto rewritten = rewrite.rewriteLine("a.md", "n10", "[up](#intro)");
    ASSERT_TRUE(rewritten.hasValue());
    EXPECT_EQ(rewritten.value(), std::string("[up](#n10-intro)"));
}

TEST(Merger, UnknownTargetIsAnError)
{
    folio::tests::TableResolver resolver;
    Merger merger(resolver, MergeSettings{});
    EXPECT_FALSE(merger.rewriteLine("a.md", "n10", "[x](./b.md#y)").hasValue());
}

TEST(Merger, MergesInputsInOrderWithPageBreaks)
{
    folio::tests::ScratchDir dir;
    dir.write("a.md", "# Intro\nsee [b](./b.md#intro)\n");
    dir.write("b.md", "# Intro\r\nbody");
    folio::tests::TableResolver resolver;
    resolver.add(dir.path("a.md"), 10);
    resolver.add(dir.path("b.md"), 20);

    Merger merger(resolver, MergeSettings{});
    std::ostringstream out;
    auto stats = merger.mergeInto(out, {dir.path("a.md"), dir.path("b.md")});
    ASSERT_TRUE(stats.hasValue());

    const std::string expected = "# Intro {#n10-intro}\n"
                                 "see [b](#n20-intro)\n"
                                 "\n\n\\newpage\n\n"
                                 "# Intro {#n20-intro}\n"
                                 "body\n"
                                 "\n\n\\newpage\n\n";
    EXPECT_EQ(out.str(), expected);
    EXPECT_EQ(stats.value().files, 2u);
    EXPECT_EQ(stats.value().lines, 4u);
    EXPECT_EQ(stats.value().anchors, 2u);
    EXPECT_EQ(stats.value().links, 1u);
}

TEST(Merger, CustomPageBreakAndTrace)
{
    folio::tests::ScratchDir dir;
    dir.write("a.md", "# Intro\ntext\n");
    folio::tests::TableResolver resolver;
    resolver.add(dir.path("a.md"), 10);

    MergeSettings settings;
    settings.pageBreak = "<hr/>";
    std::ostringstream trace;
    Merger merger(resolver, settings, &trace);

    std::ostringstream out;
    ASSERT_TRUE(merger.mergeInto(out, {dir.path("a.md")}).hasValue());
    EXPECT_EQ(out.str(), std::string("# Intro {#n10-intro}\ntext\n\n\n<hr/>\n\n"));
    EXPECT_EQ(trace.str(), std::string("> [# Intro]\n  [# Intro {#n10-intro}]\n"));
}

TEST(Merger, MergeToWritesFile)
{
    folio::tests::ScratchDir dir;
    dir.write("a.md", "hello\n");
    dir.write("out.md", "stale contents that must go away\n");
    folio::tests::TableResolver resolver;
    resolver.add(dir.path("a.md"), 10);

    Merger merger(resolver, MergeSettings{});
    auto stats = merger.mergeTo(dir.path("out.md"), {dir.path("a.md")});
    ASSERT_TRUE(stats.hasValue());
    EXPECT_EQ(dir.read("out.md"), std::string("hello\n\n\n\\newpage\n\n"));
}

TEST(Merger, MergeToReportsUnwritableOutput)
{
    folio::tests::ScratchDir dir;
    dir.write("a.md", "hello\n");
    folio::tests::TableResolver resolver;
    resolver.add(dir.path("a.md"), 10);

    Merger merger(resolver, MergeSettings{});
    auto stats = merger.mergeTo(dir.path("missing/out.md"), {dir.path("a.md")});
    ASSERT_FALSE(stats.hasValue());
    EXPECT_TRUE(stats.error().message.find("cannot open output") != std::string::npos);
}

int main(int argc, char **argv)
{
    folio_test::init(&argc, argv);
    return folio_test::run_all_tests();
}
