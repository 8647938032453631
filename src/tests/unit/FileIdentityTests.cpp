//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/FileIdentityTests.cpp
// Purpose: Exercise the stat-based identity resolver on scratch files.
// Key invariants: Aliased paths share one identity; pathOf succeeds only for
//                 exactly one match under the root.
// Ownership/Lifetime: Each test owns a scratch directory.
// Links: src/doc/FileIdentity.cpp
//
//===----------------------------------------------------------------------===//

#include "doc/FileIdentity.hpp"
#include "tests/TestHarness.hpp"
#include "tests/common/ScratchDir.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_set>

using folio::doc::FileIdentity;
using folio::doc::FileIdentityHash;
using folio::doc::FileSystemIdentityResolver;

TEST(FileIdentity, AnchorPrefixUsesInode)
{
    FileIdentity id{3, 4711};
    EXPECT_EQ(id.anchorPrefix(), std::string("n4711"));
}

TEST(FileIdentity, HashSeparatesDistinctIdentities)
{
    std::unordered_set<FileIdentity, FileIdentityHash> ids;
    ids.insert(FileIdentity{1, 2});
    ids.insert(FileIdentity{2, 1});
    ids.insert(FileIdentity{1, 2});
    EXPECT_EQ(ids.size(), 2u);
}

TEST(FileSystemIdentityResolver, AliasedPathsShareIdentity)
{
    folio::tests::ScratchDir dir;
    dir.write("doc/a.md", "# A\n");
    FileSystemIdentityResolver resolver(dir.root());

    auto direct = resolver.identify(dir.path("doc/a.md"));
    auto dotted = resolver.identify(dir.root() + "/doc/../doc/./a.md");
    ASSERT_TRUE(direct.hasValue());
    ASSERT_TRUE(dotted.hasValue());
    EXPECT_TRUE(direct.value() == dotted.value());
}

TEST(FileSystemIdentityResolver, DistinctFilesDiffer)
{
    folio::tests::ScratchDir dir;
    dir.write("a.md", "same\n");
    dir.write("b.md", "same\n");
    FileSystemIdentityResolver resolver(dir.root());

    auto a = resolver.identify(dir.path("a.md"));
    auto b = resolver.identify(dir.path("b.md"));
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_FALSE(a.value() == b.value());
}

TEST(FileSystemIdentityResolver, MissingFileIsAnError)
{
    folio::tests::ScratchDir dir;
    FileSystemIdentityResolver resolver(dir.root());
    auto id = resolver.identify(dir.path("nope.md"));
    ASSERT_FALSE(id.hasValue());
    EXPECT_TRUE(id.error().message.find("nope.md") != std::string::npos);
}

TEST(FileSystemIdentityResolver, PathOfFindsUniqueFile)
{
    folio::tests::ScratchDir dir;
    dir.write("doc/deep/a.md", "# A\n");
    dir.write("b.md", "# B\n");
    FileSystemIdentityResolver resolver(dir.root());

    auto id = resolver.identify(dir.path("doc/deep/a.md"));
    ASSERT_TRUE(id.hasValue());
    auto path = resolver.pathOf(id.value());
    ASSERT_TRUE(path.hasValue());
    EXPECT_EQ(path.value(), dir.path("doc/deep/a.md"));
}

TEST(FileSystemIdentityResolver, PathOfOutsideRootFails)
{
    folio::tests::ScratchDir inside;
    folio::tests::ScratchDir outside;
    outside.write("a.md", "# A\n");
    FileSystemIdentityResolver resolver(inside.root());

    auto id = resolver.identify(outside.path("a.md"));
    ASSERT_TRUE(id.hasValue());
    EXPECT_FALSE(resolver.pathOf(id.value()).hasValue());
}

TEST(FileSystemIdentityResolver, HardLinksMakePathOfAmbiguous)
{
    folio::tests::ScratchDir dir;
    dir.write("a.md", "# A\n");
    std::error_code ec;
    std::filesystem::create_hard_link(dir.path("a.md"), dir.path("alias.md"), ec);
    if (ec)
        FOLIO_TEST_SKIP("hard links unsupported: " + ec.message());

    FileSystemIdentityResolver resolver(dir.root());
    auto a = resolver.identify(dir.path("a.md"));
    auto alias = resolver.identify(dir.path("alias.md"));
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(alias.hasValue());
    EXPECT_TRUE(a.value() == alias.value());

    auto path = resolver.pathOf(a.value());
    ASSERT_FALSE(path.hasValue());
    EXPECT_TRUE(path.error().message.find("ambiguous") != std::string::npos);
}

int main(int argc, char **argv)
{
    folio_test::init(&argc, argv);
    return folio_test::run_all_tests();
}
