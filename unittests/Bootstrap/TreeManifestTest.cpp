//===-- TreeManifestTest.cpp ----------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "stagebuild/Bootstrap/TreeManifest.h"

#include "TempDir.h"

#include "gtest/gtest.h"

#include <unistd.h>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

TreeManifest computeManifest(basic::FileSystem& fs, const std::string& root,
                             ArrayRef<std::string> ignores = {},
                             bool hashContents = true) {
  TreeManifest manifest;
  std::string error;
  EXPECT_TRUE(computeTreeManifest(fs, root, ignores, hashContents, manifest,
                                  &error)) << error;
  return manifest;
}

TEST(TreeManifestTest, recordsTree) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("tree/bin/tool", "#!/bin/sh\n", /*executable=*/true);
  tempDir.writeFile("tree/lib/stdlib", "stdlib");
  ASSERT_EQ(0, ::symlink("stdlib", tempDir.path("tree/lib/alias").c_str()));

  auto fs = basic::createLocalFileSystem();
  auto manifest = computeManifest(*fs, tempDir.path("tree"));
  ASSERT_EQ(5u, manifest.entries.size());

  auto* tool = manifest.find("bin/tool");
  ASSERT_NE(nullptr, tool);
  EXPECT_EQ(basic::FileInfo::Kind::File, tool->kind);
  EXPECT_TRUE(tool->isExecutable);
  EXPECT_EQ(basic::hashBytes("#!/bin/sh\n"), tool->digest);

  auto* alias = manifest.find("lib/alias");
  ASSERT_NE(nullptr, alias);
  EXPECT_EQ(basic::FileInfo::Kind::Symlink, alias->kind);
  EXPECT_EQ(basic::hashBytes("stdlib"), alias->digest);

  auto* lib = manifest.find("lib");
  ASSERT_NE(nullptr, lib);
  EXPECT_EQ(basic::FileInfo::Kind::Directory, lib->kind);
  EXPECT_TRUE(lib->digest.isNull());

  EXPECT_EQ(nullptr, manifest.find("lib/missing"));
}

TEST(TreeManifestTest, digestTracksContentsNotLocation) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("a/file", "one");
  tempDir.writeFile("b/file", "one");

  auto fs = basic::createLocalFileSystem();
  auto a = computeManifest(*fs, tempDir.path("a"));
  auto b = computeManifest(*fs, tempDir.path("b"));
  EXPECT_EQ(a.getDigest(), b.getDigest());
  EXPECT_TRUE(diffTreeManifests(a, b).empty());

  tempDir.writeFile("b/file", "two");
  b = computeManifest(*fs, tempDir.path("b"));
  EXPECT_NE(a.getDigest(), b.getDigest());
  EXPECT_EQ(std::vector<std::string>{ "contents differ: file" },
            diffTreeManifests(a, b));

  // Without contents only the shape is recorded.
  auto shapeA = computeManifest(*fs, tempDir.path("a"), {}, false);
  auto shapeB = computeManifest(*fs, tempDir.path("b"), {}, false);
  EXPECT_EQ(shapeA.getDigest(), shapeB.getDigest());
}

TEST(TreeManifestTest, ignorePatterns) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("src/main.c", "int main;");
  tempDir.writeFile("src/.git/HEAD", "ref");
  tempDir.writeFile("src/cache/entry", "cached");

  auto fs = basic::createLocalFileSystem();
  auto clean = computeManifest(*fs, tempDir.path("src"), { ".git", "cache" });
  ASSERT_EQ(1u, clean.entries.size());
  EXPECT_EQ("main.c", clean.entries[0].path);

  // Ignored items never affect the digest.
  tempDir.writeFile("src/cache/other", "more");
  EXPECT_EQ(clean.getDigest(),
            computeManifest(*fs, tempDir.path("src"), { ".git", "cache" })
                .getDigest());
}

TEST(TreeManifestTest, diffDescribesEachKind) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("a/same", "x");
  tempDir.writeFile("a/mode", "m");
  tempDir.writeFile("a/gone", "g");
  tempDir.writeFile("a/kind", "k");
  tempDir.writeFile("b/same", "x");
  tempDir.writeFile("b/mode", "m", /*executable=*/true);
  tempDir.writeFile("b/new", "n");
  tempDir.writeFile("b/kind/nested", "k");

  auto fs = basic::createLocalFileSystem();
  auto diff = diffTreeManifests(computeManifest(*fs, tempDir.path("a")),
                                computeManifest(*fs, tempDir.path("b")));
  EXPECT_EQ((std::vector<std::string>{
                "only in the first tree: gone",
                "file type differs: kind",
                "only in the second tree: kind/nested",
                "permissions differ: mode",
                "only in the second tree: new" }),
            diff);

  EXPECT_EQ(2u, diffTreeManifests(computeManifest(*fs, tempDir.path("a")),
                                  computeManifest(*fs, tempDir.path("b")),
                                  2).size());
}

TEST(TreeManifestTest, missingRootFails) {
  TmpDir tempDir(__func__);
  auto fs = basic::createLocalFileSystem();
  TreeManifest manifest;
  std::string error;
  EXPECT_FALSE(computeTreeManifest(*fs, tempDir.path("nothing"), {}, true,
                                   manifest, &error));
  EXPECT_FALSE(error.empty());
}

}
