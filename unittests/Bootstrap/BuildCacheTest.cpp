//===-- BuildCacheTest.cpp ------------------------------------------------===//
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

#include "stagebuild/Bootstrap/BuildCache.h"

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Bootstrap/BootstrapError.h"

#include "TempDir.h"

#include "llvm/Support/MemoryBuffer.h"

#include "gtest/gtest.h"

#include <algorithm>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

class BuildCacheTest : public ::testing::Test {
protected:
  TmpDir tempDir{"BuildCacheTest"};
  std::unique_ptr<basic::FileSystem> fs = basic::createLocalFileSystem();
  std::unique_ptr<BuildCache> cache;
  Platform hostPlatform;
  Platform armPlatform;

  virtual void SetUp() override {
    auto host = Platform::parse("x86_64-unknown-linux-gnu");
    auto target = Platform::parse("aarch64-unknown-linux-gnu");
    ASSERT_TRUE(host && target);
    hostPlatform = *host;
    armPlatform = *target;

    auto result = BuildCache::open(tempDir.path("cache"), *fs);
    ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
    cache = std::move(*result);
  }

  CacheEntry makeDescription(StringRef seed, unsigned stage,
                             const Platform& target) {
    CacheEntry description;
    description.fingerprint = basic::hashBytes(seed);
    description.stage = stage;
    description.kind = StepKind::Build;
    description.host = hostPlatform;
    description.target = target;
    return description;
  }

  /// Write an artifact tree and return its directory.
  std::string makeArtifact(StringRef name, StringRef contents) {
    tempDir.writeFile(("out/" + name + "/bin/build-tool").str(),
                      "#!/bin/sh\n", /*executable=*/true);
    tempDir.writeFile(("out/" + name + "/lib/stdlib").str(), contents);
    return tempDir.path(("out/" + name).str());
  }

  CacheEntry commit(StringRef seed, unsigned stage, const Platform& target,
                    StringRef contents = "stdlib") {
    auto result = cache->commit(makeDescription(seed, stage, target),
                                makeArtifact(seed, contents));
    EXPECT_TRUE(bool(result));
    if (!result) {
      ADD_FAILURE() << llvm::toString(result.takeError());
      return CacheEntry();
    }
    return *result;
  }

  CacheLookup lookup(StringRef seed) {
    auto result = cache->lookup(basic::hashBytes(seed));
    EXPECT_TRUE(bool(result));
    if (!result) {
      ADD_FAILURE() << llvm::toString(result.takeError());
      return CacheLookup();
    }
    return *result;
  }
};

TEST_F(BuildCacheTest, missThenHit) {
  EXPECT_EQ(CacheLookupStatus::Miss, lookup("a").status);

  std::string artifactDir = makeArtifact("a", "stdlib");
  auto committed = cache->commit(makeDescription("a", 1, hostPlatform), artifactDir);
  ASSERT_TRUE(bool(committed)) << llvm::toString(committed.takeError());

  // The artifact was moved into the cache.
  EXPECT_TRUE(fs->getFileInfo(artifactDir).isMissing());
  EXPECT_EQ(tempDir.path("cache/entries/" + basic::hashBytes("a").toHex()),
            committed->path);
  EXPECT_TRUE(fs->getFileInfo(committed->path + "/bin/build-tool")
                  .isExecutable);
  EXPECT_FALSE(committed->contentDigest.isNull());
  EXPECT_GT(committed->createdAt, 0u);

  auto result = lookup("a");
  ASSERT_TRUE(result.isHit()) << result.reason;
  EXPECT_EQ(basic::hashBytes("a"), result.entry.fingerprint);
  EXPECT_EQ(1u, result.entry.stage);
  EXPECT_EQ(StepKind::Build, result.entry.kind);
  EXPECT_EQ(hostPlatform, result.entry.host);
  EXPECT_EQ(hostPlatform, result.entry.target);
  EXPECT_EQ(committed->contentDigest, result.entry.contentDigest);

  auto artifact = result.entry.getArtifact();
  EXPECT_EQ(committed->path, artifact.path);
  EXPECT_EQ(1u, artifact.stage);
}

TEST_F(BuildCacheTest, entriesSurviveReopening) {
  commit("a", 1, hostPlatform);
  cache.reset();

  auto reopened = BuildCache::open(tempDir.path("cache"), *fs);
  ASSERT_TRUE(bool(reopened)) << llvm::toString(reopened.takeError());
  cache = std::move(*reopened);
  EXPECT_TRUE(lookup("a").isHit());
}

TEST_F(BuildCacheTest, commitIsIdempotent) {
  CacheEntry first = commit("a", 1, hostPlatform, "first");

  // A second commit for the fingerprint keeps the first entry and leaves the
  // new artifact where it is.
  std::string second = makeArtifact("a-again", "second");
  auto result = cache->commit(makeDescription("a", 1, hostPlatform), second);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(first.contentDigest, result->contentDigest);
  EXPECT_TRUE(fs->getFileInfo(second).isDirectory());
  EXPECT_EQ("first",
            fs->getFileContents(first.path + "/lib/stdlib")->getBuffer()
                .str());
}

TEST_F(BuildCacheTest, damagedEntriesAreCorrupted) {
  CacheEntry entry = commit("a", 1, hostPlatform);
  ASSERT_TRUE(fs->remove(entry.path + "/lib/stdlib"));

  auto result = lookup("a");
  EXPECT_EQ(CacheLookupStatus::Corrupted, result.status);
  EXPECT_NE(std::string::npos, result.reason.find("lib/stdlib"));
  EXPECT_EQ(std::vector<Fingerprint>{ basic::hashBytes("a") },
            cache->getScheduledEvictions());

  // Lookups never remove anything.
  EXPECT_TRUE(fs->getFileInfo(entry.path).isDirectory());

  ASSERT_FALSE(bool(cache->flushScheduledEvictions()));
  EXPECT_TRUE(cache->getScheduledEvictions().empty());
  EXPECT_TRUE(fs->getFileInfo(entry.path).isMissing());
  EXPECT_EQ(CacheLookupStatus::Miss, lookup("a").status);
}

TEST_F(BuildCacheTest, missingMarkerIsCorrupted) {
  CacheEntry entry = commit("a", 1, hostPlatform);
  ASSERT_TRUE(fs->remove(entry.path + "/" +
                         BuildCache::getEntryMarkerName().str()));
  auto result = lookup("a");
  EXPECT_EQ(CacheLookupStatus::Corrupted, result.status);
  EXPECT_EQ("integrity marker is missing", result.reason);
}

TEST_F(BuildCacheTest, orphanDirectoryIsCorrupted) {
  std::string hex = basic::hashBytes("orphan").toHex();
  tempDir.writeFile("cache/entries/" + hex + "/file", "half committed");
  auto result = lookup("orphan");
  EXPECT_EQ(CacheLookupStatus::Corrupted, result.status);
  EXPECT_EQ("entry directory has no index row", result.reason);

  // Committing over it replaces it.
  commit("orphan", 1, hostPlatform);
  EXPECT_TRUE(lookup("orphan").isHit());
}

TEST_F(BuildCacheTest, corruptedEntryIsReplacedOnCommit) {
  CacheEntry entry = commit("a", 1, hostPlatform, "old");
  ASSERT_TRUE(fs->remove(entry.path + "/bin"));
  ASSERT_EQ(CacheLookupStatus::Corrupted, lookup("a").status);

  CacheEntry replaced = commit("a", 1, hostPlatform, "new");
  EXPECT_TRUE(lookup("a").isHit());
  EXPECT_EQ("new",
            fs->getFileContents(replaced.path + "/lib/stdlib")->getBuffer()
                .str());
  EXPECT_TRUE(cache->getScheduledEvictions().empty());
}

TEST_F(BuildCacheTest, verifyIntegrityRehashes) {
  CacheEntry a = commit("a", 1, hostPlatform, "same size");
  commit("b", 2, hostPlatform);

  auto clean = cache->verifyIntegrity();
  ASSERT_TRUE(bool(clean)) << llvm::toString(clean.takeError());
  EXPECT_TRUE(clean->empty());

  // Same size, different contents: only a full check notices.
  std::string error;
  ASSERT_TRUE(fs->writeFileContents(a.path + "/lib/stdlib", "SAME SIZE",
                                    &error)) << error;
  EXPECT_TRUE(lookup("a").isHit());

  std::string orphan = basic::hashBytes("orphan").toHex();
  tempDir.writeFile("cache/entries/" + orphan + "/x", "x");

  auto corrupted = cache->verifyIntegrity();
  ASSERT_TRUE(bool(corrupted)) << llvm::toString(corrupted.takeError());
  std::vector<Fingerprint> expected{ basic::hashBytes("a"),
                                     basic::hashBytes("orphan") };
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(expected, *corrupted);
}

TEST_F(BuildCacheTest, clearWithFilters) {
  commit("s1-hostPlatform", 1, hostPlatform);
  commit("s1-armPlatform", 1, armPlatform);
  commit("s2-hostPlatform", 2, hostPlatform);
  commit("s2-armPlatform", 2, armPlatform);

  CacheFilter byStage;
  byStage.stage = 2u;
  auto removed = cache->clear(byStage);
  ASSERT_TRUE(bool(removed)) << llvm::toString(removed.takeError());
  EXPECT_EQ(2u, *removed);
  EXPECT_FALSE(lookup("s2-hostPlatform").isHit());
  EXPECT_FALSE(lookup("s2-armPlatform").isHit());

  CacheFilter byTarget;
  byTarget.target = armPlatform;
  removed = cache->clear(byTarget);
  ASSERT_TRUE(bool(removed)) << llvm::toString(removed.takeError());
  EXPECT_EQ(1u, *removed);
  EXPECT_TRUE(lookup("s1-hostPlatform").isHit());
  EXPECT_FALSE(lookup("s1-armPlatform").isHit());

  removed = cache->clear(CacheFilter());
  ASSERT_TRUE(bool(removed)) << llvm::toString(removed.takeError());
  EXPECT_EQ(1u, *removed);
  auto all = cache->entries();
  ASSERT_TRUE(bool(all)) << llvm::toString(all.takeError());
  EXPECT_TRUE(all->empty());
  EXPECT_TRUE(fs->getFileInfo(tempDir.path("cache/entries")).isDirectory());
}

TEST_F(BuildCacheTest, entriesAreOrdered) {
  commit("x", 1, hostPlatform);
  commit("y", 2, hostPlatform);
  commit("z", 3, armPlatform);
  auto all = cache->entries();
  ASSERT_TRUE(bool(all)) << llvm::toString(all.takeError());
  ASSERT_EQ(3u, all->size());
  for (unsigned i = 1; i < all->size(); ++i)
    EXPECT_LT((*all)[i - 1].fingerprint, (*all)[i].fingerprint);
}

TEST_F(BuildCacheTest, evict) {
  CacheEntry entry = commit("a", 1, hostPlatform);
  ASSERT_FALSE(bool(cache->evict(basic::hashBytes("a"))));
  EXPECT_TRUE(fs->getFileInfo(entry.path).isMissing());
  EXPECT_EQ(CacheLookupStatus::Miss, lookup("a").status);
  // Evicting a missing entry is not an error.
  EXPECT_FALSE(bool(cache->evict(basic::hashBytes("a"))));
}

TEST_F(BuildCacheTest, acquireLock) {
  auto fingerprint = basic::hashBytes("a");
  {
    auto lock = cache->acquireLock(fingerprint);
    ASSERT_TRUE(bool(lock)) << llvm::toString(lock.takeError());
    EXPECT_EQ(tempDir.path("cache/locks/" + fingerprint.toHex() + ".lock"),
              (*lock)->getPath());
  }

  // Released when dropped.
  auto again = cache->acquireLock(fingerprint);
  ASSERT_TRUE(bool(again)) << llvm::toString(again.takeError());
}

}
