//===-- FileSystemTest.cpp ------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "../Bootstrap/TempDir.h"

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Basic/PlatformUtility.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include "gtest/gtest.h"

#include <sys/stat.h>
#include <unistd.h>

using namespace stagebuild;
using namespace stagebuild::basic;

namespace {

std::vector<std::string> getPaths(const std::vector<TreeEntry>& entries) {
  std::vector<std::string> result;
  for (const auto& entry: entries)
    result.push_back(entry.path);
  return result;
}

TEST(FileSystemTest, basic) {
  // Check basic sanity of the local filesystem object.
  auto fs = createLocalFileSystem();
  TmpDir tempDir(__func__);
  std::string tempPath = tempDir.path("hello.txt");

  std::string error;
  ASSERT_TRUE(fs->writeFileContents(tempPath, "Hello, world!", &error))
      << error;

  auto missingFileInfo = fs->getFileInfo("/does/not/exists");
  EXPECT_TRUE(missingFileInfo.isMissing());

  auto ourFileInfo = fs->getFileInfo(tempPath);
  EXPECT_TRUE(ourFileInfo.isFile());
  EXPECT_EQ(13u, ourFileInfo.size);
  EXPECT_FALSE(ourFileInfo.isExecutable);

  EXPECT_TRUE(fs->getFileInfo(tempDir.str()).isDirectory());

  auto missingFileContents = fs->getFileContents("/does/not/exist");
  EXPECT_EQ(missingFileContents.get(), nullptr);

  auto ourFileContents = fs->getFileContents(tempPath);
  ASSERT_NE(ourFileContents.get(), nullptr);
  EXPECT_EQ(ourFileContents->getBuffer().str(), "Hello, world!");

  // Replacing contents leaves no temporary files behind.
  ASSERT_TRUE(fs->writeFileContents(tempPath, "Bye", &error)) << error;
  EXPECT_EQ(fs->getFileContents(tempPath)->getBuffer().str(), "Bye");
  std::vector<TreeEntry> entries;
  ASSERT_TRUE(fs->listTree(tempDir.str(), {}, entries, &error)) << error;
  EXPECT_EQ(std::vector<std::string>{ "hello.txt" }, getPaths(entries));

  EXPECT_TRUE(fs->remove(tempPath));
  EXPECT_TRUE(fs->getFileInfo(tempPath).isMissing());
  // Removing a missing item is not an error.
  EXPECT_TRUE(fs->remove(tempPath));
}

TEST(FileSystemTest, createDirectories) {
  auto fs = createLocalFileSystem();
  TmpDir tempDir(__func__);

  std::string nested = tempDir.path("a/b/c");
  EXPECT_TRUE(fs->createDirectories(nested));
  EXPECT_TRUE(fs->getFileInfo(nested).isDirectory());
  // Already existing.
  EXPECT_TRUE(fs->createDirectories(nested));
  EXPECT_TRUE(fs->createDirectory(nested));
}

TEST(FileSystemTest, testRecursiveRemoval) {
  TmpDir rootTempDir(__func__);

  rootTempDir.writeFile("root/test.txt", "Hello, world!");
  rootTempDir.writeFile("root/subdir/file_in_subdir.txt", "Hello, world!");
  std::string tempDir = rootTempDir.path("root");

  auto fs = createLocalFileSystem();
  bool result = fs->remove(tempDir);
  EXPECT_TRUE(result);

  struct ::stat statbuf;
  EXPECT_EQ(-1, ::stat(tempDir.c_str(), &statbuf));
  EXPECT_EQ(ENOENT, errno);
}

TEST(FileSystemTest, testRecursiveRemovalDoesNotFollowSymlinks) {
  TmpDir rootTempDir(__func__);

  std::string file = rootTempDir.writeFile("test.txt", "Hello, world!");
  std::string otherFile =
      rootTempDir.writeFile("other_dir/test.txt", "Hello, world!");
  std::string otherDir = rootTempDir.path("other_dir");

  std::string tempDir = rootTempDir.path("root");
  sys::mkdir(tempDir.c_str());

  std::string linkPath = rootTempDir.path("root/link.txt");
  int res = ::symlink(file.c_str(), linkPath.c_str());
  EXPECT_EQ(res, 0);

  std::string directoryLinkPath = rootTempDir.path("root/link_to_other_dir");
  res = ::symlink(otherDir.c_str(), directoryLinkPath.c_str());
  EXPECT_EQ(res, 0);

  auto fs = createLocalFileSystem();
  bool result = fs->remove(tempDir);
  EXPECT_TRUE(result);

  struct ::stat statbuf;
  EXPECT_EQ(-1, ::stat(tempDir.c_str(), &statbuf));
  EXPECT_EQ(ENOENT, errno);
  // Verify that the symlink target still exists.
  EXPECT_EQ(0, ::stat(file.c_str(), &statbuf));
  // Verify that we did not delete the symlinked directories contents.
  EXPECT_EQ(0, ::stat(otherFile.c_str(), &statbuf));
}

TEST(FileSystemTest, listTreeIsSortedAndHonorsIgnores) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("src/b.c", "b");
  tempDir.writeFile("src/a.c", "a");
  tempDir.writeFile("src/a.o", "object");
  tempDir.writeFile(".git/HEAD", "ref");
  tempDir.writeFile("build/out", "out");
  tempDir.writeFile("README", "readme");

  auto fs = createLocalFileSystem();
  std::vector<TreeEntry> entries;
  std::string error;
  ASSERT_TRUE(fs->listTree(tempDir.str(), { ".git", "*.o", "build" },
                           entries, &error)) << error;
  EXPECT_EQ((std::vector<std::string>{
                "README", "src", "src/a.c", "src/b.c" }),
            getPaths(entries));
  EXPECT_TRUE(entries[1].info.isDirectory());
  EXPECT_EQ(1u, entries[2].info.size);

  // Patterns also match relative paths.
  entries.clear();
  ASSERT_TRUE(fs->listTree(tempDir.str(), { "src/b.c", ".git", "build" },
                           entries, &error)) << error;
  EXPECT_EQ((std::vector<std::string>{
                "README", "src", "src/a.c", "src/a.o" }),
            getPaths(entries));

  entries.clear();
  EXPECT_FALSE(fs->listTree(tempDir.path("missing"), {}, entries, &error));
  EXPECT_NE(std::string::npos, error.find("missing"));
}

TEST(FileSystemTest, copyTreePreservesModesAndLinks) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("from/bin/tool", "#!/bin/sh\n", /*executable=*/true);
  tempDir.writeFile("from/lib/data", "data");
  ASSERT_EQ(0, ::symlink("data", tempDir.path("from/lib/alias").c_str()));

  auto fs = createLocalFileSystem();
  std::string error;
  ASSERT_TRUE(fs->copyTree(tempDir.path("from"), tempDir.path("to"), &error))
      << error;

  auto toolInfo = fs->getFileInfo(tempDir.path("to/bin/tool"));
  EXPECT_TRUE(toolInfo.isFile());
  EXPECT_TRUE(toolInfo.isExecutable);
  EXPECT_FALSE(fs->getFileInfo(tempDir.path("to/lib/data")).isExecutable);

  std::vector<TreeEntry> entries;
  ASSERT_TRUE(fs->listTree(tempDir.path("to"), {}, entries, &error)) << error;
  EXPECT_EQ((std::vector<std::string>{
                "bin", "bin/tool", "lib", "lib/alias", "lib/data" }),
            getPaths(entries));
  EXPECT_TRUE(entries[3].info.isSymlink());
  EXPECT_EQ("data", entries[3].linkTarget);

  EXPECT_FALSE(fs->copyTree(tempDir.path("nothing"), tempDir.path("x"),
                            &error));
  EXPECT_NE(std::string::npos, error.find("no such file or directory"));
}

TEST(FileSystemTest, moveTree) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("from/file", "contents");
  tempDir.writeFile("occupied/other", "other");

  auto fs = createLocalFileSystem();
  std::string error;

  // A populated destination is a conflict.
  EXPECT_FALSE(fs->moveTree(tempDir.path("from"), tempDir.path("occupied"),
                            &error));
  EXPECT_TRUE(fs->getFileInfo(tempDir.path("from/file")).isFile());

  ASSERT_TRUE(fs->moveTree(tempDir.path("from"), tempDir.path("to"), &error))
      << error;
  EXPECT_TRUE(fs->getFileInfo(tempDir.path("from")).isMissing());
  EXPECT_EQ("contents",
            fs->getFileContents(tempDir.path("to/file"))->getBuffer().str());
}

TEST(FileLockTest, acquireAndRelease) {
  TmpDir tempDir(__func__);
  std::string lockPath = tempDir.path("locks/entry.lock");
  auto fs = createLocalFileSystem();
  ASSERT_TRUE(fs->createDirectories(tempDir.path("locks")));

  std::string error;
  {
    auto lock = FileLock::acquire(lockPath, &error);
    ASSERT_NE(nullptr, lock.get()) << error;
    EXPECT_EQ(lockPath, lock->getPath());
  }

  // Released on destruction, so it can be taken again.
  auto lock = FileLock::acquire(lockPath, &error);
  EXPECT_NE(nullptr, lock.get()) << error;

  EXPECT_EQ(nullptr,
            FileLock::acquire(tempDir.path("no/such/dir/x.lock"), &error)
                .get());
  EXPECT_NE(std::string::npos, error.find("unable to open lock file"));
}

}
