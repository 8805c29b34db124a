//===- FileSystem.h ---------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BASIC_FILESYSTEM_H
#define STAGEBUILD_BASIC_FILESYSTEM_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace llvm {

class MemoryBuffer;

}

namespace stagebuild {
namespace basic {

/// The state of a path in the file system, without looking through symbolic
/// links.
struct FileInfo {
  enum class Kind { Missing, File, Directory, Symlink, Other };

  Kind kind = Kind::Missing;

  /// The size of the file, for regular files.
  uint64_t size = 0;

  /// Whether the owner execute bit is set.
  bool isExecutable = false;

  bool isMissing() const { return kind == Kind::Missing; }
  bool isDirectory() const { return kind == Kind::Directory; }
  bool isFile() const { return kind == Kind::File; }
  bool isSymlink() const { return kind == Kind::Symlink; }
};

/// An item found while walking a directory tree.
struct TreeEntry {
  /// The path relative to the tree root, using '/' separators.
  std::string path;

  /// The state of the item.
  FileInfo info;

  /// The target, for symbolic links.
  std::string linkTarget;
};

// Abstract interface for interacting with a file system. This allows mocking of
// operations for testing, and for clients to provide virtualized interfaces.
class FileSystem {
  // DO NOT COPY
  FileSystem(const FileSystem&) STAGEBUILD_DELETED_FUNCTION;
  void operator=(const FileSystem&) STAGEBUILD_DELETED_FUNCTION;
  FileSystem &operator=(FileSystem&& rhs) STAGEBUILD_DELETED_FUNCTION;

public:
  FileSystem() {}
  virtual ~FileSystem();

  /// Create the given directory if it does not exist.
  ///
  /// \returns True on success (the directory was created, or already exists).
  virtual bool
  createDirectory(const std::string& path) = 0;

  /// Create the given directory (recursively) if it does not exist.
  ///
  /// \returns True on success (the directory was created, or already exists).
  virtual bool
  createDirectories(const std::string& path);

  /// Get a memory buffer for a given file on the file system.
  ///
  /// \returns The file contents, on success, or null on error.
  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) = 0;

  /// Replace the contents of the given file.
  ///
  /// The write is atomic, readers see either the old or the new contents.
  virtual bool writeFileContents(const std::string& path, StringRef data,
                                 std::string* error_out) = 0;

  /// Remove the file or directory at the given path.
  ///
  /// Directory removal is recursive.
  ///
  /// \returns True if the item was removed (or was already missing), false
  /// otherwise.
  virtual bool remove(const std::string& path) = 0;

  /// Get the information to represent the state of the given path in the file
  /// system, without looking through symbolic links.
  virtual FileInfo getFileInfo(const std::string& path) = 0;

  /// Rename \p from to \p to.
  ///
  /// Renaming a directory onto an existing non-empty directory fails.
  virtual bool rename(const std::string& from, const std::string& to,
                      std::string* error_out) = 0;

  /// Copy a file or directory tree, preserving permissions and symbolic links.
  virtual bool copyTree(const std::string& from, const std::string& to,
                        std::string* error_out) = 0;

  /// Collect every item below \p root, sorted by path.
  ///
  /// \param ignorePatterns Glob patterns matched against both the relative
  /// path and the file name of each item. Ignored directories are not
  /// descended into.
  virtual bool listTree(const std::string& root,
                        ArrayRef<std::string> ignorePatterns,
                        std::vector<TreeEntry>& entries,
                        std::string* error_out) = 0;

  /// Move a tree, falling back to copy and remove when \p from and \p to are
  /// on different devices.
  bool moveTree(const std::string& from, const std::string& to,
                std::string* error_out);
};

/// Create a FileSystem instance suitable for accessing the local filesystem.
std::unique_ptr<FileSystem> createLocalFileSystem();

/// An advisory, exclusive, cross-process lock held on a lock file.
///
/// The lock is released when the object is destroyed.
class FileLock {
  FileLock(const FileLock&) STAGEBUILD_DELETED_FUNCTION;
  void operator=(const FileLock&) STAGEBUILD_DELETED_FUNCTION;

  int fd;
  std::string path;

  FileLock(int fd, StringRef path) : fd(fd), path(path.str()) {}

public:
  ~FileLock();

  /// Acquire the lock at \p path, creating the file if necessary and blocking
  /// until any other holder releases it.
  ///
  /// \returns The lock, or null on error.
  static std::unique_ptr<FileLock> acquire(StringRef path,
                                           std::string* error_out);

  const std::string& getPath() const { return path; }
};

}
}

#endif
