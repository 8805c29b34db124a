//===-- FileSystem.cpp ----------------------------------------------------===//
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

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/PlatformUtility.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstring>

#include <limits.h>
#include <unistd.h>

namespace {
  using namespace llvm;
  using namespace llvm::sys::fs;

  std::error_code _remove_all_r(StringRef path, file_type ft, uint32_t &count) {
    if (ft == file_type::directory_file) {
      std::error_code ec;
      directory_iterator i(path, ec, /*follow_symlinks=*/false);
      if (ec)
        return ec;

      for (directory_iterator e; i != e; i.increment(ec)) {
        if (ec)
          return ec;

        file_status st;

        if (std::error_code ec = status(i->path(), st, /*follow=*/false))
          return ec;

        if (std::error_code ec = _remove_all_r(i->path(), st.type(), count))
          return ec;
      }

      if (std::error_code ec = remove(path, false))
        return ec;

      ++count; // Include the directory itself in the items removed.
    } else {
      if (std::error_code ec = remove(path, false))
        return ec;

      ++count;
    }

    return std::error_code();
  }

  bool readLink(StringRef path, std::string& result) {
    char buf[PATH_MAX];
    ssize_t length = ::readlink(path.str().c_str(), buf, sizeof(buf) - 1);
    if (length < 0)
      return false;
    result.assign(buf, length);
    return true;
  }

  bool matchesAny(llvm::ArrayRef<std::string> patterns, StringRef relPath) {
    std::string name = llvm::sys::path::filename(relPath).str();
    for (const auto& pattern: patterns) {
      if (stagebuild::basic::sys::filenameMatch(pattern, relPath.str()) ==
              stagebuild::basic::sys::MATCH ||
          stagebuild::basic::sys::filenameMatch(pattern, name) ==
              stagebuild::basic::sys::MATCH)
        return true;
    }
    return false;
  }
}

using namespace stagebuild;
using namespace stagebuild::basic;

FileSystem::~FileSystem() {}

bool FileSystem::createDirectories(const std::string& path) {
  // Attempt to create the final directory first, to optimize for the common
  // case where we don't need to recurse.
  if (createDirectory(path))
    return true;

  // If that failed, attempt to create the parent.
  StringRef parent = llvm::sys::path::parent_path(path);
  if (parent.empty())
    return false;
  return createDirectories(parent.str()) && createDirectory(path);
}

bool FileSystem::moveTree(const std::string& from, const std::string& to,
                          std::string* error_out) {
  if (rename(from, to, error_out))
    return true;

  // Only fall back to copying when the destination is free; a populated
  // destination is a real conflict the caller must see.
  if (getFileInfo(from).isMissing() || !getFileInfo(to).isMissing())
    return false;

  if (!copyTree(from, to, error_out)) {
    remove(to);
    return false;
  }
  if (!remove(from)) {
    *error_out = "unable to remove '" + from + "' after copying it";
    return false;
  }
  return true;
}

namespace {

class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() {}

  virtual bool
  createDirectory(const std::string& path) override {
    if (!stagebuild::basic::sys::mkdir(path.c_str())) {
      if (errno != EEXIST) {
        return false;
      }
      return getFileInfo(path).isDirectory();
    }
    return true;
  }

  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    auto result = llvm::MemoryBuffer::getFile(path);
    if (result.getError()) {
      return nullptr;
    }
    return std::unique_ptr<llvm::MemoryBuffer>(result->release());
  }

  virtual bool writeFileContents(const std::string& path, StringRef data,
                                 std::string* error_out) override {
    if (auto err = llvm::writeFileAtomically(path + "-%%%%%%%%.tmp", path,
                                             data)) {
      *error_out = "unable to write '" + path + "' (" +
        llvm::toString(std::move(err)) + ")";
      return false;
    }
    return true;
  }

  bool rm_tree(const char* path) {
    uint32_t count = 0;
    return !_remove_all_r(path, file_type::directory_file, count);
  }

  virtual bool remove(const std::string& path) override {
    // Assume `path` is a regular file.
    if (stagebuild::basic::sys::unlink(path.c_str()) == 0) {
      return true;
    }

    if (errno == ENOENT) {
      return true;
    }

    // Error can't be that `path` is actually a directory (on Linux `EISDIR`
    // will be returned since 2.1.132).
    if (errno != EPERM && errno != EISDIR) {
      return false;
    }

    // Check if `path` is a directory.
    if (getFileInfo(path).isDirectory()) {
      if (stagebuild::basic::sys::rmdir(path.c_str()) == 0) {
        return true;
      } else {
        return rm_tree(path.c_str());
      }
    }

    return false;
  }

  virtual FileInfo getFileInfo(const std::string& path) override {
    FileInfo info;
    file_status st;
    if (status(path, st, /*follow=*/false)) {
      return info;
    }

    switch (st.type()) {
    case file_type::regular_file:
      info.kind = FileInfo::Kind::File;
      info.size = st.getSize();
      break;
    case file_type::directory_file:
      info.kind = FileInfo::Kind::Directory;
      break;
    case file_type::symlink_file:
      info.kind = FileInfo::Kind::Symlink;
      break;
    case file_type::file_not_found:
      return info;
    default:
      info.kind = FileInfo::Kind::Other;
      break;
    }
    info.isExecutable = (st.permissions() & owner_exe) != 0;
    return info;
  }

  virtual bool rename(const std::string& from, const std::string& to,
                      std::string* error_out) override {
    if (std::error_code ec = llvm::sys::fs::rename(from, to)) {
      *error_out = "unable to rename '" + from + "' to '" + to + "' (" +
        ec.message() + ")";
      return false;
    }
    return true;
  }

  bool copyItem(const std::string& from, const std::string& to,
                const FileInfo& info, std::string* error_out) {
    switch (info.kind) {
    case FileInfo::Kind::Directory:
      if (!createDirectory(to)) {
        *error_out = "unable to create directory '" + to + "'";
        return false;
      }
      return true;

    case FileInfo::Kind::Symlink: {
      std::string target;
      if (!readLink(from, target) || ::symlink(target.c_str(), to.c_str()) != 0) {
        *error_out = "unable to copy symbolic link '" + from + "' (" +
          stagebuild::basic::sys::strerror(errno) + ")";
        return false;
      }
      return true;
    }

    case FileInfo::Kind::File: {
      if (std::error_code ec = copy_file(from, to)) {
        *error_out = "unable to copy '" + from + "' to '" + to + "' (" +
          ec.message() + ")";
        return false;
      }
      auto perms = getPermissions(from);
      if (!perms) {
        *error_out = "unable to read permissions of '" + from + "'";
        return false;
      }
      if (std::error_code ec = setPermissions(to, *perms)) {
        *error_out = "unable to set permissions of '" + to + "' (" +
          ec.message() + ")";
        return false;
      }
      return true;
    }

    case FileInfo::Kind::Missing:
    case FileInfo::Kind::Other:
      break;
    }

    *error_out = "unable to copy '" + from + "' (unsupported file type)";
    return false;
  }

  virtual bool copyTree(const std::string& from, const std::string& to,
                        std::string* error_out) override {
    FileInfo rootInfo = getFileInfo(from);
    if (rootInfo.isMissing()) {
      *error_out = "unable to copy '" + from + "' (no such file or directory)";
      return false;
    }
    if (!rootInfo.isDirectory())
      return copyItem(from, to, rootInfo, error_out);

    if (!createDirectories(to)) {
      *error_out = "unable to create directory '" + to + "'";
      return false;
    }

    std::vector<TreeEntry> entries;
    if (!listTree(from, {}, entries, error_out))
      return false;

    // Parents sort before their children, so directories exist by the time
    // their contents are copied.
    for (const auto& entry: entries) {
      if (!copyItem(from + "/" + entry.path, to + "/" + entry.path,
                    entry.info, error_out))
        return false;
    }
    return true;
  }

  virtual bool listTree(const std::string& root,
                        ArrayRef<std::string> ignorePatterns,
                        std::vector<TreeEntry>& entries,
                        std::string* error_out) override {
    StringRef rootRef = StringRef(root).rtrim('/');
    std::error_code ec;
    recursive_directory_iterator it(rootRef, ec, /*follow_symlinks=*/false);
    for (recursive_directory_iterator end; it != end; it.increment(ec)) {
      if (ec)
        break;

      const std::string& path = it->path();
      StringRef relPath = StringRef(path).drop_front(rootRef.size()).ltrim('/');

      if (matchesAny(ignorePatterns, relPath)) {
        it.no_push();
        continue;
      }

      TreeEntry entry;
      entry.path = relPath.str();
      entry.info = getFileInfo(path);
      if (entry.info.isSymlink() && !readLink(path, entry.linkTarget)) {
        *error_out = "unable to read symbolic link '" + path + "'";
        return false;
      }
      entries.push_back(std::move(entry));
    }
    if (ec) {
      *error_out = "unable to list '" + root + "' (" + ec.message() + ")";
      return false;
    }

    std::sort(entries.begin(), entries.end(),
              [](const TreeEntry& lhs, const TreeEntry& rhs) {
                return lhs.path < rhs.path;
              });
    return true;
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}

#pragma mark - FileLock

FileLock::~FileLock() {
  if (std::error_code ec = llvm::sys::fs::unlockFile(fd)) {
    (void)ec;
  }
  stagebuild::basic::sys::close(fd);
}

std::unique_ptr<FileLock> FileLock::acquire(StringRef path,
                                            std::string* error_out) {
  int fd;
  if (std::error_code ec = llvm::sys::fs::openFileForWrite(
          path, fd, llvm::sys::fs::CD_OpenAlways, llvm::sys::fs::OF_None)) {
    *error_out = "unable to open lock file '" + path.str() + "' (" +
      ec.message() + ")";
    return nullptr;
  }

  if (std::error_code ec = llvm::sys::fs::lockFile(fd)) {
    stagebuild::basic::sys::close(fd);
    *error_out = "unable to lock '" + path.str() + "' (" + ec.message() + ")";
    return nullptr;
  }

  return std::unique_ptr<FileLock>(new FileLock(fd, path));
}
