//===-- TempDir.cpp -------------------------------------------------------===//
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

#include "TempDir.h"

#include "stagebuild/Basic/FileSystem.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <cassert>

stagebuild::TmpDir::TmpDir(llvm::StringRef namePrefix) {
    llvm::SmallString<256> tempDirPrefix;
    llvm::sys::path::system_temp_directory(true, tempDirPrefix);
    llvm::sys::path::append(tempDirPrefix,
                            namePrefix.empty() ? "stagebuild" : namePrefix);

    std::error_code ec = llvm::sys::fs::createUniqueDirectory(
        tempDirPrefix.str(), tempDir);
    assert(!ec);
    (void)ec;

    // Resolve symbolic links (e.g. a linked /tmp), so paths compare equal to
    // the ones the code under test computes.
    llvm::SmallString<256> realPath;
    if (!llvm::sys::fs::real_path(tempDir, realPath))
        tempDir = realPath;
}

stagebuild::TmpDir::~TmpDir() {
    auto fs = basic::createLocalFileSystem();
    bool result = fs->remove(tempDir.c_str());
    assert(result);
    (void)result;
}

const char *stagebuild::TmpDir::c_str() { return tempDir.c_str(); }
std::string stagebuild::TmpDir::str() const { return tempDir.str().str(); }

std::string stagebuild::TmpDir::path(llvm::StringRef relativePath) const {
    llvm::SmallString<256> result(tempDir);
    llvm::sys::path::append(result, relativePath);
    return result.str().str();
}

std::string stagebuild::TmpDir::writeFile(llvm::StringRef relativePath,
                                          llvm::StringRef contents,
                                          bool executable) {
    auto fs = basic::createLocalFileSystem();
    std::string result = path(relativePath);
    bool created = fs->createDirectories(
        llvm::sys::path::parent_path(result).str());
    assert(created);
    (void)created;
    std::string error;
    bool written = fs->writeFileContents(result, contents, &error);
    assert(written);
    (void)written;
    if (executable) {
        auto ec = llvm::sys::fs::setPermissions(
            result, llvm::sys::fs::all_read | llvm::sys::fs::all_exe |
            llvm::sys::fs::owner_write);
        assert(!ec);
        (void)ec;
    }
    return result;
}
