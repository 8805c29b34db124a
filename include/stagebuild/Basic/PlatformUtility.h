//===- PlatformUtility.h ----------------------------------------*- C++ -*-===//
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
//
// This file implements small platform compatability wrapper functions for
// common functions.
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_BASIC_PLATFORMUTILITY_H
#define STAGEBUILD_BASIC_PLATFORMUTILITY_H

#include "stagebuild/Basic/CrossPlatformCompatibility.h"

#include <cstdint>
#include <cstdio>
#include <string>

#include <sys/resource.h>
#include <unistd.h>

namespace stagebuild {
namespace basic {
namespace sys {

int close(int fileHandle);
bool mkdir(const char *fileName);
int pipe(int ptHandles[2]);
int read(int fileHandle, void *destinationBuffer, unsigned int maxCharCount);
int rmdir(const char *path);
int unlink(const char *fileName);
int write(int fileHandle, void *destinationBuffer, unsigned int maxCharCount);
std::string strerror(int error);

/// Get the current soft limit on open file descriptors, or 0 if it could not
/// be determined.
stagebuild_rlim_t getOpenFileLimit();

enum MATCH_RESULT { MATCH, NO_MATCH, MATCH_ERROR };
// Test if a path or filename matches a wildcard pattern
//
// Returns MATCH if a match is detected, NO_MATCH if there is no match, and
// MATCH_ERROR on error.
MATCH_RESULT filenameMatch(const std::string& pattern,
                           const std::string& filename);

template <typename = FD> struct FileDescriptorTraits;

template <> struct FileDescriptorTraits<int> {
  using DescriptorType = int;
  static constexpr int InvalidDescriptor = -1;
  static bool IsValid(int fd) { return fd >= 0; }
  static void Close(int fd) { close(fd); }
  static int Read(int hFile, void *destinationBuffer,
                  unsigned int maxCharCount) {
    return read(hFile, destinationBuffer, maxCharCount);
  }
};

}
}
}

#endif
