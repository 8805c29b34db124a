//===-- PlatformUtility.cpp -----------------------------------------------===//
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

#include "stagebuild/Basic/PlatformUtility.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>

using namespace stagebuild;
using namespace stagebuild::basic;

int sys::close(int fileHandle) {
  return ::close(fileHandle);
}

bool sys::mkdir(const char* fileName) {
  return ::mkdir(fileName, S_IRWXU | S_IRWXG | S_IRWXO) == 0;
}

int sys::pipe(int ptHandles[2]) {
  return ::pipe(ptHandles);
}

int sys::read(int fileHandle, void *destinationBuffer,
              unsigned int maxCharCount) {
  return ::read(fileHandle, destinationBuffer, maxCharCount);
}

int sys::rmdir(const char *path) {
  return ::rmdir(path);
}

int sys::unlink(const char *fileName) {
  return ::unlink(fileName);
}

int sys::write(int fileHandle, void *destinationBuffer,
               unsigned int maxCharCount) {
  return ::write(fileHandle, destinationBuffer, maxCharCount);
}

std::string sys::strerror(int error) {
  return ::strerror(error);
}

stagebuild_rlim_t sys::getOpenFileLimit() {
  struct rlimit rl;
  int ret = getrlimit(RLIMIT_NOFILE, &rl);
  if (ret != 0) {
    return 0;
  }

  return rl.rlim_cur;
}

sys::MATCH_RESULT sys::filenameMatch(const std::string& pattern,
                                     const std::string& filename) {
  int result = fnmatch(pattern.c_str(), filename.c_str(), 0);
  return result == 0 ? sys::MATCH
                     : result == FNM_NOMATCH ? sys::NO_MATCH : sys::MATCH_ERROR;
}
