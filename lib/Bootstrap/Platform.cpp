//===-- Platform.cpp ------------------------------------------------------===//
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

#include "stagebuild/Bootstrap/Platform.h"

#include "stagebuild/Bootstrap/BootstrapError.h"

#include "llvm/ADT/Triple.h"
#include "llvm/Support/Host.h"

using namespace stagebuild;
using namespace stagebuild::bootstrap;

llvm::Expected<Platform> Platform::parse(StringRef spelling) {
  spelling = spelling.trim();
  if (spelling.count('-') < 2) {
    return makeError(ErrorKind::PlatformUnsupported,
                     "invalid platform '" + spelling +
                     "' (expected 'arch-vendor-os[-environment]')");
  }

  std::string normalized = llvm::Triple::normalize(spelling);
  llvm::Triple triple(normalized);
  if (triple.getArch() == llvm::Triple::UnknownArch) {
    return makeError(ErrorKind::PlatformUnsupported,
                     "unsupported platform '" + spelling +
                     "' (unknown architecture)");
  }
  if (triple.getOS() == llvm::Triple::UnknownOS) {
    return makeError(ErrorKind::PlatformUnsupported,
                     "unsupported platform '" + spelling +
                     "' (unknown operating system)");
  }

  return Platform(std::move(normalized));
}

Platform Platform::getHost() {
  return Platform(llvm::Triple::normalize(llvm::sys::getProcessTriple()));
}
