//===- Platform.h -----------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_PLATFORM_H
#define STAGEBUILD_BOOTSTRAP_PLATFORM_H

#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace stagebuild {
namespace bootstrap {

/// A host or target platform, identified by its normalized target triple.
class Platform {
  std::string triple;

  explicit Platform(std::string triple) : triple(std::move(triple)) {}

public:
  Platform() {}

  /// Parse a target triple.
  ///
  /// The triple must name at least an architecture, a vendor and an operating
  /// system, and both the architecture and the operating system must be
  /// known.
  static llvm::Expected<Platform> parse(StringRef spelling);

  /// Get the platform this process is running on.
  static Platform getHost();

  const std::string& str() const { return triple; }
  bool empty() const { return triple.empty(); }

  bool operator==(const Platform& rhs) const { return triple == rhs.triple; }
  bool operator!=(const Platform& rhs) const { return triple != rhs.triple; }
  bool operator<(const Platform& rhs) const { return triple < rhs.triple; }
};

}
}

#endif
