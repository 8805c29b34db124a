//===-- Version.cpp -------------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2015 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "stagebuild/Basic/Version.h"

#include <string>

namespace stagebuild {

std::string getStagebuildFullVersion(StringRef productName) {
  std::string result = productName.str() + " version 1.0";

  // Include the additional build version information, if present.
#ifdef STAGEBUILD_VENDOR_STRING
  result = std::string(STAGEBUILD_VENDOR_STRING) + " " + result;
#endif
#ifdef STAGEBUILD_VERSION_STRING
  result = result + " (" + std::string(STAGEBUILD_VERSION_STRING) + ")";
#endif

  return result;
}

}
