//===- CommandUtil.h --------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_COMMANDS_COMMANDUTIL_H
#define STAGEBUILD_COMMANDS_COMMANDUTIL_H

#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace stagebuild {
namespace commands {
namespace util {

/// Indent every line of \p text by \p indent spaces, making sure the result
/// ends with a newline.
std::string indentLines(StringRef text, unsigned indent);

/// Format a duration in milliseconds for status output.
std::string formatDuration(uint64_t milliseconds);

}
}
}

#endif
