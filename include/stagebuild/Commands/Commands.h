//===- Commands.h -----------------------------------------------*- C++ -*-===//
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
// This header describes the interfaces in the Commands stagebuild library,
// which contains the command line tool implementation.
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_COMMANDS_H
#define STAGEBUILD_COMMANDS_H

#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace stagebuild {
namespace commands {

/// Register the program name.
void setProgramName(StringRef name);

/// Get the registered program name.
const char* getProgramName();

/// Run a bootstrap command (`build`, `test`, `install`, `clean` or
/// `validate`) with its options.
///
/// \param environment The process environment, in the format of `::main()`.
/// \returns The process exit code.
int executeBootstrapCommand(const std::vector<std::string>& args,
                            const char* const* environment);

}
}

#endif
