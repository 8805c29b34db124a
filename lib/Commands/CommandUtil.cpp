//===-- CommandUtil.cpp ---------------------------------------------------===//
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

#include "CommandUtil.h"
#include "stagebuild/Commands/Commands.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>

using namespace stagebuild;
using namespace stagebuild::commands;

static std::string programName;

void commands::setProgramName(StringRef name) {
  assert(programName.empty());
  programName = name.str();
}

const char* commands::getProgramName() {
  if (programName.empty())
    return "stagebuild";

  return programName.c_str();
}

std::string util::indentLines(StringRef text, unsigned indent) {
  std::string result;
  llvm::raw_string_ostream os(result);
  SmallVector<StringRef, 32> lines;
  text.rtrim('\n').split(lines, '\n');
  for (auto line: lines) {
    os.indent(indent) << line.rtrim('\r') << "\n";
  }
  return os.str();
}

std::string util::formatDuration(uint64_t milliseconds) {
  std::string result;
  llvm::raw_string_ostream os(result);
  if (milliseconds < 1000) {
    os << milliseconds << "ms";
  } else if (milliseconds < 60 * 1000) {
    os << llvm::format("%.1fs", double(milliseconds) / 1000.0);
  } else {
    os << milliseconds / 60000 << "m" << (milliseconds / 1000) % 60 << "s";
  }
  return os.str();
}
