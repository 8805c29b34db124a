//===-- main.cpp ----------------------------------------------------------===//
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

#include "stagebuild/Basic/Version.h"

#include "stagebuild/Commands/Commands.h"

#include "llvm/Support/Path.h"
#include "llvm/Support/Signals.h"

#include <cstdio>
#include <string>
#include <vector>

using namespace stagebuild;
using namespace stagebuild::commands;

static void usage(FILE* fp) {
  fprintf(fp, "Usage: %s [--version] [--help] <command> [<args>]\n",
          getProgramName());
  fprintf(fp, "\n");
  fprintf(fp, "Available commands:\n");
  fprintf(fp, "  build    -- Build the toolchain up to the final stage\n");
  fprintf(fp, "  test     -- Build, then test the final stage\n");
  fprintf(fp, "  install  -- Build, then install the final stage\n");
  fprintf(fp, "  clean    -- Remove cached artifacts\n");
  fprintf(fp, "  validate -- Build, then check the fixed point of every host\n");
  fprintf(fp, "\n");
  fprintf(fp, "See '%s <command> --help' for the command options.\n",
          getProgramName());
}

int main(int argc, const char **argv, const char **envp) {
  // Print stacks on error.
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);

  setProgramName(llvm::sys::path::filename(argv[0]));

  if (argc == 1) {
    usage(stderr);
    return 4;
  }
  if (std::string(argv[1]) == "--help") {
    usage(stdout);
    return 0;
  }
  if (std::string(argv[1]) == "--version") {
    printf("%s\n", getStagebuildFullVersion().c_str());
    return 0;
  }

  std::vector<std::string> args;
  for (int i = 1; i != argc; ++i) {
    args.push_back(argv[i]);
  }
  return executeBootstrapCommand(args, envp);
}
