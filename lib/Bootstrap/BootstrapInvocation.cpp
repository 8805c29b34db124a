//===-- BootstrapInvocation.cpp -------------------------------------------===//
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

#include "stagebuild/Bootstrap/BootstrapInvocation.h"

#include "stagebuild/Bootstrap/BootstrapError.h"
#include "stagebuild/Bootstrap/Configuration.h"
#include "stagebuild/Bootstrap/Orchestrator.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

void BootstrapInvocation::getUsage(int optionWidth, raw_ostream& os) {
  const struct Options {
    llvm::StringRef option, helpText;
  } options[] = {
    { "--help", "show this help message and exit" },
    { "--version", "show the tool version" },
    { "--config <PATH>", "load the configuration file at PATH" },
    { "--manifest <PATH>", "load the snapshot manifest at PATH" },
    { "--source-dir <PATH>", "build the sources at PATH" },
    { "--cache-dir <PATH>", "use the artifact cache at PATH" },
    { "--stage <N>", "set the final stage to build" },
    { "--host <TRIPLE>", "add a host platform (repeatable)" },
    { "--target <TRIPLE>", "add a target platform (repeatable)" },
    { "-j,--jobs <JOBS>", "set how many steps to run concurrently" },
    { "--keep-going", "continue independent steps after a failure" },
    { "--prefix <PATH>", "install into PATH (install)" },
    { "--corrupted-only", "only evict damaged cache entries (clean)" },
    { "--dry-run", "print the plan without running it" },
    { "-v, --verbose", "show verbose status information (repeatable)" },
    { "--trace <PATH>", "trace orchestrator operation to PATH" },
  };

  for (const auto& entry: options) {
    os << "  " << llvm::format("%-*s", optionWidth, entry.option.str().c_str())
       << " " << entry.helpText << "\n";
  }
}

void BootstrapInvocation::parse(llvm::ArrayRef<std::string> args,
                                llvm::SourceMgr& sourceMgr) {
  auto error = [&](const Twine &message) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
    hadErrors = true;
  };

  auto parseUnsigned = [&](StringRef option, StringRef value,
                           unsigned& result) {
    if (value.getAsInteger(10, result)) {
      error("invalid argument '" + value + "' to '" + option + "'");
      return false;
    }
    return true;
  };

  while (!args.empty()) {
    const auto& option = args.front();
    args = args.slice(1);

    if (option == "--") {
      for (const auto& arg: args) {
        positionalArgs.push_back(arg);
      }
      break;
    }

    if (!option.empty() && option[0] != '-') {
      if (!action.hasValue() && positionalArgs.empty()) {
        action = parseActionName(option);
        if (!action.hasValue()) {
          error("unknown command '" + option + "'");
          break;
        }
        continue;
      }
      positionalArgs.push_back(option);
      continue;
    }

    // Options which take no argument.
    if (option == "--help") {
      showUsage = true;
      break;
    } else if (option == "--version") {
      showVersion = true;
      break;
    } else if (option == "--keep-going") {
      keepGoing = true;
      continue;
    } else if (option == "--dry-run") {
      dryRun = true;
      continue;
    } else if (option == "--corrupted-only") {
      corruptedOnly = true;
      continue;
    } else if (option == "-v" || option == "--verbose") {
      ++verbosity;
      continue;
    } else if (option == "-vv") {
      verbosity += 2;
      continue;
    } else if (StringRef(option).startswith("-j") && option.size() > 2) {
      unsigned value;
      if (!parseUnsigned("-j", StringRef(option).drop_front(2), value))
        break;
      jobs = value;
      continue;
    }

    // Options which take an argument.
    std::string* stringValue = llvm::StringSwitch<std::string*>(option)
      .Case("--config", &configPath)
      .Case("--manifest", &manifestPath)
      .Case("--source-dir", &sourceDir)
      .Case("--cache-dir", &cacheDir)
      .Case("--prefix", &installPrefix)
      .Case("--trace", &traceFilePath)
      .Default(nullptr);
    bool takesArgument = stringValue || option == "--stage" ||
      option == "--host" || option == "--target" || option == "-j" ||
      option == "--jobs";
    if (!takesArgument) {
      error("invalid option '" + option + "'");
      break;
    }
    if (args.empty()) {
      error("missing argument to '" + option + "'");
      break;
    }
    const std::string& value = args.front();
    args = args.slice(1);

    if (stringValue) {
      if (value.empty()) {
        error("invalid empty argument to '" + option + "'");
        break;
      }
      *stringValue = value;
    } else if (option == "--stage") {
      unsigned result;
      if (!parseUnsigned(option, value, result))
        break;
      stage = result;
    } else if (option == "-j" || option == "--jobs") {
      unsigned result;
      if (!parseUnsigned(option, value, result))
        break;
      jobs = result;
    } else if (option == "--host") {
      hosts.push_back(value);
    } else {
      targets.push_back(value);
    }
  }

  if (!hadErrors && !showUsage && !showVersion && !action.hasValue())
    error("missing command (expected build, test, install, clean or "
          "validate)");
}

void BootstrapInvocation::applyTo(BootstrapConfig& config) const {
  if (jobs.hasValue())
    config.jobs = *jobs;
  if (!manifestPath.empty())
    config.snapshotManifest = manifestPath;
  if (!sourceDir.empty())
    config.sourceDir = sourceDir;
  if (!cacheDir.empty())
    config.cacheDir = cacheDir;
  if (!installPrefix.empty())
    config.installPrefix = installPrefix;
  if (keepGoing)
    config.keepGoing = true;
  if (verbosity)
    config.verbosity = std::min(2u, std::max(config.verbosity, verbosity));
}

/// Parse a platform argument; `host` names the machine's own platform.
static llvm::Expected<Platform> parsePlatformArgument(StringRef spelling) {
  if (spelling == "host")
    return Platform::getHost();
  return Platform::parse(spelling);
}

llvm::Expected<OrchestratorRequest> BootstrapInvocation::getRequest() const {
  OrchestratorRequest request;
  request.action = action.hasValue() ? *action : BootstrapAction::Build;
  request.stage = stage;
  request.dryRun = dryRun;

  for (const auto& spelling: hosts) {
    auto platform = parsePlatformArgument(spelling);
    if (!platform)
      return platform.takeError();
    request.hosts.push_back(*platform);
  }
  for (const auto& spelling: targets) {
    auto platform = parsePlatformArgument(spelling);
    if (!platform)
      return platform.takeError();
    request.targets.push_back(*platform);
  }
  return std::move(request);
}
