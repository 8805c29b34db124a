//===-- Configuration.cpp -------------------------------------------------===//
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

#include "stagebuild/Bootstrap/Configuration.h"

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/POSIXEnvironment.h"
#include "stagebuild/Bootstrap/BootstrapError.h"

#include "YAMLReader.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <thread>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

/// Make \p path absolute relative to \p base, and drop `.` components.
std::string resolvePath(StringRef path, StringRef base) {
  if (path.empty())
    return std::string();
  SmallString<256> result;
  if (llvm::sys::path::is_absolute(path)) {
    result = path;
  } else {
    result = base;
    llvm::sys::path::append(result, path);
  }
  llvm::sys::path::remove_dots(result, /*remove_dot_dot=*/true);
  return result.str().str();
}

class ConfigParser {
  YAMLReader& reader;
  BootstrapConfig& config;
  std::string baseDir;

public:
  ConfigParser(YAMLReader& reader, BootstrapConfig& config, StringRef baseDir)
      : reader(reader), config(config), baseDir(baseDir.str()) {}

  bool readPath(llvm::yaml::Node* node, StringRef key, std::string& result) {
    std::string value;
    if (!reader.readString(node, key, value))
      return false;
    if (value.empty()) {
      reader.error(node, "invalid empty path for '" + key + "'");
      return false;
    }
    result = resolvePath(value, baseDir);
    return true;
  }

  void parseRoot(llvm::yaml::Node* root) {
    // An empty file leaves every setting at its default.
    if (llvm::isa<llvm::yaml::NullNode>(root))
      return;

    auto mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(root);
    if (!mapping) {
      reader.error(root, "unexpected top-level node (expected map)");
      return;
    }

    for (auto& entry: *mapping) {
      auto keyNode = llvm::dyn_cast<llvm::yaml::ScalarNode>(entry.getKey());
      if (!keyNode) {
        reader.error(entry.getKey(), "invalid key type in configuration");
        return;
      }
      std::string key = YAMLReader::stringFromScalarNode(keyNode);
      llvm::yaml::Node* value = entry.getValue();

      bool ok;
      if (key == "jobs") {
        ok = reader.readUnsigned(value, key, config.jobs);
      } else if (key == "cache-dir") {
        ok = readPath(value, key, config.cacheDir);
      } else if (key == "snapshot-mirror") {
        ok = reader.readString(value, key, config.snapshotMirror);
      } else if (key == "retry-count") {
        ok = reader.readUnsigned(value, key, config.retryCount);
      } else if (key == "stages") {
        ok = reader.readUnsigned(value, key, config.stages);
      } else if (key == "snapshot-manifest") {
        ok = readPath(value, key, config.snapshotManifest);
      } else if (key == "source-dir") {
        ok = readPath(value, key, config.sourceDir);
      } else if (key == "build-dir") {
        ok = readPath(value, key, config.buildDir);
      } else if (key == "build-tool") {
        ok = reader.readString(value, key, config.buildTool);
      } else if (key == "step-timeout") {
        ok = reader.readUnsigned(value, key, config.stepTimeout);
      } else if (key == "keep-going") {
        ok = reader.readBool(value, key, config.keepGoing);
      } else if (key == "verify-fixed-point") {
        ok = reader.readBool(value, key, config.verifyFixedPoint);
      } else if (key == "fixed-point-ignore") {
        ok = reader.readStringList(value, key, config.fixedPointIgnore);
      } else if (key == "source-ignore") {
        ok = reader.readStringList(value, key, config.sourceIgnore);
      } else if (key == "install-prefix") {
        ok = readPath(value, key, config.installPrefix);
      } else {
        reader.error(entry.getKey(),
                     "unknown configuration key '" + key + "'");
        ok = false;
      }
      if (!ok)
        return;
    }
  }
};

}

unsigned BootstrapConfig::getEffectiveJobs() const {
  if (jobs != 0)
    return jobs;
  return std::max(1u, std::thread::hardware_concurrency());
}

llvm::Error BootstrapConfig::resolveDefaults(const char* const* environment,
                                             StringRef workingDir) {
  if (sourceDir.empty())
    sourceDir = workingDir.str();
  sourceDir = resolvePath(sourceDir, workingDir);

  if (cacheDir.empty()) {
    if (auto xdg = basic::lookupEnvironment(environment, "XDG_CACHE_HOME")) {
      if (!xdg->empty())
        cacheDir = resolvePath("stagebuild", *xdg);
    }
  }
  if (cacheDir.empty()) {
    auto home = basic::lookupEnvironment(environment, "HOME");
    if (!home || home->empty()) {
      return makeError(ErrorKind::InvalidConfiguration,
                       "no cache directory configured and HOME is not set "
                       "(use --cache-dir or STAGEBUILD_CACHE_DIR)");
    }
    SmallString<256> path(*home);
    llvm::sys::path::append(path, ".cache", "stagebuild");
    cacheDir = path.str().str();
  }
  cacheDir = resolvePath(cacheDir, workingDir);

  if (buildDir.empty()) {
    SmallString<256> path(cacheDir);
    llvm::sys::path::append(path, "build");
    buildDir = path.str().str();
  }
  buildDir = resolvePath(buildDir, workingDir);

  if (snapshotManifest.empty()) {
    SmallString<256> path(sourceDir);
    llvm::sys::path::append(path, "stage0.yaml");
    snapshotManifest = path.str().str();
  }
  snapshotManifest = resolvePath(snapshotManifest, workingDir);

  installPrefix = resolvePath(installPrefix, workingDir);

  return llvm::Error::success();
}

llvm::Error BootstrapConfig::validate() const {
  if (buildTool.empty() || llvm::sys::path::is_absolute(buildTool)) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "invalid 'build-tool' value '" + buildTool +
                     "' (expected a path relative to the toolchain)");
  }
  if (verbosity > 2) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "invalid verbosity " + Twine(verbosity) +
                     " (expected 0-2)");
  }
  if (!snapshotMirror.empty() && StringRef(snapshotMirror).endswith("/")) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "invalid 'snapshot-mirror' value '" + snapshotMirror +
                     "' (must not end with '/')");
  }
  return llvm::Error::success();
}

llvm::Error bootstrap::parseConfig(StringRef contents, StringRef path,
                                   BootstrapConfig& config) {
  YAMLReader reader(contents, path);

  // Parse into a copy, so a failed load leaves the input untouched.
  BootstrapConfig result = config;
  StringRef baseDir = llvm::sys::path::parent_path(path);
  ConfigParser parser(reader, result, baseDir.empty() ? "." : baseDir);
  if (!reader.readDocument([&](llvm::yaml::Node* root) {
        parser.parseRoot(root);
      })) {
    return reader.takeError(ErrorKind::InvalidConfiguration);
  }

  config = std::move(result);
  return llvm::Error::success();
}

llvm::Error bootstrap::loadConfigFile(basic::FileSystem& fs, StringRef path,
                                      BootstrapConfig& config) {
  auto buffer = fs.getFileContents(path.str());
  if (!buffer) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "unable to read configuration file '" + path + "'");
  }
  return parseConfig(buffer->getBuffer(), path, config);
}

llvm::Error bootstrap::applyEnvironment(const char* const* environment,
                                        BootstrapConfig& config) {
  if (auto value = basic::lookupEnvironment(environment,
                                            "STAGEBUILD_CACHE_DIR")) {
    if (!value->empty())
      config.cacheDir = *value;
  }
  if (auto value = basic::lookupEnvironment(environment,
                                            "STAGEBUILD_SNAPSHOT_MIRROR")) {
    if (!value->empty())
      config.snapshotMirror = *value;
  }
  if (auto value = basic::lookupEnvironment(environment,
                                            "STAGEBUILD_VERBOSE")) {
    unsigned verbosity;
    if (StringRef(*value).getAsInteger(10, verbosity) || verbosity > 2) {
      return makeError(ErrorKind::InvalidConfiguration,
                       "invalid STAGEBUILD_VERBOSE value '" + *value +
                       "' (expected 0-2)");
    }
    config.verbosity = verbosity;
  }
  return llvm::Error::success();
}
