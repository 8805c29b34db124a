//===-- ConfigurationTest.cpp ---------------------------------------------===//
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
#include "stagebuild/Bootstrap/BootstrapError.h"

#include "TempDir.h"

#include "gtest/gtest.h"

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

/// Parse \p contents, expecting failure, and return the message.
std::string parseError(StringRef contents) {
  BootstrapConfig config;
  auto error = parseConfig(contents, "/work/stagebuild.yaml", config);
  if (!error)
    return "";
  auto description = describeError(std::move(error));
  EXPECT_EQ(ErrorKind::InvalidConfiguration, description.kind);
  return description.message;
}

TEST(ConfigurationTest, defaults) {
  BootstrapConfig config;
  EXPECT_EQ(0u, config.jobs);
  EXPECT_EQ(3u, config.retryCount);
  EXPECT_EQ(2u, config.stages);
  EXPECT_EQ("bin/build-tool", config.buildTool);
  EXPECT_FALSE(config.keepGoing);
  EXPECT_TRUE(config.verifyFixedPoint);
  EXPECT_GE(config.getEffectiveJobs(), 1u);
  config.jobs = 3;
  EXPECT_EQ(3u, config.getEffectiveJobs());
}

TEST(ConfigurationTest, parseEveryKey) {
  BootstrapConfig config;
  auto error = parseConfig(
      "jobs: 8\n"
      "cache-dir: cache\n"
      "snapshot-mirror: https://mirror.example.org/snapshots\n"
      "retry-count: 5\n"
      "stages: 3\n"
      "snapshot-manifest: /etc/stage0.yaml\n"
      "source-dir: ../src\n"
      "build-dir: ./out/../build\n"
      "build-tool: tools/bt\n"
      "step-timeout: 600\n"
      "keep-going: yes\n"
      "verify-fixed-point: false\n"
      "fixed-point-ignore: [\"*.log\", meta/timestamp]\n"
      "source-ignore:\n"
      "  - .git\n"
      "  - '*.o'\n"
      "install-prefix: /opt/toolchain\n",
      "/work/conf/stagebuild.yaml", config);
  ASSERT_FALSE(bool(error)) << llvm::toString(std::move(error));

  EXPECT_EQ(8u, config.jobs);
  EXPECT_EQ("/work/conf/cache", config.cacheDir);
  EXPECT_EQ("https://mirror.example.org/snapshots", config.snapshotMirror);
  EXPECT_EQ(5u, config.retryCount);
  EXPECT_EQ(3u, config.stages);
  EXPECT_EQ("/etc/stage0.yaml", config.snapshotManifest);
  EXPECT_EQ("/work/src", config.sourceDir);
  EXPECT_EQ("/work/conf/build", config.buildDir);
  EXPECT_EQ("tools/bt", config.buildTool);
  EXPECT_EQ(600u, config.stepTimeout);
  EXPECT_TRUE(config.keepGoing);
  EXPECT_FALSE(config.verifyFixedPoint);
  EXPECT_EQ((std::vector<std::string>{ "*.log", "meta/timestamp" }),
            config.fixedPointIgnore);
  EXPECT_EQ((std::vector<std::string>{ ".git", "*.o" }), config.sourceIgnore);
  EXPECT_EQ("/opt/toolchain", config.installPrefix);
}

TEST(ConfigurationTest, parseOnlyAssignsPresentKeys) {
  BootstrapConfig config;
  config.stages = 4;
  config.cacheDir = "/keep";
  auto error = parseConfig("jobs: 2\n", "/work/stagebuild.yaml", config);
  ASSERT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_EQ(2u, config.jobs);
  EXPECT_EQ(4u, config.stages);
  EXPECT_EQ("/keep", config.cacheDir);
}

TEST(ConfigurationTest, parseErrors) {
  EXPECT_NE(std::string::npos,
            parseError("colour: blue\n").find(
                "unknown configuration key 'colour'"));
  EXPECT_NE(std::string::npos,
            parseError("jobs: many\n").find(
                "invalid value 'many' for 'jobs'"));
  EXPECT_NE(std::string::npos,
            parseError("keep-going: perhaps\n").find("expected boolean"));
  EXPECT_NE(std::string::npos,
            parseError("source-ignore: .git\n").find("expected list"));
  EXPECT_NE(std::string::npos,
            parseError("- jobs\n").find("expected map"));
  EXPECT_NE(std::string::npos,
            parseError("cache-dir: ''\n").find("invalid empty path"));

  // Errors carry the location.
  EXPECT_EQ(0u, parseError("jobs: 1\nstages: x\n")
                    .find("/work/stagebuild.yaml:2:"));

  // A failed parse leaves the configuration untouched.
  BootstrapConfig config;
  auto error = parseConfig("jobs: 9\nstages: x\n", "/work/s.yaml", config);
  EXPECT_TRUE(bool(error));
  llvm::consumeError(std::move(error));
  EXPECT_EQ(0u, config.jobs);
}

TEST(ConfigurationTest, loadConfigFile) {
  TmpDir tempDir(__func__);
  std::string path = tempDir.writeFile("conf/stagebuild.yaml",
                                       "cache-dir: ../cache\nstages: 1\n");
  auto fs = basic::createLocalFileSystem();

  BootstrapConfig config;
  auto error = loadConfigFile(*fs, path, config);
  ASSERT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_EQ(tempDir.path("cache"), config.cacheDir);
  EXPECT_EQ(1u, config.stages);

  auto description = describeError(
      loadConfigFile(*fs, tempDir.path("missing.yaml"), config));
  EXPECT_EQ(ErrorKind::InvalidConfiguration, description.kind);
  EXPECT_NE(std::string::npos,
            description.message.find("unable to read configuration file"));
}

TEST(ConfigurationTest, applyEnvironment) {
  const char* environment[] = {
    "STAGEBUILD_CACHE_DIR=/env/cache",
    "STAGEBUILD_SNAPSHOT_MIRROR=https://env.example.org",
    "STAGEBUILD_VERBOSE=2",
    nullptr };

  BootstrapConfig config;
  config.cacheDir = "/file/cache";
  auto error = applyEnvironment(environment, config);
  ASSERT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_EQ("/env/cache", config.cacheDir);
  EXPECT_EQ("https://env.example.org", config.snapshotMirror);
  EXPECT_EQ(2u, config.verbosity);

  // Empty values do not override.
  const char* empty[] = { "STAGEBUILD_CACHE_DIR=", nullptr };
  ASSERT_FALSE(bool(applyEnvironment(empty, config)));
  EXPECT_EQ("/env/cache", config.cacheDir);

  const char* invalid[] = { "STAGEBUILD_VERBOSE=loud", nullptr };
  auto description = describeError(applyEnvironment(invalid, config));
  EXPECT_EQ(ErrorKind::InvalidConfiguration, description.kind);
  EXPECT_NE(std::string::npos, description.message.find("STAGEBUILD_VERBOSE"));
}

TEST(ConfigurationTest, resolveDefaults) {
  const char* environment[] = { "HOME=/home/builder", nullptr };
  BootstrapConfig config;
  auto error = config.resolveDefaults(environment, "/work/toolchain");
  ASSERT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_EQ("/work/toolchain", config.sourceDir);
  EXPECT_EQ("/home/builder/.cache/stagebuild", config.cacheDir);
  EXPECT_EQ("/home/builder/.cache/stagebuild/build", config.buildDir);
  EXPECT_EQ("/work/toolchain/stage0.yaml", config.snapshotManifest);
  EXPECT_EQ("", config.installPrefix);

  // XDG_CACHE_HOME takes precedence over HOME.
  const char* xdg[] = { "HOME=/home/builder", "XDG_CACHE_HOME=/xdg",
                        nullptr };
  BootstrapConfig xdgConfig;
  xdgConfig.sourceDir = "src";
  xdgConfig.installPrefix = "prefix";
  ASSERT_FALSE(bool(xdgConfig.resolveDefaults(xdg, "/work")));
  EXPECT_EQ("/xdg/stagebuild", xdgConfig.cacheDir);
  EXPECT_EQ("/work/src", xdgConfig.sourceDir);
  EXPECT_EQ("/work/prefix", xdgConfig.installPrefix);

  BootstrapConfig homeless;
  auto description = describeError(homeless.resolveDefaults(nullptr, "/w"));
  EXPECT_EQ(ErrorKind::InvalidConfiguration, description.kind);
  EXPECT_NE(std::string::npos, description.message.find("HOME is not set"));

  // An explicit cache directory needs no HOME.
  homeless.cacheDir = "cache";
  ASSERT_FALSE(bool(homeless.resolveDefaults(nullptr, "/w")));
  EXPECT_EQ("/w/cache", homeless.cacheDir);
}

TEST(ConfigurationTest, validate) {
  BootstrapConfig config;
  EXPECT_FALSE(bool(config.validate()));

  config.buildTool = "/usr/bin/cc";
  EXPECT_EQ(ErrorKind::InvalidConfiguration,
            describeError(config.validate()).kind);

  config.buildTool = "bin/build-tool";
  config.verbosity = 3;
  EXPECT_EQ(ErrorKind::InvalidConfiguration,
            describeError(config.validate()).kind);

  config.verbosity = 1;
  config.snapshotMirror = "https://mirror/";
  EXPECT_EQ(ErrorKind::InvalidConfiguration,
            describeError(config.validate()).kind);
}

}
