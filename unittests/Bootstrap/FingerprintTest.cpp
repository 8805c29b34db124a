//===-- FingerprintTest.cpp -----------------------------------------------===//
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

#include "stagebuild/Bootstrap/Fingerprint.h"

#include "stagebuild/Bootstrap/Configuration.h"

#include "gtest/gtest.h"

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

Platform parsePlatform(StringRef spelling) {
  auto platform = Platform::parse(spelling);
  EXPECT_TRUE(bool(platform));
  if (!platform) {
    llvm::consumeError(platform.takeError());
    return Platform();
  }
  return *platform;
}

FingerprintInputs makeInputs() {
  FingerprintInputs inputs;
  inputs.stage = 1;
  inputs.kind = StepKind::Build;
  inputs.host = parsePlatform("x86_64-unknown-linux-gnu");
  inputs.target = parsePlatform("x86_64-unknown-linux-gnu");
  inputs.sourceDigest = basic::hashBytes("sources");
  BootstrapConfig config;
  inputs.configDigest = computeConfigDigest(config);
  inputs.predecessor = basic::hashBytes("snapshot");
  return inputs;
}

TEST(FingerprintTest, stable) {
  EXPECT_EQ(computeFingerprint(makeInputs()),
            computeFingerprint(makeInputs()));
  EXPECT_FALSE(computeFingerprint(makeInputs()).isNull());
}

TEST(FingerprintTest, everyInputMatters) {
  Fingerprint base = computeFingerprint(makeInputs());

  auto inputs = makeInputs();
  inputs.stage = 2;
  EXPECT_NE(base, computeFingerprint(inputs));

  inputs = makeInputs();
  inputs.kind = StepKind::FixedPoint;
  EXPECT_NE(base, computeFingerprint(inputs));

  inputs = makeInputs();
  inputs.host = parsePlatform("aarch64-unknown-linux-gnu");
  EXPECT_NE(base, computeFingerprint(inputs));

  inputs = makeInputs();
  inputs.target = parsePlatform("aarch64-unknown-linux-gnu");
  EXPECT_NE(base, computeFingerprint(inputs));

  inputs = makeInputs();
  inputs.sourceDigest = basic::hashBytes("sources!");
  EXPECT_NE(base, computeFingerprint(inputs));

  inputs = makeInputs();
  inputs.predecessor = basic::hashBytes("other snapshot");
  EXPECT_NE(base, computeFingerprint(inputs));

  // Swapping host and target is not the same step.
  inputs = makeInputs();
  inputs.target = parsePlatform("aarch64-unknown-linux-gnu");
  auto swapped = inputs;
  std::swap(swapped.host, swapped.target);
  EXPECT_NE(computeFingerprint(inputs), computeFingerprint(swapped));
}

TEST(FingerprintTest, configDigest) {
  BootstrapConfig config;
  basic::Digest base = computeConfigDigest(config);

  // Settings which cannot change an artifact are left out.
  BootstrapConfig scheduling = config;
  scheduling.jobs = 16;
  scheduling.keepGoing = true;
  scheduling.verbosity = 2;
  scheduling.cacheDir = "/elsewhere";
  EXPECT_EQ(base, computeConfigDigest(scheduling));

  BootstrapConfig tool = config;
  tool.buildTool = "bin/other-tool";
  EXPECT_NE(base, computeConfigDigest(tool));

  BootstrapConfig ignoreA = config;
  ignoreA.sourceIgnore = { ".git", "*.o" };
  BootstrapConfig ignoreB = config;
  ignoreB.sourceIgnore = { "*.o", ".git" };
  EXPECT_NE(base, computeConfigDigest(ignoreA));
  EXPECT_EQ(computeConfigDigest(ignoreA), computeConfigDigest(ignoreB));
}

TEST(FingerprintTest, stepKindNames) {
  EXPECT_EQ("build", getStepKindName(StepKind::Build));
  EXPECT_EQ("fixed-point", getStepKindName(StepKind::FixedPoint));
}

}
