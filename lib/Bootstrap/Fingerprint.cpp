//===-- Fingerprint.cpp ---------------------------------------------------===//
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

#include "stagebuild/Basic/BinaryCoding.h"
#include "stagebuild/Bootstrap/Configuration.h"

#include <algorithm>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

/// The version of the fingerprint encoding; changing the encoding must change
/// this tag so old cache entries are never reused.
static const char* fingerprintEncodingTag = "stagebuild.fingerprint.v1";

StringRef bootstrap::getStepKindName(StepKind kind) {
  switch (kind) {
  case StepKind::Build: return "build";
  case StepKind::FixedPoint: return "fixed-point";
  }
  return "unknown";
}

Fingerprint bootstrap::computeFingerprint(const FingerprintInputs& inputs) {
  basic::BinaryEncoder coder;
  coder.writeString(fingerprintEncodingTag);
  coder.write(uint32_t(inputs.stage));
  coder.write(uint8_t(inputs.kind));
  coder.writeString(inputs.host.str());
  coder.writeString(inputs.target.str());
  coder.write(inputs.sourceDigest);
  coder.write(inputs.configDigest);
  coder.write(inputs.predecessor);
  return basic::hashBytes(coder.getData());
}

basic::Digest bootstrap::computeConfigDigest(const BootstrapConfig& config) {
  // The ignore patterns are a set, so their order must not matter.
  std::vector<std::string> sourceIgnore = config.sourceIgnore;
  std::sort(sourceIgnore.begin(), sourceIgnore.end());

  basic::BinaryEncoder coder;
  coder.writeString("stagebuild.config.v1");
  coder.writeString(config.buildTool);
  coder.write(uint32_t(sourceIgnore.size()));
  for (const auto& pattern: sourceIgnore)
    coder.writeString(pattern);
  return basic::hashBytes(coder.getData());
}
