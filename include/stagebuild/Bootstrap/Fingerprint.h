//===- Fingerprint.h --------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_FINGERPRINT_H
#define STAGEBUILD_BOOTSTRAP_FINGERPRINT_H

#include "stagebuild/Basic/Hashing.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/Platform.h"

#include <cstdint>

namespace stagebuild {
namespace bootstrap {

struct BootstrapConfig;

/// The key of a cache entry, a digest of everything which can influence the
/// artifact a step produces.
typedef basic::Digest Fingerprint;

/// The kind of a step producing a cached artifact.
enum class StepKind : uint8_t {
  /// A stage built by the previous stage.
  Build = 0,

  /// A stage rebuilt by itself, to check its fixed point.
  FixedPoint = 1,
};

StringRef getStepKindName(StepKind kind);

/// The inputs of a fingerprint.
struct FingerprintInputs {
  unsigned stage = 0;
  StepKind kind = StepKind::Build;

  /// The platform of the toolchain doing the build.
  Platform host;

  /// The platform the artifact is built for.
  Platform target;

  /// The digest of the source tree.
  basic::Digest sourceDigest;

  /// The digest of the configuration settings which influence artifacts,
  /// \see computeConfigDigest().
  basic::Digest configDigest;

  /// The fingerprint (or, for stage 0, the snapshot checksum) of the
  /// toolchain doing the build.
  Fingerprint predecessor;
};

/// Compute the fingerprint for a step.
///
/// The fingerprint is the SHA-256 digest of a canonical binary encoding of
/// \p inputs, so it is stable across runs, machines and versions of this
/// tool with the same encoding version.
Fingerprint computeFingerprint(const FingerprintInputs& inputs);

/// Compute the digest of the settings in \p config which can change the
/// artifacts a toolchain produces.
basic::Digest computeConfigDigest(const BootstrapConfig& config);

}
}

#endif
