//===- Artifact.h -----------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_ARTIFACT_H
#define STAGEBUILD_BOOTSTRAP_ARTIFACT_H

#include "stagebuild/Basic/Hashing.h"
#include "stagebuild/Bootstrap/Fingerprint.h"
#include "stagebuild/Bootstrap/Platform.h"

#include <cstdint>
#include <string>

namespace stagebuild {
namespace bootstrap {

/// A built (or fetched) toolchain: an opaque directory containing the
/// compiler, its standard library and metadata.
struct Artifact {
  unsigned stage = 0;

  /// The platform of the toolchain which produced this artifact.
  Platform host;

  /// The platform this artifact was built for.
  Platform target;

  /// The directory holding the artifact.
  std::string path;

  /// The cache key of the artifact; for stage 0, the snapshot checksum.
  Fingerprint fingerprint;
};

/// A committed BuildCache record.
struct CacheEntry {
  Fingerprint fingerprint;
  unsigned stage = 0;
  StepKind kind = StepKind::Build;
  Platform host;
  Platform target;

  /// The directory holding the artifact.
  std::string path;

  /// The digest of the artifact's tree, \see TreeManifest::getDigest().
  basic::Digest contentDigest;

  /// The commit time, in seconds since the epoch.
  uint64_t createdAt = 0;

  /// False once the entry has been found damaged.
  bool valid = true;

  Artifact getArtifact() const {
    Artifact result;
    result.stage = stage;
    result.host = host;
    result.target = target;
    result.path = path;
    result.fingerprint = fingerprint;
    return result;
  }
};

}
}

#endif
