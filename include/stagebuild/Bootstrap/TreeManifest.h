//===- TreeManifest.h -------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_TREEMANIFEST_H
#define STAGEBUILD_BOOTSTRAP_TREEMANIFEST_H

#include "stagebuild/Basic/BinaryCoding.h"
#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/Hashing.h"
#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace stagebuild {
namespace bootstrap {

/// The recorded state of one item in a directory tree.
struct TreeManifestEntry {
  /// The path relative to the tree root.
  std::string path;

  basic::FileInfo::Kind kind = basic::FileInfo::Kind::File;

  /// The size, for files.
  uint64_t size = 0;

  /// Whether the file is executable.
  bool isExecutable = false;

  /// The digest of the file contents or of the symbolic link target, null for
  /// directories and for manifests computed without contents.
  basic::Digest digest;

  bool operator==(const TreeManifestEntry& rhs) const {
    return path == rhs.path && kind == rhs.kind && size == rhs.size &&
      isExecutable == rhs.isExecutable && digest == rhs.digest;
  }
  bool operator!=(const TreeManifestEntry& rhs) const {
    return !(*this == rhs);
  }
};

/// The sorted list of everything below a directory.
struct TreeManifest {
  std::vector<TreeManifestEntry> entries;

  /// Get the digest of the whole tree.
  basic::Digest getDigest() const;

  /// Find the entry for \p path, or null.
  const TreeManifestEntry* find(StringRef path) const;
};

/// Record the tree below \p root.
///
/// \param ignorePatterns Glob patterns for items to leave out, \see
/// basic::FileSystem::listTree().
///
/// \param hashContents Whether to compute the digest of every file.
bool computeTreeManifest(basic::FileSystem& fs, StringRef root,
                         ArrayRef<std::string> ignorePatterns,
                         bool hashContents, TreeManifest& result,
                         std::string* error_out);

/// Describe how \p rhs differs from \p lhs, one line per differing path.
///
/// At most \p limit differences are described.
std::vector<std::string> diffTreeManifests(const TreeManifest& lhs,
                                           const TreeManifest& rhs,
                                           unsigned limit = 10);

}

namespace basic {

template<>
struct BinaryCodingTraits<bootstrap::TreeManifestEntry> {
  static inline void encode(const bootstrap::TreeManifestEntry& value,
                            BinaryEncoder& coder) {
    coder.writeString(value.path);
    coder.write(uint8_t(value.kind));
    coder.write(uint64_t(value.size));
    coder.write(value.isExecutable);
    coder.write(value.digest);
  }
  static inline void decode(bootstrap::TreeManifestEntry& value,
                            BinaryDecoder& coder) {
    uint8_t kind;
    coder.readString(value.path);
    coder.read(kind);
    coder.read(value.size);
    coder.read(value.isExecutable);
    coder.read(value.digest);
    value.kind = FileInfo::Kind(kind);
  }
};

template<>
struct BinaryCodingTraits<bootstrap::TreeManifest> {
  static inline void encode(const bootstrap::TreeManifest& value,
                            BinaryEncoder& coder) {
    coder.write(uint32_t(value.entries.size()));
    for (const auto& entry: value.entries)
      coder.write(entry);
  }
  static inline void decode(bootstrap::TreeManifest& value,
                            BinaryDecoder& coder) {
    uint32_t count;
    coder.read(count);
    value.entries.clear();
    for (uint32_t i = 0; i != count && !coder.hadError(); ++i) {
      bootstrap::TreeManifestEntry entry;
      coder.read(entry);
      value.entries.push_back(std::move(entry));
    }
  }
};

}
}

#endif
