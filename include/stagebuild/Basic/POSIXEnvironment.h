//===- POSIXEnvironment.h ---------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2019 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_BASIC_POSIXENVIRONMENT_H
#define STAGEBUILD_BASIC_POSIXENVIRONMENT_H

#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"

#include <cassert>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace stagebuild {
namespace basic {

/// A helper class for constructing a POSIX-style environment.
class POSIXEnvironment {
  /// The actual environment, this is only populated once frozen.
  std::vector<const char*> env;

  /// The underlying string storage.
  //
  // FIXME: This is not efficient, we could store into a single allocation.
  std::vector<std::string> envStorage;

  /// The list of known keys in the environment.
  std::unordered_set<std::string> keys{};

  /// Whether the environment pointer has been vended, and assignments can no
  /// longer be mutated.
  bool isFrozen = false;

public:
  POSIXEnvironment() {}

  /// Add a key to the environment, if missing.
  ///
  /// If the key has already been defined, it will **NOT** be inserted.
  void setIfMissing(StringRef key, StringRef value) {
    assert(!isFrozen);
    if (keys.insert(key.str()).second) {
      llvm::SmallString<256> assignment;
      assignment += key;
      assignment += '=';
      assignment += value;
      envStorage.emplace_back(assignment.str().str());
    }
  }

  /// Copy the variables named in \p names from a `::main()` style environment,
  /// if they are present there and missing here.
  void inheritIfPresent(const char* const* environment,
                        ArrayRef<StringRef> names) {
    if (!environment)
      return;
    for (const char* const* p = environment; *p != nullptr; ++p) {
      auto pair = StringRef(*p).split('=');
      for (auto name: names) {
        if (pair.first == name) {
          setIfMissing(pair.first, pair.second);
          break;
        }
      }
    }
  }

  /// Look up the value assigned to \p key.
  Optional<StringRef> get(StringRef key) const {
    for (const auto& entry: envStorage) {
      auto pair = StringRef(entry).split('=');
      if (pair.first == key)
        return pair.second;
    }
    return None;
  }

  /// Get a POSIX style envirnonment pointer.
  ///
  /// This pointer is only valid for the lifetime of the environment itself.
  const char* const* getEnvp() {
    isFrozen = true;

    // Form the final environment.
    env.clear();
    for (const auto& entry : envStorage) {
      env.emplace_back(entry.c_str());
    }
    env.emplace_back(nullptr);
    return env.data();
  }
};

/// Look up \p name in a `::main()` style environment.
inline Optional<std::string> lookupEnvironment(const char* const* environment,
                                               StringRef name) {
  if (!environment)
    return None;
  for (const char* const* p = environment; *p != nullptr; ++p) {
    auto pair = StringRef(*p).split('=');
    if (pair.first == name)
      return pair.second.str();
  }
  return None;
}

}
}

#endif
