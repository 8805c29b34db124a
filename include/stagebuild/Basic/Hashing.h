//===- Hashing.h ------------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BASIC_HASHING_H
#define STAGEBUILD_BASIC_HASHING_H

#include "stagebuild/Basic/BinaryCoding.h"
#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/SHA256.h"

#include <array>
#include <cstdint>
#include <string>

namespace stagebuild {
namespace basic {

/// A SHA-256 digest value.
class Digest {
public:
  static const unsigned NumBytes = 32;

private:
  std::array<uint8_t, NumBytes> bytes;

public:
  Digest() { bytes.fill(0); }
  explicit Digest(const std::array<uint8_t, NumBytes>& bytes) : bytes(bytes) {}

  /// Parse a digest from its 64 character hexadecimal spelling.
  ///
  /// Both lower and upper case digits are accepted.
  static Optional<Digest> fromHex(StringRef hex);

  /// Get the lowercase hexadecimal spelling.
  std::string toHex() const;

  const std::array<uint8_t, NumBytes>& getBytes() const { return bytes; }

  bool isNull() const {
    for (auto byte: bytes) {
      if (byte != 0)
        return false;
    }
    return true;
  }

  bool operator==(const Digest& rhs) const { return bytes == rhs.bytes; }
  bool operator!=(const Digest& rhs) const { return bytes != rhs.bytes; }
  bool operator<(const Digest& rhs) const { return bytes < rhs.bytes; }
};

/// Incrementally computes a \see Digest.
class DigestBuilder {
  llvm::SHA256 hasher;

public:
  DigestBuilder() {}

  DigestBuilder& update(StringRef data) {
    hasher.update(data);
    return *this;
  }

  DigestBuilder& update(ArrayRef<uint8_t> data);

  /// Complete the digest; the builder may not be used afterwards.
  Digest finalize();
};

/// Compute the digest of a single buffer.
Digest hashBytes(StringRef data);

/// Compute the digest of a file's contents, streaming it from disk.
///
/// \returns True on success.
bool hashFile(StringRef path, Digest& result, std::string* error_out);

template<>
struct BinaryCodingTraits<Digest> {
  static inline void encode(const Digest& value, BinaryEncoder& coder) {
    for (auto byte: value.getBytes())
      coder.write(byte);
  }
  static inline void decode(Digest& value, BinaryDecoder& coder) {
    std::array<uint8_t, Digest::NumBytes> bytes;
    for (auto& byte: bytes)
      coder.read(byte);
    value = Digest(bytes);
  }
};

}
}

#endif
