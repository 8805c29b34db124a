//===-- Hashing.cpp -------------------------------------------------------===//
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

#include "stagebuild/Basic/Hashing.h"

#include "stagebuild/Basic/PlatformUtility.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringExtras.h"

#include <cassert>
#include <cerrno>
#include <cstring>

#include <fcntl.h>

namespace stagebuild {
namespace basic {

Optional<Digest> Digest::fromHex(StringRef hex) {
  if (hex.size() != NumBytes * 2)
    return None;

  std::array<uint8_t, NumBytes> bytes;
  for (unsigned i = 0; i != NumBytes; ++i) {
    unsigned hi = llvm::hexDigitValue(hex[i * 2]);
    unsigned lo = llvm::hexDigitValue(hex[i * 2 + 1]);
    if (hi == ~0U || lo == ~0U)
      return None;
    bytes[i] = uint8_t((hi << 4) | lo);
  }
  return Digest(bytes);
}

std::string Digest::toHex() const {
  return llvm::toHex(
      StringRef(reinterpret_cast<const char*>(bytes.data()), bytes.size()),
      /*LowerCase=*/true);
}

DigestBuilder& DigestBuilder::update(ArrayRef<uint8_t> data) {
  hasher.update(data);
  return *this;
}

Digest DigestBuilder::finalize() {
  StringRef raw = hasher.final();
  assert(raw.size() == Digest::NumBytes);
  std::array<uint8_t, Digest::NumBytes> bytes;
  std::memcpy(bytes.data(), raw.data(), Digest::NumBytes);
  return Digest(bytes);
}

Digest hashBytes(StringRef data) {
  DigestBuilder builder;
  builder.update(data);
  return builder.finalize();
}

bool hashFile(StringRef path, Digest& result, std::string* error_out) {
  std::string pathStr = path.str();
  int fd = ::open(pathStr.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    *error_out = "unable to open '" + pathStr + "' (" +
      sys::strerror(errno) + ")";
    return false;
  }

  DigestBuilder builder;
  while (true) {
    char buf[65536];
    int numBytes = sys::read(fd, buf, sizeof(buf));
    if (numBytes < 0) {
      if (errno == EINTR)
        continue;
      *error_out = "unable to read '" + pathStr + "' (" +
        sys::strerror(errno) + ")";
      sys::close(fd);
      return false;
    }
    if (numBytes == 0)
      break;
    builder.update(StringRef(buf, numBytes));
  }
  sys::close(fd);

  result = builder.finalize();
  return true;
}

}
}
