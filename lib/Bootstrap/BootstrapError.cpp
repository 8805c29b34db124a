//===-- BootstrapError.cpp ------------------------------------------------===//
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

#include "stagebuild/Bootstrap/BootstrapError.h"

#include "llvm/Support/raw_ostream.h"

using namespace stagebuild;
using namespace stagebuild::bootstrap;

char BootstrapError::ID = 0;

StringRef bootstrap::getErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Network: return "network error";
  case ErrorKind::ChecksumMismatch: return "checksum mismatch";
  case ErrorKind::PlatformUnsupported: return "unsupported platform";
  case ErrorKind::Compile: return "compile error";
  case ErrorKind::Process: return "process error";
  case ErrorKind::CacheCorruption: return "cache corruption";
  case ErrorKind::FixedPointMismatch: return "fixed point mismatch";
  case ErrorKind::InvalidConfiguration: return "invalid configuration";
  case ErrorKind::IO: return "i/o error";
  case ErrorKind::Cancelled: return "cancelled";
  }
  return "unknown error";
}

int bootstrap::getExitCodeForErrorKind(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Compile:
  case ErrorKind::Process:
  case ErrorKind::IO:
    return 1;
  case ErrorKind::Network:
    return 2;
  case ErrorKind::ChecksumMismatch:
  case ErrorKind::CacheCorruption:
  case ErrorKind::FixedPointMismatch:
    return 3;
  case ErrorKind::PlatformUnsupported:
  case ErrorKind::InvalidConfiguration:
    return 4;
  case ErrorKind::Cancelled:
    return 130;
  }
  return 1;
}

static unsigned getExitCodeSeverity(int code) {
  switch (code) {
  case 0: return 0;
  case 1: return 1;
  case 2: return 2;
  case 3: return 3;
  case 4: return 4;
  case 130: return 5;
  default: return 1;
  }
}

int bootstrap::mergeExitCodes(int lhs, int rhs) {
  return getExitCodeSeverity(rhs) > getExitCodeSeverity(lhs) ? rhs : lhs;
}

void BootstrapError::log(raw_ostream& os) const {
  os << message;
  if (context.empty())
    return;

  os << " [";
  bool first = true;
  if (context.stage.hasValue()) {
    os << "stage " << context.stage.getValue();
    first = false;
  }
  if (!context.platform.empty()) {
    if (!first) os << ", ";
    os << context.platform;
    first = false;
  }
  if (!context.fingerprint.empty()) {
    if (!first) os << ", ";
    // The short form is enough to find the cache entry.
    os << "fingerprint " << StringRef(context.fingerprint).take_front(12);
  }
  os << "]";
}

std::string ErrorDescription::str() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  BootstrapError(kind, message, context).log(os);
  return os.str();
}

ErrorDescription bootstrap::describeError(llvm::Error error) {
  ErrorDescription result;
  llvm::handleAllErrors(
      std::move(error),
      [&](const BootstrapError& err) {
        result.kind = err.getKind();
        result.message = err.getMessage();
        result.context = err.getContext();
      },
      [&](const llvm::ErrorInfoBase& err) {
        result.kind = ErrorKind::IO;
        result.message = err.message();
      });
  return result;
}

llvm::Error bootstrap::addErrorContext(llvm::Error error,
                                       const ErrorContext& context) {
  if (!error)
    return error;

  ErrorDescription description = describeError(std::move(error));
  if (!description.context.stage.hasValue())
    description.context.stage = context.stage;
  if (description.context.platform.empty())
    description.context.platform = context.platform;
  if (description.context.fingerprint.empty())
    description.context.fingerprint = context.fingerprint;
  return makeError(description.kind, description.message,
                   std::move(description.context));
}
