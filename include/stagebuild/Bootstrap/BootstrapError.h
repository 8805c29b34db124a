//===- BootstrapError.h -----------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_BOOTSTRAPERROR_H
#define STAGEBUILD_BOOTSTRAP_BOOTSTRAPERROR_H

#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <string>

namespace stagebuild {
namespace bootstrap {

/// The classes of failure a bootstrap run distinguishes.
enum class ErrorKind {
  /// A snapshot download failed, after exhausting its retries.
  Network,

  /// A downloaded snapshot did not match its manifest checksum.
  ChecksumMismatch,

  /// The platform is unknown, or has no usable snapshot.
  PlatformUnsupported,

  /// The toolchain reported a compile error.
  Compile,

  /// The toolchain crashed, was killed, timed out or could not be spawned.
  Process,

  /// A cache entry was found damaged and the rebuild did not recover it.
  CacheCorruption,

  /// A stage recompiling itself produced a different artifact.
  FixedPointMismatch,

  /// The configuration, manifest or command line is invalid.
  InvalidConfiguration,

  /// A local file system or database operation failed.
  IO,

  /// The run was interrupted.
  Cancelled,
};

/// Get the name used when printing \p kind.
StringRef getErrorKindName(ErrorKind kind);

/// Get the process exit code a failure of \p kind maps to.
int getExitCodeForErrorKind(ErrorKind kind);

/// Combine two exit codes, keeping the most severe.
///
/// Cancellation (130) wins over everything, then 4 > 3 > 2 > 1 > 0.
int mergeExitCodes(int lhs, int rhs);

/// Where in a run an error occurred.
struct ErrorContext {
  Optional<unsigned> stage;
  std::string platform;
  std::string fingerprint;

  bool empty() const {
    return !stage.hasValue() && platform.empty() && fingerprint.empty();
  }
};

/// The error payload carried by every `llvm::Error` the bootstrap layer
/// produces.
class BootstrapError : public llvm::ErrorInfo<BootstrapError> {
  ErrorKind kind;
  std::string message;
  ErrorContext context;

public:
  static char ID;

  BootstrapError(ErrorKind kind, const Twine& message,
                 ErrorContext context = {})
      : kind(kind), message(message.str()), context(std::move(context)) {}

  ErrorKind getKind() const { return kind; }
  const std::string& getMessage() const { return message; }
  const ErrorContext& getContext() const { return context; }

  int getExitCode() const { return getExitCodeForErrorKind(kind); }

  void log(raw_ostream& os) const override;

  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }
};

/// Create an error with the given kind and message.
inline llvm::Error makeError(ErrorKind kind, const Twine& message,
                             ErrorContext context = {}) {
  return llvm::make_error<BootstrapError>(kind, message, std::move(context));
}

/// A consumed error, flattened for reporting.
struct ErrorDescription {
  ErrorKind kind = ErrorKind::IO;
  std::string message;
  ErrorContext context;

  /// Get the message followed by its context, as \see BootstrapError logs it.
  std::string str() const;
};

/// Consume \p error and describe it.
///
/// Errors which do not carry a \see BootstrapError payload are reported as
/// ErrorKind::IO.
ErrorDescription describeError(llvm::Error error);

/// Attach \p context to \p error where it does not already carry one.
llvm::Error addErrorContext(llvm::Error error, const ErrorContext& context);

}
}

#endif
