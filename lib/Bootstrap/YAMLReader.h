//===- YAMLReader.h ---------------------------------------------*- C++ -*-===//
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
//
// Private helpers shared by the configuration and snapshot manifest loaders.
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_BOOTSTRAP_YAMLREADER_H
#define STAGEBUILD_BOOTSTRAP_YAMLREADER_H

#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/BootstrapError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"

#include <memory>
#include <string>
#include <vector>

namespace stagebuild {
namespace bootstrap {

/// Reads a single YAML document, recording the first diagnostic as
/// `path:line:column: message`.
class YAMLReader {
  llvm::SourceMgr sourceMgr;
  std::string path;
  std::string firstError;
  std::unique_ptr<llvm::yaml::Stream> stream;

  static void diagnosticHandler(const llvm::SMDiagnostic& diag, void* context);

public:
  YAMLReader(StringRef contents, StringRef path);
  ~YAMLReader();

  /// Parse the single document in the stream and pass its root to \p body.
  ///
  /// \returns True if no error was reported.
  bool readDocument(llvm::function_ref<void(llvm::yaml::Node*)> body);

  /// Report an error at \p node.
  void error(llvm::yaml::Node* node, const Twine& message);

  /// Report an error without a location.
  void error(const Twine& message);

  bool hadError() const { return !firstError.empty(); }

  /// Get the first error as a BootstrapError of kind \p kind.
  llvm::Error takeError(ErrorKind kind = ErrorKind::InvalidConfiguration);

  static std::string stringFromScalarNode(llvm::yaml::ScalarNode* scalar);

  /// @name Typed Value Readers
  ///
  /// Each reader reports an error naming \p key and returns false if the
  /// node does not have the expected form.
  /// @{

  bool readString(llvm::yaml::Node* node, StringRef key, std::string& result);
  bool readUnsigned(llvm::yaml::Node* node, StringRef key, unsigned& result);
  bool readBool(llvm::yaml::Node* node, StringRef key, bool& result);
  bool readStringList(llvm::yaml::Node* node, StringRef key,
                      std::vector<std::string>& result);

  /// @}
};

}
}

#endif
