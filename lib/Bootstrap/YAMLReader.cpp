//===-- YAMLReader.cpp ----------------------------------------------------===//
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

#include "YAMLReader.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Casting.h"

using namespace stagebuild;
using namespace stagebuild::bootstrap;

YAMLReader::YAMLReader(StringRef contents, StringRef path)
    : path(path.str())
{
  sourceMgr.setDiagHandler(&YAMLReader::diagnosticHandler, this);
  stream.reset(new llvm::yaml::Stream(contents, sourceMgr,
                                      /*ShowColors=*/false));
}

YAMLReader::~YAMLReader() {}

void YAMLReader::diagnosticHandler(const llvm::SMDiagnostic& diag,
                                   void* context) {
  auto& reader = *static_cast<YAMLReader*>(context);
  if (!reader.firstError.empty())
    return;

  std::string location = reader.path;
  if (diag.getLineNo() > 0) {
    location += ":" + std::to_string(diag.getLineNo()) + ":" +
      std::to_string(diag.getColumnNo() + 1);
  }
  reader.firstError = location + ": " + diag.getMessage().str();
}

bool YAMLReader::readDocument(
    llvm::function_ref<void(llvm::yaml::Node*)> body) {
  auto it = stream->begin();
  if (it == stream->end()) {
    error("missing document in stream");
    return false;
  }

  llvm::yaml::Node* root = it->getRoot();
  if (!root || stream->failed() || hadError()) {
    if (!hadError())
      error("unable to parse document");
    return false;
  }
  body(root);
  if (hadError())
    return false;

  // Consume the rest of the document, which reports any trailing syntax
  // errors.
  ++it;
  if (stream->failed() || hadError()) {
    if (!hadError())
      error("unable to parse document");
    return false;
  }
  if (it != stream->end()) {
    error("unexpected additional document in stream");
    return false;
  }

  return true;
}

void YAMLReader::error(llvm::yaml::Node* node, const Twine& message) {
  sourceMgr.PrintMessage(node->getSourceRange().Start,
                         llvm::SourceMgr::DK_Error, message);
}

void YAMLReader::error(const Twine& message) {
  if (firstError.empty())
    firstError = path + ": " + message.str();
}

llvm::Error YAMLReader::takeError(ErrorKind kind) {
  std::string message = firstError.empty() ? path + ": invalid document"
                                           : firstError;
  firstError.clear();
  return makeError(kind, message);
}

std::string YAMLReader::stringFromScalarNode(llvm::yaml::ScalarNode* scalar) {
  SmallString<256> storage;
  return scalar->getValue(storage).str();
}

bool YAMLReader::readString(llvm::yaml::Node* node, StringRef key,
                            std::string& result) {
  auto scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(node);
  if (!scalar) {
    error(node, "invalid value for '" + key + "' (expected string)");
    return false;
  }
  result = stringFromScalarNode(scalar);
  return true;
}

bool YAMLReader::readUnsigned(llvm::yaml::Node* node, StringRef key,
                              unsigned& result) {
  std::string value;
  if (!readString(node, key, value))
    return false;
  if (StringRef(value).getAsInteger(10, result)) {
    error(node, "invalid value '" + value + "' for '" + key.str() +
          "' (expected non-negative integer)");
    return false;
  }
  return true;
}

bool YAMLReader::readBool(llvm::yaml::Node* node, StringRef key,
                          bool& result) {
  std::string value;
  if (!readString(node, key, value))
    return false;
  if (value == "true" || value == "yes") {
    result = true;
  } else if (value == "false" || value == "no") {
    result = false;
  } else {
    error(node, "invalid value '" + value + "' for '" + key.str() +
          "' (expected boolean)");
    return false;
  }
  return true;
}

bool YAMLReader::readStringList(llvm::yaml::Node* node, StringRef key,
                                std::vector<std::string>& result) {
  auto sequence = llvm::dyn_cast<llvm::yaml::SequenceNode>(node);
  if (!sequence) {
    error(node, "invalid value for '" + key + "' (expected list)");
    return false;
  }
  result.clear();
  for (auto& item: *sequence) {
    std::string value;
    if (!readString(&item, key, value))
      return false;
    result.push_back(std::move(value));
  }
  return true;
}
