//===-- OrchestratorTrace.cpp ---------------------------------------------===//
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

#include "OrchestratorTrace.h"

#include <cassert>
#include <cstdio>
#include <cstring>

#include <errno.h>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

/// Quote \p value as a JSON string.
static std::string quoted(StringRef value) {
  std::string result = "\"";
  for (char c: value) {
    switch (c) {
    case '"': result += "\\\""; break;
    case '\\': result += "\\\\"; break;
    case '\n': result += "\\n"; break;
    case '\t': result += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buffer[8];
        snprintf(buffer, sizeof(buffer), "\\u%04x", c);
        result += buffer;
      } else {
        result += c;
      }
    }
  }
  result += "\"";
  return result;
}

OrchestratorTrace::OrchestratorTrace() {}

OrchestratorTrace::~OrchestratorTrace() {
  if (isOpen()) {
    std::string error;
    if (!close(&error))
      fprintf(stderr, "stagebuild: unable to write trace: %s\n",
              error.c_str());
  }
}

bool OrchestratorTrace::open(const std::string& filename,
                             std::string* error_out) {
  assert(!isOpen());

  FILE *fp = fopen(filename.c_str(), "wb");
  if (!fp) {
    *error_out = "unable to open '" + filename + "' (" +
      ::strerror(errno) + ")";
    return false;
  }
  outputPtr = fp;
  assert(isOpen());

  // Write the opening header.
  fprintf(fp, "[\n");
  return true;
}

bool OrchestratorTrace::close(std::string* error_out) {
  assert(isOpen());

  FILE *fp = static_cast<FILE*>(outputPtr);

  // Write the footer.
  fprintf(fp, "{ \"trace-ended\" }\n]\n");

  bool success = fclose(fp) == 0;
  outputPtr = nullptr;
  assert(!isOpen());

  if (!success) {
    *error_out = "unable to close file";
    return false;
  }

  return true;
}

#pragma mark - Tracing APIs

void OrchestratorTrace::runStarted(StringRef action) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"run-started\", %s },\n", quoted(action).c_str());
}

void OrchestratorTrace::stateChanged(StringRef state, unsigned stage) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"state-changed\", %s, %u },\n", quoted(state).c_str(),
          stage);
}

void OrchestratorTrace::stepPlanned(unsigned index, StringRef name,
                                    StringRef fingerprint) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"step-planned\", \"S%u\", %s, %s },\n", index,
          quoted(name).c_str(), quoted(fingerprint).c_str());
}

void OrchestratorTrace::stepStarted(unsigned index) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"step-started\", \"S%u\" },\n", index);
}

void OrchestratorTrace::stepFinished(unsigned index, StringRef outcome) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"step-finished\", \"S%u\", %s },\n", index,
          quoted(outcome).c_str());
}

void OrchestratorTrace::cacheEntryCorrupted(StringRef fingerprint,
                                            StringRef reason) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"cache-entry-corrupted\", %s, %s },\n",
          quoted(fingerprint).c_str(), quoted(reason).c_str());
}

void OrchestratorTrace::errorRecorded(StringRef kind, StringRef message) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"error\", %s, %s },\n", quoted(kind).c_str(),
          quoted(message).c_str());
}

void OrchestratorTrace::runEnded(int exitCode) {
  FILE *fp = static_cast<FILE*>(outputPtr);

  fprintf(fp, "{ \"run-ended\", %d },\n", exitCode);
}
