//===- OrchestratorTrace.h --------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_ORCHESTRATORTRACE_H
#define STAGEBUILD_BOOTSTRAP_ORCHESTRATORTRACE_H

#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace stagebuild {
namespace bootstrap {


/// This class assists in writing orchestrator tracing information to an
/// external log file, suitable for ex post facto debugging and analysis.
class OrchestratorTrace {
    /// The output file pointer.
    void* outputPtr = nullptr;

public:
    OrchestratorTrace();
    ~OrchestratorTrace();

    /// Open an output file for writing, must be called prior to any trace
    /// recording, and may only be called once per trace object.
    ///
    /// \returns True on success.
    bool open(const std::string& path, std::string* error_out);

    /// Close the output file; no subsequest trace recording may be done.
    ///
    /// \returns True on success.
    bool close(std::string* error_out);

    /// Check if the trace output is open.
    bool isOpen() const { return outputPtr != nullptr; }

    /// @name Trace Recording APIs
    /// @{

    void runStarted(StringRef action);
    void stateChanged(StringRef state, unsigned stage);
    void stepPlanned(unsigned index, StringRef name, StringRef fingerprint);
    void stepStarted(unsigned index);
    void stepFinished(unsigned index, StringRef outcome);
    void cacheEntryCorrupted(StringRef fingerprint, StringRef reason);
    void errorRecorded(StringRef kind, StringRef message);
    void runEnded(int exitCode);

    /// @}
};

}
}

#endif
