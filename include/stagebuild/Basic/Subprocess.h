//===- Subprocess.h ---------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2018 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_BASIC_SUBPROCESS_H
#define STAGEBUILD_BASIC_SUBPROCESS_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/CrossPlatformCompatibility.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Basic/POSIXEnvironment.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <inttypes.h>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stagebuild {
  namespace basic {

    // MARK: Process Info

    /// Handle used to communicate information about a launched process.
    struct ProcessHandle {
      /// Opaque ID.
      uint64_t id;
    };

    struct ProcessInfo {
      /// Whether the process can be safely interrupted.
      bool canSafelyInterrupt;
    };


    // MARK: Process Group

    /// The set of processes spawned on behalf of one client.
    ///
    /// Every process is spawned as the leader of its own POSIX process group,
    /// so signalling it reaches any children it started as well.
    class ProcessGroup {
      ProcessGroup(const ProcessGroup&) STAGEBUILD_DELETED_FUNCTION;
      void operator=(const ProcessGroup&) STAGEBUILD_DELETED_FUNCTION;
      ProcessGroup& operator=(ProcessGroup&&) STAGEBUILD_DELETED_FUNCTION;

      std::unordered_map<stagebuild_pid_t, ProcessInfo> processes;
      std::condition_variable processesCondition;
      bool closed = false;

    public:
      ProcessGroup() {}
      ~ProcessGroup();

      std::mutex mutex;

      /// Prevent any further processes from being spawned in this group.
      ///
      /// The caller must hold \see mutex.
      void close() { closed = true; }
      bool isClosed() const { return closed; }

      void add(std::lock_guard<std::mutex>&& lock, stagebuild_pid_t pid,
               ProcessInfo info) {
        processes.emplace(std::make_pair(pid, info));
      }

      void remove(stagebuild_pid_t pid) {
        {
          std::lock_guard<std::mutex> lock(mutex);
          processes.erase(pid);
        }
        processesCondition.notify_all();
      }

      /// Send \p signal to every live process (group) in this group.
      void signalAll(int signal);

      /// Check whether any processes are running.
      bool empty() {
        std::lock_guard<std::mutex> lock(mutex);
        return processes.empty();
      }
    };


    // MARK: Process Execution

    /// Status of a process execution.
    enum class ProcessStatus {
      Succeeded = 0,
      Failed,
      Cancelled,
      TimedOut,
    };

    /// Result of a process execution.
    struct ProcessResult {

      /// The final status of the command
      ProcessStatus status;

      /// Process exit code, if it exited normally (or -1).
      int exitCode;

      /// The signal which terminated the process, or 0.
      int signal;

      /// Process identifier (can be -1 for failure reasons)
      stagebuild_pid_t pid;

      /// User time (in us)
      uint64_t utime;

      /// System time (in us)
      uint64_t stime;

      /// Max RSS (in bytes)
      uint64_t maxrss;

      ProcessResult(ProcessStatus status, int exitCode = -1,
                    stagebuild_pid_t pid = (stagebuild_pid_t)-1,
                    uint64_t utime = 0, uint64_t stime = 0,
                    uint64_t maxrss = 0)
          : status(status), exitCode(exitCode), signal(0), pid(pid),
            utime(utime), stime(stime), maxrss(maxrss) {}

      static ProcessResult makeFailed(int exitCode = -1) {
        return ProcessResult(ProcessStatus::Failed, exitCode);
      }

      static ProcessResult makeCancelled(int exitCode = -1) {
        return ProcessResult(ProcessStatus::Cancelled, exitCode);
      }
    };


    typedef std::function<void(ProcessResult)> ProcessCompletionFn;


    /// Opaque context passed on to the delegate
    struct ProcessContext;

    /// Delegate interface for process execution.
    ///
    /// All delegate interfaces are invoked synchronously by the subprocess
    /// methods and should defer any long running operations to avoid blocking
    /// the caller unnecessarily.
    ///
    /// NOTE: The delegate *MUST* be thread-safe with respect to all calls,
    /// which will arrive concurrently and without any specified thread.
    class ProcessDelegate {
      // DO NOT COPY
      ProcessDelegate(const ProcessDelegate&) STAGEBUILD_DELETED_FUNCTION;
      void operator=(const ProcessDelegate&) STAGEBUILD_DELETED_FUNCTION;
      ProcessDelegate& operator=(ProcessDelegate&& rhs)
          STAGEBUILD_DELETED_FUNCTION;

    public:
      ProcessDelegate() {}
      virtual ~ProcessDelegate();

      /// Called when the external process has started executing.
      ///
      /// The subprocess code guarantees that any processStarted() call will be
      /// paired with exactly one \see processFinished() call.
      ///
      /// \param ctx - Opaque context passed on to the delegate
      /// \param handle - A unique handle used in subsequent delegate calls to
      /// identify the process.
      /// \param pid - The process identifier, or -1 if the process could not
      /// be spawned.
      virtual void processStarted(ProcessContext* ctx, ProcessHandle handle,
                                  stagebuild_pid_t pid) = 0;

      /// Called to report an error in the management of a command process.
      ///
      /// \param ctx - Opaque context passed on to the delegate
      /// \param handle - The process handle.
      /// \param message - The error message.
      virtual void processHadError(ProcessContext* ctx, ProcessHandle handle,
                                   const Twine& message) = 0;

      /// Called to report a command processes' (merged) standard output and
      /// error.
      ///
      /// \param ctx - Opaque context passed on to the delegate
      /// \param handle - The process handle.
      /// \param data - The process output.
      virtual void processHadOutput(ProcessContext* ctx, ProcessHandle handle,
                                    StringRef data) = 0;

      /// Called when a command's job has finished executing an external
      /// process.
      ///
      /// \param ctx - Opaque context passed on to the delegate
      /// \param handle - The handle used to identify the process. This handle
      ///  will become invalid as soon as the client returns from this API call.
      /// \param result - Whether the process suceeded, failed or was cancelled.
      virtual void processFinished(ProcessContext* ctx, ProcessHandle handle,
                                   const ProcessResult& result) = 0;
    };


    struct ProcessAttributes {
      /// If true, whether it is safe to attempt to SIGINT the process to cancel
      /// it. If false, the process won't be interrupted during cancellation and
      /// will be given a chance to complete (if it fails to complete it will
      /// ultimately be sent a SIGKILL).
      bool canSafelyInterrupt;

      /// If set, the working directory to change into before spawning.
      StringRef workingDir = {};

      /// If non-zero, the process group is killed once the process has run for
      /// this many milliseconds, and the result has status TimedOut.
      uint64_t timeoutMilliseconds = 0;
    };

    /// Execute the given command line.
    ///
    /// This will launch and execute the given command line and wait for it to
    /// complete.
    ///
    /// \param delegate The process delegate.
    ///
    /// \param ctx The context object passed to the delegate.
    ///
    /// \param pgrp The process group in which to track this process.
    ///
    /// \param handle The handle object passed to the delegate.
    ///
    /// \param commandLine The command line to execute. A program name without
    /// a path separator is resolved by searching `PATH`.
    ///
    /// \param environment The complete environment to launch with; nothing is
    /// inherited from the calling process.
    ///
    /// \param attributes Additional attributes for the process to be spawned.
    ///
    /// \param completionFn A function run following the completion of the
    /// process, on the calling thread.
    void spawnProcess(ProcessDelegate& delegate,
                      ProcessContext* ctx,
                      ProcessGroup& pgrp,
                      ProcessHandle handle,
                      ArrayRef<StringRef> commandLine,
                      POSIXEnvironment environment,
                      ProcessAttributes attributes,
                      ProcessCompletionFn&& completionFn);

    /// Execute the given command line and wait for it, collecting its merged
    /// output into \p output and any process management errors into
    /// \p errors.
    ProcessResult executeProcessAndCollect(ProcessGroup& pgrp,
                                           ArrayRef<StringRef> commandLine,
                                           POSIXEnvironment environment,
                                           ProcessAttributes attributes,
                                           std::string* output,
                                           std::string* errors);

  }
}

#endif
