//===-- Subprocess.cpp ----------------------------------------------------===//
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

#include "stagebuild/Basic/Subprocess.h"

#include "stagebuild/Basic/CrossPlatformCompatibility.h"
#include "stagebuild/Basic/PlatformUtility.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"

#include <cassert>
#include <cerrno>
#include <chrono>
#include <memory>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#ifndef __GLIBC_PREREQ
#define __GLIBC_PREREQ(maj, min) 0
#endif

static int posix_spawn_file_actions_addchdir_polyfill(
    posix_spawn_file_actions_t * __restrict file_actions,
    const char * __restrict path) {
#if (defined(__GLIBC__) && !__GLIBC_PREREQ(2, 29))
  // Glibc versions prior to 2.29 don't support
  // posix_spawn_file_actions_addchdir_np.
  return ENOSYS;
#elif defined(__GLIBC__) || defined(__APPLE__) || defined(__FreeBSD__) || defined(__musl__)
  return posix_spawn_file_actions_addchdir_np(file_actions, path);
#else
  return posix_spawn_file_actions_addchdir(file_actions, path);
#endif
}

using namespace stagebuild;
using namespace stagebuild::basic;

ProcessDelegate::~ProcessDelegate() {
}


ProcessGroup::~ProcessGroup() {
  // Wait for all processes in the process group to terminate
  std::unique_lock<std::mutex> lock(mutex);
  while (!processes.empty()) {
    processesCondition.wait(lock);
  }
}

void ProcessGroup::signalAll(int signal) {
  std::lock_guard<std::mutex> lock(mutex);

  for (const auto& it: processes) {
    // If we are interrupting, only interupt processes which are believed to
    // be safe to interrupt.
    if (signal == SIGINT && !it.second.canSafelyInterrupt)
      continue;

    // We are killing the whole process group here, this depends on us
    // spawning each process in its own group earlier.
    ::kill(-it.first, signal);
  }
}

/// Remember to automatically close the descriptor when it goes out of scope.
/// This helps to keep the file descriptor alive until forwarded to the process.
/// After that we don't need to keep it around.
class ManagedDescriptor {
public:

  /// A short-hand type for a platform-independent descriptor.
  using FileDescriptor = sys::FileDescriptorTraits<>::DescriptorType;

private:
  /// Open the trait namespace to shorten the code.
  using fdTraits = sys::FileDescriptorTraits<>;

  /// Underlying file descriptor.
  FileDescriptor _descriptor = fdTraits::InvalidDescriptor;

public:

  /// Create the descriptor which doesn't describe anything.
  ManagedDescriptor() : _descriptor(fdTraits::InvalidDescriptor) { }

  /// Must not ever copy to avoid double-closure.
  ManagedDescriptor(const ManagedDescriptor &) STAGEBUILD_DELETED_FUNCTION;
  void operator=(const ManagedDescriptor &) STAGEBUILD_DELETED_FUNCTION;

  ~ManagedDescriptor() {
    close();
  }

  /// Copy the underlying descriptor out.
  FileDescriptor unsafeDescriptor() const {
    return _descriptor;
  }

  /// Whether descriptor has been initialized to a valid value and not closed.
  bool isValid() const {
    return fdTraits::IsValid(_descriptor);
  }

  /// Replace the existing descriptor with a given one,
  /// invalidating the passed descriptor.
  ManagedDescriptor &reset(FileDescriptor &fd) {
    close();
    _descriptor = fd;
    fd = fdTraits::InvalidDescriptor;
    return *this;
  }

  /// Set inheritability of a given file descriptor.
  /// true  - Ensure the descriptor is inherited by the child process.
  /// false - Prevent leaking the descriptor into a child process.
  ManagedDescriptor &childMayInherit(bool yes) {
    if (!isValid()) {
      return *this;
    }

    auto fd = _descriptor;
    if (yes) {
      fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) & ~FD_CLOEXEC);
    } else {
      fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | FD_CLOEXEC);
    }
    return *this;
  }

  /// Explicitly close the descriptor.
  bool close() {
    if (!isValid()) {
      return false;
    }

    auto fd = _descriptor;
    _descriptor = fdTraits::InvalidDescriptor;
    fdTraits::Close(fd);
    return true;
  }
};

// Helper function for cleaning up after a process has finished in
// spawnProcess
static void cleanUpExecutedProcess(ProcessDelegate& delegate,
                                   ProcessGroup& pgrp, stagebuild_pid_t pid,
                                   ProcessHandle handle, ProcessContext* ctx,
                                   bool timedOut,
                                   ProcessCompletionFn&& completionFn) {
  // Wait for the command to complete.
  struct rusage usage;
  int status, result = wait4(pid, &status, 0, &usage);
  while (result == -1 && errno == EINTR)
    result = wait4(pid, &status, 0, &usage);

  // Update the set of spawned processes.
  pgrp.remove(pid);

  if (result == -1) {
    auto result = ProcessResult::makeFailed();
    delegate.processHadError(ctx, handle,
                             Twine("unable to wait for process (") +
                                 sys::strerror(errno) + ")");
    delegate.processFinished(ctx, handle, result);
    completionFn(result);
    return;
  }

  // We report additional info in the tracing interval
  //   - user time, in µs
  //   - sys time, in µs
  //   - memory usage, in bytes
  uint64_t utime = (uint64_t(usage.ru_utime.tv_sec) * 1000000 +
                    uint64_t(usage.ru_utime.tv_usec));
  uint64_t stime = (uint64_t(usage.ru_stime.tv_sec) * 1000000 +
                    uint64_t(usage.ru_stime.tv_usec));

  bool wasClosed;
  {
    std::lock_guard<std::mutex> guard(pgrp.mutex);
    wasClosed = pgrp.isClosed();
  }

  // Notify of the process completion.
  int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  int signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  ProcessStatus processStatus;
  if (timedOut) {
    processStatus = ProcessStatus::TimedOut;
  } else if (signal != 0 && wasClosed) {
    processStatus = ProcessStatus::Cancelled;
  } else if (exitCode == 0) {
    processStatus = ProcessStatus::Succeeded;
  } else {
    processStatus = ProcessStatus::Failed;
  }
  ProcessResult processResult(processStatus, exitCode, pid, utime, stime,
                              // ru_maxrss is in kilobytes on Linux.
                              uint64_t(usage.ru_maxrss) * 1024);
  processResult.signal = signal;
  delegate.processFinished(ctx, handle, processResult);
  completionFn(processResult);
}

void stagebuild::basic::spawnProcess(
    ProcessDelegate& delegate,
    ProcessContext* ctx,
    ProcessGroup& pgrp,
    ProcessHandle handle,
    ArrayRef<StringRef> commandLine,
    POSIXEnvironment environment,
    ProcessAttributes attr,
    ProcessCompletionFn&& completionFn
) {
  stagebuild_pid_t pid = (stagebuild_pid_t)-1;

  if (commandLine.size() == 0) {
    auto result = ProcessResult::makeFailed();
    delegate.processStarted(ctx, handle, pid);
    delegate.processHadError(ctx, handle, Twine("no arguments for command"));
    delegate.processFinished(ctx, handle, result);
    completionFn(result);
    return;
  }

  // Form the complete C string command line.
  std::vector<std::string> argsStorage;
  for (auto arg: commandLine)
    argsStorage.push_back(arg.str());
  std::vector<const char*> args(argsStorage.size() + 1);
  for (size_t i = 0; i != argsStorage.size(); ++i) {
    args[i] = argsStorage[i].c_str();
  }
  args[argsStorage.size()] = nullptr;

  // Initialize the spawn attributes.
  posix_spawnattr_t attributes;
  posix_spawnattr_init(&attributes);

  // Unmask all signals.
  sigset_t noSignals;
  sigemptyset(&noSignals);
  posix_spawnattr_setsigmask(&attributes, &noSignals);

  // Reset all signals to default behavior.
  //
  // On Linux, this can only be used to reset signals that are legal to
  // modify, so we have to take care about the set we use.
#if defined(__linux__)
  sigset_t mostSignals;
  sigemptyset(&mostSignals);
  for (int i = 1; i < SIGSYS; ++i) {
    if (i == SIGKILL || i == SIGSTOP) continue;
    sigaddset(&mostSignals, i);
  }
  posix_spawnattr_setsigdefault(&attributes, &mostSignals);
#else
  sigset_t mostSignals;
  sigfillset(&mostSignals);
  sigdelset(&mostSignals, SIGKILL);
  sigdelset(&mostSignals, SIGSTOP);
  posix_spawnattr_setsigdefault(&attributes, &mostSignals);
#endif

  // Establish a separate process group.
  posix_spawnattr_setpgroup(&attributes, 0);

  // Set the attribute flags.
  posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGMASK |
                                        POSIX_SPAWN_SETSIGDEF |
                                        POSIX_SPAWN_SETPGROUP);

  // Setup the file actions.
  posix_spawn_file_actions_t fileActions;
  posix_spawn_file_actions_init(&fileActions);

  bool workingDirectoryUnsupported = false;
  const auto workingDir = attr.workingDir.str();
  if (!workingDir.empty() &&
      posix_spawn_file_actions_addchdir_polyfill(
          &fileActions, workingDir.c_str()) == ENOSYS) {
    workingDirectoryUnsupported = true;
  }

  // Open /dev/null as stdin.
  posix_spawn_file_actions_addopen(&fileActions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);

  // The parent end of the output pipe is retained and read by the parent.
  ManagedDescriptor outputPipeParentEnd;

  // Resolve the executable path, if necessary. Names with a path separator
  // are used as given.
  //
  // FIXME: This should be cached.
  if (StringRef(argsStorage[0]).find('/') == StringRef::npos) {
    StringRef searchPath;
    if (auto path = environment.get("PATH"))
      searchPath = *path;
    SmallVector<StringRef, 8> searchPaths;
    if (!searchPath.empty())
      searchPath.split(searchPaths, ':', -1, /*KeepEmpty=*/false);
    auto res = llvm::sys::findProgramByName(argsStorage[0], searchPaths);
    if (!res.getError()) {
      argsStorage[0] = *res;
      args[0] = argsStorage[0].c_str();
    }
  }

  // Spawn the command.
  bool wasCancelled;
  do {
    // We need to hold the spawn processes lock when we spawn, to ensure that
    // we don't create a process in between when we are cancelled.
    std::lock_guard<std::mutex> guard(pgrp.mutex);
    wasCancelled = pgrp.isClosed();

    // If we have been cancelled since we started, skip startup.
    if (wasCancelled) { break; }

    // Open the output pipe under the mutex to avoid leaking the wrong end into
    // other children started concurrently.
    ManagedDescriptor outputPipeChildEnd;
    int outputPipe[2]{ -1, -1 };
    if (basic::sys::pipe(outputPipe) < 0) {
      int err = errno;
      posix_spawn_file_actions_destroy(&fileActions);
      posix_spawnattr_destroy(&attributes);
      delegate.processStarted(ctx, handle, pid);
      delegate.processHadError(ctx, handle,
          Twine("unable to open output pipe (") + sys::strerror(err) + ")");
      delegate.processFinished(ctx, handle, ProcessResult::makeFailed());
      completionFn(ProcessResult(ProcessStatus::Failed));
      return;
    }
    outputPipeParentEnd.reset(outputPipe[0]).childMayInherit(false);
    outputPipeChildEnd.reset(outputPipe[1]);

    // Open the write end of the pipe as stdout and stderr.
    posix_spawn_file_actions_adddup2(
        &fileActions, outputPipeChildEnd.unsafeDescriptor(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(
        &fileActions, outputPipeChildEnd.unsafeDescriptor(), STDERR_FILENO);

    // Close the child end of the pipe known under a different number.
    posix_spawn_file_actions_addclose(&fileActions,
                                      outputPipeChildEnd.unsafeDescriptor());

    int result = -1;
    if (!workingDirectoryUnsupported) {
      result = posix_spawn(&pid, args[0], /*file_actions=*/&fileActions,
                           /*attrp=*/&attributes,
                           const_cast<char**>(args.data()),
                           const_cast<char* const*>(environment.getEnvp()));
    }

    delegate.processStarted(ctx, handle, pid);

    if (result != 0) {
      auto processResult = ProcessResult::makeFailed();
      delegate.processHadError(
          ctx, handle,
          workingDirectoryUnsupported
              ? Twine("working-directory unsupported on this platform")
              : Twine("unable to spawn process '") + argsStorage[0] + "' (" +
                    sys::strerror(result) + ")");
      delegate.processFinished(ctx, handle, processResult);
      pid = (stagebuild_pid_t)-1;
    } else {
      ProcessInfo info{ attr.canSafelyInterrupt };
      pgrp.add(std::move(guard), pid, info);
    }

    // Close the child end of the forwarded output pipe.
    outputPipeChildEnd.close();
  } while(false);

  posix_spawn_file_actions_destroy(&fileActions);
  posix_spawnattr_destroy(&attributes);

  // If we failed to launch a process, clean up and abort.
  if (pid == (stagebuild_pid_t)-1) {
    outputPipeParentEnd.close();
    if (wasCancelled) {
      // Preserve the started/finished pairing for the delegate.
      delegate.processStarted(ctx, handle, pid);
      delegate.processFinished(ctx, handle, ProcessResult::makeCancelled());
    }
    auto result = wasCancelled ? ProcessResult::makeCancelled()
                               : ProcessResult::makeFailed();
    completionFn(result);
    return;
  }

  // Read the merged output until EOF, enforcing the deadline if there is one.
  typedef std::chrono::steady_clock Clock;
  bool hasDeadline = attr.timeoutMilliseconds != 0;
  Clock::time_point deadline =
      Clock::now() + std::chrono::milliseconds(attr.timeoutMilliseconds);
  bool timedOut = false;

  pollfd readfd = { outputPipeParentEnd.unsafeDescriptor(), POLLIN, 0 };
  while (true) {
    int timeout = -1;
    if (hasDeadline && !timedOut) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - Clock::now()).count();
      timeout = remaining > 0 ? int(remaining) : 0;
    }

    int ready = poll(&readfd, 1, timeout);
    if (ready == -1) {
      int err = errno;
      if (err == EAGAIN || err == EINTR)
        continue;
      delegate.processHadError(ctx, handle,
                               Twine("failed to poll (") +
                                   sys::strerror(err) + ")");
      break;
    }

    if (ready == 0) {
      // The deadline passed; kill the whole group and drain what is left.
      timedOut = true;
      ::kill(-pid, SIGKILL);
      continue;
    }

    char buf[4096];
    ssize_t numBytes = sys::read(readfd.fd, buf, sizeof(buf));
    if (numBytes < 0) {
      int err = errno;
      if (err == EINTR)
        continue;
      delegate.processHadError(ctx, handle,
                               Twine("unable to read process output (") +
                                   sys::strerror(err) + ")");
      break;
    }
    if (numBytes == 0)
      break;

    // Notify the client of the output.
    delegate.processHadOutput(ctx, handle, StringRef(buf, numBytes));
  }

  // We have receieved the zero byte read that indicates an EOF.
  outputPipeParentEnd.close();
  cleanUpExecutedProcess(delegate, pgrp, pid, handle, ctx, timedOut,
                         std::move(completionFn));
}

#pragma mark - Collecting Execution

namespace {

/// Delegate which buffers everything a single process reports.
class CollectingProcessDelegate : public ProcessDelegate {
public:
  std::string* output;
  std::string* errors;

  CollectingProcessDelegate(std::string* output, std::string* errors)
      : output(output), errors(errors) {}

  virtual void processStarted(ProcessContext*, ProcessHandle,
                              stagebuild_pid_t) override {}

  virtual void processHadError(ProcessContext*, ProcessHandle,
                               const Twine& message) override {
    if (!errors)
      return;
    if (!errors->empty())
      *errors += "\n";
    *errors += message.str();
  }

  virtual void processHadOutput(ProcessContext*, ProcessHandle,
                                StringRef data) override {
    if (output)
      *output += data.str();
  }

  virtual void processFinished(ProcessContext*, ProcessHandle,
                               const ProcessResult&) override {}
};

}

ProcessResult stagebuild::basic::executeProcessAndCollect(
    ProcessGroup& pgrp, ArrayRef<StringRef> commandLine,
    POSIXEnvironment environment, ProcessAttributes attributes,
    std::string* output, std::string* errors) {
  CollectingProcessDelegate delegate(output, errors);
  ProcessResult result(ProcessStatus::Failed);
  spawnProcess(delegate, /*ctx=*/nullptr, pgrp, ProcessHandle{ 0 },
               commandLine, std::move(environment), attributes,
               [&](ProcessResult processResult) { result = processResult; });
  return result;
}
