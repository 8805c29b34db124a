//===-- SubprocessTest.cpp ------------------------------------------------===//
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

#include "../Bootstrap/TempDir.h"

#include "llvm/ADT/Twine.h"

#include "gtest/gtest.h"

#include <chrono>
#include <csignal>
#include <mutex>
#include <thread>

using namespace stagebuild;
using namespace stagebuild::basic;

namespace {

POSIXEnvironment makeEnvironment() {
  POSIXEnvironment env;
  env.setIfMissing("PATH", "/usr/bin:/bin");
  return env;
}

class RecordingDelegate : public ProcessDelegate {
public:
  std::mutex mutex;
  std::vector<std::string> events;
  std::string output;

  virtual void processStarted(ProcessContext*, ProcessHandle handle,
                              stagebuild_pid_t) override {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back("started " + std::to_string(handle.id));
  }

  virtual void processHadError(ProcessContext*, ProcessHandle,
                               const Twine& message) override {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back("error " + message.str());
  }

  virtual void processHadOutput(ProcessContext*, ProcessHandle,
                                StringRef data) override {
    std::lock_guard<std::mutex> lock(mutex);
    output += data.str();
  }

  virtual void processFinished(ProcessContext*, ProcessHandle handle,
                               const ProcessResult&) override {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back("finished " + std::to_string(handle.id));
  }
};

TEST(SubprocessTest, collectsMergedOutput) {
  ProcessGroup pgrp;
  std::string output, errors;
  auto result = executeProcessAndCollect(
      pgrp, { "/bin/sh", "-c", "echo out; echo err 1>&2" }, makeEnvironment(),
      { true }, &output, &errors);
  EXPECT_EQ(ProcessStatus::Succeeded, result.status);
  EXPECT_EQ(0, result.exitCode);
  EXPECT_EQ("out\nerr\n", output);
  EXPECT_EQ("", errors);
}

TEST(SubprocessTest, reportsExitCodeAndSignal) {
  ProcessGroup pgrp;
  std::string output;
  auto result = executeProcessAndCollect(
      pgrp, { "/bin/sh", "-c", "exit 7" }, makeEnvironment(), { true },
      &output, nullptr);
  EXPECT_EQ(ProcessStatus::Failed, result.status);
  EXPECT_EQ(7, result.exitCode);
  EXPECT_EQ(0, result.signal);

  result = executeProcessAndCollect(
      pgrp, { "/bin/sh", "-c", "kill -9 $$" }, makeEnvironment(), { true },
      &output, nullptr);
  EXPECT_EQ(ProcessStatus::Failed, result.status);
  EXPECT_EQ(-1, result.exitCode);
  EXPECT_EQ(SIGKILL, result.signal);
}

TEST(SubprocessTest, resolvesProgramsAndUsesOnlyGivenEnvironment) {
  ProcessGroup pgrp;
  POSIXEnvironment env = makeEnvironment();
  env.setIfMissing("STAGE", "2");
  std::string output;
  auto result = executeProcessAndCollect(
      pgrp, { "sh", "-c", "echo \"$STAGE:${HOME:-unset}\"" }, env, { true },
      &output, nullptr);
  EXPECT_EQ(ProcessStatus::Succeeded, result.status);
  EXPECT_EQ("2:unset\n", output);
}

TEST(SubprocessTest, workingDirectory) {
  TmpDir tempDir(__func__);
  tempDir.writeFile("marker", "here\n");

  ProcessGroup pgrp;
  ProcessAttributes attributes{ true };
  std::string dir = tempDir.str();
  attributes.workingDir = dir;
  std::string output, errors;
  auto result = executeProcessAndCollect(
      pgrp, { "/bin/cat", "marker" }, makeEnvironment(), attributes,
      &output, &errors);
  EXPECT_EQ(ProcessStatus::Succeeded, result.status) << errors;
  EXPECT_EQ("here\n", output);
}

TEST(SubprocessTest, spawnFailureIsReported) {
  ProcessGroup pgrp;
  RecordingDelegate delegate;
  ProcessResult result(ProcessStatus::Succeeded);
  spawnProcess(delegate, nullptr, pgrp, ProcessHandle{ 3 },
               { "/does/not/exist" }, makeEnvironment(), { true },
               [&](ProcessResult r) { result = r; });
  EXPECT_EQ(ProcessStatus::Failed, result.status);
  ASSERT_EQ(3u, delegate.events.size());
  EXPECT_EQ("started 3", delegate.events[0]);
  EXPECT_NE(std::string::npos,
            delegate.events[1].find("unable to spawn process"));
  EXPECT_EQ("finished 3", delegate.events[2]);

  delegate.events.clear();
  spawnProcess(delegate, nullptr, pgrp, ProcessHandle{ 4 }, {},
               makeEnvironment(), { true },
               [&](ProcessResult r) { result = r; });
  EXPECT_EQ(ProcessStatus::Failed, result.status);
  EXPECT_EQ((std::vector<std::string>{
                "started 4", "error no arguments for command", "finished 4" }),
            delegate.events);
}

TEST(SubprocessTest, timeoutKillsProcess) {
  ProcessGroup pgrp;
  ProcessAttributes attributes{ true };
  attributes.timeoutMilliseconds = 200;
  auto start = std::chrono::steady_clock::now();
  auto result = executeProcessAndCollect(
      pgrp, { "/bin/sh", "-c", "sleep 30" }, makeEnvironment(), attributes,
      nullptr, nullptr);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(ProcessStatus::TimedOut, result.status);
  EXPECT_LT(elapsed, std::chrono::seconds(20));
}

TEST(SubprocessTest, closedGroupCancels) {
  ProcessGroup pgrp;

  std::thread canceller([&] {
    // Wait for the process to be registered, then close and signal.
    while (pgrp.empty())
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    {
      std::lock_guard<std::mutex> lock(pgrp.mutex);
      pgrp.close();
    }
    pgrp.signalAll(SIGKILL);
  });

  auto result = executeProcessAndCollect(
      pgrp, { "/bin/sh", "-c", "sleep 30" }, makeEnvironment(), { true },
      nullptr, nullptr);
  canceller.join();
  EXPECT_EQ(ProcessStatus::Cancelled, result.status);

  // Nothing is spawned once the group is closed.
  RecordingDelegate delegate;
  spawnProcess(delegate, nullptr, pgrp, ProcessHandle{ 1 },
               { "/bin/sh", "-c", "true" }, makeEnvironment(), { true },
               [&](ProcessResult r) { result = r; });
  EXPECT_EQ(ProcessStatus::Cancelled, result.status);
  EXPECT_EQ((std::vector<std::string>{ "started 1", "finished 1" }),
            delegate.events);
}

}
