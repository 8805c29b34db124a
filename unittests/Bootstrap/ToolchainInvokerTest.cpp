//===-- ToolchainInvokerTest.cpp ------------------------------------------===//
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

#include "stagebuild/Bootstrap/ToolchainInvoker.h"

#include "stagebuild/Basic/FileSystem.h"

#include "FakeToolchain.h"
#include "TempDir.h"

#include "llvm/Support/MemoryBuffer.h"

#include "gtest/gtest.h"

#include <thread>

using namespace stagebuild;
using namespace stagebuild::bootstrap;
using namespace stagebuild::unittests;

namespace {

class ToolchainInvokerTest : public ::testing::Test {
protected:
  TmpDir tempDir{"ToolchainInvokerTest"};
  std::unique_ptr<basic::FileSystem> fs = basic::createLocalFileSystem();
  std::string logPath;
  std::string toolchainDir;
  Platform host;
  Platform cross;

  virtual void SetUp() override {
    auto platform = Platform::parse("x86_64-unknown-linux-gnu");
    auto other = Platform::parse("aarch64-unknown-linux-gnu");
    ASSERT_TRUE(platform && other);
    host = *platform;
    cross = *other;

    logPath = tempDir.path("invocations.log");
    toolchainDir = writeFakeToolchain(tempDir, "stage0", logPath);
    tempDir.writeFile("src/main.src", "fn main\n");
  }

  InvocationRequest makeRequest(unsigned stage = 1) {
    InvocationRequest request;
    request.mode = InvocationMode::Build;
    request.stage = stage;
    request.host = host;
    request.target = host;
    request.toolchainDir = toolchainDir;
    request.sourceDir = tempDir.path("src");
    request.outputDir = tempDir.path("out/stage" + std::to_string(stage));
    request.buildTool = "bin/build-tool";
    return request;
  }
};

TEST_F(ToolchainInvokerTest, commandLine) {
  auto request = makeRequest();
  EXPECT_EQ((std::vector<std::string>{
                toolchainDir + "/bin/build-tool", "build",
                "--stage", "1",
                "--host", host.str(),
                "--target", host.str(),
                "--source-dir", request.sourceDir,
                "--output-dir", request.outputDir }),
            ToolchainInvoker::getCommandLine(request));

  request.mode = InvocationMode::Test;
  request.artifactDir = "/artifact";
  auto commandLine = ToolchainInvoker::getCommandLine(request);
  EXPECT_EQ("test", commandLine[1]);
  EXPECT_EQ("--artifact-dir", commandLine[10]);
  EXPECT_EQ("/artifact", commandLine[11]);
}

TEST_F(ToolchainInvokerTest, environmentIsHermetic) {
  auto request = makeRequest(2);
  basic::POSIXEnvironment environment;
  ToolchainInvoker::getEnvironment(request, environment);
  EXPECT_EQ(StringRef(toolchainDir + "/bin:/usr/bin:/bin"),
            *environment.get("PATH"));
  EXPECT_EQ(StringRef(request.outputDir + ".tmp"), *environment.get("HOME"));
  EXPECT_EQ(StringRef("C"), *environment.get("LC_ALL"));
  EXPECT_EQ(StringRef("0"), *environment.get("SOURCE_DATE_EPOCH"));
  EXPECT_EQ(StringRef("2"), *environment.get("STAGEBUILD_STAGE"));
  EXPECT_EQ(StringRef(host.str()), *environment.get("STAGEBUILD_TARGET"));
  EXPECT_FALSE(environment.get("USER").hasValue());
}

TEST_F(ToolchainInvokerTest, successfulBuild) {
  ToolchainInvoker invoker(*fs);
  auto request = makeRequest();
  auto result = invoker.run(request);
  ASSERT_TRUE(result.isSuccess()) << result.getFailureDescription() << "\n"
                                  << result.diagnostics;
  EXPECT_EQ(request.outputDir, result.artifactDir);
  EXPECT_EQ(0, result.exitCode);
  EXPECT_NE(std::string::npos, result.diagnostics.find("built stage 1"));
  EXPECT_EQ("fn main\n",
            fs->getFileContents(result.artifactDir + "/lib/stdlib")
                ->getBuffer().str());
  EXPECT_TRUE(fs->getFileInfo(result.artifactDir + "/bin/build-tool")
                  .isExecutable);
  EXPECT_TRUE(fs->getFileInfo(request.outputDir + ".tmp").isMissing());
  EXPECT_EQ(std::vector<std::string>{
                "build 1 " + host.str() + " " + host.str() },
            readInvocationLog(logPath));
}

TEST_F(ToolchainInvokerTest, staleOutputIsCleared) {
  auto request = makeRequest();
  tempDir.writeFile("out/stage1/stale", "left over");
  ToolchainInvoker invoker(*fs);
  auto result = invoker.run(request);
  ASSERT_TRUE(result.isSuccess()) << result.getFailureDescription();
  EXPECT_TRUE(fs->getFileInfo(request.outputDir + "/stale").isMissing());
}

TEST_F(ToolchainInvokerTest, compileError) {
  tempDir.writeFile("src/fail-stage-1", "");
  ToolchainInvoker invoker(*fs);
  auto request = makeRequest();
  auto result = invoker.run(request);
  EXPECT_EQ(BuildResult::Kind::CompileError, result.kind);
  EXPECT_EQ(1, result.exitCode);
  EXPECT_NE(std::string::npos,
            result.diagnostics.find("error: cannot compile stage 1"));
  EXPECT_EQ("compile error (exit code 1)", result.getFailureDescription());
  EXPECT_TRUE(fs->getFileInfo(request.outputDir).isMissing());
}

TEST_F(ToolchainInvokerTest, crashIsProcessError) {
  tempDir.writeFile("src/crash-stage-1", "");
  ToolchainInvoker invoker(*fs);
  auto result = invoker.run(makeRequest());
  EXPECT_EQ(BuildResult::Kind::ProcessError, result.kind);
  EXPECT_EQ(3, result.exitCode);
  EXPECT_EQ("exited with code 3", result.getFailureDescription());
}

TEST_F(ToolchainInvokerTest, missingBuildTool) {
  ToolchainInvoker invoker(*fs);
  auto request = makeRequest();
  request.buildTool = "bin/missing-tool";
  auto result = invoker.run(request);
  EXPECT_EQ(BuildResult::Kind::ProcessError, result.kind);
  EXPECT_NE(std::string::npos,
            result.getFailureDescription().find("missing or not executable"));
  EXPECT_TRUE(readInvocationLog(logPath).empty());
  EXPECT_TRUE(fs->getFileInfo(request.outputDir).isMissing());
}

TEST_F(ToolchainInvokerTest, emptyOutputIsProcessError) {
  tempDir.writeFile("empty/bin/build-tool", "#!/bin/sh\nexit 0\n",
                    /*executable=*/true);
  ToolchainInvoker invoker(*fs);
  auto request = makeRequest();
  request.toolchainDir = tempDir.path("empty");
  auto result = invoker.run(request);
  EXPECT_EQ(BuildResult::Kind::ProcessError, result.kind);
  EXPECT_EQ("build tool produced no output", result.message);
}

TEST_F(ToolchainInvokerTest, crossArtifactNeedsNoBuildTool) {
  tempDir.writeFile("libonly/bin/build-tool",
                    "#!/bin/sh\n"
                    "while [ $# -gt 0 ]; do\n"
                    "  if [ \"$1\" = --output-dir ]; then out=$2; fi\n"
                    "  shift\n"
                    "done\n"
                    "mkdir -p \"$out/lib\" && echo lib > \"$out/lib/x\"\n",
                    /*executable=*/true);
  ToolchainInvoker invoker(*fs);
  auto request = makeRequest();
  request.toolchainDir = tempDir.path("libonly");

  // A host artifact must carry the build tool for the next stage.
  auto result = invoker.run(request);
  EXPECT_EQ(BuildResult::Kind::ProcessError, result.kind);
  EXPECT_NE(std::string::npos, result.message.find("missing its build tool"));

  request.target = cross;
  result = invoker.run(request);
  EXPECT_TRUE(result.isSuccess()) << result.getFailureDescription();
}

TEST_F(ToolchainInvokerTest, testMode) {
  ToolchainInvoker invoker(*fs);
  auto build = invoker.run(makeRequest());
  ASSERT_TRUE(build.isSuccess()) << build.getFailureDescription();

  auto request = makeRequest();
  request.mode = InvocationMode::Test;
  request.toolchainDir = build.artifactDir;
  request.artifactDir = build.artifactDir;
  request.outputDir = tempDir.path("test-scratch");
  auto result = invoker.run(request);
  EXPECT_TRUE(result.isSuccess()) << result.getFailureDescription();
  EXPECT_NE(std::string::npos, result.diagnostics.find("all tests passed"));
  EXPECT_TRUE(result.artifactDir.empty());
  EXPECT_TRUE(fs->getFileInfo(request.outputDir).isMissing());

  tempDir.writeFile("src/fail-tests", "");
  result = invoker.run(request);
  EXPECT_EQ(BuildResult::Kind::CompileError, result.kind);
  EXPECT_NE(std::string::npos, result.diagnostics.find("1 test failed"));
}

TEST_F(ToolchainInvokerTest, timeout) {
  tempDir.writeFile("src/sleep-stage-1", "30");
  ToolchainInvoker invoker(*fs);
  auto request = makeRequest();
  request.timeout = std::chrono::seconds(1);
  auto result = invoker.run(request);
  EXPECT_EQ(BuildResult::Kind::ProcessError, result.kind);
  EXPECT_TRUE(result.timedOut);
  EXPECT_EQ("timed out", result.getFailureDescription());
  EXPECT_TRUE(fs->getFileInfo(request.outputDir).isMissing());
}

TEST_F(ToolchainInvokerTest, cancelRunningInvocation) {
  tempDir.writeFile("src/sleep-stage-1", "30");
  ToolchainInvoker invoker(*fs, std::chrono::milliseconds(500));
  auto request = makeRequest();

  std::thread canceller([&] {
    // Wait for the build tool to start.
    while (readInvocationLog(logPath).empty())
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    invoker.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  auto result = invoker.run(request);
  canceller.join();

  EXPECT_EQ(BuildResult::Kind::ProcessError, result.kind);
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ("cancelled", result.getFailureDescription());
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::seconds(20));
  EXPECT_TRUE(invoker.isCancelled());

  // Nothing runs after cancellation.
  tempDir.writeFile("src/sleep-stage-1", "0");
  result = invoker.run(makeRequest(2));
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(1u, readInvocationLog(logPath).size());
}

}
