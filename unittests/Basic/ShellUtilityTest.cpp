//===-- ShellUtilityTest.cpp ----------------------------------------------===//
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

#include "stagebuild/Basic/ShellUtility.h"

#include "gtest/gtest.h"

using namespace stagebuild;
using namespace stagebuild::basic;

namespace {

std::string quoted(std::string s) {
  return "'" + s + "'";
}

TEST(ShellUtilityTest, escaping) {
  // No escapable char.
  EXPECT_EQ(shellEscaped("input01"), "input01");
  EXPECT_EQ(shellEscaped("/opt/stage0/bin/build-tool"),
            "/opt/stage0/bin/build-tool");
  EXPECT_EQ(shellEscaped("--stage=1"), "--stage=1");

  // Spaces.
  EXPECT_EQ(shellEscaped("input A"), quoted("input A"));
  EXPECT_EQ(shellEscaped("input A B"), quoted("input A B"));

  // Double Quote.
  EXPECT_EQ(shellEscaped("input\"A"), quoted("input\"A"));

  // Single Quote.
  EXPECT_EQ(shellEscaped("input'A"), "'input'\\''A'");
  EXPECT_EQ(shellEscaped("a b'c'd"), "'a b'\\''c'\\''d'");

  // Question Mark.
  EXPECT_EQ(shellEscaped("input?A"), quoted("input?A"));

  // New line.
  EXPECT_EQ(shellEscaped("input\nA"), quoted("input\nA"));

  // Multiple special chars.
  EXPECT_EQ(shellEscaped("input\nA\"B C>D*[$;()^><"),
            quoted("input\nA\"B C>D*[$;()^><"));
}

TEST(ShellUtilityTest, formatShellCommand) {
  EXPECT_EQ("", formatShellCommand({}));
  EXPECT_EQ("/bin/tool build --stage 1",
            formatShellCommand({ "/bin/tool", "build", "--stage", "1" }));
  EXPECT_EQ("echo '' 'two words'",
            formatShellCommand({ "echo", "", "two words" }));
}

}
