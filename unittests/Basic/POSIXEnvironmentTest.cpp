//===-- POSIXEnvironmentTest.cpp ------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2019 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "stagebuild/Basic/POSIXEnvironment.h"

#include "gtest/gtest.h"

using namespace stagebuild;
using namespace stagebuild::basic;

namespace {
  TEST(POSIXEnvironmentTest, basic) {
    POSIXEnvironment env;
    env.setIfMissing("a", "aValue");
    env.setIfMissing("b", "bValue");
    env.setIfMissing("a", "NOT HERE");

    EXPECT_EQ(StringRef("aValue"), *env.get("a"));
    EXPECT_FALSE(env.get("c").hasValue());

    auto result = env.getEnvp();
    EXPECT_EQ(StringRef(result[0]), "a=aValue");
    EXPECT_EQ(StringRef(result[1]), "b=bValue");
    EXPECT_EQ(result[2], nullptr);
  }

  TEST(POSIXEnvironmentTest, inheritIfPresent) {
    const char* parent[] = {
      "PATH=/usr/bin:/bin", "HOME=/home/builder", "SECRET=1", "EMPTY=",
      nullptr };

    POSIXEnvironment env;
    env.setIfMissing("HOME", "/sandbox");
    env.inheritIfPresent(parent, { "PATH", "HOME", "EMPTY", "MISSING" });

    EXPECT_EQ(StringRef("/usr/bin:/bin"), *env.get("PATH"));
    EXPECT_EQ(StringRef("/sandbox"), *env.get("HOME"));
    EXPECT_EQ(StringRef(""), *env.get("EMPTY"));
    EXPECT_FALSE(env.get("SECRET").hasValue());
    EXPECT_FALSE(env.get("MISSING").hasValue());

    // A null environment is tolerated.
    env.inheritIfPresent(nullptr, { "PATH" });
  }

  TEST(POSIXEnvironmentTest, lookupEnvironment) {
    const char* environment[] = { "STAGEBUILD_JOBS=4", "A=b=c", nullptr };
    EXPECT_EQ(std::string("4"),
              *lookupEnvironment(environment, "STAGEBUILD_JOBS"));
    // Only the first '=' separates the name.
    EXPECT_EQ(std::string("b=c"), *lookupEnvironment(environment, "A"));
    EXPECT_FALSE(lookupEnvironment(environment, "STAGEBUILD").hasValue());
    EXPECT_FALSE(lookupEnvironment(nullptr, "A").hasValue());
  }
}
