//===- CrossPlatformCompatibility.h -----------------------------*- C++ -*-===//
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
//
// Type aliases used to keep the process-facing code readable.
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_BASIC_CROSSPLATFORMCOMPATIBILITY_H
#define STAGEBUILD_BASIC_CROSSPLATFORMCOMPATIBILITY_H

#include <inttypes.h>
#include <sys/cdefs.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>

typedef pid_t stagebuild_pid_t;
typedef int FD;
typedef rlim_t stagebuild_rlim_t;

#endif
