//===- Compiler.h -----------------------------------------------*- C++ -*-===//
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
//
// This file defines common macros and helpers for working with the compiler.
//
//===----------------------------------------------------------------------===//

#ifndef STAGEBUILD_BASIC_COMPILER_H
#define STAGEBUILD_BASIC_COMPILER_H

#if !defined(__has_feature)
#define __has_feature(x) 0
#endif

#if __has_feature(cxx_deleted_functions) || \
    defined(__GXX_EXPERIMENTAL_CXX0X__) || __cplusplus >= 201103L
#define STAGEBUILD_DELETED_FUNCTION = delete
#else
#define STAGEBUILD_DELETED_FUNCTION
#endif

#endif
