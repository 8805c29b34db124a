//===-- ExecutionQueue.cpp ------------------------------------------------===//
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

#include "stagebuild/Basic/ExecutionQueue.h"

using namespace stagebuild;
using namespace stagebuild::basic;


JobDescriptor::~JobDescriptor() {
}

QueueJobContext::~QueueJobContext() {
}

ExecutionQueue::ExecutionQueue(ExecutionQueueDelegate& delegate)
  : delegate(delegate)
{
}

ExecutionQueue::~ExecutionQueue() {
}

ExecutionQueueDelegate::~ExecutionQueueDelegate() {
}
