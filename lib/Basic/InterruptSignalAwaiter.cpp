//===-- InterruptSignalAwaiter.cpp ----------------------------------------===//
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

#include "stagebuild/Basic/InterruptSignalAwaiter.h"

#include "stagebuild/Basic/PlatformUtility.h"

#include <cerrno>
#include <csignal>
#include <cstdio>

using namespace stagebuild;
using namespace stagebuild::basic;

int InterruptSignalAwaiter::signalWatchingPipe[2]{-1, -1};
std::atomic<bool> InterruptSignalAwaiter::wasInterrupted{false};

InterruptSignalAwaiter InterruptSignalAwaiter::GlobalAwaiter{};

void InterruptSignalAwaiter::signalHandler(int) {
  // Set the atomic interrupt flag.
  wasInterrupted = true;

  // Write to wake up the signal monitoring thread.
  char byte{};
  sys::write(signalWatchingPipe[1], &byte, 1);
}

InterruptSignalAwaiter::InterruptSignalAwaiter()
    : interruptHandler([] {}) {
  if (sys::pipe(signalWatchingPipe) < 0) {
    perror("pipe");
  }

  previousSigintHandler = std::signal(SIGINT, &signalHandler);
  previousSigtermHandler = std::signal(SIGTERM, &signalHandler);

  handlerThread = std::thread(&InterruptSignalAwaiter::waitForSignal, this);
}

void InterruptSignalAwaiter::waitForSignal() {
  // Wait for signal arrival indications.
  while (true) {
    char byte;
    int res = sys::read(signalWatchingPipe[0], &byte, 1);

    // If nothing was read, the pipe has been closed and we should shut down.
    if (res == 0) break;
    if (res < 0) {
      if (errno == EINTR)
        continue;
      break;
    }

    // Otherwise, check if we were awoke because of an interrupt.
    // Save and clear the interrupt flag, atomically.
    bool wasInterrupted =
        InterruptSignalAwaiter::wasInterrupted.exchange(false);

    // Process the interrupt flag, if present.
    if (wasInterrupted) {
      std::function<void()> handler;
      {
        std::lock_guard<std::mutex> lock(handlerMutex);
        handler = interruptHandler;
      }
      handler();
    }
  }
}

InterruptSignalAwaiter::~InterruptSignalAwaiter() {
  // Deregister the signal handlers.
  std::signal(SIGINT, previousSigintHandler);
  std::signal(SIGTERM, previousSigtermHandler);

  // Close the signal watching pipe.
  sys::close(signalWatchingPipe[1]);
  signalWatchingPipe[1] = -1;

  // Wait for the handler thread to finish execution
  handlerThread.join();
  sys::close(signalWatchingPipe[0]);
  signalWatchingPipe[0] = -1;
}
