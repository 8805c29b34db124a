//===- InterruptSignalAwaiter.h ---------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BASIC_INTERRUPTSIGNALAWAITER_H
#define STAGEBUILD_BASIC_INTERRUPTSIGNALAWAITER_H

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace stagebuild {
namespace basic {
/// Allows users to provide a function that is called when a SIGINT or SIGTERM
/// signal is received by the program.
///
/// The handler runs on a dedicated thread, never in signal context.
struct InterruptSignalAwaiter {
 private:
  void(*previousSigintHandler)(int);
  void(*previousSigtermHandler)(int);
  static int signalWatchingPipe[2];
  static std::atomic<bool> wasInterrupted;
  std::thread handlerThread;
  std::mutex handlerMutex;
  std::function<void()> interruptHandler;

  /// Called when a signal is received then sends a message to the
  /// signalWatchingPipe so this class can handle the received signal.
  static void signalHandler(int);

  /// Constructs the signal awaiter by registering a signal handler, creating
  // the pipe and firing up a thread on which to listen for signals.
  InterruptSignalAwaiter();

  /// Blocking function that waits for indications that signals have arrived
  /// and process them.
  void waitForSignal();

 public:
  /// The object on which to register interrupt handlers. This is a singleton
  /// as we share static state across the class.
  static InterruptSignalAwaiter GlobalAwaiter;

  /// Sets a function to be called whenever the program receives SIGINT or
  /// SIGTERM.
  void setInterruptHandler(std::function<void()> interruptHandler) {
    std::lock_guard<std::mutex> lock(handlerMutex);
    this->interruptHandler = interruptHandler;
  }

  /// Clears the handler for an interrupt signal.
  void resetInterruptHandler() { setInterruptHandler([] {}); }

  /// Stops listening for and handling signals.
  ~InterruptSignalAwaiter();
};
}
}

#endif  // STAGEBUILD_BASIC_INTERRUPTSIGNALAWAITER_H
