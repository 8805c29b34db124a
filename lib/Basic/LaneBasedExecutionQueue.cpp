//===-- LaneBasedExecutionQueue.cpp ---------------------------------------===//
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
#include "stagebuild/Basic/PlatformUtility.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <climits>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include <pthread.h>

using namespace stagebuild;
using namespace stagebuild::basic;

namespace {

struct LaneBasedExecutionQueueJobContext : public QueueJobContext {
  uint64_t laneNumber;

  const std::atomic<bool>& cancelled;

  LaneBasedExecutionQueueJobContext(uint64_t laneNumber,
                                    const std::atomic<bool>& cancelled)
      : laneNumber(laneNumber), cancelled(cancelled) {}

  unsigned laneID() const override { return laneNumber; }

  bool isCancelled() const override { return cancelled; }
};

/// Lane based execution queue.
class LaneBasedExecutionQueue : public ExecutionQueue {
  /// The number of lanes the queue was configured with.
  unsigned numLanes;

  /// A thread for each lane.
  std::vector<std::unique_ptr<std::thread>> lanes;

  /// The ready queue of jobs to execute, in submission order.
  std::deque<QueueJob> readyJobs;
  std::mutex readyJobsMutex;
  std::condition_variable readyJobsCondition;
  std::atomic<bool> cancelled { false };
  bool shutdown { false };

  void executeLane(uint32_t laneNumber) {
    // Set the thread name, if available.
#if defined(__APPLE__)
    pthread_setname_np(
        (llvm::Twine("stagebuild-") + llvm::Twine(laneNumber)).str().c_str());
#elif defined(__linux__)
    // Linux limits thread names to 15 characters.
    pthread_setname_np(
        pthread_self(),
        (llvm::Twine("stagebuild-") + llvm::Twine(laneNumber)).str().c_str());
#endif

    // Execute items from the queue until shutdown.
    while (true) {
      // Take a job from the ready queue.
      QueueJob job{};
      {
        std::unique_lock<std::mutex> lock(readyJobsMutex);

        // While the queue is empty, wait for an item.
        while (!shutdown && readyJobs.empty()) {
          readyJobsCondition.wait(lock);
        }
        if (shutdown && readyJobs.empty())
          return;

        job = readyJobs.front();
        readyJobs.pop_front();
      }

      // If we got an empty job, the queue is shutting down.
      if (!job.getDescriptor())
        break;

      // Process the job.
      LaneBasedExecutionQueueJobContext context{ laneNumber, cancelled };
      getDelegate().queueJobStarted(job.getDescriptor());
      job.execute(&context);
      getDelegate().queueJobFinished(job.getDescriptor());
    }
  }

public:
  LaneBasedExecutionQueue(ExecutionQueueDelegate& delegate,
                          unsigned numLanesSuggestion)
      : ExecutionQueue(delegate)
  {
    numLanes = estimateLaneLimit(numLanesSuggestion);

    for (unsigned i = 0; i != numLanes; ++i) {
      lanes.push_back(std::unique_ptr<std::thread>(
                          new std::thread(
                              &LaneBasedExecutionQueue::executeLane, this, i)));
    }
  }

  virtual ~LaneBasedExecutionQueue() {
    // Shut down the lanes.
    {
      std::unique_lock<std::mutex> lock(readyJobsMutex);
      shutdown = true;
      readyJobsCondition.notify_all();
    }

    for (unsigned i = 0; i != numLanes; ++i) {
      lanes[i]->join();
    }
  }

  /// Returns the number of lanes which can run a subprocess concurrently,
  /// according to the open file limit.
  static unsigned estimateLaneLimit(unsigned numLanes) {
    numLanes = std::max(1u, numLanes);

    stagebuild_rlim_t curOpenFileLimit =
        stagebuild::basic::sys::getOpenFileLimit();
    const unsigned reservedFileCount =   3 /* stdin, stdout, stderr */
                                       + 2 /* Cache index */
                                       + 1 /* Trace */
                                       + 2 /* Additional fds during spawn */
                                       + 2 /* Fudge factor */;
    if (curOpenFileLimit < reservedFileCount) {
      // Maybe even can't afford building altogether, but let's risk it.
      return 1;
    }

    unsigned allowedFilesForTasks = static_cast<unsigned>(
        std::min(curOpenFileLimit, static_cast<stagebuild_rlim_t>(INT_MAX))) -
        reservedFileCount;
    // A task has an output pipe and a cache lock file.
    unsigned filesPerTask = 3;
    unsigned maxConcurrentTasks = allowedFilesForTasks / filesPerTask;

    return std::max(1u, std::min(numLanes, maxConcurrentTasks));
  }

  virtual void addJob(QueueJob job) override {
    std::lock_guard<std::mutex> guard(readyJobsMutex);
    readyJobs.push_back(job);
    readyJobsCondition.notify_one();
  }

  virtual void cancelAllJobs() override {
    std::lock_guard<std::mutex> lock(readyJobsMutex);
    if (cancelled) return;
    cancelled = true;
    readyJobsCondition.notify_all();
  }

  virtual unsigned getNumLanes() const override { return numLanes; }
};

} // anonymous namespace

std::unique_ptr<ExecutionQueue> stagebuild::basic::createLaneBasedExecutionQueue(
    ExecutionQueueDelegate& delegate, int numLanes) {
  return std::unique_ptr<ExecutionQueue>(new LaneBasedExecutionQueue(
      delegate, numLanes > 0 ? unsigned(numLanes) : 1u));
}
