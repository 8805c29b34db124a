//===- ExecutionQueue.h -----------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BASIC_EXECUTIONQUEUE_H
#define STAGEBUILD_BASIC_EXECUTIONQUEUE_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace stagebuild {
  namespace basic {

    /// MARK: Execution Queue

    class ExecutionQueueDelegate;

    /// Description of the queue job, used for scheduling and diagnostics.
    class JobDescriptor {
    public:
      JobDescriptor() {}
      virtual ~JobDescriptor();

      /// Get a short description of the command, for use in status reporting.
      virtual void getShortDescription(SmallVectorImpl<char> &result) const = 0;

      /// Get a verbose description of the command, for use in status reporting.
      virtual void getVerboseDescription(SmallVectorImpl<char> &result) const = 0;
    };

    /// Opaque type which allows the queue implementation to maintain additional
    /// state for the dispatching job.
    class QueueJobContext {
    public:
      virtual ~QueueJobContext();

      virtual unsigned laneID() const = 0;

      /// Whether the queue was cancelled; jobs should finish promptly without
      /// starting new work once this is set.
      virtual bool isCancelled() const = 0;
    };

    /// Wrapper for individual pieces of work that are added to the execution
    /// queue.
    class QueueJob {
      JobDescriptor* desc = nullptr;

      /// The function to execute to do the work.
      typedef std::function<void(QueueJobContext*)> work_fn_ty;
      work_fn_ty work;

    public:
      /// Default constructor, for use as a sentinel.
      QueueJob() {}

      /// General constructor.
      QueueJob(JobDescriptor* desc, work_fn_ty work)
      : desc(desc), work(work) {}

      JobDescriptor* getDescriptor() const { return desc; }

      void execute(QueueJobContext* context) { work(context); }
    };

    /// This abstact class encapsulates the interface needed for contributing
    /// work which needs to be executed.
    class ExecutionQueue {
      // DO NOT COPY
      ExecutionQueue(const ExecutionQueue&) STAGEBUILD_DELETED_FUNCTION;
      void operator=(const ExecutionQueue&) STAGEBUILD_DELETED_FUNCTION;
      ExecutionQueue& operator=(ExecutionQueue&&) STAGEBUILD_DELETED_FUNCTION;

      ExecutionQueueDelegate& delegate;

    public:
      ExecutionQueue(ExecutionQueueDelegate& delegate);
      virtual ~ExecutionQueue();

      /// @name Accessors
      /// @{

      ExecutionQueueDelegate& getDelegate() { return delegate; }
      const ExecutionQueueDelegate& getDelegate() const { return delegate; }

      /// @}

      /// Add a job to be executed.
      virtual void addJob(QueueJob job) = 0;

      /// Cancel all jobs of this queue.
      ///
      /// Jobs which have not started yet still run, so that every
      /// queueJobStarted() is paired with a queueJobFinished(), but observe
      /// \see QueueJobContext::isCancelled().
      virtual void cancelAllJobs() = 0;

      /// Get the number of lanes jobs are executed on.
      virtual unsigned getNumLanes() const = 0;
    };

    /// Delegate interface for execution queue status.
    ///
    /// All delegate interfaces are invoked synchronously by the execution queue,
    /// and should defer any long running operations to avoid blocking the queue
    /// unnecessarily.
    ///
    /// NOTE: The delegate *MUST* be thread-safe with respect to all calls, which
    /// will arrive concurrently and without any specified thread.
    class ExecutionQueueDelegate {
      // DO NOT COPY
      ExecutionQueueDelegate(const ExecutionQueueDelegate&)
          STAGEBUILD_DELETED_FUNCTION;
      void operator=(const ExecutionQueueDelegate&) STAGEBUILD_DELETED_FUNCTION;
      ExecutionQueueDelegate &operator=(ExecutionQueueDelegate&& rhs)
          STAGEBUILD_DELETED_FUNCTION;

    public:
      ExecutionQueueDelegate() {}
      virtual ~ExecutionQueueDelegate();

      /// Called when a job has been started.
      ///
      /// The queue guarantees that any jobStarted() call will be paired with
      /// exactly one \see jobFinished() call.
      virtual void queueJobStarted(JobDescriptor*) = 0;

      /// Called when a job has been finished.
      virtual void queueJobFinished(JobDescriptor*) = 0;
    };

    // MARK: Lane Based Execution Queue

    /// Create an execution queue that schedules jobs to individual lanes with a
    /// capped limit on the number of concurrent lanes. Jobs are started in the
    /// order they were added.
    std::unique_ptr<ExecutionQueue> createLaneBasedExecutionQueue(
        ExecutionQueueDelegate& delegate, int numLanes);
  }
}

#endif
