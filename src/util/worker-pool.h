// util/worker-pool.h

// Copyright 2012  Johns Hopkins University (Author: Daniel Povey)
//                 Frantisek Skala
//           2026  The speechseg Authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#ifndef SPEECHSEG_UTIL_WORKER_POOL_H_
#define SPEECHSEG_UTIL_WORKER_POOL_H_

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "base/speechseg-common.h"

namespace speechseg {

/// A flag that one party sets and any number of others poll.  Cancel() may be
/// called from a signal handler.
class CancellationToken {
 public:
  CancellationToken(): cancelled_(false) { }

  void Cancel() { cancelled_.store(true); }

  bool IsCancelled() const { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_;
  SPEECHSEG_DISALLOW_COPY_AND_ASSIGN(CancellationToken);
};

/// Returns std::thread::hardware_concurrency(), or 1 if that is unknown.
int32 DefaultNumThreads();

/**
   WorkerPool runs tasks on a fixed number of threads, taking them from a
   FIFO queue.  Typical use:

   \code
     WorkerPool pool(num_threads);
     for (...) {
       pool.WaitForSlot(2 * pool.NumThreads());
       if (token.IsCancelled()) break;
       pool.Submit([&, i] { DoWork(i); });
     }
     if (token.IsCancelled()) pool.CancelPending();
     pool.Wait();
   \endcode

   Tasks must not throw; an exception that escapes a task is logged and
   otherwise ignored, so that it cannot take down the other tasks.
 */
class WorkerPool {
 public:
  /// num_threads must be >= 1.
  explicit WorkerPool(int32 num_threads);

  /// Finishes all queued tasks, then joins the threads.
  ~WorkerPool();

  int32 NumThreads() const { return threads_.size(); }

  /// Queues a task.  Returns false (and drops the task) if Shutdown() has
  /// been called.
  bool Submit(std::function<void()> task);

  /// Blocks until fewer than "max_outstanding" tasks are queued or running.
  /// Lets a producer keep the pool busy without queueing everything at once.
  void WaitForSlot(size_t max_outstanding);

  /// Removes the tasks that have not started yet and returns how many were
  /// removed.  Running tasks are not interrupted.
  size_t CancelPending();

  /// Blocks until no task is queued or running.
  void Wait();

  /// Stops accepting tasks, runs what is queued, and joins the threads.
  /// Called by the destructor; safe to call more than once.
  void Shutdown();

 private:
  void WorkerLoop();

  std::vector<std::thread> threads_;
  std::deque<std::function<void()> > queue_;
  size_t num_running_;
  bool stop_;
  bool joined_;
  std::mutex mutex_;
  std::condition_variable task_available_;
  std::condition_variable task_done_;

  SPEECHSEG_DISALLOW_COPY_AND_ASSIGN(WorkerPool);
};

}  // namespace speechseg

#endif  // SPEECHSEG_UTIL_WORKER_POOL_H_
