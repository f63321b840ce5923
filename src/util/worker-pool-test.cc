// util/worker-pool-test.cc

// Copyright 2012  Johns Hopkins University (Author: Daniel Povey)
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

#include <atomic>

#include "base/speechseg-common.h"
#include "util/worker-pool.h"

namespace speechseg {

void TestWorkerPoolRunsEverything() {
  for (int32 num_threads = 1; num_threads <= 4; num_threads++) {
    std::atomic<int32> sum(0);
    std::vector<int32> done(100, 0);
    WorkerPool pool(num_threads);
    SPEECHSEG_ASSERT(pool.NumThreads() == num_threads);
    for (int32 i = 0; i < 100; i++) {
      pool.WaitForSlot(2 * num_threads);
      bool ok = pool.Submit([&sum, &done, i] {
          sum += i;
          done[i] = 1;  // each task writes its own slot.
        });
      SPEECHSEG_ASSERT(ok);
    }
    pool.Wait();
    SPEECHSEG_ASSERT(sum == 4950);
    for (int32 i = 0; i < 100; i++)
      SPEECHSEG_ASSERT(done[i] == 1);
  }
}

void TestWorkerPoolIsolatesExceptions() {
  std::atomic<int32> count(0);
  WorkerPool pool(2);
  for (int32 i = 0; i < 10; i++) {
    pool.Submit([&count, i] {
        if (i % 3 == 0)
          SPEECHSEG_ERR << "Failing task " << i << " on purpose.";
        count++;
      });
  }
  pool.Wait();
  // Tasks 0, 3, 6 and 9 threw.
  SPEECHSEG_ASSERT(count == 6);
}

void TestWorkerPoolCancelPending() {
  std::atomic<bool> release(false);
  std::atomic<int32> started(0);
  WorkerPool pool(1);
  // The first task blocks the only thread until released.
  pool.Submit([&release, &started] {
      started++;
      while (!release) Sleep(0.001);
    });
  for (int32 i = 0; i < 5; i++)
    pool.Submit([&started] { started++; });
  while (started == 0) Sleep(0.001);
  size_t dropped = pool.CancelPending();
  SPEECHSEG_ASSERT(dropped == 5);
  release = true;
  pool.Wait();
  SPEECHSEG_ASSERT(started == 1);
}

void TestWorkerPoolShutdown() {
  std::atomic<int32> count(0);
  WorkerPool pool(3);
  for (int32 i = 0; i < 20; i++)
    pool.Submit([&count] { Sleep(0.001); count++; });
  pool.Shutdown();
  // Queued work is finished before the threads are joined.
  SPEECHSEG_ASSERT(count == 20);
  SPEECHSEG_ASSERT(!pool.Submit([&count] { count++; }));
  pool.Shutdown();
  SPEECHSEG_ASSERT(count == 20);
}

void TestCancellationToken() {
  CancellationToken token;
  SPEECHSEG_ASSERT(!token.IsCancelled());
  token.Cancel();
  SPEECHSEG_ASSERT(token.IsCancelled());
  token.Cancel();
  SPEECHSEG_ASSERT(token.IsCancelled());
  SPEECHSEG_ASSERT(DefaultNumThreads() >= 1);
}

}  // end namespace speechseg

int main() {
  using namespace speechseg;
  TestWorkerPoolRunsEverything();
  TestWorkerPoolIsolatesExceptions();
  TestWorkerPoolCancelPending();
  TestWorkerPoolShutdown();
  TestCancellationToken();
  std::cout << "Test OK.\n";
  return 0;
}
