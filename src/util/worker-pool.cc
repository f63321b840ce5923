// util/worker-pool.cc

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

#include "util/worker-pool.h"

namespace speechseg {

int32 DefaultNumThreads() {
  int32 n = static_cast<int32>(std::thread::hardware_concurrency());
  return n > 0 ? n : 1;
}

WorkerPool::WorkerPool(int32 num_threads):
    num_running_(0), stop_(false), joined_(false) {
  SPEECHSEG_ASSERT(num_threads > 0);
  for (int32 i = 0; i < num_threads; i++)
    threads_.push_back(std::thread(&WorkerPool::WorkerLoop, this));
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

bool WorkerPool::Submit(std::function<void()> task) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stop_) return false;
    queue_.push_back(std::move(task));
  }
  task_available_.notify_one();
  return true;
}

void WorkerPool::WaitForSlot(size_t max_outstanding) {
  std::unique_lock<std::mutex> lock(mutex_);
  task_done_.wait(lock, [this, max_outstanding] {
      return queue_.size() + num_running_ < max_outstanding; });
}

size_t WorkerPool::CancelPending() {
  size_t ans;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    ans = queue_.size();
    queue_.clear();
  }
  task_done_.notify_all();
  return ans;
}

void WorkerPool::Wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  task_done_.wait(lock, [this] {
      return queue_.empty() && num_running_ == 0; });
}

void WorkerPool::Shutdown() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (joined_) return;
    stop_ = true;
    joined_ = true;
  }
  task_available_.notify_all();
  for (size_t i = 0; i < threads_.size(); i++)
    threads_[i].join();
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      task_available_.wait(lock, [this] { return stop_ || !queue_.empty(); });
      if (queue_.empty()) return;  // stop_ is set and nothing is left.
      task = std::move(queue_.front());
      queue_.pop_front();
      num_running_++;
    }
    try {
      task();
    } catch (const std::exception &e) {
      SPEECHSEG_WARN << "Task in worker pool threw an exception: " << e.what();
    }
    {
      std::unique_lock<std::mutex> lock(mutex_);
      num_running_--;
    }
    task_done_.notify_all();
  }
}

}  // namespace speechseg
