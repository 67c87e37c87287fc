// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef FACTFUSE_UTIL_THREADPOOL_H_
#define FACTFUSE_UTIL_THREADPOOL_H_

#include <pthread.h>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "factfuse/base/macros.h"
#include "factfuse/base/types.h"

namespace factfuse {

// Bounded pool of worker threads executing tasks from a task queue. Schedule()
// blocks while the queue is full.
class ThreadPool {
 public:
  // Task that can be scheduled for execution.
  typedef std::function<void()> Task;

  // Initialize thread pool. The worker threads are named after the pool.
  ThreadPool(int num_workers, int queue_size, const string &name = "worker");

  // Wait for all workers to complete.
  ~ThreadPool();

  // Start worker threads.
  void StartWorkers();

  // Schedule task to be executed by worker.
  void Schedule(Task &&task);

  // Wait until all scheduled tasks have been completed and stop the workers.
  // No tasks can be scheduled after this.
  void Join();

  // Number of worker threads.
  int num_workers() const { return num_workers_; }

  // Number of tasks that workers have started.
  int64 started() const;

 private:
  // Entry point for worker threads.
  static void *WorkerMain(void *arg);

  // Run tasks until the pool is shut down.
  void Work();

  // Fetch next task. Returns false when all tasks have been completed.
  bool FetchTask(Task *task);

  // Shut down workers. This waits until all tasks have been completed.
  void Shutdown();

  // Pool name.
  string name_;

  // Worker threads.
  int num_workers_;
  std::vector<pthread_t> workers_;

  // Task queue.
  size_t queue_size_;
  std::queue<Task> tasks_;

  // Are we done with adding new tasks.
  bool done_ = false;

  // Number of tasks taken from the queue by workers.
  int64 started_ = 0;

  // Mutex for serializing access to task queue.
  mutable std::mutex mu_;

  // Signal to notify about new tasks in queue.
  std::condition_variable nonempty_;

  // Signal to notify about available space in queue.
  std::condition_variable nonfull_;

  DISALLOW_COPY_AND_ASSIGN(ThreadPool);
};

}  // namespace factfuse

#endif  // FACTFUSE_UTIL_THREADPOOL_H_
