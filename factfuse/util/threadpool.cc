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

#include "factfuse/util/threadpool.h"

#include <string.h>

#include "factfuse/base/logging.h"

namespace factfuse {

// Maximum length of thread names on Linux, excluding the terminator.
static const int kMaxThreadNameLength = 15;

ThreadPool::ThreadPool(int num_workers, int queue_size, const string &name)
    : name_(name), num_workers_(num_workers), queue_size_(queue_size) {
  CHECK_GT(num_workers, 0);
  CHECK_GT(queue_size, 0);
}

ThreadPool::~ThreadPool() {
  Join();
}

void *ThreadPool::WorkerMain(void *arg) {
  static_cast<ThreadPool *>(arg)->Work();
  return nullptr;
}

void ThreadPool::Work() {
  // Keep processing tasks until done.
  Task task;
  while (FetchTask(&task)) {
    task();
    task = nullptr;
  }
}

void ThreadPool::StartWorkers() {
  CHECK(workers_.empty());
  workers_.resize(num_workers_);
  for (int i = 0; i < num_workers_; ++i) {
    int rc = pthread_create(&workers_[i], nullptr, &WorkerMain, this);
    CHECK_EQ(rc, 0) << "Cannot create worker thread: " << strerror(rc);

    string name = name_ + "-" + std::to_string(i);
    if (name.size() > kMaxThreadNameLength) name.resize(kMaxThreadNameLength);
    pthread_setname_np(workers_[i], name.c_str());
  }
  VLOG(2) << "Started " << num_workers_ << " " << name_ << " threads";
}

void ThreadPool::Schedule(Task &&task) {
  std::unique_lock<std::mutex> lock(mu_);
  CHECK(!done_) << "Task scheduled after thread pool shutdown";
  while (tasks_.size() >= queue_size_) {
    nonfull_.wait(lock);
  }
  tasks_.push(std::move(task));
  nonempty_.notify_one();
}

void ThreadPool::Join() {
  // Let workers drain the queue.
  Shutdown();

  // Wait until all workers have terminated.
  for (pthread_t &worker : workers_) {
    int rc = pthread_join(worker, nullptr);
    CHECK_EQ(rc, 0) << "Cannot join worker thread: " << strerror(rc);
  }
  workers_.clear();
}

int64 ThreadPool::started() const {
  std::lock_guard<std::mutex> lock(mu_);
  return started_;
}

bool ThreadPool::FetchTask(Task *task) {
  std::unique_lock<std::mutex> lock(mu_);
  while (tasks_.empty()) {
    if (done_) return false;
    nonempty_.wait(lock);
  }
  *task = std::move(tasks_.front());
  tasks_.pop();
  started_++;
  nonfull_.notify_one();
  return true;
}

void ThreadPool::Shutdown() {
  // Notify all workers that no more tasks are coming.
  std::lock_guard<std::mutex> lock(mu_);
  done_ = true;
  nonempty_.notify_all();
}

}  // namespace factfuse
