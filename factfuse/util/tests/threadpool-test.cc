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

#include <unistd.h>
#include <atomic>
#include <iostream>
#include <mutex>
#include <vector>

#include "factfuse/base/init.h"
#include "factfuse/base/logging.h"
#include "factfuse/util/threadpool.h"

using namespace factfuse;

// All scheduled tasks run before Join() returns.
static void TestRunsAllTasks() {
  std::atomic<int> count(0);
  ThreadPool pool(4, 8);
  pool.StartWorkers();
  for (int i = 0; i < 1000; ++i) {
    pool.Schedule([&count]() { count++; });
  }
  pool.Join();
  CHECK_EQ(count.load(), 1000);
  CHECK_EQ(pool.started(), 1000);
}

// Schedule() blocks on a full queue instead of dropping tasks.
static void TestSmallQueue() {
  std::mutex mu;
  std::vector<int> seen;
  ThreadPool pool(2, 1);
  pool.StartWorkers();
  for (int i = 0; i < 50; ++i) {
    pool.Schedule([&mu, &seen, i]() {
      usleep(100);
      std::lock_guard<std::mutex> lock(mu);
      seen.push_back(i);
    });
  }
  pool.Join();
  CHECK_EQ(seen.size(), 50);
}

// Destructor waits for outstanding tasks.
static void TestDestructorJoins() {
  std::atomic<int> count(0);
  {
    ThreadPool pool(3, 10);
    pool.StartWorkers();
    for (int i = 0; i < 30; ++i) {
      pool.Schedule([&count]() {
        usleep(50);
        count++;
      });
    }
  }
  CHECK_EQ(count.load(), 30);
}

// Join() can be called more than once.
static void TestRepeatedJoin() {
  ThreadPool pool(2, 4);
  CHECK_EQ(pool.num_workers(), 2);
  pool.StartWorkers();
  pool.Schedule([]() {});
  pool.Join();
  pool.Join();
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestRunsAllTasks();
  TestSmallQueue();
  TestDestructorJoins();
  TestRepeatedJoin();

  std::cout << "PASS\n";
  return 0;
}
