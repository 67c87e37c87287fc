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

#include "factfuse/nlp/fact/dispatcher.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <utility>

#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/util/threadpool.h"

namespace factfuse {
namespace nlp {

Status Dispatcher::Validate(const DispatcherOptions &options) {
  if (options.num_workers <= 0) {
    return ConfigError("number of workers must be positive, got " +
                       std::to_string(options.num_workers));
  }
  if (options.queue_size < 0) {
    return ConfigError("queue size must not be negative, got " +
                       std::to_string(options.queue_size));
  }
  return Status::OK;
}

Status Dispatcher::Dispatch(const std::vector<string> &sentences,
                            const Task &task,
                            std::vector<ScoredSentence> *results) const {
  results->clear();
  Status st = Validate(options_);
  if (!st.ok()) return DispatchFailure(st.message());
  int num_sentences = sentences.size();
  if (num_sentences == 0) return Status::OK;

  // Completed results and the first failure.
  std::mutex mu;
  std::vector<ScoredSentence> completed;
  completed.reserve(num_sentences);
  Status failure;
  std::atomic<bool> aborted(false);

  // Start workers. There is no need for more workers than sentences.
  int num_workers = std::min(options_.num_workers, num_sentences);
  int queue_size = options_.queue_size;
  if (queue_size == 0) queue_size = 2 * num_workers;
  ThreadPool pool(num_workers, queue_size, "fact-scorer");
  pool.StartWorkers();

  // Submit one task per sentence tagged with the sentence position.
  for (int i = 0; i < num_sentences; ++i) {
    if (aborted) break;
    pool.Schedule([&, i]() {
      if (aborted) return;
      ScoredSentence result;
      Status status = task(sentences[i], &result);
      result.index = i;

      std::lock_guard<std::mutex> lock(mu);
      if (!status.ok()) {
        if (!aborted) {
          failure = status.WithContext("sentence " + std::to_string(i));
        }
        aborted = true;
        return;
      }
      completed.push_back(std::move(result));
    });
  }

  // Wait for all tasks to finish.
  pool.Join();
  if (aborted) {
    VLOG(1) << "Batch of " << num_sentences << " sentences aborted with "
            << completed.size() << " of " << pool.started()
            << " started tasks completed";
    return failure;
  }

  // Restore input order.
  std::sort(completed.begin(), completed.end(),
            [](const ScoredSentence &a, const ScoredSentence &b) {
              return a.index < b.index;
            });
  CHECK_EQ(completed.size(), static_cast<size_t>(num_sentences));
  for (int i = 0; i < num_sentences; ++i) {
    CHECK_EQ(completed[i].index, i) << "Sentence result missing or duplicated";
  }

  results->swap(completed);
  return Status::OK;
}

}  // namespace nlp
}  // namespace factfuse
