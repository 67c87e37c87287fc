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

#ifndef FACTFUSE_NLP_FACT_DISPATCHER_H_
#define FACTFUSE_NLP_FACT_DISPATCHER_H_

#include <functional>
#include <string>
#include <vector>

#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/nlp/fact/sentence-scorer.h"

namespace factfuse {
namespace nlp {

// Dispatcher parameters.
struct DispatcherOptions {
  // Number of worker threads.
  int num_workers = 4;

  // Maximum number of queued tasks. Zero means twice the number of workers.
  int queue_size = 0;
};

// Scores sentences in parallel on a pool of worker threads and returns the
// results in input order. Every task is tagged with the position of its
// sentence when it is submitted, and results are put back in order by this
// position, so duplicate sentences keep their places.
//
// If any task fails, the batch is aborted: tasks that have not started are
// skipped, the first failure is returned, and no results are returned.
class Dispatcher {
 public:
  // Per-sentence scoring task.
  typedef std::function<Status(const string &, ScoredSentence *)> Task;

  explicit Dispatcher(const DispatcherOptions &options = DispatcherOptions())
      : options_(options) {}

  // Check that the dispatcher options are usable.
  static Status Validate(const DispatcherOptions &options);

  // Run task for all sentences. On success, results[i] is the result for
  // sentences[i] with index i.
  Status Dispatch(const std::vector<string> &sentences, const Task &task,
                  std::vector<ScoredSentence> *results) const;

  const DispatcherOptions &options() const { return options_; }

 private:
  DispatcherOptions options_;
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_DISPATCHER_H_
