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
#include <string>
#include <vector>

#include "factfuse/base/init.h"
#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/dispatcher.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/string/text.h"

using namespace factfuse;
using namespace factfuse::nlp;

// Sentences with many duplicates.
static std::vector<string> Sentences(int n) {
  std::vector<string> sentences;
  for (int i = 0; i < n; ++i) {
    sentences.push_back("句子" + std::to_string(i % 5) + "。");
  }
  return sentences;
}

// Task that takes longer for some sentences so that tasks complete out of
// order.
static Status SlowTask(std::atomic<int> *calls, const string &sentence,
                       ScoredSentence *result) {
  (*calls)++;
  int k = sentence[6] - '0';
  usleep((4 - k) * 300);
  result->text = sentence;
  result->probability = k / 10.0;
  return Status::OK;
}

static void TestOrderWithDuplicates() {
  std::vector<string> sentences = Sentences(100);
  std::atomic<int> calls(0);
  Dispatcher dispatcher;
  std::vector<ScoredSentence> results;
  CHECK(dispatcher.Dispatch(
      sentences,
      [&calls](const string &s, ScoredSentence *r) {
        return SlowTask(&calls, s, r);
      },
      &results));

  CHECK_EQ(calls.load(), 100);
  CHECK_EQ(results.size(), sentences.size());
  for (int i = 0; i < sentences.size(); ++i) {
    CHECK_EQ(results[i].index, i);
    CHECK_EQ(results[i].text, sentences[i]);
  }
}

static void TestWorkerCounts() {
  std::vector<string> sentences = Sentences(7);
  for (int workers : {1, 2, 7, 32}) {
    DispatcherOptions options;
    options.num_workers = workers;
    options.queue_size = workers == 2 ? 1 : 0;
    Dispatcher dispatcher(options);
    std::atomic<int> calls(0);
    std::vector<ScoredSentence> results;
    CHECK(dispatcher.Dispatch(
        sentences,
        [&calls](const string &s, ScoredSentence *r) {
          return SlowTask(&calls, s, r);
        },
        &results));
    CHECK_EQ(results.size(), 7);
    for (int i = 0; i < 7; ++i) {
      CHECK_EQ(results[i].index, i);
      CHECK_EQ(results[i].text, sentences[i]);
    }
  }
}

static void TestNoSentences() {
  Dispatcher dispatcher;
  std::vector<ScoredSentence> results(3);
  std::vector<string> none;
  CHECK(dispatcher.Dispatch(
      none,
      [](const string &s, ScoredSentence *r) { return Status::OK; },
      &results));
  CHECK(results.empty());
}

static void TestAbort() {
  std::vector<string> sentences = {"一。", "二。", "三。", "错。", "五。"};
  Dispatcher dispatcher;
  std::vector<ScoredSentence> results(2);
  Status st = dispatcher.Dispatch(
      sentences,
      [](const string &s, ScoredSentence *r) -> Status {
        if (s == "错。") return AnnotationFailure("cannot parse");
        r->text = s;
        return Status::OK;
      },
      &results);
  CHECK_EQ(st.code(), ANNOTATION_FAILURE);
  CHECK(Text(st.message()).contains("sentence 3"));
  CHECK(results.empty());
}

static void TestAbortSkipsRemainingTasks() {
  DispatcherOptions options;
  options.num_workers = 1;
  options.queue_size = 1;
  Dispatcher dispatcher(options);
  std::atomic<int> calls(0);
  std::vector<ScoredSentence> results;
  Status st = dispatcher.Dispatch(
      Sentences(100),
      [&calls](const string &s, ScoredSentence *r) -> Status {
        calls++;
        return ClassifierFailure("model crashed");
      },
      &results);
  CHECK_EQ(st.code(), CLASSIFIER_FAILURE);
  CHECK_EQ(calls.load(), 1);
  CHECK(results.empty());
}

static void TestInvalidOptions() {
  DispatcherOptions options;
  CHECK(Dispatcher::Validate(options));
  options.num_workers = 0;
  CHECK_EQ(Dispatcher::Validate(options).code(), CONFIG_ERROR);

  Dispatcher dispatcher(options);
  std::vector<ScoredSentence> results;
  Status st = dispatcher.Dispatch(
      Sentences(3),
      [](const string &s, ScoredSentence *r) { return Status::OK; },
      &results);
  CHECK_EQ(st.code(), DISPATCH_FAILURE);
  CHECK(results.empty());

  options.num_workers = 2;
  options.queue_size = -1;
  CHECK_EQ(Dispatcher::Validate(options).code(), CONFIG_ERROR);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestOrderWithDuplicates();
  TestWorkerCounts();
  TestNoSentences();
  TestAbort();
  TestAbortSkipsRemainingTasks();
  TestInvalidOptions();

  std::cout << "PASS\n";
  return 0;
}
