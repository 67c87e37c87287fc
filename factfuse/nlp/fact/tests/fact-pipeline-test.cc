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

#include <atomic>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "factfuse/base/flags.h"
#include "factfuse/base/init.h"
#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/conllu.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/nlp/fact/fact-pipeline.h"
#include "factfuse/nlp/fact/sentence-splitter.h"
#include "factfuse/nlp/fact/tests/fake-collaborators.h"

DEFINE_string(lexicon, "data/lexicon", "Directory with cue lexicon files");
DEFINE_string(testdata, "data/testdata", "Test data directory");

using namespace factfuse;
using namespace factfuse::nlp;

static const char kFactSentence[] = "根据最新的数据，他们的市场份额正在扩大。";
static const char kOpinionSentence[] = "我觉得这个产品很棒。";

// Counts error messages.
class ErrorCounter : public LogSink {
 public:
  ErrorCounter() { LogMessage::AddLogSink(this); }
  ~ErrorCounter() { LogMessage::RemoveLogSink(this); }

  void Send(int severity, const char *fname, int line,
            const string &message) override {
    if (severity >= ERROR) errors_++;
  }

  int errors() const { return errors_; }

 private:
  std::atomic<int> errors_{0};
};

// Annotator that counts live instances.
class CountedAnnotator : public FakeAnnotator {
 public:
  CountedAnnotator() { live++; }
  ~CountedAnnotator() override { live--; }

  static int live;
};

int CountedAnnotator::live = 0;

static void CheckNear(float actual, float expected) {
  CHECK_LT(std::fabs(actual - expected), 1e-5)
      << "expected " << expected << ", got " << actual;
}

static CueLexicon DefaultLexicon() {
  CueLexicon lexicon;
  CHECK(lexicon.Load(FLAGS_lexicon + "/opinion-cues.txt",
                     FLAGS_lexicon + "/fact-cues.txt",
                     FLAGS_lexicon + "/degree-adverbs.txt"));
  return lexicon;
}

// Ensemble with one fixed classifier.
static Ensemble *FixedEnsemble(FixedClassifier *member) {
  Ensemble *ensemble = new Ensemble();
  ensemble->Add(member);
  return ensemble;
}

static void TestEmptyInput() {
  FakeAnnotator *annotator = new FakeAnnotator();
  FixedClassifier *classifier = new FixedClassifier(0.5);
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), annotator, FixedEnsemble(classifier),
                      FactPipelineOptions()));

  for (const string &text : {string(""), string("  \n　"),
                             string("\xe6\x88")}) {
    ErrorCounter counter;
    std::vector<ScoredSentence> results(1);
    Status st = pipeline.Score(text, &results);
    CHECK_EQ(st.code(), INVALID_INPUT);
    CHECK(results.empty());
    CHECK_EQ(counter.errors(), 1);
  }
  CHECK_EQ(annotator->calls(), 0);
  CHECK_EQ(classifier->calls(), 0);
}

static void TestFactAndOpinion() {
  ConlluAnnotator *annotator = new ConlluAnnotator();
  CHECK(annotator->Load(FLAGS_testdata + "/sample.conllu"));
  FixedClassifier *classifier = new FixedClassifier(0.6);
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), annotator, FixedEnsemble(classifier),
                      FactPipelineOptions()));

  std::vector<ScoredSentence> results;
  CHECK(pipeline.Score(string(kFactSentence) + kOpinionSentence, &results));
  CHECK_EQ(results.size(), 2);

  const ScoredSentence &fact = results[0];
  CHECK_EQ(fact.index, 0);
  CHECK_EQ(fact.text, kFactSentence);
  CHECK_GE(fact.logic_score, 1.0);
  CheckNear(fact.model_probability, 0.6);
  CHECK_GE(fact.probability, fact.model_probability);
  CheckNear(fact.probability, 0.7);

  const ScoredSentence &opinion = results[1];
  CHECK_EQ(opinion.index, 1);
  CHECK_EQ(opinion.text, kOpinionSentence);
  CHECK_LE(opinion.logic_score, -1.5);
  CHECK_LE(opinion.probability, opinion.model_probability);
  CheckNear(opinion.probability, 0.35);

  CHECK_EQ(classifier->calls(), 2);
}

static void TestOrderWithDuplicates() {
  FixedClassifier *classifier = new FixedClassifier(0.5);
  classifier->set_max_delay_us(2000);
  classifier->Set("不确定。", 0.3);
  FactPipelineOptions options;
  options.dispatcher.num_workers = 8;
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), new FakeAnnotator(),
                      FixedEnsemble(classifier), options));

  string text;
  std::vector<string> expected;
  const char *pattern[] = {"今天下雨。", "不确定。", "今天下雨。", "也许吧！"};
  for (int i = 0; i < 40; ++i) {
    text.append(pattern[i % 4]);
    expected.push_back(pattern[i % 4]);
  }

  std::vector<ScoredSentence> results;
  CHECK(pipeline.Score(text, &results));
  CHECK_EQ(results.size(), expected.size());
  for (int i = 0; i < expected.size(); ++i) {
    CHECK_EQ(results[i].index, i);
    CHECK_EQ(results[i].text, expected[i]);
  }
  CheckNear(results[1].model_probability, 0.3);
  CheckNear(results[3].logic_score, -1.0);
  CheckNear(results[3].probability, 0.4);
}

static void TestEnsembleSize() {
  Ensemble *ensemble = new Ensemble();
  float facts[] = {0.1, 0.3, 0.5, 0.7, 0.9};
  for (float f : facts) ensemble->Add(new FixedClassifier(f));
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), new FakeAnnotator(), ensemble,
                      FactPipelineOptions()));
  CHECK_EQ(pipeline.ensemble_size(), 5);

  std::vector<ScoredSentence> results;
  CHECK(pipeline.Score("今天是星期一。", &results));
  CHECK_EQ(results.size(), 1);
  CheckNear(results[0].model_probability, 0.5);
  CheckNear(results[0].probability, 0.5);
}

static void TestClassifierFailureAborts() {
  Ensemble *ensemble = new Ensemble();
  ensemble->Add(new FixedClassifier(0.5));
  ensemble->Add(new FailingClassifier("坏", FailingClassifier::NOT_NORMALIZED));
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), new FakeAnnotator(), ensemble,
                      FactPipelineOptions()));

  ErrorCounter counter;
  std::vector<ScoredSentence> results;
  Status st = pipeline.Score("好的。很好。坏的。好的。", &results);
  CHECK_EQ(st.code(), CLASSIFIER_FAILURE);
  CHECK(results.empty());
  CHECK_EQ(counter.errors(), 1);
}

static void TestAnnotationFailureAborts() {
  FakeAnnotator *annotator = new FakeAnnotator();
  annotator->Fail("无法分析。");
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), annotator,
                      FixedEnsemble(new FixedClassifier(0.5)),
                      FactPipelineOptions()));

  std::vector<ScoredSentence> results;
  Status st = pipeline.Score("第一句。无法分析。第三句。", &results);
  CHECK_EQ(st.code(), ANNOTATION_FAILURE);
  CHECK(results.empty());
}

static void TestFusionWeight() {
  FactPipelineOptions options;
  options.fusion.weight = 0.2;
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), new FakeAnnotator(),
                      FixedEnsemble(new FixedClassifier(0.5)), options));

  ScoredSentence result;
  CHECK(pipeline.ScoreSentence("据悉，工厂已经开工。", &result));
  CheckNear(result.logic_score, 1.0);
  CheckNear(result.probability, 0.7);
  CHECK_EQ(pipeline.ScoreSentence("  ", &result).code(), INVALID_INPUT);
}

static void TestRuleTrace() {
  FakeAnnotator *annotator = new FakeAnnotator();
  annotator->Add("也许很好。", {Word("很", "ADV", "advmod"),
                               Word("好", "ADJ", "root")});
  FactPipelineOptions options;
  options.trace_rules = true;
  FactPipeline pipeline;
  CHECK(pipeline.Init(DefaultLexicon(), annotator,
                      FixedEnsemble(new FixedClassifier(0.5)), options));

  std::vector<ScoredSentence> results;
  CHECK(pipeline.Score("也许很好。", &results));
  CHECK_EQ(results.size(), 1);
  CHECK_EQ(results[0].hits.size(), 3);
  CHECK_EQ(results[0].hits[0].rule, "opinion-cue");
  CHECK_EQ(results[0].hits[0].text, "也许");
  CheckNear(results[0].logic_score, -2.0);
}

static void TestConfigErrors() {
  {
    FactPipelineOptions options;
    options.fusion.weight = -1.0;
    FactPipeline pipeline;
    Status st = pipeline.Init(DefaultLexicon(), new FakeAnnotator(),
                              FixedEnsemble(new FixedClassifier()), options);
    CHECK_EQ(st.code(), CONFIG_ERROR);
  }
  {
    FactPipelineOptions options;
    options.dispatcher.num_workers = 0;
    FactPipeline pipeline;
    Status st = pipeline.Init(DefaultLexicon(), new FakeAnnotator(),
                              FixedEnsemble(new FixedClassifier()), options);
    CHECK_EQ(st.code(), CONFIG_ERROR);
  }
  {
    FactPipelineOptions options;
    options.terminators = " ";
    FactPipeline pipeline;
    Status st = pipeline.Init(DefaultLexicon(), new FakeAnnotator(),
                              FixedEnsemble(new FixedClassifier()), options);
    CHECK_EQ(st.code(), CONFIG_ERROR);
  }
  {
    FactPipeline pipeline;
    Status st = pipeline.Init(DefaultLexicon(), new FakeAnnotator(),
                              new Ensemble(), FactPipelineOptions());
    CHECK_EQ(st.code(), CONFIG_ERROR);
  }
  {
    // Retry after a failed initialization.
    FactPipelineOptions options;
    options.fusion.weight = -1.0;
    FactPipeline pipeline;
    Status st = pipeline.Init(DefaultLexicon(), new CountedAnnotator(),
                              FixedEnsemble(new FixedClassifier()), options);
    CHECK_EQ(st.code(), CONFIG_ERROR);
    CHECK_EQ(CountedAnnotator::live, 1);

    options.fusion.weight = 0.1;
    Ensemble *ensemble = FixedEnsemble(new FixedClassifier());
    ensemble->Add(new FixedClassifier());
    st = pipeline.Init(DefaultLexicon(), new CountedAnnotator(), ensemble,
                       options);
    CHECK(st.ok()) << st;
    CHECK_EQ(CountedAnnotator::live, 1);
    CHECK_EQ(pipeline.ensemble_size(), 2);

    std::vector<ScoredSentence> results;
    CHECK(pipeline.Score(kOpinionSentence, &results).ok());
    CHECK_EQ(results.size(), 1);
  }
  CHECK_EQ(CountedAnnotator::live, 0);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestEmptyInput();
  TestFactAndOpinion();
  TestOrderWithDuplicates();
  TestEnsembleSize();
  TestClassifierFailureAborts();
  TestAnnotationFailureAborts();
  TestFusionWeight();
  TestRuleTrace();
  TestConfigErrors();

  std::cout << "PASS\n";
  return 0;
}
