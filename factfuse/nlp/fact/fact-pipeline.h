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

#ifndef FACTFUSE_NLP_FACT_FACT_PIPELINE_H_
#define FACTFUSE_NLP_FACT_FACT_PIPELINE_H_

#include <string>
#include <vector>

#include "factfuse/base/macros.h"
#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/nlp/fact/annotator.h"
#include "factfuse/nlp/fact/classifier.h"
#include "factfuse/nlp/fact/cue-lexicon.h"
#include "factfuse/nlp/fact/dispatcher.h"
#include "factfuse/nlp/fact/fusion.h"
#include "factfuse/nlp/fact/rule-scorer.h"
#include "factfuse/nlp/fact/sentence-scorer.h"
#include "factfuse/nlp/fact/sentence-splitter.h"
#include "factfuse/string/text.h"

namespace factfuse {
namespace nlp {

// Fact pipeline configuration.
struct FactPipelineOptions {
  // Sentence terminators.
  string terminators = SentenceSplitter::kDefaultTerminators;

  RuleScorerOptions rules;
  FusionOptions fusion;
  DispatcherOptions dispatcher;

  // Keep the rules that fired for each sentence.
  bool trace_rules = false;
};

// Fact/opinion scoring pipeline. The text is split into sentences, and each
// sentence is scored in parallel by the rule scorer and the classifier
// ensemble, fused into an adjusted fact probability. Results are returned in
// sentence order.
//
// The annotator and the classifiers are called concurrently from several
// threads and must be read-only while scoring.
class FactPipeline {
 public:
  FactPipeline() = default;
  ~FactPipeline();

  // Initialize pipeline. Takes ownership of the annotator and the ensemble,
  // also on failure. Returns CONFIG_ERROR for invalid options, in which case
  // Init() can be called again.
  Status Init(const CueLexicon &lexicon, Annotator *annotator,
              Ensemble *ensemble, const FactPipelineOptions &options);

  // Score all sentences in the text. On failure the error is logged, the
  // status is returned, and the results are empty. Returns INVALID_INPUT for
  // empty text without calling the annotator or the classifiers.
  Status Score(Text text, std::vector<ScoredSentence> *results) const;

  // Score a single sentence.
  Status ScoreSentence(const string &sentence, ScoredSentence *result) const;

  // Number of classifiers in the ensemble.
  int ensemble_size() const { return ensemble_ ? ensemble_->size() : 0; }

 private:
  SentenceSplitter splitter_;
  Annotator *annotator_ = nullptr;
  Ensemble *ensemble_ = nullptr;
  RuleScorer *rules_ = nullptr;
  FusionEngine fusion_;
  Dispatcher dispatcher_;
  SentenceScorer *scorer_ = nullptr;

  DISALLOW_COPY_AND_ASSIGN(FactPipeline);
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_FACT_PIPELINE_H_
