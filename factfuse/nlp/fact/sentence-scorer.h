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

#ifndef FACTFUSE_NLP_FACT_SENTENCE_SCORER_H_
#define FACTFUSE_NLP_FACT_SENTENCE_SCORER_H_

#include <string>
#include <vector>

#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/nlp/fact/classifier.h"
#include "factfuse/nlp/fact/fusion.h"
#include "factfuse/nlp/fact/rule-scorer.h"

namespace factfuse {
namespace nlp {

// Scored sentence with the adjusted fact probability and the signals it was
// computed from.
struct ScoredSentence {
  int index = -1;                 // position of sentence in input text
  string text;                    // sentence text
  float probability = 0.0;        // adjusted fact probability in [0,1]
  float model_probability = 0.0;  // ensemble fact probability
  float logic_score = 0.0;        // rule-based logic score
  std::vector<RuleHit> hits;      // rules that fired, if traced
};

// Scores a single sentence by combining the rule scorer, the classifier
// ensemble and the fusion engine. The scorer does not own its parts, and
// Score() can be called concurrently if the collaborators allow it.
class SentenceScorer {
 public:
  SentenceScorer(const RuleScorer *rules, const Ensemble *ensemble,
                 const FusionEngine *fusion, bool trace = false)
      : rules_(rules), ensemble_(ensemble), fusion_(fusion), trace_(trace) {}

  // Score sentence. The index of the result is not set.
  Status Score(const string &sentence, ScoredSentence *result) const;

 private:
  const RuleScorer *rules_;
  const Ensemble *ensemble_;
  const FusionEngine *fusion_;
  bool trace_;
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_SENTENCE_SCORER_H_
