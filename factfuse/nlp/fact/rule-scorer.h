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

#ifndef FACTFUSE_NLP_FACT_RULE_SCORER_H_
#define FACTFUSE_NLP_FACT_RULE_SCORER_H_

#include <string>
#include <vector>

#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/nlp/fact/annotator.h"
#include "factfuse/nlp/fact/cue-lexicon.h"
#include "factfuse/string/text.h"

namespace factfuse {
namespace nlp {

// Rule weights and the annotation tags the rules look for.
struct RuleScorerOptions {
  // Lexical rules.
  float opinion_cue_weight = -1.0;
  float fact_cue_weight = 1.0;

  // Syntactic rules.
  float modal_verb_weight = -1.0;
  float adjective_weight = -0.5;
  float argument_noun_weight = 0.5;
  float degree_adverb_weight = -0.5;

  // Universal part-of-speech tags.
  string verb_tag = "VERB";
  string adjective_tag = "ADJ";
  string noun_tag = "NOUN";
  string adverb_tag = "ADV";

  // Morphological features marking potential or subjunctive mood.
  std::vector<string> modal_moods = {"Mood=Pot", "Mood=Sub"};

  // Dependency relations for subject and object arguments.
  std::vector<string> argument_relations = {"nsubj", "obj"};
};

// Rule that fired while scoring a sentence.
struct RuleHit {
  RuleHit(const string &rule, const string &text, float contribution)
      : rule(rule), text(text), contribution(contribution) {}

  string rule;         // rule name, e.g. "opinion-cue"
  string text;         // matched phrase or word
  float contribution;  // signed contribution to the logic score
};

// Computes the logic score of a sentence from lexical cue phrases and from
// syntactic features of its dependency parse. Positive scores lean towards
// fact, negative towards opinion. Each rule adds a fixed weight, and the
// score is not bounded.
class RuleScorer {
 public:
  // Initialize scorer. The lexicon is copied. The annotator is not owned and
  // must be safe for concurrent use.
  RuleScorer(const CueLexicon &lexicon, const Annotator *annotator,
             const RuleScorerOptions &options = RuleScorerOptions());

  // Compute logic score for sentence. Optionally returns the rules that
  // fired. Returns ANNOTATION_FAILURE if the sentence cannot be annotated.
  Status Score(Text sentence, float *score,
               std::vector<RuleHit> *hits = nullptr) const;

  // Score from cue phrases found in the sentence.
  float LexicalScore(Text sentence, std::vector<RuleHit> *hits) const;

  // Score from syntactic features of annotated words.
  float SyntacticScore(const std::vector<AnnotatedWord> &words,
                       std::vector<RuleHit> *hits) const;

  const CueLexicon &lexicon() const { return lexicon_; }
  const RuleScorerOptions &options() const { return options_; }

 private:
  // Check if word is a verb in potential or subjunctive mood.
  bool IsModalVerb(const AnnotatedWord &word) const;

  // Check if word is a noun in subject or object position.
  bool IsArgumentNoun(const AnnotatedWord &word) const;

  // Check if word is a degree adverb.
  bool IsDegreeAdverb(const AnnotatedWord &word) const;

  CueLexicon lexicon_;
  const Annotator *annotator_;
  RuleScorerOptions options_;
};

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_RULE_SCORER_H_
