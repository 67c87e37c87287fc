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

#include "factfuse/nlp/fact/rule-scorer.h"

#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/fact-errors.h"

namespace factfuse {
namespace nlp {

RuleScorer::RuleScorer(const CueLexicon &lexicon, const Annotator *annotator,
                       const RuleScorerOptions &options)
    : lexicon_(lexicon), annotator_(annotator), options_(options) {
  CHECK(annotator_ != nullptr);
}

Status RuleScorer::Score(Text sentence, float *score,
                         std::vector<RuleHit> *hits) const {
  std::vector<AnnotatedWord> words;
  Status st = annotator_->Annotate(sentence, &words);
  if (!st.ok()) {
    if (st.code() == ANNOTATION_FAILURE) return st;
    return AnnotationFailure(st.message());
  }

  *score = LexicalScore(sentence, hits) + SyntacticScore(words, hits);
  VLOG(2) << "Logic score " << *score << " for " << sentence;
  return Status::OK;
}

float RuleScorer::LexicalScore(Text sentence,
                               std::vector<RuleHit> *hits) const {
  float score = 0.0;
  std::vector<string> matches;

  lexicon_.opinion_cues.Match(sentence, &matches);
  for (const string &phrase : matches) {
    score += options_.opinion_cue_weight;
    if (hits) hits->emplace_back("opinion-cue", phrase,
                                 options_.opinion_cue_weight);
  }

  matches.clear();
  lexicon_.fact_cues.Match(sentence, &matches);
  for (const string &phrase : matches) {
    score += options_.fact_cue_weight;
    if (hits) hits->emplace_back("fact-cue", phrase, options_.fact_cue_weight);
  }

  return score;
}

float RuleScorer::SyntacticScore(const std::vector<AnnotatedWord> &words,
                                 std::vector<RuleHit> *hits) const {
  float score = 0.0;
  for (const AnnotatedWord &word : words) {
    const char *rule = nullptr;
    float weight = 0.0;
    if (IsModalVerb(word)) {
      rule = "modal-verb";
      weight = options_.modal_verb_weight;
    } else if (word.pos == options_.adjective_tag) {
      rule = "adjective";
      weight = options_.adjective_weight;
    } else if (IsArgumentNoun(word)) {
      rule = "argument-noun";
      weight = options_.argument_noun_weight;
    } else if (IsDegreeAdverb(word)) {
      rule = "degree-adverb";
      weight = options_.degree_adverb_weight;
    }

    if (rule != nullptr) {
      score += weight;
      if (hits) hits->emplace_back(rule, word.text, weight);
    }
  }
  return score;
}

bool RuleScorer::IsModalVerb(const AnnotatedWord &word) const {
  if (word.pos != options_.verb_tag) return false;
  for (const string &mood : options_.modal_moods) {
    if (word.HasFeature(mood)) return true;
  }
  return false;
}

bool RuleScorer::IsArgumentNoun(const AnnotatedWord &word) const {
  if (word.pos != options_.noun_tag) return false;

  // Relation subtypes like nsubj:pass count as their base relation.
  Text base(word.relation);
  ssize_t colon = base.find(':');
  if (colon != -1) base = base.substr(0, colon);
  for (const string &relation : options_.argument_relations) {
    if (base == relation) return true;
  }
  return false;
}

bool RuleScorer::IsDegreeAdverb(const AnnotatedWord &word) const {
  return word.pos == options_.adverb_tag &&
         lexicon_.degree_adverbs.Contains(word.text);
}

}  // namespace nlp
}  // namespace factfuse
