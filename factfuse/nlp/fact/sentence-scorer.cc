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

#include "factfuse/nlp/fact/sentence-scorer.h"

#include "factfuse/base/logging.h"

namespace factfuse {
namespace nlp {

Status SentenceScorer::Score(const string &sentence,
                             ScoredSentence *result) const {
  result->text = sentence;
  result->hits.clear();

  Status st = rules_->Score(sentence, &result->logic_score,
                            trace_ ? &result->hits : nullptr);
  if (!st.ok()) return st;

  st = ensemble_->FactProbability(sentence, &result->model_probability);
  if (!st.ok()) return st;

  result->probability =
      fusion_->Fuse(result->model_probability, result->logic_score);
  VLOG(1) << "p=" << result->probability
          << " model=" << result->model_probability
          << " logic=" << result->logic_score << " " << sentence;
  return Status::OK;
}

}  // namespace nlp
}  // namespace factfuse
