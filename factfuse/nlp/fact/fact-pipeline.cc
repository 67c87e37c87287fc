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

#include "factfuse/nlp/fact/fact-pipeline.h"

#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/fact-errors.h"
#include "factfuse/util/utf8.h"

namespace factfuse {
namespace nlp {

FactPipeline::~FactPipeline() {
  delete scorer_;
  delete rules_;
  delete ensemble_;
  delete annotator_;
}

Status FactPipeline::Init(const CueLexicon &lexicon, Annotator *annotator,
                          Ensemble *ensemble,
                          const FactPipelineOptions &options) {
  CHECK(scorer_ == nullptr) << "Fact pipeline already initialized";

  // Release collaborators kept from an earlier failed initialization.
  delete ensemble_;
  delete annotator_;
  annotator_ = annotator;
  ensemble_ = ensemble;

  // Check configuration.
  if (annotator_ == nullptr) return ConfigError("no annotator");
  if (ensemble_ == nullptr || ensemble_->empty()) {
    return ConfigError("no classifiers in ensemble");
  }
  Text terminators = UTF8::Trim(options.terminators);
  if (terminators.empty() || !UTF8::Valid(terminators)) {
    return ConfigError("invalid sentence terminators");
  }
  Status st = FusionEngine::Validate(options.fusion);
  if (!st.ok()) return st;
  st = Dispatcher::Validate(options.dispatcher);
  if (!st.ok()) return st;

  // Set up pipeline stages.
  splitter_ = SentenceSplitter(terminators);
  rules_ = new RuleScorer(lexicon, annotator_, options.rules);
  fusion_ = FusionEngine(options.fusion);
  dispatcher_ = Dispatcher(options.dispatcher);
  scorer_ = new SentenceScorer(rules_, ensemble_, &fusion_,
                               options.trace_rules);

  LOG(INFO) << "Fact pipeline with " << ensemble_->size()
            << " classifiers, fusion weight " << fusion_.weight() << ", "
            << options.dispatcher.num_workers << " workers";
  return Status::OK;
}

Status FactPipeline::Score(Text text,
                           std::vector<ScoredSentence> *results) const {
  CHECK(scorer_ != nullptr) << "Fact pipeline not initialized";
  results->clear();

  std::vector<string> sentences;
  Status st = splitter_.Split(text, &sentences);
  if (st.ok()) {
    auto task = [this](const string &sentence, ScoredSentence *result) {
      return scorer_->Score(sentence, result);
    };
    st = dispatcher_.Dispatch(sentences, task, results);
  }

  if (!st.ok()) {
    LOG(ERROR) << "Fact scoring failed: " << st;
    results->clear();
  }
  return st;
}

Status FactPipeline::ScoreSentence(const string &sentence,
                                   ScoredSentence *result) const {
  CHECK(scorer_ != nullptr) << "Fact pipeline not initialized";
  if (UTF8::Trim(sentence).empty()) return InvalidInput("empty sentence");
  if (!UTF8::Valid(sentence)) return InvalidInput("not valid UTF-8");
  result->index = 0;
  return scorer_->Score(sentence, result);
}

}  // namespace nlp
}  // namespace factfuse
