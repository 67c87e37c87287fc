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

#include "factfuse/nlp/fact/classifier.h"

#include <cmath>

#include "factfuse/base/logging.h"
#include "factfuse/nlp/fact/fact-errors.h"

REGISTER_COMPONENT_REGISTRY("classifier", factfuse::nlp::Classifier);

namespace factfuse {
namespace nlp {

// Allowed deviation from one for the sum of class probabilities.
static const float kSumTolerance = 1e-3;

Ensemble::~Ensemble() {
  for (Classifier *member : members_) delete member;
}

void Ensemble::Add(Classifier *member) {
  CHECK(member != nullptr);
  members_.push_back(member);
}

Status Ensemble::Classify(Text sentence, ClassProbabilities *probs) const {
  if (members_.empty()) return ClassifierFailure("empty ensemble");

  ClassProbabilities sum(NUM_FACT_CLASSES, 0.0);
  ClassProbabilities member_probs;
  for (int i = 0; i < members_.size(); ++i) {
    member_probs.clear();
    Status st = members_[i]->Classify(sentence, &member_probs);
    if (st.ok()) st = Validate(member_probs);
    if (!st.ok()) {
      return ClassifierFailure("ensemble member " + std::to_string(i) + ": " +
                               st.message());
    }
    for (int c = 0; c < NUM_FACT_CLASSES; ++c) sum[c] += member_probs[c];
  }

  probs->resize(NUM_FACT_CLASSES);
  for (int c = 0; c < NUM_FACT_CLASSES; ++c) {
    (*probs)[c] = sum[c] / members_.size();
  }
  return Status::OK;
}

Status Ensemble::FactProbability(Text sentence, float *probability) const {
  ClassProbabilities probs;
  Status st = Classify(sentence, &probs);
  if (!st.ok()) return st;
  *probability = probs[FACT];
  return Status::OK;
}

Status Ensemble::Validate(const ClassProbabilities &probs) {
  if (probs.size() != NUM_FACT_CLASSES) {
    return ClassifierFailure("expected " + std::to_string(NUM_FACT_CLASSES) +
                             " class probabilities, got " +
                             std::to_string(probs.size()));
  }
  float sum = 0.0;
  for (float p : probs) {
    if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
      return ClassifierFailure("invalid class probability " +
                               std::to_string(p));
    }
    sum += p;
  }
  if (std::fabs(sum - 1.0) > kSumTolerance) {
    return ClassifierFailure("class probabilities sum to " +
                             std::to_string(sum));
  }
  return Status::OK;
}

Status LoadEnsemble(const string &type, const std::vector<string> &models,
                    Ensemble *ensemble) {
  if (models.empty()) return ConfigError("no classifier models");
  if (!Classifier::Has(type)) {
    return ConfigError("unknown classifier type: " + type);
  }
  for (const string &model : models) {
    Classifier *member = Classifier::Create(type);
    Status st = member->Load(model);
    if (!st.ok()) {
      delete member;
      return st.WithContext(model);
    }
    ensemble->Add(member);
  }
  LOG(INFO) << "Loaded " << ensemble->size() << " " << type
            << " classifiers into ensemble";
  return Status::OK;
}

}  // namespace nlp
}  // namespace factfuse
