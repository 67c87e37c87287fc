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

#ifndef FACTFUSE_NLP_FACT_CLASSIFIER_H_
#define FACTFUSE_NLP_FACT_CLASSIFIER_H_

#include <string>
#include <vector>

#include "factfuse/base/macros.h"
#include "factfuse/base/registry.h"
#include "factfuse/base/status.h"
#include "factfuse/base/types.h"
#include "factfuse/string/text.h"

namespace factfuse {
namespace nlp {

// Sentence classes.
enum FactClass {
  NOT_FACT = 0,
  FACT = 1,
  NUM_FACT_CLASSES = 2,
};

// Probability distribution over sentence classes indexed by FactClass.
typedef std::vector<float> ClassProbabilities;

// Binary fact/opinion sentence classifier. Implementations must be
// deterministic and safe for concurrent calls to Classify() once loaded.
class Classifier : public Component<Classifier> {
 public:
  virtual ~Classifier() = default;

  // Load classifier model.
  virtual Status Load(const string &model) = 0;

  // Compute class probabilities for sentence.
  virtual Status Classify(Text sentence,
                          ClassProbabilities *probs) const = 0;
};

#define REGISTER_CLASSIFIER(type, component) \
    REGISTER_COMPONENT_TYPE(factfuse::nlp::Classifier, type, component)

// Ensemble of independently trained classifiers. The class probabilities of
// the members are averaged element-wise.
class Ensemble {
 public:
  Ensemble() = default;
  ~Ensemble();

  // Add classifier to ensemble. The ensemble takes ownership.
  void Add(Classifier *member);

  // Number of ensemble members.
  int size() const { return members_.size(); }
  bool empty() const { return members_.empty(); }

  // Classify sentence with all members and average the class probabilities.
  // Returns CLASSIFIER_FAILURE if the ensemble is empty, if a member fails,
  // or if a member returns an invalid distribution.
  Status Classify(Text sentence, ClassProbabilities *probs) const;

  // Compute averaged probability of the fact class.
  Status FactProbability(Text sentence, float *probability) const;

  // Check that class probabilities form a valid distribution.
  static Status Validate(const ClassProbabilities &probs);

 private:
  // Ensemble members.
  std::vector<Classifier *> members_;

  DISALLOW_COPY_AND_ASSIGN(Ensemble);
};

// Create and load an ensemble member of the classifier type for each model.
Status LoadEnsemble(const string &type, const std::vector<string> &models,
                    Ensemble *ensemble);

}  // namespace nlp
}  // namespace factfuse

#endif  // FACTFUSE_NLP_FACT_CLASSIFIER_H_
